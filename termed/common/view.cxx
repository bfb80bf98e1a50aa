// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/view.hxx"
#include "termed/support/debug.hxx"

#include <algorithm>

namespace {

size_t saturatingSub(size_t lhs, size_t rhs) {
    return lhs > rhs ? lhs - rhs : 0;
}

size_t divCeil(size_t lhs, size_t rhs) {
    return (lhs + rhs - 1) / rhs;
}

} // namespace {anonymous}

void View::setBuffer(Buffer buffer) {
    _buffer = std::move(buffer);
    _cursor = Location();
    _scroll = Position();
    _search.commit();
    _selection.clear();
    _needsRedraw = true;
}

void View::load(const std::string & path) {
    Buffer buffer;
    buffer.loadFile(path);
    setBuffer(std::move(buffer));
}

void View::save() {
    _buffer.saveFile();
}

void View::saveAs(const std::string & path) {
    _buffer.saveFileAs(path);
}

DocumentStatus View::status() const {
    DocumentStatus status;
    status.totalLines  = _buffer.height();
    status.currentLine = _cursor.line;
    status.modified    = _buffer.isDirty();
    status.fileName    = _buffer.fileName();
    return status;
}

Position View::caretPosition() const {
    return Position(saturatingSub(_cursor.line, _scroll.row),
                    saturatingSub(cursorColumn(), _scroll.col));
}

void View::insert(const std::string & text) {
    size_t i = 0;

    for (;;) {
        auto j = text.find('\n', i);
        auto piece = text.substr(i, j == std::string::npos ? std::string::npos : j - i);

        if (!piece.empty() && piece.back() == '\r') {
            piece.pop_back();
        }

        insertText(piece);

        if (j == std::string::npos) { break; }

        insertNewline();
        i = j + 1;
    }
}

void View::insertText(const std::string & text) {
    if (text.empty()) {
        return;
    }

    _selection.clear();

    auto oldCount = _buffer.graphemeCount(_cursor.line);
    _buffer.insert(_cursor, text);
    auto newCount = _buffer.graphemeCount(_cursor.line);

    // Combining marks merge into the preceding cluster.
    _cursor.grapheme += saturatingSub(newCount, oldCount);

    scrollIntoView();
    _needsRedraw = true;
}

void View::insertNewline() {
    _selection.clear();
    _buffer.insertNewline(_cursor);
    moveRight();
    scrollIntoView();
    _needsRedraw = true;
}

void View::erase() {
    _selection.clear();
    _buffer.erase(_cursor);
    _needsRedraw = true;
}

void View::eraseBackward() {
    if (_cursor.line != 0 || _cursor.grapheme != 0) {
        moveLeft();
        erase();
        scrollIntoView();
    }
}

void View::move(Move move, bool extend) {
    if (extend) {
        _selection.extendFrom(_cursor);
        _needsRedraw = true;
    }
    else if (_selection.isActive()) {
        _selection.clear();
        _needsRedraw = true;
    }

    auto page = std::max<size_t>(_size.rows, 2) - 1;

    switch (move) {
        case Move::UP:
            moveUp(1);
            break;
        case Move::DOWN:
            moveDown(1);
            break;
        case Move::LEFT:
            moveLeft();
            break;
        case Move::RIGHT:
            moveRight();
            break;
        case Move::PAGE_UP:
            moveUp(page);
            break;
        case Move::PAGE_DOWN:
            moveDown(page);
            break;
        case Move::HOME:
            _cursor.grapheme = 0;
            break;
        case Move::END:
            _cursor.grapheme = _buffer.graphemeCount(_cursor.line);
            break;
    }

    scrollIntoView();
}

void View::enterSearch() {
    _selection.clear();
    _search.enter(_cursor, _scroll);
    _needsRedraw = true;
}

void View::search(const std::string & query) {
    if (!_search.isActive()) {
        return;
    }

    auto location = _search.setQuery(_buffer, query, _cursor);

    if (location) {
        jumpTo(*location);
    }

    _needsRedraw = true;
}

void View::searchNext() {
    auto location = _search.next();

    if (location) {
        jumpTo(*location);
        _needsRedraw = true;
    }
}

void View::searchPrevious() {
    auto location = _search.previous();

    if (location) {
        jumpTo(*location);
        _needsRedraw = true;
    }
}

void View::commitSearch() {
    _search.commit();
    _needsRedraw = true;
}

void View::cancelSearch() {
    if (!_search.isActive()) {
        return;
    }

    auto snapshot = _search.cancel();
    _cursor = snapshot.location;
    _scroll = snapshot.scroll;
    snapToValidLine();
    snapToValidGrapheme();
    scrollIntoView();
    _needsRedraw = true;
}

std::string View::welcomeMessage(size_t width) {
    if (width == 0) {
        return std::string();
    }

    std::string message = "termed editor -- version " VERSION;
    auto remaining = width - 1;

    if (remaining < message.size()) {
        return "~";
    }

    auto padding = remaining - message.size();
    auto left    = padding / 2;

    return "~" + std::string(left, ' ') + message + std::string(padding - left, ' ');
}

void View::resize(Size size) {
    _size = size;
    scrollIntoView();
    _needsRedraw = true;
}

void View::render(I_Painter & painter, uint16_t originRow) {
    auto left     = _scroll.col;
    auto right    = _scroll.col + _size.cols;
    auto topThird = divCeil(_size.rows, 3);

    for (uint16_t r = 0; r != _size.rows; ++r) {
        auto lineIndex = _scroll.row + r;
        auto row       = static_cast<uint16_t>(originRow + r);

        if (lineIndex < _buffer.height()) {
            auto & line        = _buffer.line(lineIndex);
            auto   annotations = _search.annotations(lineIndex);
            auto   selection   = _selection.annotations(lineIndex, line, _cursor);

            annotations.insert(annotations.end(), selection.begin(), selection.end());

            AnnotatedStringIterator spans(line, std::move(annotations), left, right);
            painter.paintSpans(row, spans);
        }
        else if (r == topThird && _buffer.isEmpty() && _showWelcome) {
            painter.paintText(row, welcomeMessage(_size.cols));
        }
        else {
            painter.paintText(row, "~");
        }
    }

    _needsRedraw = false;
}

void View::moveUp(size_t step) {
    auto column = cursorColumn();
    _cursor.line     = saturatingSub(_cursor.line, step);
    _cursor.grapheme = _buffer.line(_cursor.line).graphemeIndexAtColumn(column);
    snapToValidGrapheme();
}

void View::moveDown(size_t step) {
    auto column = cursorColumn();
    _cursor.line += step;
    snapToValidLine();
    _cursor.grapheme = _buffer.line(_cursor.line).graphemeIndexAtColumn(column);
    snapToValidGrapheme();
}

void View::moveLeft() {
    if (_cursor.grapheme > 0) {
        --_cursor.grapheme;
    }
    else if (_cursor.line > 0) {
        --_cursor.line;
        _cursor.grapheme = _buffer.graphemeCount(_cursor.line);
    }
}

void View::moveRight() {
    if (_cursor.grapheme < _buffer.graphemeCount(_cursor.line)) {
        ++_cursor.grapheme;
    }
    else if (_cursor.line < _buffer.height()) {
        ++_cursor.line;
        _cursor.grapheme = 0;
    }
}

size_t View::cursorColumn() const {
    return _buffer.widthUpTo(_cursor.line, _cursor.grapheme);
}

void View::snapToValidLine() {
    _cursor.line = std::min(_cursor.line, _buffer.height());
}

void View::snapToValidGrapheme() {
    _cursor.grapheme = std::min(_cursor.grapheme, _buffer.graphemeCount(_cursor.line));
}

void View::scrollIntoView() {
    auto row = _cursor.line;
    auto col = cursorColumn();

    if (_size.rows != 0) {
        if (row < _scroll.row) {
            _scroll.row  = row;
            _needsRedraw = true;
        }
        else if (row >= _scroll.row + _size.rows) {
            _scroll.row  = row - _size.rows + 1;
            _needsRedraw = true;
        }
    }

    if (_size.cols != 0) {
        if (col < _scroll.col) {
            _scroll.col  = col;
            _needsRedraw = true;
        }
        else if (col >= _scroll.col + _size.cols) {
            _scroll.col  = col - _size.cols + 1;
            _needsRedraw = true;
        }
    }
}

void View::centerCursor() {
    _scroll.row  = saturatingSub(_cursor.line,   divCeil(_size.rows, 2));
    _scroll.col  = saturatingSub(cursorColumn(), divCeil(_size.cols, 2));
    _needsRedraw = true;
}

void View::jumpTo(Location location) {
    _cursor = location;
    snapToValidLine();
    snapToValidGrapheme();
    centerCursor();
}
