// vi:noai:sw=4
// Copyright © 2017 David Bryant

#include "termed/common/line.hxx"
#include "termed/support/debug.hxx"

#include <algorithm>
#include <ostream>

Line::Line(std::string text) :
    _text(std::move(text)),
    _fragments(),
    _dirty(true)
{}

const std::vector<TextFragment> & Line::fragments() const {
    if (_dirty) {
        _fragments = fragmentize(_text);
        _dirty     = false;
    }
    return _fragments;
}

void Line::insert(size_t graphemeIndex, const std::string & str) {
    if (str.empty()) {
        return;
    }

    _text.insert(graphemeToByte(graphemeIndex), str);
    invalidate();
}

void Line::erase(size_t graphemeIndex) {
    auto & frags = fragments();

    if (graphemeIndex >= frags.size()) {
        return;
    }

    auto & fragment = frags[graphemeIndex];
    _text.erase(fragment.start, fragment.grapheme.size());
    invalidate();
}

void Line::eraseLast() {
    auto count = graphemeCount();

    if (count != 0) {
        erase(count - 1);
    }
}

Line Line::splitAt(size_t graphemeIndex) {
    if (graphemeIndex >= graphemeCount()) {
        return Line();
    }

    auto byte = graphemeToByte(graphemeIndex);
    Line tail(_text.substr(byte));
    _text.erase(byte);
    invalidate();

    return tail;
}

void Line::append(const Line & other) {
    if (other._text.empty()) {
        return;
    }

    _text += other._text;
    invalidate();
}

size_t Line::widthUpTo(size_t graphemeIndex) const {
    auto & frags = fragments();
    auto   end   = std::min(graphemeIndex, frags.size());
    size_t width = 0;

    for (size_t i = 0; i != end; ++i) {
        width += frags[i].width;
    }

    return width;
}

size_t Line::graphemeIndexAtColumn(size_t column) const {
    auto & frags = fragments();
    size_t col   = 0;

    for (size_t i = 0; i != frags.size(); ++i) {
        if (col + frags[i].width > column) {
            return i;
        }
        col += frags[i].width;
    }

    return frags.size();
}

size_t Line::graphemeToByte(size_t graphemeIndex) const {
    auto & frags = fragments();

    if (graphemeIndex >= frags.size()) {
        return _text.size();
    }
    else {
        return frags[graphemeIndex].start;
    }
}

size_t Line::byteToGrapheme(size_t byteOffset) const {
    auto & frags = fragments();

    auto iter = std::lower_bound(frags.begin(), frags.end(), byteOffset,
                                 [](const TextFragment & fragment, size_t offset) {
                                     return fragment.start < offset;
                                 });

    return static_cast<size_t>(iter - frags.begin());
}

std::vector<Line::Match> Line::findAll(const std::string & query,
                                       size_t byteBegin, size_t byteEnd) const {
    std::vector<Match> matches;

    byteEnd   = std::min(byteEnd, _text.size());
    byteBegin = std::min(byteBegin, byteEnd);

    if (query.empty() || byteEnd - byteBegin < query.size()) {
        return matches;
    }

    auto & frags = fragments();
    auto   pos   = byteBegin;

    while (pos + query.size() <= byteEnd) {
        pos = _text.find(query, pos);

        if (pos == std::string::npos || pos + query.size() > byteEnd) {
            break;
        }

        auto grapheme = byteToGrapheme(pos);
        auto endByte  = pos + query.size();
        auto after    = byteToGrapheme(endByte);

        bool startsOnBoundary =
            grapheme != frags.size() && frags[grapheme].start == pos;
        bool endsOnBoundary =
            endByte == _text.size() || (after != frags.size() && frags[after].start == endByte);

        if (startsOnBoundary && endsOnBoundary) {
            matches.push_back(Match{pos, grapheme});
            pos = endByte;
        }
        else {
            // The bytes matched inside a cluster; keep looking.
            ++pos;
        }
    }

    return matches;
}

std::string Line::glyphs(size_t columns) const {
    std::string result;
    size_t      column = 0;

    for (auto & fragment : fragments()) {
        column += fragment.width;
        if (column > columns) { break; }
        result += fragment.glyph();
    }

    return result;
}

std::ostream & operator << (std::ostream & ost, const Line & line) {
    return ost << line.text();
}
