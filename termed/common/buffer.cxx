// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/buffer.hxx"
#include "termed/support/exception.hxx"
#include "termed/support/debug.hxx"

#include <fstream>

namespace {

const Line EMPTY_LINE;

std::vector<Line> read(std::istream & ist) {
    std::vector<Line> lines;
    std::string       text;

    while (std::getline(ist, text)) {
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        lines.emplace_back(std::move(text));
        text.clear();
    }

    return lines;
}

} // namespace {anonymous}

Buffer Buffer::fromLines(const std::vector<std::string> & lines) {
    Buffer buffer;
    buffer._lines.reserve(lines.size());

    for (auto & text : lines) {
        buffer._lines.emplace_back(text);
    }

    return buffer;
}

void Buffer::load(std::istream & ist) {
    auto lines = read(ist);

    THROW_UNLESS(!ist.bad(),
                 SystemError(std::make_error_code(std::errc::io_error), "Failed to read document"));

    _lines = std::move(lines);
    _dirty = false;
}

void Buffer::loadFile(const std::string & path) {
    std::ifstream ifs(path);

    if (!ifs.is_open()) {
        THROW_SYSTEM_ERROR(errno, "Could not open file: " + path);
    }

    auto lines = read(ifs);

    if (ifs.bad()) {
        THROW_SYSTEM_ERROR(errno, "Could not read file: " + path);
    }

    _lines = std::move(lines);
    _path  = path;
    _dirty = false;

    PRINT(<< "Loaded " << path << ", " << _lines.size() << " lines");
}

void Buffer::save(std::ostream & ost) const {
    for (auto & line : _lines) {
        ost << line << '\n';
    }
}

void Buffer::saveFile() {
    THROW_UNLESS(_path, UserError("No file name"));

    write(*_path);
    _dirty = false;
}

void Buffer::saveFileAs(const std::string & path) {
    THROW_UNLESS(!path.empty(), UserError("No file name"));

    write(path);
    _path  = path;
    _dirty = false;
}

void Buffer::write(const std::string & path) const {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);

    if (!ofs.is_open()) {
        THROW_SYSTEM_ERROR(errno, "Could not write file: " + path);
    }

    save(ofs);
    ofs.close();

    if (ofs.fail()) {
        THROW_SYSTEM_ERROR(errno, "Could not write file: " + path);
    }

    PRINT(<< "Saved " << path << ", " << _lines.size() << " lines");
}

std::vector<std::string> Buffer::lines() const {
    std::vector<std::string> result;
    result.reserve(_lines.size());

    for (auto & line : _lines) {
        result.push_back(line.text());
    }

    return result;
}

std::string Buffer::fileName() const {
    if (!_path) {
        return "[No Name]";
    }

    auto slash = _path->find_last_of('/');
    return slash == std::string::npos ? *_path : _path->substr(slash + 1);
}

const Line & Buffer::line(size_t index) const {
    return index < _lines.size() ? _lines[index] : EMPTY_LINE;
}

void Buffer::insert(Location at, const std::string & text) {
    ASSERT(text.find('\n') == std::string::npos, );

    if (text.empty()) {
        return;
    }

    if (at.line >= _lines.size()) {
        _lines.emplace_back(text);
    }
    else {
        _lines[at.line].insert(at.grapheme, text);
    }

    _dirty = true;
}

void Buffer::erase(Location at) {
    if (at.line >= _lines.size()) {
        return;
    }

    auto & current = _lines[at.line];

    if (at.grapheme < current.graphemeCount()) {
        current.erase(at.grapheme);
        _dirty = true;
    }
    else if (at.line + 1 < _lines.size()) {
        current.append(_lines[at.line + 1]);
        _lines.erase(_lines.begin() + at.line + 1);
        _dirty = true;
    }
}

void Buffer::insertNewline(Location at) {
    if (at.line >= _lines.size()) {
        _lines.emplace_back();
    }
    else {
        auto tail = _lines[at.line].splitAt(at.grapheme);
        _lines.insert(_lines.begin() + at.line + 1, std::move(tail));
    }

    _dirty = true;
}
