// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/selection.hxx"

std::pair<Location, Location> Selection::range(Location cursor) const {
    auto anchor = _anchor ? *_anchor : cursor;

    if (cursor < anchor) {
        return std::make_pair(cursor, anchor);
    }
    else {
        return std::make_pair(anchor, cursor);
    }
}

std::vector<Annotation> Selection::annotations(size_t lineIndex,
                                               const Line & line,
                                               Location cursor) const {
    std::vector<Annotation> result;

    if (!_anchor) {
        return result;
    }

    auto range = this->range(cursor);
    auto begin = range.first;
    auto end   = range.second;

    if (lineIndex < begin.line || lineIndex > end.line) {
        return result;
    }

    auto startByte = lineIndex == begin.line ? line.graphemeToByte(begin.grapheme) : 0;
    auto endByte   = lineIndex == end.line   ? line.graphemeToByte(end.grapheme)   : line.byteLength();

    if (startByte < endByte) {
        result.push_back(Annotation{AnnotationType::SELECTION, startByte, endByte});
    }

    return result;
}
