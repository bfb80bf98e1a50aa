// vi:noai:sw=4
// Copyright © 2017 David Bryant

#ifndef COMMON__LINE__HXX
#define COMMON__LINE__HXX

#include "termed/common/text_fragment.hxx"

#include <iosfwd>
#include <string>
#include <vector>

//
// One line of a document. The text is UTF-8; the fragment sequence is
// derived from it and rebuilt on the first read after any mutation.
//
// Grapheme indices, byte offsets and columns passed in are clamped, never
// rejected.
//

class Line {
    std::string                       _text;
    mutable std::vector<TextFragment> _fragments;
    mutable bool                      _dirty = false;

public:
    struct Match {
        size_t byte;
        size_t grapheme;
    };

    Line() = default;

    // Pass-by-value because we are taking a copy.
    explicit Line(std::string text);

    const std::string & text() const { return _text; }
    size_t byteLength() const { return _text.size(); }
    bool   isEmpty() const { return _text.empty(); }

    const std::vector<TextFragment> & fragments() const;

    size_t graphemeCount() const { return fragments().size(); }

    // Total rendered width.
    size_t width() const { return widthUpTo(graphemeCount()); }

    // Insert at the start of the grapheme; an index at or past the end appends.
    void insert(size_t graphemeIndex, const std::string & str);

    // Remove one grapheme. Out of range is a no-op.
    void erase(size_t graphemeIndex);

    void eraseLast();

    // Truncate at the grapheme and return what was cut off.
    Line splitAt(size_t graphemeIndex);

    void append(const Line & other);

    // Column at which the grapheme starts.
    size_t widthUpTo(size_t graphemeIndex) const;

    // The last grapheme boundary whose column doesn't exceed column.
    size_t graphemeIndexAtColumn(size_t column) const;

    size_t graphemeToByte(size_t graphemeIndex) const;

    // First grapheme starting at or after the byte offset.
    size_t byteToGrapheme(size_t byteOffset) const;

    // What the graphemes wholly within the first columns draw as.
    std::string glyphs(size_t columns) const;

    // Literal, case-sensitive, non-overlapping matches lying within
    // [byteBegin, byteEnd) that start and end on grapheme boundaries.
    std::vector<Match> findAll(const std::string & query,
                               size_t byteBegin, size_t byteEnd) const;

private:
    void invalidate() { _dirty = true; }
};

std::ostream & operator << (std::ostream & ost, const Line & line);

#endif // COMMON__LINE__HXX
