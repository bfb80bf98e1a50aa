// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__ANNOTATED_STRING__HXX
#define COMMON__ANNOTATED_STRING__HXX

#include "termed/common/line.hxx"
#include "termed/common/annotation.hxx"

#include <optional>
#include <string>
#include <vector>
#include <iosfwd>

//
// A run of text drawn with one style.
//

struct Span {
    std::string                   text;
    std::optional<AnnotationType> type;     // Unstyled if empty.
    size_t                        width = 0;
};

std::ostream & operator << (std::ostream & ost, const Span & span);

//
// Pull-based producer of the spans that draw the columns [left, right) of
// a line. A wide glyph cut by either edge is drawn as spaces. Adjacent
// fragments resolving to the same style are merged into one span.
//
// The line is borrowed; it must outlive the iterator and not be mutated
// while the iterator is in use.
//

class AnnotatedStringIterator {
    const Line              & _line;
    std::vector<Annotation>   _annotations;
    size_t                    _left;
    size_t                    _right;
    size_t                    _index  = 0;      // Next fragment.
    size_t                    _column = 0;      // Column of _index.

public:
    AnnotatedStringIterator(const Line & line,
                            std::vector<Annotation> annotations,
                            size_t left,
                            size_t right);

    // Produce the next span. Returns false when exhausted.
    bool next(Span & span);

private:
    std::optional<AnnotationType> resolve(size_t start, size_t end) const;
};

#endif // COMMON__ANNOTATED_STRING__HXX
