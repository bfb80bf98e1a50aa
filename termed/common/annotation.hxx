// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__ANNOTATION__HXX
#define COMMON__ANNOTATION__HXX

#include <iosfwd>
#include <cstddef>

enum class AnnotationType {
    MATCH,
    SELECTED_MATCH,
    SELECTION
};

std::ostream & operator << (std::ostream & ost, AnnotationType type);

// Where annotations overlap the highest precedence wins:
// SELECTED_MATCH > SELECTION > MATCH.
int precedence(AnnotationType type);

//
// A highlight over the half-open byte range [start, end) of one line.
// Built for a single render pass.
//

struct Annotation {
    AnnotationType type;
    size_t         start;
    size_t         end;

    bool overlaps(size_t begin_, size_t end_) const {
        return start < end_ && begin_ < end;
    }
};

inline bool operator == (const Annotation & lhs, const Annotation & rhs) {
    return lhs.type == rhs.type && lhs.start == rhs.start && lhs.end == rhs.end;
}

std::ostream & operator << (std::ostream & ost, const Annotation & annotation);

#endif // COMMON__ANNOTATION__HXX
