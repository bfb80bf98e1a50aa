// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/annotation.hxx"
#include "termed/support/debug.hxx"

#include <ostream>

std::ostream & operator << (std::ostream & ost, AnnotationType type) {
    switch (type) {
        case AnnotationType::MATCH:
            return ost << "MATCH";
        case AnnotationType::SELECTED_MATCH:
            return ost << "SELECTED_MATCH";
        case AnnotationType::SELECTION:
            return ost << "SELECTION";
    }

    FATAL(<< "Invalid annotation type: " << static_cast<int>(type));
}

int precedence(AnnotationType type) {
    switch (type) {
        case AnnotationType::MATCH:
            return 0;
        case AnnotationType::SELECTION:
            return 1;
        case AnnotationType::SELECTED_MATCH:
            return 2;
    }

    FATAL(<< "Invalid annotation type: " << static_cast<int>(type));
}

std::ostream & operator << (std::ostream & ost, const Annotation & annotation) {
    return ost << annotation.type << '[' << annotation.start << ',' << annotation.end << ')';
}
