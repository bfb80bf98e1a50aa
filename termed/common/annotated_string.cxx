// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/annotated_string.hxx"

#include <algorithm>
#include <ostream>

std::ostream & operator << (std::ostream & ost, const Span & span) {
    ost << "'" << span.text << "'";
    if (span.type) {
        ost << ":" << *span.type;
    }
    return ost;
}

AnnotatedStringIterator::AnnotatedStringIterator(const Line & line,
                                                 std::vector<Annotation> annotations,
                                                 size_t left,
                                                 size_t right) :
    _line(line),
    _annotations(std::move(annotations)),
    _left(left),
    _right(std::max(left, right))
{
    _annotations.erase(std::remove_if(_annotations.begin(), _annotations.end(),
                                      [](const Annotation & a) { return a.start >= a.end; }),
                       _annotations.end());

    // Skip the fragments that lie wholly left of the window.
    auto & frags = _line.fragments();

    while (_index != frags.size() && _column + frags[_index].width <= _left) {
        _column += frags[_index].width;
        ++_index;
    }
}

bool AnnotatedStringIterator::next(Span & span) {
    auto & frags = _line.fragments();
    bool   have  = false;

    span = Span();

    while (_index != frags.size() && _column < _right) {
        auto & fragment = frags[_index];
        auto   begin    = _column;
        auto   end      = _column + fragment.width;
        bool   whole    = begin >= _left && end <= _right;
        auto   visible  = whole ? fragment.width : std::min(end, _right) - std::max(begin, _left);

        if (!whole && visible == 0) {
            // Clipped away entirely.
            _column = end;
            ++_index;
            continue;
        }

        auto type = resolve(fragment.start, fragment.end());

        if (have && type != span.type) {
            break;
        }

        if (whole) {
            span.text  += fragment.glyph();
            span.width += fragment.width;
        }
        else {
            // Clipped by an edge.
            span.text.append(visible, ' ');
            span.width += visible;
        }

        span.type = type;
        have      = true;

        _column = end;
        ++_index;
    }

    return have;
}

std::optional<AnnotationType> AnnotatedStringIterator::resolve(size_t start, size_t end) const {
    std::optional<AnnotationType> type;

    for (auto & annotation : _annotations) {
        if (annotation.overlaps(start, end)) {
            if (!type || precedence(annotation.type) > precedence(*type)) {
                type = annotation.type;
            }
        }
    }

    return type;
}
