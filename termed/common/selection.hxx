// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__SELECTION__HXX
#define COMMON__SELECTION__HXX

#include "termed/common/line.hxx"
#include "termed/common/annotation.hxx"
#include "termed/common/data_types.hxx"

#include <optional>
#include <utility>
#include <vector>

//
// The text between an anchor and the cursor, grown by shift-movement.
//

class Selection {
    std::optional<Location> _anchor;

public:
    bool isActive() const { return static_cast<bool>(_anchor); }

    const std::optional<Location> & anchor() const { return _anchor; }

    // Anchor at location unless already anchored.
    void extendFrom(Location location) {
        if (!_anchor) { _anchor = location; }
    }

    void clear() { _anchor.reset(); }

    // The selected range [begin, end) in reading order.
    std::pair<Location, Location> range(Location cursor) const;

    // The part of the selection on one line, as a SELECTION annotation.
    std::vector<Annotation> annotations(size_t lineIndex,
                                        const Line & line,
                                        Location cursor) const;
};

#endif // COMMON__SELECTION__HXX
