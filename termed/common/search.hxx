// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__SEARCH__HXX
#define COMMON__SEARCH__HXX

#include "termed/common/buffer.hxx"
#include "termed/common/annotation.hxx"
#include "termed/common/data_types.hxx"

#include <optional>
#include <string>
#include <vector>

//
// Incremental search. Inactive until enter(); each query change re-scans
// the whole document. Matches are literal and case-sensitive, kept in
// reading order, and the current match is either a valid index or none.
//

class Search {
public:
    // What cancel() hands back.
    struct Snapshot {
        Location location;
        Position scroll;
    };

    struct Match {
        Location location;
        size_t   byte;
    };

private:
    bool                  _active = false;
    Snapshot              _snapshot;
    std::string           _query;
    std::vector<Match>    _matches;
    std::optional<size_t> _current;

public:
    Search() = default;

    bool isActive() const { return _active; }

    const std::string &        query()        const { return _query; }
    const std::vector<Match> & matches()      const { return _matches; }
    size_t                     matchCount()   const { return _matches.size(); }
    std::optional<size_t>      currentIndex() const { return _current; }

    std::optional<Location> currentLocation() const;

    // Snapshot the cursor and scroll offset and become active with an
    // empty query.
    void enter(Location location, Position scroll);

    // Re-scan the buffer. The current match becomes the first at or after
    // from, else the first overall, else none. Returns its location.
    std::optional<Location> setQuery(const Buffer & buffer,
                                     const std::string & query,
                                     Location from);

    // Circular navigation. From none, next() selects the first match and
    // previous() the last. Nothing happens if there are no matches.
    std::optional<Location> next();
    std::optional<Location> previous();

    // Leave the cursor where it is.
    void commit();

    // Deactivate and return the state to restore.
    Snapshot cancel();

    // MATCH for every match on the line, SELECTED_MATCH for the current one.
    std::vector<Annotation> annotations(size_t lineIndex) const;

private:
    void reset();
};

#endif // COMMON__SEARCH__HXX
