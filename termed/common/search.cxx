// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/search.hxx"
#include "termed/support/debug.hxx"

#include <algorithm>

std::optional<Location> Search::currentLocation() const {
    if (_current) {
        return _matches[*_current].location;
    }
    else {
        return std::nullopt;
    }
}

void Search::enter(Location location, Position scroll) {
    reset();
    _active   = true;
    _snapshot = Snapshot{location, scroll};
}

std::optional<Location> Search::setQuery(const Buffer & buffer,
                                         const std::string & query,
                                         Location from) {
    ASSERT(_active, );

    _query = query;
    _matches.clear();
    _current.reset();

    if (_query.empty()) {
        return std::nullopt;
    }

    for (size_t index = 0; index != buffer.height(); ++index) {
        auto & line = buffer.line(index);

        for (auto & match : line.findAll(_query, 0, line.byteLength())) {
            _matches.push_back(Match{Location(index, match.grapheme), match.byte});
        }
    }

    if (_matches.empty()) {
        return std::nullopt;
    }

    auto iter = std::find_if(_matches.begin(), _matches.end(),
                             [from](const Match & match) { return from <= match.location; });

    _current = iter == _matches.end() ? 0 : static_cast<size_t>(iter - _matches.begin());

    PRINT(<< "Search '" << _query << "': " << _matches.size() << " matches, current " << *_current);

    return currentLocation();
}

std::optional<Location> Search::next() {
    if (_matches.empty()) {
        return std::nullopt;
    }

    _current = _current ? (*_current + 1) % _matches.size() : 0;
    return currentLocation();
}

std::optional<Location> Search::previous() {
    if (_matches.empty()) {
        return std::nullopt;
    }

    auto count = _matches.size();
    _current = _current ? (*_current + count - 1) % count : count - 1;
    return currentLocation();
}

void Search::commit() {
    reset();
}

Search::Snapshot Search::cancel() {
    auto snapshot = _snapshot;
    reset();
    return snapshot;
}

std::vector<Annotation> Search::annotations(size_t lineIndex) const {
    std::vector<Annotation> result;

    if (!_active || _matches.empty()) {
        return result;
    }

    auto begin = std::lower_bound(_matches.begin(), _matches.end(), lineIndex,
                                  [](const Match & match, size_t index) {
                                      return match.location.line < index;
                                  });

    for (auto iter = begin; iter != _matches.end() && iter->location.line == lineIndex; ++iter) {
        auto index = static_cast<size_t>(iter - _matches.begin());
        auto type  = _current && *_current == index ?
            AnnotationType::SELECTED_MATCH : AnnotationType::MATCH;

        result.push_back(Annotation{type, iter->byte, iter->byte + _query.size()});
    }

    return result;
}

void Search::reset() {
    _active = false;
    _snapshot = Snapshot();
    _query.clear();
    _matches.clear();
    _current.reset();
}
