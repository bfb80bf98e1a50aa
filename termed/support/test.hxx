// vi:noai:sw=4
// Copyright © 2015 David Bryant

#ifndef SUPPORT__TEST__HXX
#define SUPPORT__TEST__HXX

#include "termed/support/conv.hxx"
#include "termed/support/pattern.hxx"

#include <string>
#include <utility>
#include <vector>

// A tree of named checks. Each check prints a PASS or FAIL line with its
// path, e.g. "common/buffer/load". The destructor lists the failed paths and
// exits non-zero if there were any.
class Test final : protected Uncopyable {
    std::vector<std::string> _path;
    std::vector<std::string> _failed;
    int                      _checks = 0;

    void record(bool success, const std::string & description);
    std::string path() const;

    // Keep long values on one screen when they match anyway.
    template <typename T>
    static std::string show(const T & value, bool brief) {
        auto str = stringify(value);
        if (brief && str.size() > 24) { str = str.substr(0, 21) + "..."; }
        return str;
    }

public:
    explicit Test(const std::string & name) : _path{name} {}
    ~Test();

    template <typename Func>
    void run(const std::string & name, Func && func) {
        _path.push_back(name);
        func(*this);
        _path.pop_back();
    }

    bool enforce(bool condition, const std::string & description) {
        record(condition, description);
        return condition;
    }

    template <typename T, typename U>
    bool enforceEqual(const T & actual, const U & expected, const std::string & description) {
        bool equal = actual == expected;
        record(equal, description + " (" + show(actual, equal) + " == " + show(expected, equal) + ")");
        return equal;
    }

    // Passes if 'func' throws an E. Any other exception propagates.
    template <typename E, typename Func>
    bool enforceThrows(Func && func, const std::string & description) {
        try {
            func();
        }
        catch (const E &) {
            record(true, description);
            return true;
        }
        record(false, description + " (nothing thrown)");
        return false;
    }
};

#endif // SUPPORT__TEST__HXX
