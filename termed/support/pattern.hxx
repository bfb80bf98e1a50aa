// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__PATTERN__HXX
#define SUPPORT__PATTERN__HXX

#include <utility>

// Inherit from this to be uncopyable (and unassignable).
class Uncopyable {
public:
    Uncopyable(const Uncopyable &) noexcept = delete;
    Uncopyable & operator=(const Uncopyable &) noexcept = delete;

protected:
    Uncopyable() noexcept  = default;
    ~Uncopyable() noexcept = default;
};

// Run a cleanup when the scope ends, however it ends:
//
//     ScopeGuard closeText([utext]() { utext_close(utext); });
template <typename F>
class ScopeGuard final : private Uncopyable {
    F _cleanup;

public:
    explicit ScopeGuard(F cleanup) : _cleanup(std::move(cleanup)) {}

    ~ScopeGuard() { _cleanup(); }
};

#endif // SUPPORT__PATTERN__HXX
