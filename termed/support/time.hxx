// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__TIME__HXX
#define SUPPORT__TIME__HXX

#include <chrono>
#include <cstdint>

//
// A timer that expires.
//

class Timer {
    using Clock = std::chrono::steady_clock;
    Clock::time_point _endTime;

public:
    explicit Timer(uint32_t milliseconds)
        : _endTime(Clock::now() + std::chrono::duration<int, std::milli>(milliseconds)) {}

    // Construct already expired.
    Timer() : _endTime(Clock::now()) {}

    bool expired() const { return Clock::now() >= _endTime; }

    // Milliseconds until expiry, rounded up. Zero once expired.
    uint32_t remaining() const {
        auto now = Clock::now();
        if (now >= _endTime) { return 0; }
        auto left = std::chrono::ceil<std::chrono::milliseconds>(_endTime - now);
        return static_cast<uint32_t>(left.count());
    }
};

#endif // SUPPORT__TIME__HXX
