// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__PIPE__HXX
#define SUPPORT__PIPE__HXX

#include "termed/support/pattern.hxx"

// A non-blocking pipe to itself. A signal handler notify()s and the event
// loop, watching readFd(), drain()s.
class SignalPipe final : private Uncopyable {
    int _readFd;
    int _writeFd;

public:
    SignalPipe();
    ~SignalPipe();

    int readFd() const { return _readFd; }

    // Async-signal-safe. Preserves errno.
    void notify() noexcept;

    // Consume every pending notification. Returns false if there were none.
    bool drain();
};

#endif // SUPPORT__PIPE__HXX
