// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__SELECTOR__HXX
#define SUPPORT__SELECTOR__HXX

#include "termed/support/pattern.hxx"

#include <map>

class I_Selector {
public:
    class I_ReadHandler {
    public:
        virtual void handleRead(int fd) = 0;

    protected:
        ~I_ReadHandler() = default;
    };

    virtual void addReadable(int fd, I_ReadHandler * handler) = 0;
    virtual void removeReadable(int fd) = 0;

protected:
    ~I_Selector() = default;
};

//
//
//

// Waits on readable descriptors with epoll.
class EPollSelector final : public I_Selector, private Uncopyable {
    int                            _fd;
    std::map<int, I_ReadHandler *> _handlers;

public:
    EPollSelector();
    ~EPollSelector();

    // Block until a registered descriptor is readable or 'timeout'
    // milliseconds pass (-1 waits indefinitely), then dispatch. Returns
    // false if nothing was dispatched, on timeout or a signal.
    bool animate(int timeout);

    // I_Selector implementation:

    void addReadable(int fd, I_ReadHandler * handler) override;
    void removeReadable(int fd) override;
};

using Selector = EPollSelector;

#endif // SUPPORT__SELECTOR__HXX
