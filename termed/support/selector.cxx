// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/selector.hxx"
#include "termed/support/debug.hxx"
#include "termed/support/exception.hxx"

#include <array>

#include <unistd.h>
#include <sys/epoll.h>

EPollSelector::EPollSelector() {
    _fd = THROW_IF_SYSCALL_FAILS(::epoll_create1(EPOLL_CLOEXEC), "epoll_create1()");
}

EPollSelector::~EPollSelector() {
    ASSERT(_handlers.empty(), << "Descriptors still registered");
    TEMP_FAILURE_RETRY(::close(_fd));
}

bool EPollSelector::animate(int timeout) {
    ASSERT(!_handlers.empty(), );

    std::array<struct epoll_event, 4> events;

    // Not retried: a signal must get back to the caller so it can react.
    auto n = ::epoll_wait(_fd, events.data(), static_cast<int>(events.size()), timeout);

    if (n == -1) {
        if (errno == EINTR) { return false; }
        THROW_SYSTEM_ERROR(errno, "epoll_wait()");
    }

    for (int i = 0; i != n; ++i) {
        auto fd = events[i].data.fd;

        if (events[i].events & EPOLLERR) {
            ERROR(<< "Error condition on fd " << fd);
        }

        // A handler may have removed the descriptor.
        auto iter = _handlers.find(fd);
        if (iter != _handlers.end()) {
            iter->second->handleRead(fd);
        }
    }

    return n != 0;
}

void EPollSelector::addReadable(int fd, I_ReadHandler * handler) {
    ASSERT(handler, );
    ASSERT(_handlers.count(fd) == 0, << "fd " << fd << " already registered");

    struct epoll_event event = {};
    event.events  = EPOLLIN;
    event.data.fd = fd;
    THROW_IF_SYSCALL_FAILS(::epoll_ctl(_fd, EPOLL_CTL_ADD, fd, &event), "epoll_ctl(ADD)");

    _handlers[fd] = handler;
}

void EPollSelector::removeReadable(int fd) {
    auto iter = _handlers.find(fd);
    ASSERT(iter != _handlers.end(), << "fd " << fd << " not registered");

    THROW_IF_SYSCALL_FAILS(::epoll_ctl(_fd, EPOLL_CTL_DEL, fd, nullptr), "epoll_ctl(DEL)");

    _handlers.erase(iter);
}
