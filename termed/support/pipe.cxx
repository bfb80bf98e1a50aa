// vi:noai:sw=4
// Copyright © 2017 David Bryant

#include "termed/support/pipe.hxx"
#include "termed/support/exception.hxx"

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

SignalPipe::SignalPipe() {
    int fds[2];
    // pipe2() doesn't raise EINTR.
    THROW_IF_SYSCALL_FAILS(::pipe2(fds, O_NONBLOCK | O_CLOEXEC), "pipe2()");
    _readFd  = fds[0];
    _writeFd = fds[1];
}

SignalPipe::~SignalPipe() {
    TEMP_FAILURE_RETRY(::close(_readFd));
    TEMP_FAILURE_RETRY(::close(_writeFd));
}

void SignalPipe::notify() noexcept {
    auto savedErrno = errno;
    const char byte = 0;
    // A full pipe already has a notification pending.
    auto UNUSED(written) = TEMP_FAILURE_RETRY(::write(_writeFd, &byte, 1));
    errno = savedErrno;
}

bool SignalPipe::drain() {
    std::array<char, 64> buf;
    bool pending = false;

    for (;;) {
        auto rval = TEMP_FAILURE_RETRY(::read(_readFd, buf.data(), buf.size()));

        if (rval > 0) {
            pending = true;
        }
        else if (rval == 0 || errno == EAGAIN) {
            return pending;
        }
        else {
            THROW_SYSTEM_ERROR(errno, "read()");
        }
    }
}
