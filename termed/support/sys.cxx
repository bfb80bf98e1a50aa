// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/sys.hxx"
#include "termed/support/debug.hxx"
#include "termed/support/exception.hxx"

#include <unistd.h>
#include <poll.h>

void writeAll(int fd, const std::string & data) {
    ASSERT(fd != -1, );
    size_t offset = 0;

    while (offset != data.size()) {
        auto rval = TEMP_FAILURE_RETRY(::write(fd, data.data() + offset, data.size() - offset));

        if (rval == -1) {
            if (errno == EAGAIN) {
                struct pollfd pfd = { fd, POLLOUT, 0 };
                THROW_IF_SYSCALL_FAILS(::poll(&pfd, 1, -1), "poll()");
                continue;
            }
            THROW_SYSTEM_ERROR(errno, "write()");
        }

        offset += static_cast<size_t>(rval);
    }
}
