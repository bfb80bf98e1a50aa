// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__EXCEPTION__HXX
#define SUPPORT__EXCEPTION__HXX

#include "termed/support/debug.hxx"

#include <exception>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

// BSD doesn't have EINTR
#ifndef __linux__
#define TEMP_FAILURE_RETRY(a) (a)
#endif

// Base class for all termed exceptions. message() is the bare text, fit to
// show the user. what() adds the throw site once THROW has recorded it.
class Exception : public std::exception {
    std::string _message;
    std::string _what;

public:
    const std::string & message() const noexcept { return _message; }
    const char * what() const noexcept override { return _what.c_str(); }

    void locate(const char * file, int line);

protected:
    explicit Exception(const std::string & message) : _message(message), _what(message) {}
};

// The user asked for something that can't be done.
class UserError final : public Exception {
public:
    explicit UserError(const std::string & message) : Exception(message) {}
};

// A value didn't parse as the type wanted.
class ConversionError final : public Exception {
public:
    explicit ConversionError(const std::string & message) : Exception(message) {}
};

// A configuration line is malformed.
class ParseError final : public Exception {
public:
    explicit ParseError(const std::string & message) : Exception(message) {}
};

// A system or I/O call failed.
class SystemError final : public Exception {
    std::error_code _ec;

    static std::string describe(const std::error_code & ec, const std::string & context) {
        if (!ec)             { return context; }
        if (context.empty()) { return ec.message(); }
        return context + ": " + ec.message();
    }

public:
    SystemError(std::error_code ec, const std::string & context) :
        Exception(describe(ec, context)),
        _ec(ec)
    {}

    const std::error_code & code() const noexcept { return _ec; }
};

namespace detail {

template <typename E>
E && located(E && exception, const char * file, int line) {
    exception.locate(file, line);
    return std::forward<E>(exception);
}

} // namespace detail

// Throw an exception that remembers where it was thrown, e.g.:
//
//     THROW(UserError("No file name"));
#define THROW(exception_) \
    do { \
        static_assert(std::is_base_of_v<Exception, std::decay_t<decltype(exception_)>>); \
        throw detail::located(exception_, __FILE__, __LINE__); \
    } while (false)

// Throw a SystemError for an errno value, when THROW_IF_SYSCALL_FAILS()
// doesn't fit because some failures are expected:
//
//     if (rval == -1 && errno != EAGAIN) { THROW_SYSTEM_ERROR(errno, "read()"); }
#define THROW_SYSTEM_ERROR(errno_, text) \
    do { \
        int errno_copy = errno_; \
        THROW(SystemError(std::error_code(errno_copy, std::generic_category()), text)); \
    } while (false)

// Throw unless a condition holds, e.g.:
//
//     THROW_UNLESS(count >= 1, ConversionError("Must be at least 1"));
#define THROW_UNLESS(condition, exception) \
    do { \
        if (!(condition)) { \
            THROW(exception); \
        } \
    } while (false)

// Evaluate a system call, retrying on EINTR, and throw a SystemError if it
// returns -1. Otherwise yields the result:
//
//     auto n = THROW_IF_SYSCALL_FAILS(::read(fd, buf, size), "read()");
#define THROW_IF_SYSCALL_FAILS(syscall, text) \
    (__extension__ \
        ({ long int rval_ = TEMP_FAILURE_RETRY(syscall); \
           if (rval_ == -1) { \
               THROW_SYSTEM_ERROR(errno, text); \
           } \
           rval_; }))

#endif // SUPPORT__EXCEPTION__HXX
