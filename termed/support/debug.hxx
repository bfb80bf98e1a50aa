// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__DEBUG__HXX
#define SUPPORT__DEBUG__HXX

#include <iostream>
#include <cstring>
#include <cerrno>
#include <sstream>
#include <string>

enum class LogLevel { INFO, WARNING, ERROR };

// Where PRINT, WARNING and ERROR go. Defaults to std::cerr. While the
// editor owns the screen it is pointed at the log file, or at nullStream()
// when there is none, so diagnostics don't land on the display.
std::ostream & logStream() noexcept;
std::ostream * setLogStream(std::ostream * ost) noexcept;
std::ostream & nullStream() noexcept;

// Start a log entry: "HH:MM:SS.mmm LEVEL file:line ". Returns logStream().
std::ostream & logLine(LogLevel level, const char * file, int line);

// Report a broken invariant on std::cerr and abort.
[[noreturn]] void fail(const char * file, int line, const std::string & what);

#define LIKELY(x) __builtin_expect(!!(x), 1)

#define UNUSED(x) UNUSED_##x __attribute__((unused))

#define LOG_AT(level, output) \
    do { logLine(level, __FILE__, __LINE__) output << std::endl; } while (false)

#define PRINT(output)   LOG_AT(LogLevel::INFO,    output)
#define WARNING(output) LOG_AT(LogLevel::WARNING, output)
#define ERROR(output)   LOG_AT(LogLevel::ERROR,   output)

#define FAIL_WITH(prefix, output) \
    do { \
        std::ostringstream ost_DEBUG; \
        ost_DEBUG << prefix output; \
        fail(__FILE__, __LINE__, ost_DEBUG.str()); \
    } while (false)

#define FATAL(output) FAIL_WITH("", output)

// ENFORCE never gets compiled out
#define ENFORCE(condition, output) \
    do { \
        if (!LIKELY(condition)) { FAIL_WITH("((" #condition ")) ", output); } \
    } while (false)

// ASSERT may be compiled out
#if DEBUG
#define ASSERT(condition, output) ENFORCE(condition, output)
#else
#define ASSERT(condition, output) \
    do { \
    } while (false)
#endif

#endif // SUPPORT__DEBUG__HXX
