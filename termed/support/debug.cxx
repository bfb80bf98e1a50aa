// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/debug.hxx"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <streambuf>

namespace {

    // Discards everything written to it.
    class NullBuffer final : public std::streambuf {
    protected:
        int overflow(int c) override { return traits_type::not_eof(c); }
        std::streamsize xsputn(const char *, std::streamsize n) override { return n; }
    };

    NullBuffer   nullBuffer;
    std::ostream nullOstream(&nullBuffer);

    std::ostream * currentLogStream = &std::cerr;

    const char * levelName(LogLevel level) {
        switch (level) {
            case LogLevel::INFO:    return "INFO ";
            case LogLevel::WARNING: return "WARN ";
            case LogLevel::ERROR:   return "ERROR";
        }
        return "?????";
    }

    // Strip the directories, "termed/tty/editor.cxx" is plenty.
    const char * shortFile(const char * file) {
        const char * found = std::strstr(file, "termed/");
        return found ? found : file;
    }

} // namespace

std::ostream & logStream() noexcept {
    return *currentLogStream;
}

std::ostream * setLogStream(std::ostream * ost) noexcept {
    auto oldStream   = currentLogStream;
    currentLogStream = ost ? ost : &std::cerr;
    return oldStream;
}

std::ostream & nullStream() noexcept {
    return nullOstream;
}

std::ostream & logLine(LogLevel level, const char * file, int line) {
    using Clock = std::chrono::system_clock;

    auto now    = Clock::now();
    auto time   = Clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm local;
    ::localtime_r(&time, &local);

    auto & ost = logStream();
    ost << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << std::setfill(' ')
        << ' ' << levelName(level) << ' ' << shortFile(file) << ':' << line << ' ';
    return ost;
}

void fail(const char * file, int line, const std::string & what) {
    std::cerr << shortFile(file) << ':' << line << ' ' << what << std::endl;
    std::abort();
}
