// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/tty/terminal.hxx"
#include "termed/support/escape.hxx"
#include "termed/support/exception.hxx"
#include "termed/support/sys.hxx"

#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <sys/ioctl.h>

Terminal::Terminal(const Config & config) :
    _config(config),
    _inFd(STDIN_FILENO),
    _outFd(STDOUT_FILENO)
{
    THROW_UNLESS(::isatty(_inFd) && ::isatty(_outFd),
                 UserError("termed must be run in a terminal"));

    THROW_IF_SYSCALL_FAILS(::tcgetattr(_inFd, &_savedTermios), "tcgetattr()");

    auto raw = _savedTermios;
    ::cfmakeraw(&raw);
    raw.c_cc[VMIN]  = 1;
    raw.c_cc[VTIME] = 0;
    THROW_IF_SYSCALL_FAILS(::tcsetattr(_inFd, TCSAFLUSH, &raw), "tcsetattr()");

    _frame << CSIEsc::alternateScreen(true) << CSIEsc::clearScreen();

    try {
        flush();
    }
    catch (const Exception &) {
        if (::tcsetattr(_inFd, TCSAFLUSH, &_savedTermios) == -1) {
            ERROR(<< "Failed to restore terminal attributes: " << std::strerror(errno));
        }
        throw;
    }
}

Terminal::~Terminal() {
    _frame.str(std::string());
    _frame << SGR::RESET_ALL
           << CSIEsc::clearScreen()
           << CSIEsc::showCursor(true)
           << CSIEsc::alternateScreen(false);

    try {
        flush();
    }
    catch (const Exception & ex) {
        ERROR(<< "Failed to restore screen: " << ex.what());
    }

    if (::tcsetattr(_inFd, TCSAFLUSH, &_savedTermios) == -1) {
        ERROR(<< "Failed to restore terminal attributes: " << std::strerror(errno));
    }
}

Size Terminal::size() const {
    struct winsize winsize;
    THROW_IF_SYSCALL_FAILS(::ioctl(_outFd, TIOCGWINSZ, &winsize), "ioctl(TIOCGWINSZ)");
    return Size(winsize.ws_row, winsize.ws_col);
}

void Terminal::beginFrame() {
    _frame << CSIEsc::showCursor(false);
}

void Terminal::endFrame(Position caret) {
    _frame << MoveCursor(static_cast<uint16_t>(caret.row), static_cast<uint16_t>(caret.col))
           << CSIEsc::showCursor(true);
    flush();
}

void Terminal::setTitle(const std::string & title) {
    if (title != _title) {
        _title = title;
        _frame << SetTitle(_title);
    }
}

void Terminal::paintSpans(uint16_t row, AnnotatedStringIterator & spans) {
    _frame << MoveCursor(row, 0);

    Span span;

    while (spans.next(span)) {
        if (span.type) {
            style(*span.type);
            _frame << span.text << SGR::RESET_ALL;
        }
        else {
            _frame << span.text;
        }
    }

    _frame << CSIEsc::clearLine();
}

void Terminal::paintText(uint16_t row, const std::string & text) {
    _frame << MoveCursor(row, 0) << text << CSIEsc::clearLine();
}

void Terminal::paintInverse(uint16_t row, const std::string & text) {
    _frame << MoveCursor(row, 0)
           << SGR::INVERSE << text << SGR::RESET_ALL
           << CSIEsc::clearLine();
}

void Terminal::style(AnnotationType type) {
    Color fg, bg;

    switch (type) {
        case AnnotationType::MATCH:
            fg = _config.matchFgColor;
            bg = _config.matchBgColor;
            break;
        case AnnotationType::SELECTED_MATCH:
            fg = _config.selectedMatchFgColor;
            bg = _config.selectedMatchBgColor;
            break;
        case AnnotationType::SELECTION:
            fg = _config.selectionFgColor;
            bg = _config.selectionBgColor;
            break;
    }

    _frame << CSIEsc::fg24bit(fg.r, fg.g, fg.b) << CSIEsc::bg24bit(bg.r, bg.g, bg.b);
}

void Terminal::flush() {
    auto data = _frame.str();
    _frame.str(std::string());
    writeAll(_outFd, data);
}
