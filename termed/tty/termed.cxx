// vi:noai:sw=4
// Copyright © 2013-2014 David Bryant

#include "termed/tty/editor.hxx"
#include "termed/tty/key_decoder.hxx"
#include "termed/tty/terminal.hxx"
#include "termed/common/config.hxx"
#include "termed/support/cmdline.hxx"
#include "termed/support/debug.hxx"
#include "termed/support/exception.hxx"
#include "termed/support/pattern.hxx"
#include "termed/support/pipe.hxx"
#include "termed/support/selector.hxx"

#include <array>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <utility>

#include <unistd.h>
#include <signal.h>

// Feeds terminal input and window size changes to the editor, and redraws
// after each batch. A message bar timeout bounds the wait so an expired
// message disappears without a key press.
class EventLoop final
    : protected I_Selector::I_ReadHandler
    , protected Uncopyable {
    Terminal   & _terminal;
    Editor     & _editor;
    Selector     _selector;
    SignalPipe   _winch;
    KeyDecoder   _decoder;
    bool         _endOfInput = false;

    static EventLoop * _singleton;

public:
    EventLoop(Terminal & terminal, Editor & editor)
        : _terminal(terminal)
        , _editor(editor) {
        ENFORCE(std::exchange(_singleton, this) == nullptr, );
    }

    ~EventLoop() { ENFORCE(std::exchange(_singleton, nullptr) == this, ); }

    void run() {
        struct sigaction action = {};
        action.sa_handler = &staticWinchHandler;
        ::sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;

        struct sigaction previous;
        THROW_IF_SYSCALL_FAILS(::sigaction(SIGWINCH, &action, &previous), "sigaction()");
        ScopeGuard restoreAction([previous]() { ::sigaction(SIGWINCH, &previous, nullptr); });

        _selector.addReadable(_terminal.inFd(), this);
        ScopeGuard removeInput([this]() { _selector.removeReadable(_terminal.inFd()); });
        _selector.addReadable(_winch.readFd(), this);
        ScopeGuard removeWinch([this]() { _selector.removeReadable(_winch.readFd()); });

        _editor.resize(_terminal.size());
        draw();

        while (!_endOfInput && !_editor.shouldQuit()) {
            auto expiresIn = _editor.messageExpiresIn();
            _selector.animate(expiresIn == 0 ? -1 : static_cast<int>(expiresIn));
            draw();
        }
    }

protected:
    static void staticWinchHandler(int UNUSED(sigNum)) {
        if (_singleton) { _singleton->_winch.notify(); }
    }

    void draw() {
        _terminal.beginFrame();
        _editor.render(_terminal);
        _terminal.setTitle(_editor.title());
        _terminal.endFrame(_editor.caretPosition());
    }

    void resized() {
        // Coalesced signals need only one resize.
        if (_winch.drain()) {
            _editor.resize(_terminal.size());
            _editor.setNeedsRedraw();
        }
    }

    void input() {
        std::array<uint8_t, BUFSIZ> buf;

        auto rval = THROW_IF_SYSCALL_FAILS(::read(_terminal.inFd(),
                                                  static_cast<void *>(buf.data()),
                                                  buf.size()),
                                           "read()");

        if (rval == 0) {
            PRINT(<< "End of input");
            _endOfInput = true;
            return;
        }

        std::vector<KeyEvent> events;
        _decoder.consumeRead(buf.data(), static_cast<size_t>(rval), buf.size(), events);

        for (auto & event : events) {
            _editor.handleKey(event);
            if (_editor.shouldQuit()) { break; }
        }
    }

    // I_Selector::I_ReadHandler implementation:

    void handleRead(int fd) override {
        if (fd == _winch.readFd()) { resized(); }
        else                       { input();   }
    }
};

EventLoop * EventLoop::_singleton = nullptr;

//
//
//

namespace {

const char USAGE[] =
    "Usage: termed [OPTION]... [FILE]\n"
    "\n"
    "  --log-file=PATH             append diagnostics to PATH\n"
    "  --quit-times=N              Ctrl-Q presses to discard changes\n"
    "  --message-timeout=MS        how long messages stay\n"
    "  --[no-]welcome              show the welcome banner on an empty buffer\n"
    "  --help                      show this help\n"
    "  --version                   show the version\n";

} // namespace {anonymous}

int main(int argc, char * argv[]) try {
    Config config;

    parseConfig(config);

    CmdLine cmdLine;
    cmdLine.add(std::make_unique<ValueHandler<std::string>>(config.logFile), "log-file");
    cmdLine.add(std::make_unique<ValueHandler<int>>(config.quitTimes), "quit-times");
    cmdLine.add(std::make_unique<ValueHandler<uint32_t>>(config.messageTimeout), "message-timeout");
    cmdLine.add(std::make_unique<FlagHandler>(config.showWelcome), "welcome");

    auto result = cmdLine.parse(argc, argv);

    switch (result.outcome) {
        case CmdLine::Outcome::SHOW_HELP:
            std::cout << USAGE;
            return 0;
        case CmdLine::Outcome::SHOW_VERSION:
            std::cout << "termed " << VERSION << std::endl;
            return 0;
        case CmdLine::Outcome::RUN:
            break;
    }

    auto & arguments = result.arguments;

    THROW_UNLESS(arguments.size() <= 1, UserError("Too many arguments, expected one FILE"));
    THROW_UNLESS(config.quitTimes >= 1, UserError("--quit-times must be at least 1"));

    std::ofstream logFile;

    if (!config.logFile.empty()) {
        logFile.open(config.logFile, std::ios::app);
        THROW_UNLESS(logFile.good(), UserError("Could not open log file: " + config.logFile));
    }

    // The screen belongs to the editor from here on.
    auto previousLog = setLogStream(logFile.is_open() ? &logFile : &nullStream());
    ScopeGuard restoreLog([previousLog]() { setLogStream(previousLog); });

    bool quit;

    {
        Terminal terminal(config);
        Editor   editor(config);

        if (!arguments.empty()) { editor.open(arguments.front()); }

        EventLoop eventLoop(terminal, editor);
        eventLoop.run();
        quit = editor.shouldQuit();
    }

    if (quit) { std::cout << "Goodbye." << std::endl; }

    return 0;
}
catch (const UserError & ex) {
    std::cerr << ex.message() << std::endl;
    return 1;
}
catch (const Exception & ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
}
