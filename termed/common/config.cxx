// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/config.hxx"
#include "termed/support/conv.hxx"
#include "termed/support/debug.hxx"
#include "termed/support/exception.hxx"
#include "termed/support/pattern.hxx"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <unordered_map>

namespace {

class Parser final : protected Uncopyable {
    class Handler {
    public:
        virtual ~Handler() {}

        virtual void handle(const std::string & value) = 0;
    };

    using HandlerMap = std::unordered_map<std::string, std::unique_ptr<Handler>>;

    //

    template <class T>
    class SimpleHandler final : public Handler {
        T & _t;
    public:
        explicit SimpleHandler(T & t) : _t(t) {}

        void handle(const std::string & value) override {
            _t = unstringify<T>(value);
        }
    };

    //

    template <class F>
    class GenericHandler final : public Handler {
        F _func;
    public:
        explicit GenericHandler(F func) : _func(func) {}
        void handle(const std::string & value) override {
            _func(value);
        }
    };

    //

    Config     & _config;
    HandlerMap   _handlers;

    template <class T>
    void registerSimpleHandler(const std::string & name, T & value) {
        _handlers.insert({name, std::make_unique<SimpleHandler<T>>(value)});
    }

    template <class F>
    void registerGenericHandler(const std::string & name, F func) {
        _handlers.insert({name, std::make_unique<GenericHandler<F>>(func)});
    }

public:
    explicit Parser(Config & config);

    void   parse();
    size_t parse(std::istream & ist, const std::string & origin);

private:
    bool tryPath(const std::string & path);
    void interpretTokens(const std::vector<std::string> & tokens);
    void handleSet(const std::string & key, const std::string & value);
};

//
//
//

Parser::Parser(Config & config) : _config(config) {
    registerSimpleHandler("match-fg-color",          _config.matchFgColor);
    registerSimpleHandler("match-bg-color",          _config.matchBgColor);
    registerSimpleHandler("selected-match-fg-color", _config.selectedMatchFgColor);
    registerSimpleHandler("selected-match-bg-color", _config.selectedMatchBgColor);
    registerSimpleHandler("selection-fg-color",      _config.selectionFgColor);
    registerSimpleHandler("selection-bg-color",      _config.selectionBgColor);

    registerSimpleHandler("message-timeout", _config.messageTimeout);
    registerSimpleHandler("show-welcome",    _config.showWelcome);
    registerSimpleHandler("log-file",        _config.logFile);

    registerGenericHandler("quit-times",
                           [this](const std::string & value) {
                               auto times = unstringify<int>(value);
                               THROW_UNLESS(times >= 1,
                                            ConversionError("quit-times must be at least 1"));
                               _config.quitTimes = times;
                           });
}

void Parser::parse() {
    const std::string conf = "/termed/config";

    auto xdg_config_home = static_cast<const char *>(::getenv("XDG_CONFIG_HOME"));

    if (xdg_config_home) {
        if (tryPath(xdg_config_home + conf)) {
            return;
        }
    }

    auto xdg_config_dirs = static_cast<const char *>(::getenv("XDG_CONFIG_DIRS"));

    if (xdg_config_dirs) {
        for (auto & dir : splitList(xdg_config_dirs, ':')) {
            if (tryPath(dir + conf)) {
                return;
            }
        }
    }

    auto home = static_cast<const char *>(::getenv("HOME"));

    if (home) {
        if (tryPath(home + std::string("/.config") + conf)) {
            return;
        }
    }

    PRINT(<< "No configuration file found.");
}

size_t Parser::parse(std::istream & ist, const std::string & origin) {
    size_t num    = 0;
    size_t errors = 0;
    std::string line;

    while (getline(ist, line)) {
        ++num;

        try {
            auto tokens = tokenize(line);
            if (!tokens.empty()) {
                interpretTokens(tokens);
            }
        }
        catch (const ConversionError & error) {
            std::cerr << origin << ":" << num << ": " << error.message() << std::endl;
            ++errors;
        }
        catch (const ParseError & error) {
            std::cerr << origin << ":" << num << ": " << error.message() << std::endl;
            ++errors;
        }
    }

    return errors;
}

bool Parser::tryPath(const std::string & path) {
    std::ifstream ifs;
    ifs.open(path.c_str());

    if (ifs.good()) {
        parse(ifs, path);
        return true;
    }
    else {
        return false;
    }
}

void Parser::interpretTokens(const std::vector<std::string> & tokens) {
    ASSERT(!tokens.empty(), );

    if (tokens[0] == "set") {
        if (tokens.size() == 3) {
            handleSet(tokens[1], tokens[2]);
        }
        else {
            THROW(ConversionError("Syntax: 'set NAME VALUE'"));
        }
    }
    else {
        THROW(ConversionError("Unrecognised token: '" + tokens[0] + "'"));
    }
}

void Parser::handleSet(const std::string & key, const std::string & value) {
    auto iter = _handlers.find(key);
    if (iter == _handlers.end()) {
        THROW(ConversionError("No such setting: '" + key + "'"));
    }
    else {
        auto & handler = iter->second;
        handler->handle(value);
    }
}

} // namespace {anonymous}

//
//
//

void parseConfig(Config & config) {
    Parser parser(config);
    parser.parse();
}

size_t parseConfig(Config & config, std::istream & ist, const std::string & origin) {
    Parser parser(config);
    return parser.parse(ist, origin);
}
