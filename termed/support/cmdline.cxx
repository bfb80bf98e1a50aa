// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/cmdline.hxx"

void CmdLine::add(std::unique_ptr<I_Handler> handler, const std::string & name, char letter) {
    ENFORCE(!name.empty(), );
    ENFORCE(_byName.count(name) == 0, << name);

    auto index = _options.size();
    _byName[name] = index;

    if (letter != '\0') {
        ENFORCE(_byLetter.count(letter) == 0, << letter);
        _byLetter[letter] = index;
    }

    _options.push_back(Option{std::move(handler), name, letter});
}

CmdLine::Result CmdLine::parse(int argc, const char * const * argv) {
    ENFORCE(argc >= 1, );

    Result result;
    bool   optionsDone = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg  = argv[i];
        auto        next = i + 1 < argc ? argv[i + 1] : nullptr;

        if (optionsDone || arg.size() < 2 || arg[0] != '-') {
            // A lone "-" is positional too.
            result.arguments.push_back(arg);
        }
        else if (arg == "--") {
            optionsDone = true;
        }
        else if (arg == "--help") {
            result.outcome = Outcome::SHOW_HELP;
            return result;
        }
        else if (arg == "--version") {
            result.outcome = Outcome::SHOW_VERSION;
            return result;
        }
        else if (arg[1] == '-') {
            if (parseLong(arg, next)) { ++i; }
        }
        else {
            if (parseShort(arg, next)) { ++i; }
        }
    }

    return result;
}

bool CmdLine::parseLong(const std::string & arg, const char * next) {
    auto name     = arg.substr(2);
    bool negated  = false;
    bool attached = false;
    std::string value;

    auto equals = name.find('=');
    if (equals != std::string::npos) {
        value    = name.substr(equals + 1);
        name     = name.substr(0, equals);
        attached = true;
    }

    if (_byName.count(name) == 0 && name.compare(0, 3, "no-") == 0) {
        name    = name.substr(3);
        negated = true;
    }

    auto & option = byName(name, arg);

    THROW_UNLESS(!negated || option.handler->negatable(),
                 UserError("Option cannot be negated: " + arg));

    if (!option.handler->takesValue()) {
        THROW_UNLESS(!attached, UserError("Option takes no value: " + arg));
        option.handler->handle(negated, value);
        return false;
    }

    if (attached) {
        option.handler->handle(false, value);
        return false;
    }

    THROW_UNLESS(next, UserError("No value provided for: " + arg));
    option.handler->handle(false, next);
    return true;
}

bool CmdLine::parseShort(const std::string & arg, const char * next) {
    for (size_t j = 1; j != arg.size(); ++j) {
        auto & option = byLetter(arg[j]);

        if (!option.handler->takesValue()) {
            option.handler->handle(false, std::string());
            continue;
        }

        // The value is the rest of this argument, or else the next one.
        if (j + 1 != arg.size()) {
            option.handler->handle(false, arg.substr(j + 1));
            return false;
        }

        THROW_UNLESS(next, UserError("No value provided for: " + arg));
        option.handler->handle(false, next);
        return true;
    }

    return false;
}

CmdLine::Option & CmdLine::byName(const std::string & name, const std::string & arg) {
    auto iter = _byName.find(name);
    THROW_UNLESS(iter != _byName.end(), UserError("Unknown option: " + arg));
    return _options[iter->second];
}

CmdLine::Option & CmdLine::byLetter(char letter) {
    auto iter = _byLetter.find(letter);
    THROW_UNLESS(iter != _byLetter.end(), UserError(std::string("Unknown option: -") + letter));
    return _options[iter->second];
}
