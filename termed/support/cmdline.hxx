// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__CMDLINE__HXX
#define SUPPORT__CMDLINE__HXX

#include "termed/support/conv.hxx"
#include "termed/support/pattern.hxx"

#include <map>
#include <memory>
#include <string>
#include <vector>

// GNU style options: --name=VALUE, --name VALUE, --[no-]flag, -x VALUE,
// -xVALUE and bundled short flags. "--" ends the options.
class CmdLine final : protected Uncopyable {
public:
    class I_Handler {
    public:
        virtual bool negatable() const = 0;
        virtual bool takesValue() const = 0;
        virtual void handle(bool negated, const std::string & value) = 0;

        virtual ~I_Handler() = default;
    };

    enum class Outcome { RUN, SHOW_HELP, SHOW_VERSION };

    struct Result {
        Outcome                  outcome = Outcome::RUN;
        std::vector<std::string> arguments;
    };

private:
    struct Option {
        std::unique_ptr<I_Handler> handler;
        std::string                name;
        char                       letter;
    };

    std::vector<Option>          _options;
    std::map<std::string, size_t> _byName;
    std::map<char, size_t>        _byLetter;

public:
    CmdLine() = default;

    // 'letter' of '\0' means no short form.
    void add(std::unique_ptr<I_Handler> handler, const std::string & name, char letter = '\0');

    // Throws UserError for unknown options, missing or unwanted values and
    // values the handler rejects. --help and --version stop the parse.
    Result parse(int argc, const char * const * argv);

private:
    // Returns true if the next argument was used as the value.
    bool parseLong(const std::string & arg, const char * next);
    bool parseShort(const std::string & arg, const char * next);

    Option & byName(const std::string & name, const std::string & arg);
    Option & byLetter(char letter);
};

//
//
//

class FlagHandler final : public CmdLine::I_Handler {
    bool & _value;

public:
    explicit FlagHandler(bool & value) : _value(value) {}

    bool negatable()  const override { return true; }
    bool takesValue() const override { return false; }

    void handle(bool negated, const std::string & UNUSED(value)) override {
        _value = !negated;
    }
};

// Converts the value with unstringify<V>.
template <class V>
class ValueHandler final : public CmdLine::I_Handler {
    V & _value;

public:
    explicit ValueHandler(V & value) : _value(value) {}

    bool negatable()  const override { return false; }
    bool takesValue() const override { return true; }

    void handle(bool UNUSED(negated), const std::string & value) override {
        try {
            _value = unstringify<V>(value);
        }
        catch (const ConversionError &) {
            THROW(UserError("Bad option value: '" + value + "'"));
        }
    }
};

#endif // SUPPORT__CMDLINE__HXX
