// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/conv.hxx"

namespace {

bool isBlank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

} // namespace {anonymous}

std::vector<std::string> tokenize(const std::string & line) {
    std::vector<std::string> words;
    auto i = line.begin();

    for (;;) {
        while (i != line.end() && isBlank(*i)) { ++i; }
        if (i == line.end()) { break; }

        if (words.empty() && *i == '#') { break; }

        std::string word;

        if (*i == '"') {
            for (++i; ; ++i) {
                THROW_UNLESS(i != line.end(), ParseError("Unterminated quote."));

                if (*i == '"') {
                    ++i;
                    break;
                }
                else if (*i == '\\') {
                    ++i;
                    THROW_UNLESS(i != line.end(), ParseError("Dangling escape."));
                    word.push_back(*i);
                }
                else {
                    word.push_back(*i);
                }
            }
        }
        else {
            while (i != line.end() && !isBlank(*i)) { word.push_back(*i++); }
        }

        words.push_back(std::move(word));
    }

    return words;
}

std::vector<std::string> splitList(const std::string & list, char sep) {
    std::vector<std::string> elements;
    std::string::size_type begin = 0;

    while (begin <= list.size()) {
        auto end = list.find(sep, begin);
        if (end == std::string::npos) { end = list.size(); }

        if (end != begin) { elements.push_back(list.substr(begin, end - begin)); }

        begin = end + 1;
    }

    return elements;
}

template <>
bool unstringify<>(const std::string & str) {
    static const char * const TRUTHS[] = { "true",  "yes", "on",  "1" };
    static const char * const LIES[]   = { "false", "no",  "off", "0" };

    for (auto t : TRUTHS) { if (str == t) { return true;  } }
    for (auto l : LIES)   { if (str == l) { return false; } }

    THROW(ConversionError("Not a boolean: '" + str + "'"));
}

uint8_t hexValue(char digit) {
    if (digit >= '0' && digit <= '9') { return static_cast<uint8_t>(digit - '0'); }
    if (digit >= 'A' && digit <= 'F') { return static_cast<uint8_t>(10 + digit - 'A'); }
    if (digit >= 'a' && digit <= 'f') { return static_cast<uint8_t>(10 + digit - 'a'); }

    THROW(ConversionError(std::string("Not a hex digit: '") + digit + "'"));
}
