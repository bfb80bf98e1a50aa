// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__CONV__HXX
#define SUPPORT__CONV__HXX

#include "termed/support/exception.hxx"

#include <string>
#include <vector>
#include <sstream>
#include <cstdint>

// Break a configuration line into words separated by blanks. A word may be
// double quoted to hold blanks, and inside quotes \" and \\ escape. A line
// whose first word starts with '#' is a comment. Blank lines and comments
// give no words. Throws ParseError on a dangling quote or escape.
std::vector<std::string> tokenize(const std::string & line);

// Break a list such as $XDG_CONFIG_DIRS at 'sep', dropping empty elements.
std::vector<std::string> splitList(const std::string & list, char sep);

template <typename... Args>
std::string stringify(const Args &... args) {
    std::ostringstream ost;
    ost << std::boolalpha;
    (ost << ... << args);
    return ost.str();
}

// Parse all of 'str' as a T. Leading and trailing blanks are allowed,
// anything else left over is a ConversionError.
template <typename T>
T unstringify(const std::string & str) {
    std::istringstream ist(str);
    T t{};
    ist >> t;
    if (!ist.fail() && !ist.eof()) { ist >> std::ws; }
    THROW_UNLESS(!ist.fail() && ist.eof(),
                 ConversionError("Not a valid value: '" + str + "'"));
    return t;
}

template <>
inline std::string unstringify<>(const std::string & str) {
    return str;
}

// Accepts true/false, yes/no, on/off and 1/0.
template <>
bool unstringify<>(const std::string & str);

// Hex digit for the low four bits of 'value', upper case.
inline char hexDigit(uint8_t value) {
    value &= 0x0F;
    return static_cast<char>(value < 10 ? '0' + value : 'A' + (value - 10));
}

// Value of one hex digit, either case. Throws ConversionError.
uint8_t hexValue(char digit);

// Byte from two hex digits, most significant first.
inline uint8_t hexByte(char high, char low) {
    return static_cast<uint8_t>((hexValue(high) << 4) | hexValue(low));
}

#endif // SUPPORT__CONV__HXX
