// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__UTF8__HXX
#define COMMON__UTF8__HXX

#include <array>
#include <cstdint>
#include <string>

namespace utf8 {

// Negative values stand for ill-formed input.
using CodePoint = int32_t;

// U+FFFD REPLACEMENT CHARACTER, encoded.
constexpr char REPLACEMENT[] = "\xEF\xBF\xBD";

//
// Assembles characters from a byte stream, such as keyboard input, one byte
// at a time. Only well-formed sequences are accepted: overlong forms,
// surrogates and anything beyond U+10FFFF are rejected at the first byte
// that proves them bad.
//
class Decoder {
public:
    enum class Result {
        PENDING,        // Need more bytes.
        ACCEPT,         // sequence() is a whole character.
        REJECT          // The bytes so far are discarded.
    };

private:
    std::array<char, 4> _bytes;
    uint8_t             _length = 0;
    uint8_t             _needed = 0;    // Continuation bytes still to come.
    uint8_t             _lower  = 0x80; // Range of the next continuation byte.
    uint8_t             _upper  = 0xBF;

public:
    Result consume(uint8_t byte) noexcept;

    // Part way through a multi byte sequence.
    bool pending() const noexcept { return _needed != 0; }

    std::string sequence() const { return std::string(_bytes.data(), _length); }

    // Abandon a partial sequence.
    void reset() noexcept;
};

} // namespace utf8

#endif // COMMON__UTF8__HXX
