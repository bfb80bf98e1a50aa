// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/utf8.hxx"

namespace utf8 {

Decoder::Result Decoder::consume(uint8_t byte) noexcept {
    if (_needed == 0) {
        reset();

        if (byte < 0x80) {
            _bytes[_length++] = static_cast<char>(byte);
            return Result::ACCEPT;
        }
        else if (byte >= 0xC2 && byte <= 0xDF) {
            _needed = 1;
        }
        else if (byte >= 0xE0 && byte <= 0xEF) {
            _needed = 2;
            if      (byte == 0xE0) { _lower = 0xA0; }   // Overlong.
            else if (byte == 0xED) { _upper = 0x9F; }   // Surrogates.
        }
        else if (byte >= 0xF0 && byte <= 0xF4) {
            _needed = 3;
            if      (byte == 0xF0) { _lower = 0x90; }   // Overlong.
            else if (byte == 0xF4) { _upper = 0x8F; }   // Beyond U+10FFFF.
        }
        else {
            // A stray continuation byte, 0xC0, 0xC1 or 0xF5 and above.
            return Result::REJECT;
        }

        _bytes[_length++] = static_cast<char>(byte);
        return Result::PENDING;
    }

    if (byte < _lower || byte > _upper) {
        reset();
        return Result::REJECT;
    }

    _lower = 0x80;
    _upper = 0xBF;
    _bytes[_length++] = static_cast<char>(byte);

    return --_needed == 0 ? Result::ACCEPT : Result::PENDING;
}

void Decoder::reset() noexcept {
    _length = 0;
    _needed = 0;
    _lower  = 0x80;
    _upper  = 0xBF;
}

} // namespace utf8
