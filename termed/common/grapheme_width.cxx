// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/grapheme_width.hxx"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace {

constexpr UChar32 VARIATION_SELECTOR_16 = 0xFE0F;

// Iterate the code points of a UTF-8 string. Ill-formed sequences are
// reported as negative values.
template <typename Func>
void forEachCodePoint(const std::string & str, Func && func) {
    auto    data   = reinterpret_cast<const uint8_t *>(str.data());
    int32_t length = static_cast<int32_t>(str.size());
    int32_t i      = 0;

    while (i < length) {
        UChar32 c;
        U8_NEXT(data, i, length, c);
        if (!func(c)) { break; }
    }
}

} // namespace {anonymous}

uint8_t codePointWidth(utf8::CodePoint codePoint) {
    if (codePoint < 0) {
        // Ill-formed, drawn as U+FFFD.
        return 1;
    }

    switch (u_charType(codePoint)) {
        case U_NON_SPACING_MARK:
        case U_ENCLOSING_MARK:
        case U_FORMAT_CHAR:
        case U_CONTROL_CHAR:
            return 0;
        default:
            break;
    }

    switch (u_getIntPropertyValue(codePoint, UCHAR_HANGUL_SYLLABLE_TYPE)) {
        case U_HST_VOWEL_JAMO:
        case U_HST_TRAILING_JAMO:
            // Conjoined with the preceding leading jamo.
            return 0;
        default:
            break;
    }

    switch (u_getIntPropertyValue(codePoint, UCHAR_EAST_ASIAN_WIDTH)) {
        case U_EA_WIDE:
        case U_EA_FULLWIDTH:
            return 2;
        default:
            break;
    }

    if (u_hasBinaryProperty(codePoint, UCHAR_EMOJI_PRESENTATION)) {
        return 2;
    }

    return 1;
}

uint8_t graphemeWidth(const std::string & cluster) {
    uint8_t width        = 0;
    bool    pictographic = false;

    forEachCodePoint(cluster, [&](UChar32 c) {
        if (width == 0) {
            width        = codePointWidth(c);
            pictographic = c >= 0 && u_hasBinaryProperty(c, UCHAR_EXTENDED_PICTOGRAPHIC);
            return true;
        }
        else if (c == VARIATION_SELECTOR_16 && pictographic) {
            width = 2;
            return false;
        }
        else {
            return true;
        }
    });

    return width;
}

bool isControl(const std::string & cluster) {
    // CR LF is a single cluster made only of controls.
    bool control = !cluster.empty();

    forEachCodePoint(cluster, [&](UChar32 c) {
        control = c >= 0 && u_charType(c) == U_CONTROL_CHAR;
        return control;
    });

    return control;
}

bool isMalformed(const std::string & cluster) {
    bool malformed = false;

    forEachCodePoint(cluster, [&](UChar32 c) {
        malformed = c < 0;
        return !malformed;
    });

    return malformed;
}

bool isWhitespace(const std::string & cluster) {
    if (cluster.empty()) {
        return false;
    }

    bool whitespace = true;

    forEachCodePoint(cluster, [&](UChar32 c) {
        whitespace = c >= 0 && u_hasBinaryProperty(c, UCHAR_WHITE_SPACE);
        return whitespace;
    });

    return whitespace;
}
