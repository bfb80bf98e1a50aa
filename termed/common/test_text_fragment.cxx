// vi:noai:sw=4
// Copyright © 2015 David Bryant

#include "termed/common/grapheme_width.hxx"
#include "termed/common/text_fragment.hxx"
#include "termed/support/test.hxx"

namespace {

void testCodePointWidth(Test & test) {
    test.enforceEqual(int(codePointWidth('a')),     1, "ASCII");
    test.enforceEqual(int(codePointWidth(0x4E2D)),  2, "CJK ideograph");
    test.enforceEqual(int(codePointWidth(0xFF21)),  2, "Fullwidth A");
    test.enforceEqual(int(codePointWidth(0x1F389)), 2, "Emoji presentation");
    test.enforceEqual(int(codePointWidth(0x0301)),  0, "Combining acute");
    test.enforceEqual(int(codePointWidth(0x200D)),  0, "ZWJ");
    test.enforceEqual(int(codePointWidth(0x0001)),  0, "Control");
    test.enforceEqual(int(codePointWidth(0x1161)),  0, "Hangul vowel jamo");
    test.enforceEqual(int(codePointWidth(-1)),      1, "Invalid");
}

void testGraphemeWidth(Test & test) {
    test.enforceEqual(int(graphemeWidth("a")),                  1, "ASCII");
    test.enforceEqual(int(graphemeWidth(u8"e\u0301")),          1, "Decomposed e acute");
    test.enforceEqual(int(graphemeWidth(u8"\u4E2D")),           2, "CJK");
    test.enforceEqual(int(graphemeWidth(u8"\U0001F389")),       2, "Party popper");
    test.enforceEqual(int(graphemeWidth(u8"\u2764")),           1, "Text heart");
    test.enforceEqual(int(graphemeWidth(u8"\u2764\uFE0F")),     2, "Heart with VS16");
    test.enforceEqual(int(graphemeWidth(u8"\U0001F468\u200D\U0001F469\u200D\U0001F467")),
                      2, "ZWJ family");
    test.enforceEqual(int(graphemeWidth(u8"\u200B")),           0, "Zero width space");

    test.enforce(isControl("\x01"), "SOH is a control");
    test.enforce(!isControl("a"), "a is not a control");
    test.enforce(isControl("\r\n"), "CR LF is a control");
    test.enforce(!isControl(""), "Empty is not a control");
    test.enforce(isMalformed("\xFF"), "Lone 0xFF");
    test.enforce(isMalformed("\xE4\xB8"), "Truncated");
    test.enforce(!isMalformed(u8"\u4E2D"), "Well formed");
    test.enforce(isWhitespace(u8"\u00A0"), "No-break space");
    test.enforce(!isWhitespace(u8"\u200B"), "Zero width space isn't White_Space");
}

void testFragmentize(Test & test) {
    auto fragments = fragmentize(u8"ae\u0301\u4E2D\t");

    test.enforceEqual(fragments.size(), 4u, "Cluster count");
    test.enforceEqual(fragments[1].grapheme, std::string(u8"e\u0301"), "Combined cluster");
    test.enforceEqual(fragments[1].start, 1u, "Byte offset");
    test.enforceEqual(int(fragments[2].width), 2, "Wide");
    test.enforceEqual(fragments[2].start, 4u, "After the combining mark");
    test.enforceEqual(fragments[3].glyph(), std::string(" "), "Tab drawn as a space");
    test.enforceEqual(fragments.back().end(), std::string(u8"ae\u0301\u4E2D\t").size(), "Gapless");

    test.enforce(fragmentize("").empty(), "Empty text");
}

void testReplacements(Test & test) {
    auto fragments = fragmentize(u8" \u00A0\u200B" "\x01" "\xFF" "x");

    test.enforceEqual(fragments.size(), 6u, "Cluster count");
    test.enforce(!fragments[0].replacement, "Plain space drawn as is");
    test.enforceEqual(fragments[1].glyph(), std::string(u8"\u2423"), "Other whitespace");
    test.enforceEqual(fragments[2].glyph(), std::string(u8"\u00B7"), "Zero width");
    test.enforceEqual(fragments[3].glyph(), std::string(u8"\u25AF"), "Control");
    test.enforceEqual(fragments[4].glyph(), std::string(u8"\uFFFD"), "Malformed");
    test.enforceEqual(fragments[4].grapheme, std::string("\xFF"), "Original bytes kept");

    for (size_t i = 1; i != 5; ++i) {
        test.enforceEqual(int(fragments[i].width), 1, "Replacements take one column");
    }

    fragments = fragmentize("a\r\nb");
    test.enforceEqual(fragments.size(), 3u, "CR LF is one cluster");
    test.enforceEqual(fragments[1].glyph(), std::string(u8"\u25AF"), "CR LF drawn as a control");
    test.enforceEqual(fragments[1].start, 1u, "CR LF offset");
}

} // namespace {anonymous}

int main() {
    Test test("common/text_fragment");
    test.run("code-point-width", testCodePointWidth);
    test.run("grapheme-width", testGraphemeWidth);
    test.run("fragmentize", testFragmentize);
    test.run("replacements", testReplacements);
    return 0;
}
