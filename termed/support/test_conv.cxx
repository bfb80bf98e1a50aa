// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/conv.hxx"
#include "termed/support/test.hxx"

namespace {

using Words = std::vector<std::string>;

void testTokenize(Test & test) {
    test.enforce(tokenize("").empty(), "Empty line");
    test.enforce(tokenize(" \t \t").empty(), "Blank line");
    test.enforce(tokenize("# set quit-times 2").empty(), "Comment");
    test.enforce(tokenize("\t  #").empty(), "Indented comment");

    test.enforce(tokenize(" set  quit-times\t2 ") == Words{"set", "quit-times", "2"},
                 "Blanks separate words");
    test.enforce(tokenize("set match-bg-color #D3D3D3") == Words{"set", "match-bg-color", "#D3D3D3"},
                 "Hash after the first word is a value");
    test.enforce(tokenize("set log-file \"/tmp/my log\"") == Words{"set", "log-file", "/tmp/my log"},
                 "Quoted blanks");
    test.enforce(tokenize("\"a \\\"b\\\" \\\\c\" \"\"") == Words{"a \"b\" \\c", ""},
                 "Escapes and an empty quote");
    test.enforce(tokenize("set a b\r") == Words{"set", "a", "b"}, "Carriage return");

    test.enforceThrows<ParseError>([]() { tokenize("set log-file \"open"); }, "Unterminated quote");
    test.enforceThrows<ParseError>([]() { tokenize("\"dangling\\"); }, "Dangling escape");
}

void testSplitList(Test & test) {
    test.enforce(splitList("/etc/xdg:/usr/local/etc", ':') == Words{"/etc/xdg", "/usr/local/etc"},
                 "Two directories");
    test.enforce(splitList("::/a::", ':') == Words{"/a"}, "Empty elements dropped");
    test.enforce(splitList("", ':').empty(), "Empty list");
}

void testUnstringify(Test & test) {
    test.enforceEqual(unstringify<int>("42"), 42, "Int");
    test.enforceEqual(unstringify<int>(" -7 "), -7, "Surrounding blanks");
    test.enforceEqual(unstringify<uint32_t>("5000"), 5000u, "Unsigned");
    test.enforceEqual(unstringify<std::string>("a b"), std::string("a b"), "String verbatim");

    test.enforce(unstringify<bool>("yes") && unstringify<bool>("on") && unstringify<bool>("1"),
                 "Truths");
    test.enforce(!unstringify<bool>("no") && !unstringify<bool>("off") && !unstringify<bool>("false"),
                 "Lies");

    test.enforceThrows<ConversionError>([]() { unstringify<int>("forty two"); }, "Not a number");
    test.enforceThrows<ConversionError>([]() { unstringify<int>("3x"); }, "Trailing junk");
    test.enforceThrows<ConversionError>([]() { unstringify<int>(""); }, "Nothing");
    test.enforceThrows<ConversionError>([]() { unstringify<bool>("maybe"); }, "Not a boolean");

    test.enforceEqual(stringify(true), std::string("true"), "Bool text");
    test.enforceEqual(stringify("row ", 3, ':', 7u), std::string("row 3:7"), "Several values");
}

void testHex(Test & test) {
    test.enforceEqual(hexDigit(0x0), '0', "Zero");
    test.enforceEqual(hexDigit(0xB), 'B', "Upper case");
    test.enforceEqual(hexDigit(0x3C), 'C', "High bits ignored");
    test.enforceEqual(int(hexByte('d', '3')), 0xD3, "Lower case pair");
    test.enforceEqual(int(hexByte('F', 'f')), 0xFF, "Mixed case pair");
    test.enforceThrows<ConversionError>([]() { hexValue('g'); }, "Not a hex digit");
}

} // namespace {anonymous}

int main() {
    Test test("support/conv");
    test.run("tokenize", testTokenize);
    test.run("split-list", testSplitList);
    test.run("unstringify", testUnstringify);
    test.run("hex", testHex);
    return 0;
}
