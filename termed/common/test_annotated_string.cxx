// vi:noai:sw=4
// Copyright © 2015 David Bryant

#include "termed/common/annotated_string.hxx"
#include "termed/support/test.hxx"

namespace {

std::vector<Span> collect(const Line & line,
                          std::vector<Annotation> annotations,
                          size_t left, size_t right) {
    AnnotatedStringIterator iter(line, std::move(annotations), left, right);
    std::vector<Span> spans;
    Span span;

    while (iter.next(span)) {
        spans.push_back(span);
    }

    return spans;
}

void testPlain(Test & test) {
    Line line("abcdef");

    auto spans = collect(line, {}, 0, 10);
    test.enforceEqual(spans.size(), 1u, "One span");
    test.enforceEqual(spans[0].text, std::string("abcdef"), "Whole line");
    test.enforce(!spans[0].type, "Unstyled");
    test.enforceEqual(spans[0].width, 6u, "Width");

    spans = collect(line, {}, 2, 4);
    test.enforceEqual(spans.size(), 1u, "Windowed");
    test.enforceEqual(spans[0].text, std::string("cd"), "Middle");

    test.enforce(collect(line, {}, 6, 10).empty(), "Past the end");
    test.enforce(collect(Line(), {}, 0, 10).empty(), "Empty line");
    test.enforce(collect(line, {}, 3, 3).empty(), "Empty window");
}

void testPrecedence(Test & test) {
    Line line("abcdef");

    auto spans = collect(line,
                         {
                             Annotation{AnnotationType::MATCH,          1, 3},
                             Annotation{AnnotationType::SELECTED_MATCH, 2, 4}
                         },
                         0, 6);

    test.enforceEqual(spans.size(), 4u, "Four spans");
    test.enforceEqual(spans[0].text, std::string("a"), "Before");
    test.enforceEqual(spans[1].text, std::string("b"), "Match only");
    test.enforce(spans[1].type == AnnotationType::MATCH, "Match style");
    test.enforceEqual(spans[2].text, std::string("cd"), "Overlap resolved");
    test.enforce(spans[2].type == AnnotationType::SELECTED_MATCH, "Selected match wins");
    test.enforceEqual(spans[3].text, std::string("ef"), "After");

    spans = collect(line,
                    {
                        Annotation{AnnotationType::MATCH,     0, 3},
                        Annotation{AnnotationType::SELECTION, 0, 3}
                    },
                    0, 6);

    test.enforce(spans[0].type == AnnotationType::SELECTION, "Selection beats match");

    spans = collect(line, { Annotation{AnnotationType::MATCH, 2, 2} }, 0, 6);
    test.enforceEqual(spans.size(), 1u, "Empty annotation ignored");
}

void testClipping(Test & test) {
    Line line(u8"a\u4E2Db");

    auto spans = collect(line, {}, 2, 4);
    test.enforceEqual(spans.size(), 1u, "Merged");
    test.enforceEqual(spans[0].text, std::string(" b"), "Left half of wide glyph cut");
    test.enforceEqual(spans[0].width, 2u, "Width of window");

    spans = collect(line, {}, 0, 2);
    test.enforceEqual(spans[0].text, std::string("a "), "Right half of wide glyph cut");

    spans = collect(line, {}, 1, 3);
    test.enforceEqual(spans[0].text, std::string(u8"\u4E2D"), "Whole wide glyph");

    Line wide(u8"\u4E2D");
    test.enforce(collect(wide, {}, 1, 1).empty(), "Empty window inside a wide glyph");
    test.enforce(collect(wide, {Annotation{AnnotationType::MATCH, 0, 3}}, 1, 1).empty(),
                 "Empty window inside an annotated wide glyph");
}

void testReplacements(Test & test) {
    Line line("a\tb");

    auto spans = collect(line, {}, 0, 3);
    test.enforceEqual(spans[0].text, std::string("a b"), "Tab drawn as a space");
}

} // namespace {anonymous}

int main() {
    Test test("common/annotated_string");
    test.run("plain", testPlain);
    test.run("precedence", testPrecedence);
    test.run("clipping", testClipping);
    test.run("replacements", testReplacements);
    return 0;
}
