// vi:noai:sw=4
// Copyright © 2015 David Bryant

#include "termed/common/command_bar.hxx"
#include "termed/common/message_bar.hxx"
#include "termed/common/status_bar.hxx"
#include "termed/support/test.hxx"

namespace {

class FakePainter final : public I_Painter {
public:
    std::string text;
    bool        inverse = false;

    // I_Painter implementation:

    void paintSpans(uint16_t UNUSED(row), AnnotatedStringIterator & spans) override {
        text.clear();
        Span span;
        while (spans.next(span)) {
            text += span.text;
        }
        inverse = false;
    }

    void paintText(uint16_t UNUSED(row), const std::string & text_) override {
        text    = text_;
        inverse = false;
    }

    void paintInverse(uint16_t UNUSED(row), const std::string & text_) override {
        text    = text_;
        inverse = true;
    }
};

DocumentStatus makeStatus(bool modified) {
    DocumentStatus status;
    status.totalLines  = 12;
    status.currentLine = 2;
    status.modified    = modified;
    status.fileName    = "notes.txt";
    return status;
}

void testStatusBar(Test & test) {
    auto text = StatusBar::format(makeStatus(true), 50);
    test.enforceEqual(text.size(), 50u, "Exact width");
    test.enforceEqual(text.substr(0, 31), std::string("notes.txt - 12 lines (modified)"), "Left part");
    test.enforceEqual(text.substr(46), std::string("3/12"), "Right part");

    text = StatusBar::format(makeStatus(false), 30);
    test.enforceEqual(text.substr(0, 21), std::string("notes.txt - 12 lines "), "Unmodified");

    text = StatusBar::format(makeStatus(true), 20);
    test.enforceEqual(text, std::string(20, ' '), "Blank when too narrow");

    auto status = makeStatus(false);
    status.fileName = "a\x1B" "b";
    text = StatusBar::format(status, 40);
    test.enforce(text.find('\x1B') == std::string::npos, "No raw escape in the file name");
    test.enforceEqual(text.substr(0, 5), std::string(u8"a\u25AFb"), "Control in the file name");

    StatusBar   bar;
    FakePainter painter;

    bar.resize(Size(1, 40));
    bar.update(makeStatus(false));
    bar.render(painter, 0);
    test.enforce(painter.inverse, "Drawn inverted");
    test.enforce(!bar.needsRedraw(), "Clean");

    bar.update(makeStatus(false));
    test.enforce(!bar.needsRedraw(), "Same status");

    bar.update(makeStatus(true));
    test.enforce(bar.needsRedraw(), "Changed status");
}

void testCommandBar(Test & test) {
    CommandBar bar;
    bar.resize(Size(1, 12));
    bar.setPrompt("Find: ");

    bar.append("abc");
    test.enforceEqual(bar.value(), std::string("abc"), "Value");
    test.enforceEqual(bar.visibleText(), std::string("Find: abc"), "Fits");
    test.enforceEqual(bar.caretColumn(), 9u, "Caret after the value");

    bar.append("defghij");
    test.enforceEqual(bar.visibleText(), std::string("Find: efghij"), "Tail shown");
    test.enforceEqual(bar.caretColumn(), 12u, "Caret clamped");

    bar.eraseLast();
    test.enforceEqual(bar.visibleText(), std::string("Find: defghi"), "Erase last");

    bar.clearValue();
    test.enforce(bar.value().empty(), "Cleared");
    bar.eraseLast();
    test.enforce(bar.value().empty(), "Erase on empty");

    bar.setPrompt("Find:");
    bar.append(u8"\u4E2D\u4E2D\u4E2D\u4E2D");
    test.enforceEqual(bar.visibleText(), std::string(u8"Find: \u4E2D\u4E2D\u4E2D"), "Cut wide glyph drawn as a space");

    bar.resize(Size(1, 3));
    test.enforceEqual(bar.visibleText(), std::string(), "Prompt too wide");

    FakePainter painter;
    bar.resize(Size(1, 12));
    bar.render(painter, 0);
    test.enforceEqual(painter.text, bar.visibleText(), "Render");
    test.enforce(!bar.needsRedraw(), "Clean");
}

void testMessageBar(Test & test) {
    MessageBar  bar(60000);
    FakePainter painter;

    bar.resize(Size(1, 3));
    test.enforceEqual(bar.expiresIn(), 0u, "Nothing shown");

    bar.update("hello");
    test.enforce(!bar.isExpired(), "Fresh");
    test.enforce(bar.expiresIn() > 0 && bar.expiresIn() <= 60000, "Counting down");

    bar.render(painter, 0);
    test.enforceEqual(painter.text, std::string("hel"), "Clipped");
    test.enforce(!bar.needsRedraw(), "Clean");

    bar.resize(Size(1, 2));
    bar.update(u8"a\u4E2Db");
    bar.render(painter, 0);
    test.enforceEqual(painter.text, std::string("a"), "Clipped before a wide glyph");

    bar.resize(Size(1, 10));
    bar.update("\x1B[2J");
    bar.render(painter, 0);
    test.enforce(painter.text.find('\x1B') == std::string::npos, "No raw escape");
    test.enforceEqual(painter.text, std::string(u8"\u25AF[2J"), "Escape drawn as a control");

    MessageBar instant(0);
    instant.resize(Size(1, 10));
    instant.update("gone");
    test.enforce(instant.isExpired(), "Expired");
    test.enforce(instant.needsRedraw(), "Needs clearing");

    instant.render(painter, 0);
    test.enforce(painter.text.empty(), "Cleared");
    test.enforce(!instant.needsRedraw(), "Cleared once");
    test.enforceEqual(instant.expiresIn(), 0u, "Nothing pending");
}

} // namespace {anonymous}

int main() {
    Test test("common/bars");
    test.run("status-bar", testStatusBar);
    test.run("command-bar", testCommandBar);
    test.run("message-bar", testMessageBar);
    return 0;
}
