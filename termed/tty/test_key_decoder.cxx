// vi:noai:sw=4
// Copyright © 2015 David Bryant

#include "termed/tty/key_decoder.hxx"
#include "termed/support/test.hxx"

namespace {

using Events = std::vector<KeyEvent>;

ModifierSet mods(std::initializer_list<Modifier> list) {
    ModifierSet set;
    for (auto m : list) { set.set(m); }
    return set;
}

Events decode(KeyDecoder & decoder, const std::string & input) {
    Events events;
    decoder.consume(reinterpret_cast<const uint8_t *>(input.data()), input.size(), events);
    decoder.flush(events);
    return events;
}

void enforceEvents(Test & test, const std::string & input,
                   const Events & expected, const std::string & description) {
    KeyDecoder decoder;
    auto events = decode(decoder, input);

    if (test.enforceEqual(events.size(), expected.size(), description + " (count)")) {
        for (size_t i = 0; i != events.size(); ++i) {
            test.enforceEqual(events[i], expected[i], description);
        }
    }
}

void testText(Test & test) {
    enforceEvents(test, "ab", {KeyEvent("a"), KeyEvent("b")}, "ASCII");
    enforceEvents(test, u8"\u00E9", {KeyEvent(u8"\u00E9")}, "Two byte");
    enforceEvents(test, u8"\U0001F389", {KeyEvent(u8"\U0001F389")}, "Four byte");
    enforceEvents(test, "\xC3" "a", {KeyEvent(u8"\uFFFD"), KeyEvent("a")}, "Truncated");
    enforceEvents(test, "\xFF", {KeyEvent(u8"\uFFFD")}, "Invalid");

    // A sequence split across reads.
    KeyDecoder decoder;
    test.enforce(decode(decoder, "\xE4").empty(), "First byte pending");
    auto events = decode(decoder, "\xB8\xAD");
    test.enforceEqual(events.size(), 1u, "Completed");
    test.enforceEqual(events.front(), KeyEvent(u8"\u4E2D"), "Split sequence");
}

void testControls(Test & test) {
    auto control = mods({Modifier::CONTROL});

    enforceEvents(test, "\r", {KeyEvent(Key::ENTER)}, "Carriage return");
    enforceEvents(test, "\n", {KeyEvent(Key::ENTER)}, "Line feed");
    enforceEvents(test, "\t", {KeyEvent(Key::TAB)}, "Tab");
    enforceEvents(test, "\x7F", {KeyEvent(Key::BACKSPACE)}, "Delete");
    enforceEvents(test, "\x08", {KeyEvent(Key::BACKSPACE)}, "Backspace");
    enforceEvents(test, "\x11", {KeyEvent("q", control)}, "Ctrl-Q");
    enforceEvents(test, "\x06", {KeyEvent("f", control)}, "Ctrl-F");
    enforceEvents(test, "\x1C", {KeyEvent("\\", control)}, "Ctrl-Backslash");
}

void testEscape(Test & test) {
    auto alt = mods({Modifier::ALT});

    enforceEvents(test, "\x1B", {KeyEvent(Key::ESCAPE)}, "Lone escape");
    enforceEvents(test, "\x1B\x1B", {KeyEvent(Key::ESCAPE), KeyEvent(Key::ESCAPE)}, "Escape twice");
    enforceEvents(test, "\x1Bx", {KeyEvent("x", alt)}, "Alt-x");
    enforceEvents(test, "\x1B\x7F", {KeyEvent(Key::BACKSPACE, alt)}, "Alt-Backspace");
}

void testReads(Test & test) {
    KeyDecoder decoder;
    Events     events;
    std::string first  = "ab\x1B[";
    std::string second = "A";

    decoder.consumeRead(reinterpret_cast<const uint8_t *>(first.data()), first.size(),
                        first.size(), events);
    test.enforceEqual(events.size(), 2u, "Full read keeps the pending sequence");

    decoder.consumeRead(reinterpret_cast<const uint8_t *>(second.data()), second.size(),
                        16, events);
    test.enforceEqual(events.size(), 3u, "Completed by the next read");
    test.enforceEqual(events.back(), KeyEvent(Key::UP), "Arrow split across reads");

    events.clear();
    std::string lone = "\x1B";
    decoder.consumeRead(reinterpret_cast<const uint8_t *>(lone.data()), lone.size(), 16, events);
    test.enforceEqual(events.size(), 1u, "Short read flushes");
    test.enforceEqual(events.front(), KeyEvent(Key::ESCAPE), "Lone escape");
}

void testSequences(Test & test) {
    auto shift = mods({Modifier::SHIFT});

    enforceEvents(test, "\x1B[A", {KeyEvent(Key::UP)}, "Up");
    enforceEvents(test, "\x1B[B", {KeyEvent(Key::DOWN)}, "Down");
    enforceEvents(test, "\x1B[C\x1B[D", {KeyEvent(Key::RIGHT), KeyEvent(Key::LEFT)}, "Right left");
    enforceEvents(test, "\x1B[H", {KeyEvent(Key::HOME)}, "Home");
    enforceEvents(test, "\x1B[4~", {KeyEvent(Key::END)}, "End");
    enforceEvents(test, "\x1B[3~", {KeyEvent(Key::DELETE)}, "Delete");
    enforceEvents(test, "\x1B[5~\x1B[6~", {KeyEvent(Key::PAGE_UP), KeyEvent(Key::PAGE_DOWN)}, "Pages");
    enforceEvents(test, "\x1BOA", {KeyEvent(Key::UP)}, "SS3 up");
    enforceEvents(test, "\x1BOF", {KeyEvent(Key::END)}, "SS3 end");
    enforceEvents(test, "\x1B[1;2C", {KeyEvent(Key::RIGHT, shift)}, "Shift-Right");
    enforceEvents(test, "\x1B[5;5~", {KeyEvent(Key::PAGE_UP, mods({Modifier::CONTROL}))}, "Ctrl-PageUp");
    enforceEvents(test, "\x1B[1;4A", {KeyEvent(Key::UP, mods({Modifier::SHIFT, Modifier::ALT}))}, "Shift-Alt-Up");
    enforceEvents(test, "\x1B[Z", {KeyEvent(Key::TAB, shift)}, "Back tab");

    enforceEvents(test, "\x1B[?1h" "a", {KeyEvent("a")}, "Private sequence ignored");
    enforceEvents(test, "\x1B[99~" "a", {KeyEvent("a")}, "Unknown sequence ignored");
    enforceEvents(test, "\x1B[1;", {}, "Incomplete sequence dropped");

    KeyDecoder decoder;
    decode(decoder, "\x1B[");
    auto events = decode(decoder, "b");
    test.enforceEqual(events.size(), 1u, "Decoder recovers");
    test.enforceEqual(events.front(), KeyEvent("b"), "Plain text after the drop");
}

} // namespace {anonymous}

int main() {
    Test test("tty/key_decoder");
    test.run("text", testText);
    test.run("controls", testControls);
    test.run("escape", testEscape);
    test.run("sequences", testSequences);
    test.run("reads", testReads);
    return 0;
}
