// vi:noai:sw=4
// Copyright © 2015 David Bryant

#include "termed/common/view.hxx"
#include "termed/support/test.hxx"

#include <map>

namespace {

class FakePainter final : public I_Painter {
public:
    std::map<uint16_t, std::string> rows;

    // I_Painter implementation:

    void paintSpans(uint16_t row, AnnotatedStringIterator & spans) override {
        std::string text;
        Span span;
        while (spans.next(span)) {
            text += span.text;
        }
        rows[row] = text;
    }

    void paintText(uint16_t row, const std::string & text) override {
        rows[row] = text;
    }

    void paintInverse(uint16_t row, const std::string & text) override {
        rows[row] = text;
    }
};

Buffer numbered(size_t count) {
    std::vector<std::string> lines;
    for (size_t i = 0; i != count; ++i) {
        lines.push_back("line " + std::to_string(i));
    }
    return Buffer::fromLines(lines);
}

void testWelcome(Test & test) {
    View        view;
    FakePainter painter;

    view.resize(Size(9, 40));
    view.render(painter, 0);

    test.enforceEqual(painter.rows.size(), 9u, "Every row painted");
    test.enforceEqual(painter.rows[0], std::string("~"), "Tilde");
    test.enforceEqual(painter.rows[3].size(), 40u, "Banner fills the row");
    test.enforce(painter.rows[3].find("termed editor -- version") != std::string::npos, "Banner text");
    test.enforceEqual(painter.rows[3].front(), '~', "Banner row starts with a tilde");
    test.enforce(!view.needsRedraw(), "Clean after render");

    test.enforceEqual(View::welcomeMessage(10), std::string("~"), "Too narrow");
    test.enforceEqual(View::welcomeMessage(0), std::string(), "No room at all");

    View quiet(false);
    FakePainter quietPainter;
    quiet.resize(Size(9, 40));
    quiet.render(quietPainter, 0);
    test.enforceEqual(quietPainter.rows[3], std::string("~"), "Banner disabled");

    view.setBuffer(Buffer::fromLines({"text"}));
    painter.rows.clear();
    view.render(painter, 2);
    test.enforceEqual(painter.rows[2], std::string("text"), "Origin applied");
    test.enforceEqual(painter.rows[5], std::string("~"), "No banner once there is text");
}

void testMovement(Test & test) {
    View view;
    view.resize(Size(10, 20));
    view.setBuffer(Buffer::fromLines({u8"a\u4E2Db", "abcd"}));

    view.move(Move::RIGHT);
    view.move(Move::RIGHT);
    test.enforceEqual(view.cursor(), Location(0, 2), "After the wide glyph");
    test.enforceEqual(view.caretPosition(), Position(0, 3), "Display column");

    view.move(Move::DOWN);
    test.enforceEqual(view.cursor(), Location(1, 3), "Column preserved going down");

    view.move(Move::UP);
    test.enforceEqual(view.cursor(), Location(0, 2), "Column preserved going up");

    view.move(Move::END);
    view.move(Move::RIGHT);
    test.enforceEqual(view.cursor(), Location(1, 0), "Right wraps to the next line");

    view.move(Move::LEFT);
    test.enforceEqual(view.cursor(), Location(0, 3), "Left wraps to the previous line");

    view.move(Move::HOME);
    view.move(Move::LEFT);
    test.enforceEqual(view.cursor(), Location(0, 0), "Left stops at the start");

    view.move(Move::PAGE_DOWN);
    test.enforceEqual(view.cursor(), Location(2, 0), "Page down stops on the virtual line");

    view.move(Move::PAGE_UP);
    test.enforceEqual(view.cursor(), Location(0, 0), "Page up");
}

void testScrolling(Test & test) {
    View view;
    view.resize(Size(3, 10));
    view.setBuffer(numbered(10));

    for (int i = 0; i != 5; ++i) {
        view.move(Move::DOWN);
    }

    test.enforceEqual(view.scroll(), Position(3, 0), "Scrolled down");
    test.enforceEqual(view.caretPosition(), Position(2, 0), "Caret on the last row");

    FakePainter painter;
    view.render(painter, 0);
    test.enforceEqual(painter.rows[0], std::string("line 3"), "Top row");

    view.setBuffer(Buffer::fromLines({"0123456789abcdef"}));
    view.move(Move::END);
    test.enforceEqual(view.scroll(), Position(0, 7), "Scrolled right");

    painter.rows.clear();
    view.render(painter, 0);
    test.enforceEqual(painter.rows[0], std::string("789abcdef"), "Horizontal window");
}

void testEditing(Test & test) {
    View view;
    view.resize(Size(10, 20));

    view.insert("ab\ncd");
    test.enforce(view.buffer().lines() == std::vector<std::string>({"ab", "cd"}), "Multi-line insert");
    test.enforceEqual(view.cursor(), Location(1, 2), "Cursor after insert");
    test.enforce(view.status().modified, "Modified");

    view.move(Move::HOME);
    view.eraseBackward();
    test.enforce(view.buffer().lines() == std::vector<std::string>({"abcd"}), "Backspace joins lines");
    test.enforceEqual(view.cursor(), Location(0, 2), "Cursor at the join");

    view.erase();
    test.enforce(view.buffer().lines() == std::vector<std::string>({"abd"}), "Delete");

    view.insert(u8"\u00E9");
    test.enforceEqual(view.cursor(), Location(0, 3), "One grapheme inserted");

    view.move(Move::HOME);
    view.eraseBackward();
    test.enforce(view.buffer().lines().size() == 1, "Backspace at the start does nothing");

    auto status = view.status();
    test.enforceEqual(status.totalLines, 1u, "Total lines");
    test.enforceEqual(status.fileName, std::string("[No Name]"), "File name");
}

void testSelection(Test & test) {
    View view;
    view.resize(Size(10, 20));
    view.setBuffer(Buffer::fromLines({"abcdef"}));

    view.move(Move::RIGHT, true);
    view.move(Move::RIGHT, true);
    test.enforce(view.selection().isActive(), "Selecting");
    test.enforce(view.selection().anchor() == Location(0, 0), "Anchored at the start");

    view.move(Move::RIGHT);
    test.enforce(!view.selection().isActive(), "Plain move drops the selection");

    view.move(Move::LEFT, true);
    view.insert("x");
    test.enforce(!view.selection().isActive(), "Edit drops the selection");
}

void testSearch(Test & test) {
    View view;
    view.resize(Size(10, 20));
    view.setBuffer(numbered(100));

    view.move(Move::DOWN);
    view.move(Move::RIGHT);
    auto cursor = view.cursor();
    auto scroll = view.scroll();

    view.search("line 5");
    test.enforce(!view.isSearching(), "Ignored until entered");

    view.enterSearch();
    view.search("line 50");
    test.enforceEqual(view.cursor(), Location(50, 0), "Jumped to the match");
    test.enforceEqual(view.scroll().row, 45u, "Match centred");

    view.search("line 9");
    test.enforceEqual(view.cursor(), Location(90, 0), "First match after the cursor");

    view.searchNext();
    test.enforceEqual(view.cursor(), Location(91, 0), "Next");

    view.searchPrevious();
    view.searchPrevious();
    test.enforceEqual(view.cursor(), Location(9, 0), "Previous");

    view.search("line 99x");
    test.enforceEqual(view.cursor(), Location(9, 0), "No match leaves the cursor");

    view.cancelSearch();
    test.enforce(!view.isSearching(), "Cancelled");
    test.enforceEqual(view.cursor(), cursor, "Cursor restored");
    test.enforceEqual(view.scroll(), scroll, "Scroll restored");

    view.enterSearch();
    view.search("line 42");
    view.commitSearch();
    test.enforce(!view.isSearching(), "Committed");
    test.enforceEqual(view.cursor(), Location(42, 0), "Cursor kept");
}

} // namespace {anonymous}

int main() {
    Test test("common/view");
    test.run("welcome", testWelcome);
    test.run("movement", testMovement);
    test.run("scrolling", testScrolling);
    test.run("editing", testEditing);
    test.run("selection", testSelection);
    test.run("search", testSearch);
    return 0;
}
