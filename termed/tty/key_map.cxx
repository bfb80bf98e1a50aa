// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/tty/key_map.hxx"

namespace {

Command controlCommand(const std::string & text) {
    if      (text == "q") { return Command::makeSystem(System::QUIT);   }
    else if (text == "s") { return Command::makeSystem(System::SAVE);   }
    else if (text == "f") { return Command::makeSystem(System::SEARCH); }
    else                  { return Command::none();                     }
}

} // namespace {anonymous}

Command keyToCommand(const KeyEvent & event) {
    auto extend = event.has(Modifier::SHIFT);

    switch (event.key) {
        case Key::CHAR:
            if (event.has(Modifier::CONTROL)) {
                return controlCommand(event.text);
            }
            else if (event.has(Modifier::ALT)) {
                return Command::none();
            }
            else {
                return Command::makeEdit(Edit::INSERT, event.text);
            }
        case Key::ENTER:
            return Command::makeEdit(Edit::INSERT_NEWLINE);
        case Key::TAB:
            return extend ? Command::none() : Command::makeEdit(Edit::INSERT, "\t");
        case Key::BACKSPACE:
            return Command::makeEdit(Edit::DELETE_BACKWARD);
        case Key::DELETE:
            return Command::makeEdit(Edit::DELETE);
        case Key::ESCAPE:
            return Command::makeSystem(System::DISMISS);
        case Key::UP:
            return Command::makeMove(Move::UP, extend);
        case Key::DOWN:
            return Command::makeMove(Move::DOWN, extend);
        case Key::LEFT:
            return Command::makeMove(Move::LEFT, extend);
        case Key::RIGHT:
            return Command::makeMove(Move::RIGHT, extend);
        case Key::HOME:
            return Command::makeMove(Move::HOME, extend);
        case Key::END:
            return Command::makeMove(Move::END, extend);
        case Key::PAGE_UP:
            return Command::makeMove(Move::PAGE_UP, extend);
        case Key::PAGE_DOWN:
            return Command::makeMove(Move::PAGE_DOWN, extend);
        case Key::INSERT:
            return Command::none();
    }

    return Command::none();
}
