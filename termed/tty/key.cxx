// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/tty/key.hxx"

#include <iostream>

std::ostream & operator << (std::ostream & ost, Key key) {
    switch (key) {
        case Key::CHAR:
            return ost << "CHAR";
        case Key::ENTER:
            return ost << "ENTER";
        case Key::TAB:
            return ost << "TAB";
        case Key::BACKSPACE:
            return ost << "BACKSPACE";
        case Key::ESCAPE:
            return ost << "ESCAPE";
        case Key::UP:
            return ost << "UP";
        case Key::DOWN:
            return ost << "DOWN";
        case Key::LEFT:
            return ost << "LEFT";
        case Key::RIGHT:
            return ost << "RIGHT";
        case Key::HOME:
            return ost << "HOME";
        case Key::END:
            return ost << "END";
        case Key::PAGE_UP:
            return ost << "PAGE_UP";
        case Key::PAGE_DOWN:
            return ost << "PAGE_DOWN";
        case Key::INSERT:
            return ost << "INSERT";
        case Key::DELETE:
            return ost << "DELETE";
    }

    FATAL(<< "Invalid key: " << static_cast<int>(key));
}

std::ostream & operator << (std::ostream & ost, Modifier modifier) {
    switch (modifier) {
        case Modifier::SHIFT:
            return ost << "SHIFT";
        case Modifier::ALT:
            return ost << "ALT";
        case Modifier::CONTROL:
            return ost << "CONTROL";
    }

    FATAL(<< "Invalid modifier: " << static_cast<int>(modifier));
}

std::ostream & operator << (std::ostream & ost, ModifierSet modifiers) {
    auto first = true;
    for (auto i = 0; i != static_cast<int>(Modifier::LAST) + 1; ++i) {
        auto a = static_cast<Modifier>(i);
        if (modifiers.get(a)) {
            if (first) { first = false; }
            else       { ost << "|"; }
            ost << a;
        }
    }
    return ost;
}

bool operator == (const KeyEvent & lhs, const KeyEvent & rhs) {
    return
        lhs.key       == rhs.key       &&
        lhs.modifiers == rhs.modifiers &&
        lhs.text      == rhs.text;
}

std::ostream & operator << (std::ostream & ost, const KeyEvent & event) {
    if (!event.modifiers.empty()) {
        ost << event.modifiers << "+";
    }

    ost << event.key;

    if (event.key == Key::CHAR) {
        ost << "'" << event.text << "'";
    }

    return ost;
}
