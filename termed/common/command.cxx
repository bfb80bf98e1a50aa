// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/command.hxx"
#include "termed/support/debug.hxx"

#include <ostream>

std::ostream & operator << (std::ostream & ost, Move move) {
    switch (move) {
        case Move::UP:        return ost << "UP";
        case Move::DOWN:      return ost << "DOWN";
        case Move::LEFT:      return ost << "LEFT";
        case Move::RIGHT:     return ost << "RIGHT";
        case Move::PAGE_UP:   return ost << "PAGE_UP";
        case Move::PAGE_DOWN: return ost << "PAGE_DOWN";
        case Move::HOME:      return ost << "HOME";
        case Move::END:       return ost << "END";
    }

    FATAL(<< "Invalid move: " << static_cast<int>(move));
}

std::ostream & operator << (std::ostream & ost, Edit edit) {
    switch (edit) {
        case Edit::INSERT:          return ost << "INSERT";
        case Edit::INSERT_NEWLINE:  return ost << "INSERT_NEWLINE";
        case Edit::DELETE:          return ost << "DELETE";
        case Edit::DELETE_BACKWARD: return ost << "DELETE_BACKWARD";
    }

    FATAL(<< "Invalid edit: " << static_cast<int>(edit));
}

std::ostream & operator << (std::ostream & ost, System system) {
    switch (system) {
        case System::SAVE:    return ost << "SAVE";
        case System::QUIT:    return ost << "QUIT";
        case System::SEARCH:  return ost << "SEARCH";
        case System::DISMISS: return ost << "DISMISS";
    }

    FATAL(<< "Invalid system command: " << static_cast<int>(system));
}

bool operator == (const Command & lhs, const Command & rhs) {
    if (lhs.type != rhs.type) {
        return false;
    }

    switch (lhs.type) {
        case Command::Type::NONE:
            return true;
        case Command::Type::MOVE:
            return lhs.move == rhs.move && lhs.extend == rhs.extend;
        case Command::Type::EDIT:
            return lhs.edit == rhs.edit && lhs.text == rhs.text;
        case Command::Type::SYSTEM:
            return lhs.system == rhs.system;
    }

    FATAL(<< "Unreachable");
}

std::ostream & operator << (std::ostream & ost, const Command & command) {
    switch (command.type) {
        case Command::Type::NONE:
            return ost << "NONE";
        case Command::Type::MOVE:
            return ost << "MOVE " << command.move << (command.extend ? " (extend)" : "");
        case Command::Type::EDIT:
            ost << "EDIT " << command.edit;
            if (command.edit == Edit::INSERT) {
                ost << " '" << command.text << "'";
            }
            return ost;
        case Command::Type::SYSTEM:
            return ost << "SYSTEM " << command.system;
    }

    FATAL(<< "Unreachable");
}
