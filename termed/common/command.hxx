// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__COMMAND__HXX
#define COMMON__COMMAND__HXX

#include <iosfwd>
#include <string>
#include <utility>

enum class Move {
    UP,
    DOWN,
    LEFT,
    RIGHT,
    PAGE_UP,
    PAGE_DOWN,
    HOME,
    END
};

enum class Edit {
    INSERT,             // Command::text
    INSERT_NEWLINE,
    DELETE,
    DELETE_BACKWARD
};

enum class System {
    SAVE,
    QUIT,
    SEARCH,
    DISMISS
};

std::ostream & operator << (std::ostream & ost, Move   move);
std::ostream & operator << (std::ostream & ost, Edit   edit);
std::ostream & operator << (std::ostream & ost, System system);

//
// A decoded user request.
//

struct Command {
    enum class Type { NONE, MOVE, EDIT, SYSTEM };

    Type        type   = Type::NONE;
    Move        move   = Move::UP;
    bool        extend = false;         // MOVE: grow the selection.
    Edit        edit   = Edit::INSERT;
    std::string text;                   // EDIT INSERT: the text.
    System      system = System::SAVE;

    static Command none() { return Command(); }

    static Command makeMove(Move move_, bool extend_ = false) {
        Command command(Type::MOVE);
        command.move   = move_;
        command.extend = extend_;
        return command;
    }

    static Command makeEdit(Edit edit_, std::string text_ = std::string()) {
        Command command(Type::EDIT);
        command.edit = edit_;
        command.text = std::move(text_);
        return command;
    }

    static Command makeSystem(System system_) {
        Command command(Type::SYSTEM);
        command.system = system_;
        return command;
    }

    Command() = default;

private:
    explicit Command(Type type_) : type(type_) {}
};

bool operator == (const Command & lhs, const Command & rhs);

inline bool operator != (const Command & lhs, const Command & rhs) { return !(lhs == rhs); }

std::ostream & operator << (std::ostream & ost, const Command & command);

#endif // COMMON__COMMAND__HXX
