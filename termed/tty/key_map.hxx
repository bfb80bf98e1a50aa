// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef TTY__KEY_MAP__HXX
#define TTY__KEY_MAP__HXX

#include "termed/tty/key.hxx"
#include "termed/common/command.hxx"

//
// The editor's key bindings:
//
//     Ctrl-Q quit, Ctrl-S save, Ctrl-F find, Esc dismiss
//     Enter, Tab, Backspace, Delete and printable text edit
//     arrows, Home, End, PgUp, PgDn move; with Shift they select
//
// Unbound keys map to Command::none().
//
Command keyToCommand(const KeyEvent & event);

#endif // TTY__KEY_MAP__HXX
