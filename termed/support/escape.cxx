// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/escape.hxx"

#include <ostream>

namespace {

const char ESC = '\033';
const char BEL = '\007';

} // namespace {anonymous}

std::ostream & operator << (std::ostream & ost, SGR sgr) {
    return ost << ESC << '[' << static_cast<int>(sgr) << 'm';
}

std::ostream & operator << (std::ostream & ost, const CSIEsc & esc) {
    ost << ESC << '[';

    if (esc._priv) { ost << '?'; }

    for (size_t i = 0; i != esc._args.size(); ++i) {
        if (i != 0) { ost << ';'; }
        ost << esc._args[i];
    }

    return ost << esc._final;
}

std::ostream & operator << (std::ostream & ost, MoveCursor moveCursor) {
    return ost << ESC << '[' << moveCursor.row + 1 << ';' << moveCursor.col + 1 << 'H';
}

std::ostream & operator << (std::ostream & ost, const SetTitle & setTitle) {
    return ost << ESC << "]0;" << setTitle.title << BEL;
}
