// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/exception.hxx"

#include <sstream>

void Exception::locate(const char * file, int line) {
    ASSERT(file && line > 0, );

    std::ostringstream ost;
    ost << _message << " (" << file << ':' << line << ')';
    _what = ost.str();
}
