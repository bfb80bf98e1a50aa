// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/data_types.hxx"

#include <initializer_list>
#include <iostream>
#include <string>

std::ostream & operator << (std::ostream & ost, Color color) {
    ost << '#';
    for (auto component : { color.r, color.g, color.b }) {
        ost << hexDigit(component >> 4) << hexDigit(component);
    }
    return ost;
}

std::istream & operator >> (std::istream & ist, Color & color) {
    std::string token;

    if (!(ist >> token)) { return ist; }

    if (token.size() != 7 || token[0] != '#') {
        ist.setstate(std::ios::failbit);
        return ist;
    }

    try {
        color = Color(hexByte(token[1], token[2]),
                      hexByte(token[3], token[4]),
                      hexByte(token[5], token[6]));
    }
    catch (const ConversionError &) {
        ist.setstate(std::ios::failbit);
    }

    return ist;
}

std::ostream & operator << (std::ostream & ost, Size size) {
    return ost << size.rows << 'x' << size.cols;
}

std::ostream & operator << (std::ostream & ost, Position position) {
    return ost << position.row << ',' << position.col;
}

std::ostream & operator << (std::ostream & ost, Location location) {
    return ost << location.line << ':' << location.grapheme;
}
