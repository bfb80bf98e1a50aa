// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__DATA_TYPES__HXX
#define COMMON__DATA_TYPES__HXX

#include "termed/support/conv.hxx"

#include <iosfwd>
#include <cstdint>
#include <cstddef>

//
// An RGB color.
//

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    constexpr Color() = default;
    constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_) : r(r_), g(g_), b(b_) {}
};

inline bool operator == (Color lhs, Color rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
}

inline bool operator != (Color lhs, Color rhs) {
    return !(lhs == rhs);
}

static_assert(sizeof(Color) == 3, "Color should be 3 bytes.");

// #RRGGBB
std::ostream & operator << (std::ostream & ost, Color   color);
std::istream & operator >> (std::istream & ist, Color & color);

//
// Terminal (or component) dimensions.
//

struct Size {
    uint16_t rows = 0;
    uint16_t cols = 0;

    Size() = default;
    Size(uint16_t rows_, uint16_t cols_) : rows(rows_), cols(cols_) {}
};

inline bool operator == (Size lhs, Size rhs) {
    return lhs.rows == rhs.rows && lhs.cols == rhs.cols;
}

inline bool operator != (Size lhs, Size rhs) { return !(lhs == rhs); }

std::ostream & operator << (std::ostream & ost, Size size);

//
// A position in display units: a screen cell or a scroll offset.
//

struct Position {
    size_t row = 0;
    size_t col = 0;

    Position() = default;
    Position(size_t row_, size_t col_) : row(row_), col(col_) {}
};

inline bool operator == (Position lhs, Position rhs) {
    return lhs.row == rhs.row && lhs.col == rhs.col;
}

inline bool operator != (Position lhs, Position rhs) { return !(lhs == rhs); }

std::ostream & operator << (std::ostream & ost, Position position);

//
// A position in the document: line index and grapheme index.
//

struct Location {
    size_t line     = 0;
    size_t grapheme = 0;

    Location() = default;
    Location(size_t line_, size_t grapheme_) : line(line_), grapheme(grapheme_) {}
};

inline bool operator == (Location lhs, Location rhs) {
    return lhs.line == rhs.line && lhs.grapheme == rhs.grapheme;
}

inline bool operator != (Location lhs, Location rhs) { return !(lhs == rhs); }

// Reading order.
inline bool operator < (Location lhs, Location rhs) {
    return lhs.line < rhs.line || (lhs.line == rhs.line && lhs.grapheme < rhs.grapheme);
}

inline bool operator <= (Location lhs, Location rhs) { return !(rhs < lhs); }

std::ostream & operator << (std::ostream & ost, Location location);

#endif // COMMON__DATA_TYPES__HXX
