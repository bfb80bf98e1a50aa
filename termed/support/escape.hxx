// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__ESCAPE__HXX
#define SUPPORT__ESCAPE__HXX

#include <initializer_list>
#include <iosfwd>
#include <string>
#include <vector>

#include <stdint.h>

//
// The ECMA-48 and xterm output sequences termed writes. Each is inserted
// into an ostream, e.g.:
//
//     ost << MoveCursor(0, 0) << SGR::INVERSE << "status" << SGR::RESET_ALL;
//

// Select Graphic Rendition, values as sent.
enum class SGR : uint8_t {
    RESET_ALL = 0,
    INVERSE   = 7
};

std::ostream & operator << (std::ostream & ost, SGR sgr);

// ESC [ [?] ARGS FINAL
class CSIEsc {
    bool                 _priv;
    char                 _final;
    std::vector<int32_t> _args;

    CSIEsc(bool priv, char finalByte, std::initializer_list<int32_t> args) :
        _priv(priv), _final(finalByte), _args(args) {}

    friend std::ostream & operator << (std::ostream & ost, const CSIEsc & esc);

public:
    static CSIEsc fg24bit(uint8_t r, uint8_t g, uint8_t b) { return CSIEsc(false, 'm', {38, 2, r, g, b}); }
    static CSIEsc bg24bit(uint8_t r, uint8_t g, uint8_t b) { return CSIEsc(false, 'm', {48, 2, r, g, b}); }

    // Erase from the cursor to the end of the line.
    static CSIEsc clearLine()   { return CSIEsc(false, 'K', {}); }
    static CSIEsc clearScreen() { return CSIEsc(false, 'J', {2}); }

    static CSIEsc showCursor(bool show)       { return CSIEsc(true, show  ? 'h' : 'l', {25}); }
    static CSIEsc alternateScreen(bool enter) { return CSIEsc(true, enter ? 'h' : 'l', {1049}); }
};

// Zero based row and column. Written one based.
struct MoveCursor {
    MoveCursor(uint16_t row_, uint16_t col_) : row(row_), col(col_) {}

    uint16_t row;
    uint16_t col;
};

std::ostream & operator << (std::ostream & ost, MoveCursor moveCursor);

// xterm window title (OSC 0).
struct SetTitle {
    explicit SetTitle(const std::string & title_) : title(title_) {}

    std::string title;
};

std::ostream & operator << (std::ostream & ost, const SetTitle & setTitle);

#endif // SUPPORT__ESCAPE__HXX
