// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__CONFIG__HXX
#define COMMON__CONFIG__HXX

#include "termed/common/data_types.hxx"

#include <iosfwd>
#include <string>
#include <cstdint>

struct Config {
    Color matchFgColor         = {0xFF, 0xFF, 0xFF};
    Color matchBgColor         = {0xD3, 0xD3, 0xD3};
    Color selectedMatchFgColor = {0xFF, 0xFF, 0xFF};
    Color selectedMatchBgColor = {0xFF, 0xFF, 0x99};
    Color selectionFgColor     = {0xFF, 0xFF, 0xFF};
    Color selectionBgColor     = {0x26, 0x4F, 0x78};

    uint32_t messageTimeout = 5000;     // Milliseconds.
    int      quitTimes      = 3;        // Presses needed to quit with unsaved changes.
    bool     showWelcome    = true;

    // Diagnostics go here while the editor owns the screen. Empty
    // discards them.
    std::string logFile;
};

// Read the first of $XDG_CONFIG_HOME/termed/config, each of
// $XDG_CONFIG_DIRS/termed/config and ~/.config/termed/config that exists.
// Lines look like:
//
//     # comment
//     set match-bg-color #D3D3D3
//
// Bad lines are reported and skipped.
void parseConfig(Config & config);

// Parse one stream. Returns the number of lines rejected.
size_t parseConfig(Config & config, std::istream & ist, const std::string & origin);

#endif // COMMON__CONFIG__HXX
