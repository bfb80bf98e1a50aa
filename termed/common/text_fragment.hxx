// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__TEXT_FRAGMENT__HXX
#define COMMON__TEXT_FRAGMENT__HXX

#include <string>
#include <vector>
#include <optional>
#include <iosfwd>
#include <cstdint>

//
// One grapheme cluster of a line, ready to be drawn.
//

struct TextFragment {
    std::string                grapheme;        // Original bytes.
    uint8_t                    width = 1;       // Rendered width, 1 or 2.
    std::optional<std::string> replacement;     // Drawn instead of grapheme.
    size_t                     start = 0;       // Byte offset in the line.

    size_t end() const { return start + grapheme.size(); }

    const std::string & glyph() const { return replacement ? *replacement : grapheme; }
};

std::ostream & operator << (std::ostream & ost, const TextFragment & fragment);

// Segment text into extended grapheme clusters and classify each one.
// The result covers the text without gaps, in order.
std::vector<TextFragment> fragmentize(const std::string & text);

#endif // COMMON__TEXT_FRAGMENT__HXX
