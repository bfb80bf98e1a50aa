// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__GRAPHEME_WIDTH__HXX
#define COMMON__GRAPHEME_WIDTH__HXX

#include "termed/common/utf8.hxx"

#include <string>
#include <cstdint>

//
// Terminal display width of code points and grapheme clusters.
//
// Widths are "natural" widths: 0 for marks, joiners and controls, 2 for
// East Asian wide/fullwidth and emoji presentation, otherwise 1. Deciding
// what to draw for a zero width cluster is TextFragment's business.
//

// Width of a single code point: 0, 1 or 2.
uint8_t codePointWidth(utf8::CodePoint codePoint);

// Width of one grapheme cluster: the width of its first code point with a
// non-zero width, or 2 for a pictographic base followed by VS16.
uint8_t graphemeWidth(const std::string & cluster);

// Cluster made only of control (Cc) code points, e.g. "\x01" or CR LF.
bool isControl(const std::string & cluster);

// Cluster containing bytes that aren't well-formed UTF-8.
bool isMalformed(const std::string & cluster);

// Non-empty cluster made only of White_Space code points.
bool isWhitespace(const std::string & cluster);

#endif // COMMON__GRAPHEME_WIDTH__HXX
