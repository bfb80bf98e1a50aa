// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/text_fragment.hxx"
#include "termed/common/grapheme_width.hxx"
#include "termed/support/pattern.hxx"
#include "termed/support/debug.hxx"

#include <memory>
#include <ostream>

#include <unicode/brkiter.h>
#include <unicode/utext.h>
#include <unicode/locid.h>

namespace {

const char SPACE_SYMBOL[]       = u8"\u2423";   // OPEN BOX
const char CONTROL_SYMBOL[]     = u8"\u25AF";   // WHITE VERTICAL RECTANGLE
const char REPLACEMENT_SYMBOL[] = u8"\uFFFD";   // REPLACEMENT CHARACTER
const char ZERO_WIDTH_SYMBOL[]  = u8"\u00B7";   // MIDDLE DOT

icu::BreakIterator & characterBreakIterator() {
    static std::unique_ptr<icu::BreakIterator> iterator;

    if (!iterator) {
        UErrorCode status = U_ZERO_ERROR;
        iterator.reset(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
        ENFORCE(U_SUCCESS(status) && iterator,
                << "Failed to create character break iterator: " << u_errorName(status));
    }

    return *iterator;
}

TextFragment classify(std::string grapheme, size_t start) {
    TextFragment fragment;
    fragment.start = start;

    if (grapheme == " ") {
        fragment.width = 1;
    }
    else if (grapheme == "\t") {
        fragment.width       = 1;
        fragment.replacement = " ";
    }
    else if (isMalformed(grapheme)) {
        fragment.width       = 1;
        fragment.replacement = REPLACEMENT_SYMBOL;
    }
    else {
        auto width = graphemeWidth(grapheme);

        if (width > 0 && isWhitespace(grapheme)) {
            fragment.width       = 1;
            fragment.replacement = SPACE_SYMBOL;
        }
        else if (width == 0) {
            // Give it a column so the cursor can land on it.
            fragment.width       = 1;
            fragment.replacement = isControl(grapheme) ? CONTROL_SYMBOL : ZERO_WIDTH_SYMBOL;
        }
        else {
            fragment.width = width;
        }
    }

    fragment.grapheme = std::move(grapheme);
    return fragment;
}

} // namespace {anonymous}

std::ostream & operator << (std::ostream & ost, const TextFragment & fragment) {
    return ost << "'" << fragment.glyph() << "'@" << fragment.start << "/" << int(fragment.width);
}

std::vector<TextFragment> fragmentize(const std::string & text) {
    std::vector<TextFragment> fragments;

    if (text.empty()) {
        return fragments;
    }

    UErrorCode status = U_ZERO_ERROR;
    UText * utext = utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status);
    ENFORCE(U_SUCCESS(status), << "utext_openUTF8(): " << u_errorName(status));
    ScopeGuard guard([utext]() { utext_close(utext); });

    auto & iterator = characterBreakIterator();
    iterator.setText(utext, status);
    ENFORCE(U_SUCCESS(status), << "BreakIterator::setText(): " << u_errorName(status));

    // Boundaries are native (byte) offsets for UTF-8 text.
    int32_t begin = iterator.first();

    for (int32_t end = iterator.next(); end != icu::BreakIterator::DONE; end = iterator.next()) {
        auto b = static_cast<size_t>(begin);
        auto e = static_cast<size_t>(end);
        fragments.push_back(classify(text.substr(b, e - b), b));
        begin = end;
    }

    ASSERT(!fragments.empty() && fragments.back().end() == text.size(), );

    return fragments;
}
