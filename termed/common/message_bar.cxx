// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/message_bar.hxx"
#include "termed/common/line.hxx"

void MessageBar::update(const std::string & message) {
    _message            = message;
    _timer              = Timer(_timeout);
    _clearedAfterExpiry = false;
    _needsRedraw        = true;
}

void MessageBar::resize(Size size) {
    _size        = size;
    _needsRedraw = true;
}

void MessageBar::render(I_Painter & painter, uint16_t originRow) {
    if (isExpired()) {
        _clearedAfterExpiry = true;
        painter.paintText(originRow, std::string());
    }
    else {
        // Clipped at a grapheme boundary, controls made visible.
        painter.paintText(originRow, Line(_message).glyphs(_size.cols));
    }

    _needsRedraw = false;
}
