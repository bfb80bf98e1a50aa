// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/status_bar.hxx"
#include "termed/common/line.hxx"

void StatusBar::update(const DocumentStatus & status) {
    if (status != _status) {
        _status      = status;
        _needsRedraw = true;
    }
}

std::string StatusBar::format(const DocumentStatus & status, size_t width) {
    auto beginning = status.fileName + " - " + status.lineCount() + " " +
        status.modifiedIndicator();
    auto position  = status.positionIndicator();

    Line beginningLine(beginning);
    Line positionLine(position);

    auto beginningWidth = beginningLine.width();
    auto positionWidth  = positionLine.width();

    if (beginningWidth + positionWidth > width) {
        return std::string(width, ' ');
    }

    return beginningLine.glyphs(beginningWidth) +
        std::string(width - beginningWidth - positionWidth, ' ') +
        positionLine.glyphs(positionWidth);
}

void StatusBar::resize(Size size) {
    _size        = size;
    _needsRedraw = true;
}

void StatusBar::render(I_Painter & painter, uint16_t originRow) {
    painter.paintInverse(originRow, format(_status, _size.cols));
    _needsRedraw = false;
}
