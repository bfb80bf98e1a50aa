// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/common/command_bar.hxx"
#include "termed/common/annotated_string.hxx"

#include <algorithm>

void CommandBar::setPrompt(const std::string & prompt) {
    _prompt      = prompt;
    _needsRedraw = true;
}

void CommandBar::clearValue() {
    _value       = Line();
    _needsRedraw = true;
}

void CommandBar::append(const std::string & text) {
    _value.insert(_value.graphemeCount(), text);
    _needsRedraw = true;
}

void CommandBar::eraseLast() {
    _value.eraseLast();
    _needsRedraw = true;
}

size_t CommandBar::caretColumn() const {
    return std::min<size_t>(promptWidth() + _value.width(), _size.cols);
}

std::string CommandBar::visibleText() const {
    auto prompt = promptWidth();

    if (prompt > _size.cols) {
        return std::string();
    }

    auto room  = _size.cols - prompt;
    auto end   = _value.width();
    auto start = end > room ? end - room : 0;

    auto text = _prompt;

    AnnotatedStringIterator spans(_value, {}, start, end);
    Span span;

    while (spans.next(span)) {
        text += span.text;
    }

    return text;
}

void CommandBar::resize(Size size) {
    _size        = size;
    _needsRedraw = true;
}

void CommandBar::render(I_Painter & painter, uint16_t originRow) {
    painter.paintText(originRow, visibleText());
    _needsRedraw = false;
}

size_t CommandBar::promptWidth() const {
    return Line(_prompt).width();
}
