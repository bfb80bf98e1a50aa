// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__COMMAND_BAR__HXX
#define COMMON__COMMAND_BAR__HXX

#include "termed/common/line.hxx"
#include "termed/common/ui_component.hxx"
#include "termed/support/pattern.hxx"

#include <string>

//
// A one row prompt taking over the message bar's row, e.g. "Save as: ".
// The value is edited only at its end. When it is wider than the room
// after the prompt, its tail is shown.
//
class CommandBar final : public I_UiComponent, private Uncopyable {
    std::string _prompt;
    Line        _value;
    Size        _size;
    bool        _needsRedraw = true;

public:
    CommandBar() = default;

    void setPrompt(const std::string & prompt);
    const std::string & prompt() const { return _prompt; }

    const std::string & value() const { return _value.text(); }
    void clearValue();
    void append(const std::string & text);
    void eraseLast();

    // Column of the caret, at the end of the value.
    size_t caretColumn() const;

    // What render() draws. Blank if even the prompt doesn't fit.
    std::string visibleText() const;

    // I_UiComponent implementation:

    void resize(Size size) override;
    void render(I_Painter & painter, uint16_t originRow) override;
    bool needsRedraw() const override { return _needsRedraw; }
    void setNeedsRedraw() override { _needsRedraw = true; }

private:
    size_t promptWidth() const;
};

#endif // COMMON__COMMAND_BAR__HXX
