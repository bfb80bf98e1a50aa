// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__STATUS_BAR__HXX
#define COMMON__STATUS_BAR__HXX

#include "termed/common/document_status.hxx"
#include "termed/common/ui_component.hxx"
#include "termed/support/pattern.hxx"

#include <string>

//
// The inverted row under the text area:
//
//     notes.txt - 12 lines (modified)                  3/12
//
class StatusBar final : public I_UiComponent, private Uncopyable {
    DocumentStatus _status;
    Size           _size;
    bool           _needsRedraw = true;

public:
    StatusBar() = default;

    void update(const DocumentStatus & status);

    // Exactly width columns. Blank if the text doesn't fit.
    static std::string format(const DocumentStatus & status, size_t width);

    // I_UiComponent implementation:

    void resize(Size size) override;
    void render(I_Painter & painter, uint16_t originRow) override;
    bool needsRedraw() const override { return _needsRedraw; }
    void setNeedsRedraw() override { _needsRedraw = true; }
};

#endif // COMMON__STATUS_BAR__HXX
