// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__UI_COMPONENT__HXX
#define COMMON__UI_COMPONENT__HXX

#include "termed/common/data_types.hxx"
#include "termed/common/annotated_string.hxx"

#include <string>
#include <cstdint>

//
// Where components draw. Each call draws one whole screen row from
// column 0; whatever the text doesn't cover is cleared.
//

class I_Painter {
public:
    virtual void paintSpans(uint16_t row, AnnotatedStringIterator & spans) = 0;
    virtual void paintText(uint16_t row, const std::string & text) = 0;
    virtual void paintInverse(uint16_t row, const std::string & text) = 0;

protected:
    ~I_Painter() = default;
};

//
// A rectangle of the screen the editor owns: the text view and the bars.
//

class I_UiComponent {
public:
    virtual void resize(Size size) = 0;
    virtual void render(I_Painter & painter, uint16_t originRow) = 0;
    virtual bool needsRedraw() const = 0;
    virtual void setNeedsRedraw() = 0;

protected:
    ~I_UiComponent() = default;
};

#endif // COMMON__UI_COMPONENT__HXX
