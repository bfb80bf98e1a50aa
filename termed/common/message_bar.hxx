// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__MESSAGE_BAR__HXX
#define COMMON__MESSAGE_BAR__HXX

#include "termed/common/ui_component.hxx"
#include "termed/support/pattern.hxx"
#include "termed/support/time.hxx"

#include <string>
#include <cstdint>

//
// The bottom row: help text, errors and confirmations. A message is
// shown until it is replaced or its timeout lapses.
//
class MessageBar final : public I_UiComponent, private Uncopyable {
    uint32_t    _timeout;       // Milliseconds.
    std::string _message;
    Timer       _timer;
    Size        _size;
    bool        _clearedAfterExpiry = true;
    bool        _needsRedraw        = true;

public:
    explicit MessageBar(uint32_t timeout) : _timeout(timeout) {}

    void update(const std::string & message);

    const std::string & message() const { return _message; }
    bool                isExpired() const { return _timer.expired(); }
    uint32_t            timeout() const { return _timeout; }

    // Milliseconds until a shown message must be cleared, zero if none is.
    uint32_t expiresIn() const {
        return _clearedAfterExpiry ? 0 : _timer.remaining();
    }

    // I_UiComponent implementation:

    void resize(Size size) override;
    void render(I_Painter & painter, uint16_t originRow) override;
    bool needsRedraw() const override {
        return _needsRedraw || (!_clearedAfterExpiry && isExpired());
    }
    void setNeedsRedraw() override { _needsRedraw = true; }
};

#endif // COMMON__MESSAGE_BAR__HXX
