// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef TTY__KEY_DECODER__HXX
#define TTY__KEY_DECODER__HXX

#include "termed/tty/key.hxx"
#include "termed/common/utf8.hxx"

#include <vector>
#include <cstddef>
#include <cstdint>

//
// Turns the bytes read from a raw mode terminal into key events.
// Understands UTF-8 text, C0 controls, and the CSI and SS3 sequences
// xterm-like terminals send for cursor and editing keys, including the
// ";MOD" modifier parameter.
//
// A lone ESC is ambiguous until more input arrives, so after each read
// the caller calls flush() to turn it into an Escape press. consumeRead()
// does both for one read().
//
class KeyDecoder {
    enum class State {
        GROUND,
        ESCAPE,
        CSI,
        SS3
    };

    State                _state = State::GROUND;
    utf8::Decoder        _utf8;
    std::vector<uint8_t> _escSeq;
    ModifierSet          _pending;      // ALT from a leading ESC.

public:
    KeyDecoder() = default;

    void consume(const uint8_t * data, size_t size, std::vector<KeyEvent> & events);
    void consume(uint8_t c, std::vector<KeyEvent> & events);

    // End of the available input.
    void flush(std::vector<KeyEvent> & events);

    // One read() into a buffer of the given capacity. A full buffer may
    // have more input behind it, so a pending sequence is kept.
    void consumeRead(const uint8_t * data, size_t size, size_t capacity,
                     std::vector<KeyEvent> & events);

protected:
    void ground(uint8_t c, std::vector<KeyEvent> & events);
    void escape(uint8_t c, std::vector<KeyEvent> & events);
    void csi(uint8_t c, std::vector<KeyEvent> & events);
    void ss3(uint8_t c, std::vector<KeyEvent> & events);

    void processControl(uint8_t c, std::vector<KeyEvent> & events);
    void processCsi(const std::vector<uint8_t> & seq, std::vector<KeyEvent> & events);
    void emit(KeyEvent event, std::vector<KeyEvent> & events);
};

#endif // TTY__KEY_DECODER__HXX
