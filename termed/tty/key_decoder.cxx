// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/tty/key_decoder.hxx"
#include "termed/support/debug.hxx"

#include <string>

namespace {

bool inRange(uint8_t c, uint8_t min, uint8_t max) {
    return c >= min && c <= max;
}

// xterm encodes modifiers as 1 + bits: 1 shift, 2 alt, 4 control.
ModifierSet decodeModifiers(int param) {
    ModifierSet modifiers;

    if (param > 1) {
        auto bits = param - 1;
        modifiers.setTo(Modifier::SHIFT,   bits & 1);
        modifiers.setTo(Modifier::ALT,     bits & 2);
        modifiers.setTo(Modifier::CONTROL, bits & 4);
    }

    return modifiers;
}

KeyEvent replacement() {
    return KeyEvent(std::string(utf8::REPLACEMENT));
}

bool keyForFinal(uint8_t c, Key & key) {
    switch (c) {
        case 'A':
            key = Key::UP;
            return true;
        case 'B':
            key = Key::DOWN;
            return true;
        case 'C':
            key = Key::RIGHT;
            return true;
        case 'D':
            key = Key::LEFT;
            return true;
        case 'H':
            key = Key::HOME;
            return true;
        case 'F':
            key = Key::END;
            return true;
        default:
            return false;
    }
}

bool keyForTilde(int param, Key & key) {
    switch (param) {
        case 1:
        case 7:
            key = Key::HOME;
            return true;
        case 2:
            key = Key::INSERT;
            return true;
        case 3:
            key = Key::DELETE;
            return true;
        case 4:
        case 8:
            key = Key::END;
            return true;
        case 5:
            key = Key::PAGE_UP;
            return true;
        case 6:
            key = Key::PAGE_DOWN;
            return true;
        default:
            return false;
    }
}

} // namespace {anonymous}

void KeyDecoder::consume(const uint8_t * data, size_t size, std::vector<KeyEvent> & events) {
    for (size_t i = 0; i != size; ++i) {
        consume(data[i], events);
    }
}

void KeyDecoder::consume(uint8_t c, std::vector<KeyEvent> & events) {
    switch (_state) {
        case State::GROUND:
            ground(c, events);
            break;
        case State::ESCAPE:
            escape(c, events);
            break;
        case State::CSI:
            csi(c, events);
            break;
        case State::SS3:
            ss3(c, events);
            break;
    }
}

void KeyDecoder::flush(std::vector<KeyEvent> & events) {
    switch (_state) {
        case State::GROUND:
            break;
        case State::ESCAPE:
            _pending.clear();
            emit(KeyEvent(Key::ESCAPE), events);
            break;
        case State::CSI:
        case State::SS3:
            PRINT(<< "Dropping incomplete escape sequence");
            break;
    }

    _state = State::GROUND;
    _escSeq.clear();
    _pending.clear();
}

void KeyDecoder::consumeRead(const uint8_t * data, size_t size, size_t capacity,
                             std::vector<KeyEvent> & events) {
    consume(data, size, events);
    if (size < capacity) { flush(events); }
}

void KeyDecoder::ground(uint8_t c, std::vector<KeyEvent> & events) {
    if (_utf8.pending() && c < 0x80) {
        // Truncated sequence; the ASCII byte still counts.
        _utf8.reset();
        emit(replacement(), events);
    }

    if (c < 0x80) {
        if (c == 0x1B /* ESC */) {
            _state = State::ESCAPE;
            _escSeq.clear();
        }
        else if (inRange(c, 0x00, 0x1F) || c == 0x7F /* DEL */) {
            processControl(c, events);
        }
        else {
            emit(KeyEvent(std::string(1, static_cast<char>(c))), events);
        }
        return;
    }

    switch (_utf8.consume(c)) {
        case utf8::Decoder::Result::ACCEPT:
            emit(KeyEvent(_utf8.sequence()), events);
            break;
        case utf8::Decoder::Result::REJECT:
            emit(replacement(), events);
            break;
        case utf8::Decoder::Result::PENDING:
            break;
    }
}

void KeyDecoder::escape(uint8_t c, std::vector<KeyEvent> & events) {
    if (c == 0x5B /* [ */) {
        _state = State::CSI;
    }
    else if (c == 0x4F /* O */) {
        _state = State::SS3;
    }
    else if (c == 0x1B /* ESC */) {
        // Escape pressed twice.
        emit(KeyEvent(Key::ESCAPE), events);
    }
    else {
        // Meta: ESC prefixes the key.
        _state = State::GROUND;
        _pending.set(Modifier::ALT);
        ground(c, events);
    }
}

void KeyDecoder::csi(uint8_t c, std::vector<KeyEvent> & events) {
    if (inRange(c, 0x20 /* SPACE */, 0x3F /* ? */)) {
        // param or intermediate
        _escSeq.push_back(c);
    }
    else if (inRange(c, 0x40 /* @ */, 0x7E /* ~ */)) {
        // dispatch
        _escSeq.push_back(c);
        processCsi(_escSeq, events);
        _escSeq.clear();
        _state = State::GROUND;
    }
    else {
        ERROR(<< "Unexpected byte in CSI: " << static_cast<int>(c));
        _escSeq.clear();
        _state = State::GROUND;
        ground(c, events);
    }
}

void KeyDecoder::ss3(uint8_t c, std::vector<KeyEvent> & events) {
    _state = State::GROUND;

    Key key;

    if (keyForFinal(c, key)) {
        emit(KeyEvent(key), events);
    }
    else if (c == 'M') {
        emit(KeyEvent(Key::ENTER), events);
    }
    else {
        PRINT(<< "Unsupported SS3: " << static_cast<int>(c));
    }
}

void KeyDecoder::processControl(uint8_t c, std::vector<KeyEvent> & events) {
    ModifierSet control;
    control.set(Modifier::CONTROL);

    switch (c) {
        case 0x0D /* CR */:
        case 0x0A /* LF */:
            emit(KeyEvent(Key::ENTER), events);
            break;
        case 0x09 /* HT */:
            emit(KeyEvent(Key::TAB), events);
            break;
        case 0x08 /* BS */:
        case 0x7F /* DEL */:
            emit(KeyEvent(Key::BACKSPACE), events);
            break;
        case 0x00 /* NUL */:
            emit(KeyEvent(" ", control), events);
            break;
        default:
            if (inRange(c, 0x01, 0x1A)) {
                // Ctrl-A through Ctrl-Z.
                emit(KeyEvent(std::string(1, static_cast<char>('a' + c - 1)), control), events);
            }
            else {
                // Ctrl-\ Ctrl-] Ctrl-^ Ctrl-_
                emit(KeyEvent(std::string(1, static_cast<char>(c + 0x40)), control), events);
            }
            break;
    }
}

void KeyDecoder::processCsi(const std::vector<uint8_t> & seq, std::vector<KeyEvent> & events) {
    ASSERT(!seq.empty(), );

    auto finalByte = seq.back();

    std::vector<int> params;
    int              param    = 0;
    bool             hasParam = false;
    bool             priv     = false;

    for (size_t i = 0; i != seq.size() - 1; ++i) {
        auto c = seq[i];

        if (inRange(c, 0x30 /* 0 */, 0x39 /* 9 */)) {
            param    = 10 * param + (c - 0x30);
            hasParam = true;
        }
        else if (c == 0x3B /* ; */) {
            params.push_back(hasParam ? param : 0);
            param    = 0;
            hasParam = false;
        }
        else {
            priv = true;
        }
    }

    if (hasParam || !params.empty()) {
        params.push_back(hasParam ? param : 0);
    }

    if (priv) {
        PRINT(<< "Ignoring private CSI: " << std::string(seq.begin(), seq.end()));
        return;
    }

    auto modifiers = decodeModifiers(params.size() > 1 ? params[1] : 1);

    Key key;

    if (finalByte == '~') {
        if (!params.empty() && keyForTilde(params[0], key)) {
            emit(KeyEvent(key, modifiers), events);
            return;
        }
    }
    else if (finalByte == 'Z') {
        // Back tab.
        modifiers.set(Modifier::SHIFT);
        emit(KeyEvent(Key::TAB, modifiers), events);
        return;
    }
    else if (keyForFinal(finalByte, key)) {
        emit(KeyEvent(key, modifiers), events);
        return;
    }

    PRINT(<< "Unsupported CSI: " << std::string(seq.begin(), seq.end()));
}

void KeyDecoder::emit(KeyEvent event, std::vector<KeyEvent> & events) {
    if (!_pending.empty()) {
        event.modifiers.set(Modifier::ALT);
        _pending.clear();
    }

    events.push_back(std::move(event));
}
