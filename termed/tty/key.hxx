// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef TTY__KEY__HXX
#define TTY__KEY__HXX

#include "termed/support/debug.hxx"

#include <iosfwd>
#include <string>
#include <type_traits>
#include <cstdint>

enum class Key {
    CHAR,               // KeyEvent::text
    ENTER,
    TAB,
    BACKSPACE,
    ESCAPE,
    UP,
    DOWN,
    LEFT,
    RIGHT,
    HOME,
    END,
    PAGE_UP,
    PAGE_DOWN,
    INSERT,
    DELETE
};

std::ostream & operator << (std::ostream & ost, Key key);

enum class Modifier {
    SHIFT,
    ALT,
    CONTROL,
    LAST = CONTROL
};

std::ostream & operator << (std::ostream & ost, Modifier modifier);

//
//
//

template <typename T, typename I>
class BitSet final {
    static_assert(std::is_unsigned_v<I>);

    I _bits = 0;

    static I bit(T t) {
        auto shift = static_cast<unsigned int>(t);
        ASSERT(shift < sizeof(I) * 8, << "Overflow.");
        return 1 << shift;
    }

public:
    BitSet() = default;

    void clear()        { _bits  =  I(0);        }
    void set(T t)       { _bits |=  bit(t);      }
    void unset(T t)     { _bits &= ~bit(t);      }
    bool get(T t) const { return _bits & bit(t); }
    I    bits()   const { return _bits;          }
    bool empty()  const { return _bits == 0;     }

    void setTo(T t, bool to) {
        if (to) { set(t);   }
        else    { unset(t); }
    }

    friend inline bool operator == (BitSet lhs, BitSet rhs) {
        return lhs._bits == rhs._bits;
    }

    friend inline bool operator != (BitSet lhs, BitSet rhs) {
        return !(lhs == rhs);
    }
};

using ModifierSet = BitSet<Modifier, uint8_t>;
std::ostream & operator << (std::ostream & ost, ModifierSet modifierSet);

//
// One key press as decoded from the terminal. Control letters arrive as
// CHAR with the lower case letter in text and CONTROL set.
//
struct KeyEvent {
    Key         key = Key::CHAR;
    ModifierSet modifiers;
    std::string text;

    KeyEvent() = default;
    explicit KeyEvent(Key key_, ModifierSet modifiers_ = ModifierSet()) :
        key(key_), modifiers(modifiers_) {}
    KeyEvent(const std::string & text_, ModifierSet modifiers_ = ModifierSet()) :
        key(Key::CHAR), modifiers(modifiers_), text(text_) {}

    bool has(Modifier modifier) const { return modifiers.get(modifier); }
};

bool operator == (const KeyEvent & lhs, const KeyEvent & rhs);
inline bool operator != (const KeyEvent & lhs, const KeyEvent & rhs) { return !(lhs == rhs); }

std::ostream & operator << (std::ostream & ost, const KeyEvent & event);

#endif // TTY__KEY__HXX
