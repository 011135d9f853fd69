#pragma once

#include <pmc/result.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace pmc {

enum class KeyCode : uint8_t {
    Char,
    Enter,
    Escape,
    Backspace,
    Tab,
    BackTab,
    Delete,
    Insert,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12
};

// Modifier bits
static constexpr uint8_t MOD_NONE  = 0x00;
static constexpr uint8_t MOD_SHIFT = 0x01;
static constexpr uint8_t MOD_ALT   = 0x02;
static constexpr uint8_t MOD_CTRL  = 0x04;

struct KeyEvent {
    KeyCode code = KeyCode::Char;
    char32_t ch = 0;      // code point for Char; lower-case letter for Ctrl+letter
    uint8_t mods = MOD_NONE;

    static KeyEvent key(KeyCode code, uint8_t mods = MOD_NONE) { return KeyEvent{code, 0, mods}; }
    static KeyEvent character(char32_t ch, uint8_t mods = MOD_NONE) { return KeyEvent{KeyCode::Char, ch, mods}; }
    static KeyEvent ctrl(char letter) { return KeyEvent{KeyCode::Char, static_cast<char32_t>(letter), MOD_CTRL}; }

    // Plain or shifted text that goes into a line
    bool isPrintable() const {
        return code == KeyCode::Char && ch >= 0x20 && ch != 0x7f &&
               (mods & (MOD_CTRL | MOD_ALT)) == 0;
    }

    bool operator==(const KeyEvent& o) const { return code == o.code && ch == o.ch && mods == o.mods; }
    bool operator!=(const KeyEvent& o) const { return !(*this == o); }
};

const char* keyCodeName(KeyCode code);

// "Ctrl+Q", "Alt+x", "F2", "Shift+Tab"
std::string describeKey(const KeyEvent& ev);

//=============================================================================
// KeyChord - a configured binding such as "Ctrl+T" or "F2"
//=============================================================================

struct KeyChord {
    KeyEvent key;

    bool matches(const KeyEvent& ev) const;

    std::string toString() const { return describeKey(key); }
};

// Tokens joined by '+', case-insensitive: modifiers ctrl/alt/shift, then one
// key (a single character, f1-f12, or a named key such as enter, tab, pgup)
Result<KeyChord> parseKeyChord(std::string_view text);

} // namespace pmc
