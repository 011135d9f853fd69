#include <pmc/key-decoder.h>
#include <ytrace/ytrace.hpp>
#include <cstdlib>

namespace pmc {

namespace {

constexpr unsigned char ESC = 0x1b;

// xterm modifier parameter: 1 + (shift | alt << 1 | ctrl << 2)
uint8_t modsFromParam(int param) {
    if (param <= 1) return MOD_NONE;
    int bits = param - 1;
    uint8_t mods = MOD_NONE;
    if (bits & 1) mods |= MOD_SHIFT;
    if (bits & 2) mods |= MOD_ALT;
    if (bits & 4) mods |= MOD_CTRL;
    return mods;
}

bool tildeKey(int number, KeyCode& code) {
    switch (number) {
    case 1: case 7: code = KeyCode::Home; return true;
    case 2: code = KeyCode::Insert; return true;
    case 3: code = KeyCode::Delete; return true;
    case 4: case 8: code = KeyCode::End; return true;
    case 5: code = KeyCode::PageUp; return true;
    case 6: code = KeyCode::PageDown; return true;
    case 11: code = KeyCode::F1; return true;
    case 12: code = KeyCode::F2; return true;
    case 13: code = KeyCode::F3; return true;
    case 14: code = KeyCode::F4; return true;
    case 15: code = KeyCode::F5; return true;
    case 17: code = KeyCode::F6; return true;
    case 18: code = KeyCode::F7; return true;
    case 19: code = KeyCode::F8; return true;
    case 20: code = KeyCode::F9; return true;
    case 21: code = KeyCode::F10; return true;
    case 23: code = KeyCode::F11; return true;
    case 24: code = KeyCode::F12; return true;
    default: return false;
    }
}

bool letterKey(char final, KeyCode& code) {
    switch (final) {
    case 'A': code = KeyCode::Up; return true;
    case 'B': code = KeyCode::Down; return true;
    case 'C': code = KeyCode::Right; return true;
    case 'D': code = KeyCode::Left; return true;
    case 'H': code = KeyCode::Home; return true;
    case 'F': code = KeyCode::End; return true;
    case 'P': code = KeyCode::F1; return true;
    case 'Q': code = KeyCode::F2; return true;
    case 'R': code = KeyCode::F3; return true;
    case 'S': code = KeyCode::F4; return true;
    default: return false;
    }
}

} // namespace

void KeyDecoder::feed(std::string_view bytes) {
    for (char c : bytes) {
        auto byte = static_cast<unsigned char>(c);
        switch (_state) {
        case State::Ground: ground(byte, MOD_NONE); break;
        case State::Escape: escape(byte); break;
        case State::Csi: csi(byte); break;
        case State::Ss3: ss3(byte); break;
        case State::Utf8: utf8(byte); break;
        }
    }
}

std::vector<KeyEvent> KeyDecoder::drain() {
    std::vector<KeyEvent> out;
    out.swap(_events);
    return out;
}

void KeyDecoder::reset() {
    _state = State::Ground;
    _params.clear();
    _codepoint = 0;
    _utf8Remaining = 0;
    _utf8Mods = MOD_NONE;
}

void KeyDecoder::timeout() {
    switch (_state) {
    case State::Ground:
        return;
    case State::Escape:
        emit(KeyEvent::key(KeyCode::Escape));
        break;
    case State::Csi:
        if (_params.empty()) {
            emit(KeyEvent::character(U'[', MOD_ALT));
        } else {
            ydebug("KeyDecoder: dropping incomplete CSI '{}'", _params);
        }
        break;
    case State::Ss3:
        emit(KeyEvent::character(U'O', MOD_ALT));
        break;
    case State::Utf8:
        emit(KeyEvent::character(U'\uFFFD', _utf8Mods));
        break;
    }
    reset();
}

void KeyDecoder::ground(unsigned char byte, uint8_t extraMods) {
    if (byte == ESC) {
        _state = State::Escape;
        return;
    }
    if (byte == '\r' || byte == '\n') {
        emit(KeyEvent::key(KeyCode::Enter, extraMods));
    } else if (byte == '\t') {
        emit(KeyEvent::key(KeyCode::Tab, extraMods));
    } else if (byte == 0x7f || byte == 0x08) {
        emit(KeyEvent::key(KeyCode::Backspace, extraMods));
    } else if (byte == 0x00) {
        emit(KeyEvent::character(U' ', MOD_CTRL | extraMods));
    } else if (byte >= 0x01 && byte <= 0x1a) {
        emit(KeyEvent::character(static_cast<char32_t>('a' + byte - 1), MOD_CTRL | extraMods));
    } else if (byte < 0x20) {
        ydebug("KeyDecoder: ignoring control byte 0x{:02x}", static_cast<int>(byte));
    } else if (byte < 0x80) {
        emit(KeyEvent::character(static_cast<char32_t>(byte), extraMods));
    } else if ((byte & 0xE0) == 0xC0) {
        _codepoint = byte & 0x1F;
        _utf8Remaining = 1;
        _utf8Mods = extraMods;
        _state = State::Utf8;
    } else if ((byte & 0xF0) == 0xE0) {
        _codepoint = byte & 0x0F;
        _utf8Remaining = 2;
        _utf8Mods = extraMods;
        _state = State::Utf8;
    } else if ((byte & 0xF8) == 0xF0) {
        _codepoint = byte & 0x07;
        _utf8Remaining = 3;
        _utf8Mods = extraMods;
        _state = State::Utf8;
    } else {
        emit(KeyEvent::character(U'\uFFFD', extraMods));
    }
}

void KeyDecoder::escape(unsigned char byte) {
    if (byte == '[') {
        _params.clear();
        _state = State::Csi;
    } else if (byte == 'O') {
        _state = State::Ss3;
    } else if (byte == ESC) {
        // ESC ESC: the first one was a plain Escape
        emit(KeyEvent::key(KeyCode::Escape));
    } else {
        _state = State::Ground;
        ground(byte, MOD_ALT);
    }
}

void KeyDecoder::csi(unsigned char byte) {
    if (byte >= 0x20 && byte <= 0x3f) {
        _params += static_cast<char>(byte);
        return;
    }
    if (byte >= 0x40 && byte <= 0x7e) {
        dispatchCsi(static_cast<char>(byte));
        reset();
        return;
    }
    ydebug("KeyDecoder: aborting CSI on byte 0x{:02x}", static_cast<int>(byte));
    reset();
    ground(byte, MOD_NONE);
}

void KeyDecoder::dispatchCsi(char final) {
    int first = 0;
    int second = 0;
    size_t semi = _params.find(';');
    if (!_params.empty()) {
        first = std::atoi(_params.c_str());
    }
    if (semi != std::string::npos) {
        second = std::atoi(_params.c_str() + semi + 1);
    }
    uint8_t mods = modsFromParam(second);

    if (final == 'Z') {
        emit(KeyEvent::key(KeyCode::BackTab, mods));
        return;
    }
    KeyCode code;
    if (final == '~') {
        if (tildeKey(first, code)) {
            emit(KeyEvent::key(code, mods));
        } else {
            ydebug("KeyDecoder: unknown CSI {}~", first);
        }
        return;
    }
    if (letterKey(final, code)) {
        emit(KeyEvent::key(code, mods));
        return;
    }
    ydebug("KeyDecoder: unhandled CSI '{}{}'", _params, final);
}

void KeyDecoder::ss3(unsigned char byte) {
    KeyCode code;
    if (letterKey(static_cast<char>(byte), code)) {
        emit(KeyEvent::key(code));
    } else {
        ydebug("KeyDecoder: unhandled SS3 0x{:02x}", static_cast<int>(byte));
    }
    reset();
}

void KeyDecoder::utf8(unsigned char byte) {
    if ((byte & 0xC0) != 0x80) {
        // Truncated sequence; the new byte starts over
        uint8_t mods = _utf8Mods;
        reset();
        emit(KeyEvent::character(U'\uFFFD', mods));
        ground(byte, MOD_NONE);
        return;
    }
    _codepoint = (_codepoint << 6) | (byte & 0x3F);
    if (--_utf8Remaining == 0) {
        emit(KeyEvent::character(_codepoint, _utf8Mods));
        reset();
    }
}

} // namespace pmc
