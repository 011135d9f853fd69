#pragma once

#include <pmc/key-event.h>
#include <string>
#include <string_view>
#include <vector>

namespace pmc {

//=============================================================================
// KeyDecoder - terminal input bytes to KeyEvents
//
//   Ground --ESC--> Escape --'['--> Csi --final--> Ground
//                          --'O'--> Ss3 --final--> Ground
//                          --other--> Alt+key, Ground
//   Ground --lead byte--> Utf8 --last continuation--> Ground
//
// A bare ESC cannot be told apart from the start of a sequence until more
// bytes arrive or the caller gives up waiting and calls timeout().
//=============================================================================

class KeyDecoder {
public:
    enum class State {
        Ground,
        Escape,
        Csi,
        Ss3,
        Utf8
    };

    void feed(std::string_view bytes);

    // Events decoded so far; the internal queue is emptied
    std::vector<KeyEvent> drain();

    // An escape prefix or partial UTF-8 sequence is buffered
    bool pending() const { return _state != State::Ground; }

    // Resolve whatever is buffered: lone ESC -> Escape, ESC [ / ESC O -> Alt+key
    void timeout();

    State state() const { return _state; }

private:
    void ground(unsigned char byte, uint8_t extraMods);
    void escape(unsigned char byte);
    void csi(unsigned char byte);
    void ss3(unsigned char byte);
    void utf8(unsigned char byte);

    void dispatchCsi(char final);
    void emit(KeyEvent ev) { _events.push_back(ev); }
    void reset();

    State _state = State::Ground;
    std::string _params;
    char32_t _codepoint = 0;
    int _utf8Remaining = 0;
    uint8_t _utf8Mods = MOD_NONE;
    std::vector<KeyEvent> _events;
};

} // namespace pmc
