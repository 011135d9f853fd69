#include <pmc/key-event.h>
#include <pmc/screen-buffer.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace pmc {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(std::string s) {
    auto ws = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && ws(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && ws(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

struct NamedKey {
    const char* name;
    KeyCode code;
};

const NamedKey NAMED_KEYS[] = {
    {"enter", KeyCode::Enter},     {"return", KeyCode::Enter},
    {"escape", KeyCode::Escape},   {"esc", KeyCode::Escape},
    {"backspace", KeyCode::Backspace},
    {"tab", KeyCode::Tab},         {"backtab", KeyCode::BackTab},
    {"delete", KeyCode::Delete},   {"del", KeyCode::Delete},
    {"insert", KeyCode::Insert},   {"ins", KeyCode::Insert},
    {"up", KeyCode::Up},           {"down", KeyCode::Down},
    {"left", KeyCode::Left},       {"right", KeyCode::Right},
    {"home", KeyCode::Home},       {"end", KeyCode::End},
    {"pageup", KeyCode::PageUp},   {"pgup", KeyCode::PageUp},
    {"pagedown", KeyCode::PageDown}, {"pgdn", KeyCode::PageDown},
};

} // namespace

const char* keyCodeName(KeyCode code) {
    switch (code) {
    case KeyCode::Char: return "Char";
    case KeyCode::Enter: return "Enter";
    case KeyCode::Escape: return "Escape";
    case KeyCode::Backspace: return "Backspace";
    case KeyCode::Tab: return "Tab";
    case KeyCode::BackTab: return "BackTab";
    case KeyCode::Delete: return "Delete";
    case KeyCode::Insert: return "Insert";
    case KeyCode::Up: return "Up";
    case KeyCode::Down: return "Down";
    case KeyCode::Left: return "Left";
    case KeyCode::Right: return "Right";
    case KeyCode::Home: return "Home";
    case KeyCode::End: return "End";
    case KeyCode::PageUp: return "PageUp";
    case KeyCode::PageDown: return "PageDown";
    case KeyCode::F1: return "F1";
    case KeyCode::F2: return "F2";
    case KeyCode::F3: return "F3";
    case KeyCode::F4: return "F4";
    case KeyCode::F5: return "F5";
    case KeyCode::F6: return "F6";
    case KeyCode::F7: return "F7";
    case KeyCode::F8: return "F8";
    case KeyCode::F9: return "F9";
    case KeyCode::F10: return "F10";
    case KeyCode::F11: return "F11";
    case KeyCode::F12: return "F12";
    }
    return "?";
}

std::string describeKey(const KeyEvent& ev) {
    std::string out;
    if (ev.mods & MOD_CTRL) out += "Ctrl+";
    if (ev.mods & MOD_ALT) out += "Alt+";
    if (ev.mods & MOD_SHIFT) out += "Shift+";
    if (ev.code == KeyCode::Char) {
        if (ev.mods & MOD_CTRL) {
            appendUtf8(out, static_cast<char32_t>(std::toupper(static_cast<int>(ev.ch))));
        } else {
            appendUtf8(out, ev.ch);
        }
    } else {
        out += keyCodeName(ev.code);
    }
    return out;
}

bool KeyChord::matches(const KeyEvent& ev) const {
    if (ev.code != key.code) return false;
    if (key.code != KeyCode::Char) {
        return ev.mods == key.mods;
    }
    // Shift is implied by the character itself for plain text
    uint8_t mask = (key.mods & (MOD_CTRL | MOD_ALT)) ? 0xff : static_cast<uint8_t>(~MOD_SHIFT);
    if ((ev.mods & mask) != (key.mods & mask)) return false;
    if (key.mods & (MOD_CTRL | MOD_ALT)) {
        char32_t a = ev.ch < 0x80 ? static_cast<char32_t>(std::tolower(static_cast<int>(ev.ch))) : ev.ch;
        char32_t b = key.ch < 0x80 ? static_cast<char32_t>(std::tolower(static_cast<int>(key.ch))) : key.ch;
        return a == b;
    }
    return ev.ch == key.ch;
}

Result<KeyChord> parseKeyChord(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    std::string s = trim(std::string(text));
    for (size_t i = 0; i < s.size(); ++i) {
        // A trailing '+' is the plus key itself
        if (s[i] == '+' && !current.empty()) {
            tokens.push_back(trim(current));
            current.clear();
        } else {
            current += s[i];
        }
    }
    if (!current.empty()) tokens.push_back(trim(current));
    if (tokens.empty()) {
        return Err<KeyChord>("empty key chord");
    }

    KeyChord chord;
    uint8_t mods = MOD_NONE;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        std::string t = lower(tokens[i]);
        if (t == "ctrl" || t == "control" || t == "c") {
            mods |= MOD_CTRL;
        } else if (t == "alt" || t == "meta" || t == "m") {
            mods |= MOD_ALT;
        } else if (t == "shift" || t == "s") {
            mods |= MOD_SHIFT;
        } else {
            return Err<KeyChord>("unknown modifier '" + tokens[i] + "' in '" + std::string(text) + "'");
        }
    }

    const std::string& keyToken = tokens.back();
    std::string k = lower(keyToken);
    std::u32string cps = decodeUtf8(keyToken);

    if (k == "space") {
        chord.key = KeyEvent::character(U' ', mods);
        return Ok(chord);
    }
    if (cps.size() == 1) {
        char32_t ch = cps[0];
        if (mods & MOD_CTRL) {
            if (ch >= 0x80 || !std::isalpha(static_cast<int>(ch))) {
                return Err<KeyChord>("Ctrl chords need a letter: '" + std::string(text) + "'");
            }
            ch = static_cast<char32_t>(std::tolower(static_cast<int>(ch)));
        }
        chord.key = KeyEvent::character(ch, mods);
        return Ok(chord);
    }
    if (k.size() >= 2 && k[0] == 'f' && std::all_of(k.begin() + 1, k.end(), ::isdigit)) {
        int n = std::atoi(k.c_str() + 1);
        if (n < 1 || n > 12) {
            return Err<KeyChord>("function key out of range: '" + keyToken + "'");
        }
        chord.key = KeyEvent::key(static_cast<KeyCode>(static_cast<int>(KeyCode::F1) + n - 1), mods);
        return Ok(chord);
    }
    for (const auto& named : NAMED_KEYS) {
        if (k == named.name) {
            if (named.code == KeyCode::Tab && (mods & MOD_SHIFT)) {
                chord.key = KeyEvent::key(KeyCode::BackTab, mods & static_cast<uint8_t>(~MOD_SHIFT));
            } else {
                chord.key = KeyEvent::key(named.code, mods);
            }
            return Ok(chord);
        }
    }
    return Err<KeyChord>("unknown key '" + keyToken + "' in '" + std::string(text) + "'");
}

} // namespace pmc
