#include <pmc/line-editor.h>
#include <pmc/screen-buffer.h>
#include <algorithm>

namespace pmc {

std::string LineEditor::text() const {
    std::string out;
    out.reserve(_chars.size());
    for (char32_t ch : _chars) {
        appendUtf8(out, ch);
    }
    return out;
}

void LineEditor::setText(const std::string& text, size_t cursor) {
    _chars = decodeUtf8(text);
    _cursor = std::min(cursor, _chars.size());
}

void LineEditor::clear() {
    _chars.clear();
    _cursor = 0;
}

void LineEditor::insert(char32_t ch) {
    _chars.insert(_chars.begin() + static_cast<std::ptrdiff_t>(_cursor), ch);
    ++_cursor;
}

bool LineEditor::backspace() {
    if (_cursor == 0) return false;
    _chars.erase(_cursor - 1, 1);
    --_cursor;
    return true;
}

bool LineEditor::deleteForward() {
    if (_cursor >= _chars.size()) return false;
    _chars.erase(_cursor, 1);
    return true;
}

bool LineEditor::moveLeft() {
    if (_cursor == 0) return false;
    --_cursor;
    return true;
}

bool LineEditor::moveRight() {
    if (_cursor >= _chars.size()) return false;
    ++_cursor;
    return true;
}

bool LineEditor::handleKey(const KeyEvent& ev) {
    if (ev.isPrintable()) {
        insert(ev.ch);
        return true;
    }
    if (ev.mods & (MOD_CTRL | MOD_ALT)) {
        return false;
    }
    switch (ev.code) {
    case KeyCode::Backspace: backspace(); return true;
    case KeyCode::Delete: deleteForward(); return true;
    case KeyCode::Left: moveLeft(); return true;
    case KeyCode::Right: moveRight(); return true;
    case KeyCode::Home: home(); return true;
    case KeyCode::End: end(); return true;
    default: return false;
    }
}

} // namespace pmc
