#include <pmc/app.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>

namespace pmc {

namespace {

constexpr const char* PROMPT = "> ";

void loadChord(const Config& config, const char* key, KeyChord& target) {
    auto text = config.get<std::string>(key);
    if (!text) return;
    auto chord = parseKeyChord(*text);
    if (!chord) {
        ywarn("{}: {}, keeping {}", key, error_msg(chord), target.toString());
        return;
    }
    target = *chord;
}

} // namespace

const char* focusModeName(FocusMode mode) {
    return mode == FocusMode::Command ? "command" : "grid";
}

AppOptions AppOptions::fromConfig(const Config& config) {
    AppOptions options;
    loadChord(config, Config::KEY_KEYS_TOGGLE, options.toggle);
    loadChord(config, Config::KEY_KEYS_QUIT, options.quit);
    loadChord(config, Config::KEY_KEYS_EDIT, options.edit);
    loadChord(config, Config::KEY_KEYS_COMPLETE, options.complete);
    options.headerHeight = config.get<int>(Config::KEY_LAYOUT_HEADER_HEIGHT, options.headerHeight);
    options.statusHeight = config.get<int>(Config::KEY_LAYOUT_STATUS_HEIGHT, options.statusHeight);
    options.commandHeight = config.get<int>(Config::KEY_LAYOUT_COMMAND_HEIGHT, options.commandHeight);
    options.truecolor = config.get<bool>(Config::KEY_RENDER_TRUECOLOR, options.truecolor);
    return options;
}

//=============================================================================
// Construction
//=============================================================================

Result<App::Ptr> App::create(Store::Ptr store, std::string kind, SchemaProvider schema,
                             TermOutput& out, int width, int height,
                             AppOptions options, Theme theme) {
    if (!store) {
        return Err<Ptr>("App::create: no store");
    }
    if (!store->hasCollection(kind)) {
        return Err<Ptr>("App::create: store has no collection '" + kind + "'");
    }
    auto app = Ptr(new App(std::move(store), std::move(kind), std::move(schema), out,
                           width, height, std::move(options), std::move(theme)));

    if (auto layout = app->_viewer.computeColumnLayout(app->_layout.content.width); !layout) {
        // Not fatal here; render shows it until the schema is fixed
        yerror("App: {}", error_msg(layout));
    }

    std::weak_ptr<App> weak = app;
    app->_saveErrorSub = app->_store->subscribe(StoreEventKind::SaveError, [weak](const StoreEvent& ev) {
        if (auto self = weak.lock()) {
            std::lock_guard<std::mutex> lock(self->_asyncStatusMutex);
            self->_asyncStatus = ev.message;
        }
    });
    return Ok(app);
}

App::App(Store::Ptr store, std::string kind, SchemaProvider schema, TermOutput& out,
         int width, int height, AppOptions options, Theme theme)
    : _store(std::move(store)), _kind(std::move(kind)), _options(std::move(options)),
      _theme(std::move(theme)),
      _renderer(out, width, height, _options.truecolor),
      _viewer(*_store, _kind, std::move(schema)) {
    _layout = computeLayout(width, height, _options.headerHeight, _options.statusHeight,
                            _options.commandHeight);
    _viewer.setViewportRows(_layout.content.height - 1);
    _viewer.refresh(true);
    syncSelection();
    yinfo("App: {}x{} on '{}'", width, height, _kind);
}

App::~App() {
    if (_saveErrorSub) {
        _store->unsubscribe(_saveErrorSub);
    }
}

void App::setStatus(std::string message) {
    _state.statusMessage = std::move(message);
}

void App::takeAsyncStatus() {
    std::lock_guard<std::mutex> lock(_asyncStatusMutex);
    if (_asyncStatus) {
        _state.statusMessage = std::move(*_asyncStatus);
        _asyncStatus.reset();
    }
}

void App::syncSelection() {
    _state.selectedRow = _viewer.selectedRow();
    _state.selectedColumn = _viewer.selectedColumn();
}

//=============================================================================
// Input
//=============================================================================

bool App::handleKey(const KeyEvent& ev) {
    if (_state.terminated) {
        return false;
    }
    if (_options.quit.matches(ev)) {
        ydebug("App: quit");
        _state.terminated = true;
        return true;
    }
    if (_options.toggle.matches(ev)) {
        toggleFocus();
        return true;
    }

    bool changed = false;
    if (_state.focus == FocusMode::Command) {
        changed = handleCommandKey(ev);
    } else if (_state.grid == GridState::Browse) {
        changed = handleBrowseKey(ev);
    } else {
        changed = handleEditKey(ev);
    }
    syncSelection();
    return changed;
}

void App::toggleFocus() {
    if (_state.focus == FocusMode::Command) {
        _state.focus = FocusMode::Grid;
        _state.grid = GridState::Browse;
    } else {
        if (_state.grid == GridState::Edit) {
            cancelEdit();
        }
        _state.focus = FocusMode::Command;
    }
    _needsFullRefresh = true;
    ydebug("App: focus -> {}", focusModeName(_state.focus));
}

bool App::handleCommandKey(const KeyEvent& ev) {
    if (_options.complete.matches(ev)) {
        return complete();
    }
    if (ev.mods & (MOD_CTRL | MOD_ALT)) {
        return false;
    }
    switch (ev.code) {
    case KeyCode::Enter:
        submitCommand();
        return true;
    case KeyCode::Escape:
        _state.command.clear();
        _state.historyIndex = _state.history.size();
        return true;
    case KeyCode::Up:
        return historyUp();
    case KeyCode::Down:
        return historyDown();
    default:
        return _state.command.handleKey(ev);
    }
}

void App::submitCommand() {
    std::string line = _state.command.text();
    _state.command.clear();
    _historyDraft.clear();

    bool blank = std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
    if (!blank) {
        if (_state.history.empty() || _state.history.back() != line) {
            _state.history.push_back(line);
        }
        if (_executor) {
            ydebug("App: executing '{}'", line);
            try {
                _executor(line);
            } catch (const std::exception& e) {
                yerror("App: command '{}' failed: {}", line, e.what());
                setStatus(std::string("error: ") + e.what());
            } catch (...) {
                yerror("App: command '{}' failed with a non-standard exception", line);
                setStatus("error: command failed");
            }
        }
    }
    _state.historyIndex = _state.history.size();
    // Whatever the command did, show current data
    _viewer.refresh(true);
}

bool App::complete() {
    if (!_completion) {
        return false;
    }
    std::vector<std::string> candidates;
    try {
        candidates = _completion(_state.command.text(), _state.command.cursor());
    } catch (const std::exception& e) {
        yerror("App: completion failed: {}", e.what());
        return false;
    } catch (...) {
        yerror("App: completion failed with a non-standard exception");
        return false;
    }
    if (candidates.empty()) {
        return false;
    }
    _state.command.setText(candidates.front());
    if (candidates.size() > 1) {
        std::string list;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (i > 0) list += " ";
            list += candidates[i];
        }
        setStatus(list);
    }
    return true;
}

bool App::historyUp() {
    if (_state.history.empty() || _state.historyIndex == 0) {
        return false;
    }
    if (_state.historyIndex >= _state.history.size()) {
        _historyDraft = _state.command.text();
        _state.historyIndex = _state.history.size();
    }
    --_state.historyIndex;
    _state.command.setText(_state.history[_state.historyIndex]);
    return true;
}

bool App::historyDown() {
    if (_state.historyIndex >= _state.history.size()) {
        return false;
    }
    ++_state.historyIndex;
    if (_state.historyIndex == _state.history.size()) {
        _state.command.setText(_historyDraft);
    } else {
        _state.command.setText(_state.history[_state.historyIndex]);
    }
    return true;
}

bool App::handleBrowseKey(const KeyEvent& ev) {
    if (_options.edit.matches(ev)) {
        return beginEdit(std::nullopt);
    }
    if (ev.isPrintable()) {
        return beginEdit(ev.ch);
    }
    if (ev.mods & (MOD_CTRL | MOD_ALT)) {
        return false;
    }
    switch (ev.code) {
    case KeyCode::Enter: return beginEdit(std::nullopt);
    case KeyCode::Up: _viewer.moveSelection(-1); return true;
    case KeyCode::Down: _viewer.moveSelection(1); return true;
    case KeyCode::PageUp: _viewer.pageUp(); return true;
    case KeyCode::PageDown: _viewer.pageDown(); return true;
    case KeyCode::Home: _viewer.selectFirst(); return true;
    case KeyCode::End: _viewer.selectLast(); return true;
    case KeyCode::Left: _viewer.moveColumn(-1); return true;
    case KeyCode::Right: _viewer.moveColumn(1); return true;
    default: return false;
    }
}

bool App::beginEdit(std::optional<char32_t> typed) {
    const Record* record = _viewer.selectedRecord();
    if (!record) {
        setStatus("nothing to edit");
        return true;
    }
    auto cols = _viewer.columns();
    if (!cols) {
        yerror("App: {}", error_msg(cols));
        setStatus(error_msg(cols));
        return true;
    }
    size_t column = std::min(_viewer.selectedColumn(), cols->size() - 1);
    const std::string& name = (*cols)[column].name;
    if (name == "id") {
        setStatus("id is read-only");
        return true;
    }

    _editRecordId = record->id();
    _editColumn = name;
    std::string current = DataViewer::cellText(*record, name);
    if (typed) {
        std::string seeded;
        appendUtf8(seeded, *typed);
        _state.edit.setText(seeded + current, 1);
    } else {
        _state.edit.setText(current);
    }
    _state.grid = GridState::Edit;
    ydebug("App: editing {}/{}.{}", _kind, _editRecordId, _editColumn);
    return true;
}

bool App::handleEditKey(const KeyEvent& ev) {
    if (!(ev.mods & (MOD_CTRL | MOD_ALT))) {
        if (ev.code == KeyCode::Enter) {
            commitEdit();
            return true;
        }
        if (ev.code == KeyCode::Escape) {
            cancelEdit();
            return true;
        }
    }
    return _state.edit.handleKey(ev);
}

void App::commitEdit() {
    const std::string text = _state.edit.text();
    const std::string id = _editRecordId;
    const std::string column = _editColumn;
    cancelEdit();

    auto record = _store->getById(_kind, id);
    if (!record) {
        ywarn("App: edit dropped, {}/{} is gone", _kind, id);
        setStatus("edit dropped: record no longer exists");
        return;
    }

    FieldKind kind = FieldKind::String;
    const ValidationRules* rules = _store->rules(_kind);
    if (auto declared = rules ? rules->typeOf(column) : std::nullopt) {
        kind = *declared;
    } else if (auto existing = kindOf(record->get(column))) {
        kind = *existing;
    }

    FieldValue value;
    if (!text.empty()) {
        auto parsed = parseValue(text, kind);
        if (!parsed) {
            ywarn("App: edit of {}.{} dropped: {}", id, column, error_msg(parsed));
            setStatus(column + ": " + error_msg(parsed));
            return;
        }
        value = *parsed;
    }

    if (auto res = _store->update(_kind, id, FieldChanges{{column, value}}); !res) {
        ywarn("App: edit of {}.{} dropped: {}", id, column, error_msg(res));
        setStatus(error_msg(res));
        return;
    }
    _viewer.refresh();
    _viewer.selectRecord(id);
}

void App::cancelEdit() {
    _state.edit.clear();
    _state.grid = GridState::Browse;
    _editRecordId.clear();
    _editColumn.clear();
}

//=============================================================================
// Output
//=============================================================================

void App::resize(int width, int height) {
    _renderer.resize(width, height);
    _layout = computeLayout(width, height, _options.headerHeight, _options.statusHeight,
                            _options.commandHeight);
    _viewer.setViewportRows(_layout.content.height - 1);
    syncSelection();
    _needsFullRefresh = true;
    ydebug("App: resized to {}x{}", width, height);
}

void App::drawHeader(ScreenBuffer& buffer) {
    const Region& r = _layout.header;
    if (r.empty()) return;
    buffer.fill(r.x, r.y, r.width, r.height, ScreenCell(U' ', _theme.header));

    std::string mode = _state.focus == FocusMode::Command ? "COMMAND"
                     : _state.grid == GridState::Edit   ? "EDIT"
                                                        : "GRID";
    std::string left = " " + _options.title + " | " + _kind;
    if (!_state.statusMessage.empty()) {
        left += " | " + _state.statusMessage;
    }
    std::string right = "[" + mode + "] ";
    int rightX = r.x + r.width - static_cast<int>(right.size());
    int leftWidth = std::max(rightX - r.x - 1, 0);
    buffer.setText(r.x, r.y, truncateText(left, leftWidth), _theme.header);
    if (rightX > r.x) {
        buffer.setText(rightX, r.y, right, _theme.header);
    }
}

void App::drawCommandLine(ScreenBuffer& buffer) {
    const Region& r = _layout.command;
    if (r.empty()) return;
    const bool focused = _state.focus == FocusMode::Command;
    const CellStyle& style = focused ? _theme.commandFocused : _theme.command;
    buffer.fill(r.x, r.y, r.width, r.height, ScreenCell(U' ', style));

    const int promptWidth = static_cast<int>(std::string(PROMPT).size());
    buffer.setText(r.x, r.y, PROMPT, style);

    int avail = r.width - promptWidth;
    if (avail <= 0) {
        if (focused) _renderer.setCursor(r.x + r.width - 1, r.y, true);
        return;
    }
    std::u32string chars = decodeUtf8(_state.command.text());
    size_t cursor = _state.command.cursor();
    auto w = static_cast<size_t>(avail);
    // Scroll horizontally so the cursor cell stays visible
    size_t start = cursor >= w ? cursor - w + 1 : 0;
    std::string visible;
    for (size_t i = start; i < chars.size() && i < start + w; ++i) {
        appendUtf8(visible, chars[i]);
    }
    buffer.setText(r.x + promptWidth, r.y, visible, style);

    if (focused) {
        _renderer.setCursor(r.x + promptWidth + static_cast<int>(cursor - start), r.y, true);
    }
}

void App::render() {
    takeAsyncStatus();
    _viewer.refresh();
    syncSelection();

    if (_needsFullRefresh) {
        _renderer.forceFullRefresh();
        _needsFullRefresh = false;
    }

    ScreenBuffer& buffer = _renderer.drawBuffer();
    buffer.clear();
    _renderer.setCursor(0, 0, false);

    drawHeader(buffer);

    const bool gridFocus = _state.focus == FocusMode::Grid;
    EditOverlay overlay;
    const bool editing = gridFocus && _state.grid == GridState::Edit;
    if (editing) {
        overlay.text = _state.edit.text();
        overlay.cursor = _state.edit.cursor();
    }

    auto res = _viewer.render(buffer, _layout.content, _layout.status, _theme, gridFocus,
                              editing ? &overlay : nullptr);
    if (!res) {
        yerror("App: {}", error_msg(res));
        const Region& s = _layout.status;
        if (!s.empty()) {
            buffer.fill(s.x, s.y, s.width, s.height, ScreenCell(U' ', _theme.status));
            buffer.setText(s.x, s.y, truncateText(" error: " + error_msg(res), s.width), _theme.status);
        }
    } else if (editing) {
        if (auto rect = _viewer.selectedCellRect(_layout.content)) {
            size_t cursor = overlay.cursor;
            auto w = static_cast<size_t>(rect->width);
            size_t offset = cursor >= w ? w - 1 : cursor;
            _renderer.setCursor(rect->x + static_cast<int>(offset), rect->y, true);
        }
    }

    drawCommandLine(buffer);
    _renderer.render();
}

} // namespace pmc
