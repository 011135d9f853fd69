#pragma once

#include <pmc/config.h>
#include <pmc/data-viewer.h>
#include <pmc/key-event.h>
#include <pmc/layout.h>
#include <pmc/line-editor.h>
#include <pmc/renderer.h>
#include <pmc/result.hpp>
#include <pmc/store.h>
#include <pmc/theme.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pmc {

enum class FocusMode {
    Command,
    Grid
};

enum class GridState {
    Browse,
    Edit
};

const char* focusModeName(FocusMode mode);

//=============================================================================
// UIState - everything the App mutates and the renderers read
//=============================================================================

struct UIState {
    FocusMode focus = FocusMode::Command;
    GridState grid = GridState::Browse;

    LineEditor command;
    LineEditor edit;

    size_t selectedRow = 0;
    size_t selectedColumn = 0;

    bool terminated = false;
    std::string statusMessage;

    std::vector<std::string> history;
    size_t historyIndex = 0;  // history.size() means "not browsing history"
};

using CommandExecutor = std::function<void(const std::string& line)>;
using CompletionProvider = std::function<std::vector<std::string>(const std::string& line, size_t cursor)>;

struct AppOptions {
    KeyChord toggle{KeyEvent::ctrl('t')};
    KeyChord quit{KeyEvent::ctrl('q')};
    KeyChord edit{KeyEvent::key(KeyCode::F2)};
    KeyChord complete{KeyEvent::key(KeyCode::Tab)};

    int headerHeight = 1;
    int statusHeight = 1;
    int commandHeight = 1;
    bool truecolor = true;

    std::string title = "pmc";

    // Bad chords are logged and the default kept
    static AppOptions fromConfig(const Config& config);
};

//=============================================================================
// App - input/mode state machine over one collection
//
//   Command <--toggle--> Grid.Browse --Enter/edit/printable--> Grid.Edit
//                                    <--Enter (commit)/Escape--
//   quit from anywhere -> terminated
//
// Rendering is reactive: the caller renders after a handled key or a settled
// resize, never on a timer.
//=============================================================================

class App {
public:
    using Ptr = std::shared_ptr<App>;

    static Result<Ptr> create(Store::Ptr store, std::string kind, SchemaProvider schema,
                              TermOutput& out, int width, int height,
                              AppOptions options = {}, Theme theme = {});

    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    void setCommandExecutor(CommandExecutor executor) { _executor = std::move(executor); }
    void setCompletionProvider(CompletionProvider provider) { _completion = std::move(provider); }

    // Returns whether anything changed
    bool handleKey(const KeyEvent& ev);

    void render();
    void resize(int width, int height);

    bool running() const { return !_state.terminated; }
    void quit() { _state.terminated = true; }

    const UIState& state() const { return _state; }
    void setStatus(std::string message);

    DataViewer& viewer() { return _viewer; }
    const DataViewer& viewer() const { return _viewer; }
    Renderer& renderer() { return _renderer; }
    const RegionLayout& layout() const { return _layout; }
    Store& store() { return *_store; }

private:
    App(Store::Ptr store, std::string kind, SchemaProvider schema, TermOutput& out,
        int width, int height, AppOptions options, Theme theme);

    void toggleFocus();

    bool handleCommandKey(const KeyEvent& ev);
    bool handleBrowseKey(const KeyEvent& ev);
    bool handleEditKey(const KeyEvent& ev);

    void submitCommand();
    bool complete();
    bool historyUp();
    bool historyDown();

    bool beginEdit(std::optional<char32_t> typed);
    void commitEdit();
    void cancelEdit();

    void syncSelection();
    void takeAsyncStatus();

    void drawHeader(ScreenBuffer& buffer);
    void drawCommandLine(ScreenBuffer& buffer);

    Store::Ptr _store;
    std::string _kind;
    AppOptions _options;
    Theme _theme;

    Renderer _renderer;
    RegionLayout _layout;
    DataViewer _viewer;
    UIState _state;

    CommandExecutor _executor;
    CompletionProvider _completion;

    // Record and column under edit, fixed when the edit starts
    std::string _editRecordId;
    std::string _editColumn;

    std::string _historyDraft;
    bool _needsFullRefresh = true;

    Store::SubscriptionId _saveErrorSub = 0;
    std::mutex _asyncStatusMutex;
    std::optional<std::string> _asyncStatus;
};

} // namespace pmc
