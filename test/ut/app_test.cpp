//=============================================================================
// App Tests - mode state machine, editing, command line and frame output
//=============================================================================

#include <boost/ut.hpp>
#include "harness/terminal_harness.h"
#include <pmc/app.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace pmc;
using namespace pmc::test;

namespace {

constexpr int WIDTH = 60;
constexpr int HEIGHT = 12;

struct Backend {
    Collections data;
    bool failSave = false;
};

Store::Schema schema() {
    ValidationRules rules;
    rules.requiredFields = {"title"};
    rules.fieldTypes = {{"title", FieldKind::String}, {"priority", FieldKind::Integer}};
    return {{"tasks", rules}};
}

std::vector<ColumnSpec> columns(const std::string&) {
    return {{"title", "Title", 20}, {"priority", "Pri", 8}};
}

// Owns everything an App needs; never copied or moved
struct Fixture {
    std::shared_ptr<Backend> backend = std::make_shared<Backend>();
    Store::Ptr store;
    StringTermOutput out;
    App::Ptr app;
    std::string alpha;
    std::string beta;

    explicit Fixture(bool autoSave = false, SchemaProvider provider = columns) {
        auto b = backend;
        auto adapter = FunctionPersistence::create(
            [b] { return Ok(b->data); },
            [b](const Collections& c) -> Result<void> {
                if (b->failSave) return Err<void>("disk full");
                b->data = c;
                return Ok();
            });
        store = *Store::create(adapter, schema(), StoreOptions{autoSave, 5});
        alpha = *store->add("tasks", Record{{"title", std::string("alpha")}, {"priority", int64_t(1)}});
        beta = *store->add("tasks", Record{{"title", std::string("beta")}, {"priority", int64_t(2)}});
        app = *App::create(store, "tasks", std::move(provider), out, WIDTH, HEIGHT);
    }

    Fixture(const Fixture&) = delete;
    Fixture& operator=(const Fixture&) = delete;

    void type(const std::string& text) {
        for (char32_t c : decodeUtf8(text)) app->handleKey(KeyEvent::character(c));
    }
    void press(KeyCode code) { app->handleKey(KeyEvent::key(code)); }
    void toggle() { app->handleKey(KeyEvent::ctrl('t')); }

    Record record(const std::string& id) const { return *store->getById("tasks", id); }

    std::string screenRow(int y) {
        std::string s;
        const auto& front = app->renderer().frontBuffer();
        for (int x = 0; x < front.width(); ++x) appendUtf8(s, front.get(x, y).glyph);
        return s;
    }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

suite app_mode_tests = [] {
    "create rejects a missing store or collection"_test = [] {
        StringTermOutput out;
        expect(!App::create(nullptr, "tasks", columns, out, 80, 24));
        Fixture f;
        expect(!App::create(f.store, "nope", columns, out, 80, 24));
    };

    "starts in command focus"_test = [] {
        Fixture f;
        expect(f.app->state().focus == FocusMode::Command);
        expect(f.app->running());
        f.type("hello");
        expect(f.app->state().command.text() == "hello");
        expect(f.app->state().grid == GridState::Browse);
    };

    "toggling keeps the command line"_test = [] {
        Fixture f;
        f.type("q tas");
        f.toggle();
        expect(f.app->state().focus == FocusMode::Grid);
        f.press(KeyCode::Down);
        f.toggle();
        expect(f.app->state().focus == FocusMode::Command);
        expect(f.app->state().command.text() == "q tas");
        expect(f.app->state().command.cursor() == 5_u);
        expect(f.app->state().selectedRow == 1_u) << "grid cursor kept too";
    };

    "quit works from every mode"_test = [] {
        Fixture command;
        expect(command.app->handleKey(KeyEvent::ctrl('q')));
        expect(!command.app->running());
        expect(!command.app->handleKey(KeyEvent::character(U'x'))) << "keys after quit are ignored";
        expect(command.app->state().command.empty());

        Fixture edit;
        edit.toggle();
        edit.press(KeyCode::Enter);
        expect(edit.app->state().grid == GridState::Edit);
        edit.app->handleKey(KeyEvent::ctrl('q'));
        expect(edit.app->state().terminated);
    };

    "custom chords from options"_test = [] {
        auto config = Config::createDefaults();
        config->set<std::string>(Config::KEY_KEYS_TOGGLE, "F5");
        config->set<std::string>(Config::KEY_KEYS_QUIT, "Hyper+Q");
        auto options = AppOptions::fromConfig(*config);
        expect(options.toggle.key == KeyEvent::key(KeyCode::F5));
        expect(options.quit.key == KeyEvent::ctrl('q')) << "bad chord keeps the default";
    };

    "grid navigation moves the selection"_test = [] {
        Fixture f;
        f.toggle();
        f.press(KeyCode::Down);
        expect(f.app->state().selectedRow == 1_u);
        f.press(KeyCode::Down);
        expect(f.app->state().selectedRow == 1_u) << "clamped at the last row";
        f.press(KeyCode::Home);
        expect(f.app->state().selectedRow == 0_u);
        f.press(KeyCode::Right);
        expect(f.app->state().selectedColumn == 1_u);
        f.press(KeyCode::Right);
        expect(f.app->state().selectedColumn == 1_u);
        f.press(KeyCode::Left);
        expect(f.app->state().selectedColumn == 0_u);
    };
};

suite app_edit_tests = [] {
    "enter edits the current value and commits"_test = [] {
        Fixture f;
        f.toggle();
        f.press(KeyCode::Enter);
        expect(f.app->state().grid == GridState::Edit);
        expect(f.app->state().edit.text() == "alpha");
        expect(f.app->state().edit.cursor() == 5_u);
        f.type("!");
        f.press(KeyCode::Enter);
        expect(f.app->state().grid == GridState::Browse);
        expect(f.record(f.alpha).text("title") == "alpha!");
        expect(f.app->viewer().selectedRecord()->id() == f.alpha);
    };

    "the edit chord also starts an edit"_test = [] {
        Fixture f;
        f.toggle();
        f.press(KeyCode::F2);
        expect(f.app->state().grid == GridState::Edit);
        expect(f.app->state().edit.text() == "alpha");
    };

    "typing starts an edit seeded with the key"_test = [] {
        Fixture f;
        f.toggle();
        f.type("x");
        expect(f.app->state().grid == GridState::Edit);
        expect(f.app->state().edit.text() == "xalpha");
        expect(f.app->state().edit.cursor() == 1_u);
        expect(f.app->state().command.empty()) << "grid keys never reach the command line";
    };

    "escape cancels without touching the store"_test = [] {
        Fixture f;
        f.toggle();
        f.type("zzz");
        f.press(KeyCode::Escape);
        expect(f.app->state().grid == GridState::Browse);
        expect(f.app->state().edit.empty());
        expect(f.record(f.alpha).text("title") == "alpha");
    };

    "typed values follow the field type"_test = [] {
        Fixture f;
        f.toggle();
        f.press(KeyCode::Right);
        f.press(KeyCode::Enter);
        expect(f.app->state().edit.text() == "1");
        f.press(KeyCode::Backspace);
        f.type("42");
        f.press(KeyCode::Enter);
        expect(std::get<int64_t>(f.record(f.alpha).get("priority")) == 42);
    };

    "bad input leaves the record alone"_test = [] {
        Fixture f;
        f.toggle();
        f.press(KeyCode::Right);
        f.press(KeyCode::Enter);
        f.type("abc");
        f.press(KeyCode::Enter);
        expect(f.app->state().grid == GridState::Browse);
        expect(contains(f.app->state().statusMessage, "priority: not an integer"));
        expect(std::get<int64_t>(f.record(f.alpha).get("priority")) == 1);
    };

    "clearing a field removes it, unless it is required"_test = [] {
        Fixture f;
        f.toggle();
        f.press(KeyCode::Right);
        f.press(KeyCode::Enter);
        f.press(KeyCode::Backspace);
        f.press(KeyCode::Enter);
        expect(!f.record(f.alpha).has("priority"));

        f.press(KeyCode::Left);
        f.press(KeyCode::Enter);
        for (int i = 0; i < 5; ++i) f.press(KeyCode::Backspace);
        f.press(KeyCode::Enter);
        expect(contains(f.app->state().statusMessage, "validation failed"));
        expect(f.record(f.alpha).text("title") == "alpha");
    };

    "toggling away cancels an edit"_test = [] {
        Fixture f;
        f.toggle();
        f.type("q");
        f.toggle();
        expect(f.app->state().focus == FocusMode::Command);
        expect(f.app->state().grid == GridState::Browse);
        expect(f.app->state().command.empty());
        expect(f.record(f.alpha).text("title") == "alpha");
    };

    "nothing to edit on an empty grid"_test = [] {
        Fixture f;
        expect(f.store->remove("tasks", f.alpha).has_value());
        expect(f.store->remove("tasks", f.beta).has_value());
        f.app->render();
        f.toggle();
        f.press(KeyCode::Enter);
        expect(f.app->state().grid == GridState::Browse);
        expect(f.app->state().statusMessage == "nothing to edit");
    };

    "the id column is read-only"_test = [] {
        Fixture f(false, [](const std::string&) {
            return std::vector<ColumnSpec>{{"id", "Id", 12}, {"title", "Title", 20}};
        });
        f.toggle();
        f.press(KeyCode::Enter);
        expect(f.app->state().grid == GridState::Browse);
        expect(f.app->state().statusMessage == "id is read-only");
    };
};

suite app_command_tests = [] {
    "submit runs the executor and records history"_test = [] {
        Fixture f;
        std::vector<std::string> lines;
        f.app->setCommandExecutor([&](const std::string& line) { lines.push_back(line); });

        f.type("one");
        f.press(KeyCode::Enter);
        f.type("two");
        f.press(KeyCode::Enter);
        f.type("two");
        f.press(KeyCode::Enter);
        f.type("   ");
        f.press(KeyCode::Enter);

        expect(lines == std::vector<std::string>{"one", "two", "two"});
        expect(f.app->state().history == std::vector<std::string>{"one", "two"});
        expect(f.app->state().command.empty());
    };

    "history walks back and returns to the draft"_test = [] {
        Fixture f;
        f.app->setCommandExecutor([](const std::string&) {});
        for (const char* cmd : {"one", "two"}) {
            f.type(cmd);
            f.press(KeyCode::Enter);
        }
        f.type("dra");
        f.press(KeyCode::Up);
        expect(f.app->state().command.text() == "two");
        f.press(KeyCode::Up);
        expect(f.app->state().command.text() == "one");
        expect(!f.app->handleKey(KeyEvent::key(KeyCode::Up)));
        f.press(KeyCode::Down);
        expect(f.app->state().command.text() == "two");
        f.press(KeyCode::Down);
        expect(f.app->state().command.text() == "dra");
        expect(!f.app->handleKey(KeyEvent::key(KeyCode::Down)));
    };

    "escape clears the command line"_test = [] {
        Fixture f;
        f.type("half typed");
        f.press(KeyCode::Escape);
        expect(f.app->state().command.empty());
    };

    "a failing command reports and keeps running"_test = [] {
        Fixture f;
        f.app->setCommandExecutor([](const std::string&) {
            throw std::invalid_argument("usage: add <title>");
        });
        f.type("add");
        f.press(KeyCode::Enter);
        expect(f.app->running());
        expect(f.app->state().statusMessage == "error: usage: add <title>");
    };

    "a command throwing a non-exception type is contained"_test = [] {
        Fixture f;
        f.app->setCommandExecutor([](const std::string&) { throw 7; });
        f.type("boom");
        expect(nothrow([&f] { f.press(KeyCode::Enter); }));
        expect(f.app->running());
        expect(f.app->state().statusMessage == "error: command failed");
        expect(f.app->state().command.text().empty());
    };

    "a throwing completion provider leaves the line alone"_test = [] {
        Fixture f;
        f.app->setCompletionProvider([](const std::string&, size_t) -> std::vector<std::string> {
            throw std::runtime_error("no completions today");
        });
        f.type("ad");
        bool changed = true;
        expect(nothrow([&] { changed = f.app->handleKey(KeyEvent::key(KeyCode::Tab)); }));
        expect(!changed);
        expect(f.app->state().command.text() == "ad");
    };

    "commands see fresh data afterwards"_test = [] {
        Fixture f;
        f.app->setCommandExecutor([&f](const std::string& line) {
            expect(f.store->add("tasks", Record{{"title", line}}).has_value());
        });
        f.type("gamma");
        f.press(KeyCode::Enter);
        expect(f.app->viewer().filteredCount() == 3_u);
    };

    "completion"_test = [] {
        Fixture f;
        f.app->setCompletionProvider([](const std::string& line, size_t) -> std::vector<std::string> {
            if (line == "a") return {"add "};
            if (line == "s") return {"save ", "sort "};
            return {};
        });
        f.type("a");
        expect(f.app->handleKey(KeyEvent::key(KeyCode::Tab)));
        expect(f.app->state().command.text() == "add ");

        f.press(KeyCode::Escape);
        f.type("s");
        f.press(KeyCode::Tab);
        expect(f.app->state().command.text() == "save ");
        expect(contains(f.app->state().statusMessage, "sort"));

        f.press(KeyCode::Escape);
        f.type("zz");
        expect(!f.app->handleKey(KeyEvent::key(KeyCode::Tab)));
        expect(f.app->state().command.text() == "zz");
    };
};

suite app_render_tests = [] {
    "frame shows header, grid, status and prompt"_test = [] {
        Fixture f;
        f.type("filter");
        f.app->render();

        expect(f.screenRow(0).rfind(" pmc | tasks", 0) == 0u);
        expect(contains(f.screenRow(0), "[COMMAND] "));
        expect(f.screenRow(1).rfind("Title", 0) == 0u);
        expect(f.screenRow(2).rfind("alpha", 0) == 0u);
        expect(f.screenRow(HEIGHT - 2).rfind(" 2 items | tasks", 0) == 0u);
        expect(f.screenRow(HEIGHT - 1).rfind("> filter", 0) == 0u);

        TerminalHarness term(WIDTH, HEIGHT);
        term.feed(f.out.buffer());
        std::string why;
        expect(term.matches(f.app->renderer().frontBuffer(), &why)) << why;
        expect(term.cursorVisible());
        expect(term.cursorRow() == HEIGHT - 1);
        expect(term.cursorCol() == 8_i);
    };

    "grid focus hides the command cursor and shows the mode"_test = [] {
        Fixture f;
        f.app->render();
        f.toggle();
        f.app->render();
        expect(contains(f.screenRow(0), "[GRID] "));

        TerminalHarness term(WIDTH, HEIGHT);
        term.feed(f.out.buffer());
        expect(!term.cursorVisible());

        f.out.clear();
        f.press(KeyCode::Enter);
        f.app->render();
        expect(contains(f.screenRow(0), "[EDIT] "));
        term.feed(f.out.buffer());
        expect(term.cursorVisible());
        expect(term.cursorRow() == 2_i);
        expect(term.cursorCol() == 5_i);
    };

    "status messages appear in the header"_test = [] {
        Fixture f;
        f.app->setStatus("hello there");
        f.app->render();
        expect(f.screenRow(0).rfind(" pmc | tasks | hello there", 0) == 0u);
    };

    "save errors reach the header on the next frame"_test = [] {
        Fixture f(true);
        f.backend->failSave = true;
        expect(f.store->add("tasks", Record{{"title", std::string("unsaved")}}).has_value());
        f.app->render();
        expect(contains(f.screenRow(0), "save failed: disk full"));
        expect(f.app->state().statusMessage == "save failed: disk full");
    };

    "store changes show up without a key press"_test = [] {
        Fixture f;
        f.app->render();
        expect(f.store->remove("tasks", f.alpha).has_value());
        f.app->render();
        expect(f.screenRow(2).rfind("beta", 0) == 0u);
        expect(f.screenRow(HEIGHT - 2).rfind(" 1 item | tasks", 0) == 0u);
    };

    "resize relayouts and repaints"_test = [] {
        Fixture f;
        f.app->render();
        f.app->resize(40, 8);
        expect(f.app->layout().content.height == 5_i);
        expect(f.app->viewer().viewportRows() == 4_i);
        expect(f.app->renderer().fullRefreshPending());
        f.app->render();
        expect(f.app->renderer().frontBuffer().width() == 40_i);
        expect(f.screenRow(7).rfind("> ", 0) == 0u);
    };

    "columns that do not fit show an error instead of the grid"_test = [] {
        Fixture f;
        f.app->resize(20, 8);
        f.app->render();
        expect(f.screenRow(6).rfind(" error: ", 0) == 0u);
        expect(f.app->running());
    };

    "an unchanged frame writes no cells"_test = [] {
        Fixture f;
        f.app->render();
        f.out.clear();
        f.app->render();
        expect(f.app->renderer().computeDiff().empty());
        expect(!contains(f.out.buffer(), "alpha"));
    };
};
