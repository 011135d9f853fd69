//=============================================================================
// Demo task command tests
//=============================================================================

#include <boost/ut.hpp>
#include "tasks.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace pmc;
using namespace pmc::demo;

namespace {

struct TaskFixture {
    std::shared_ptr<Collections> saved = std::make_shared<Collections>();
    Store::Ptr store;
    std::unique_ptr<DataViewer> viewer;
    std::vector<std::string> messages;
    std::unique_ptr<TaskCommands> commands;

    TaskFixture() {
        auto data = saved;
        auto adapter = FunctionPersistence::create(
            [data] { return Ok(*data); },
            [data](const Collections& c) -> Result<void> { *data = c; return Ok(); });
        store = *Store::create(adapter, tasksSchema(), StoreOptions{false, 5});
        viewer = std::make_unique<DataViewer>(*store, TASKS, tasksColumns);
        viewer->refresh();
        commands = std::make_unique<TaskCommands>(*store, *viewer,
                                                  [this](const std::string& m) { messages.push_back(m); });
    }

    void run(const std::string& line) {
        commands->execute(line);
        viewer->refresh();
    }

    const std::string& last() const { return messages.back(); }
};

} // namespace

suite task_schema_tests = [] {
    "columns fit an eighty column terminal"_test = [] {
        auto cols = tasksColumns(TASKS);
        int width = 0;
        for (const auto& c : cols) width += c.width + 1;
        expect(width == 79_i);
        expect(cols.front().name == "id");
        expect(tasksColumns("other").empty());
    };

    "schema requires title and status"_test = [] {
        auto schema = tasksSchema();
        const auto& rules = schema.at(TASKS);
        auto violations = rules.validate(Record{{"priority", int64_t(1)}});
        expect(violations.size() == 2_u);
        expect(rules.typeOf("due") == std::optional<FieldKind>(FieldKind::Timestamp));
    };
};

suite task_command_tests = [] {
    "add creates an open task and selects it"_test = [] {
        TaskFixture f;
        f.run("add  buy   milk ");
        expect((f.store->count(TASKS) == 1_u) >> fatal);
        const Record r = f.store->getAll(TASKS).front();
        expect(r.text("title") == "buy   milk ");
        expect(r.text("status") == "open");
        expect(std::get<int64_t>(r.get("priority")) == 3);
        expect(f.last() == "added " + r.id());
        expect(f.viewer->selectedRecord()->id() == r.id());
    };

    "usage errors throw"_test = [] {
        TaskFixture f;
        expect(throws<std::invalid_argument>([&] { f.commands->execute("add"); }));
        expect(throws<std::invalid_argument>([&] { f.commands->execute("filter title"); }));
        expect(throws<std::invalid_argument>([&] { f.commands->execute("sort"); }));
        expect(throws<std::invalid_argument>([&] { f.commands->execute("sort a b c"); }));
        expect(throws<std::invalid_argument>([&] { f.commands->execute("frobnicate"); }));
        expect(nothrow([&] { f.commands->execute("   "); }));
        expect(f.store->count(TASKS) == 0_u);
    };

    "filter, sort and clear drive the viewer"_test = [] {
        TaskFixture f;
        f.run("add write report");
        f.run("add buy milk");
        f.run("add buy bread");

        f.run("filter title buy");
        expect(f.viewer->filteredCount() == 2_u);
        expect(f.last() == "tasks where title contains \"buy\"");

        f.run("sort title desc");
        expect(f.viewer->item(0)->text("title") == "buy milk");
        expect(f.last() == "tasks where title contains \"buy\" order by title desc");

        f.run("clear");
        expect(f.viewer->filteredCount() == 3_u);
        expect(!f.viewer->sortColumn().has_value());
        expect(f.last() == "showing all tasks");
    };

    "delete removes the selected task"_test = [] {
        TaskFixture f;
        f.run("delete");
        expect(f.last() == "nothing selected");

        f.run("add first");
        f.run("add second");
        std::string selected = f.viewer->selectedRecord()->id();
        f.run("delete");
        expect(f.last() == "deleted " + selected);
        expect(f.store->count(TASKS) == 1_u);
        expect(!f.store->getById(TASKS, selected).has_value());
    };

    "save and reload"_test = [] {
        TaskFixture f;
        f.run("add keep");
        expect(f.saved->empty());
        f.run("save");
        expect(f.last() == "saved");
        expect(f.saved->at(TASKS).size() == 1_u);

        f.saved->at(TASKS).clear();
        f.run("reload");
        expect(f.last() == "reloaded");
        expect(f.store->count(TASKS) == 0_u);
        expect(f.viewer->filteredCount() == 0_u);
    };

    "completion of verbs and fields"_test = [] {
        TaskFixture f;
        expect(f.commands->complete("s", 1) == std::vector<std::string>{"save ", "sort "});
        expect(f.commands->complete("de", 2) == std::vector<std::string>{"delete "});
        expect(f.commands->complete("", 0).size() == TaskCommands::verbs().size());
        expect(f.commands->complete("sort pr", 7) == std::vector<std::string>{"sort priority "});
        expect(f.commands->complete("filter ", 7).size() == 5_u);
        expect(f.commands->complete("add x", 5).empty());
        expect(f.commands->complete("sort title d", 12).empty());
        expect(f.commands->complete("sort xyz", 3) == std::vector<std::string>{"sort "})
            << "only text before the cursor counts";
    };
};
