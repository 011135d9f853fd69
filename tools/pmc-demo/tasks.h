#pragma once

#include <pmc/data-viewer.h>
#include <pmc/store.h>
#include <functional>
#include <string>
#include <vector>

namespace pmc::demo {

constexpr const char* TASKS = "tasks";

Store::Schema tasksSchema();

// Column specs for a collection; empty for unknown kinds
std::vector<ColumnSpec> tasksColumns(const std::string& kind);

//=============================================================================
// TaskCommands - the demo's command line
//
//   add <title>             new open task
//   filter <field> <text>   narrow the grid
//   sort <field> [desc]     order the grid
//   clear                   drop filters and sort
//   delete                  remove the selected task
//   save / reload           explicit persistence
//
// Usage errors throw std::invalid_argument; the App reports them.
//=============================================================================

class TaskCommands {
public:
    using StatusFn = std::function<void(const std::string&)>;

    TaskCommands(Store& store, DataViewer& viewer, StatusFn status)
        : _store(store), _viewer(viewer), _status(std::move(status)) {}

    void execute(const std::string& line);

    // Whole-line candidates for the text before the cursor
    std::vector<std::string> complete(const std::string& line, size_t cursor) const;

    static const std::vector<std::string>& verbs();

private:
    void report(const std::string& message);

    Store& _store;
    DataViewer& _viewer;
    StatusFn _status;
};

} // namespace pmc::demo
