#include "tasks.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace pmc::demo {

namespace {

const std::vector<std::string> FIELDS = {"id", "title", "status", "priority", "due"};

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

// Everything after the first n words, leading blanks trimmed
std::string restAfter(const std::string& line, size_t n) {
    size_t pos = 0;
    for (size_t i = 0; i < n; ++i) {
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string::npos) return {};
        pos = line.find(' ', pos);
        if (pos == std::string::npos) return {};
    }
    pos = line.find_first_not_of(' ', pos);
    return pos == std::string::npos ? std::string() : line.substr(pos);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

Store::Schema tasksSchema() {
    ValidationRules rules;
    rules.requiredFields = {"title", "status"};
    rules.fieldTypes = {
        {"title", FieldKind::String},
        {"status", FieldKind::String},
        {"priority", FieldKind::Integer},
        {"due", FieldKind::Timestamp},
        {Store::FIELD_CREATED, FieldKind::Timestamp},
        {Store::FIELD_MODIFIED, FieldKind::Timestamp},
    };
    return {{TASKS, rules}};
}

std::vector<ColumnSpec> tasksColumns(const std::string& kind) {
    if (kind != TASKS) return {};
    return {
        {"id", "Id", 12},
        {"title", "Title", 30},
        {"status", "Status", 8},
        {"priority", "Pri", 8},
        {"due", "Due", 16},
    };
}

const std::vector<std::string>& TaskCommands::verbs() {
    static const std::vector<std::string> VERBS = {
        "add", "clear", "delete", "filter", "reload", "save", "sort"
    };
    return VERBS;
}

void TaskCommands::report(const std::string& message) {
    yinfo("TaskCommands: {}", message);
    if (_status) _status(message);
}

void TaskCommands::execute(const std::string& line) {
    auto words = splitWords(line);
    if (words.empty()) return;
    const std::string& verb = words[0];

    if (verb == "add") {
        std::string title = restAfter(line, 1);
        if (title.empty()) {
            throw std::invalid_argument("usage: add <title>");
        }
        Record record{{"title", title}, {"status", std::string("open")}, {"priority", int64_t{3}}};
        auto id = _store.add(TASKS, record);
        if (!id) {
            report("add failed: " + error_msg(id));
            return;
        }
        _viewer.refresh();
        _viewer.selectRecord(*id);
        report("added " + *id);
    } else if (verb == "filter") {
        if (words.size() < 3) {
            throw std::invalid_argument("usage: filter <field> <text>");
        }
        _viewer.addFilter(words[1], restAfter(line, 2));
        report(_viewer.queryDescription());
    } else if (verb == "sort") {
        if (words.size() < 2 || words.size() > 3) {
            throw std::invalid_argument("usage: sort <field> [desc]");
        }
        bool desc = words.size() == 3 && words[2] == "desc";
        _viewer.setSort(words[1], desc ? SortDirection::Descending : SortDirection::Ascending);
        report(_viewer.queryDescription());
    } else if (verb == "clear") {
        _viewer.clearFilters();
        _viewer.clearSort();
        report("showing all " + std::string(TASKS));
    } else if (verb == "delete") {
        const Record* selected = _viewer.selectedRecord();
        if (!selected) {
            report("nothing selected");
            return;
        }
        std::string id = selected->id();
        if (auto res = _store.remove(TASKS, id); !res) {
            report("delete failed: " + error_msg(res));
            return;
        }
        report("deleted " + id);
    } else if (verb == "save") {
        auto res = _store.save();
        report(res ? "saved" : "save failed: " + error_msg(res));
    } else if (verb == "reload") {
        auto res = _store.load();
        report(res ? "reloaded" : "reload failed: " + error_msg(res));
    } else {
        throw std::invalid_argument("unknown command '" + verb + "'");
    }
}

std::vector<std::string> TaskCommands::complete(const std::string& line, size_t cursor) const {
    std::string head = line.substr(0, std::min(cursor, line.size()));
    std::vector<std::string> out;

    size_t space = head.find(' ');
    if (space == std::string::npos) {
        for (const auto& verb : verbs()) {
            if (startsWith(verb, head)) out.push_back(verb + " ");
        }
        return out;
    }

    // Field name after "sort" / "filter"
    std::string verb = head.substr(0, space);
    if (verb != "sort" && verb != "filter") return out;
    std::string rest = head.substr(space + 1);
    if (rest.find(' ') != std::string::npos) return out;
    for (const auto& field : FIELDS) {
        if (startsWith(field, rest)) out.push_back(verb + " " + field + " ");
    }
    return out;
}

} // namespace pmc::demo
