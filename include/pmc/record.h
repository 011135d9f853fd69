#pragma once

#include <pmc/result.hpp>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pmc {

using Timestamp = std::chrono::system_clock::time_point;
using StringList = std::vector<std::string>;

// Index order matters: it is the cross-kind sort order and part of the digest
using FieldValue = std::variant<std::monostate, std::string, int64_t, bool, Timestamp, StringList>;

enum class FieldKind {
    String,
    Integer,
    Boolean,
    Timestamp,
    List
};

const char* fieldKindName(FieldKind kind);
Result<FieldKind> parseFieldKind(std::string_view name);

inline bool isNull(const FieldValue& v) { return std::holds_alternative<std::monostate>(v); }

// nullopt for null
std::optional<FieldKind> kindOf(const FieldValue& v);

// Display text: timestamps "YYYY-MM-DD HH:MM" (UTC), lists joined by ", ",
// booleans "yes"/"no", null as empty
std::string formatValue(const FieldValue& v);

// Parse user-entered text into a value of the given kind
Result<FieldValue> parseValue(std::string_view text, FieldKind kind);

// <0, 0, >0. Null sorts after everything; strings compare case-insensitively.
int compareValues(const FieldValue& a, const FieldValue& b);

//=============================================================================
// Record - opaque id plus ordered field map
//=============================================================================

class Record {
public:
    using Fields = std::map<std::string, FieldValue>;

    // Reserved: the identifier is stored under this key, never as a field
    static constexpr const char* ID_FIELD = "id";

    Record() = default;
    explicit Record(std::string id) : _id(std::move(id)) {}
    Record(std::initializer_list<Fields::value_type> fields) : _fields(fields) {}

    const std::string& id() const { return _id; }
    void setId(std::string id) { _id = std::move(id); }

    bool has(const std::string& name) const { return _fields.count(name) > 0; }
    const FieldValue* find(const std::string& name) const;

    // Null when absent
    FieldValue get(const std::string& name) const;

    // Formatted value, empty when absent
    std::string text(const std::string& name) const;

    void set(const std::string& name, FieldValue value) { _fields[name] = std::move(value); }
    void erase(const std::string& name) { _fields.erase(name); }

    const Fields& fields() const { return _fields; }

    bool operator==(const Record& o) const { return _id == o._id && _fields == o._fields; }
    bool operator!=(const Record& o) const { return !(*this == o); }

private:
    std::string _id;
    Fields _fields;
};

using FieldChanges = std::map<std::string, FieldValue>;

// FNV-1a over id, field names and values
uint64_t recordDigest(const Record& record, uint64_t seed);

//=============================================================================
// ValidationRules - per-kind required fields and field types
//=============================================================================

struct ValidationRules {
    std::vector<std::string> requiredFields;
    std::map<std::string, FieldKind> fieldTypes;

    // Every violation, not just the first. Empty means valid.
    std::vector<std::string> validate(const Record& record) const;

    std::optional<FieldKind> typeOf(const std::string& field) const;
};

} // namespace pmc
