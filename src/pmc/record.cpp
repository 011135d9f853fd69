#include <pmc/record.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace pmc {

namespace {

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

void fnv(uint64_t& h, const void* data, size_t len) {
    auto bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < len; ++i) {
        h ^= bytes[i];
        h *= FNV_PRIME;
    }
}

void fnv(uint64_t& h, std::string_view s) {
    uint64_t len = s.size();
    fnv(h, &len, sizeof(len));
    fnv(h, s.data(), s.size());
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* fieldKindName(FieldKind kind) {
    switch (kind) {
    case FieldKind::String: return "string";
    case FieldKind::Integer: return "integer";
    case FieldKind::Boolean: return "boolean";
    case FieldKind::Timestamp: return "timestamp";
    case FieldKind::List: return "list";
    }
    return "unknown";
}

Result<FieldKind> parseFieldKind(std::string_view name) {
    std::string n = lower(trim(name));
    if (n == "string" || n == "text") return Ok(FieldKind::String);
    if (n == "integer" || n == "int") return Ok(FieldKind::Integer);
    if (n == "boolean" || n == "bool") return Ok(FieldKind::Boolean);
    if (n == "timestamp" || n == "date") return Ok(FieldKind::Timestamp);
    if (n == "list") return Ok(FieldKind::List);
    return Err<FieldKind>("unknown field kind: " + std::string(name));
}

std::optional<FieldKind> kindOf(const FieldValue& v) {
    switch (v.index()) {
    case 1: return FieldKind::String;
    case 2: return FieldKind::Integer;
    case 3: return FieldKind::Boolean;
    case 4: return FieldKind::Timestamp;
    case 5: return FieldKind::List;
    default: return std::nullopt;
    }
}

std::string formatValue(const FieldValue& v) {
    if (auto s = std::get_if<std::string>(&v)) return *s;
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto b = std::get_if<bool>(&v)) return *b ? "yes" : "no";
    if (auto ts = std::get_if<Timestamp>(&v)) {
        std::time_t t = std::chrono::system_clock::to_time_t(*ts);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min);
        return buf;
    }
    if (auto list = std::get_if<StringList>(&v)) {
        std::string out;
        for (size_t i = 0; i < list->size(); ++i) {
            if (i > 0) out += ", ";
            out += (*list)[i];
        }
        return out;
    }
    return {};
}

Result<FieldValue> parseValue(std::string_view text, FieldKind kind) {
    std::string t = trim(text);
    switch (kind) {
    case FieldKind::String:
        return Ok(FieldValue(std::string(text)));

    case FieldKind::Integer: {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
        if (t.empty() || ec != std::errc() || ptr != t.data() + t.size()) {
            return Err<FieldValue>("not an integer: '" + t + "'");
        }
        return Ok(FieldValue(value));
    }

    case FieldKind::Boolean: {
        std::string l = lower(t);
        if (l == "yes" || l == "y" || l == "true" || l == "1" || l == "on") return Ok(FieldValue(true));
        if (l == "no" || l == "n" || l == "false" || l == "0" || l == "off") return Ok(FieldValue(false));
        return Err<FieldValue>("not a boolean: '" + t + "'");
    }

    case FieldKind::Timestamp: {
        std::tm tm{};
        int year = 0, month = 0, day = 0, hour = 0, minute = 0;
        // %n must land on the end: trailing text is not a date
        const int length = static_cast<int>(t.size());
        int consumed = -1;
        int n = std::sscanf(t.c_str(), "%4d-%2d-%2d %2d:%2d%n", &year, &month, &day, &hour, &minute, &consumed);
        if (n != 5 || consumed != length) {
            hour = minute = 0;
            consumed = -1;
            n = std::sscanf(t.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed);
            if (n != 3 || consumed != length) {
                return Err<FieldValue>("not a date (YYYY-MM-DD [HH:MM]): '" + t + "'");
            }
        }
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 ||
            minute < 0 || minute > 59) {
            return Err<FieldValue>("date out of range: '" + t + "'");
        }
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        std::time_t secs = timegm(&tm);
        // timegm rolls 2024-02-31 over into March
        if (tm.tm_mday != day || tm.tm_mon != month - 1) {
            return Err<FieldValue>("no such date: '" + t + "'");
        }
        return Ok(FieldValue(std::chrono::system_clock::from_time_t(secs)));
    }

    case FieldKind::List: {
        StringList items;
        size_t start = 0;
        while (start <= t.size()) {
            size_t comma = t.find(',', start);
            if (comma == std::string::npos) comma = t.size();
            std::string item = trim(std::string_view(t).substr(start, comma - start));
            if (!item.empty()) items.push_back(item);
            start = comma + 1;
        }
        return Ok(FieldValue(items));
    }
    }
    return Err<FieldValue>("unsupported field kind");
}

int compareValues(const FieldValue& a, const FieldValue& b) {
    const bool an = isNull(a);
    const bool bn = isNull(b);
    if (an || bn) {
        return an == bn ? 0 : (an ? 1 : -1);
    }
    if (a.index() != b.index()) {
        return a.index() < b.index() ? -1 : 1;
    }
    if (auto s = std::get_if<std::string>(&a)) {
        std::string la = lower(*s);
        std::string lb = lower(std::get<std::string>(b));
        return la < lb ? -1 : (lb < la ? 1 : 0);
    }
    if (auto i = std::get_if<int64_t>(&a)) {
        int64_t j = std::get<int64_t>(b);
        return *i < j ? -1 : (j < *i ? 1 : 0);
    }
    if (auto x = std::get_if<bool>(&a)) {
        bool y = std::get<bool>(b);
        return *x == y ? 0 : (*x ? 1 : -1);
    }
    if (auto t = std::get_if<Timestamp>(&a)) {
        const Timestamp& u = std::get<Timestamp>(b);
        return *t < u ? -1 : (u < *t ? 1 : 0);
    }
    std::string fa = formatValue(a);
    std::string fb = formatValue(b);
    return fa < fb ? -1 : (fb < fa ? 1 : 0);
}

const FieldValue* Record::find(const std::string& name) const {
    auto it = _fields.find(name);
    return it == _fields.end() ? nullptr : &it->second;
}

FieldValue Record::get(const std::string& name) const {
    auto v = find(name);
    return v ? *v : FieldValue{};
}

std::string Record::text(const std::string& name) const {
    auto v = find(name);
    return v ? formatValue(*v) : std::string();
}

uint64_t recordDigest(const Record& record, uint64_t seed) {
    uint64_t h = seed ? seed : FNV_OFFSET;
    fnv(h, record.id());
    for (const auto& [name, value] : record.fields()) {
        fnv(h, name);
        uint8_t tag = static_cast<uint8_t>(value.index());
        fnv(h, &tag, 1);
        if (auto ts = std::get_if<Timestamp>(&value)) {
            int64_t ticks = ts->time_since_epoch().count();
            fnv(h, &ticks, sizeof(ticks));
        } else if (auto list = std::get_if<StringList>(&value)) {
            uint64_t n = list->size();
            fnv(h, &n, sizeof(n));
            for (const auto& item : *list) fnv(h, item);
        } else {
            fnv(h, formatValue(value));
        }
    }
    return h;
}

std::vector<std::string> ValidationRules::validate(const Record& record) const {
    std::vector<std::string> violations;
    if (record.has(Record::ID_FIELD)) {
        violations.push_back(std::string(Record::ID_FIELD) + ": reserved for the record identifier");
    }
    for (const auto& field : requiredFields) {
        const FieldValue* v = record.find(field);
        bool missing = !v || isNull(*v);
        if (!missing) {
            if (auto s = std::get_if<std::string>(v)) missing = s->empty();
        }
        if (missing) {
            violations.push_back(field + ": required field missing");
        }
    }
    for (const auto& [field, expected] : fieldTypes) {
        const FieldValue* v = record.find(field);
        if (!v) continue;
        auto actual = kindOf(*v);
        if (actual && *actual != expected) {
            violations.push_back(field + ": expected " + fieldKindName(expected) + ", got " +
                                 fieldKindName(*actual));
        }
    }
    return violations;
}

std::optional<FieldKind> ValidationRules::typeOf(const std::string& field) const {
    auto it = fieldTypes.find(field);
    if (it == fieldTypes.end()) return std::nullopt;
    return it->second;
}

} // namespace pmc
