#include <pmc/persistence.h>
#include <ytrace/ytrace.hpp>
#include <yaml-cpp/yaml.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace pmc {

//=============================================================================
// FunctionPersistence
//=============================================================================

PersistenceAdapter::Ptr FunctionPersistence::create(LoadFn load, SaveFn save) {
    return std::make_shared<FunctionPersistence>(std::move(load), std::move(save));
}

Result<Collections> FunctionPersistence::load() {
    if (!_load) return Err<Collections>("no load function supplied");
    return _load();
}

Result<void> FunctionPersistence::save(const Collections& collections) {
    if (!_save) return Err<void>("no save function supplied");
    return _save(collections);
}

//=============================================================================
// YamlFilePersistence
//=============================================================================

namespace {

constexpr const char* ID_KEY = Record::ID_FIELD;
constexpr const char* TS_KEY = "ts";

void emitValue(YAML::Emitter& out, const FieldValue& value) {
    if (isNull(value)) {
        out << YAML::Null;
    } else if (auto s = std::get_if<std::string>(&value)) {
        out << YAML::DoubleQuoted << *s;
    } else if (auto i = std::get_if<int64_t>(&value)) {
        out << static_cast<long long>(*i);
    } else if (auto b = std::get_if<bool>(&value)) {
        out << YAML::TrueFalseBool << *b;
    } else if (auto ts = std::get_if<Timestamp>(&value)) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts->time_since_epoch()).count();
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << TS_KEY << YAML::Value << static_cast<long long>(secs);
        out << YAML::EndMap;
    } else if (auto list = std::get_if<StringList>(&value)) {
        out << YAML::Flow << YAML::BeginSeq;
        for (const auto& item : *list) {
            out << YAML::DoubleQuoted << item;
        }
        out << YAML::EndSeq;
    }
}

Result<FieldValue> readValue(const YAML::Node& node, const std::string& field) {
    if (!node || node.IsNull()) {
        return Ok(FieldValue{});
    }
    if (node.IsMap()) {
        const YAML::Node& ts = node[TS_KEY];
        if (!ts || !ts.IsScalar()) {
            return Err<FieldValue>(field + ": unsupported map value");
        }
        auto secs = ts.as<long long>();
        return Ok(FieldValue(Timestamp(std::chrono::seconds(secs))));
    }
    if (node.IsSequence()) {
        StringList items;
        for (const auto& item : node) {
            items.push_back(item.as<std::string>());
        }
        return Ok(FieldValue(items));
    }
    // Quoted scalars carry the "!" tag and are always strings
    if (node.Tag() == "!") {
        return Ok(FieldValue(node.as<std::string>()));
    }
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) {
        return Ok(FieldValue(static_cast<int64_t>(i)));
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        return Ok(FieldValue(b));
    }
    return Ok(FieldValue(node.as<std::string>()));
}

} // namespace

PersistenceAdapter::Ptr YamlFilePersistence::create(std::string path) {
    return std::make_shared<YamlFilePersistence>(std::move(path));
}

Result<Collections> YamlFilePersistence::load() {
    Collections collections;
    std::error_code ec;
    if (!std::filesystem::exists(_path, ec)) {
        yinfo("YamlFilePersistence: {} does not exist, starting empty", _path);
        return Ok(collections);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(_path);
    } catch (const YAML::Exception& e) {
        return Err<Collections>(std::string("YAML parse error: ") + e.what());
    }
    if (!root || root.IsNull()) {
        return Ok(collections);
    }
    if (!root.IsMap()) {
        return Err<Collections>(_path + ": top level must be a map of collections");
    }

    try {
        for (auto it = root.begin(); it != root.end(); ++it) {
            std::string name = it->first.as<std::string>();
            const YAML::Node& seq = it->second;
            auto& records = collections[name];
            if (!seq || seq.IsNull()) continue;
            if (!seq.IsSequence()) {
                return Err<Collections>(name + ": collection must be a sequence");
            }
            for (const auto& item : seq) {
                if (!item.IsMap()) {
                    return Err<Collections>(name + ": record must be a map");
                }
                Record record;
                for (auto f = item.begin(); f != item.end(); ++f) {
                    std::string field = f->first.as<std::string>();
                    if (field == ID_KEY) {
                        record.setId(f->second.as<std::string>());
                        continue;
                    }
                    auto value = readValue(f->second, field);
                    if (!value) {
                        return Err<Collections>(name + ": bad record", value);
                    }
                    record.set(field, *value);
                }
                records.push_back(std::move(record));
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<Collections>(std::string("YAML conversion error: ") + e.what());
    }

    ydebug("YamlFilePersistence: loaded {} collections from {}", collections.size(), _path);
    return Ok(collections);
}

Result<void> YamlFilePersistence::save(const Collections& collections) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [name, records] : collections) {
        out << YAML::Key << name << YAML::Value;
        out << YAML::BeginSeq;
        for (const auto& record : records) {
            out << YAML::BeginMap;
            out << YAML::Key << ID_KEY << YAML::Value << YAML::DoubleQuoted << record.id();
            for (const auto& [field, value] : record.fields()) {
                out << YAML::Key << field << YAML::Value;
                emitValue(out, value);
            }
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
    if (!out.good()) {
        return Err<void>("YAML emit error: " + out.GetLastError());
    }

    const std::string tmpPath = _path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            return Err<void>("Cannot open for writing: " + tmpPath);
        }
        file << out.c_str() << '\n';
        file.flush();
        if (!file) {
            return Err<void>("Write failed: " + tmpPath);
        }
    }
    if (std::rename(tmpPath.c_str(), _path.c_str()) != 0) {
        std::string reason = strerror(errno);
        std::error_code ec;
        std::filesystem::remove(tmpPath, ec);
        return Err<void>("Cannot replace " + _path + ": " + reason);
    }
    ydebug("YamlFilePersistence: saved {} collections to {}", collections.size(), _path);
    return Ok();
}

} // namespace pmc
