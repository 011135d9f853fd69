#pragma once

#include <pmc/record.h>
#include <pmc/result.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pmc {

// Collection name -> records, in order
using Collections = std::map<std::string, std::vector<Record>>;

//=============================================================================
// PersistenceAdapter - full-snapshot load/save, owned by the caller
//=============================================================================

class PersistenceAdapter {
public:
    using Ptr = std::shared_ptr<PersistenceAdapter>;

    virtual ~PersistenceAdapter() = default;

    virtual Result<Collections> load() = 0;
    virtual Result<void> save(const Collections& collections) = 0;
};

// Adapter over a pair of functions
class FunctionPersistence : public PersistenceAdapter {
public:
    using LoadFn = std::function<Result<Collections>()>;
    using SaveFn = std::function<Result<void>(const Collections&)>;

    static Ptr create(LoadFn load, SaveFn save);

    FunctionPersistence(LoadFn load, SaveFn save)
        : _load(std::move(load)), _save(std::move(save)) {}

    Result<Collections> load() override;
    Result<void> save(const Collections& collections) override;

private:
    LoadFn _load;
    SaveFn _save;
};

//=============================================================================
// YamlFilePersistence - one YAML document, collection -> list of records
//
//   tasks:
//     - id: 3fa9c2e81b04
//       title: Buy milk
//       created: {ts: 1760000000}
//
// Missing file loads as empty. Saves go through <path>.tmp + rename.
//=============================================================================

class YamlFilePersistence : public PersistenceAdapter {
public:
    static Ptr create(std::string path);

    explicit YamlFilePersistence(std::string path) : _path(std::move(path)) {}

    Result<Collections> load() override;
    Result<void> save(const Collections& collections) override;

    const std::string& path() const { return _path; }

private:
    std::string _path;
};

} // namespace pmc
