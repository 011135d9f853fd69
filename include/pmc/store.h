#pragma once

#include <pmc/persistence.h>
#include <pmc/record.h>
#include <pmc/result.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pmc {

// Error::code() values for store failures
enum class StoreErrc : int {
    Validation = 100,
    NotFound,
    Duplicate,
    IdExhausted,
    Persistence,
    Load,
    UnknownCollection
};

inline bool isStoreError(const Error& e, StoreErrc code) { return e.code() == static_cast<int>(code); }

template<typename T>
bool isStoreError(const Result<T>& r, StoreErrc code) {
    return !r && isStoreError(r.error(), code);
}

enum class StoreEventKind {
    Added,
    Updated,
    Deleted,
    CollectionChanged,
    DataChanged,
    SaveError
};

const char* storeEventKindName(StoreEventKind kind);

struct StoreEvent {
    StoreEventKind kind;
    std::string collection;  // empty for DataChanged / SaveError
    std::string recordId;    // Added / Updated / Deleted
    std::string message;     // SaveError
};

struct StoreOptions {
    bool autoSave = true;
    int idAttempts = 5;
};

//=============================================================================
// Store - authoritative in-memory collections behind a persistence adapter
//
// Every collection has its own mutex. Operations spanning all collections
// take them in name order. Locks are always released before subscribers
// run, so a subscriber may call straight back into the store.
//=============================================================================

class Store {
public:
    using Ptr = std::shared_ptr<Store>;
    using Callback = std::function<void(const StoreEvent&)>;
    using SubscriptionId = uint64_t;
    using IdGenerator = std::function<std::string()>;
    using Schema = std::map<std::string, ValidationRules>;

    static constexpr const char* FIELD_CREATED = "created";
    static constexpr const char* FIELD_MODIFIED = "modified";

    // Loads from the adapter. A load failure produces no store.
    static Result<Ptr> create(PersistenceAdapter::Ptr adapter, Schema schema,
                              StoreOptions options = {});

    ~Store() = default;

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    //-------------------------------------------------------------------------
    // Reads
    //-------------------------------------------------------------------------

    std::vector<std::string> collections() const;
    bool hasCollection(const std::string& kind) const;

    std::vector<Record> getAll(const std::string& kind) const;
    std::optional<Record> getById(const std::string& kind, const std::string& id) const;
    size_t count(const std::string& kind) const;

    const ValidationRules* rules(const std::string& kind) const;
    std::vector<std::string> validate(const std::string& kind, const Record& record) const;

    uint64_t digest(const std::string& kind) const;

    //-------------------------------------------------------------------------
    // Mutations
    //-------------------------------------------------------------------------

    // Returns the record's id (generated when the record has none)
    Result<std::string> add(const std::string& kind, Record record);

    // A null value in changes removes that field
    Result<void> update(const std::string& kind, const std::string& id, const FieldChanges& changes);

    Result<void> remove(const std::string& kind, const std::string& id);

    //-------------------------------------------------------------------------
    // Persistence
    //-------------------------------------------------------------------------

    // Replace everything from the adapter; on failure the old state stays
    Result<void> load();

    // Roll back to the pre-save snapshot if the adapter fails
    Result<void> save();

    void setAutoSave(bool enabled);
    bool autoSave() const { return _autoSave.load(); }

    // One save covering everything accumulated since the last one
    Result<void> flush();

    bool hasPendingChanges() const;
    bool isDirty(const std::string& kind) const;

    //-------------------------------------------------------------------------
    // Events
    //-------------------------------------------------------------------------

    SubscriptionId subscribe(StoreEventKind kind, Callback callback);
    void unsubscribe(SubscriptionId id);

    void setIdGenerator(IdGenerator generator);

private:
    struct Collection {
        ValidationRules rules;
        std::vector<Record> records;
        bool dirty = false;
        uint64_t digest = 0;
        mutable std::mutex mutex;
    };

    struct Subscriber {
        SubscriptionId id;
        StoreEventKind kind;
        Callback callback;
    };

    Store(PersistenceAdapter::Ptr adapter, Schema schema, StoreOptions options);

    Collection* find(const std::string& kind);
    const Collection* find(const std::string& kind) const;

    // Locks every collection in name order
    std::vector<std::unique_lock<std::mutex>> lockAll() const;

    std::string generateId();
    static uint64_t computeDigest(const std::vector<Record>& records);
    static Timestamp now();

    // Caller holds every collection lock
    Result<void> saveLocked();

    // Save after a mutation when auto-save is on; failures are reported, not returned
    void autoSaveAfterMutation(std::vector<StoreEvent>& events);

    void fire(const std::vector<StoreEvent>& events);

    PersistenceAdapter::Ptr _adapter;
    StoreOptions _options;
    std::map<std::string, std::unique_ptr<Collection>> _collections;
    std::atomic<bool> _autoSave{true};

    mutable std::mutex _idMutex;
    IdGenerator _idGenerator;

    mutable std::mutex _subscribersMutex;
    std::vector<Subscriber> _subscribers;
    SubscriptionId _nextSubscriptionId = 1;

    // Serializes save/load so two snapshots never interleave
    std::mutex _persistMutex;
};

} // namespace pmc
