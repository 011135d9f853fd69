#include <pmc/store.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cstdio>
#include <random>

namespace pmc {

namespace {

constexpr uint64_t DIGEST_SEED = 0xcbf29ce484222325ULL;

template<typename T>
Result<T> storeErr(StoreErrc code, std::string message) {
    return Err<T>(std::move(message), static_cast<int>(code));
}

std::string joinViolations(const std::vector<std::string>& violations) {
    std::string out;
    for (size_t i = 0; i < violations.size(); ++i) {
        if (i > 0) out += "; ";
        out += violations[i];
    }
    return out;
}

} // namespace

const char* storeEventKindName(StoreEventKind kind) {
    switch (kind) {
    case StoreEventKind::Added: return "added";
    case StoreEventKind::Updated: return "updated";
    case StoreEventKind::Deleted: return "deleted";
    case StoreEventKind::CollectionChanged: return "collection-changed";
    case StoreEventKind::DataChanged: return "data-changed";
    case StoreEventKind::SaveError: return "save-error";
    }
    return "unknown";
}

//=============================================================================
// Construction
//=============================================================================

Result<Store::Ptr> Store::create(PersistenceAdapter::Ptr adapter, Schema schema,
                                 StoreOptions options) {
    if (!adapter) {
        return storeErr<Ptr>(StoreErrc::Load, "Store::create: no persistence adapter");
    }
    auto loaded = adapter->load();
    if (!loaded) {
        return Error("initial load failed", Error(loaded.error().to_string(),
                                                  static_cast<int>(StoreErrc::Load)));
    }

    auto store = Ptr(new Store(std::move(adapter), std::move(schema), options));

    // Nobody else can see the store yet, so collections may still be added
    for (auto& [kind, records] : *loaded) {
        auto& slot = store->_collections[kind];
        if (!slot) {
            ywarn("Store: collection '{}' has no validation rules", kind);
            slot = std::make_unique<Collection>();
        }
        for (const auto& record : records) {
            auto violations = slot->rules.validate(record);
            if (!violations.empty()) {
                ywarn("Store: loaded {}/{} is invalid: {}", kind, record.id(), joinViolations(violations));
            }
        }
        slot->records = std::move(records);
    }
    for (auto& [kind, coll] : store->_collections) {
        coll->digest = computeDigest(coll->records);
        coll->dirty = false;
        yinfo("Store: collection '{}' loaded with {} records", kind, coll->records.size());
    }
    return Ok(store);
}

Store::Store(PersistenceAdapter::Ptr adapter, Schema schema, StoreOptions options)
    : _adapter(std::move(adapter)), _options(options), _autoSave(options.autoSave) {
    for (auto& [kind, rules] : schema) {
        auto coll = std::make_unique<Collection>();
        coll->rules = std::move(rules);
        _collections.emplace(kind, std::move(coll));
    }
    if (_options.idAttempts < 1) {
        _options.idAttempts = 1;
    }
}

//=============================================================================
// Helpers
//=============================================================================

Store::Collection* Store::find(const std::string& kind) {
    auto it = _collections.find(kind);
    return it == _collections.end() ? nullptr : it->second.get();
}

const Store::Collection* Store::find(const std::string& kind) const {
    auto it = _collections.find(kind);
    return it == _collections.end() ? nullptr : it->second.get();
}

std::vector<std::unique_lock<std::mutex>> Store::lockAll() const {
    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(_collections.size());
    for (const auto& [kind, coll] : _collections) {
        locks.emplace_back(coll->mutex);
    }
    return locks;
}

std::string Store::generateId() {
    std::lock_guard<std::mutex> lock(_idMutex);
    if (_idGenerator) {
        return _idGenerator();
    }
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t value = rng();
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%012llx",
                  static_cast<unsigned long long>(value & 0xFFFFFFFFFFFFULL));
    return buf;
}

uint64_t Store::computeDigest(const std::vector<Record>& records) {
    uint64_t h = DIGEST_SEED;
    for (const auto& record : records) {
        h = recordDigest(record, h);
    }
    return h;
}

Timestamp Store::now() {
    // Whole seconds, so persisted timestamps compare equal after a round-trip
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

void Store::setIdGenerator(IdGenerator generator) {
    std::lock_guard<std::mutex> lock(_idMutex);
    _idGenerator = std::move(generator);
}

//=============================================================================
// Reads
//=============================================================================

std::vector<std::string> Store::collections() const {
    std::vector<std::string> names;
    names.reserve(_collections.size());
    for (const auto& [kind, coll] : _collections) {
        names.push_back(kind);
    }
    return names;
}

bool Store::hasCollection(const std::string& kind) const {
    return find(kind) != nullptr;
}

std::vector<Record> Store::getAll(const std::string& kind) const {
    const Collection* coll = find(kind);
    if (!coll) return {};
    std::lock_guard<std::mutex> lock(coll->mutex);
    return coll->records;
}

std::optional<Record> Store::getById(const std::string& kind, const std::string& id) const {
    const Collection* coll = find(kind);
    if (!coll) return std::nullopt;
    std::lock_guard<std::mutex> lock(coll->mutex);
    for (const auto& record : coll->records) {
        if (record.id() == id) return record;
    }
    return std::nullopt;
}

size_t Store::count(const std::string& kind) const {
    const Collection* coll = find(kind);
    if (!coll) return 0;
    std::lock_guard<std::mutex> lock(coll->mutex);
    return coll->records.size();
}

const ValidationRules* Store::rules(const std::string& kind) const {
    const Collection* coll = find(kind);
    return coll ? &coll->rules : nullptr;
}

std::vector<std::string> Store::validate(const std::string& kind, const Record& record) const {
    const Collection* coll = find(kind);
    if (!coll) return {"unknown collection: " + kind};
    return coll->rules.validate(record);
}

uint64_t Store::digest(const std::string& kind) const {
    const Collection* coll = find(kind);
    if (!coll) return 0;
    std::lock_guard<std::mutex> lock(coll->mutex);
    return coll->digest;
}

bool Store::hasPendingChanges() const {
    for (const auto& [kind, coll] : _collections) {
        std::lock_guard<std::mutex> lock(coll->mutex);
        if (coll->dirty) return true;
    }
    return false;
}

bool Store::isDirty(const std::string& kind) const {
    const Collection* coll = find(kind);
    if (!coll) return false;
    std::lock_guard<std::mutex> lock(coll->mutex);
    return coll->dirty;
}

//=============================================================================
// Mutations
//=============================================================================

Result<std::string> Store::add(const std::string& kind, Record record) {
    Collection* coll = find(kind);
    if (!coll) {
        return storeErr<std::string>(StoreErrc::UnknownCollection, "unknown collection: " + kind);
    }

    std::string id;
    {
        std::lock_guard<std::mutex> lock(coll->mutex);

        auto exists = [&](const std::string& candidate) {
            return std::any_of(coll->records.begin(), coll->records.end(),
                               [&](const Record& r) { return r.id() == candidate; });
        };

        if (!record.id().empty()) {
            if (exists(record.id())) {
                return storeErr<std::string>(StoreErrc::Duplicate,
                                             kind + ": id already exists: " + record.id());
            }
        } else {
            bool assigned = false;
            for (int attempt = 0; attempt < _options.idAttempts; ++attempt) {
                std::string candidate = generateId();
                if (!candidate.empty() && !exists(candidate)) {
                    record.setId(candidate);
                    assigned = true;
                    break;
                }
                ydebug("Store::add: id collision on '{}' (attempt {})", candidate, attempt + 1);
            }
            if (!assigned) {
                return storeErr<std::string>(StoreErrc::IdExhausted,
                    kind + ": could not generate a unique id after " +
                    std::to_string(_options.idAttempts) + " attempts");
            }
        }

        const Timestamp stamp = now();
        if (!record.has(FIELD_CREATED)) {
            record.set(FIELD_CREATED, stamp);
        }
        record.set(FIELD_MODIFIED, stamp);

        auto violations = coll->rules.validate(record);
        if (!violations.empty()) {
            return storeErr<std::string>(StoreErrc::Validation,
                                         kind + ": validation failed: " + joinViolations(violations));
        }

        id = record.id();
        coll->records.push_back(std::move(record));
        coll->dirty = true;
        coll->digest = computeDigest(coll->records);
    }

    ydebug("Store::add: {}/{}", kind, id);
    std::vector<StoreEvent> events{
        {StoreEventKind::Added, kind, id, {}},
        {StoreEventKind::CollectionChanged, kind, {}, {}},
        {StoreEventKind::DataChanged, {}, {}, {}},
    };
    autoSaveAfterMutation(events);
    fire(events);
    return Ok(id);
}

Result<void> Store::update(const std::string& kind, const std::string& id, const FieldChanges& changes) {
    Collection* coll = find(kind);
    if (!coll) {
        return storeErr<void>(StoreErrc::UnknownCollection, "unknown collection: " + kind);
    }

    {
        std::lock_guard<std::mutex> lock(coll->mutex);
        auto it = std::find_if(coll->records.begin(), coll->records.end(),
                               [&](const Record& r) { return r.id() == id; });
        if (it == coll->records.end()) {
            return storeErr<void>(StoreErrc::NotFound, kind + ": no record with id " + id);
        }

        // Work on a copy; the live record is only replaced once the whole thing validates
        Record working = *it;
        for (const auto& [field, value] : changes) {
            if (isNull(value)) {
                working.erase(field);
            } else {
                working.set(field, value);
            }
        }
        working.set(FIELD_MODIFIED, now());

        auto violations = coll->rules.validate(working);
        if (!violations.empty()) {
            return storeErr<void>(StoreErrc::Validation,
                                  kind + ": validation failed: " + joinViolations(violations));
        }

        *it = std::move(working);
        coll->dirty = true;
        coll->digest = computeDigest(coll->records);
    }

    ydebug("Store::update: {}/{} ({} fields)", kind, id, changes.size());
    std::vector<StoreEvent> events{
        {StoreEventKind::Updated, kind, id, {}},
        {StoreEventKind::CollectionChanged, kind, {}, {}},
        {StoreEventKind::DataChanged, {}, {}, {}},
    };
    autoSaveAfterMutation(events);
    fire(events);
    return Ok();
}

Result<void> Store::remove(const std::string& kind, const std::string& id) {
    Collection* coll = find(kind);
    if (!coll) {
        return storeErr<void>(StoreErrc::UnknownCollection, "unknown collection: " + kind);
    }

    {
        std::lock_guard<std::mutex> lock(coll->mutex);
        auto it = std::find_if(coll->records.begin(), coll->records.end(),
                               [&](const Record& r) { return r.id() == id; });
        if (it == coll->records.end()) {
            return storeErr<void>(StoreErrc::NotFound, kind + ": no record with id " + id);
        }
        coll->records.erase(it);
        coll->dirty = true;
        coll->digest = computeDigest(coll->records);
    }

    ydebug("Store::remove: {}/{}", kind, id);
    std::vector<StoreEvent> events{
        {StoreEventKind::Deleted, kind, id, {}},
        {StoreEventKind::CollectionChanged, kind, {}, {}},
        {StoreEventKind::DataChanged, {}, {}, {}},
    };
    autoSaveAfterMutation(events);
    fire(events);
    return Ok();
}

//=============================================================================
// Persistence
//=============================================================================

Result<void> Store::load() {
    std::vector<StoreEvent> events;
    {
        std::lock_guard<std::mutex> persist(_persistMutex);
        auto locks = lockAll();

        auto loaded = _adapter->load();
        if (!loaded) {
            yerror("Store::load: reload failed, keeping current data: {}", error_msg(loaded));
            return Error("reload failed", Error(loaded.error().to_string(),
                                                static_cast<int>(StoreErrc::Load)));
        }

        for (auto& [kind, records] : *loaded) {
            if (!find(kind)) {
                ywarn("Store::load: ignoring unknown collection '{}'", kind);
            }
        }

        for (auto& [kind, coll] : _collections) {
            auto it = loaded->find(kind);
            std::vector<Record> records;
            if (it != loaded->end()) {
                records = std::move(it->second);
            }
            uint64_t newDigest = computeDigest(records);
            coll->records = std::move(records);
            coll->dirty = false;
            if (newDigest != coll->digest) {
                coll->digest = newDigest;
                events.push_back({StoreEventKind::CollectionChanged, kind, {}, {}});
            }
        }
    }

    yinfo("Store::load: reloaded, {} collections changed", events.size());
    if (!events.empty()) {
        events.push_back({StoreEventKind::DataChanged, {}, {}, {}});
    }
    fire(events);
    return Ok();
}

Result<void> Store::saveLocked() {
    // Snapshot taken before anything is attempted
    Collections snapshot;
    std::map<std::string, bool> dirtySnapshot;
    for (const auto& [kind, coll] : _collections) {
        snapshot[kind] = coll->records;
        dirtySnapshot[kind] = coll->dirty;
    }

    auto res = _adapter->save(snapshot);
    if (!res) {
        for (auto& [kind, coll] : _collections) {
            coll->records = snapshot[kind];
            coll->dirty = dirtySnapshot[kind];
            coll->digest = computeDigest(coll->records);
        }
        return Error("save failed", Error(res.error().to_string(),
                                          static_cast<int>(StoreErrc::Persistence)));
    }

    for (auto& [kind, coll] : _collections) {
        coll->dirty = false;
    }
    return Ok();
}

Result<void> Store::save() {
    Result<void> res = Ok();
    {
        std::lock_guard<std::mutex> persist(_persistMutex);
        auto locks = lockAll();
        res = saveLocked();
    }
    if (!res) {
        yerror("Store::save: {}", error_msg(res));
        fire({{StoreEventKind::SaveError, {}, {}, error_msg(res)}});
        return res;
    }
    ydebug("Store::save: ok");
    return Ok();
}

void Store::setAutoSave(bool enabled) {
    _autoSave = enabled;
    ydebug("Store: auto-save {}", enabled ? "on" : "off");
}

Result<void> Store::flush() {
    if (!hasPendingChanges()) {
        return Ok();
    }
    return save();
}

void Store::autoSaveAfterMutation(std::vector<StoreEvent>& events) {
    if (!_autoSave) return;
    Result<void> res = Ok();
    {
        std::lock_guard<std::mutex> persist(_persistMutex);
        auto locks = lockAll();
        res = saveLocked();
    }
    if (!res) {
        // The mutation itself stands; it stays pending until a save succeeds
        ywarn("Store: auto-save failed, changes kept pending: {}", error_msg(res));
        events.push_back({StoreEventKind::SaveError, {}, {}, error_msg(res)});
    }
}

//=============================================================================
// Events
//=============================================================================

Store::SubscriptionId Store::subscribe(StoreEventKind kind, Callback callback) {
    std::lock_guard<std::mutex> lock(_subscribersMutex);
    SubscriptionId id = _nextSubscriptionId++;
    _subscribers.push_back({id, kind, std::move(callback)});
    return id;
}

void Store::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(_subscribersMutex);
    _subscribers.erase(std::remove_if(_subscribers.begin(), _subscribers.end(),
                                      [id](const Subscriber& s) { return s.id == id; }),
                       _subscribers.end());
}

void Store::fire(const std::vector<StoreEvent>& events) {
    if (events.empty()) return;
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(_subscribersMutex);
        subscribers = _subscribers;
    }
    for (const auto& event : events) {
        for (const auto& sub : subscribers) {
            if (sub.kind != event.kind || !sub.callback) continue;
            try {
                sub.callback(event);
            } catch (const std::exception& e) {
                yerror("Store: {} subscriber {} threw: {}", storeEventKindName(event.kind), sub.id, e.what());
            } catch (...) {
                yerror("Store: {} subscriber {} threw a non-standard exception",
                       storeEventKindName(event.kind), sub.id);
            }
        }
    }
}

} // namespace pmc
