#pragma once
// Fact Table: indexed in-memory view of one collection
//
// Three indices over the same facts: id, identity key and fingerprint.
// Readers take a shared lock. Only the deduplication gate (and eviction)
// commits, after the backend accepted the write, so readers never see a
// fact the store does not hold.

#include "backend.hpp"
#include "facts.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetmind {

template<typename T>
class FactTable {
public:
    using Traits = FactTraits<T>;

    explicit FactTable(KnowledgeBackend& backend) : backend_(backend) {}

    FactTable(const FactTable&) = delete;
    FactTable& operator=(const FactTable&) = delete;

    const char* collection() const { return Traits::collection; }

    // Rebuild indices from the backend
    bool load() {
        std::vector<StoredRow> rows;
        try {
            rows = backend_.scan(Traits::collection);
        } catch (const StorageError& e) {
            log_warn("store", "load %s failed: %s", Traits::collection, e.what());
            return false;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        facts_.clear();
        by_key_.clear();
        by_fingerprint_.clear();
        size_t skipped = 0;
        for (const auto& row : rows) {
            try {
                T fact = nlohmann::json::parse(row.payload).get<T>();
                fact.id = FactId::from_string(row.id);
                index_locked(fact);
            } catch (const nlohmann::json::exception& e) {
                ++skipped;
                log_warn("store", "skipping corrupt %s row %s: %s",
                         Traits::collection, row.id.c_str(), e.what());
            }
        }
        log_debug("store", "loaded %zu %s (%zu skipped)", facts_.size(), Traits::collection, skipped);
        return true;
    }

    std::optional<T> get(const FactId& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = facts_.find(id);
        if (it == facts_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<T> find_by_key(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = by_key_.find(key);
        if (it == by_key_.end()) return std::nullopt;
        return facts_.at(it->second);
    }

    std::optional<T> find_by_fingerprint(const std::string& fp) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = by_fingerprint_.find(fp);
        if (it == by_fingerprint_.end()) return std::nullopt;
        return facts_.at(it->second);
    }

    std::vector<T> all() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(facts_.size());
        for (const auto& [_, f] : facts_) out.push_back(f);
        return out;
    }

    template<typename Pred>
    std::vector<T> scan(Pred pred) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<T> out;
        for (const auto& [_, f] : facts_) {
            if (pred(f)) out.push_back(f);
        }
        return out;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return facts_.size();
    }

    static StoredRow to_row(const T& fact) {
        StoredRow row;
        row.id = fact.id.to_string();
        row.key = Traits::identity_key(fact);
        row.fingerprint = fingerprint(Traits::canonical(fact));
        row.payload = nlohmann::json(fact).dump();
        row.updated_at = fact.updated_at;
        return row;
    }

    // Publish a persisted write
    void commit(const T& fact) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = facts_.find(fact.id);
        if (it != facts_.end()) {
            unindex_locked(it->second);
        }
        index_locked(fact);
    }

    // Drop a fact after the backend erased it
    void remove(const FactId& id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = facts_.find(id);
        if (it == facts_.end()) return;
        unindex_locked(it->second);
        facts_.erase(it);
    }

    KnowledgeBackend& backend() { return backend_; }

private:
    void index_locked(const T& fact) {
        facts_[fact.id] = fact;
        by_key_[Traits::identity_key(fact)] = fact.id;
        by_fingerprint_[fingerprint(Traits::canonical(fact))] = fact.id;
    }

    void unindex_locked(const T& fact) {
        auto kit = by_key_.find(Traits::identity_key(fact));
        if (kit != by_key_.end() && kit->second == fact.id) by_key_.erase(kit);
        auto fit = by_fingerprint_.find(fingerprint(Traits::canonical(fact)));
        if (fit != by_fingerprint_.end() && fit->second == fact.id) by_fingerprint_.erase(fit);
    }

    KnowledgeBackend& backend_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<FactId, T, FactIdHash> facts_;
    std::unordered_map<std::string, FactId> by_key_;
    std::unordered_map<std::string, FactId> by_fingerprint_;
};

} // namespace assetmind
