#pragma once
// Knowledge Backend: persistence seam for the four partitions
//
// Every fact is stored as a JSON payload under (collection, id) with its
// identity key and fingerprint alongside. Writes arrive as batches that
// either land completely or not at all.
// - MemoryBackend: process-local, for tests and ephemeral runs
// - SqliteBackend: see sqlite_backend.hpp

#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetmind {

// Backend could not complete a read or write. Fails the current request only.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

struct StoredRow {
    std::string id;
    std::string key;           // Identity key
    std::string fingerprint;
    std::string payload;       // JSON
    Timestamp updated_at = 0;
};

struct WriteOp {
    std::string collection;
    StoredRow row;
    bool erase = false;
};

using WriteBatch = std::vector<WriteOp>;

// Held while a collection is seeded; released on destruction
class CollectionLock {
public:
    virtual ~CollectionLock() = default;
};

class KnowledgeBackend {
public:
    virtual ~KnowledgeBackend() = default;

    virtual bool open() = 0;
    virtual void close() = 0;

    // All ops in the batch are applied atomically. Throws StorageError.
    virtual void apply(const WriteBatch& batch) = 0;

    virtual std::optional<StoredRow> find_by_key(const std::string& collection,
                                                 const std::string& key) = 0;

    virtual std::vector<StoredRow> scan(const std::string& collection,
                                        const std::function<bool(const StoredRow&)>& filter = {}) = 0;

    virtual size_t count(const std::string& collection) = 0;

    // Persisted "already loaded" markers for bootstrap
    virtual bool has_marker(const std::string& collection) = 0;
    virtual void set_marker(const std::string& collection) = 0;

    // Coarse lock for read-check-then-act on a collection
    virtual std::unique_ptr<CollectionLock> lock_collection(const std::string& collection) = 0;

    void upsert(const std::string& collection, const StoredRow& row) {
        apply({WriteOp{collection, row, false}});
    }

    void erase(const std::string& collection, const std::string& id) {
        StoredRow row;
        row.id = id;
        apply({WriteOp{collection, row, true}});
    }
};

// Process-local backend
class MemoryBackend : public KnowledgeBackend {
public:
    MemoryBackend() = default;
    MemoryBackend(const MemoryBackend&) = delete;
    MemoryBackend& operator=(const MemoryBackend&) = delete;

    bool open() override { return true; }
    void close() override {}

    void apply(const WriteBatch& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) throw StorageError("memory backend: writes disabled");
        for (const auto& op : batch) {
            auto& rows = collections_[op.collection];
            if (op.erase) {
                rows.erase(op.row.id);
            } else {
                rows[op.row.id] = op.row;
            }
        }
    }

    std::optional<StoredRow> find_by_key(const std::string& collection,
                                         const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cit = collections_.find(collection);
        if (cit == collections_.end()) return std::nullopt;
        for (const auto& [_, row] : cit->second) {
            if (row.key == key) return row;
        }
        return std::nullopt;
    }

    std::vector<StoredRow> scan(const std::string& collection,
                                const std::function<bool(const StoredRow&)>& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StoredRow> result;
        auto cit = collections_.find(collection);
        if (cit == collections_.end()) return result;
        for (const auto& [_, row] : cit->second) {
            if (!filter || filter(row)) result.push_back(row);
        }
        return result;
    }

    size_t count(const std::string& collection) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cit = collections_.find(collection);
        return cit == collections_.end() ? 0 : cit->second.size();
    }

    bool has_marker(const std::string& collection) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return markers_.count(collection) > 0;
    }

    void set_marker(const std::string& collection) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) throw StorageError("memory backend: writes disabled");
        markers_.insert(collection);
    }

    std::unique_ptr<CollectionLock> lock_collection(const std::string& collection) override {
        std::mutex* m;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& slot = collection_locks_[collection];
            if (!slot) slot = std::make_unique<std::mutex>();
            m = slot.get();
        }
        return std::make_unique<MutexLock>(*m);
    }

    // Simulates an unavailable store
    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

private:
    class MutexLock : public CollectionLock {
    public:
        explicit MutexLock(std::mutex& m) : lock_(m) {}
    private:
        std::unique_lock<std::mutex> lock_;
    };

    std::mutex mutex_;
    std::unordered_map<std::string, std::map<std::string, StoredRow>> collections_;
    std::set<std::string> markers_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> collection_locks_;
    bool fail_writes_ = false;
};

} // namespace assetmind
