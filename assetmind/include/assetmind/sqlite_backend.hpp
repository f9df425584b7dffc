#pragma once
// SQLite Backend: durable storage for every partition
//
// Schema:
//   facts(collection, id, key, fingerprint, payload, updated_at)
//   bootstrap_markers(collection, loaded_at)
//
// One connection guarded by a mutex. Batches run inside BEGIN IMMEDIATE
// so a failed statement rolls the whole batch back.
// Collection locks combine an in-process mutex with an fcntl lock on
// <db_path>.<collection>.lock so concurrent startups seed only once.

#include "backend.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

struct sqlite3;

namespace assetmind {

class SqliteBackend : public KnowledgeBackend {
public:
    explicit SqliteBackend(std::string path);
    ~SqliteBackend() override;

    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    bool open() override;
    void close() override;

    void apply(const WriteBatch& batch) override;

    std::optional<StoredRow> find_by_key(const std::string& collection,
                                         const std::string& key) override;

    std::vector<StoredRow> scan(const std::string& collection,
                                const std::function<bool(const StoredRow&)>& filter = {}) override;

    size_t count(const std::string& collection) override;

    bool has_marker(const std::string& collection) override;
    void set_marker(const std::string& collection) override;

    std::unique_ptr<CollectionLock> lock_collection(const std::string& collection) override;

    const std::string& path() const { return path_; }
    bool is_open() const { return db_ != nullptr; }

private:
    void exec(const char* sql);
    void require_open() const;

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> collection_mutexes_;
};

} // namespace assetmind
