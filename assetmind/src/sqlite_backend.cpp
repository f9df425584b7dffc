#include <assetmind/sqlite_backend.hpp>
#include <assetmind/log.hpp>

#include <sqlite3.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace assetmind {

namespace {

const char* SCHEMA =
    "CREATE TABLE IF NOT EXISTS facts ("
    "  collection TEXT NOT NULL,"
    "  id TEXT NOT NULL,"
    "  key TEXT NOT NULL,"
    "  fingerprint TEXT NOT NULL,"
    "  payload TEXT NOT NULL,"
    "  updated_at INTEGER NOT NULL,"
    "  PRIMARY KEY (collection, id));"
    "CREATE INDEX IF NOT EXISTS facts_by_key ON facts(collection, key);"
    "CREATE TABLE IF NOT EXISTS bootstrap_markers ("
    "  collection TEXT PRIMARY KEY,"
    "  loaded_at INTEGER NOT NULL);";

// Finalizes on scope exit
struct Statement {
    sqlite3_stmt* stmt = nullptr;

    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
    void bind(int idx, int64_t value) { sqlite3_bind_int64(stmt, idx, value); }
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

StoredRow read_row(sqlite3_stmt* stmt) {
    StoredRow row;
    row.id = column_text(stmt, 0);
    row.key = column_text(stmt, 1);
    row.fingerprint = column_text(stmt, 2);
    row.payload = column_text(stmt, 3);
    row.updated_at = sqlite3_column_int64(stmt, 4);
    return row;
}

class FileCollectionLock : public CollectionLock {
public:
    FileCollectionLock(std::mutex& m, int fd) : guard_(m), fd_(fd) {}
    ~FileCollectionLock() override {
        if (fd_ >= 0) {
            struct flock fl;
            std::memset(&fl, 0, sizeof(fl));
            fl.l_type = F_UNLCK;
            fl.l_whence = SEEK_SET;
            fcntl(fd_, F_SETLK, &fl);
            ::close(fd_);
        }
    }
private:
    std::unique_lock<std::mutex> guard_;
    int fd_;
};

} // namespace

SqliteBackend::SqliteBackend(std::string path) : path_(std::move(path)) {}

SqliteBackend::~SqliteBackend() {
    close();
}

bool SqliteBackend::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return true;

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        log_warn("sqlite", "cannot open %s: %s", path_.c_str(), sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    sqlite3_busy_timeout(db_, 5000);

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec(SCHEMA);
    } catch (const StorageError& e) {
        log_warn("sqlite", "schema setup failed: %s", e.what());
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    log_debug("sqlite", "opened %s", path_.c_str());
    return true;
}

void SqliteBackend::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteBackend::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError("exec failed: " + msg);
    }
}

void SqliteBackend::require_open() const {
    if (!db_) throw StorageError("database not open: " + path_);
}

void SqliteBackend::apply(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    exec("BEGIN IMMEDIATE;");
    try {
        for (const auto& op : batch) {
            if (op.erase) {
                Statement st(db_, "DELETE FROM facts WHERE collection = ?1 AND id = ?2");
                st.bind(1, op.collection);
                st.bind(2, op.row.id);
                if (sqlite3_step(st.stmt) != SQLITE_DONE) {
                    throw StorageError(std::string("delete failed: ") + sqlite3_errmsg(db_));
                }
                continue;
            }
            Statement st(db_,
                "INSERT INTO facts (collection, id, key, fingerprint, payload, updated_at) "
                "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
                "ON CONFLICT(collection, id) DO UPDATE SET key = excluded.key, "
                "fingerprint = excluded.fingerprint, payload = excluded.payload, "
                "updated_at = excluded.updated_at");
            st.bind(1, op.collection);
            st.bind(2, op.row.id);
            st.bind(3, op.row.key);
            st.bind(4, op.row.fingerprint);
            st.bind(5, op.row.payload);
            st.bind(6, op.row.updated_at);
            if (sqlite3_step(st.stmt) != SQLITE_DONE) {
                throw StorageError(std::string("upsert failed: ") + sqlite3_errmsg(db_));
            }
        }
        exec("COMMIT;");
    } catch (const StorageError&) {
        char* err = nullptr;
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err);
        sqlite3_free(err);
        throw;
    }
}

std::optional<StoredRow> SqliteBackend::find_by_key(const std::string& collection,
                                                    const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "SELECT id, key, fingerprint, payload, updated_at FROM facts "
        "WHERE collection = ?1 AND key = ?2 LIMIT 1");
    st.bind(1, collection);
    st.bind(2, key);
    int rc = sqlite3_step(st.stmt);
    if (rc == SQLITE_ROW) return read_row(st.stmt);
    if (rc != SQLITE_DONE) throw StorageError(std::string("lookup failed: ") + sqlite3_errmsg(db_));
    return std::nullopt;
}

std::vector<StoredRow> SqliteBackend::scan(const std::string& collection,
                                           const std::function<bool(const StoredRow&)>& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "SELECT id, key, fingerprint, payload, updated_at FROM facts "
        "WHERE collection = ?1 ORDER BY updated_at");
    st.bind(1, collection);

    std::vector<StoredRow> result;
    int rc;
    while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW) {
        StoredRow row = read_row(st.stmt);
        if (!filter || filter(row)) result.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) throw StorageError(std::string("scan failed: ") + sqlite3_errmsg(db_));
    return result;
}

size_t SqliteBackend::count(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_, "SELECT COUNT(*) FROM facts WHERE collection = ?1");
    st.bind(1, collection);
    if (sqlite3_step(st.stmt) != SQLITE_ROW) {
        throw StorageError(std::string("count failed: ") + sqlite3_errmsg(db_));
    }
    return static_cast<size_t>(sqlite3_column_int64(st.stmt, 0));
}

bool SqliteBackend::has_marker(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_, "SELECT 1 FROM bootstrap_markers WHERE collection = ?1");
    st.bind(1, collection);
    int rc = sqlite3_step(st.stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw StorageError(std::string("marker lookup failed: ") + sqlite3_errmsg(db_));
    }
    return rc == SQLITE_ROW;
}

void SqliteBackend::set_marker(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "INSERT OR REPLACE INTO bootstrap_markers (collection, loaded_at) VALUES (?1, ?2)");
    st.bind(1, collection);
    st.bind(2, now());
    if (sqlite3_step(st.stmt) != SQLITE_DONE) {
        throw StorageError(std::string("marker write failed: ") + sqlite3_errmsg(db_));
    }
}

std::unique_ptr<CollectionLock> SqliteBackend::lock_collection(const std::string& collection) {
    std::mutex* m;
    {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        auto& slot = collection_mutexes_[collection];
        if (!slot) slot = std::make_unique<std::mutex>();
        m = slot.get();
    }

    std::string lock_path = path_ + "." + collection + ".lock";
    int fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR, 0600);
    if (fd < 0) {
        throw StorageError("cannot open lock " + lock_path + ": " + std::strerror(errno));
    }

    // In-process side first; fcntl locks do not exclude threads of one process
    auto held = std::make_unique<FileCollectionLock>(*m, fd);

    struct flock fl;
    std::memset(&fl, 0, sizeof(fl));
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    while (fcntl(fd, F_SETLKW, &fl) != 0) {
        if (errno == EINTR) continue;
        throw StorageError("cannot lock " + lock_path + ": " + std::strerror(errno));
    }

    log_debug("sqlite", "locked collection %s", collection.c_str());
    return held;
}

} // namespace assetmind
