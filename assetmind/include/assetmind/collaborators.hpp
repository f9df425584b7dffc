#pragma once
// Collaborators: the edges of the engine
//
// - EmailSource:     yields inbound emails
// - SecurityScanner: clean or threat, per attachment
// - DocumentSink:    keeps accepted documents under asset/category or a
//                    review bucket, and moves or drops them on review
//
// Each has a local implementation so the CLI and tests run standalone.

#include "backend.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace assetmind {

using json = nlohmann::json;
namespace fs = std::filesystem;

struct Attachment {
    std::string filename;
    std::string bytes;
};

struct Email {
    std::string id;
    std::string sender;
    std::string subject;
    std::string body;
    std::vector<Attachment> attachments;
};

inline void from_json(const json& j, Attachment& a) {
    a.filename = j.value("filename", "");
    a.bytes = j.value("content", j.value("bytes", ""));
}

inline void to_json(json& j, const Attachment& a) {
    j = json{{"filename", a.filename}, {"size", a.bytes.size()}};
}

inline void from_json(const json& j, Email& e) {
    e.id = j.value("id", "");
    e.sender = j.value("sender", "");
    e.subject = j.value("subject", "");
    e.body = j.value("body", "");
    e.attachments = j.value("attachments", std::vector<Attachment>{});
}

// ═══════════════════════════════════════════════════════════════════════════
// Email source
// ═══════════════════════════════════════════════════════════════════════════

class EmailSource {
public:
    virtual ~EmailSource() = default;
    virtual std::optional<Email> next() = 0;
};

// A JSON file holding one email object or an array of them
class JsonFileEmailSource : public EmailSource {
public:
    explicit JsonFileEmailSource(const std::string& path) : path_(path) {}

    bool open() {
        std::ifstream f(path_);
        if (!f) {
            log_warn("source", "cannot open %s", path_.c_str());
            return false;
        }
        try {
            json j;
            f >> j;
            if (j.is_array()) {
                for (const auto& e : j) emails_.push_back(e.get<Email>());
            } else {
                emails_.push_back(j.get<Email>());
            }
        } catch (const json::exception& e) {
            log_warn("source", "error reading %s: %s", path_.c_str(), e.what());
            return false;
        }
        return true;
    }

    std::optional<Email> next() override {
        if (pos_ >= emails_.size()) return std::nullopt;
        return emails_[pos_++];
    }

private:
    std::string path_;
    std::vector<Email> emails_;
    size_t pos_ = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Security scanner
// ═══════════════════════════════════════════════════════════════════════════

struct ScanResult {
    bool clean = true;
    std::string threat;
};

class SecurityScanner {
public:
    virtual ~SecurityScanner() = default;
    virtual ScanResult scan(const Attachment& attachment) = 0;
};

// Accepts everything; for deployments that scan upstream
class PassThroughScanner : public SecurityScanner {
public:
    ScanResult scan(const Attachment&) override { return {}; }
};

// ═══════════════════════════════════════════════════════════════════════════
// Document sink
// ═══════════════════════════════════════════════════════════════════════════

constexpr const char* REVIEW_FOLDER = "_review";

class DocumentSink {
public:
    virtual ~DocumentSink() = default;

    // Accepted document under folder/category. Throws StorageError.
    virtual std::string store(const std::string& asset_id, const std::string& category,
                              const Attachment& attachment) = 0;

    // Parked document awaiting review. Throws StorageError.
    virtual std::string park(const std::string& bucket, const Attachment& attachment) = 0;

    // Move a parked document to its final place. Throws StorageError.
    virtual std::string relocate(const std::string& ref, const std::string& asset_id,
                                 const std::string& category) = 0;

    // Put a relocated document back where it was parked. Throws StorageError.
    virtual void restore(const std::string& ref, const std::string& parked_ref) = 0;

    virtual void discard(const std::string& ref) = 0;
};

class FilesystemSink : public DocumentSink {
public:
    explicit FilesystemSink(std::string root) : root_(std::move(root)) {}

    std::string store(const std::string& asset_id, const std::string& category,
                      const Attachment& attachment) override {
        return write(fs::path(root_) / safe(asset_id) / safe(category), attachment);
    }

    std::string park(const std::string& bucket, const Attachment& attachment) override {
        return write(fs::path(root_) / REVIEW_FOLDER / safe(bucket), attachment);
    }

    std::string relocate(const std::string& ref, const std::string& asset_id,
                         const std::string& category) override {
        fs::path from(ref);
        fs::path dir = fs::path(root_) / safe(asset_id) / safe(category);
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) throw StorageError("cannot create " + dir.string() + ": " + ec.message());
        fs::path to = unique_path(dir / from.filename());
        fs::rename(from, to, ec);
        if (ec) throw StorageError("cannot move " + ref + ": " + ec.message());
        return to.string();
    }

    void restore(const std::string& ref, const std::string& parked_ref) override {
        std::error_code ec;
        fs::rename(ref, parked_ref, ec);
        if (ec) throw StorageError("cannot move " + ref + " back: " + ec.message());
    }

    void discard(const std::string& ref) override {
        std::error_code ec;
        fs::remove(ref, ec);
        if (ec) log_warn("sink", "cannot remove %s: %s", ref.c_str(), ec.message().c_str());
    }

private:
    // Folder names never escape the root
    static std::string safe(const std::string& name) {
        std::string out;
        for (char c : name) {
            out += (c == '/' || c == '\\' || c == '\0') ? '_' : c;
        }
        if (out.empty() || out == "." || out == "..") out = "_";
        return out;
    }

    static fs::path unique_path(const fs::path& wanted) {
        if (!fs::exists(wanted)) return wanted;
        fs::path stem = wanted.stem();
        fs::path ext = wanted.extension();
        for (int i = 1;; ++i) {
            fs::path candidate = wanted.parent_path() /
                                 (stem.string() + "_" + std::to_string(i) + ext.string());
            if (!fs::exists(candidate)) return candidate;
        }
    }

    std::string write(const fs::path& dir, const Attachment& attachment) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) throw StorageError("cannot create " + dir.string() + ": " + ec.message());
        fs::path target = unique_path(dir / safe(fs::path(attachment.filename).filename().string()));
        std::ofstream out(target, std::ios::binary);
        if (!out) throw StorageError("cannot write " + target.string());
        out.write(attachment.bytes.data(), static_cast<std::streamsize>(attachment.bytes.size()));
        if (!out) throw StorageError("short write on " + target.string());
        return target.string();
    }

    std::string root_;
    std::mutex mutex_;
};

// Keeps documents in memory, keyed by their logical path
class MemorySink : public DocumentSink {
public:
    std::string store(const std::string& asset_id, const std::string& category,
                      const Attachment& attachment) override {
        return put(asset_id + "/" + category + "/" + attachment.filename, attachment.bytes);
    }

    std::string park(const std::string& bucket, const Attachment& attachment) override {
        return put(std::string(REVIEW_FOLDER) + "/" + bucket + "/" + attachment.filename,
                   attachment.bytes);
    }

    std::string relocate(const std::string& ref, const std::string& asset_id,
                         const std::string& category) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = docs_.find(ref);
        if (it == docs_.end()) throw StorageError("no parked document " + ref);
        std::string name = ref.substr(ref.find_last_of('/') + 1);
        std::string to = asset_id + "/" + category + "/" + name;
        docs_[to] = it->second;
        docs_.erase(ref);
        return to;
    }

    void restore(const std::string& ref, const std::string& parked_ref) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = docs_.find(ref);
        if (it == docs_.end()) throw StorageError("no stored document " + ref);
        docs_[parked_ref] = it->second;
        docs_.erase(ref);
    }

    void discard(const std::string& ref) override {
        std::lock_guard<std::mutex> lock(mutex_);
        docs_.erase(ref);
    }

    bool contains(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return docs_.count(path) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return docs_.size();
    }

private:
    std::string put(const std::string& path, const std::string& bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        docs_[path] = bytes;
        return path;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> docs_;
};

} // namespace assetmind
