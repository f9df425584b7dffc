#pragma once
// Review Queue: attachments waiting for a human decision
//
// Items are pending until resolved; a resolved item records whether the
// document was stored (possibly with a corrected asset/category) or
// discarded. Priority follows the reason the item was queued:
//   disallowed_file_type  critical
//   no_asset_match        high
//   very_low_confidence   normal
//   low_confidence        low
// Every change is written to the backend before it is visible here.

#include "backend.hpp"
#include "log.hpp"
#include "routing.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

constexpr const char* REVIEW_COLLECTION = "reviews";
constexpr const char* GENERAL_BUCKET = "general";

enum class ReviewStatus : uint8_t {
    Pending = 0,
    Resolved = 1,
};

enum class ReviewOutcome : uint8_t {
    None = 0,
    Stored = 1,
    Discarded = 2,
};

enum class ReviewPriority : uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3,
};

inline ReviewPriority priority_for(ReviewReason reason) {
    switch (reason) {
        case ReviewReason::DisallowedFileType: return ReviewPriority::Critical;
        case ReviewReason::NoAssetMatch:       return ReviewPriority::High;
        case ReviewReason::VeryLowConfidence:  return ReviewPriority::Normal;
        case ReviewReason::LowConfidence:      return ReviewPriority::Low;
        case ReviewReason::None:               return ReviewPriority::Normal;
    }
    return ReviewPriority::Normal;
}

inline const char* review_outcome_name(ReviewOutcome o) {
    switch (o) {
        case ReviewOutcome::Stored:    return "stored";
        case ReviewOutcome::Discarded: return "discarded";
        case ReviewOutcome::None:      return "none";
    }
    return "none";
}

struct ReviewItem {
    FactId id;
    std::string filename;
    std::string sender;
    std::string subject;
    std::string excerpt;            // Subject and leading body text
    ReviewReason reason = ReviewReason::None;
    std::string bucket;             // Asset id, or "general"
    std::string suggested_asset;
    std::string suggested_category;
    std::string asset_type;
    float confidence = 0.0f;
    std::vector<std::string> rationale;
    std::string document_ref;       // Where the sink parked the document
    ReviewStatus status = ReviewStatus::Pending;
    ReviewPriority priority = ReviewPriority::Normal;
    Timestamp queued_at = 0;
    Timestamp resolved_at = 0;

    // Filled on resolution
    ReviewOutcome outcome = ReviewOutcome::None;
    std::string final_asset;
    std::string final_category;
    std::string stored_path;
};

inline void to_json(json& j, const ReviewItem& r) {
    j = json{
        {"id", r.id.to_string()},
        {"filename", r.filename},
        {"sender", r.sender},
        {"subject", r.subject},
        {"excerpt", r.excerpt},
        {"reason", review_reason_name(r.reason)},
        {"bucket", r.bucket},
        {"suggested_asset", r.suggested_asset},
        {"suggested_category", r.suggested_category},
        {"asset_type", r.asset_type},
        {"confidence", r.confidence},
        {"rationale", r.rationale},
        {"document_ref", r.document_ref},
        {"status", r.status == ReviewStatus::Pending ? "pending" : "resolved"},
        {"priority", static_cast<int>(r.priority)},
        {"queued_at", r.queued_at},
        {"resolved_at", r.resolved_at},
        {"outcome", review_outcome_name(r.outcome)},
        {"final_asset", r.final_asset},
        {"final_category", r.final_category},
        {"stored_path", r.stored_path},
    };
}

inline void from_json(const json& j, ReviewItem& r) {
    r.id = FactId::from_string(j.value("id", ""));
    r.filename = j.value("filename", "");
    r.sender = j.value("sender", "");
    r.subject = j.value("subject", "");
    r.excerpt = j.value("excerpt", "");
    r.reason = parse_review_reason(j.value("reason", ""));
    r.bucket = j.value("bucket", GENERAL_BUCKET);
    r.suggested_asset = j.value("suggested_asset", "");
    r.suggested_category = j.value("suggested_category", "");
    r.asset_type = j.value("asset_type", "");
    r.confidence = j.value("confidence", 0.0f);
    r.rationale = j.value("rationale", std::vector<std::string>{});
    r.document_ref = j.value("document_ref", "");
    r.status = j.value("status", "pending") == "pending" ? ReviewStatus::Pending : ReviewStatus::Resolved;
    r.priority = static_cast<ReviewPriority>(j.value("priority", 1));
    r.queued_at = j.value("queued_at", Timestamp(0));
    r.resolved_at = j.value("resolved_at", Timestamp(0));
    std::string outcome = j.value("outcome", "none");
    r.outcome = outcome == "stored" ? ReviewOutcome::Stored
              : outcome == "discarded" ? ReviewOutcome::Discarded : ReviewOutcome::None;
    r.final_asset = j.value("final_asset", "");
    r.final_category = j.value("final_category", "");
    r.stored_path = j.value("stored_path", "");
}

struct ReviewStats {
    size_t pending = 0;
    size_t stored = 0;
    size_t discarded = 0;
    std::map<std::string, size_t> pending_by_reason;
};

class ReviewQueue {
public:
    explicit ReviewQueue(KnowledgeBackend& backend) : backend_(backend) {}

    ReviewQueue(const ReviewQueue&) = delete;
    ReviewQueue& operator=(const ReviewQueue&) = delete;

    bool load() {
        std::vector<StoredRow> rows;
        try {
            rows = backend_.scan(REVIEW_COLLECTION);
        } catch (const StorageError& e) {
            log_warn("review", "loading review queue failed: %s", e.what());
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        while (!priority_queue_.empty()) priority_queue_.pop();
        for (const auto& row : rows) {
            try {
                auto item = json::parse(row.payload).get<ReviewItem>();
                items_[item.id] = item;
                if (item.status == ReviewStatus::Pending) {
                    priority_queue_.push({item.id, item.priority, item.queued_at});
                }
            } catch (const json::exception& e) {
                log_warn("review", "skipping corrupt review item %s: %s", row.id.c_str(), e.what());
            }
        }
        return true;
    }

    // Assigns id, priority and timestamp. Throws StorageError.
    ReviewItem enqueue(ReviewItem item) {
        if (!item.id.valid()) item.id = FactId::generate();
        if (item.queued_at == 0) item.queued_at = now();
        if (item.bucket.empty()) item.bucket = GENERAL_BUCKET;
        item.status = ReviewStatus::Pending;
        item.priority = priority_for(item.reason);

        persist(item);
        std::lock_guard<std::mutex> lock(mutex_);
        items_[item.id] = item;
        priority_queue_.push({item.id, item.priority, item.queued_at});
        log_debug("review", "queued %s in %s (%s)", item.filename.c_str(), item.bucket.c_str(),
                  review_reason_name(item.reason));
        return item;
    }

    std::optional<ReviewItem> get(const FactId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = items_.find(id);
        if (it == items_.end()) return std::nullopt;
        return it->second;
    }

    // Highest priority, oldest first
    std::optional<ReviewItem> next() const {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!priority_queue_.empty()) {
            const auto& top = priority_queue_.top();
            auto it = items_.find(top.id);
            if (it != items_.end() && it->second.status == ReviewStatus::Pending) {
                return it->second;
            }
            priority_queue_.pop();
        }
        return std::nullopt;
    }

    // reason None means every pending item
    std::vector<ReviewItem> get_pending(ReviewReason reason = ReviewReason::None) const {
        std::vector<ReviewItem> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, item] : items_) {
                if (item.status != ReviewStatus::Pending) continue;
                if (reason != ReviewReason::None && item.reason != reason) continue;
                result.push_back(item);
            }
        }
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            if (a.priority != b.priority) {
                return static_cast<uint8_t>(a.priority) > static_cast<uint8_t>(b.priority);
            }
            return a.queued_at < b.queued_at;
        });
        return result;
    }

    std::vector<ReviewItem> get_bucket(const std::string& bucket) const {
        auto pending = get_pending();
        pending.erase(std::remove_if(pending.begin(), pending.end(),
                                     [&](const ReviewItem& r) { return r.bucket != bucket; }),
                      pending.end());
        return pending;
    }

    // Marks a pending item resolved. False if missing or already resolved.
    // Throws StorageError.
    bool resolve(const FactId& id, ReviewOutcome outcome, const std::string& asset,
                 const std::string& category, const std::string& stored_path, std::string& error) {
        std::lock_guard<std::mutex> lock(resolve_mutex_);
        auto current = get(id);
        if (!current) {
            error = "review item not found: " + id.to_string();
            return false;
        }
        if (current->status != ReviewStatus::Pending) {
            error = "review item already resolved";
            return false;
        }
        ReviewItem item = *current;
        item.status = ReviewStatus::Resolved;
        item.outcome = outcome;
        item.final_asset = asset;
        item.final_category = category;
        item.stored_path = stored_path;
        item.resolved_at = now();

        persist(item);
        std::lock_guard<std::mutex> state_lock(mutex_);
        items_[id] = item;
        return true;
    }

    ReviewStats stats() const {
        ReviewStats s;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, item] : items_) {
            if (item.status == ReviewStatus::Pending) {
                s.pending++;
                s.pending_by_reason[review_reason_name(item.reason)]++;
            } else if (item.outcome == ReviewOutcome::Stored) {
                s.stored++;
            } else {
                s.discarded++;
            }
        }
        return s;
    }

    size_t pending_count() const { return stats().pending; }

    size_t total_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    struct QueueEntry {
        FactId id;
        ReviewPriority priority;
        Timestamp queued_at;

        bool operator<(const QueueEntry& other) const {
            if (priority != other.priority) {
                return static_cast<uint8_t>(priority) < static_cast<uint8_t>(other.priority);
            }
            return queued_at > other.queued_at;
        }
    };

    void persist(const ReviewItem& item) {
        StoredRow row;
        row.id = item.id.to_string();
        row.key = item.bucket;
        row.fingerprint = item.status == ReviewStatus::Pending ? "pending" : "resolved";
        row.payload = json(item).dump();
        row.updated_at = item.resolved_at ? item.resolved_at : item.queued_at;
        backend_.upsert(REVIEW_COLLECTION, row);
    }

    KnowledgeBackend& backend_;
    mutable std::mutex mutex_;
    std::mutex resolve_mutex_;
    std::unordered_map<FactId, ReviewItem, FactIdHash> items_;
    mutable std::priority_queue<QueueEntry> priority_queue_;
};

} // namespace assetmind
