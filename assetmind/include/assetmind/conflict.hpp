#pragma once
// Conflict Ledger: explicit contradiction records and their resolution
//
// A conflict is raised whenever a candidate fact collides with a stored
// fact on its identity key and the two cannot both be true.
// - Severity comes from a fixed table per conflict type
// - The resolution action is a pure function of the two confidence tiers
// - Records are kept for audit whatever the outcome
//
// Nothing is overwritten silently: every contradiction leaves a record.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

enum class ConflictType : uint8_t {
    AssetTypeMismatch = 0,        // Same asset id, different asset type
    FilePermissionMismatch = 1,   // Same extension, allowed vs denied
    SecurityLevelMismatch = 2,    // Same extension, different security level
    SenderOrganizationMismatch = 3,
    RuleContradiction = 4,        // Pattern or business rule says the opposite
};

enum class ConflictSeverity : uint8_t {
    Medium = 1,
    High = 2,
};

// Outcome of a conflict. Pending means a human has to decide.
enum class Resolution : uint8_t {
    Pending = 0,
    Updated = 1,
    Rejected = 2,
    HumanReview = 3,
};

inline const char* conflict_type_name(ConflictType t) {
    switch (t) {
        case ConflictType::AssetTypeMismatch:          return "asset_type_conflict";
        case ConflictType::FilePermissionMismatch:     return "file_permission_conflict";
        case ConflictType::SecurityLevelMismatch:      return "security_level_conflict";
        case ConflictType::SenderOrganizationMismatch: return "sender_organization_conflict";
        case ConflictType::RuleContradiction:          return "rule_contradiction";
    }
    return "rule_contradiction";
}

inline ConflictType parse_conflict_type(const std::string& s) {
    if (s == "asset_type_conflict")          return ConflictType::AssetTypeMismatch;
    if (s == "file_permission_conflict")     return ConflictType::FilePermissionMismatch;
    if (s == "security_level_conflict")      return ConflictType::SecurityLevelMismatch;
    if (s == "sender_organization_conflict") return ConflictType::SenderOrganizationMismatch;
    return ConflictType::RuleContradiction;
}

inline ConflictSeverity severity_of(ConflictType t) {
    switch (t) {
        case ConflictType::SecurityLevelMismatch:
        case ConflictType::SenderOrganizationMismatch:
            return ConflictSeverity::Medium;
        default:
            return ConflictSeverity::High;
    }
}

inline const char* severity_name(ConflictSeverity s) {
    return s == ConflictSeverity::High ? "high" : "medium";
}

inline const char* resolution_name(Resolution r) {
    switch (r) {
        case Resolution::Pending:     return "pending";
        case Resolution::Updated:     return "updated";
        case Resolution::Rejected:    return "rejected";
        case Resolution::HumanReview: return "human_review";
    }
    return "pending";
}

inline bool parse_resolution(const std::string& s, Resolution& out) {
    if (s == "pending")      { out = Resolution::Pending; return true; }
    if (s == "updated" || s == "update") { out = Resolution::Updated; return true; }
    if (s == "rejected" || s == "reject") { out = Resolution::Rejected; return true; }
    if (s == "human_review") { out = Resolution::HumanReview; return true; }
    return false;
}

// Resolution rule. Depends on nothing but the tiers and the margin:
//   incoming beats existing by more than `margin` tiers -> Updated
//   existing outranks incoming                          -> Rejected
//   otherwise                                           -> HumanReview
inline Resolution decide_resolution(ConfidenceTier existing, ConfidenceTier incoming,
                                    int margin = 1) {
    int e = tier_rank(existing);
    int n = tier_rank(incoming);
    if (n > e + margin) return Resolution::Updated;
    if (e > n) return Resolution::Rejected;
    return Resolution::HumanReview;
}

// A contradiction found by comparing two facts with the same identity key
struct DetectedConflict {
    ConflictType type;
    std::string description;
};

// Ledger entry
struct ConflictRecord {
    FactId id;
    ConflictType type = ConflictType::RuleContradiction;   // Most severe detected type
    ConflictSeverity severity = ConflictSeverity::High;
    std::string collection;            // Partition the candidate targeted
    std::string identity_key;
    FactId existing_id;                // Stored fact that was challenged
    json candidate;                    // Full candidate payload, applied if a human accepts it
    ConfidenceTier existing_tier = ConfidenceTier::Experimental;
    ConfidenceTier candidate_tier = ConfidenceTier::Experimental;
    Resolution resolution = Resolution::Pending;
    std::vector<std::string> details;  // One line per detected contradiction
    std::string rationale;
    Timestamp detected_at = 0;
    Timestamp resolved_at = 0;
    bool resolved_by_human = false;
};

inline void to_json(json& j, const ConflictRecord& c) {
    j = json{
        {"id", c.id.to_string()},
        {"type", conflict_type_name(c.type)},
        {"severity", severity_name(c.severity)},
        {"collection", c.collection},
        {"identity_key", c.identity_key},
        {"existing_id", c.existing_id.to_string()},
        {"candidate", c.candidate},
        {"existing_confidence", tier_name(c.existing_tier)},
        {"candidate_confidence", tier_name(c.candidate_tier)},
        {"resolution", resolution_name(c.resolution)},
        {"details", c.details},
        {"rationale", c.rationale},
        {"detected_at", c.detected_at},
        {"resolved_at", c.resolved_at},
        {"resolved_by_human", c.resolved_by_human},
    };
}

inline void from_json(const json& j, ConflictRecord& c) {
    c.id = FactId::from_string(j.value("id", ""));
    c.type = parse_conflict_type(j.value("type", ""));
    c.severity = j.value("severity", "high") == "medium" ? ConflictSeverity::Medium
                                                         : ConflictSeverity::High;
    c.collection = j.value("collection", "");
    c.identity_key = j.value("identity_key", "");
    c.existing_id = FactId::from_string(j.value("existing_id", ""));
    c.candidate = j.value("candidate", json::object());
    parse_tier(j.value("existing_confidence", "experimental"), c.existing_tier);
    parse_tier(j.value("candidate_confidence", "experimental"), c.candidate_tier);
    parse_resolution(j.value("resolution", "pending"), c.resolution);
    c.details = j.value("details", std::vector<std::string>{});
    c.rationale = j.value("rationale", "");
    c.detected_at = j.value("detected_at", Timestamp(0));
    c.resolved_at = j.value("resolved_at", Timestamp(0));
    c.resolved_by_human = j.value("resolved_by_human", false);
}

// Build a record from the contradictions found on one collision
inline ConflictRecord make_conflict_record(const std::string& collection,
                                           const std::string& identity_key,
                                           const FactId& existing_id,
                                           const std::vector<DetectedConflict>& found,
                                           ConfidenceTier existing_tier,
                                           ConfidenceTier candidate_tier,
                                           Timestamp at) {
    ConflictRecord rec;
    rec.id = FactId::generate();
    rec.collection = collection;
    rec.identity_key = identity_key;
    rec.existing_id = existing_id;
    rec.existing_tier = existing_tier;
    rec.candidate_tier = candidate_tier;
    rec.detected_at = at;
    rec.severity = ConflictSeverity::Medium;
    for (const auto& d : found) {
        rec.details.push_back(std::string(conflict_type_name(d.type)) + ": " + d.description);
        if (severity_of(d.type) > rec.severity || rec.details.size() == 1) {
            rec.type = d.type;
            rec.severity = severity_of(d.type);
        }
    }
    return rec;
}

// In-memory index over all conflict records
class ConflictLedger {
public:
    ConflictLedger() = default;
    ConflictLedger(const ConflictLedger&) = delete;
    ConflictLedger& operator=(const ConflictLedger&) = delete;

    void put(const ConflictRecord& rec) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[rec.id] = rec;
    }

    std::optional<ConflictRecord> get(const FactId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    // Awaiting a human, oldest first
    std::vector<ConflictRecord> get_pending() const {
        return filter([](const ConflictRecord& c) { return c.resolution == Resolution::Pending; });
    }

    std::vector<ConflictRecord> get_all() const {
        return filter([](const ConflictRecord&) { return true; });
    }

    std::vector<ConflictRecord> get_for_key(const std::string& collection,
                                            const std::string& key) const {
        return filter([&](const ConflictRecord& c) {
            return c.collection == collection && c.identity_key == key;
        });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& [_, c] : records_) {
            if (c.resolution == Resolution::Pending) ++n;
        }
        return n;
    }

private:
    template<typename Pred>
    std::vector<ConflictRecord> filter(Pred pred) const {
        std::vector<ConflictRecord> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, c] : records_) {
                if (pred(c)) result.push_back(c);
            }
        }
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return a.detected_at < b.detected_at;
        });
        return result;
    }

    mutable std::mutex mutex_;
    std::unordered_map<FactId, ConflictRecord, FactIdHash> records_;
};

} // namespace assetmind
