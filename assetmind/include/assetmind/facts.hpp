#pragma once
// Facts: every record kind the four partitions hold
//
// Each kind gets a FactTraits specialization telling the deduplication gate
// how to find its identity key, how to fingerprint it, how to validate it
// and which contradictions two versions of it can have.

#include "types.hpp"
#include "conflict.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

// Fields shared by all stored facts
struct FactMeta {
    FactId id;
    ConfidenceTier tier = ConfidenceTier::Medium;
    std::string source;            // Who asserted it (bootstrap, admin, learned, feedback)
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

inline void meta_to_json(json& j, const FactMeta& m) {
    j["id"] = m.id.to_string();
    j["confidence"] = tier_name(m.tier);
    j["source"] = m.source;
    j["created_at"] = m.created_at;
    j["updated_at"] = m.updated_at;
}

// Accepts a tier name or a numeric score
inline ConfidenceTier tier_from_json(const json& v, ConfidenceTier fallback) {
    ConfidenceTier t = fallback;
    if (v.is_string()) {
        parse_tier(v.get<std::string>(), t);
    } else if (v.is_number()) {
        t = tier_from_score(v.get<float>());
    }
    return t;
}

inline void meta_from_json(const json& j, FactMeta& m) {
    if (j.contains("id")) m.id = FactId::from_string(j.value("id", ""));
    if (j.contains("confidence")) m.tier = tier_from_json(j["confidence"], m.tier);
    m.source = j.value("source", m.source);
    m.created_at = j.value("created_at", m.created_at);
    m.updated_at = j.value("updated_at", m.updated_at);
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

// Sorted, lowercased copy used for canonical serialization
inline std::vector<std::string> canonical_list(const std::vector<std::string>& in) {
    std::vector<std::string> out;
    out.reserve(in.size());
    for (const auto& s : in) out.push_back(normalize(s));
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Semantic facts
// ═══════════════════════════════════════════════════════════════════════════

struct AssetProfile : FactMeta {
    std::string asset_id;
    std::string deal_name;
    std::string asset_name;
    AssetType asset_type = AssetType::Unknown;
    std::vector<std::string> identifiers;              // Disjoint across assets
    std::map<std::string, std::string> business_context;
};

struct FileTypeRule : FactMeta {
    std::string extension;                    // Normalized, with leading '.'
    bool is_allowed = false;
    SecurityLevel security_level = SecurityLevel::Restricted;
    std::vector<std::string> asset_types;
    std::vector<std::string> document_categories;
    uint32_t success_count = 0;
    uint32_t failure_count = 0;

    float processing_rate() const {
        uint32_t total = success_count + failure_count;
        return total == 0 ? 0.0f : static_cast<float>(success_count) / total;
    }
};

// Allowed document categories for one asset type
struct CategorySet : FactMeta {
    std::string asset_type;
    std::vector<std::string> categories;
};

// A human correction kept as a fact
struct FeedbackRecord : FactMeta {
    std::string filename;
    std::string context;
    std::string corrected_category;
    std::string corrected_asset;
};

// ═══════════════════════════════════════════════════════════════════════════
// Procedural facts
// ═══════════════════════════════════════════════════════════════════════════

struct ClassificationPattern : FactMeta {
    std::string asset_type;
    std::string category;
    std::string pattern;       // Case-insensitive regular expression
    float weight = -1.0f;      // Explicit specificity weight; negative means derive
};

struct BusinessRule : FactMeta {
    std::string subject;       // What the rule is about, e.g. "pdf attachments"
    std::string statement;     // e.g. "pdf attachments must be scanned"
};

// ═══════════════════════════════════════════════════════════════════════════
// Episodic and contact facts
// ═══════════════════════════════════════════════════════════════════════════

enum class EpisodeSource : uint8_t {
    Auto = 0,
    HumanCorrection = 1,
};

struct EpisodicRecord : FactMeta {
    std::string filename;
    std::string excerpt;             // Subject and leading body text
    std::string predicted_category;
    std::string asset_type;
    std::string asset_id;
    float confidence = 0.0f;
    EpisodeSource episode_source = EpisodeSource::Auto;
    Timestamp timestamp = 0;
};

struct SenderMapping : FactMeta {
    std::string sender;              // Normalized address
    std::vector<std::string> asset_ids;
    float trust_score = 0.5f;
    std::string organization;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════════════════════

inline void to_json(json& j, const AssetProfile& a) {
    j = json{
        {"asset_id", a.asset_id},
        {"deal_name", a.deal_name},
        {"asset_name", a.asset_name},
        {"asset_type", asset_type_name(a.asset_type)},
        {"identifiers", a.identifiers},
        {"business_context", a.business_context},
    };
    meta_to_json(j, a);
}

inline void from_json(const json& j, AssetProfile& a) {
    meta_from_json(j, a);
    a.asset_id = j.value("asset_id", "");
    a.deal_name = j.value("deal_name", "");
    a.asset_name = j.value("asset_name", "");
    a.asset_type = parse_asset_type(j.value("asset_type", ""));
    a.identifiers = j.value("identifiers", std::vector<std::string>{});
    a.business_context.clear();
    if (j.contains("business_context") && j["business_context"].is_object()) {
        for (const auto& [k, v] : j["business_context"].items()) {
            a.business_context[k] = v.is_string() ? v.get<std::string>() : v.dump();
        }
    }
}

inline void to_json(json& j, const FileTypeRule& r) {
    j = json{
        {"extension", r.extension},
        {"is_allowed", r.is_allowed},
        {"security_level", security_level_name(r.security_level)},
        {"asset_types", r.asset_types},
        {"document_categories", r.document_categories},
        {"success_count", r.success_count},
        {"failure_count", r.failure_count},
    };
    meta_to_json(j, r);
}

inline void from_json(const json& j, FileTypeRule& r) {
    meta_from_json(j, r);
    r.extension = normalize_extension(j.value("extension", ""));
    r.is_allowed = j.value("is_allowed", false);
    parse_security_level(j.value("security_level", "restricted"), r.security_level);
    r.asset_types = j.value("asset_types", std::vector<std::string>{});
    r.document_categories = j.value("document_categories", std::vector<std::string>{});
    r.success_count = j.value("success_count", 0u);
    r.failure_count = j.value("failure_count", 0u);
}

inline void to_json(json& j, const CategorySet& c) {
    j = json{{"asset_type", c.asset_type}, {"categories", c.categories}};
    meta_to_json(j, c);
}

inline void from_json(const json& j, CategorySet& c) {
    meta_from_json(j, c);
    c.asset_type = j.value("asset_type", "");
    c.categories = j.value("categories", std::vector<std::string>{});
}

inline void to_json(json& j, const FeedbackRecord& f) {
    j = json{
        {"filename", f.filename},
        {"context", f.context},
        {"corrected_category", f.corrected_category},
        {"corrected_asset", f.corrected_asset},
    };
    meta_to_json(j, f);
}

inline void from_json(const json& j, FeedbackRecord& f) {
    meta_from_json(j, f);
    f.filename = j.value("filename", "");
    f.context = j.value("context", "");
    f.corrected_category = j.value("corrected_category", "");
    f.corrected_asset = j.value("corrected_asset", "");
}

inline void to_json(json& j, const ClassificationPattern& p) {
    j = json{
        {"asset_type", p.asset_type},
        {"category", p.category},
        {"pattern", p.pattern},
        {"weight", p.weight},
    };
    meta_to_json(j, p);
}

inline void from_json(const json& j, ClassificationPattern& p) {
    meta_from_json(j, p);
    p.asset_type = j.value("asset_type", "");
    p.category = j.value("category", "");
    p.pattern = j.value("pattern", "");
    p.weight = j.value("weight", -1.0f);
}

inline void to_json(json& j, const BusinessRule& r) {
    j = json{{"subject", r.subject}, {"statement", r.statement}};
    meta_to_json(j, r);
}

inline void from_json(const json& j, BusinessRule& r) {
    meta_from_json(j, r);
    r.subject = j.value("subject", "");
    r.statement = j.value("statement", "");
}

inline void to_json(json& j, const EpisodicRecord& e) {
    j = json{
        {"filename", e.filename},
        {"excerpt", e.excerpt},
        {"predicted_category", e.predicted_category},
        {"asset_type", e.asset_type},
        {"asset_id", e.asset_id},
        {"score", e.confidence},
        {"episode_source", e.episode_source == EpisodeSource::HumanCorrection
                               ? "human_correction" : "auto"},
        {"timestamp", e.timestamp},
    };
    meta_to_json(j, e);
}

inline void from_json(const json& j, EpisodicRecord& e) {
    meta_from_json(j, e);
    e.filename = j.value("filename", "");
    e.excerpt = j.value("excerpt", "");
    e.predicted_category = j.value("predicted_category", "");
    e.asset_type = j.value("asset_type", "");
    e.asset_id = j.value("asset_id", "");
    e.confidence = j.value("score", 0.0f);
    e.episode_source = j.value("episode_source", "auto") == "human_correction"
                           ? EpisodeSource::HumanCorrection : EpisodeSource::Auto;
    e.timestamp = j.value("timestamp", Timestamp(0));
}

inline void to_json(json& j, const SenderMapping& s) {
    j = json{
        {"sender", s.sender},
        {"asset_ids", s.asset_ids},
        {"trust_score", s.trust_score},
        {"organization", s.organization},
    };
    meta_to_json(j, s);
}

inline void from_json(const json& j, SenderMapping& s) {
    meta_from_json(j, s);
    s.sender = normalize_email(j.value("sender", j.value("email", "")));
    s.asset_ids = j.value("asset_ids", std::vector<std::string>{});
    s.trust_score = j.value("trust_score", 0.5f);
    s.organization = j.value("organization", "");
}

// ═══════════════════════════════════════════════════════════════════════════
// Traits consumed by the deduplication gate
// ═══════════════════════════════════════════════════════════════════════════

template<typename T> struct FactTraits;

template<> struct FactTraits<AssetProfile> {
    static constexpr const char* collection = "assets";

    static std::string identity_key(const AssetProfile& a) { return normalize(a.asset_id); }

    static std::string validate(const AssetProfile& a) {
        if (identity_key(a).empty()) return "asset_id is required";
        if (a.identifiers.empty()) return "at least one identifier is required";
        return "";
    }

    static std::string canonical(const AssetProfile& a) {
        std::string ctx;
        for (const auto& [k, v] : a.business_context) ctx += normalize(k) + "=" + normalize(v) + ";";
        return identity_key(a) + "|" + normalize(a.deal_name) + "|" + normalize(a.asset_name) + "|" +
               asset_type_name(a.asset_type) + "|" + join(canonical_list(a.identifiers), ",") + "|" + ctx;
    }

    static std::vector<DetectedConflict> detect(const AssetProfile& existing, const AssetProfile& candidate) {
        std::vector<DetectedConflict> out;
        if (existing.asset_type != candidate.asset_type) {
            out.push_back({ConflictType::AssetTypeMismatch,
                           std::string("asset type ") + asset_type_name(existing.asset_type) +
                           " vs " + asset_type_name(candidate.asset_type)});
        }
        return out;
    }
};

template<> struct FactTraits<FileTypeRule> {
    static constexpr const char* collection = "file_types";

    static std::string identity_key(const FileTypeRule& r) { return normalize_extension(r.extension); }

    static std::string validate(const FileTypeRule& r) {
        if (identity_key(r).size() < 2) return "extension is required";
        return "";
    }

    static std::string canonical(const FileTypeRule& r) {
        return identity_key(r) + "|" + (r.is_allowed ? "1" : "0") + "|" +
               security_level_name(r.security_level) + "|" +
               join(canonical_list(r.asset_types), ",") + "|" +
               join(canonical_list(r.document_categories), ",") + "|" +
               std::to_string(r.success_count) + "/" + std::to_string(r.failure_count);
    }

    // Candidate is the existing rule plus one more processing outcome
    static bool outcome_of(const FileTypeRule& existing, const FileTypeRule& candidate) {
        return candidate.source == "learned" &&
               candidate.success_count >= existing.success_count &&
               candidate.failure_count >= existing.failure_count &&
               candidate.success_count + candidate.failure_count ==
                   existing.success_count + existing.failure_count + 1;
    }

    static std::vector<DetectedConflict> detect(const FileTypeRule& existing, const FileTypeRule& candidate) {
        std::vector<DetectedConflict> out;
        // A permission moved by the rule's own outcome counters is a refinement
        if (existing.is_allowed != candidate.is_allowed && !outcome_of(existing, candidate)) {
            out.push_back({ConflictType::FilePermissionMismatch,
                           std::string("allowed=") + (existing.is_allowed ? "true" : "false") +
                           " vs allowed=" + (candidate.is_allowed ? "true" : "false")});
        }
        if (existing.security_level != candidate.security_level) {
            out.push_back({ConflictType::SecurityLevelMismatch,
                           std::string(security_level_name(existing.security_level)) + " vs " +
                           security_level_name(candidate.security_level)});
        }
        return out;
    }
};

template<> struct FactTraits<CategorySet> {
    static constexpr const char* collection = "categories";

    static std::string identity_key(const CategorySet& c) { return normalize(c.asset_type); }

    static std::string validate(const CategorySet& c) {
        if (identity_key(c).empty()) return "asset_type is required";
        if (c.categories.empty()) return "categories must not be empty";
        return "";
    }

    static std::string canonical(const CategorySet& c) {
        return identity_key(c) + "|" + join(canonical_list(c.categories), ",");
    }

    static std::vector<DetectedConflict> detect(const CategorySet&, const CategorySet&) {
        return {};
    }
};

template<> struct FactTraits<FeedbackRecord> {
    static constexpr const char* collection = "feedback";

    static std::string identity_key(const FeedbackRecord& f) { return f.id.valid() ? f.id.to_string() : ""; }

    static std::string validate(const FeedbackRecord& f) {
        if (!f.id.valid()) return "record id is required";
        if (normalize(f.filename).empty()) return "filename is required";
        if (normalize(f.corrected_category).empty() && normalize(f.corrected_asset).empty()) {
            return "a corrected category or asset is required";
        }
        return "";
    }

    static std::string canonical(const FeedbackRecord& f) {
        return normalize(f.filename) + "|" + normalize(f.context) + "|" +
               normalize(f.corrected_category) + "|" + normalize(f.corrected_asset);
    }

    static std::vector<DetectedConflict> detect(const FeedbackRecord&, const FeedbackRecord&) {
        return {};
    }
};

template<> struct FactTraits<ClassificationPattern> {
    static constexpr const char* collection = "patterns";

    static std::string identity_key(const ClassificationPattern& p) {
        if (normalize(p.asset_type).empty() || normalize(p.pattern).empty()) return "";
        return normalize(p.asset_type) + "|" + normalize(p.pattern);
    }

    static std::string validate(const ClassificationPattern& p) {
        if (identity_key(p).empty()) return "asset_type and pattern are required";
        if (normalize(p.category).empty()) return "category is required";
        if (p.weight > 1.0f) return "weight must be at most 1.0";
        return "";
    }

    static std::string canonical(const ClassificationPattern& p) {
        char w[16];
        snprintf(w, sizeof(w), "%.3f", p.weight);
        return identity_key(p) + "|" + normalize(p.category) + "|" + w;
    }

    static std::vector<DetectedConflict> detect(const ClassificationPattern& existing,
                                                const ClassificationPattern& candidate) {
        std::vector<DetectedConflict> out;
        if (normalize(existing.category) != normalize(candidate.category)) {
            out.push_back({ConflictType::RuleContradiction,
                           "pattern '" + candidate.pattern + "' maps to " + existing.category +
                           " and " + candidate.category});
        }
        return out;
    }
};

// Opposing keyword pairs. A rule using one side contradicts a rule on the
// same subject using the other.
inline bool statements_contradict(const std::string& a, const std::string& b) {
    static const std::vector<std::pair<std::string, std::string>> opposites = {
        {"always", "never"},
        {"required", "forbidden"},
        {"allowed", "prohibited"},
        {"must", "must not"},
    };
    std::string la = " " + normalize(a) + " ";
    std::string lb = " " + normalize(b) + " ";
    auto has = [](const std::string& text, const std::string& word) {
        return text.find(" " + word + " ") != std::string::npos;
    };
    for (const auto& [pos, neg] : opposites) {
        if (pos == "must") {
            bool a_neg = has(la, "must not");
            bool b_neg = has(lb, "must not");
            bool a_pos = has(la, "must") && !a_neg;
            bool b_pos = has(lb, "must") && !b_neg;
            if ((a_pos && b_neg) || (a_neg && b_pos)) return true;
            continue;
        }
        if ((has(la, pos) && has(lb, neg)) || (has(la, neg) && has(lb, pos))) return true;
    }
    return false;
}

template<> struct FactTraits<BusinessRule> {
    static constexpr const char* collection = "rules";

    static std::string identity_key(const BusinessRule& r) { return normalize(r.subject); }

    static std::string validate(const BusinessRule& r) {
        if (identity_key(r).empty()) return "subject is required";
        if (normalize(r.statement).empty()) return "statement is required";
        return "";
    }

    static std::string canonical(const BusinessRule& r) {
        return identity_key(r) + "|" + normalize(r.statement);
    }

    static std::vector<DetectedConflict> detect(const BusinessRule& existing, const BusinessRule& candidate) {
        std::vector<DetectedConflict> out;
        if (statements_contradict(existing.statement, candidate.statement)) {
            out.push_back({ConflictType::RuleContradiction,
                           "'" + existing.statement + "' vs '" + candidate.statement + "'"});
        }
        return out;
    }
};

template<> struct FactTraits<EpisodicRecord> {
    static constexpr const char* collection = "episodes";

    static std::string identity_key(const EpisodicRecord& e) { return e.id.valid() ? e.id.to_string() : ""; }

    static std::string validate(const EpisodicRecord& e) {
        if (!e.id.valid()) return "record id is required";
        if (normalize(e.filename).empty()) return "filename is required";
        if (e.confidence < 0.0f || e.confidence > 1.0f) return "confidence must be in [0,1]";
        return "";
    }

    static std::string canonical(const EpisodicRecord& e) {
        char c[16];
        snprintf(c, sizeof(c), "%.3f", e.confidence);
        return normalize(e.filename) + "|" + normalize(e.excerpt) + "|" +
               normalize(e.predicted_category) + "|" + normalize(e.asset_id) + "|" + c + "|" +
               (e.episode_source == EpisodeSource::HumanCorrection ? "human" : "auto");
    }

    static std::vector<DetectedConflict> detect(const EpisodicRecord&, const EpisodicRecord&) {
        return {};
    }
};

template<> struct FactTraits<SenderMapping> {
    static constexpr const char* collection = "senders";

    static std::string identity_key(const SenderMapping& s) { return normalize_email(s.sender); }

    static std::string validate(const SenderMapping& s) {
        auto key = identity_key(s);
        if (key.empty()) return "sender address is required";
        if (key.find('@') == std::string::npos) return "sender address is malformed";
        if (s.trust_score < 0.0f || s.trust_score > 1.0f) return "trust_score must be in [0,1]";
        return "";
    }

    static std::string canonical(const SenderMapping& s) {
        char t[16];
        snprintf(t, sizeof(t), "%.3f", s.trust_score);
        return identity_key(s) + "|" + join(canonical_list(s.asset_ids), ",") + "|" + t + "|" +
               normalize(s.organization);
    }

    static std::vector<DetectedConflict> detect(const SenderMapping& existing, const SenderMapping& candidate) {
        std::vector<DetectedConflict> out;
        if (!existing.organization.empty() && !candidate.organization.empty() &&
            normalize(existing.organization) != normalize(candidate.organization)) {
            out.push_back({ConflictType::SenderOrganizationMismatch,
                           existing.organization + " vs " + candidate.organization});
        }
        return out;
    }
};

} // namespace assetmind
