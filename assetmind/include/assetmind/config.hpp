#pragma once
// Config: every tunable number in one place
//
// Defaults below are the canonical threshold table. A JSON file may
// override any subset; missing keys keep their defaults.

#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

// Routing bands. Every check is score >= bound.
struct ThresholdTable {
    float high = 0.85f;            // Auto-process
    float medium = 0.65f;          // Process, flag for confirmation
    float low = 0.40f;             // Asset review bucket
};

struct MatchingParameters {
    float exact_token_score = 0.95f;
    float all_words_score = 0.85f;
    float substring_score = 0.75f;
    float fuzzy_score = 0.65f;
    float fuzzy_threshold = 0.80f;         // Edit similarity needed for a fuzzy hit
    size_t fuzzy_min_length = 4;           // Shorter identifiers never match fuzzily
    size_t all_words_min_length = 3;       // Words shorter than this are ignored

    float sender_seed = 0.95f;             // Candidate seeded by a trusted sender
    float sender_trust_floor = 0.5f;

    float extra_match_bonus = 0.10f;       // Per additional matching identifier
    float extra_match_bonus_cap = 0.30f;
    float filename_dilution_factor = 10.0f; // Filename longer than factor x identifier
    float filename_dilution_penalty = 0.05f;
    float relevance_overlap_penalty = 0.15f; // Identifier is also a generic keyword

    float min_qualifying = 0.5f;           // Candidates below are dropped

    float episodic_similarity_floor = 0.3f;
    float auto_record_weight = 0.10f;
    float correction_record_weight = 0.30f;
    float episodic_boost_cap = 0.30f;
    size_t episodic_neighbors = 10;
};

struct ClassifierParameters {
    std::string fallback_category = "uncategorized";
    float fallback_confidence = 0.20f;
    float specificity_divisor = 20.0f;     // Derived weight = min(len / divisor, 1)

    float professional_keyword_bonus = 0.10f;
    float document_extension_bonus = 0.05f;
    float subject_relevance_bonus = 0.05f;
    size_t subject_min_length = 10;
    float trusted_sender_bonus = 0.10f;

    float feedback_bonus = 0.20f;          // Cap on correction-derived boost
    float feedback_similarity_floor = 0.5f;
    size_t pattern_text_limit = 1024;      // Bytes of filename + subject + body fed to patterns

    // Explicit specificity weights by pattern text; consulted before the length rule
    std::map<std::string, float> pattern_weights;

    std::vector<std::string> professional_keywords = {"report", "statement", "summary"};
    std::vector<std::string> document_extensions = {
        ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx", ".csv", ".txt"};
    std::vector<std::string> business_keywords = {
        "loan", "report", "statement", "financial", "quarterly", "monthly", "annual",
        "compliance", "legal", "valuation", "investor", "update", "documents", "docs"};
};

struct ConcurrencyConfig {
    size_t max_concurrent_emails = 4;
    size_t max_concurrent_attachments = 4;  // Per email
    int similarity_timeout_ms = 250;
    size_t similarity_workers = 2;
    size_t max_pending_lookups = 8;         // Beyond this, similarity degrades at once
};

struct EpisodicConfig {
    size_t max_records = 10000;
    int max_age_days = 365;
};

struct EngineConfig {
    std::string db_path = "assetmind.db";   // Empty means in-memory backend
    ThresholdTable thresholds;
    MatchingParameters matching;
    ClassifierParameters classifier;
    ConcurrencyConfig concurrency;
    EpisodicConfig episodic;
    int conflict_margin = 1;                // Tiers a candidate must win by to overwrite
    size_t file_type_min_outcomes = 5;      // Outcomes before learning moves a file-type rule

    // Generic relevance keywords. Kept apart from asset identifiers.
    std::vector<std::string> relevance_keywords = {
        "loan", "report", "fund", "property", "portfolio", "capital", "investment",
        "financial", "statement", "document", "deal", "asset"};
};

namespace detail {

template<typename T>
inline void read_key(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

} // namespace detail

inline void apply_config_json(const json& j, EngineConfig& c) {
    using detail::read_key;
    read_key(j, "db_path", c.db_path);
    read_key(j, "conflict_margin", c.conflict_margin);
    read_key(j, "file_type_min_outcomes", c.file_type_min_outcomes);
    read_key(j, "relevance_keywords", c.relevance_keywords);

    if (j.contains("thresholds")) {
        const auto& t = j["thresholds"];
        read_key(t, "high", c.thresholds.high);
        read_key(t, "medium", c.thresholds.medium);
        read_key(t, "low", c.thresholds.low);
    }
    if (j.contains("matching")) {
        const auto& m = j["matching"];
        auto& p = c.matching;
        read_key(m, "exact_token_score", p.exact_token_score);
        read_key(m, "all_words_score", p.all_words_score);
        read_key(m, "substring_score", p.substring_score);
        read_key(m, "fuzzy_score", p.fuzzy_score);
        read_key(m, "fuzzy_threshold", p.fuzzy_threshold);
        read_key(m, "fuzzy_min_length", p.fuzzy_min_length);
        read_key(m, "all_words_min_length", p.all_words_min_length);
        read_key(m, "sender_seed", p.sender_seed);
        read_key(m, "sender_trust_floor", p.sender_trust_floor);
        read_key(m, "extra_match_bonus", p.extra_match_bonus);
        read_key(m, "extra_match_bonus_cap", p.extra_match_bonus_cap);
        read_key(m, "filename_dilution_factor", p.filename_dilution_factor);
        read_key(m, "filename_dilution_penalty", p.filename_dilution_penalty);
        read_key(m, "relevance_overlap_penalty", p.relevance_overlap_penalty);
        read_key(m, "min_qualifying", p.min_qualifying);
        read_key(m, "episodic_similarity_floor", p.episodic_similarity_floor);
        read_key(m, "auto_record_weight", p.auto_record_weight);
        read_key(m, "correction_record_weight", p.correction_record_weight);
        read_key(m, "episodic_boost_cap", p.episodic_boost_cap);
        read_key(m, "episodic_neighbors", p.episodic_neighbors);
    }
    if (j.contains("classifier")) {
        const auto& k = j["classifier"];
        auto& p = c.classifier;
        read_key(k, "fallback_category", p.fallback_category);
        read_key(k, "fallback_confidence", p.fallback_confidence);
        read_key(k, "specificity_divisor", p.specificity_divisor);
        read_key(k, "professional_keyword_bonus", p.professional_keyword_bonus);
        read_key(k, "document_extension_bonus", p.document_extension_bonus);
        read_key(k, "subject_relevance_bonus", p.subject_relevance_bonus);
        read_key(k, "subject_min_length", p.subject_min_length);
        read_key(k, "trusted_sender_bonus", p.trusted_sender_bonus);
        read_key(k, "feedback_bonus", p.feedback_bonus);
        read_key(k, "feedback_similarity_floor", p.feedback_similarity_floor);
        read_key(k, "pattern_text_limit", p.pattern_text_limit);
        read_key(k, "pattern_weights", p.pattern_weights);
        read_key(k, "professional_keywords", p.professional_keywords);
        read_key(k, "document_extensions", p.document_extensions);
        read_key(k, "business_keywords", p.business_keywords);
    }
    if (j.contains("concurrency")) {
        const auto& k = j["concurrency"];
        read_key(k, "max_concurrent_emails", c.concurrency.max_concurrent_emails);
        read_key(k, "max_concurrent_attachments", c.concurrency.max_concurrent_attachments);
        read_key(k, "similarity_timeout_ms", c.concurrency.similarity_timeout_ms);
        read_key(k, "similarity_workers", c.concurrency.similarity_workers);
        read_key(k, "max_pending_lookups", c.concurrency.max_pending_lookups);
    }
    if (j.contains("episodic")) {
        const auto& k = j["episodic"];
        read_key(k, "max_records", c.episodic.max_records);
        read_key(k, "max_age_days", c.episodic.max_age_days);
    }
}

// Bands must be ordered and inside [0,1]
inline bool validate_config(const EngineConfig& c, std::string& error) {
    const auto& t = c.thresholds;
    if (!(t.low >= 0.0f && t.low <= t.medium && t.medium <= t.high && t.high <= 1.0f)) {
        error = "thresholds must satisfy 0 <= low <= medium <= high <= 1";
        return false;
    }
    if (c.matching.min_qualifying < 0.0f || c.matching.min_qualifying > 1.0f) {
        error = "matching.min_qualifying must be in [0,1]";
        return false;
    }
    if (c.classifier.specificity_divisor <= 0.0f) {
        error = "classifier.specificity_divisor must be positive";
        return false;
    }
    if (c.classifier.pattern_text_limit == 0) {
        error = "classifier.pattern_text_limit must be at least 1";
        return false;
    }
    if (c.concurrency.max_concurrent_emails == 0 || c.concurrency.max_concurrent_attachments == 0 ||
        c.concurrency.similarity_workers == 0 || c.concurrency.max_pending_lookups == 0) {
        error = "concurrency limits must be at least 1";
        return false;
    }
    if (c.conflict_margin < 0) {
        error = "conflict_margin must not be negative";
        return false;
    }
    return true;
}

// Overlay a JSON file onto config. False if unreadable or invalid.
inline bool load_config(const std::string& path, EngineConfig& config) {
    std::ifstream f(path);
    if (!f) {
        log_warn("config", "cannot open %s", path.c_str());
        return false;
    }
    try {
        json j;
        f >> j;
        EngineConfig candidate = config;
        apply_config_json(j, candidate);
        std::string error;
        if (!validate_config(candidate, error)) {
            log_warn("config", "%s: %s", path.c_str(), error.c_str());
            return false;
        }
        config = candidate;
    } catch (const json::exception& e) {
        log_warn("config", "error reading %s: %s", path.c_str(), e.what());
        return false;
    }
    return true;
}

// ASSETMIND_DB_PATH overrides the configured database
inline void apply_environment(EngineConfig& config) {
    if (const char* env_path = std::getenv("ASSETMIND_DB_PATH")) {
        config.db_path = env_path;
    }
}

} // namespace assetmind
