#pragma once
// Semantic Store: what is true about assets and file types
//
// Collections:
// - assets:     asset profiles with their identifiers
// - file_types: allow/deny rules per extension, learned from outcomes
// - categories: allowed document categories per asset type
// - feedback:   human corrections kept as facts

#include "knowledge_store.hpp"
#include "log.hpp"
#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace assetmind {

struct FileTypeCheck {
    std::string extension;
    bool allowed = false;
    SecurityLevel security_level = SecurityLevel::Restricted;
    float confidence = 0.0f;
    std::string reason;
};

inline float tier_score(ConfidenceTier t) {
    switch (t) {
        case ConfidenceTier::High:         return 0.9f;
        case ConfidenceTier::Medium:       return 0.7f;
        case ConfidenceTier::Low:          return 0.5f;
        case ConfidenceTier::Experimental: return 0.3f;
    }
    return 0.3f;
}

// Categories every asset type can receive
inline const std::vector<std::string>& general_categories() {
    static const std::vector<std::string> cats = {
        "legal_documents", "tax_documents", "insurance", "correspondence"};
    return cats;
}

inline std::vector<CategorySet> default_category_sets() {
    auto make = [](AssetType t, std::vector<std::string> cats) {
        CategorySet c;
        c.asset_type = asset_type_name(t);
        c.categories = std::move(cats);
        c.tier = ConfidenceTier::High;
        c.source = "defaults";
        return c;
    };
    return {
        make(AssetType::CommercialRealEstate,
             {"rent_roll", "financial_statements", "property_photos", "appraisal",
              "lease_documents", "property_management"}),
        make(AssetType::PrivateCredit,
             {"loan_documents", "borrower_financials", "covenant_compliance", "credit_memo",
              "loan_monitoring"}),
        make(AssetType::PrivateEquity,
             {"portfolio_reports", "investor_updates", "board_materials", "deal_documents",
              "valuation_reports"}),
        make(AssetType::Infrastructure,
             {"engineering_reports", "construction_updates", "regulatory_documents",
              "operations_reports"}),
    };
}

class SemanticStore : public KnowledgeStore {
public:
    SemanticStore(KnowledgeBackend& backend, DeduplicationGate& gate, size_t min_outcomes = 5)
        : gate_(gate), assets_(backend), file_types_(backend),
          categories_(backend), feedback_(backend), min_outcomes_(min_outcomes) {
        // An accepted asset candidate must still leave identifiers disjoint
        gate_.register_table<AssetProfile>(assets_,
            [this](const AssetProfile& accepted) { return identifier_clash(accepted); },
            &asset_write_mutex_);
        gate_.register_table(file_types_);
        gate_.register_table(categories_);
        gate_.register_table(feedback_);
    }

    const char* name() const override { return "semantic"; }

    bool load() override {
        return assets_.load() && file_types_.load() && categories_.load() && feedback_.load();
    }

    std::map<std::string, size_t> counts() const override {
        return {
            {assets_.collection(), assets_.size()},
            {file_types_.collection(), file_types_.size()},
            {categories_.collection(), categories_.size()},
            {feedback_.collection(), feedback_.size()},
        };
    }

    std::vector<std::string> collections() const override {
        return {assets_.collection(), file_types_.collection(), categories_.collection(),
                feedback_.collection()};
    }

    IngestResult ingest_json(const std::string& collection, const json& payload,
                             ConfidenceTier tier, const std::string& source) override {
        if (collection == assets_.collection()) {
            AssetProfile a;
            try {
                a = payload.get<AssetProfile>();
            } catch (const json::exception& e) {
                IngestResult r;
                r.reason = std::string("malformed asset record: ") + e.what();
                return r;
            }
            if (!payload.contains("confidence")) a.tier = tier;
            if (a.source.empty()) a.source = source;
            return add_asset(std::move(a), "ingested from " + source);
        }
        if (collection == file_types_.collection()) {
            return detail::ingest_json_into(gate_, file_types_, payload, tier, source);
        }
        if (collection == categories_.collection()) {
            return detail::ingest_json_into(gate_, categories_, payload, tier, source);
        }
        if (collection == feedback_.collection()) {
            json p = payload;
            if (!p.contains("id")) p["id"] = FactId::generate().to_string();
            return detail::ingest_json_into(gate_, feedback_, p, tier, source);
        }
        return detail::unknown_collection(name(), collection);
    }

    std::vector<json> query(const std::string& collection,
                            const std::function<bool(const json&)>& filter) const override {
        if (collection == assets_.collection()) return detail::query_table(assets_, filter);
        if (collection == file_types_.collection()) return detail::query_table(file_types_, filter);
        if (collection == categories_.collection()) return detail::query_table(categories_, filter);
        if (collection == feedback_.collection()) return detail::query_table(feedback_, filter);
        return {};
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Assets
    // ═══════════════════════════════════════════════════════════════════════

    // Identifiers must stay disjoint across assets; the check and the write
    // happen under one lock so two new assets cannot claim the same word.
    IngestResult add_asset(AssetProfile asset, const std::string& rationale = "") {
        std::lock_guard<std::mutex> lock(asset_write_mutex_);

        std::string clash = identifier_clash(asset);
        if (!clash.empty()) {
            IngestResult r;
            r.outcome = IngestOutcome::Rejected;
            r.reason = clash;
            log_info("semantic", "rejected asset %s: %s", asset.asset_id.c_str(), clash.c_str());
            return r;
        }
        return gate_.ingest(assets_, std::move(asset), rationale);
    }

    std::vector<AssetProfile> assets() const { return assets_.all(); }

    std::optional<AssetProfile> asset(const std::string& asset_id) const {
        return assets_.find_by_key(normalize(asset_id));
    }

    // ═══════════════════════════════════════════════════════════════════════
    // File types
    // ═══════════════════════════════════════════════════════════════════════

    IngestResult add_file_type_rule(FileTypeRule rule, const std::string& rationale = "") {
        rule.extension = normalize_extension(rule.extension);
        return gate_.ingest(file_types_, std::move(rule), rationale);
    }

    std::optional<FileTypeRule> file_type_rule(const std::string& extension) const {
        return file_types_.find_by_key(normalize_extension(extension));
    }

    // Unknown extensions are refused
    FileTypeCheck validate_file_type(const std::string& filename,
                                     const std::string& asset_type = "",
                                     const std::string& category = "") const {
        FileTypeCheck check;
        check.extension = extension_of(filename);
        if (check.extension.empty()) {
            check.reason = "file has no extension";
            return check;
        }

        auto rule = file_types_.find_by_key(check.extension);
        if (!rule) {
            check.reason = "unknown file type " + check.extension;
            check.confidence = tier_score(ConfidenceTier::Experimental);
            return check;
        }

        check.allowed = rule->is_allowed;
        check.security_level = rule->security_level;
        check.confidence = tier_score(rule->tier);

        auto listed = [](const std::vector<std::string>& list, const std::string& v) {
            return !v.empty() && std::find(list.begin(), list.end(), v) != list.end();
        };
        if (listed(rule->asset_types, asset_type) || listed(rule->document_categories, category)) {
            check.confidence = clamp01(check.confidence + 0.1f);
        }
        check.reason = std::string(rule->is_allowed ? "allowed" : "blocked") + " (" +
                       security_level_name(rule->security_level) + ")";
        return check;
    }

    // Fold one processing outcome into the rule's counters. Tier and
    // permission follow the processing rate once min_outcomes are counted;
    // successes also record the asset type and category they came with.
    IngestResult learn_file_type_outcome(const std::string& extension, bool success,
                                         const std::string& asset_type = "",
                                         const std::string& category = "") {
        const std::string key = normalize_extension(extension);
        const size_t min_outcomes = min_outcomes_;
        return gate_.ingest_update(file_types_, key,
            [&](const std::optional<FileTypeRule>& rule) -> std::optional<FileTypeRule> {
                if (!rule) return std::nullopt;
                FileTypeRule updated = *rule;
                if (success) {
                    updated.success_count++;
                    add_unique(updated.asset_types, asset_type);
                    add_unique(updated.document_categories, category);
                } else {
                    updated.failure_count++;
                }
                updated.source = "learned";
                if (updated.success_count + updated.failure_count < min_outcomes) return updated;

                float rate = updated.processing_rate();
                if (rate > 0.8f) {
                    updated.tier = ConfidenceTier::High;
                } else if (rate > 0.6f) {
                    updated.tier = ConfidenceTier::Medium;
                } else {
                    updated.tier = ConfidenceTier::Low;
                }
                updated.is_allowed = rate > 0.5f;
                return updated;
            },
            success ? "learned from processing success" : "learned from processing failure");
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Categories
    // ═══════════════════════════════════════════════════════════════════════

    IngestResult set_categories(CategorySet set, const std::string& rationale = "") {
        return gate_.ingest(categories_, std::move(set), rationale);
    }

    // Type-specific categories plus the general set. Unknown types get the
    // general set only; *known reports which case applied.
    std::vector<std::string> allowed_categories(AssetType type, bool* known = nullptr) const {
        std::vector<std::string> result;
        bool found = false;
        if (type != AssetType::Unknown) {
            if (auto stored = categories_.find_by_key(asset_type_name(type))) {
                result = stored->categories;
                found = true;
            } else {
                for (const auto& d : default_category_sets()) {
                    if (d.asset_type == asset_type_name(type)) {
                        result = d.categories;
                        found = true;
                    }
                }
            }
        }
        for (const auto& g : general_categories()) {
            if (std::find(result.begin(), result.end(), g) == result.end()) result.push_back(g);
        }
        if (known) *known = found;
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Feedback
    // ═══════════════════════════════════════════════════════════════════════

    IngestResult add_feedback(FeedbackRecord record) {
        if (!record.id.valid()) record.id = FactId::generate();
        record.tier = ConfidenceTier::High;
        if (record.source.empty()) record.source = "human_feedback";
        return gate_.ingest(feedback_, std::move(record), "human feedback");
    }

    std::vector<FeedbackRecord> feedback() const { return feedback_.all(); }

    const FactTable<AssetProfile>& asset_table() const { return assets_; }
    const FactTable<FileTypeRule>& file_type_table() const { return file_types_; }

private:
    static void add_unique(std::vector<std::string>& list, const std::string& value) {
        if (value.empty() || value == asset_type_name(AssetType::Unknown)) return;
        if (std::find(list.begin(), list.end(), value) == list.end()) list.push_back(value);
    }

    std::string identifier_clash(const AssetProfile& candidate) const {
        const std::string key = normalize(candidate.asset_id);
        for (const auto& other : assets_.all()) {
            if (normalize(other.asset_id) == key) continue;
            for (const auto& mine : candidate.identifiers) {
                for (const auto& theirs : other.identifiers) {
                    if (normalize(mine) == normalize(theirs)) {
                        return "identifier '" + mine + "' already belongs to asset " + other.asset_id;
                    }
                }
            }
        }
        return "";
    }

    DeduplicationGate& gate_;
    FactTable<AssetProfile> assets_;
    FactTable<FileTypeRule> file_types_;
    FactTable<CategorySet> categories_;
    FactTable<FeedbackRecord> feedback_;
    size_t min_outcomes_;
    std::mutex asset_write_mutex_;
};

} // namespace assetmind
