#pragma once
// Procedural Store: how classification is done
//
// - patterns: regular expressions mapping text to a category per asset type
// - rules:    business rules on a subject; opposing statements conflict
// - the specificity weight table and the relevance keyword list
//
// Patterns are compiled once and cached. An expression that fails to
// compile is refused at ingest and skipped (with a warning) on load.

#include "config.hpp"
#include "knowledge_store.hpp"
#include "log.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetmind {

struct CompiledPattern {
    ClassificationPattern pattern;
    std::shared_ptr<const std::regex> regex;
    float weight = 0.0f;
};

class ProceduralStore : public KnowledgeStore {
public:
    ProceduralStore(KnowledgeBackend& backend, DeduplicationGate& gate, const EngineConfig& config)
        : gate_(gate), patterns_(backend), rules_(backend),
          divisor_(config.classifier.specificity_divisor) {
        for (const auto& k : config.relevance_keywords) relevance_keywords_.push_back(normalize(k));
        for (const auto& [pattern, weight] : config.classifier.pattern_weights) {
            weight_table_[normalize(pattern)] = clamp01(weight);
        }
        gate_.register_table(patterns_);
        gate_.register_table(rules_);
    }

    const char* name() const override { return "procedural"; }

    bool load() override {
        bool ok = patterns_.load() && rules_.load();
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_.clear();
        return ok;
    }

    std::map<std::string, size_t> counts() const override {
        return {
            {patterns_.collection(), patterns_.size()},
            {rules_.collection(), rules_.size()},
        };
    }

    std::vector<std::string> collections() const override {
        return {patterns_.collection(), rules_.collection()};
    }

    IngestResult ingest_json(const std::string& collection, const json& payload,
                             ConfidenceTier tier, const std::string& source) override {
        if (collection == patterns_.collection()) {
            ClassificationPattern p;
            try {
                p = payload.get<ClassificationPattern>();
            } catch (const json::exception& e) {
                IngestResult r;
                r.reason = std::string("malformed pattern record: ") + e.what();
                return r;
            }
            if (!payload.contains("confidence")) p.tier = tier;
            if (p.source.empty()) p.source = source;
            return add_pattern(std::move(p));
        }
        if (collection == rules_.collection()) {
            return detail::ingest_json_into(gate_, rules_, payload, tier, source);
        }
        return detail::unknown_collection(name(), collection);
    }

    std::vector<json> query(const std::string& collection,
                            const std::function<bool(const json&)>& filter) const override {
        if (collection == patterns_.collection()) return detail::query_table(patterns_, filter);
        if (collection == rules_.collection()) return detail::query_table(rules_, filter);
        return {};
    }

    IngestResult add_pattern(ClassificationPattern pattern) {
        if (!compile(pattern.pattern)) {
            IngestResult r;
            r.outcome = IngestOutcome::Rejected;
            r.reason = "invalid regular expression: " + pattern.pattern;
            log_warn("procedural", "%s", r.reason.c_str());
            return r;
        }
        return gate_.ingest(patterns_, std::move(pattern), "classification pattern");
    }

    IngestResult add_rule(BusinessRule rule) {
        return gate_.ingest(rules_, std::move(rule), "business rule");
    }

    std::vector<BusinessRule> rules() const { return rules_.all(); }
    std::vector<ClassificationPattern> patterns() const { return patterns_.all(); }

    // Compiled patterns for one asset type
    std::vector<CompiledPattern> patterns_for(const std::string& asset_type) const {
        const std::string type = normalize(asset_type);
        auto matching = patterns_.scan([&](const ClassificationPattern& p) {
            return normalize(p.asset_type) == type;
        });

        std::vector<CompiledPattern> out;
        out.reserve(matching.size());
        for (auto& p : matching) {
            auto regex = compile(p.pattern);
            if (!regex) continue;
            float w = specificity(p);
            out.push_back({std::move(p), std::move(regex), w});
        }
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
            return a.pattern.pattern < b.pattern.pattern;
        });
        return out;
    }

    // Explicit weight on the pattern, then the weight table, then length
    float specificity(const ClassificationPattern& p) const {
        if (p.weight >= 0.0f) return clamp01(p.weight);
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            auto it = weight_table_.find(normalize(p.pattern));
            if (it != weight_table_.end()) return it->second;
        }
        return std::min(static_cast<float>(p.pattern.size()) / divisor_, 1.0f);
    }

    void set_weight(const std::string& pattern, float weight) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        weight_table_[normalize(pattern)] = clamp01(weight);
    }

    const std::vector<std::string>& relevance_keywords() const { return relevance_keywords_; }

    bool is_relevance_keyword(const std::string& word) const {
        const std::string w = normalize(word);
        return std::find(relevance_keywords_.begin(), relevance_keywords_.end(), w) !=
               relevance_keywords_.end();
    }

private:
    std::shared_ptr<const std::regex> compile(const std::string& expr) const {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(expr);
        if (it != cache_.end()) return it->second;
        try {
            auto rx = std::make_shared<const std::regex>(
                expr, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
            cache_[expr] = rx;
            return rx;
        } catch (const std::regex_error& e) {
            log_warn("procedural", "skipping pattern '%s': %s", expr.c_str(), e.what());
            return nullptr;
        }
    }

    DeduplicationGate& gate_;
    FactTable<ClassificationPattern> patterns_;
    FactTable<BusinessRule> rules_;
    float divisor_;
    std::vector<std::string> relevance_keywords_;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<const std::regex>> cache_;
    std::unordered_map<std::string, float> weight_table_;
};

} // namespace assetmind
