#pragma once
// Document Classifier: which category a document belongs to
//
// Per allowed category, the specificity weights of every firing pattern
// are summed (capped at 1.0). The best category then gets additive
// business adjustments. No firing pattern means the fallback category
// at a fixed low confidence. The trace of what fired is always returned.

#include "asset_identifier.hpp"
#include "config.hpp"
#include "procedural_store.hpp"
#include <algorithm>
#include <cstdio>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace assetmind {

struct ClassifyInput {
    std::string asset_type;
    std::string filename;
    std::string subject;
    std::string body;
    bool trusted_sender = false;
};

struct Classification {
    std::string category;
    float confidence = 0.0f;
    bool fallback = false;                    // No pattern fired
    std::map<std::string, float> scores;      // Category -> pattern score
    std::vector<std::string> rationale;
};

class DocumentClassifier {
public:
    explicit DocumentClassifier(ClassifierParameters params) : params_(std::move(params)) {}

    Classification classify(const ClassifyInput& input,
                            const std::vector<std::string>& allowed_categories,
                            const std::vector<CompiledPattern>& patterns,
                            const std::vector<EpisodeEvidence>& evidence = {}) const {
        Classification out;
        const std::string text = pattern_text(input);

        for (const auto& cat : allowed_categories) out.scores[cat] = 0.0f;

        for (const auto& cp : patterns) {
            auto it = out.scores.find(normalize(cp.pattern.category));
            if (it == out.scores.end()) continue;
            if (!cp.regex || !std::regex_search(text, *cp.regex)) continue;
            it->second = std::min(1.0f, it->second + cp.weight);
            out.rationale.push_back("pattern '" + cp.pattern.pattern + "' -> " + it->first +
                                    " (+" + format_score(cp.weight) + ")");
        }

        // Human corrections on similar documents
        std::map<std::string, float> corrections;
        for (const auto& ev : evidence) {
            if (ev.record.episode_source != EpisodeSource::HumanCorrection) continue;
            if (ev.similarity < params_.feedback_similarity_floor) continue;
            auto cat = normalize(ev.record.predicted_category);
            if (out.scores.count(cat)) corrections[cat] += ev.similarity * params_.feedback_bonus;
        }
        for (const auto& [cat, boost] : corrections) {
            float b = std::min(params_.feedback_bonus, boost);
            out.scores[cat] = std::min(1.0f, out.scores[cat] + b);
            out.rationale.push_back("human corrections favour " + cat + " (+" + format_score(b) + ")");
        }

        float best = 0.0f;
        for (const auto& [cat, score] : out.scores) {
            if (score > best) {
                best = score;
                out.category = cat;
            }
        }

        if (best <= 0.0f) {
            out.category = params_.fallback_category;
            out.confidence = params_.fallback_confidence;
            out.fallback = true;
            out.rationale.push_back("no pattern matched; fallback " + out.category);
        } else {
            out.confidence = best;
        }

        apply_adjustments(input, out);
        out.confidence = clamp01(out.confidence);
        return out;
    }

    const ClassifierParameters& params() const { return params_; }

    // Patterns see the filename, the subject and the head of the body.
    // std::regex recurses per character, so the input stays bounded.
    std::string pattern_text(const ClassifyInput& input) const {
        std::string text = input.filename + " " + input.subject + " " + input.body;
        if (text.size() > params_.pattern_text_limit) text.resize(params_.pattern_text_limit);
        return text;
    }

private:
    static std::string format_score(float v) {
        char buf[16];
        snprintf(buf, sizeof(buf), "%.2f", v);
        return buf;
    }

    void apply_adjustments(const ClassifyInput& input, Classification& out) const {
        const std::string filename = to_lower(input.filename);

        for (const auto& kw : params_.professional_keywords) {
            if (filename.find(normalize(kw)) != std::string::npos) {
                out.confidence += params_.professional_keyword_bonus;
                out.rationale.push_back("filename has professional keyword '" + kw + "'");
                break;
            }
        }

        const std::string ext = extension_of(input.filename);
        if (!ext.empty() &&
            std::find(params_.document_extensions.begin(), params_.document_extensions.end(), ext) !=
                params_.document_extensions.end()) {
            out.confidence += params_.document_extension_bonus;
            out.rationale.push_back("document format " + ext);
        }

        const std::string subject = normalize(input.subject);
        if (subject.size() >= params_.subject_min_length) {
            auto tokens = tokenize(subject);
            for (const auto& kw : params_.business_keywords) {
                if (std::find(tokens.begin(), tokens.end(), normalize(kw)) != tokens.end()) {
                    out.confidence += params_.subject_relevance_bonus;
                    out.rationale.push_back("subject mentions '" + kw + "'");
                    break;
                }
            }
        }

        if (input.trusted_sender) {
            out.confidence += params_.trusted_sender_bonus;
            out.rationale.push_back("known sender");
        }
    }

    ClassifierParameters params_;
};

} // namespace assetmind
