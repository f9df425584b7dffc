#pragma once
// Asset Identifier: which assets an email and attachment are about
//
// Score per asset, highest signal wins:
//   sender seed     trusted sender mapped to the asset
//   identifiers     exact token > all words > substring > fuzzy
//   bonus/penalty   extra identifier hits, diluted filenames,
//                   identifiers that are also generic relevance words
//   experience      similar past episodes naming the asset
// Every surviving candidate is returned, best first.

#include "config.hpp"
#include "facts.hpp"
#include "text.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace assetmind {

struct IdentifyInput {
    std::string sender;
    std::string subject;
    std::string body;
    std::string filename;
};

// A past episode returned by the similarity lookup
struct EpisodeEvidence {
    EpisodicRecord record;
    float similarity = 0.0f;
};

enum class MatchTier : uint8_t {
    None = 0,
    Fuzzy = 1,
    Substring = 2,
    AllWords = 3,
    ExactToken = 4,
};

inline const char* match_tier_name(MatchTier t) {
    switch (t) {
        case MatchTier::ExactToken: return "exact";
        case MatchTier::AllWords:   return "all_words";
        case MatchTier::Substring:  return "substring";
        case MatchTier::Fuzzy:      return "fuzzy";
        case MatchTier::None:       return "none";
    }
    return "none";
}

struct AssetCandidate {
    std::string asset_id;
    AssetType asset_type = AssetType::Unknown;
    float confidence = 0.0f;
    std::vector<std::string> rationale;
};

class AssetIdentifier {
public:
    AssetIdentifier(MatchingParameters params, std::vector<std::string> relevance_keywords)
        : params_(std::move(params)) {
        for (auto& k : relevance_keywords) relevance_.insert(normalize(k));
    }

    // Match tier of one identifier against lowercase text
    MatchTier classify_match(const std::string& identifier, const std::string& text,
                             const std::vector<std::string>& tokens,
                             const std::unordered_set<std::string>& token_set) const {
        const std::string id = normalize(identifier);
        if (id.empty()) return MatchTier::None;

        if (contains_bounded(text, id)) return MatchTier::ExactToken;

        auto words = tokenize(id, params_.all_words_min_length);
        if (words.size() >= 2) {
            bool all = std::all_of(words.begin(), words.end(),
                                   [&](const std::string& w) { return token_set.count(w) > 0; });
            if (all) return MatchTier::AllWords;
        }

        if (id.size() >= 3 && text.find(id) != std::string::npos) return MatchTier::Substring;

        if (id.size() >= params_.fuzzy_min_length && fuzzy_hit(id, tokens)) return MatchTier::Fuzzy;

        return MatchTier::None;
    }

    float tier_score(MatchTier t) const {
        switch (t) {
            case MatchTier::ExactToken: return params_.exact_token_score;
            case MatchTier::AllWords:   return params_.all_words_score;
            case MatchTier::Substring:  return params_.substring_score;
            case MatchTier::Fuzzy:      return params_.fuzzy_score;
            case MatchTier::None:       return 0.0f;
        }
        return 0.0f;
    }

    std::vector<AssetCandidate> identify(const IdentifyInput& input,
                                         const std::vector<AssetProfile>& assets,
                                         const std::optional<SenderMapping>& sender,
                                         const std::vector<EpisodeEvidence>& evidence = {}) const {
        std::vector<AssetCandidate> out;
        if (assets.empty()) return out;

        const std::string text = to_lower(input.subject + " " + input.body + " " + input.filename);
        const std::string filename = to_lower(input.filename);
        const auto tokens = tokenize(text);
        const std::unordered_set<std::string> token_set(tokens.begin(), tokens.end());
        const size_t stem_length = filename_stem(input.filename).size();

        bool sender_trusted = sender && sender->trust_score >= params_.sender_trust_floor;

        for (const auto& asset : assets) {
            AssetCandidate cand;
            cand.asset_id = asset.asset_id;
            cand.asset_type = asset.asset_type;

            float seed = 0.0f;
            if (sender_trusted &&
                std::find(sender->asset_ids.begin(), sender->asset_ids.end(), asset.asset_id) !=
                    sender->asset_ids.end()) {
                seed = params_.sender_seed;
                cand.rationale.push_back("sender " + sender->sender + " mapped to asset");
            }

            float best = 0.0f;
            std::string best_id;
            size_t hits = 0;
            for (const auto& identifier : asset.identifiers) {
                MatchTier tier = classify_match(identifier, text, tokens, token_set);
                if (tier == MatchTier::None) continue;
                ++hits;
                float score = tier_score(tier);
                if (relevance_.count(normalize(identifier))) {
                    score -= params_.relevance_overlap_penalty;
                    cand.rationale.push_back("identifier '" + identifier + "' is a generic keyword");
                }
                cand.rationale.push_back("identifier '" + identifier + "' " + match_tier_name(tier));
                if (score > best) {
                    best = score;
                    best_id = normalize(identifier);
                }
            }

            float identifier_score = 0.0f;
            if (hits > 0) {
                float bonus = std::min(params_.extra_match_bonus_cap,
                                       params_.extra_match_bonus * static_cast<float>(hits - 1));
                identifier_score = best + bonus;
                if (bonus > 0.0f) cand.rationale.push_back("multi-identifier bonus");

                if (filename.find(best_id) != std::string::npos &&
                    static_cast<float>(stem_length) >
                        params_.filename_dilution_factor * static_cast<float>(best_id.size())) {
                    identifier_score -= params_.filename_dilution_penalty;
                    cand.rationale.push_back("long filename dilutes match");
                }
            }

            float score = std::max(seed, identifier_score);

            float experience = 0.0f;
            for (const auto& ev : evidence) {
                if (ev.similarity < params_.episodic_similarity_floor) continue;
                if (normalize(ev.record.asset_id) != normalize(asset.asset_id)) continue;
                float weight = ev.record.episode_source == EpisodeSource::HumanCorrection
                                   ? params_.correction_record_weight
                                   : params_.auto_record_weight;
                experience += weight * ev.similarity;
            }
            if (experience > 0.0f) {
                experience = std::min(experience, params_.episodic_boost_cap);
                score += experience;
                cand.rationale.push_back("similar past episodes");
            }

            cand.confidence = clamp01(score);
            if (cand.confidence >= params_.min_qualifying) out.push_back(std::move(cand));
        }

        std::sort(out.begin(), out.end(), [](const AssetCandidate& a, const AssetCandidate& b) {
            if (a.confidence != b.confidence) return a.confidence > b.confidence;
            return a.asset_id < b.asset_id;
        });
        return out;
    }

    const MatchingParameters& params() const { return params_; }

private:
    // Compare against windows of text tokens with the identifier's word count
    bool fuzzy_hit(const std::string& id, const std::vector<std::string>& tokens) const {
        auto id_words = tokenize(id);
        size_t n = std::max<size_t>(1, id_words.size());
        if (tokens.size() < n) return false;
        const std::string joined_id = join(id_words, " ");
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            std::string window = tokens[i];
            for (size_t k = 1; k < n; ++k) window += " " + tokens[i + k];
            if (edit_similarity(joined_id, window) >= params_.fuzzy_threshold) return true;
        }
        return false;
    }

    MatchingParameters params_;
    std::unordered_set<std::string> relevance_;
};

} // namespace assetmind
