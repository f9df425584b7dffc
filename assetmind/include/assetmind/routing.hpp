#pragma once
// Routing: what happens to a classified attachment
//
//   confidence >= high     AutoProcessed         stored, no approval
//   confidence >= medium   PendingConfirmation   stored, flagged
//   confidence >= low      AssetReview           matched asset's review bucket
//   below low / no match   GeneralReview         general queue, partitioned by reason
//
// Outside the bands: Quarantined (scanner threat) and Cancelled (caller gave
// up before any write). Every boundary is inclusive.

#include "asset_identifier.hpp"
#include "config.hpp"
#include "document_classifier.hpp"
#include "semantic_store.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

enum class ConfidenceBand : uint8_t {
    VeryLow = 0,
    Low = 1,
    Medium = 2,
    High = 3,
};

inline const char* band_name(ConfidenceBand b) {
    switch (b) {
        case ConfidenceBand::High:    return "high";
        case ConfidenceBand::Medium:  return "medium";
        case ConfidenceBand::Low:     return "low";
        case ConfidenceBand::VeryLow: return "very_low";
    }
    return "very_low";
}

inline ConfidenceBand band_of(float confidence, const ThresholdTable& t) {
    if (confidence >= t.high) return ConfidenceBand::High;
    if (confidence >= t.medium) return ConfidenceBand::Medium;
    if (confidence >= t.low) return ConfidenceBand::Low;
    return ConfidenceBand::VeryLow;
}

enum class RoutingState : uint8_t {
    AutoProcessed = 0,
    PendingConfirmation = 1,
    AssetReview = 2,
    GeneralReview = 3,
    Quarantined = 4,
    Cancelled = 5,
};

inline const char* routing_state_name(RoutingState s) {
    switch (s) {
        case RoutingState::AutoProcessed:       return "auto_processed";
        case RoutingState::PendingConfirmation: return "pending_confirmation";
        case RoutingState::AssetReview:         return "asset_review";
        case RoutingState::GeneralReview:       return "general_review";
        case RoutingState::Quarantined:         return "quarantined";
        case RoutingState::Cancelled:           return "cancelled";
    }
    return "general_review";
}

// Stored states end in the asset folder; review states end in a bucket
inline bool is_stored_state(RoutingState s) {
    return s == RoutingState::AutoProcessed || s == RoutingState::PendingConfirmation;
}

inline bool is_review_state(RoutingState s) {
    return s == RoutingState::AssetReview || s == RoutingState::GeneralReview;
}

enum class ReviewReason : uint8_t {
    None = 0,
    LowConfidence = 1,
    VeryLowConfidence = 2,
    NoAssetMatch = 3,
    DisallowedFileType = 4,
};

inline const char* review_reason_name(ReviewReason r) {
    switch (r) {
        case ReviewReason::LowConfidence:      return "low_confidence";
        case ReviewReason::VeryLowConfidence:  return "very_low_confidence";
        case ReviewReason::NoAssetMatch:       return "no_asset_match";
        case ReviewReason::DisallowedFileType: return "disallowed_file_type";
        case ReviewReason::None:               return "none";
    }
    return "none";
}

inline ReviewReason parse_review_reason(const std::string& s) {
    if (s == "low_confidence")       return ReviewReason::LowConfidence;
    if (s == "very_low_confidence")  return ReviewReason::VeryLowConfidence;
    if (s == "no_asset_match")       return ReviewReason::NoAssetMatch;
    if (s == "disallowed_file_type") return ReviewReason::DisallowedFileType;
    return ReviewReason::None;
}

struct RoutingDecision {
    RoutingState state = RoutingState::GeneralReview;
    ConfidenceBand band = ConfidenceBand::VeryLow;
    std::string filename;
    std::string asset_id;                 // Best candidate, empty on no match
    std::string asset_type;
    std::string category;
    float asset_confidence = 0.0f;
    float category_confidence = 0.0f;
    float confidence = 0.0f;              // min(asset, category)
    std::vector<AssetCandidate> candidates;
    std::vector<std::string> rationale;
    bool needs_confirmation = false;
    ReviewReason review_reason = ReviewReason::None;
    std::string review_id;
    std::string stored_path;
    bool degraded = false;                // Similarity signal was unavailable
    std::string error;                    // Set when the request failed on storage
};

inline json decision_to_json(const RoutingDecision& d) {
    json candidates = json::array();
    for (const auto& c : d.candidates) {
        candidates.push_back({
            {"asset_id", c.asset_id},
            {"asset_type", asset_type_name(c.asset_type)},
            {"confidence", c.confidence},
            {"rationale", c.rationale},
        });
    }
    json j = {
        {"state", routing_state_name(d.state)},
        {"band", band_name(d.band)},
        {"filename", d.filename},
        {"asset_id", d.asset_id},
        {"asset_type", d.asset_type},
        {"category", d.category},
        {"asset_confidence", d.asset_confidence},
        {"category_confidence", d.category_confidence},
        {"confidence", d.confidence},
        {"candidates", candidates},
        {"rationale", d.rationale},
        {"needs_confirmation", d.needs_confirmation},
        {"degraded", d.degraded},
    };
    if (d.review_reason != ReviewReason::None) j["review_reason"] = review_reason_name(d.review_reason);
    if (!d.review_id.empty()) j["review_id"] = d.review_id;
    if (!d.stored_path.empty()) j["stored_path"] = d.stored_path;
    if (!d.error.empty()) j["error"] = d.error;
    return j;
}

class Router {
public:
    explicit Router(ThresholdTable thresholds) : thresholds_(thresholds) {}

    RoutingDecision route(const std::vector<AssetCandidate>& candidates,
                          const Classification& classification,
                          const FileTypeCheck& file_check) const {
        RoutingDecision d;
        d.candidates = candidates;
        d.category = classification.category;
        d.category_confidence = classification.confidence;
        d.rationale = classification.rationale;

        if (!candidates.empty()) {
            const auto& best = candidates.front();
            d.asset_id = best.asset_id;
            d.asset_type = asset_type_name(best.asset_type);
            d.asset_confidence = best.confidence;
            d.rationale.insert(d.rationale.begin(), best.rationale.begin(), best.rationale.end());
        }
        d.confidence = std::min(d.asset_confidence, d.category_confidence);
        d.band = band_of(d.confidence, thresholds_);

        if (!file_check.allowed) {
            d.state = RoutingState::GeneralReview;
            d.review_reason = ReviewReason::DisallowedFileType;
            d.rationale.push_back("file type: " + file_check.reason);
            return d;
        }

        if (candidates.empty()) {
            d.state = RoutingState::GeneralReview;
            d.review_reason = ReviewReason::NoAssetMatch;
            d.rationale.push_back("no asset qualified");
            return d;
        }

        switch (d.band) {
            case ConfidenceBand::High:
                d.state = RoutingState::AutoProcessed;
                break;
            case ConfidenceBand::Medium:
                d.state = RoutingState::PendingConfirmation;
                d.needs_confirmation = true;
                break;
            case ConfidenceBand::Low:
                d.state = RoutingState::AssetReview;
                d.review_reason = ReviewReason::LowConfidence;
                break;
            case ConfidenceBand::VeryLow:
                d.state = RoutingState::GeneralReview;
                d.review_reason = ReviewReason::VeryLowConfidence;
                break;
        }
        return d;
    }

    const ThresholdTable& thresholds() const { return thresholds_; }

private:
    ThresholdTable thresholds_;
};

} // namespace assetmind
