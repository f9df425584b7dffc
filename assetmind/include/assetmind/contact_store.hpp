#pragma once
// Contact Store: which senders speak for which assets
//
// Keyed by normalized address. Read on every classification, written
// rarely (admin edits and learned associations).

#include "knowledge_store.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace assetmind {

class ContactStore : public KnowledgeStore {
public:
    ContactStore(KnowledgeBackend& backend, DeduplicationGate& gate)
        : gate_(gate), senders_(backend) {
        gate_.register_table(senders_);
    }

    const char* name() const override { return "contact"; }

    bool load() override { return senders_.load(); }

    std::map<std::string, size_t> counts() const override {
        return {{senders_.collection(), senders_.size()}};
    }

    std::vector<std::string> collections() const override {
        return {senders_.collection()};
    }

    IngestResult ingest_json(const std::string& collection, const json& payload,
                             ConfidenceTier tier, const std::string& source) override {
        if (collection != senders_.collection()) return detail::unknown_collection(name(), collection);
        return detail::ingest_json_into(gate_, senders_, payload, tier, source);
    }

    std::vector<json> query(const std::string& collection,
                            const std::function<bool(const json&)>& filter) const override {
        if (collection != senders_.collection()) return {};
        return detail::query_table(senders_, filter);
    }

    IngestResult upsert(SenderMapping mapping) {
        mapping.sender = normalize_email(mapping.sender);
        if (mapping.source.empty()) mapping.source = "admin";
        return gate_.ingest(senders_, std::move(mapping), "sender mapping");
    }

    // Learned association: add asset_id to the sender's list, creating the
    // mapping on first sight
    IngestResult associate(const std::string& sender, const std::string& asset_id,
                           const std::string& organization = "", float trust_score = 0.5f) {
        const std::string key = normalize_email(sender);
        return gate_.ingest_update(senders_, key,
            [&](const std::optional<SenderMapping>& current) -> std::optional<SenderMapping> {
                SenderMapping m;
                if (current) {
                    m = *current;
                } else {
                    m.sender = key;
                    m.trust_score = clamp01(trust_score);
                    m.tier = ConfidenceTier::Low;
                }
                if (std::find(m.asset_ids.begin(), m.asset_ids.end(), asset_id) == m.asset_ids.end()) {
                    m.asset_ids.push_back(asset_id);
                }
                if (!organization.empty()) m.organization = organization;
                m.source = "learned";
                return m;
            },
            "learned sender association");
    }

    std::optional<SenderMapping> lookup(const std::string& sender) const {
        return senders_.find_by_key(normalize_email(sender));
    }

    bool is_trusted(const std::string& sender, float floor) const {
        auto m = lookup(sender);
        return m && m->trust_score >= floor;
    }

    std::vector<SenderMapping> all() const { return senders_.all(); }

private:
    DeduplicationGate& gate_;
    FactTable<SenderMapping> senders_;
};

} // namespace assetmind
