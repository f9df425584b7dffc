#pragma once
// Episodic Store: append-only log of past decisions and corrections
//
// Records are never edited. Eviction keeps the log inside its caps:
//   1. records older than max_age_days go first (auto before corrections)
//   2. then the oldest auto records
//   3. corrections only when nothing else is left to evict
// Every appended record is also handed to the similarity lookup.

#include "config.hpp"
#include "knowledge_store.hpp"
#include "log.hpp"
#include "similarity.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace assetmind {

// Text the similarity lookup indexes for a record
inline std::string episode_text(const EpisodicRecord& r) {
    return r.filename + " " + r.excerpt;
}

class EpisodicStore : public KnowledgeStore {
public:
    EpisodicStore(KnowledgeBackend& backend, DeduplicationGate& gate, EpisodicConfig config,
                  std::shared_ptr<SimilarityLookup> lookup)
        : backend_(backend), gate_(gate), records_(backend), config_(config),
          lookup_(std::move(lookup)) {}

    const char* name() const override { return "episodic"; }

    bool load() override {
        if (!records_.load()) return false;
        if (lookup_) {
            for (const auto& r : records_.all()) lookup_->index(r.id.to_string(), episode_text(r));
        }
        return true;
    }

    std::map<std::string, size_t> counts() const override {
        return {{records_.collection(), records_.size()}};
    }

    std::vector<std::string> collections() const override {
        return {records_.collection()};
    }

    IngestResult ingest_json(const std::string& collection, const json& payload,
                             ConfidenceTier tier, const std::string& source) override {
        if (collection != records_.collection()) return detail::unknown_collection(name(), collection);
        EpisodicRecord r;
        try {
            r = payload.get<EpisodicRecord>();
        } catch (const json::exception& e) {
            IngestResult res;
            res.reason = std::string("malformed episodic record: ") + e.what();
            return res;
        }
        if (!payload.contains("confidence")) r.tier = tier;
        if (r.source.empty()) r.source = source;
        return append(std::move(r));
    }

    std::vector<json> query(const std::string& collection,
                            const std::function<bool(const json&)>& filter) const override {
        if (collection != records_.collection()) return {};
        return detail::query_table(records_, filter);
    }

    IngestResult append(EpisodicRecord record) {
        if (!record.id.valid()) record.id = FactId::generate();
        if (record.timestamp == 0) record.timestamp = now();
        record.confidence = clamp01(record.confidence);
        if (record.source.empty()) {
            record.source = record.episode_source == EpisodeSource::HumanCorrection
                                ? "human_correction" : "auto";
        }

        auto result = gate_.ingest(records_, record, "episode");
        if (result.outcome == IngestOutcome::Inserted) {
            if (lookup_) lookup_->index(result.id.to_string(), episode_text(record));
            evict(now());
        }
        return result;
    }

    std::optional<EpisodicRecord> get(const std::string& id) const {
        return records_.get(FactId::from_string(id));
    }

    std::vector<EpisodicRecord> all() const { return records_.all(); }
    size_t size() const { return records_.size(); }

    size_t correction_count() const {
        return records_.scan([](const EpisodicRecord& r) {
            return r.episode_source == EpisodeSource::HumanCorrection;
        }).size();
    }

    // Returns the number of records removed
    size_t evict(Timestamp at) {
        std::lock_guard<std::mutex> lock(evict_mutex_);

        auto all = records_.all();
        const Timestamp max_age = static_cast<Timestamp>(config_.max_age_days) * MS_PER_DAY;

        // Eviction order: expired first, auto before correction, oldest first
        std::sort(all.begin(), all.end(), [&](const EpisodicRecord& a, const EpisodicRecord& b) {
            bool a_expired = at - a.timestamp > max_age;
            bool b_expired = at - b.timestamp > max_age;
            if (a_expired != b_expired) return a_expired;
            if (a.episode_source != b.episode_source) {
                return a.episode_source == EpisodeSource::Auto;
            }
            return a.timestamp < b.timestamp;
        });

        size_t remaining = all.size();
        WriteBatch batch;
        std::vector<FactId> removed;
        for (const auto& r : all) {
            bool expired = at - r.timestamp > max_age;
            bool over_cap = remaining > config_.max_records;
            if (!expired && !over_cap) break;
            StoredRow row;
            row.id = r.id.to_string();
            batch.push_back(WriteOp{records_.collection(), row, true});
            removed.push_back(r.id);
            --remaining;
        }
        if (removed.empty()) return 0;

        try {
            backend_.apply(batch);
        } catch (const StorageError& e) {
            log_warn("episodic", "eviction deferred: %s", e.what());
            return 0;
        }
        for (const auto& id : removed) {
            records_.remove(id);
            if (lookup_) lookup_->remove(id.to_string());
        }
        log_debug("episodic", "evicted %zu records", removed.size());
        return removed.size();
    }

    SimilarityLookup* lookup() const { return lookup_.get(); }

private:
    KnowledgeBackend& backend_;
    DeduplicationGate& gate_;
    FactTable<EpisodicRecord> records_;
    EpisodicConfig config_;
    std::shared_ptr<SimilarityLookup> lookup_;
    std::mutex evict_mutex_;
};

} // namespace assetmind
