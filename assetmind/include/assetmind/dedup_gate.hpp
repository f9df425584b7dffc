#pragma once
// Deduplication Gate: the only write path into any partition
//
// ingest(candidate):
//   1. validate identity fields            -> rejected, nothing written
//   2. same fingerprint already stored     -> duplicate, existing id returned
//   3. no identity-key collision           -> inserted
//   4. collision without contradiction     -> updated (refinement)
//   5. collision with contradiction        -> ConflictRecord, then
//      decide_resolution(existing, candidate) picks updated / rejected /
//      queued for human review
//
// Writes are serialized per identity key. The backend batch (fact, conflict
// record, audit entry) lands before the in-memory table publishes the fact.

#include "backend.hpp"
#include "conflict.hpp"
#include "fact_table.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

enum class IngestOutcome : uint8_t {
    Inserted = 0,
    Updated = 1,
    Rejected = 2,
    QueuedForReview = 3,
    Duplicate = 4,          // Identical fact already stored
};

inline const char* ingest_outcome_name(IngestOutcome o) {
    switch (o) {
        case IngestOutcome::Inserted:        return "inserted";
        case IngestOutcome::Updated:         return "updated";
        case IngestOutcome::Rejected:        return "rejected";
        case IngestOutcome::QueuedForReview: return "queued_for_review";
        case IngestOutcome::Duplicate:       return "duplicate";
    }
    return "rejected";
}

struct IngestResult {
    IngestOutcome outcome = IngestOutcome::Rejected;
    FactId id;                          // Stored fact (new, updated or kept)
    std::string reason;
    std::optional<FactId> conflict_id;  // Set when a contradiction was recorded

    bool stored() const {
        return outcome == IngestOutcome::Inserted || outcome == IngestOutcome::Updated ||
               outcome == IngestOutcome::Duplicate;
    }
};

// One line of the mutation history
struct AuditEntry {
    FactId id;
    Timestamp at = 0;
    std::string collection;
    std::string identity_key;
    FactId fact_id;
    std::string action;        // inserted, updated, resolved_updated, resolved_rejected
    std::string rationale;
    json previous;             // Null on insert
    json current;
};

inline void to_json(json& j, const AuditEntry& a) {
    j = json{
        {"id", a.id.to_string()},
        {"at", a.at},
        {"collection", a.collection},
        {"identity_key", a.identity_key},
        {"fact_id", a.fact_id.to_string()},
        {"action", a.action},
        {"rationale", a.rationale},
        {"previous", a.previous},
        {"current", a.current},
    };
}

inline void from_json(const json& j, AuditEntry& a) {
    a.id = FactId::from_string(j.value("id", ""));
    a.at = j.value("at", Timestamp(0));
    a.collection = j.value("collection", "");
    a.identity_key = j.value("identity_key", "");
    a.fact_id = FactId::from_string(j.value("fact_id", ""));
    a.action = j.value("action", "");
    a.rationale = j.value("rationale", "");
    a.previous = j.value("previous", json());
    a.current = j.value("current", json());
}

// Per-key mutual exclusion. Slots live only while someone holds or waits.
class KeyedLocks {
public:
    class Guard {
    public:
        Guard(KeyedLocks* owner, std::string key, std::mutex* m)
            : owner_(owner), key_(std::move(key)), m_(m) {}
        Guard(Guard&& other) noexcept
            : owner_(other.owner_), key_(std::move(other.key_)), m_(other.m_) {
            other.owner_ = nullptr;
            other.m_ = nullptr;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;
        ~Guard() {
            if (m_) {
                m_->unlock();
                owner_->release(key_);
            }
        }
    private:
        KeyedLocks* owner_;
        std::string key_;
        std::mutex* m_;
    };

    Guard lock(const std::string& key) {
        std::mutex* m;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& slot = slots_[key];
            if (!slot) slot = std::make_unique<Slot>();
            slot->users++;
            m = &slot->m;
        }
        m->lock();
        return Guard(this, key, m);
    }

    size_t active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

private:
    struct Slot {
        std::mutex m;
        size_t users = 0;
    };

    void release(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end() && --it->second->users == 0) {
            slots_.erase(it);
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

constexpr const char* AUDIT_COLLECTION = "audit";
constexpr const char* CONFLICT_COLLECTION = "conflicts";

class DeduplicationGate {
public:
    DeduplicationGate(KnowledgeBackend& backend, ConflictLedger& ledger, int margin = 1)
        : backend_(backend), ledger_(ledger), margin_(margin) {}

    DeduplicationGate(const DeduplicationGate&) = delete;
    DeduplicationGate& operator=(const DeduplicationGate&) = delete;

    int margin() const { return margin_; }

    // Make a table's pending conflicts resolvable by a human. check runs on
    // a candidate the human accepts; a non-empty message refuses it and the
    // conflict stays pending. guard, if set, is held around check and write.
    template<typename T>
    void register_table(FactTable<T>& table,
                        std::function<std::string(const T&)> check = nullptr,
                        std::mutex* guard = nullptr) {
        std::lock_guard<std::mutex> lock(appliers_mutex_);
        appliers_[FactTraits<T>::collection] = [this, &table, check, guard](
                const ConflictRecord& rec, Resolution resolution, std::string& error) {
            std::unique_lock<std::mutex> outer;
            if (guard) outer = std::unique_lock<std::mutex>(*guard);
            return apply_resolution(table, rec, resolution, check, error);
        };
    }

    template<typename T>
    IngestResult ingest(FactTable<T>& table, T candidate, const std::string& rationale = "") {
        using Traits = FactTraits<T>;
        IngestResult result;

        std::string err = Traits::validate(candidate);
        if (!err.empty()) {
            result.outcome = IngestOutcome::Rejected;
            result.reason = err;
            log_info("gate", "rejected %s candidate: %s", Traits::collection, err.c_str());
            return result;
        }

        const std::string key = Traits::identity_key(candidate);
        auto guard = locks_.lock(std::string(Traits::collection) + ":" + key);
        return ingest_locked(table, std::move(candidate), rationale);
    }

    // Read-modify-write under the key lock. build() receives the current
    // fact (if any) and returns the candidate, or nullopt to abandon, so
    // concurrent learners of the same fact never lose each other's updates.
    template<typename T, typename Build>
    IngestResult ingest_update(FactTable<T>& table, const std::string& key, Build build,
                               const std::string& rationale = "") {
        using Traits = FactTraits<T>;
        auto guard = locks_.lock(std::string(Traits::collection) + ":" + key);
        std::optional<T> current = table.find_by_key(key);
        std::optional<T> candidate = build(current);
        IngestResult result;
        if (!candidate) {
            result.outcome = IngestOutcome::Rejected;
            result.reason = "nothing to update for " + key;
            return result;
        }
        if (Traits::identity_key(*candidate) != key) {
            result.outcome = IngestOutcome::Rejected;
            result.reason = "update changed the identity key";
            return result;
        }
        return ingest_locked(table, std::move(*candidate), rationale);
    }

    // Human decision on a pending conflict. Accepts updated or rejected.
    bool resolve_conflict(const FactId& id, Resolution resolution, std::string& error) {
        if (resolution != Resolution::Updated && resolution != Resolution::Rejected) {
            error = "resolution must be 'updated' or 'rejected'";
            return false;
        }
        auto rec = ledger_.get(id);
        if (!rec) {
            error = "conflict not found: " + id.to_string();
            return false;
        }
        if (rec->resolution != Resolution::Pending) {
            error = std::string("conflict already resolved: ") + resolution_name(rec->resolution);
            return false;
        }

        std::function<bool(const ConflictRecord&, Resolution, std::string&)> applier;
        {
            std::lock_guard<std::mutex> lock(appliers_mutex_);
            auto it = appliers_.find(rec->collection);
            if (it == appliers_.end()) {
                error = "no store registered for collection " + rec->collection;
                return false;
            }
            applier = it->second;
        }
        if (!applier(*rec, resolution, error)) {
            if (error.empty()) error = "conflict was resolved concurrently";
            return false;
        }
        return true;
    }

    // Rebuild the conflict ledger from the backend
    bool load() {
        std::vector<StoredRow> rows;
        try {
            rows = backend_.scan(CONFLICT_COLLECTION);
        } catch (const StorageError& e) {
            log_warn("gate", "loading conflicts failed: %s", e.what());
            return false;
        }
        for (const auto& row : rows) {
            try {
                ledger_.put(json::parse(row.payload).get<ConflictRecord>());
            } catch (const json::exception& e) {
                log_warn("gate", "skipping corrupt conflict %s: %s", row.id.c_str(), e.what());
            }
        }
        return true;
    }

    // Most recent first
    std::vector<AuditEntry> audit_log(size_t limit = 100) {
        auto rows = backend_.scan(AUDIT_COLLECTION);
        std::stable_sort(rows.begin(), rows.end(), [](const StoredRow& a, const StoredRow& b) {
            return a.updated_at < b.updated_at;
        });
        std::vector<AuditEntry> out;
        for (auto it = rows.rbegin(); it != rows.rend() && out.size() < limit; ++it) {
            try {
                out.push_back(json::parse(it->payload).get<AuditEntry>());
            } catch (const json::exception& e) {
                log_warn("gate", "skipping corrupt audit row %s: %s", it->id.c_str(), e.what());
            }
        }
        return out;
    }

    size_t audit_count() { return backend_.count(AUDIT_COLLECTION); }

    ConflictLedger& ledger() { return ledger_; }

private:
    template<typename T>
    IngestResult ingest_locked(FactTable<T>& table, T candidate, const std::string& rationale) {
        using Traits = FactTraits<T>;
        IngestResult result;

        std::string err = Traits::validate(candidate);
        if (!err.empty()) {
            result.outcome = IngestOutcome::Rejected;
            result.reason = err;
            log_info("gate", "rejected %s candidate: %s", Traits::collection, err.c_str());
            return result;
        }
        const std::string key = Traits::identity_key(candidate);

        const std::string fp = fingerprint(Traits::canonical(candidate));
        if (auto dup = table.find_by_fingerprint(fp)) {
            result.outcome = IngestOutcome::Duplicate;
            result.id = dup->id;
            result.reason = "identical fact already stored";
            log_debug("gate", "duplicate %s %s", Traits::collection, key.c_str());
            return result;
        }

        Timestamp ts = now();
        auto existing = table.find_by_key(key);

        if (!existing) {
            if (!candidate.id.valid()) candidate.id = FactId::generate();
            candidate.created_at = ts;
            candidate.updated_at = ts;

            AuditEntry audit = make_audit(Traits::collection, key, candidate.id, "inserted",
                                          rationale.empty() ? "new identity key" : rationale);
            audit.current = json(candidate);

            backend_.apply({fact_op(table, candidate), audit_op(audit)});
            table.commit(candidate);

            result.outcome = IngestOutcome::Inserted;
            result.id = candidate.id;
            log_debug("gate", "inserted %s %s", Traits::collection, key.c_str());
            return result;
        }

        candidate.id = existing->id;
        candidate.created_at = existing->created_at;
        candidate.updated_at = ts;

        auto found = Traits::detect(*existing, candidate);
        if (found.empty()) {
            AuditEntry audit = make_audit(Traits::collection, key, candidate.id, "updated",
                                          rationale.empty() ? "refinement without contradiction" : rationale);
            audit.previous = json(*existing);
            audit.current = json(candidate);

            backend_.apply({fact_op(table, candidate), audit_op(audit)});
            table.commit(candidate);

            result.outcome = IngestOutcome::Updated;
            result.id = candidate.id;
            return result;
        }

        ConflictRecord rec = make_conflict_record(Traits::collection, key, existing->id, found,
                                                  existing->tier, candidate.tier, ts);
        rec.candidate = json(candidate);
        Resolution action = decide_resolution(existing->tier, candidate.tier, margin_);

        WriteBatch batch;
        switch (action) {
            case Resolution::Updated: {
                rec.resolution = Resolution::Updated;
                rec.resolved_at = ts;
                rec.rationale = std::string("candidate confidence ") + tier_name(candidate.tier) +
                                " exceeds existing " + tier_name(existing->tier) +
                                " by more than " + std::to_string(margin_) + " tier(s)";
                AuditEntry audit = make_audit(Traits::collection, key, candidate.id, "updated", rec.rationale);
                audit.previous = json(*existing);
                audit.current = json(candidate);
                batch.push_back(fact_op(table, candidate));
                batch.push_back(audit_op(audit));
                result.outcome = IngestOutcome::Updated;
                break;
            }
            case Resolution::Rejected:
                rec.resolution = Resolution::Rejected;
                rec.resolved_at = ts;
                rec.rationale = std::string("existing confidence ") + tier_name(existing->tier) +
                                " outranks candidate " + tier_name(candidate.tier);
                result.outcome = IngestOutcome::Rejected;
                break;
            default:
                rec.resolution = Resolution::Pending;
                rec.rationale = std::string("confidence ") + tier_name(existing->tier) + " vs " +
                                tier_name(candidate.tier) + " too close to decide; existing stays authoritative";
                result.outcome = IngestOutcome::QueuedForReview;
                break;
        }
        batch.push_back(conflict_op(rec));

        backend_.apply(batch);
        if (result.outcome == IngestOutcome::Updated) table.commit(candidate);
        ledger_.put(rec);

        result.id = existing->id;
        result.conflict_id = rec.id;
        result.reason = rec.rationale;
        log_info("gate", "%s conflict on %s %s (%s): %s",
                 severity_name(rec.severity), Traits::collection, key.c_str(),
                 conflict_type_name(rec.type), resolution_name(rec.resolution));
        return result;
    }

    template<typename T>
    bool apply_resolution(FactTable<T>& table, const ConflictRecord& pending, Resolution resolution,
                          const std::function<std::string(const T&)>& check, std::string& error) {
        using Traits = FactTraits<T>;
        auto guard = locks_.lock(pending.collection + ":" + pending.identity_key);

        auto latest = ledger_.get(pending.id);
        if (!latest || latest->resolution != Resolution::Pending) return false;

        ConflictRecord rec = pending;
        Timestamp ts = now();
        rec.resolution = resolution;
        rec.resolved_at = ts;
        rec.resolved_by_human = true;

        WriteBatch batch;
        std::optional<T> accepted;
        if (resolution == Resolution::Updated) {
            T candidate = rec.candidate.get<T>();
            auto existing = table.find_by_key(pending.identity_key);
            candidate.id = existing ? existing->id : pending.existing_id;
            candidate.updated_at = ts;
            if (check) {
                std::string refused = check(candidate);
                if (!refused.empty()) {
                    error = "candidate no longer acceptable: " + refused;
                    log_info("gate", "conflict %s stays pending: %s",
                             rec.id.to_string().c_str(), refused.c_str());
                    return false;
                }
            }
            rec.rationale = "human accepted candidate";

            AuditEntry audit = make_audit(Traits::collection, pending.identity_key, candidate.id,
                                          "resolved_updated", rec.rationale);
            if (existing) audit.previous = json(*existing);
            audit.current = json(candidate);
            batch.push_back(fact_op(table, candidate));
            batch.push_back(audit_op(audit));
            accepted = candidate;
        } else {
            rec.rationale = "human kept existing fact";
            AuditEntry audit = make_audit(Traits::collection, pending.identity_key, pending.existing_id,
                                          "resolved_rejected", rec.rationale);
            batch.push_back(audit_op(audit));
        }
        batch.push_back(conflict_op(rec));

        backend_.apply(batch);
        if (accepted) table.commit(*accepted);
        ledger_.put(rec);
        log_info("gate", "conflict %s resolved by human: %s",
                 rec.id.to_string().c_str(), resolution_name(resolution));
        return true;
    }

    template<typename T>
    static WriteOp fact_op(FactTable<T>& table, const T& fact) {
        return WriteOp{table.collection(), FactTable<T>::to_row(fact), false};
    }

    static AuditEntry make_audit(const std::string& collection, const std::string& key,
                                 const FactId& fact_id, const std::string& action,
                                 const std::string& rationale) {
        AuditEntry a;
        a.id = FactId::generate();
        a.at = now();
        a.collection = collection;
        a.identity_key = key;
        a.fact_id = fact_id;
        a.action = action;
        a.rationale = rationale;
        return a;
    }

    static WriteOp audit_op(const AuditEntry& a) {
        StoredRow row;
        row.id = a.id.to_string();
        row.key = a.collection + ":" + a.identity_key;
        row.fingerprint = a.action;
        row.payload = json(a).dump();
        row.updated_at = a.at;
        return WriteOp{AUDIT_COLLECTION, row, false};
    }

    static WriteOp conflict_op(const ConflictRecord& rec) {
        StoredRow row;
        row.id = rec.id.to_string();
        row.key = rec.collection + ":" + rec.identity_key;
        row.fingerprint = resolution_name(rec.resolution);
        row.payload = json(rec).dump();
        row.updated_at = rec.resolved_at ? rec.resolved_at : rec.detected_at;
        return WriteOp{CONFLICT_COLLECTION, row, false};
    }

    KnowledgeBackend& backend_;
    ConflictLedger& ledger_;
    int margin_;
    KeyedLocks locks_;

    std::mutex appliers_mutex_;
    std::unordered_map<std::string,
                       std::function<bool(const ConflictRecord&, Resolution, std::string&)>> appliers_;
};

} // namespace assetmind
