#pragma once
// Engine: the routing service in one object
//
// Owns the backend, the deduplication gate and the four partitions, and
// drives one attachment through:
//   scan -> similar episodes -> sender -> assets -> categories -> file type
//   -> route -> (cancel check) -> store or queue for review -> learn
// Scoring only reads. Every write happens after a full decision exists,
// so a cancelled or failed request leaves the stores untouched.

#include "asset_identifier.hpp"
#include "backend.hpp"
#include "bootstrap.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "contact_store.hpp"
#include "dedup_gate.hpp"
#include "document_classifier.hpp"
#include "episodic_store.hpp"
#include "log.hpp"
#include "procedural_store.hpp"
#include "review_queue.hpp"
#include "routing.hpp"
#include "semantic_store.hpp"
#include "similarity.hpp"
#include "sqlite_backend.hpp"
#include "worker_pool.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

// Set from any thread; checked before the first write
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct ReviewResolution {
    ReviewOutcome action = ReviewOutcome::Stored;
    std::string asset_id;          // Empty keeps the suggestion
    std::string category;          // Empty keeps the suggestion
    bool trust_sender = false;     // Learn sender -> asset with high trust
};

struct KnowledgeStats {
    std::map<std::string, size_t> collections;
    size_t conflicts_total = 0;
    size_t conflicts_pending = 0;
    size_t reviews_pending = 0;
    size_t reviews_total = 0;
    size_t corrections = 0;
    size_t audit_entries = 0;
};

inline json stats_to_json(const KnowledgeStats& s) {
    return {
        {"collections", s.collections},
        {"conflicts", {{"total", s.conflicts_total}, {"pending", s.conflicts_pending}}},
        {"reviews", {{"total", s.reviews_total}, {"pending", s.reviews_pending}}},
        {"human_corrections", s.corrections},
        {"audit_entries", s.audit_entries},
    };
}

// Empty path or ":memory:" keeps everything in process
inline std::unique_ptr<KnowledgeBackend> make_backend(const EngineConfig& config) {
    if (config.db_path.empty() || config.db_path == ":memory:") {
        return std::make_unique<MemoryBackend>();
    }
    return std::make_unique<SqliteBackend>(config.db_path);
}

class Engine {
public:
    Engine(EngineConfig config,
           std::unique_ptr<KnowledgeBackend> backend,
           std::shared_ptr<DocumentSink> sink,
           std::shared_ptr<SecurityScanner> scanner = nullptr,
           std::shared_ptr<SimilarityLookup> lookup = nullptr)
        : config_(std::move(config))
        , backend_(std::move(backend))
        , sink_(std::move(sink))
        , scanner_(scanner ? std::move(scanner) : std::make_shared<PassThroughScanner>())
        , lookup_(lookup ? std::move(lookup) : std::make_shared<TermVectorIndex>())
        , gate_(*backend_, ledger_, config_.conflict_margin)
        , semantic_(*backend_, gate_, config_.file_type_min_outcomes)
        , procedural_(*backend_, gate_, config_)
        , episodic_(*backend_, gate_, config_.episodic, lookup_)
        , contacts_(*backend_, gate_)
        , reviews_(*backend_)
        , gateway_(lookup_, config_.concurrency.similarity_timeout_ms,
                   config_.concurrency.similarity_workers, config_.concurrency.max_pending_lookups)
        , identifier_(config_.matching, config_.relevance_keywords)
        , classifier_(config_.classifier)
        , router_(config_.thresholds)
        , email_pool_(config_.concurrency.max_concurrent_emails)
        , attachment_pool_(config_.concurrency.max_concurrent_emails *
                           config_.concurrency.max_concurrent_attachments)
    {}

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Open the backend and rebuild every in-memory index
    bool open() {
        if (!backend_->open()) {
            log_warn("engine", "cannot open knowledge backend");
            return false;
        }
        if (!gate_.load()) return false;
        for (KnowledgeStore* store : stores()) {
            if (!store->load()) {
                log_warn("engine", "loading %s store failed", store->name());
                return false;
            }
        }
        if (!reviews_.load()) return false;

        log_info("engine", "ready: %zu assets, %zu episodes, %zu pending conflicts, %zu pending reviews",
                 semantic_.assets().size(), episodic_.size(), ledger_.pending_count(),
                 reviews_.pending_count());
        return true;
    }

    void close() { backend_->close(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Bootstrap
    // ═══════════════════════════════════════════════════════════════════════

    BootstrapReport bootstrap(const json& doc) {
        KnowledgeBootstrap loader(*backend_, stores());
        return loader.load(doc);
    }

    bool bootstrap_file(const std::string& path, BootstrapReport& report) {
        KnowledgeBootstrap loader(*backend_, stores());
        return loader.load_file(path, report);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Classification
    // ═══════════════════════════════════════════════════════════════════════

    // Throws StorageError if a write fails; the stores stay consistent.
    RoutingDecision classify_attachment(const Email& email, const Attachment& attachment,
                                        const CancelToken* cancel = nullptr) {
        RoutingDecision decision;

        ScanResult scan = scanner_->scan(attachment);
        if (!scan.clean) {
            decision.filename = attachment.filename;
            decision.state = RoutingState::Quarantined;
            decision.rationale.push_back("security threat: " + scan.threat);
            log_warn("engine", "quarantined %s: %s", attachment.filename.c_str(), scan.threat.c_str());
            return decision;
        }

        const std::string excerpt = make_excerpt(email);

        // Similar past episodes, bounded by the gateway timeout
        EpisodicRecord sample;
        sample.filename = attachment.filename;
        sample.excerpt = excerpt;
        SimilarityResult similar = gateway_.query(episode_text(sample),
                                                  config_.matching.episodic_neighbors);
        std::vector<EpisodeEvidence> evidence;
        for (const auto& hit : similar.hits) {
            if (auto rec = episodic_.get(hit.record_id)) {
                evidence.push_back({*rec, hit.similarity});
            }
        }

        auto sender = contacts_.lookup(email.sender);
        const bool trusted = sender && sender->trust_score >= config_.matching.sender_trust_floor;

        IdentifyInput id_input{email.sender, email.subject, email.body, attachment.filename};
        auto candidates = identifier_.identify(id_input, semantic_.assets(), sender, evidence);

        AssetType type = candidates.empty() ? AssetType::Unknown : candidates.front().asset_type;
        bool known_type = false;
        auto allowed = semantic_.allowed_categories(type, &known_type);
        if (!candidates.empty() && !known_type) {
            log_info("engine", "unknown asset type for %s; using general categories",
                     candidates.front().asset_id.c_str());
        }

        ClassifyInput cls_input{asset_type_name(type), attachment.filename, email.subject,
                                email.body, trusted};
        auto classification = classifier_.classify(cls_input, allowed,
                                                   procedural_.patterns_for(asset_type_name(type)),
                                                   evidence);

        auto file_check = semantic_.validate_file_type(attachment.filename, asset_type_name(type),
                                                       classification.category);

        decision = router_.route(candidates, classification, file_check);
        decision.filename = attachment.filename;
        if (!candidates.empty() && !known_type) {
            decision.rationale.push_back("unknown asset type; general categories used");
        }
        if (similar.degraded) {
            decision.degraded = true;
            decision.rationale.push_back("similarity unavailable: " + similar.reason);
        }

        if (cancel && cancel->cancelled()) {
            decision.state = RoutingState::Cancelled;
            decision.review_reason = ReviewReason::None;
            decision.needs_confirmation = false;
            decision.rationale.push_back("cancelled before any write");
            log_debug("engine", "cancelled %s", attachment.filename.c_str());
            return decision;
        }

        if (is_stored_state(decision.state)) {
            commit_stored(attachment, excerpt, decision);
        } else {
            commit_review(email, attachment, excerpt, decision);
        }

        log_debug("engine", "%s -> %s (%s/%s, %.2f)", attachment.filename.c_str(),
                  routing_state_name(decision.state), decision.asset_id.c_str(),
                  decision.category.c_str(), decision.confidence);
        return decision;
    }

    // Attachments of one email, at most max_concurrent_attachments at a time.
    // A storage failure marks only the affected attachment.
    std::vector<RoutingDecision> process_email(const Email& email, const CancelToken* cancel = nullptr) {
        const size_t n = email.attachments.size();
        const size_t width = std::max<size_t>(1, config_.concurrency.max_concurrent_attachments);
        std::vector<RoutingDecision> out(n);

        for (size_t start = 0; start < n; start += width) {
            size_t end = std::min(n, start + width);
            std::vector<std::future<RoutingDecision>> futures;
            for (size_t i = start; i < end; ++i) {
                futures.push_back(attachment_pool_.submit([this, &email, i, cancel]() {
                    return classify_guarded(email, email.attachments[i], cancel);
                }));
            }
            for (size_t i = start; i < end; ++i) out[i] = futures[i - start].get();
        }
        return out;
    }

    std::vector<std::vector<RoutingDecision>> process_batch(const std::vector<Email>& emails,
                                                            const CancelToken* cancel = nullptr) {
        std::vector<std::future<std::vector<RoutingDecision>>> futures;
        futures.reserve(emails.size());
        for (const auto& email : emails) {
            futures.push_back(email_pool_.submit([this, &email, cancel]() {
                return process_email(email, cancel);
            }));
        }
        std::vector<std::vector<RoutingDecision>> out;
        out.reserve(emails.size());
        for (auto& f : futures) out.push_back(f.get());
        return out;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Human input
    // ═══════════════════════════════════════════════════════════════════════

    // Stores the correction as a fact and as a human_correction episode
    IngestResult record_feedback(const std::string& filename, const std::string& context,
                                 const std::string& corrected_category,
                                 const std::string& corrected_asset) {
        std::string asset_type;
        if (!corrected_asset.empty()) {
            auto asset = semantic_.asset(corrected_asset);
            if (!asset) {
                IngestResult r;
                r.outcome = IngestOutcome::Rejected;
                r.reason = "unknown asset: " + corrected_asset;
                return r;
            }
            asset_type = asset_type_name(asset->asset_type);
        }

        FeedbackRecord fb;
        fb.filename = filename;
        fb.context = context;
        fb.corrected_category = normalize(corrected_category);
        fb.corrected_asset = corrected_asset;
        auto result = semantic_.add_feedback(fb);
        if (!result.stored()) return result;

        EpisodicRecord rec;
        rec.filename = filename;
        rec.excerpt = context;
        rec.predicted_category = normalize(corrected_category);
        rec.asset_type = asset_type;
        rec.asset_id = corrected_asset;
        rec.confidence = 1.0f;
        rec.episode_source = EpisodeSource::HumanCorrection;
        auto episode = episodic_.append(rec);
        if (!episode.stored()) {
            log_warn("engine", "feedback episode not stored: %s", episode.reason.c_str());
        }
        log_info("engine", "feedback on %s: %s / %s", filename.c_str(),
                 corrected_asset.c_str(), corrected_category.c_str());
        return result;
    }

    std::vector<ConflictRecord> get_pending_conflicts() const { return ledger_.get_pending(); }

    bool resolve_conflict(const std::string& id, Resolution resolution, std::string& error) {
        FactId fid = FactId::from_string(id);
        if (!fid.valid()) {
            error = "invalid conflict id: " + id;
            return false;
        }
        return gate_.resolve_conflict(fid, resolution, error);
    }

    std::vector<ReviewItem> pending_reviews(ReviewReason reason = ReviewReason::None) const {
        return reviews_.get_pending(reason);
    }

    // Stores or discards the parked document; always leaves a
    // human_correction episode behind. The document and the review item
    // move together: a failed commit puts the document back, so the call
    // can be retried.
    bool resolve_review(const std::string& id, const ReviewResolution& resolution, std::string& error) {
        std::lock_guard<std::mutex> lock(review_mutex_);

        FactId rid = FactId::from_string(id);
        std::optional<ReviewItem> item;
        if (rid.valid()) item = reviews_.get(rid);
        if (!item) {
            error = "review item not found: " + id;
            return false;
        }
        if (item->status != ReviewStatus::Pending) {
            error = "review item already resolved";
            return false;
        }

        std::string asset_id, category, path, asset_type;
        if (resolution.action == ReviewOutcome::Stored) {
            asset_id = resolution.asset_id.empty() ? item->suggested_asset : resolution.asset_id;
            category = normalize(resolution.category.empty() ? item->suggested_category
                                                             : resolution.category);
            if (asset_id.empty() || category.empty()) {
                error = "asset and category are required to store";
                return false;
            }
            auto asset = semantic_.asset(asset_id);
            if (!asset) {
                error = "unknown asset: " + asset_id;
                return false;
            }
            asset_type = asset_type_name(asset->asset_type);
            if (!store_reviewed(*item, asset_id, category, path, error)) return false;
        } else if (resolution.action == ReviewOutcome::Discarded) {
            // The item is closed first; a discard cannot fail
            if (!reviews_.resolve(rid, resolution.action, "", "", "", error)) return false;
            if (!item->document_ref.empty()) sink_->discard(item->document_ref);
        } else {
            error = "resolution must be 'store' or 'discard'";
            return false;
        }
        log_info("engine", "review %s resolved: %s", id.c_str(), review_outcome_name(resolution.action));

        // The decision is committed; what follows only teaches the stores
        try {
            learn_from_review(*item, resolution, asset_id, asset_type, category);
        } catch (const StorageError& e) {
            log_warn("engine", "review %s resolved but not learned: %s", id.c_str(), e.what());
        }
        return true;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Introspection
    // ═══════════════════════════════════════════════════════════════════════

    KnowledgeStats get_knowledge_stats() {
        KnowledgeStats s;
        for (KnowledgeStore* store : stores()) {
            for (const auto& [collection, n] : store->counts()) s.collections[collection] = n;
        }
        s.conflicts_total = ledger_.size();
        s.conflicts_pending = ledger_.pending_count();
        auto rs = reviews_.stats();
        s.reviews_pending = rs.pending;
        s.reviews_total = reviews_.total_count();
        s.corrections = episodic_.correction_count();
        s.audit_entries = gate_.audit_count();
        return s;
    }

    std::vector<AuditEntry> audit_log(size_t limit = 100) { return gate_.audit_log(limit); }

    const EngineConfig& config() const { return config_; }
    KnowledgeBackend& backend() { return *backend_; }
    DeduplicationGate& gate() { return gate_; }
    SemanticStore& semantic() { return semantic_; }
    ProceduralStore& procedural() { return procedural_; }
    EpisodicStore& episodic() { return episodic_; }
    ContactStore& contacts() { return contacts_; }
    ReviewQueue& reviews() { return reviews_; }

private:
    std::vector<KnowledgeStore*> stores() {
        return {&semantic_, &procedural_, &episodic_, &contacts_};
    }

    static std::string make_excerpt(const Email& email) {
        constexpr size_t BODY_EXCERPT = 200;
        std::string body = email.body.substr(0, std::min(email.body.size(), BODY_EXCERPT));
        return trim(email.subject + " " + body);
    }

    RoutingDecision classify_guarded(const Email& email, const Attachment& attachment,
                                     const CancelToken* cancel) {
        try {
            return classify_attachment(email, attachment, cancel);
        } catch (const StorageError& e) {
            RoutingDecision d;
            d.filename = attachment.filename;
            d.state = RoutingState::GeneralReview;
            d.error = e.what();
            d.rationale.push_back(std::string("storage unavailable: ") + e.what());
            log_warn("engine", "%s failed: %s", attachment.filename.c_str(), e.what());
            return d;
        }
    }

    // File the document, then write what was learned. A failed write takes
    // the document back out, so a retry files it once.
    void commit_stored(const Attachment& attachment, const std::string& excerpt,
                       RoutingDecision& decision) {
        try {
            decision.stored_path = sink_->store(decision.asset_id, decision.category, attachment);
        } catch (const StorageError&) {
            learn_file_type_logged(attachment.filename, false);
            throw;
        }

        EpisodicRecord rec;
        rec.filename = attachment.filename;
        rec.excerpt = excerpt;
        rec.predicted_category = decision.category;
        rec.asset_type = decision.asset_type;
        rec.asset_id = decision.asset_id;
        rec.confidence = decision.confidence;
        rec.episode_source = EpisodeSource::Auto;
        try {
            learn_file_type(attachment.filename, true, decision.asset_type, decision.category);
            auto episode = episodic_.append(rec);
            if (!episode.stored()) {
                log_warn("engine", "episode for %s not stored: %s", attachment.filename.c_str(),
                         episode.reason.c_str());
            }
        } catch (const StorageError&) {
            sink_->discard(decision.stored_path);
            decision.stored_path.clear();
            throw;
        }
    }

    void commit_review(const Email& email, const Attachment& attachment, const std::string& excerpt,
                       RoutingDecision& decision) {
        ReviewItem item;
        item.filename = attachment.filename;
        item.sender = normalize_email(email.sender);
        item.subject = email.subject;
        item.excerpt = excerpt;
        item.reason = decision.review_reason;
        item.bucket = decision.state == RoutingState::AssetReview ? decision.asset_id : GENERAL_BUCKET;
        item.suggested_asset = decision.asset_id;
        item.suggested_category = decision.category;
        item.asset_type = decision.asset_type;
        item.confidence = decision.confidence;
        item.rationale = decision.rationale;
        const std::string parked = sink_->park(item.bucket, attachment);
        item.document_ref = parked;

        try {
            item = reviews_.enqueue(std::move(item));
        } catch (const StorageError&) {
            sink_->discard(parked);
            throw;
        }
        decision.review_id = item.id.to_string();
    }

    // Relocate, then commit the item; a failed commit moves the document back
    bool store_reviewed(const ReviewItem& item, const std::string& asset_id,
                        const std::string& category, std::string& path, std::string& error) {
        if (item.document_ref.empty()) {
            return reviews_.resolve(item.id, ReviewOutcome::Stored, asset_id, category, "", error);
        }
        path = sink_->relocate(item.document_ref, asset_id, category);
        bool resolved = false;
        try {
            resolved = reviews_.resolve(item.id, ReviewOutcome::Stored, asset_id, category, path, error);
        } catch (const StorageError&) {
            sink_->restore(path, item.document_ref);
            throw;
        }
        if (!resolved) sink_->restore(path, item.document_ref);
        return resolved;
    }

    void learn_from_review(const ReviewItem& item, const ReviewResolution& resolution,
                           const std::string& asset_id, const std::string& asset_type,
                           const std::string& category) {
        EpisodicRecord rec;
        rec.filename = item.filename;
        rec.excerpt = item.excerpt;
        rec.predicted_category = category;
        rec.asset_type = asset_type;
        rec.asset_id = asset_id;
        rec.confidence = 1.0f;
        rec.episode_source = EpisodeSource::HumanCorrection;
        auto episode = episodic_.append(rec);
        if (!episode.stored()) {
            log_warn("engine", "review episode not stored: %s", episode.reason.c_str());
        }

        if (resolution.action != ReviewOutcome::Stored) {
            learn_file_type(item.filename, false);
            return;
        }
        learn_file_type(item.filename, true, asset_type, category);
        if (resolution.trust_sender && !item.sender.empty()) {
            auto learned = contacts_.associate(item.sender, asset_id, "", 0.8f);
            if (!learned.stored()) {
                log_info("engine", "sender %s not associated: %s", item.sender.c_str(),
                         learned.reason.c_str());
            }
        }
    }

    // Throws StorageError
    void learn_file_type(const std::string& filename, bool success,
                         const std::string& asset_type = "", const std::string& category = "") {
        const std::string ext = extension_of(filename);
        if (ext.empty()) return;
        auto learned = semantic_.learn_file_type_outcome(ext, success, asset_type, category);
        if (!learned.stored()) {
            log_debug("engine", "file type %s not learned: %s", ext.c_str(), learned.reason.c_str());
        }
    }

    // For failure paths that are already reporting a storage error
    void learn_file_type_logged(const std::string& filename, bool success) {
        try {
            learn_file_type(filename, success);
        } catch (const StorageError& e) {
            log_warn("engine", "file type outcome for %s not learned: %s", filename.c_str(), e.what());
        }
    }

    EngineConfig config_;
    std::unique_ptr<KnowledgeBackend> backend_;
    std::shared_ptr<DocumentSink> sink_;
    std::shared_ptr<SecurityScanner> scanner_;
    std::shared_ptr<SimilarityLookup> lookup_;

    ConflictLedger ledger_;
    DeduplicationGate gate_;
    SemanticStore semantic_;
    ProceduralStore procedural_;
    EpisodicStore episodic_;
    ContactStore contacts_;
    ReviewQueue reviews_;

    SimilarityGateway gateway_;
    AssetIdentifier identifier_;
    DocumentClassifier classifier_;
    Router router_;

    std::mutex review_mutex_;

    // Declared last so workers stop before the stores go away
    WorkerPool email_pool_;
    WorkerPool attachment_pool_;
};

} // namespace assetmind
