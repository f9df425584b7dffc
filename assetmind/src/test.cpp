#include <assetmind/assetmind.hpp>
#include <assetmind/rpc/handler.hpp>
#include <iostream>
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <future>
#include <mutex>
#include <thread>

using namespace assetmind;

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════════════

EngineConfig test_config() {
    EngineConfig c;
    c.db_path = ":memory:";
    c.concurrency.similarity_timeout_ms = 2000;
    return c;
}

json sample_knowledge() {
    return {
        {"assets", json::array({
            {{"asset_id", "I3"}, {"deal_name", "I3 Verticals"}, {"asset_type", "private_credit"},
             {"identifiers", json::array({"i3", "i3 verticals", "verticals"})}},
            {{"asset_id", "HARBOR"}, {"asset_name", "Harbor Point Tower"},
             {"asset_type", "commercial_real_estate"},
             {"identifiers", json::array({"harbor point", "harbor tower"})}},
        })},
        {"file_types", {
            {"safe", {{".pdf", json::object()}, {".xlsx", json::object()}}},
            {"dangerous", {{".exe", json::object()}}},
        }},
        {"patterns", json::array({
            {{"asset_type", "private_credit"}, {"category", "loan_documents"},
             {"pattern", "(rlv|trm)_.*_td"}},
            {{"asset_type", "commercial_real_estate"}, {"category", "rent_roll"},
             {"pattern", "rent.?roll"}, {"weight", 0.3}},
        })},
        {"rules", json::array({
            {{"subject", "pdf attachments"}, {"statement", "pdf attachments must be scanned"}},
        })},
        {"senders", json::array({
            {{"sender", "ops@i3verticals.com"}, {"asset_ids", json::array({"I3"})},
             {"trust_score", 0.9}, {"organization", "I3 Verticals"}},
        })},
    };
}

struct Harness {
    MemoryBackend* backend = nullptr;
    std::shared_ptr<MemorySink> sink;
    std::unique_ptr<Engine> engine;
};

Harness make_harness(EngineConfig config = test_config(),
                     std::shared_ptr<SecurityScanner> scanner = nullptr,
                     std::shared_ptr<SimilarityLookup> lookup = nullptr) {
    Harness h;
    auto backend = std::make_unique<MemoryBackend>();
    h.backend = backend.get();
    h.sink = std::make_shared<MemorySink>();
    h.engine = std::make_unique<Engine>(config, std::move(backend), h.sink, scanner, lookup);
    assert(h.engine->open());
    return h;
}

Harness seeded_harness(EngineConfig config = test_config(),
                       std::shared_ptr<SecurityScanner> scanner = nullptr,
                       std::shared_ptr<SimilarityLookup> lookup = nullptr) {
    Harness h = make_harness(config, scanner, lookup);
    auto report = h.engine->bootstrap(sample_knowledge());
    assert(report.status == "loaded");
    return h;
}

Email i3_email() {
    Email e;
    e.id = "m-1";
    e.sender = "ops@i3verticals.com";
    e.subject = "Term loan docs";
    e.body = "Please find the signed documents.";
    e.attachments.push_back({"RLV_TRM_i3_TD.pdf", "%PDF-1.4"});
    return e;
}

Email unmatched_email() {
    Email e;
    e.id = "m-2";
    e.sender = "someone@example.com";
    e.subject = "Misc";
    e.body = "see attached";
    e.attachments.push_back({"notes.pdf", "%PDF-1.4"});
    return e;
}

class ThreatScanner : public SecurityScanner {
public:
    ScanResult scan(const Attachment& attachment) override {
        ScanResult r;
        if (attachment.bytes.find("EICAR") != std::string::npos) {
            r.clean = false;
            r.threat = "eicar test signature";
        }
        return r;
    }
};

class SlowLookup : public SimilarityLookup {
public:
    std::vector<SimilarHit> nearest(const std::string&, size_t) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return {};
    }
    void index(const std::string&, const std::string&) override {}
    void remove(const std::string&) override {}
};

// Blocks every lookup until released
class StuckLookup : public SimilarityLookup {
public:
    std::vector<SimilarHit> nearest(const std::string&, size_t) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return released_; });
        return {};
    }
    void index(const std::string&, const std::string&) override {}
    void remove(const std::string&) override {}

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
};

// Refuses every accepted document
class FullDiskSink : public MemorySink {
public:
    std::string store(const std::string&, const std::string&, const Attachment& attachment) override {
        throw StorageError("no space left for " + attachment.filename);
    }
};

bool listed(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

// ═══════════════════════════════════════════════════════════════════════════
// Core rules
// ═══════════════════════════════════════════════════════════════════════════

void test_decide_resolution() {
    std::cout << "Testing decide_resolution..." << std::endl;

    assert(decide_resolution(ConfidenceTier::Low, ConfidenceTier::High) == Resolution::Updated);
    assert(decide_resolution(ConfidenceTier::Experimental, ConfidenceTier::Medium) == Resolution::Updated);
    assert(decide_resolution(ConfidenceTier::High, ConfidenceTier::Low) == Resolution::Rejected);
    assert(decide_resolution(ConfidenceTier::Medium, ConfidenceTier::Low) == Resolution::Rejected);
    assert(decide_resolution(ConfidenceTier::Medium, ConfidenceTier::High) == Resolution::HumanReview);
    assert(decide_resolution(ConfidenceTier::High, ConfidenceTier::High) == Resolution::HumanReview);
    assert(decide_resolution(ConfidenceTier::Low, ConfidenceTier::Low) == Resolution::HumanReview);

    // Same inputs, same answer
    for (int i = 0; i < 10; ++i) {
        assert(decide_resolution(ConfidenceTier::Low, ConfidenceTier::High) == Resolution::Updated);
    }

    // A wider margin makes overwrites harder
    assert(decide_resolution(ConfidenceTier::Low, ConfidenceTier::High, 2) == Resolution::HumanReview);
    assert(decide_resolution(ConfidenceTier::Medium, ConfidenceTier::High, 0) == Resolution::Updated);

    std::cout << "  PASS" << std::endl;
}

void test_text_matching() {
    std::cout << "Testing text matching..." << std::endl;

    auto tokens = tokenize("RLV_TRM_i3_TD.pdf");
    assert(tokens.size() == 5);
    assert(tokens[2] == "i3");

    assert(contains_bounded("rlv_trm_i3_td.pdf", "i3"));
    assert(!contains_bounded("ai3x report", "i3"));
    assert(edit_similarity("verticals", "verticals") == 1.0f);
    assert(edit_similarity("verticals", "vertcals") > 0.8f);

    assert(extension_of("Report.PDF") == ".pdf");
    assert(extension_of("noext") == "");
    assert(filename_stem("dir/RLV_TRM_i3_TD.pdf") == "RLV_TRM_i3_TD");

    std::cout << "  PASS" << std::endl;
}

void test_confidence_bands() {
    std::cout << "Testing confidence band boundaries..." << std::endl;

    ThresholdTable t;
    assert(band_of(0.85f, t) == ConfidenceBand::High);
    assert(band_of(0.849f, t) == ConfidenceBand::Medium);
    assert(band_of(0.65f, t) == ConfidenceBand::Medium);
    assert(band_of(0.649f, t) == ConfidenceBand::Low);
    assert(band_of(0.40f, t) == ConfidenceBand::Low);
    assert(band_of(0.399f, t) == ConfidenceBand::VeryLow);

    Router router(t);
    FileTypeCheck ok;
    ok.allowed = true;

    auto route_at = [&](float asset, float category) {
        AssetCandidate c;
        c.asset_id = "I3";
        c.asset_type = AssetType::PrivateCredit;
        c.confidence = asset;
        Classification cls;
        cls.category = "loan_documents";
        cls.confidence = category;
        return router.route({c}, cls, ok);
    };

    auto d = route_at(0.95f, 0.85f);
    assert(d.state == RoutingState::AutoProcessed);
    assert(d.confidence == 0.85f);

    d = route_at(0.849f, 0.95f);
    assert(d.state == RoutingState::PendingConfirmation);
    assert(d.needs_confirmation);

    d = route_at(0.95f, 0.40f);
    assert(d.state == RoutingState::AssetReview);
    assert(d.review_reason == ReviewReason::LowConfidence);

    d = route_at(0.95f, 0.39f);
    assert(d.state == RoutingState::GeneralReview);
    assert(d.review_reason == ReviewReason::VeryLowConfidence);

    // File type outranks any confidence
    FileTypeCheck blocked;
    blocked.reason = "blocked (dangerous)";
    AssetCandidate c;
    c.asset_id = "I3";
    c.confidence = 1.0f;
    Classification cls;
    cls.category = "loan_documents";
    cls.confidence = 1.0f;
    d = router.route({c}, cls, blocked);
    assert(d.state == RoutingState::GeneralReview);
    assert(d.review_reason == ReviewReason::DisallowedFileType);

    d = router.route({}, cls, ok);
    assert(d.review_reason == ReviewReason::NoAssetMatch);

    std::cout << "  PASS" << std::endl;
}

void test_config_overrides() {
    std::cout << "Testing config overrides..." << std::endl;

    const char* path = "/tmp/assetmind_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"thresholds": {"high": 0.9}, "concurrency": {"max_concurrent_emails": 2}})";
    }
    EngineConfig c;
    assert(load_config(path, c));
    assert(c.thresholds.high == 0.9f);
    assert(c.thresholds.medium == 0.65f);
    assert(c.concurrency.max_concurrent_emails == 2);

    {
        std::ofstream f(path);
        f << R"({"thresholds": {"low": 0.9, "medium": 0.5}})";
    }
    EngineConfig unchanged;
    assert(!load_config(path, unchanged));
    assert(unchanged.thresholds.low == 0.40f);

    assert(!load_config("/tmp/assetmind_no_such_config.json", unchanged));
    std::remove(path);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Deduplication gate
// ═══════════════════════════════════════════════════════════════════════════

void test_idempotent_ingest() {
    std::cout << "Testing idempotent ingest..." << std::endl;

    MemoryBackend backend;
    ConflictLedger ledger;
    DeduplicationGate gate(backend, ledger);
    SemanticStore semantic(backend, gate);

    AssetProfile a;
    a.asset_id = "I3";
    a.asset_type = AssetType::PrivateCredit;
    a.identifiers = {"i3", "i3 verticals"};
    a.tier = ConfidenceTier::High;

    auto first = semantic.add_asset(a);
    assert(first.outcome == IngestOutcome::Inserted);
    size_t audits = gate.audit_count();

    auto second = semantic.add_asset(a);
    assert(second.outcome == IngestOutcome::Duplicate);
    assert(second.id == first.id);
    assert(semantic.assets().size() == 1);
    assert(gate.audit_count() == audits);

    // Identifier order and case do not make a new fact
    a.identifiers = {"I3 Verticals", "i3"};
    assert(semantic.add_asset(a).outcome == IngestOutcome::Duplicate);

    // Missing identity fields are rejected before any write
    AssetProfile nameless;
    nameless.identifiers = {"x"};
    auto rejected = semantic.add_asset(nameless);
    assert(rejected.outcome == IngestOutcome::Rejected);
    assert(gate.audit_count() == audits);

    std::cout << "  PASS" << std::endl;
}

void test_identifier_clash() {
    std::cout << "Testing identifier disjointness..." << std::endl;

    MemoryBackend backend;
    ConflictLedger ledger;
    DeduplicationGate gate(backend, ledger);
    SemanticStore semantic(backend, gate);

    AssetProfile x;
    x.asset_id = "X";
    x.asset_type = AssetType::PrivateEquity;
    x.identifiers = {"alpha"};
    assert(semantic.add_asset(x).outcome == IngestOutcome::Inserted);

    AssetProfile y;
    y.asset_id = "Y";
    y.asset_type = AssetType::PrivateEquity;
    y.identifiers = {"Alpha ", "other"};
    auto r = semantic.add_asset(y);
    assert(r.outcome == IngestOutcome::Rejected);
    assert(r.reason.find("alpha") != std::string::npos || r.reason.find("Alpha") != std::string::npos);
    assert(semantic.assets().size() == 1);

    // The owner may restate its own identifiers
    x.identifiers = {"alpha", "alpha fund"};
    assert(semantic.add_asset(x).outcome == IngestOutcome::Updated);

    std::cout << "  PASS" << std::endl;
}

void test_accepted_asset_stays_disjoint() {
    std::cout << "Testing accepted asset candidate keeps identifiers disjoint..." << std::endl;

    MemoryBackend backend;
    ConflictLedger ledger;
    DeduplicationGate gate(backend, ledger);
    SemanticStore semantic(backend, gate);

    AssetProfile oak;
    oak.asset_id = "OAK";
    oak.asset_type = AssetType::CommercialRealEstate;
    oak.identifiers = {"oak tower"};
    oak.tier = ConfidenceTier::High;
    assert(semantic.add_asset(oak).outcome == IngestOutcome::Inserted);

    AssetProfile retyped = oak;
    retyped.asset_type = AssetType::PrivateCredit;
    retyped.identifiers = {"oak tower", "oak lending"};
    auto r = semantic.add_asset(retyped);
    assert(r.outcome == IngestOutcome::QueuedForReview);
    assert(r.conflict_id.has_value());

    // Another asset claims the pending identifier in the meantime
    AssetProfile lend;
    lend.asset_id = "LEND";
    lend.asset_type = AssetType::PrivateCredit;
    lend.identifiers = {"oak lending"};
    lend.tier = ConfidenceTier::High;
    assert(semantic.add_asset(lend).outcome == IngestOutcome::Inserted);

    std::string error;
    assert(!gate.resolve_conflict(*r.conflict_id, Resolution::Updated, error));
    assert(error.find("oak lending") != std::string::npos);
    assert(ledger.pending_count() == 1);
    assert(semantic.asset("OAK")->asset_type == AssetType::CommercialRealEstate);
    assert(semantic.asset("OAK")->identifiers.size() == 1);

    // Keeping the existing fact still closes the conflict
    error.clear();
    assert(gate.resolve_conflict(*r.conflict_id, Resolution::Rejected, error));
    assert(ledger.pending_count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_file_type_conflict() {
    std::cout << "Testing file type conflict resolution..." << std::endl;

    MemoryBackend backend;
    ConflictLedger ledger;
    DeduplicationGate gate(backend, ledger);
    SemanticStore semantic(backend, gate);

    FileTypeRule weak;
    weak.extension = "pdf";
    weak.is_allowed = false;
    weak.security_level = SecurityLevel::Restricted;
    weak.tier = ConfidenceTier::Low;
    assert(semantic.add_file_type_rule(weak).outcome == IngestOutcome::Inserted);

    FileTypeRule strong;
    strong.extension = ".PDF";
    strong.is_allowed = true;
    strong.security_level = SecurityLevel::Safe;
    strong.tier = ConfidenceTier::High;
    auto r = semantic.add_file_type_rule(strong);
    assert(r.outcome == IngestOutcome::Updated);
    assert(r.conflict_id.has_value());

    auto rec = ledger.get(*r.conflict_id);
    assert(rec.has_value());
    assert(rec->type == ConflictType::FilePermissionMismatch);
    assert(rec->severity == ConflictSeverity::High);
    assert(rec->resolution == Resolution::Updated);
    assert(rec->details.size() == 2);
    assert(semantic.file_type_rule(".pdf")->is_allowed);

    // A weaker contradiction is rejected and recorded; the fact stays
    FileTypeRule late;
    late.extension = ".pdf";
    late.is_allowed = false;
    late.security_level = SecurityLevel::Safe;
    late.tier = ConfidenceTier::Medium;
    auto rejected = semantic.add_file_type_rule(late);
    assert(rejected.outcome == IngestOutcome::Rejected);
    assert(rejected.conflict_id.has_value());
    assert(semantic.file_type_rule(".pdf")->is_allowed);
    assert(ledger.size() == 2);
    assert(ledger.pending_count() == 0);

    // Unknown extensions never pass
    auto check = semantic.validate_file_type("archive.zip");
    assert(!check.allowed);

    std::cout << "  PASS" << std::endl;
}

void test_rule_contradiction_review() {
    std::cout << "Testing rule contradiction human review..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;

    BusinessRule rule;
    rule.subject = "PDF attachments";
    rule.statement = "pdf attachments must not be scanned";
    rule.tier = ConfidenceTier::High;
    auto r = engine.procedural().add_rule(rule);
    assert(r.outcome == IngestOutcome::QueuedForReview);
    assert(r.conflict_id.has_value());

    // Existing rule stays authoritative while the conflict is pending
    auto rules = engine.procedural().rules();
    assert(rules.size() == 1);
    assert(rules[0].statement == "pdf attachments must be scanned");

    auto pending = engine.get_pending_conflicts();
    assert(pending.size() == 1);
    assert(pending[0].type == ConflictType::RuleContradiction);

    std::string error;
    assert(!engine.resolve_conflict(pending[0].id.to_string(), Resolution::HumanReview, error));
    assert(engine.resolve_conflict(pending[0].id.to_string(), Resolution::Updated, error));
    rules = engine.procedural().rules();
    assert(rules.size() == 1);
    assert(rules[0].statement == "pdf attachments must not be scanned");
    assert(engine.get_pending_conflicts().empty());

    // A decided conflict cannot be decided again
    assert(!engine.resolve_conflict(pending[0].id.to_string(), Resolution::Rejected, error));
    assert(!engine.resolve_conflict("not-an-id", Resolution::Rejected, error));

    bool audited = false;
    for (const auto& a : engine.audit_log(100)) {
        if (a.action == "resolved_updated" && a.collection == "rules") audited = true;
    }
    assert(audited);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_learning() {
    std::cout << "Testing concurrent file type learning..." << std::endl;

    auto h = seeded_harness();
    SemanticStore& semantic = h.engine->semantic();
    uint32_t before = semantic.file_type_rule(".pdf")->success_count;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&semantic]() {
            for (int i = 0; i < 25; ++i) {
                auto r = semantic.learn_file_type_outcome("PDF", true);
                assert(r.stored());
            }
        });
    }
    for (auto& t : threads) t.join();

    auto rule = semantic.file_type_rule(".pdf");
    assert(rule->success_count == before + 200);
    assert(rule->failure_count == 0);
    assert(rule->is_allowed);

    // Nothing to learn for an extension with no rule
    assert(!semantic.learn_file_type_outcome(".zip", true).stored());

    std::cout << "  PASS" << std::endl;
}

void test_file_type_outcome_learning() {
    std::cout << "Testing file type outcome learning..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;
    SemanticStore& semantic = engine.semantic();
    const size_t min_outcomes = engine.config().file_type_min_outcomes;
    assert(min_outcomes == 5);

    // Successes carry their asset type and category onto the rule
    auto r = semantic.learn_file_type_outcome(".pdf", true, "private_credit", "loan_documents");
    assert(r.outcome == IngestOutcome::Updated);
    auto rule = semantic.file_type_rule(".pdf");
    assert(rule->success_count == 1);
    assert(listed(rule->asset_types, "private_credit"));
    assert(listed(rule->document_categories, "loan_documents"));
    assert(rule->tier == ConfidenceTier::High);

    // Too few outcomes to move the rule
    for (int i = 0; i < 3; ++i) {
        assert(semantic.learn_file_type_outcome(".pdf", false).stored());
    }
    rule = semantic.file_type_rule(".pdf");
    assert(rule->failure_count == 3);
    assert(rule->is_allowed);
    assert(rule->tier == ConfidenceTier::High);

    // 1 of 5 succeeded: the rule drops and blocks, without a conflict
    r = semantic.learn_file_type_outcome(".pdf", false);
    assert(r.outcome == IngestOutcome::Updated);
    assert(!r.conflict_id.has_value());
    rule = semantic.file_type_rule(".pdf");
    assert(rule->failure_count == 4);
    assert(rule->tier == ConfidenceTier::Low);
    assert(!rule->is_allowed);
    assert(engine.get_pending_conflicts().empty());

    Email email = i3_email();
    auto d = engine.classify_attachment(email, email.attachments[0]);
    assert(d.state == RoutingState::GeneralReview);
    assert(d.review_reason == ReviewReason::DisallowedFileType);

    // An outside claim on the permission is still a contradiction
    FileTypeRule claim = *rule;
    claim.is_allowed = true;
    claim.source = "admin";
    auto contested = semantic.add_file_type_rule(claim);
    assert(contested.outcome == IngestOutcome::QueuedForReview);
    assert(contested.conflict_id.has_value());

    // A discarded review counts as a failure
    auto h2 = seeded_harness();
    Email junk = unmatched_email();
    auto parked = h2.engine->classify_attachment(junk, junk.attachments[0]);
    ReviewResolution discard;
    discard.action = ReviewOutcome::Discarded;
    std::string error;
    assert(h2.engine->resolve_review(parked.review_id, discard, error));
    assert(h2.engine->semantic().file_type_rule(".pdf")->failure_count == 1);
    assert(h2.sink->size() == 0);

    // So does a document the sink could not take
    auto sink = std::make_shared<FullDiskSink>();
    Engine full(test_config(), std::make_unique<MemoryBackend>(), sink);
    assert(full.open());
    full.bootstrap(sample_knowledge());
    auto decisions = full.process_email(i3_email());
    assert(decisions.size() == 1);
    assert(!decisions[0].error.empty());
    assert(decisions[0].stored_path.empty());
    assert(full.semantic().file_type_rule(".pdf")->failure_count == 1);
    assert(full.semantic().file_type_rule(".pdf")->success_count == 0);
    assert(full.episodic().size() == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Scoring
// ═══════════════════════════════════════════════════════════════════════════

void test_disjoint_identifier_ranking() {
    std::cout << "Testing disjoint identifier ranking..." << std::endl;

    std::vector<AssetProfile> assets;
    const std::vector<std::pair<std::string, std::string>> defs = {
        {"ALPHA", "alpha ridge"}, {"BETA", "beta lending"}, {"GAMMA", "gamma wind"}, {"DELTA", "delta yard"}};
    for (const auto& [id, ident] : defs) {
        AssetProfile a;
        a.asset_id = id;
        a.asset_type = AssetType::Infrastructure;
        a.identifiers = {ident};
        assets.push_back(a);
    }

    EngineConfig config;
    AssetIdentifier identifier(config.matching, config.relevance_keywords);
    for (const auto& [id, ident] : defs) {
        IdentifyInput in{"x@example.com", "Update on " + ident, "Quarterly figures attached.",
                         "q3_update.pdf"};
        auto out = identifier.identify(in, assets, std::nullopt);
        assert(!out.empty());
        assert(out.front().asset_id == id);
        for (size_t i = 1; i < out.size(); ++i) {
            assert(out[i].confidence < out.front().confidence);
        }
    }

    // Nothing mentioned, nothing returned
    IdentifyInput none{"x@example.com", "Hello", "", "memo.pdf"};
    assert(identifier.identify(none, assets, std::nullopt).empty());

    std::cout << "  PASS" << std::endl;
}

void test_match_tiers() {
    std::cout << "Testing identifier match tiers..." << std::endl;

    EngineConfig config;
    AssetIdentifier identifier(config.matching, config.relevance_keywords);

    auto tier = [&](const std::string& id, const std::string& raw) {
        std::string text = to_lower(raw);
        auto tokens = tokenize(text);
        std::unordered_set<std::string> set(tokens.begin(), tokens.end());
        return identifier.classify_match(id, text, tokens, set);
    };

    assert(tier("i3", "rlv_trm_i3_td.pdf") == MatchTier::ExactToken);
    assert(tier("harbor point tower", "tower update for point harbor") == MatchTier::AllWords);
    assert(tier("crest", "hillcrestview memo") == MatchTier::Substring);
    assert(tier("verticals", "vertcals loan docs") == MatchTier::Fuzzy);
    assert(tier("i3", "ai3x") == MatchTier::None);
    assert(tier("zeta", "nothing here") == MatchTier::None);

    std::cout << "  PASS" << std::endl;
}

void test_sender_and_experience_signals() {
    std::cout << "Testing sender seed and episodic boost..." << std::endl;

    EngineConfig config;
    AssetIdentifier identifier(config.matching, config.relevance_keywords);

    AssetProfile a;
    a.asset_id = "I3";
    a.asset_type = AssetType::PrivateCredit;
    a.identifiers = {"i3 verticals", "verticals"};

    SenderMapping sender;
    sender.sender = "ops@i3verticals.com";
    sender.asset_ids = {"I3"};
    sender.trust_score = 0.9f;

    IdentifyInput in{"ops@i3verticals.com", "Monthly pack", "", "pack.pdf"};
    auto seeded = identifier.identify(in, {a}, sender);
    assert(seeded.size() == 1);
    assert(seeded[0].confidence >= config.matching.sender_seed);

    // An untrusted mapping seeds nothing
    sender.trust_score = 0.2f;
    assert(identifier.identify(in, {a}, sender).empty());

    // Corrections on similar documents lift a weak candidate
    IdentifyInput weak{"x@example.com", "Vertcals update", "", "update.pdf"};
    auto base = identifier.identify(weak, {a}, std::nullopt);
    EpisodeEvidence ev;
    ev.record.asset_id = "I3";
    ev.record.episode_source = EpisodeSource::HumanCorrection;
    ev.similarity = 0.9f;
    auto boosted = identifier.identify(weak, {a}, std::nullopt, {ev});
    assert(!boosted.empty());
    float before = base.empty() ? 0.0f : base[0].confidence;
    assert(boosted[0].confidence > before);

    std::cout << "  PASS" << std::endl;
}

void test_classifier() {
    std::cout << "Testing document classifier..." << std::endl;

    EngineConfig config;
    MemoryBackend backend;
    ConflictLedger ledger;
    DeduplicationGate gate(backend, ledger);
    ProceduralStore procedural(backend, gate, config);
    DocumentClassifier classifier(config.classifier);

    ClassificationPattern p;
    p.asset_type = "private_credit";
    p.category = "covenant_compliance";
    p.pattern = "covenant";
    p.weight = 0.5f;
    assert(procedural.add_pattern(p).outcome == IngestOutcome::Inserted);

    ClassificationPattern bad;
    bad.asset_type = "private_credit";
    bad.category = "loan_documents";
    bad.pattern = "([unclosed";
    assert(procedural.add_pattern(bad).outcome == IngestOutcome::Rejected);

    std::vector<std::string> allowed = {"covenant_compliance", "loan_documents"};
    ClassifyInput in{"private_credit", "covenant_q3.docx", "Covenant certificate", "", false};
    auto c = classifier.classify(in, allowed, procedural.patterns_for("private_credit"));
    assert(c.category == "covenant_compliance");
    assert(!c.fallback);
    assert(c.confidence > 0.5f);

    ClassifyInput nothing{"private_credit", "image.png", "hi", "", false};
    auto f = classifier.classify(nothing, allowed, procedural.patterns_for("private_credit"));
    assert(f.fallback);
    assert(f.category == config.classifier.fallback_category);
    assert(f.confidence == config.classifier.fallback_confidence);

    // Derived specificity is length based and capped
    ClassificationPattern derived;
    derived.pattern = "abcdefghij";
    assert(procedural.specificity(derived) == 0.5f);
    derived.pattern = std::string(60, 'x');
    assert(procedural.specificity(derived) == 1.0f);

    assert(procedural.is_relevance_keyword("Loan"));
    assert(!procedural.is_relevance_keyword("i3"));

    // Rationale lines carry the whole pattern, however long
    ClassificationPattern verbose_pattern;
    verbose_pattern.asset_type = "private_credit";
    verbose_pattern.category = "credit_memo";
    verbose_pattern.pattern = "credit_memo_" + std::string(200, 'q') + "|memo";
    verbose_pattern.weight = 0.4f;
    assert(procedural.add_pattern(verbose_pattern).outcome == IngestOutcome::Inserted);
    ClassifyInput memo{"private_credit", "memo.pdf", "", "", false};
    auto m = classifier.classify(memo, {"credit_memo"}, procedural.patterns_for("private_credit"));
    assert(m.category == "credit_memo");
    bool whole = false;
    for (const auto& line : m.rationale) {
        if (line.find(verbose_pattern.pattern) != std::string::npos &&
            line.find("(+0.40)") != std::string::npos) {
            whole = true;
        }
    }
    assert(whole);

    std::cout << "  PASS" << std::endl;
}

void test_pattern_input_bound() {
    std::cout << "Testing pattern input bound on long bodies..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;
    DocumentClassifier classifier(engine.config().classifier);
    auto patterns = engine.procedural().patterns_for("private_credit");
    std::vector<std::string> allowed = {"loan_documents", "credit_memo"};

    // A single 200 KB line that a ".*" pattern starts matching
    ClassifyInput in{"private_credit", "statement.pdf", "Quarterly",
                     "rlv_" + std::string(200000, 'x'), false};
    auto c = classifier.classify(in, allowed, patterns);
    assert(c.fallback);

    // A match at the head of the body still counts
    in.body = "rlv_x_td " + std::string(200000, 'x');
    c = classifier.classify(in, allowed, patterns);
    assert(c.category == "loan_documents");
    assert(!c.fallback);

    // Past the bound it is not seen
    in.body = std::string(5000, ' ') + "rlv_x_td";
    c = classifier.classify(in, allowed, patterns);
    assert(c.fallback);
    assert(classifier.pattern_text(in).size() == engine.config().classifier.pattern_text_limit);

    // End to end through the engine
    Email email = i3_email();
    email.attachments[0].filename = "statement.pdf";
    email.body = "rlv_" + std::string(200000, 'x');
    auto d = engine.classify_attachment(email, email.attachments[0]);
    assert(d.asset_id == "I3");
    assert(d.category == engine.config().classifier.fallback_category);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Stores
// ═══════════════════════════════════════════════════════════════════════════

void test_episodic_eviction() {
    std::cout << "Testing episodic eviction..." << std::endl;

    MemoryBackend backend;
    ConflictLedger ledger;
    DeduplicationGate gate(backend, ledger);
    EpisodicConfig config;
    config.max_records = 3;
    config.max_age_days = 30;
    auto lookup = std::make_shared<TermVectorIndex>();
    EpisodicStore episodic(backend, gate, config, lookup);

    Timestamp t0 = now() - 1000000;
    EpisodicRecord correction;
    correction.filename = "corrected.pdf";
    correction.episode_source = EpisodeSource::HumanCorrection;
    correction.confidence = 1.0f;
    correction.timestamp = t0;
    assert(episodic.append(correction).outcome == IngestOutcome::Inserted);

    for (int i = 0; i < 4; ++i) {
        EpisodicRecord r;
        r.filename = "auto_" + std::to_string(i) + ".pdf";
        r.confidence = 0.9f;
        r.timestamp = t0 + 1000 * (i + 1);
        assert(episodic.append(r).outcome == IngestOutcome::Inserted);
    }

    // Oldest auto records go first; the correction survives
    assert(episodic.size() == 3);
    assert(episodic.correction_count() == 1);
    assert(lookup->size() == 3);
    for (const auto& r : episodic.all()) {
        assert(r.filename != "auto_0.pdf");
        assert(r.filename != "auto_1.pdf");
    }

    // Expired records go even below the cap
    EpisodicRecord old;
    old.filename = "ancient.pdf";
    old.timestamp = now() - 40 * MS_PER_DAY;
    episodic.append(old);
    for (const auto& r : episodic.all()) assert(r.filename != "ancient.pdf");
    assert(episodic.size() <= 3);

    std::cout << "  PASS" << std::endl;
}

void test_contact_association() {
    std::cout << "Testing sender association..." << std::endl;

    MemoryBackend backend;
    ConflictLedger ledger;
    DeduplicationGate gate(backend, ledger);
    ContactStore contacts(backend, gate);

    assert(contacts.associate("Ops@Fund.com", "I3", "Fund LLC", 0.8f).outcome == IngestOutcome::Inserted);
    assert(contacts.associate("ops@fund.com", "HARBOR").outcome == IngestOutcome::Updated);

    auto m = contacts.lookup("OPS@fund.com");
    assert(m.has_value());
    assert(m->asset_ids.size() == 2);
    assert(m->trust_score == 0.8f);
    assert(contacts.is_trusted("ops@fund.com", 0.5f));

    // Same sender, another organization at equal confidence: queued, not overwritten
    SenderMapping other = *m;
    other.organization = "Other Co";
    auto r = contacts.upsert(other);
    assert(r.outcome == IngestOutcome::QueuedForReview);
    assert(contacts.lookup("ops@fund.com")->organization == "Fund LLC");

    SenderMapping malformed;
    malformed.sender = "not-an-address";
    assert(contacts.upsert(malformed).outcome == IngestOutcome::Rejected);

    std::cout << "  PASS" << std::endl;
}

void test_review_queue_priority() {
    std::cout << "Testing review queue priority..." << std::endl;

    MemoryBackend backend;
    ReviewQueue queue(backend);

    ReviewItem low;
    low.filename = "a.pdf";
    low.reason = ReviewReason::LowConfidence;
    low.bucket = "I3";
    auto a = queue.enqueue(low);

    ReviewItem critical;
    critical.filename = "b.exe";
    critical.reason = ReviewReason::DisallowedFileType;
    auto b = queue.enqueue(critical);

    assert(queue.next()->id == b.id);
    assert(queue.get_pending().front().id == b.id);
    assert(queue.get_pending(ReviewReason::LowConfidence).size() == 1);
    assert(queue.get_bucket("I3").size() == 1);
    assert(queue.get_bucket(GENERAL_BUCKET).size() == 1);

    std::string error;
    assert(queue.resolve(b.id, ReviewOutcome::Discarded, "", "", "", error));
    assert(!queue.resolve(b.id, ReviewOutcome::Discarded, "", "", "", error));
    assert(queue.next()->id == a.id);

    // State survives a reload from the backend
    ReviewQueue reloaded(backend);
    assert(reloaded.load());
    assert(reloaded.pending_count() == 1);
    assert(reloaded.stats().discarded == 1);

    std::cout << "  PASS" << std::endl;
}

void test_worker_pool_bound() {
    std::cout << "Testing worker pool bound..." << std::endl;

    WorkerPool pool(2);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&active, &peak, i]() {
            int now_active = ++active;
            int prev = peak.load();
            while (now_active > prev && !peak.compare_exchange_weak(prev, now_active)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --active;
            return i * i;
        }));
    }
    int sum = 0;
    for (auto& f : futures) sum += f.get();
    assert(sum == 140);
    assert(peak.load() <= 2);

    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    bool threw = false;
    try {
        failing.get();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Bootstrap
// ═══════════════════════════════════════════════════════════════════════════

void test_bootstrap_once() {
    std::cout << "Testing bootstrap runs once per collection..." << std::endl;

    auto h = make_harness();
    Engine& engine = *h.engine;

    auto first = engine.bootstrap(sample_knowledge());
    assert(first.status == "loaded");
    assert(first.counts["assets"] == 2);
    assert(first.counts["file_types"] == 3);
    assert(first.counts["patterns"] == 2);
    assert(first.counts["senders"] == 1);

    auto exe = engine.semantic().file_type_rule(".exe");
    assert(exe.has_value());
    assert(!exe->is_allowed);
    assert(exe->security_level == SecurityLevel::Dangerous);
    assert(exe->tier == ConfidenceTier::High);

    size_t audits = engine.gate().audit_count();
    auto second = engine.bootstrap(sample_knowledge());
    assert(second.status == "already_loaded");
    assert(second.counts == first.counts);
    for (const auto& c : second.collections) assert(c.status == "already_loaded");
    assert(engine.gate().audit_count() == audits);

    assert(engine.bootstrap(json::object()).status == "empty");

    std::cout << "  PASS" << std::endl;
}

void test_bootstrap_legacy_layout() {
    std::cout << "Testing legacy knowledge base layout..." << std::endl;

    auto h = make_harness();
    json doc = {
        {"file_type_validation", {
            {"safe_file_types", {{".pdf", {{"description", "PDF"}}}}},
            {"restricted_file_types", {{".zip", json::object()}}},
        }},
        {"categories", {{"private_credit", json::array({"loan_documents", "credit_memo"})}}},
    };
    auto report = h.engine->bootstrap(doc);
    assert(report.status == "loaded");
    assert(h.engine->semantic().file_type_rule(".pdf")->is_allowed);
    assert(!h.engine->semantic().file_type_rule(".zip")->is_allowed);

    bool known = false;
    auto cats = h.engine->semantic().allowed_categories(AssetType::PrivateCredit, &known);
    assert(known);
    assert(std::find(cats.begin(), cats.end(), "credit_memo") != cats.end());
    assert(std::find(cats.begin(), cats.end(), "loan_monitoring") == cats.end());
    assert(std::find(cats.begin(), cats.end(), "correspondence") != cats.end());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Engine flows
// ═══════════════════════════════════════════════════════════════════════════

void test_i3_scenario() {
    std::cout << "Testing I3 term loan routing..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;
    Email email = i3_email();

    auto d = engine.classify_attachment(email, email.attachments[0]);
    assert(!d.candidates.empty());
    assert(d.asset_id == "I3");
    assert(d.asset_confidence > 0.6f);
    assert(d.category == "loan_documents");
    assert(d.state == RoutingState::AutoProcessed);
    assert(d.stored_path == "I3/loan_documents/RLV_TRM_i3_TD.pdf");
    assert(h.sink->contains(d.stored_path));
    assert(!d.rationale.empty());

    // The outcome is remembered
    assert(engine.episodic().size() == 1);
    assert(engine.semantic().file_type_rule(".pdf")->success_count == 1);

    std::cout << "  PASS" << std::endl;
}

void test_unmapped_sender_scenario() {
    std::cout << "Testing unmapped sender routing..." << std::endl;

    auto h = seeded_harness();
    Email email;
    email.sender = "analyst@example.com";
    email.subject = "i3 loan docs";
    email.body = "attached find the loan documents for the i3 deal";
    Attachment file{"RLV_TRM_i3_TD.pdf", "%PDF"};

    auto d = h.engine->classify_attachment(email, file);
    assert(!d.candidates.empty());
    assert(d.candidates.front().asset_id == "I3");
    assert(d.asset_confidence > 0.6f);
    assert(d.category == "loan_documents");
    assert(is_stored_state(d.state));
    assert(!h.engine->contacts().lookup(email.sender).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_feedback_raises_confidence() {
    std::cout << "Testing feedback raises confidence..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;

    Email email;
    email.sender = "pm@example.com";
    email.subject = "Harbor Point rent roll March";
    email.body = "Attached.";
    Attachment file{"harbor_point_march.xlsx", "PK"};

    auto before = engine.classify_attachment(email, file);
    assert(before.category == "rent_roll");
    assert(before.asset_id == "HARBOR");

    auto fb = engine.record_feedback(file.filename, email.subject + " " + email.body,
                                     "rent_roll", "HARBOR");
    assert(fb.outcome == IngestOutcome::Inserted);
    assert(engine.episodic().correction_count() == 1);

    auto after = engine.classify_attachment(email, file);
    assert(after.category == "rent_roll");
    assert(after.category_confidence > before.category_confidence + 0.1f);
    assert(after.confidence >= before.confidence);

    // Feedback naming an unknown asset is refused
    auto bad = engine.record_feedback(file.filename, "", "rent_roll", "NOPE");
    assert(bad.outcome == IngestOutcome::Rejected);
    assert(engine.episodic().correction_count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_review_resolution() {
    std::cout << "Testing review resolution..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;
    Email email = unmatched_email();

    auto d = engine.classify_attachment(email, email.attachments[0]);
    assert(d.state == RoutingState::GeneralReview);
    assert(d.review_reason == ReviewReason::NoAssetMatch);
    assert(!d.review_id.empty());
    assert(h.sink->contains("_review/general/notes.pdf"));
    assert(engine.pending_reviews(ReviewReason::NoAssetMatch).size() == 1);

    size_t corrections = engine.episodic().correction_count();

    ReviewResolution r;
    r.action = ReviewOutcome::Stored;
    r.asset_id = "I3";
    r.category = "loan_documents";
    r.trust_sender = true;
    std::string error;
    assert(engine.resolve_review(d.review_id, r, error));

    assert(h.sink->contains("I3/loan_documents/notes.pdf"));
    assert(!h.sink->contains("_review/general/notes.pdf"));
    assert(engine.pending_reviews().empty());
    assert(engine.episodic().correction_count() == corrections + 1);

    auto mapping = engine.contacts().lookup("someone@example.com");
    assert(mapping.has_value());
    assert(mapping->trust_score == 0.8f);
    assert(mapping->asset_ids.size() == 1 && mapping->asset_ids[0] == "I3");

    assert(!engine.resolve_review(d.review_id, r, error));
    assert(!engine.resolve_review("missing", r, error));

    // The learned sender now routes the next document from the same address
    Email again = unmatched_email();
    again.attachments[0].filename = "notes_2.pdf";
    auto next = engine.classify_attachment(again, again.attachments[0]);
    assert(next.asset_id == "I3");

    std::cout << "  PASS" << std::endl;
}

void test_review_resolution_retry() {
    std::cout << "Testing review resolution after a failed commit..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;
    Email email = unmatched_email();
    email.attachments[0].filename = "zzz_unmatched.pdf";
    auto d = engine.classify_attachment(email, email.attachments[0]);
    assert(d.state == RoutingState::GeneralReview);
    assert(h.sink->contains("_review/general/zzz_unmatched.pdf"));

    ReviewResolution store;
    store.action = ReviewOutcome::Stored;
    store.asset_id = "HARBOR";
    store.category = "rent_roll";
    std::string error;

    h.backend->set_fail_writes(true);
    bool threw = false;
    try {
        engine.resolve_review(d.review_id, store, error);
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);
    assert(h.sink->contains("_review/general/zzz_unmatched.pdf"));
    assert(!h.sink->contains("HARBOR/rent_roll/zzz_unmatched.pdf"));
    assert(engine.pending_reviews().size() == 1);

    h.backend->set_fail_writes(false);
    assert(engine.resolve_review(d.review_id, store, error));
    assert(h.sink->contains("HARBOR/rent_roll/zzz_unmatched.pdf"));
    assert(!h.sink->contains("_review/general/zzz_unmatched.pdf"));
    assert(engine.pending_reviews().empty());
    assert(engine.reviews().get(FactId::from_string(d.review_id))->stored_path ==
           "HARBOR/rent_roll/zzz_unmatched.pdf");

    // A failed discard keeps the parked document too
    Email other = unmatched_email();
    other.attachments[0].filename = "scan.pdf";
    auto d2 = engine.classify_attachment(other, other.attachments[0]);
    ReviewResolution discard;
    discard.action = ReviewOutcome::Discarded;

    h.backend->set_fail_writes(true);
    threw = false;
    try {
        engine.resolve_review(d2.review_id, discard, error);
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);
    assert(h.sink->contains("_review/general/scan.pdf"));

    h.backend->set_fail_writes(false);
    assert(engine.resolve_review(d2.review_id, discard, error));
    assert(!h.sink->contains("_review/general/scan.pdf"));
    assert(engine.pending_reviews().empty());

    std::cout << "  PASS" << std::endl;
}

void test_disallowed_and_quarantine() {
    std::cout << "Testing disallowed files and quarantine..." << std::endl;

    auto h = seeded_harness(test_config(), std::make_shared<ThreatScanner>());
    Engine& engine = *h.engine;

    Email email = i3_email();
    email.attachments = {
        {"RLV_TRM_i3_TD.pdf", "%PDF-1.4"},
        {"setup.exe", "MZ"},
        {"payload.pdf", "X5O!P%@AP EICAR"},
        {"archive.zip", "PK"},
    };
    auto decisions = engine.process_email(email);
    assert(decisions.size() == 4);
    assert(decisions[0].state == RoutingState::AutoProcessed);
    assert(decisions[1].review_reason == ReviewReason::DisallowedFileType);
    assert(decisions[2].state == RoutingState::Quarantined);
    assert(decisions[3].review_reason == ReviewReason::DisallowedFileType);

    // Quarantined documents leave nothing behind
    assert(!h.sink->contains("_review/general/payload.pdf"));
    assert(!h.sink->contains("I3/loan_documents/payload.pdf"));

    auto pending = engine.pending_reviews();
    assert(pending.size() == 2);
    assert(pending[0].priority == ReviewPriority::Critical);

    std::cout << "  PASS" << std::endl;
}

void test_batch_processing() {
    std::cout << "Testing batch processing..." << std::endl;

    EngineConfig config = test_config();
    config.concurrency.max_concurrent_emails = 2;
    config.concurrency.max_concurrent_attachments = 2;
    auto h = seeded_harness(config);

    std::vector<Email> emails;
    for (int i = 0; i < 5; ++i) {
        Email e = i3_email();
        e.id = "m-" + std::to_string(i);
        e.attachments = {
            {"RLV_TRM_i3_TD_" + std::to_string(i) + ".pdf", "%PDF"},
            {"RLV_TRM_i3_TD_" + std::to_string(i) + "b.pdf", "%PDF"},
            {"RLV_TRM_i3_TD_" + std::to_string(i) + "c.pdf", "%PDF"},
        };
        emails.push_back(e);
    }
    auto results = h.engine->process_batch(emails);
    assert(results.size() == 5);
    for (size_t i = 0; i < results.size(); ++i) {
        assert(results[i].size() == 3);
        for (const auto& d : results[i]) {
            assert(d.error.empty());
            assert(d.asset_id == "I3");
        }
    }
    assert(h.engine->semantic().file_type_rule(".pdf")->success_count ==
           h.engine->episodic().size());

    std::cout << "  PASS" << std::endl;
}

void test_similarity_timeout() {
    std::cout << "Testing similarity timeout degradation..." << std::endl;

    EngineConfig config = test_config();
    config.concurrency.similarity_timeout_ms = 20;
    auto h = seeded_harness(config, nullptr, std::make_shared<SlowLookup>());

    Email email = i3_email();
    auto start = std::chrono::steady_clock::now();
    auto d = h.engine->classify_attachment(email, email.attachments[0]);
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(d.degraded);
    assert(d.asset_id == "I3");
    assert(d.state == RoutingState::AutoProcessed);
    assert(elapsed < std::chrono::milliseconds(250));

    std::cout << "  PASS" << std::endl;
}

void test_similarity_saturation() {
    std::cout << "Testing similarity lookups stay bounded..." << std::endl;

    auto lookup = std::make_shared<StuckLookup>();
    SimilarityGateway gateway(lookup, 100, 1, 2);

    auto first = gateway.query("rent roll harbor", 5);
    auto second = gateway.query("rent roll harbor", 5);
    assert(first.degraded && second.degraded);
    assert(first.reason.find("timed out") != std::string::npos);
    assert(gateway.pending() == 2);

    // Full: degrade at once, start nothing new
    auto third = gateway.query("rent roll harbor", 5);
    assert(third.degraded);
    assert(third.reason.find("saturated") != std::string::npos);
    assert(gateway.pending() == 2);

    lookup->release();
    for (int i = 0; i < 200 && gateway.pending() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(gateway.pending() == 0);

    auto recovered = gateway.query("rent roll harbor", 5);
    assert(!recovered.degraded);

    std::cout << "  PASS" << std::endl;
}

void test_cancellation() {
    std::cout << "Testing cancellation before writes..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;
    size_t audits = engine.gate().audit_count();

    CancelToken token;
    token.cancel();
    Email email = i3_email();
    auto d = engine.classify_attachment(email, email.attachments[0], &token);
    assert(d.state == RoutingState::Cancelled);
    assert(h.sink->size() == 0);
    assert(engine.episodic().size() == 0);
    assert(engine.reviews().total_count() == 0);
    assert(engine.gate().audit_count() == audits);

    std::cout << "  PASS" << std::endl;
}

void test_storage_failure() {
    std::cout << "Testing storage failure isolation..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;
    Email email = unmatched_email();

    h.backend->set_fail_writes(true);
    bool threw = false;
    try {
        engine.classify_attachment(email, email.attachments[0]);
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);
    assert(engine.reviews().total_count() == 0);
    assert(h.sink->size() == 0);

    // In a batch only the affected attachment is marked
    auto decisions = engine.process_email(email);
    assert(decisions.size() == 1);
    assert(!decisions[0].error.empty());
    assert(decisions[0].review_id.empty());
    assert(h.sink->size() == 0);

    // A routed document is not left filed either
    Email routed = i3_email();
    auto failed = engine.process_email(routed);
    assert(!failed[0].error.empty());
    assert(failed[0].stored_path.empty());
    assert(h.sink->size() == 0);
    assert(engine.episodic().size() == 0);

    h.backend->set_fail_writes(false);
    auto ok = engine.classify_attachment(email, email.attachments[0]);
    assert(ok.error.empty());
    assert(!ok.review_id.empty());
    assert(engine.reviews().total_count() == 1);
    assert(h.sink->size() == 1);

    // The retry files the document once
    auto stored = engine.classify_attachment(routed, routed.attachments[0]);
    assert(stored.stored_path == "I3/loan_documents/RLV_TRM_i3_TD.pdf");
    assert(h.sink->size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_knowledge_stats() {
    std::cout << "Testing knowledge stats..." << std::endl;

    auto h = seeded_harness();
    Engine& engine = *h.engine;
    Email email = i3_email();
    engine.classify_attachment(email, email.attachments[0]);

    auto stats = engine.get_knowledge_stats();
    assert(stats.collections["assets"] == 2);
    assert(stats.collections["episodes"] == 1);
    assert(stats.collections["rules"] == 1);
    assert(stats.conflicts_pending == 0);
    assert(stats.audit_entries > 0);

    json j = stats_to_json(stats);
    assert(j["collections"]["senders"] == 1);
    assert(j["reviews"]["pending"] == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Persistence and edges
// ═══════════════════════════════════════════════════════════════════════════

void test_sqlite_persistence() {
    std::cout << "Testing SQLite persistence..." << std::endl;

    const std::string path = "/tmp/assetmind_test.db";
    std::system("rm -f /tmp/assetmind_test.db*");

    EngineConfig config = test_config();
    config.db_path = path;
    std::string review_id;
    {
        auto sink = std::make_shared<MemorySink>();
        Engine engine(config, make_backend(config), sink);
        assert(engine.open());
        assert(engine.bootstrap(sample_knowledge()).status == "loaded");

        Email email = unmatched_email();
        auto d = engine.classify_attachment(email, email.attachments[0]);
        review_id = d.review_id;

        BusinessRule rule;
        rule.subject = "pdf attachments";
        rule.statement = "pdf attachments must not be scanned";
        rule.tier = ConfidenceTier::High;
        assert(engine.procedural().add_rule(rule).outcome == IngestOutcome::QueuedForReview);
        engine.close();
    }
    {
        auto sink = std::make_shared<MemorySink>();
        Engine engine(config, make_backend(config), sink);
        assert(engine.open());
        assert(engine.semantic().assets().size() == 2);
        assert(engine.contacts().lookup("ops@i3verticals.com").has_value());
        assert(engine.get_pending_conflicts().size() == 1);
        assert(engine.reviews().get(FactId::from_string(review_id)).has_value());

        auto again = engine.bootstrap(sample_knowledge());
        assert(again.status == "already_loaded");
        assert(again.counts["assets"] == 2);
        engine.close();
    }

    std::system("rm -f /tmp/assetmind_test.db*");
    std::cout << "  PASS" << std::endl;
}

void test_email_source_and_filesystem_sink() {
    std::cout << "Testing email source and filesystem sink..." << std::endl;

    const char* path = "/tmp/assetmind_emails_test.json";
    {
        std::ofstream f(path);
        f << R"([{"id": "a", "sender": "x@y.com", "subject": "s",
                  "attachments": [{"filename": "one.pdf", "content": "1"}]},
                 {"id": "b", "sender": "x@y.com", "subject": "t"}])";
    }
    JsonFileEmailSource source(path);
    assert(source.open());
    auto first = source.next();
    assert(first && first->id == "a" && first->attachments.size() == 1);
    auto second = source.next();
    assert(second && second->attachments.empty());
    assert(!source.next());
    std::remove(path);

    const std::string root = "/tmp/assetmind_sink_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    FilesystemSink sink(root);
    Attachment doc{"../escape.pdf", "data"};
    std::string stored = sink.store("I3", "loan_documents", doc);
    assert(fs::exists(stored));
    assert(fs::path(stored).parent_path() == fs::path(root) / "I3" / "loan_documents");

    std::string parked = sink.park("general", doc);
    std::string parked_again = sink.park("general", doc);
    assert(parked != parked_again);
    std::string moved = sink.relocate(parked, "HARBOR", "rent_roll");
    assert(fs::exists(moved));
    assert(!fs::exists(parked));
    sink.discard(parked_again);
    assert(!fs::exists(parked_again));
    fs::remove_all(root, ec);

    std::cout << "  PASS" << std::endl;
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    auto h = make_harness();
    rpc::Handler handler(h.engine.get());

    auto call = [&](const std::string& method, const json& params) {
        json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}, {"params", params}};
        return json::parse(handler.handle(req.dump()));
    };

    auto parse_error = json::parse(handler.handle("{not json"));
    assert(parse_error["error"]["code"] == rpc::error::PARSE_ERROR);

    auto unknown = call("no_such_method", json::object());
    assert(unknown["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    auto invalid = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":2,"method":"describe","params":[1]})"));
    assert(invalid["error"]["code"] == rpc::error::INVALID_REQUEST);

    auto described = call("describe", json::object());
    assert(described["result"]["version"] == ASSETMIND_VERSION);
    assert(described["result"]["methods"].size() == handler.methods().size());

    auto boot = call("bootstrap", {{"knowledge", sample_knowledge()}});
    assert(boot["result"]["status"] == "loaded");

    Email email = i3_email();
    auto routed = call("classify_attachment", {
        {"email", {{"sender", email.sender}, {"subject", email.subject}, {"body", email.body}}},
        {"attachment", {{"filename", "RLV_TRM_i3_TD.pdf"}, {"content", "%PDF"}}},
    });
    assert(routed["result"]["state"] == "auto_processed");
    assert(routed["result"]["asset_id"] == "I3");

    auto missing = call("resolve_conflict", {{"id", "x"}});
    assert(missing["error"]["code"] == rpc::error::INVALID_PARAMS);

    auto rejected = call("resolve_conflict", {{"id", "x"}, {"resolution", "updated"}});
    assert(rejected["error"]["code"] == rpc::error::REJECTED);

    auto reviews = call("get_pending_reviews", {{"reason", "bogus"}});
    assert(reviews["error"]["code"] == rpc::error::INVALID_PARAMS);

    auto stats = call("get_knowledge_stats", json::object());
    assert(stats["result"]["collections"]["assets"] == 2);

    h.backend->set_fail_writes(true);
    auto unavailable = call("record_feedback", {
        {"filename", "x.pdf"}, {"corrected_category", "loan_documents"}, {"corrected_asset", "I3"}});
    assert(unavailable["error"]["code"] == rpc::error::STORAGE_UNAVAILABLE);
    h.backend->set_fail_writes(false);

    auto recorded = call("record_feedback", {
        {"filename", "x.pdf"}, {"corrected_category", "loan_documents"}, {"corrected_asset", "I3"}});
    assert(recorded["result"]["outcome"] == "inserted");

    assert(version::protocol_compatible(ASSETMIND_PROTOCOL_VERSION_MAJOR, 0));
    assert(!version::protocol_compatible(ASSETMIND_PROTOCOL_VERSION_MAJOR + 1, 0));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== AssetMind Tests ===" << std::endl;
    set_quiet(true);

    test_decide_resolution();
    test_text_matching();
    test_confidence_bands();
    test_config_overrides();

    std::cout << std::endl;
    std::cout << "=== Knowledge Stores ===" << std::endl;
    test_idempotent_ingest();
    test_identifier_clash();
    test_accepted_asset_stays_disjoint();
    test_file_type_conflict();
    test_rule_contradiction_review();
    test_concurrent_learning();
    test_file_type_outcome_learning();
    test_episodic_eviction();
    test_contact_association();
    test_review_queue_priority();
    test_worker_pool_bound();

    std::cout << std::endl;
    std::cout << "=== Scoring ===" << std::endl;
    test_disjoint_identifier_ranking();
    test_match_tiers();
    test_sender_and_experience_signals();
    test_classifier();
    test_pattern_input_bound();

    std::cout << std::endl;
    std::cout << "=== Engine ===" << std::endl;
    test_bootstrap_once();
    test_bootstrap_legacy_layout();
    test_i3_scenario();
    test_unmapped_sender_scenario();
    test_feedback_raises_confidence();
    test_review_resolution();
    test_review_resolution_retry();
    test_disallowed_and_quarantine();
    test_batch_processing();
    test_similarity_timeout();
    test_similarity_saturation();
    test_cancellation();
    test_storage_failure();
    test_knowledge_stats();

    std::cout << std::endl;
    std::cout << "=== Persistence and RPC ===" << std::endl;
    test_sqlite_persistence();
    test_email_source_and_filesystem_sink();
    test_rpc_handler();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
