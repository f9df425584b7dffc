// assetmind: Command-line interface for the attachment router
//
// Usage: assetmind <command> [options]
//
// Commands:
//   bootstrap FILE        Seed the knowledge base (once per collection)
//   classify FILE         Route every attachment of the emails in FILE
//   feedback              Record a human correction
//   conflicts             List conflicts awaiting a decision
//   resolve ID ACTION     Decide a conflict (updated | rejected)
//   reviews               List pending review items
//   review ID ACTION      Store or discard a review item (store | discard)
//   stats                 Knowledge base statistics
//   audit                 Recent store mutations
//   serve                 JSON-RPC 2.0 over stdin/stdout, one request per line

#include <assetmind/engine.hpp>
#include <assetmind/rpc/handler.hpp>
#include <assetmind/version.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace assetmind;

static std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested.store(true);
}

const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "assetmind " << ASSETMIND_VERSION << " - Email attachment routing\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  bootstrap <file>       Seed the knowledge base from a JSON document\n"
              << "  classify <file>        Route attachments of the emails in a JSON file\n"
              << "  feedback               Record a correction (--file, --context, --category, --asset)\n"
              << "  conflicts              List conflicts awaiting a decision\n"
              << "  resolve <id> <action>  Decide a conflict: updated | rejected\n"
              << "  reviews                List pending review items (--reason R)\n"
              << "  review <id> <action>   Decide a review item: store | discard\n"
              << "  stats                  Knowledge base statistics\n"
              << "  audit                  Recent store mutations (--limit N)\n"
              << "  serve                  JSON-RPC 2.0 on stdin/stdout\n"
              << "  help                   Show this help\n\n"
              << "Options:\n"
              << "  --db PATH              Knowledge database (default: assetmind.db, :memory: for none)\n"
              << "  --config PATH          JSON file overriding thresholds and limits\n"
              << "  --store DIR            Document root (default: ./documents)\n"
              << "  --file NAME            Filename (feedback)\n"
              << "  --context TEXT         Subject or excerpt (feedback)\n"
              << "  --category NAME        Category (feedback, review)\n"
              << "  --asset ID             Asset id (feedback, review)\n"
              << "  --trust-sender         Learn the sender on review store\n"
              << "  --reason R             Review reason filter\n"
              << "  --limit N              Result limit (default: 20)\n"
              << "  --json                 Output as JSON\n"
              << "  -v, --verbose          Enable verbose debug logging\n"
              << "  --quiet                Only warnings on stderr\n"
              << "  --version              Show version\n";
}

int print_json(const json& j) {
    std::cout << j.dump(2) << "\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_bootstrap(Engine& engine, const std::string& file) {
    BootstrapReport report;
    if (!engine.bootstrap_file(file, report)) {
        std::cerr << "Error: cannot read knowledge base " << file << "\n";
        return 1;
    }
    print_json(report_to_json(report));
    return report.status == "failed" ? 1 : 0;
}

int cmd_classify(Engine& engine, const std::string& file, bool json_output) {
    JsonFileEmailSource source(file);
    if (!source.open()) {
        std::cerr << "Error: cannot read emails from " << file << "\n";
        return 1;
    }
    std::vector<Email> emails;
    while (auto email = source.next()) emails.push_back(std::move(*email));

    auto results = engine.process_batch(emails);

    int failures = 0;
    json out = json::array();
    for (size_t i = 0; i < emails.size(); ++i) {
        for (const auto& d : results[i]) {
            if (!d.error.empty()) failures++;
            if (json_output) {
                json j = decision_to_json(d);
                j["email"] = emails[i].id;
                out.push_back(j);
                continue;
            }
            std::cout << d.filename << "  " << routing_state_name(d.state);
            if (!d.asset_id.empty()) std::cout << "  " << d.asset_id << "/" << d.category;
            std::cout << "  " << d.confidence;
            if (!d.review_id.empty()) std::cout << "  review=" << d.review_id;
            if (!d.stored_path.empty()) std::cout << "  -> " << d.stored_path;
            std::cout << "\n";
        }
    }
    if (json_output) print_json(out);
    return failures > 0 ? 1 : 0;
}

int cmd_feedback(Engine& engine, const std::string& file, const std::string& context,
                 const std::string& category, const std::string& asset) {
    if (file.empty() || (category.empty() && asset.empty())) {
        std::cerr << "Usage: assetmind feedback --file NAME [--context TEXT] "
                     "[--category C] [--asset A]\n";
        return 1;
    }
    auto result = engine.record_feedback(file, context, category, asset);
    std::cout << ingest_outcome_name(result.outcome);
    if (!result.reason.empty()) std::cout << ": " << result.reason;
    std::cout << "\n";
    return result.stored() ? 0 : 1;
}

int cmd_conflicts(Engine& engine, bool json_output) {
    auto pending = engine.get_pending_conflicts();
    if (json_output) return print_json(pending);
    if (pending.empty()) {
        std::cout << "No pending conflicts\n";
        return 0;
    }
    for (const auto& c : pending) {
        std::cout << c.id.to_string() << "  " << c.collection << "/" << c.identity_key
                  << "  " << conflict_type_name(c.type) << " (" << severity_name(c.severity) << ")\n";
    }
    return 0;
}

int cmd_resolve(Engine& engine, const std::string& id, const std::string& action) {
    Resolution resolution;
    if (id.empty() || !parse_resolution(action, resolution) ||
        resolution == Resolution::Pending || resolution == Resolution::HumanReview) {
        std::cerr << "Usage: assetmind resolve <id> updated|rejected\n";
        return 1;
    }
    std::string error;
    if (!engine.resolve_conflict(id, resolution, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cout << "Resolved " << id << ": " << resolution_name(resolution) << "\n";
    return 0;
}

int cmd_reviews(Engine& engine, const std::string& reason_name, int limit, bool json_output) {
    ReviewReason reason = ReviewReason::None;
    if (!reason_name.empty()) {
        reason = parse_review_reason(reason_name);
        if (reason == ReviewReason::None) {
            std::cerr << "Unknown review reason: " << reason_name << "\n";
            return 1;
        }
    }
    auto items = engine.pending_reviews(reason);
    if (limit > 0 && items.size() > static_cast<size_t>(limit)) items.resize(limit);
    if (json_output) return print_json(items);
    for (const auto& item : items) {
        std::cout << item.id.to_string() << "  " << review_reason_name(item.reason)
                  << "  " << item.bucket << "  " << item.filename;
        if (!item.suggested_asset.empty()) {
            std::cout << "  (" << item.suggested_asset << "/" << item.suggested_category << ")";
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_review(Engine& engine, const std::string& id, const std::string& action,
               const std::string& asset, const std::string& category, bool trust_sender) {
    ReviewResolution r;
    if (action == "store") {
        r.action = ReviewOutcome::Stored;
    } else if (action == "discard") {
        r.action = ReviewOutcome::Discarded;
    } else {
        std::cerr << "Usage: assetmind review <id> store|discard [--asset A] [--category C]\n";
        return 1;
    }
    r.asset_id = asset;
    r.category = category;
    r.trust_sender = trust_sender;

    std::string error;
    if (!engine.resolve_review(id, r, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cout << "Review " << id << ": " << review_outcome_name(r.action) << "\n";
    return 0;
}

int cmd_stats(Engine& engine, bool json_output) {
    auto stats = engine.get_knowledge_stats();
    if (json_output) return print_json(stats_to_json(stats));

    std::cout << "assetmind " << ASSETMIND_VERSION << "\n\n";
    std::cout << "Collections:\n";
    for (const auto& [name, n] : stats.collections) {
        std::cout << "  " << name << ": " << n << "\n";
    }
    std::cout << "\nConflicts: " << stats.conflicts_pending << " pending / "
              << stats.conflicts_total << " total\n";
    std::cout << "Reviews:   " << stats.reviews_pending << " pending / "
              << stats.reviews_total << " total\n";
    std::cout << "Human corrections: " << stats.corrections << "\n";
    std::cout << "Audit entries:     " << stats.audit_entries << "\n";
    return 0;
}

int cmd_audit(Engine& engine, int limit) {
    json out = json::array();
    for (const auto& entry : engine.audit_log(limit > 0 ? limit : 20)) out.push_back(entry);
    return print_json(out);
}

int cmd_serve(Engine& engine) {
    rpc::Handler handler(&engine);
    log_info("serve", "listening on stdin (protocol %d.%d)",
             ASSETMIND_PROTOCOL_VERSION_MAJOR, ASSETMIND_PROTOCOL_VERSION_MINOR);

    std::string line;
    while (!g_shutdown_requested.load() && std::getline(std::cin, line)) {
        if (line.empty()) continue;
        std::cout << handler.handle(line) << "\n";
        std::cout.flush();
    }
    log_info("serve", "shutdown complete");
    return 0;
}

int main(int argc, char* argv[]) {
    EngineConfig config;
    apply_environment(config);

    std::string command;
    std::vector<std::string> positional;
    std::string config_path;
    std::string db_path;
    std::string store_root = "./documents";
    std::string fb_file, fb_context, category, asset, reason;
    bool trust_sender = false;
    bool json_output = false;
    int limit = 20;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
            store_root = argv[++i];
        } else if (strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            fb_file = argv[++i];
        } else if (strcmp(argv[i], "--context") == 0 && i + 1 < argc) {
            fb_context = argv[++i];
        } else if (strcmp(argv[i], "--category") == 0 && i + 1 < argc) {
            category = argv[++i];
        } else if (strcmp(argv[i], "--asset") == 0 && i + 1 < argc) {
            asset = argv[++i];
        } else if (strcmp(argv[i], "--reason") == 0 && i + 1 < argc) {
            reason = argv[++i];
        } else if (strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--trust-sender") == 0) {
            trust_sender = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            set_verbose(true);
        } else if (strcmp(argv[i], "--quiet") == 0) {
            set_quiet(true);
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--version") == 0) {
            std::cout << "assetmind " << ASSETMIND_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else {
                positional.push_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (!config_path.empty() && !load_config(config_path, config)) {
        std::cerr << "Error: invalid config " << config_path << "\n";
        return 1;
    }
    if (!db_path.empty()) config.db_path = db_path;

    auto arg = [&](size_t i) { return i < positional.size() ? positional[i] : std::string(); };

    Engine engine(config, make_backend(config), std::make_shared<FilesystemSink>(store_root));
    if (!engine.open()) {
        std::cerr << "Error: failed to open knowledge base at " << config.db_path << "\n";
        return 1;
    }

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    int result = 0;
    try {
        if (command == "bootstrap") {
            if (arg(0).empty()) {
                std::cerr << "Usage: assetmind bootstrap <knowledge_base.json>\n";
                result = 1;
            } else {
                result = cmd_bootstrap(engine, arg(0));
            }
        } else if (command == "classify") {
            if (arg(0).empty()) {
                std::cerr << "Usage: assetmind classify <emails.json>\n";
                result = 1;
            } else {
                result = cmd_classify(engine, arg(0), json_output);
            }
        } else if (command == "feedback") {
            result = cmd_feedback(engine, fb_file, fb_context, category, asset);
        } else if (command == "conflicts") {
            result = cmd_conflicts(engine, json_output);
        } else if (command == "resolve") {
            result = cmd_resolve(engine, arg(0), arg(1));
        } else if (command == "reviews") {
            result = cmd_reviews(engine, reason, limit, json_output);
        } else if (command == "review") {
            result = cmd_review(engine, arg(0), arg(1), asset, category, trust_sender);
        } else if (command == "stats") {
            result = cmd_stats(engine, json_output);
        } else if (command == "audit") {
            result = cmd_audit(engine, limit);
        } else if (command == "serve") {
            result = cmd_serve(engine);
        } else {
            std::cerr << "Unknown command: " << command << "\n\n";
            print_usage(argv[0]);
            result = 1;
        }
    } catch (const StorageError& e) {
        std::cerr << "Error: storage unavailable: " << e.what() << "\n";
        result = 1;
    }

    engine.close();
    return result;
}
