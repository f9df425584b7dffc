#pragma once
// Knowledge Bootstrap: seed the partitions from a knowledge-base document
//
// Each collection is seeded at most once, ever:
//   lock_collection(c)          coarse lock, shared with other processes
//   has_marker(c)  -> skip      already_loaded
//   ingest every record         tier high, source knowledge_base_bootstrap
//   set_marker(c)
// A failure part way leaves the marker unset; rerunning is safe because
// the gate turns records already stored into duplicates.
//
// Accepted document:
//   {"assets": [...], "file_types": [...] or {"safe": {...}, ...},
//    "patterns": [...], "senders": [...], "rules": [...],
//    "categories": {"private_credit": [...]} or [...]}
// The legacy {"file_type_validation": {"safe_file_types": {...}, ...}}
// layout is read as file_types.

#include "knowledge_store.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

constexpr const char* BOOTSTRAP_SOURCE = "knowledge_base_bootstrap";

struct CollectionReport {
    std::string collection;
    std::string status;            // loaded, already_loaded, failed
    size_t inserted = 0;
    size_t updated = 0;
    size_t duplicates = 0;
    size_t rejected = 0;
    size_t queued = 0;
    std::vector<std::string> errors;
};

struct BootstrapReport {
    std::string status;            // loaded, already_loaded, failed, empty
    std::vector<CollectionReport> collections;
    std::map<std::string, size_t> counts;   // Stored count per collection afterwards
};

inline json report_to_json(const BootstrapReport& r) {
    json cols = json::array();
    for (const auto& c : r.collections) {
        cols.push_back({
            {"collection", c.collection},
            {"status", c.status},
            {"inserted", c.inserted},
            {"updated", c.updated},
            {"duplicates", c.duplicates},
            {"rejected", c.rejected},
            {"queued_for_review", c.queued},
            {"errors", c.errors},
        });
    }
    return {{"status", r.status}, {"collections", cols}, {"counts", r.counts}};
}

class KnowledgeBootstrap {
public:
    KnowledgeBootstrap(KnowledgeBackend& backend, std::vector<KnowledgeStore*> stores)
        : backend_(backend), stores_(std::move(stores)) {}

    BootstrapReport load(const json& doc) {
        BootstrapReport report;
        auto sections = split(doc);
        if (sections.empty()) {
            report.status = "empty";
            return report;
        }

        bool any_loaded = false, any_failed = false;
        for (const auto& [collection, records] : sections) {
            auto col = load_collection(collection, records);
            if (col.status == "loaded") any_loaded = true;
            if (col.status == "failed") any_failed = true;
            report.collections.push_back(std::move(col));
        }
        report.status = any_failed ? "failed" : any_loaded ? "loaded" : "already_loaded";

        for (auto* store : stores_) {
            for (const auto& [c, n] : store->counts()) report.counts[c] = n;
        }
        log_info("bootstrap", "%s (%zu collections)", report.status.c_str(),
                 report.collections.size());
        return report;
    }

    // False if the file cannot be read or parsed
    bool load_file(const std::string& path, BootstrapReport& report) {
        std::ifstream f(path);
        if (!f) {
            log_warn("bootstrap", "cannot open %s", path.c_str());
            return false;
        }
        json doc;
        try {
            f >> doc;
        } catch (const json::exception& e) {
            log_warn("bootstrap", "error reading %s: %s", path.c_str(), e.what());
            return false;
        }
        report = load(doc);
        return true;
    }

private:
    KnowledgeStore* owner(const std::string& collection) const {
        for (auto* store : stores_) {
            for (const auto& c : store->collections()) {
                if (c == collection) return store;
            }
        }
        return nullptr;
    }

    CollectionReport load_collection(const std::string& collection, const std::vector<json>& records) {
        CollectionReport col;
        col.collection = collection;

        KnowledgeStore* store = owner(collection);
        if (!store) {
            col.status = "failed";
            col.errors.push_back("no store owns collection " + collection);
            return col;
        }

        try {
            auto lock = backend_.lock_collection(collection);
            if (backend_.has_marker(collection)) {
                col.status = "already_loaded";
                log_debug("bootstrap", "%s already loaded", collection.c_str());
                return col;
            }

            for (const auto& record : records) {
                auto r = store->ingest_json(collection, record, ConfidenceTier::High, BOOTSTRAP_SOURCE);
                switch (r.outcome) {
                    case IngestOutcome::Inserted:        col.inserted++; break;
                    case IngestOutcome::Updated:         col.updated++; break;
                    case IngestOutcome::Duplicate:       col.duplicates++; break;
                    case IngestOutcome::QueuedForReview: col.queued++; break;
                    case IngestOutcome::Rejected:
                        col.rejected++;
                        col.errors.push_back(r.reason);
                        break;
                }
            }
            backend_.set_marker(collection);
            col.status = "loaded";
            log_info("bootstrap", "%s: %zu inserted, %zu duplicates, %zu rejected",
                     collection.c_str(), col.inserted, col.duplicates, col.rejected);
        } catch (const StorageError& e) {
            col.status = "failed";
            col.errors.push_back(e.what());
            log_warn("bootstrap", "%s failed: %s", collection.c_str(), e.what());
        }
        return col;
    }

    // Collection name -> records, in seeding order
    static std::vector<std::pair<std::string, std::vector<json>>> split(const json& doc) {
        std::vector<std::pair<std::string, std::vector<json>>> out;
        if (!doc.is_object()) return out;

        auto list = [](const json& v) {
            std::vector<json> records;
            if (v.is_array()) {
                for (const auto& r : v) records.push_back(r);
            }
            return records;
        };

        if (doc.contains("categories")) {
            const auto& c = doc["categories"];
            std::vector<json> records;
            if (c.is_object()) {
                for (const auto& [type, cats] : c.items()) {
                    records.push_back({{"asset_type", type}, {"categories", cats}});
                }
            } else {
                records = list(c);
            }
            out.emplace_back("categories", std::move(records));
        }
        if (doc.contains("assets")) out.emplace_back("assets", list(doc["assets"]));

        std::vector<json> file_types;
        if (doc.contains("file_types")) {
            const auto& ft = doc["file_types"];
            if (ft.is_array()) {
                file_types = list(ft);
            } else {
                file_types = grouped_file_types(ft);
            }
        }
        if (doc.contains("file_type_validation")) {
            auto legacy = grouped_file_types(doc["file_type_validation"]);
            file_types.insert(file_types.end(), legacy.begin(), legacy.end());
        }
        if (doc.contains("file_types") || doc.contains("file_type_validation")) {
            out.emplace_back("file_types", std::move(file_types));
        }

        if (doc.contains("patterns")) out.emplace_back("patterns", list(doc["patterns"]));
        if (doc.contains("rules")) out.emplace_back("rules", list(doc["rules"]));
        if (doc.contains("senders")) out.emplace_back("senders", list(doc["senders"]));
        return out;
    }

    // {"safe": {".pdf": {...}}, "restricted_file_types": [...], ...}
    static std::vector<json> grouped_file_types(const json& groups) {
        std::vector<json> out;
        if (!groups.is_object()) return out;
        for (const auto& [name, entries] : groups.items()) {
            std::string level = name;
            auto suffix = level.find("_file_types");
            if (suffix != std::string::npos) level = level.substr(0, suffix);
            SecurityLevel parsed;
            if (!parse_security_level(level, parsed)) {
                log_warn("bootstrap", "unknown file type group '%s'", name.c_str());
                continue;
            }

            auto with_defaults = [&](json rule) {
                if (!rule.contains("is_allowed")) rule["is_allowed"] = parsed == SecurityLevel::Safe;
                if (!rule.contains("security_level")) rule["security_level"] = security_level_name(parsed);
                return rule;
            };

            if (entries.is_object()) {
                for (const auto& [ext, rule] : entries.items()) {
                    json r = rule.is_object() ? rule : json::object();
                    r["extension"] = ext;
                    out.push_back(with_defaults(std::move(r)));
                }
            } else if (entries.is_array()) {
                for (const auto& rule : entries) {
                    if (rule.is_object()) out.push_back(with_defaults(rule));
                }
            }
        }
        return out;
    }

    KnowledgeBackend& backend_;
    std::vector<KnowledgeStore*> stores_;
};

} // namespace assetmind
