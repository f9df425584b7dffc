#pragma once
// Knowledge Store: the interface all four partitions share
//
// Each partition owns one or more fact tables and writes only through the
// deduplication gate. The common surface lets bootstrap and stats treat
// partitions uniformly: load, count, generic JSON ingest and query.

#include "dedup_gate.hpp"
#include "fact_table.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace assetmind {

using json = nlohmann::json;

class KnowledgeStore {
public:
    virtual ~KnowledgeStore() = default;

    virtual const char* name() const = 0;

    // Rebuild in-memory state from the backend
    virtual bool load() = 0;

    // Collection name -> stored count
    virtual std::map<std::string, size_t> counts() const = 0;

    // Collections this partition owns
    virtual std::vector<std::string> collections() const = 0;

    // Ingest a JSON payload into one of this partition's collections
    virtual IngestResult ingest_json(const std::string& collection, const json& payload,
                                     ConfidenceTier tier, const std::string& source) = 0;

    virtual std::vector<json> query(const std::string& collection,
                                    const std::function<bool(const json&)>& filter = {}) const = 0;
};

namespace detail {

template<typename T>
IngestResult ingest_json_into(DeduplicationGate& gate, FactTable<T>& table, const json& payload,
                              ConfidenceTier tier, const std::string& source) {
    T fact;
    try {
        fact = payload.get<T>();
    } catch (const json::exception& e) {
        IngestResult r;
        r.outcome = IngestOutcome::Rejected;
        r.reason = std::string("malformed ") + FactTraits<T>::collection + " record: " + e.what();
        return r;
    }
    if (!payload.contains("confidence")) fact.tier = tier;
    if (fact.source.empty()) fact.source = source;
    return gate.ingest(table, std::move(fact), "ingested from " + source);
}

template<typename T>
std::vector<json> query_table(const FactTable<T>& table, const std::function<bool(const json&)>& filter) {
    std::vector<json> out;
    for (const auto& fact : table.all()) {
        json j = fact;
        if (!filter || filter(j)) out.push_back(std::move(j));
    }
    return out;
}

inline IngestResult unknown_collection(const char* store, const std::string& collection) {
    IngestResult r;
    r.outcome = IngestOutcome::Rejected;
    r.reason = std::string(store) + " has no collection '" + collection + "'";
    return r;
}

} // namespace detail

} // namespace assetmind
