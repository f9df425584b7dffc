#pragma once
// Similarity: nearest past episodes for a query text
//
// SimilarityLookup is the capability the engine calls; any embedding
// service can implement it. TermVectorIndex is the local default
// (term-frequency cosine). SimilarityGateway bounds every call with a
// timeout and a cap on outstanding calls, and reports a degraded result
// instead of failing.

#include "log.hpp"
#include "text.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetmind {

struct SimilarHit {
    std::string record_id;
    float similarity = 0.0f;     // [0,1]
};

class SimilarityLookup {
public:
    virtual ~SimilarityLookup() = default;

    // Up to k hits, most similar first
    virtual std::vector<SimilarHit> nearest(const std::string& query, size_t k) = 0;

    // Keep the lookup in step with the episodic log
    virtual void index(const std::string& record_id, const std::string& text) = 0;
    virtual void remove(const std::string& record_id) = 0;
};

class TermVectorIndex : public SimilarityLookup {
public:
    std::vector<SimilarHit> nearest(const std::string& query, size_t k) override {
        auto q = tokenize(query, 2);
        std::vector<SimilarHit> hits;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, tokens] : docs_) {
                float sim = token_cosine(q, tokens);
                if (sim > 0.0f) hits.push_back({id, sim});
            }
        }
        std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
            return a.similarity > b.similarity;
        });
        if (hits.size() > k) hits.resize(k);
        return hits;
    }

    void index(const std::string& record_id, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        docs_[record_id] = tokenize(text, 2);
    }

    void remove(const std::string& record_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        docs_.erase(record_id);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return docs_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::string>> docs_;
};

struct SimilarityResult {
    std::vector<SimilarHit> hits;
    bool degraded = false;       // True when the lookup timed out or failed
    std::string reason;
};

class SimilarityGateway {
public:
    SimilarityGateway(std::shared_ptr<SimilarityLookup> lookup, int timeout_ms,
                      size_t workers = 2, size_t max_pending = 8)
        : lookup_(std::move(lookup))
        , timeout_ms_(timeout_ms)
        , max_pending_(std::max<size_t>(1, max_pending))
        , pool_(workers) {}

    // Never throws. Lookups run on a fixed pool; an abandoned call keeps
    // its slot until it returns, and once max_pending calls are
    // outstanding new queries degrade at once instead of queueing.
    SimilarityResult query(const std::string& text, size_t k) {
        SimilarityResult result;
        if (!lookup_) {
            result.degraded = true;
            result.reason = "no similarity lookup attached";
            return result;
        }

        if (pending_.fetch_add(1) >= max_pending_) {
            pending_--;
            result.degraded = true;
            result.reason = "similarity lookups saturated (" + std::to_string(max_pending_) + " pending)";
            log_warn("similarity", "%s", result.reason.c_str());
            return result;
        }

        std::future<std::vector<SimilarHit>> future;
        try {
            auto lookup = lookup_;
            future = pool_.submit([this, lookup, text, k]() {
                struct Release {
                    std::atomic<size_t>& n;
                    ~Release() { n--; }
                } release{pending_};
                return lookup->nearest(text, k);
            });
        } catch (const std::runtime_error& e) {
            pending_--;
            result.degraded = true;
            result.reason = std::string("similarity lookup not started: ") + e.what();
            return result;
        }

        if (future.wait_for(std::chrono::milliseconds(timeout_ms_)) != std::future_status::ready) {
            result.degraded = true;
            result.reason = "similarity lookup timed out after " + std::to_string(timeout_ms_) + "ms";
            log_warn("similarity", "%s", result.reason.c_str());
            return result;
        }

        try {
            result.hits = future.get();
        } catch (const std::exception& e) {
            result.degraded = true;
            result.reason = std::string("similarity lookup failed: ") + e.what();
            log_warn("similarity", "%s", result.reason.c_str());
        }
        return result;
    }

    // Lookups submitted and not yet returned
    size_t pending() const { return pending_.load(); }

    SimilarityLookup* lookup() const { return lookup_.get(); }

private:
    std::shared_ptr<SimilarityLookup> lookup_;
    int timeout_ms_;
    size_t max_pending_;
    std::atomic<size_t> pending_{0};
    WorkerPool pool_;                // Last: joins before pending_ goes away
};

} // namespace assetmind
