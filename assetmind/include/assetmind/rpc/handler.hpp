#pragma once
// RPC Handler: JSON-RPC 2.0 methods over one Engine
//
// Used by the stdio server (`assetmind serve`) and by tests. Each method
// takes a params object and returns a result object; failures surface as
// JSON-RPC errors, storage failures as STORAGE_UNAVAILABLE.

#include "protocol.hpp"
#include "../engine.hpp"
#include "../version.hpp"
#include <chrono>
#include <functional>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

namespace assetmind::rpc {

using json = nlohmann::json;

struct MethodSchema {
    std::string name;
    std::string description;
    json params;           // Parameter name -> description
};

using MethodHandler = std::function<json(const json&)>;

inline void require(const json& params, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (!params.contains(key)) {
            throw RpcError(error::INVALID_PARAMS, std::string("Missing required parameter: ") + key);
        }
    }
}

template<typename T>
inline T get_param(const json& params, const char* key, T default_val) {
    if (!params.contains(key) || params[key].is_null()) return default_val;
    try {
        return params[key].get<T>();
    } catch (const json::exception&) {
        throw RpcError(error::INVALID_PARAMS, std::string("Invalid type for parameter: ") + key);
    }
}

class Handler {
public:
    explicit Handler(Engine* engine)
        : engine_(engine), start_time_(std::chrono::steady_clock::now()) {
        register_methods();
    }

    // One request line in, one response line out
    std::string handle(const std::string& request_str) {
        json response;
        try {
            response = handle_request(json::parse(request_str));
        } catch (const json::parse_error& e) {
            response = make_error(json(), error::PARSE_ERROR, std::string("JSON parse error: ") + e.what());
        }
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        auto it = handlers_.find(info.method);
        if (it == handlers_.end()) {
            return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
        }

        try {
            return make_result(info.id, it->second(info.params));
        } catch (const RpcError& e) {
            return make_error(info.id, e.code(), e.what());
        } catch (const StorageError& e) {
            log_warn("rpc", "%s: storage unavailable: %s", info.method.c_str(), e.what());
            return make_error(info.id, error::STORAGE_UNAVAILABLE,
                              std::string("Storage unavailable: ") + e.what());
        } catch (const json::exception& e) {
            return make_error(info.id, error::INVALID_PARAMS, std::string("Invalid params: ") + e.what());
        } catch (const std::exception& e) {
            log_warn("rpc", "%s failed: %s", info.method.c_str(), e.what());
            return make_error(info.id, error::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
        }
    }

    const std::vector<MethodSchema>& methods() const { return schemas_; }

private:
    void add(MethodSchema schema, MethodHandler handler) {
        handlers_[schema.name] = std::move(handler);
        schemas_.push_back(std::move(schema));
    }

    void register_methods() {
        add({"describe", "Server version and available methods", json::object()},
            [this](const json&) { return describe(); });

        add({"classify_attachment", "Route one attachment of an email",
             {{"email", "{sender, subject, body}"}, {"attachment", "{filename, content}"}}},
            [this](const json& p) { return classify_attachment(p); });

        add({"process_email", "Route every attachment of an email",
             {{"email", "{sender, subject, body, attachments[]}"}}},
            [this](const json& p) { return process_email(p); });

        add({"record_feedback", "Record a human correction",
             {{"filename", "Document filename"}, {"context", "Subject or body excerpt"},
              {"corrected_category", "Correct category"}, {"corrected_asset", "Correct asset id"}}},
            [this](const json& p) { return record_feedback(p); });

        add({"get_pending_conflicts", "Conflicts awaiting a human decision", json::object()},
            [this](const json&) { return get_pending_conflicts(); });

        add({"resolve_conflict", "Decide a pending conflict",
             {{"id", "Conflict id"}, {"resolution", "updated | rejected"}}},
            [this](const json& p) { return resolve_conflict(p); });

        add({"get_knowledge_stats", "Per-collection counts and queue sizes", json::object()},
            [this](const json&) { return stats_to_json(engine_->get_knowledge_stats()); });

        add({"get_pending_reviews", "Review items awaiting a human",
             {{"reason", "Optional filter: low_confidence | very_low_confidence | "
                         "no_asset_match | disallowed_file_type"}}},
            [this](const json& p) { return get_pending_reviews(p); });

        add({"resolve_review", "Store or discard a review item",
             {{"id", "Review item id"}, {"action", "store | discard"},
              {"asset_id", "Asset (defaults to suggestion)"},
              {"category", "Category (defaults to suggestion)"},
              {"trust_sender", "Learn the sender for this asset"}}},
            [this](const json& p) { return resolve_review(p); });

        add({"bootstrap", "Seed the knowledge base once per collection",
             {{"path", "Knowledge-base JSON file"}, {"knowledge", "Inline knowledge-base document"}}},
            [this](const json& p) { return bootstrap(p); });

        add({"get_audit_log", "Most recent store mutations", {{"limit", "Default 50"}}},
            [this](const json& p) { return audit_log(p); });
    }

    json describe() const {
        json list = json::array();
        for (const auto& m : schemas_) {
            list.push_back({{"name", m.name}, {"description", m.description}, {"params", m.params}});
        }
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count();
        return {{"name", "assetmind"}, {"version", ASSETMIND_VERSION},
                {"uptime_seconds", uptime}, {"methods", list}};
    }

    static Email email_from(const json& p) {
        if (p.contains("email")) return p["email"].get<Email>();
        return p.get<Email>();
    }

    json classify_attachment(const json& p) {
        Email email = email_from(p);
        Attachment attachment;
        if (p.contains("attachment")) {
            attachment = p["attachment"].get<Attachment>();
        } else if (!email.attachments.empty()) {
            attachment = email.attachments.front();
        } else {
            attachment.filename = get_param<std::string>(p, "filename", "");
            attachment.bytes = get_param<std::string>(p, "content", "");
        }
        if (attachment.filename.empty()) {
            throw RpcError(error::INVALID_PARAMS, "attachment filename is required");
        }
        return decision_to_json(engine_->classify_attachment(email, attachment));
    }

    json process_email(const json& p) {
        Email email = email_from(p);
        json decisions = json::array();
        for (const auto& d : engine_->process_email(email)) decisions.push_back(decision_to_json(d));
        return {{"decisions", decisions}};
    }

    json record_feedback(const json& p) {
        require(p, {"filename"});
        auto result = engine_->record_feedback(
            get_param<std::string>(p, "filename", ""),
            get_param<std::string>(p, "context", ""),
            get_param<std::string>(p, "corrected_category", ""),
            get_param<std::string>(p, "corrected_asset", ""));
        if (result.outcome == IngestOutcome::Rejected) throw RpcError(error::REJECTED, result.reason);
        return {{"outcome", ingest_outcome_name(result.outcome)}, {"id", result.id.to_string()}};
    }

    json get_pending_conflicts() const {
        json list = json::array();
        for (const auto& c : engine_->get_pending_conflicts()) list.push_back(c);
        return {{"conflicts", list}, {"count", list.size()}};
    }

    json resolve_conflict(const json& p) {
        require(p, {"id", "resolution"});
        Resolution resolution;
        if (!parse_resolution(get_param<std::string>(p, "resolution", ""), resolution)) {
            throw RpcError(error::INVALID_PARAMS, "resolution must be 'updated' or 'rejected'");
        }
        std::string err;
        if (!engine_->resolve_conflict(get_param<std::string>(p, "id", ""), resolution, err)) {
            throw RpcError(error::REJECTED, err);
        }
        return {{"resolved", true}, {"resolution", resolution_name(resolution)}};
    }

    json get_pending_reviews(const json& p) const {
        ReviewReason reason = ReviewReason::None;
        std::string filter = get_param<std::string>(p, "reason", "");
        if (!filter.empty()) {
            reason = parse_review_reason(filter);
            if (reason == ReviewReason::None) {
                throw RpcError(error::INVALID_PARAMS, "unknown review reason: " + filter);
            }
        }
        json list = json::array();
        for (const auto& item : engine_->pending_reviews(reason)) list.push_back(item);
        return {{"reviews", list}, {"count", list.size()}};
    }

    json resolve_review(const json& p) {
        require(p, {"id", "action"});
        ReviewResolution r;
        std::string action = get_param<std::string>(p, "action", "");
        if (action == "store") {
            r.action = ReviewOutcome::Stored;
        } else if (action == "discard") {
            r.action = ReviewOutcome::Discarded;
        } else {
            throw RpcError(error::INVALID_PARAMS, "action must be 'store' or 'discard'");
        }
        r.asset_id = get_param<std::string>(p, "asset_id", "");
        r.category = get_param<std::string>(p, "category", "");
        r.trust_sender = get_param<bool>(p, "trust_sender", false);

        std::string err;
        if (!engine_->resolve_review(get_param<std::string>(p, "id", ""), r, err)) {
            throw RpcError(error::REJECTED, err);
        }
        return {{"resolved", true}, {"outcome", review_outcome_name(r.action)}};
    }

    json bootstrap(const json& p) {
        if (p.contains("knowledge")) return report_to_json(engine_->bootstrap(p["knowledge"]));
        require(p, {"path"});
        BootstrapReport report;
        std::string path = get_param<std::string>(p, "path", "");
        if (!engine_->bootstrap_file(path, report)) {
            throw RpcError(error::INVALID_PARAMS, "cannot read knowledge base " + path);
        }
        return report_to_json(report);
    }

    json audit_log(const json& p) {
        json list = json::array();
        for (const auto& a : engine_->audit_log(get_param<size_t>(p, "limit", 50))) list.push_back(a);
        return {{"entries", list}};
    }

    Engine* engine_;
    std::chrono::steady_clock::time_point start_time_;
    std::vector<MethodSchema> schemas_;
    std::unordered_map<std::string, MethodHandler> handlers_;
};

} // namespace assetmind::rpc
