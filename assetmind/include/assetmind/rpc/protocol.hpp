#pragma once
// RPC Protocol: JSON-RPC 2.0 envelopes and error codes

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace assetmind::rpc {

using json = nlohmann::json;

// Replace invalid UTF-8 bytes with U+FFFD; filenames arrive from anywhere
inline std::string sanitize_utf8(const std::string& input) {
    std::string output;
    output.reserve(input.size());

    auto continuation = [&](size_t at) {
        return at < input.size() && (static_cast<unsigned char>(input[at]) & 0xC0) == 0x80;
    };

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t len = 0;
        if (c < 0x80) {
            len = 1;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
        }

        bool ok = len > 0;
        for (size_t k = 1; ok && k < len; ++k) ok = continuation(i + k);

        if (ok) {
            output.append(input, i, len);
            i += len;
        } else {
            output += "\xEF\xBF\xBD";
            ++i;
        }
    }
    return output;
}

namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // Service errors
    constexpr int STORAGE_UNAVAILABLE = -32001;
    constexpr int REJECTED = -32002;
}

// Thrown by method handlers; becomes an error response
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", sanitize_utf8(message)}
        }}
    };
}

inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be an object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    if (request.contains("params") && !request["params"].is_object()) {
        error_msg = "params must be an object";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json())
    };
}

} // namespace assetmind::rpc
