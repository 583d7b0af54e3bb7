#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace acp {
namespace protocol {

// ============================================================================
// JSON-RPC 2.0 Types
// ============================================================================

using RequestId = std::variant<int, std::string>;

inline std::string request_id_to_string(const RequestId& id) {
    if (std::holds_alternative<int>(id)) {
        return std::to_string(std::get<int>(id));
    }
    return "\"" + std::get<std::string>(id) + "\"";
}

inline nlohmann::json request_id_to_json(const RequestId& id) {
    return std::visit([](const auto& val) { return nlohmann::json(val); }, id);
}

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& other) const {
        return code == other.code && message == other.message && data == other.data;
    }
};

// Standard JSON-RPC error codes used by the engine
namespace error_codes {
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
} // namespace error_codes

// ============================================================================
// Frames
// ============================================================================

/** @brief Message with a method and no id; never answered. */
struct Notification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const Notification& other) const {
        return method == other.method && params == other.params;
    }
};

/** @brief Message with a method and an id; the peer expects exactly one Response. */
struct Request {
    RequestId id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const Request& other) const {
        return id == other.id && method == other.method && params == other.params;
    }
};

/** @brief Answer to a Request; carries either a result or an error. */
struct Response {
    RequestId id = 0;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool is_error() const { return error.has_value(); }

    bool operator==(const Response& other) const {
        return id == other.id && result == other.result && error == other.error;
    }
};

/**
 * @brief Closed set of well-formed wire messages.
 *
 * Determined once by the frame classifier; downstream code visits this
 * variant instead of probing for optional keys.
 */
using Frame = std::variant<Notification, Request, Response>;

inline const char* frame_kind(const Frame& frame) {
    switch (frame.index()) {
        case 0: return "notification";
        case 1: return "request";
        case 2: return "response";
    }
    return "unknown";
}

} // namespace protocol
} // namespace acp
