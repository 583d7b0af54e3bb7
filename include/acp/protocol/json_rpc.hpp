#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace acp {
namespace protocol {

/**
 * @brief JSON-RPC 2.0 encoder for outbound messages.
 *
 * Produces single-line JSON (no embedded newlines) suitable for the
 * newline-delimited stdio transport. Decoding lives in FrameClassifier.
 * All methods are static and stateless.
 */
class JsonRpc {
public:
    static std::string encode_request(const Request& request) {
        nlohmann::json j;
        j["jsonrpc"] = "2.0";
        j["id"] = request_id_to_json(request.id);
        j["method"] = request.method;

        if (!request.params.is_null()) {
            j["params"] = request.params;
        }

        return j.dump();
    }

    static std::string encode_response(const Response& response) {
        nlohmann::json j;
        j["jsonrpc"] = "2.0";
        j["id"] = request_id_to_json(response.id);

        if (response.error.has_value()) {
            nlohmann::json err;
            err["code"] = response.error->code;
            err["message"] = response.error->message;
            if (response.error->data.has_value()) {
                err["data"] = *response.error->data;
            }
            j["error"] = err;
        } else {
            j["result"] = response.result.value_or(nlohmann::json::object());
        }

        return j.dump();
    }

    static std::string encode_notification(const std::string& method,
                                           const nlohmann::json& params = nlohmann::json::object()) {
        nlohmann::json j;
        j["jsonrpc"] = "2.0";
        j["method"] = method;
        if (!params.is_null()) {
            j["params"] = params;
        }
        return j.dump();
    }

    static std::string encode_result(const RequestId& id, nlohmann::json result) {
        Response response;
        response.id = id;
        response.result = std::move(result);
        return encode_response(response);
    }

    static std::string encode_error(const RequestId& id, int code, const std::string& message) {
        Response response;
        response.id = id;
        response.error = JsonRpcError{code, message, std::nullopt};
        return encode_response(response);
    }
};

} // namespace protocol
} // namespace acp
