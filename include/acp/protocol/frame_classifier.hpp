#pragma once

#include "../types.hpp"
#include "types.hpp"
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace acp {
namespace protocol {

/**
 * @brief Turns raw stdio lines into classified JSON-RPC frames.
 *
 * Classification rules:
 * - object with "method" and no "id"           -> Notification
 * - object with "method" and "id"              -> Request
 * - object with "id" and exactly one of
 *   "result"/"error", and no "method"          -> Response
 * - array                                      -> expanded element by element
 *
 * Anything else (invalid JSON, scalars, objects of no known shape, ids that
 * are neither integers nor strings) is dropped with a warning. Nothing here
 * throws, so a hostile line can never stall the reader loop.
 */
class FrameClassifier {
public:
    /// Arrays nested deeper than this are dropped instead of expanded.
    static constexpr int kMaxBatchDepth = 32;

    /**
     * @brief Parse one line of agent output.
     *
     * Blank lines yield no frames.
     */
    static std::vector<Frame> parse_line(std::string_view line) {
        std::vector<Frame> frames;

        auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            return frames;
        }
        auto last = line.find_last_not_of(" \t\r\n");
        std::string_view trimmed = line.substr(first, last - first + 1);

        nlohmann::json value;
        try {
            value = nlohmann::json::parse(trimmed.begin(), trimmed.end());
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("ACP: invalid JSON ignored: {}", e.what());
            return frames;
        }

        expand(value, frames, 0);
        return frames;
    }

    /**
     * @brief Classify an already-parsed JSON value (object or batch).
     */
    static std::vector<Frame> classify(const nlohmann::json& value) {
        std::vector<Frame> frames;
        expand(value, frames, 0);
        return frames;
    }

    /**
     * @brief Classify a single JSON object.
     *
     * @return The frame, or std::nullopt if the object has no valid shape.
     */
    static std::optional<Frame> classify_object(const nlohmann::json& msg) {
        if (!msg.is_object()) {
            return std::nullopt;
        }

        const bool has_method = msg.contains("method");
        const bool has_id = msg.contains("id");
        const bool has_result = msg.contains("result");
        const bool has_error = msg.contains("error");

        if (has_method) {
            const auto& method = msg["method"];
            if (!method.is_string()) {
                return std::nullopt;
            }

            nlohmann::json params = nlohmann::json::object();
            auto params_it = msg.find("params");
            if (params_it != msg.end() && !params_it->is_null()) {
                params = *params_it;
            }

            if (!has_id) {
                return Frame{Notification{method.get<std::string>(), std::move(params)}};
            }

            auto id = decode_id(msg["id"]);
            if (!id) {
                return std::nullopt;
            }
            return Frame{Request{std::move(*id), method.get<std::string>(), std::move(params)}};
        }

        if (has_id && (has_result != has_error)) {
            auto id = decode_id(msg["id"]);
            if (!id) {
                return std::nullopt;
            }

            Response response;
            response.id = std::move(*id);

            if (has_result) {
                response.result = msg["result"];
                return Frame{std::move(response)};
            }

            const auto& err = msg["error"];
            if (!err.is_object()) {
                return std::nullopt;
            }
            JsonRpcError rpc_error;
            auto code_it = err.find("code");
            if (code_it != err.end() && code_it->is_number_integer()) {
                rpc_error.code = code_it->get<int>();
            }
            auto message_it = err.find("message");
            if (message_it != err.end() && message_it->is_string()) {
                rpc_error.message = message_it->get<std::string>();
            }
            auto data_it = err.find("data");
            if (data_it != err.end()) {
                rpc_error.data = *data_it;
            }
            response.error = std::move(rpc_error);
            return Frame{std::move(response)};
        }

        return std::nullopt;
    }

private:
    static void expand(const nlohmann::json& value, std::vector<Frame>& out, int depth) {
        if (value.is_object()) {
            auto frame = classify_object(value);
            if (frame) {
                out.push_back(std::move(*frame));
            } else {
                spdlog::warn("ACP: unrecognized message shape dropped: {}", preview(value));
            }
            return;
        }

        if (value.is_array()) {
            if (depth >= kMaxBatchDepth) {
                spdlog::warn("ACP: batch nested deeper than {} levels dropped", kMaxBatchDepth);
                return;
            }
            size_t dropped = 0;
            for (const auto& item : value) {
                if (item.is_object() || item.is_array()) {
                    expand(item, out, depth + 1);
                } else {
                    ++dropped;
                }
            }
            if (dropped > 0) {
                spdlog::warn("ACP: batch contained {} non-object items", dropped);
            }
            return;
        }

        spdlog::warn("ACP: unexpected JSON type: {}", value.type_name());
    }

    static std::optional<RequestId> decode_id(const nlohmann::json& j) {
        if (j.is_number_integer()) {
            if (j.is_number_unsigned()) {
                auto v = j.get<std::uint64_t>();
                if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                    return std::nullopt;
                }
                return RequestId{static_cast<int>(v)};
            }
            auto v = j.get<std::int64_t>();
            if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
                return std::nullopt;
            }
            return RequestId{static_cast<int>(v)};
        }
        if (j.is_string()) {
            return RequestId{j.get<std::string>()};
        }
        return std::nullopt;
    }

    static std::string preview(const nlohmann::json& value) {
        return truncate_utf8(value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), 200);
    }
};

} // namespace protocol
} // namespace acp
