#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace acp {
namespace protocol {

// ============================================================================
// Agent Capability Types
// ============================================================================

struct PromptCapabilities {
    bool image = false;
    bool audio = false;
    bool embedded_context = false;
};

struct McpCapabilities {
    bool http = false;
    bool sse = false;
};

struct AgentCapabilities {
    bool load_session = false;
    PromptCapabilities prompt;
    McpCapabilities mcp;
};

struct AgentInfo {
    std::string name;
    std::string title;
    std::string version;
};

struct InitializeResult {
    int protocol_version = 0;
    AgentCapabilities capabilities;
    AgentInfo agent_info;
    std::vector<std::string> auth_methods;   ///< Ids of advertised authentication methods
};

// ============================================================================
// Negotiation
// ============================================================================

/**
 * @brief Build the clientCapabilities object sent with initialize.
 *
 * File-system and terminal access are always declared unsupported; the
 * matching agent requests are rejected no matter what was negotiated.
 * Rendering features go under "_meta", the protocol's extension slot.
 */
inline nlohmann::json build_client_capabilities(const UiCapabilities& ui) {
    return nlohmann::json{
        {"fs", {
            {"readTextFile", false},
            {"writeTextFile", false}
        }},
        {"terminal", false},
        {"_meta", {
            {"ui", {
                {"image", ui.image},
                {"markdown", ui.markdown}
            }}
        }}
    };
}

/**
 * @brief Build the params of the initialize request.
 */
inline nlohmann::json build_initialize_params(const Config& config) {
    return nlohmann::json{
        {"protocolVersion", config.protocol_version},
        {"clientCapabilities", build_client_capabilities(config.ui)},
        {"clientInfo", {
            {"name", config.client_name},
            {"version", config.client_version}
        }}
    };
}

/**
 * @brief True for agent->client methods the engine never implements.
 */
inline bool is_rejected_method(std::string_view method) {
    return method.rfind("fs/", 0) == 0 || method.rfind("terminal/", 0) == 0;
}

namespace detail {

inline bool flag(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

inline std::string text(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

} // namespace detail

/**
 * @brief Parse the agent's initialize result.
 *
 * Missing sections default to "not supported". A non-object result or a
 * non-integer protocol version is a protocol error.
 */
inline Expected<InitializeResult> parse_initialize_result(const nlohmann::json& result) {
    if (!result.is_object()) {
        return tl::unexpected(Error{
            ErrorCode::HandshakeFailed,
            "initialize result must be an object",
            result.dump()
        });
    }

    InitializeResult init;

    auto version_it = result.find("protocolVersion");
    if (version_it == result.end() || !version_it->is_number_integer()) {
        return tl::unexpected(Error{
            ErrorCode::HandshakeFailed,
            "initialize result has no integer protocolVersion",
            result.dump()
        });
    }
    init.protocol_version = version_it->get<int>();

    auto caps_it = result.find("agentCapabilities");
    if (caps_it != result.end() && caps_it->is_object()) {
        const auto& caps = *caps_it;
        init.capabilities.load_session = detail::flag(caps, "loadSession");

        auto prompt_it = caps.find("promptCapabilities");
        if (prompt_it != caps.end() && prompt_it->is_object()) {
            init.capabilities.prompt.image = detail::flag(*prompt_it, "image");
            init.capabilities.prompt.audio = detail::flag(*prompt_it, "audio");
            init.capabilities.prompt.embedded_context = detail::flag(*prompt_it, "embeddedContext");
        }

        auto mcp_it = caps.find("mcpCapabilities");
        if (mcp_it != caps.end() && mcp_it->is_object()) {
            init.capabilities.mcp.http = detail::flag(*mcp_it, "http");
            init.capabilities.mcp.sse = detail::flag(*mcp_it, "sse");
        }
    }

    auto info_it = result.find("agentInfo");
    if (info_it != result.end() && info_it->is_object()) {
        init.agent_info.name = detail::text(*info_it, "name");
        init.agent_info.title = detail::text(*info_it, "title");
        init.agent_info.version = detail::text(*info_it, "version");
    }

    auto auth_it = result.find("authMethods");
    if (auth_it != result.end() && auth_it->is_array()) {
        for (const auto& method : *auth_it) {
            if (method.is_object()) {
                auto id = detail::text(method, "id");
                if (!id.empty()) {
                    init.auth_methods.push_back(std::move(id));
                }
            }
        }
    }

    return init;
}

} // namespace protocol
} // namespace acp
