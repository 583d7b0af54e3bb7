#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace acp {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: Transport / subprocess errors
 * - 300-399: Protocol errors
 * - 400-499: Runtime/request errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    InvalidCommand = 101,

    // Transport errors (200-299)
    TransportFailed = 200,
    AgentSpawnFailed = 201,
    AgentDisconnected = 202,
    AgentRestartFailed = 203,

    // Protocol errors (300-399)
    ProtocolError = 300,
    AgentError = 301,
    HandshakeFailed = 302,
    NoActiveSession = 303,

    // Runtime errors (400-499)
    AgentNotRunning = 400,
    RequestCancelled = 401,
    RequestTimeout = 402,
    AgentBusy = 403,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (e.g., method names, raw payloads)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Text Utilities
// ============================================================================

/**
 * @brief Shorten text for logs and status details.
 *
 * Keeps at most @p limit bytes, cut back to a UTF-8 code point boundary, and
 * appends "..." when anything was dropped.
 */
inline std::string truncate_utf8(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

// ============================================================================
// Session Lifecycle
// ============================================================================

/**
 * @brief Lifecycle of the agent subprocess owned by a SessionController
 *
 *   Stopped -> Starting -> Initializing -> Ready
 *   Ready -> Restarting (subprocess exited) -> Stopped (grace period elapsed)
 *   Restarting / Stopped -> Starting (a new caller arrived)
 */
enum class SessionState {
    Starting,
    Initializing,
    Ready,
    Restarting,
    Stopped
};

[[nodiscard]] inline const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Starting: return "Starting";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Ready: return "Ready";
        case SessionState::Restarting: return "Restarting";
        case SessionState::Stopped: return "Stopped";
    }
    return "unknown";
}

// ============================================================================
// Engine Configuration
// ============================================================================

/** @brief Segment tags that mark content as thought unless configured otherwise. */
inline std::vector<std::string> default_thought_tags() {
    return {"think", "thought", "thinking", "segment", "intent"};
}

/**
 * @brief Rendering features the embedding application implements.
 *
 * Advertised to the agent during initialize; they never enable file-system
 * or terminal access.
 */
struct UiCapabilities {
    bool image = true;      ///< Application renders image content blocks
    bool markdown = true;   ///< Application renders markdown in text blocks

    bool operator==(const UiCapabilities& other) const {
        return image == other.image && markdown == other.markdown;
    }

    bool operator!=(const UiCapabilities& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Complete configuration for a SessionController
 *
 * Value type holding the values the engine consumes. How they are loaded
 * (files, environment, flags) is up to the embedding application.
 * Must be validated via validate() before use.
 *
 * @threadsafety Safe to copy and pass by value across threads (excluding callbacks)
 */
struct Config {
    // Agent process
    std::string agent_command;                                       ///< Command line of the agent (e.g. "copilot --acp")
    std::string working_directory = ".";                             ///< cwd sent with session/new
    nlohmann::json mcp_servers = nlohmann::json::array();            ///< MCP servers forwarded to session/new

    // Timing
    std::chrono::seconds permission_timeout{300};                    ///< Deadline for unanswered permission requests
    std::chrono::seconds disconnect_grace{30};                       ///< Wait after an unexpected exit before teardown
    std::chrono::seconds request_timeout{30};                        ///< Deadline for initialize and session/new

    // Diagnostics
    bool verbose_wire_logging = false;                               ///< Log every frame sent and received at debug level

    // Handshake
    std::string client_name = "acp-engine";
    std::string client_version = "0.1.0";
    int protocol_version = 1;
    UiCapabilities ui;                                               ///< Advertised rendering capabilities

    // Classification
    std::vector<std::string> thought_tags = default_thought_tags();

    // Aggregation
    bool answer_after_tool_calls = true;                             ///< Drop narration streamed before a turn's first tool call

    // Restart policy
    int max_restart_attempts = 3;                                    ///< Consecutive failed spawns before giving up
    bool send_session_cancel = true;                                 ///< Send session/cancel when a turn is cancelled

    // Callbacks
    using AutoApprove = std::function<bool(const std::string& title, const nlohmann::json& tool_call)>;
    std::optional<AutoApprove> auto_approve;                         ///< Returns true to approve a permission request unseen

    // Validation
    Expected<void> validate() const {
        if (agent_command.find_first_not_of(" \t\r\n") == std::string::npos) {
            return tl::unexpected(Error{ErrorCode::InvalidCommand, "Agent command cannot be empty"});
        }
        if (permission_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "permission_timeout must be positive"});
        }
        if (request_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "request_timeout must be positive"});
        }
        if (disconnect_grace.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "disconnect_grace cannot be negative"});
        }
        if (max_restart_attempts <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_restart_attempts must be positive"});
        }
        if (!mcp_servers.is_array()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "mcp_servers must be a JSON array"});
        }
        return {};
    }
};

} // namespace acp
