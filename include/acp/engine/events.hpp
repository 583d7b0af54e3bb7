#pragma once

#include "../protocol/types.hpp"
#include "../types.hpp"
#include "content_block.hpp"
#include "tool_call_registry.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace acp {
namespace engine {

// ============================================================================
// Event Payloads
// ============================================================================

enum class DraftKind {
    Draft,
    Plan
};

enum class StatusKind {
    TurnStarted,
    ToolCall,
    Plan,
    TurnCompleted,
    TurnCancelled,
    TurnFailed
};

[[nodiscard]] inline const char* status_kind_to_string(StatusKind kind) {
    switch (kind) {
        case StatusKind::TurnStarted: return "turn_started";
        case StatusKind::ToolCall: return "tool_call";
        case StatusKind::Plan: return "plan";
        case StatusKind::TurnCompleted: return "turn_completed";
        case StatusKind::TurnCancelled: return "turn_cancelled";
        case StatusKind::TurnFailed: return "turn_failed";
    }
    return "unknown";
}

/**
 * @brief Progress notice for the UI status line.
 */
struct StatusEvent {
    int turn_id = 0;
    StatusKind kind = StatusKind::TurnStarted;
    std::string title;
    std::optional<ToolCallRecord> tool_call;    ///< Snapshot, set for ToolCall events
    std::string detail;

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"turn_id", turn_id},
            {"kind", status_kind_to_string(kind)},
            {"title", title},
            {"detail", detail}
        };
        if (tool_call) {
            j["tool_call"] = tool_call->to_json();
        }
        return j;
    }
};

/**
 * @brief Update to the draft (or plan) preview.
 *
 * text is the chunk as received; mode says whether it replaces or extends
 * what the consumer has shown so far.
 */
struct DraftEvent {
    int turn_id = 0;
    std::string text;
    StreamMode mode = StreamMode::Append;
    DraftKind kind = DraftKind::Draft;

    nlohmann::json to_json() const {
        return {
            {"turn_id", turn_id},
            {"text", text},
            {"mode", stream_mode_to_string(mode)},
            {"kind", kind == DraftKind::Plan ? "plan" : "draft"}
        };
    }
};

/** @brief Full thought buffer after an update. */
struct ThoughtEvent {
    int turn_id = 0;
    std::string text;

    nlohmann::json to_json() const {
        return {{"turn_id", turn_id}, {"text", text}};
    }
};

struct PermissionOption {
    std::string option_id;
    std::string name;
    std::string kind;       ///< allow_once, allow_always, reject_once, reject_always

    bool operator==(const PermissionOption& other) const {
        return option_id == other.option_id && name == other.name && kind == other.kind;
    }
};

/**
 * @brief A permission request waiting for a decision from the user.
 */
struct PermissionPromptEvent {
    protocol::RequestId request_id;
    std::optional<int> turn_id;
    std::string title;
    std::string tool_call_id;
    nlohmann::json tool_call;
    std::vector<PermissionOption> options;
    std::chrono::steady_clock::time_point deadline;

    nlohmann::json to_json() const {
        nlohmann::json opts = nlohmann::json::array();
        for (const auto& o : options) {
            opts.push_back({{"optionId", o.option_id}, {"name", o.name}, {"kind", o.kind}});
        }
        nlohmann::json j = {
            {"request_id", protocol::request_id_to_json(request_id)},
            {"title", title},
            {"tool_call_id", tool_call_id},
            {"tool_call", tool_call},
            {"options", opts}
        };
        if (turn_id) {
            j["turn_id"] = *turn_id;
        }
        return j;
    }
};

struct RequestTimeoutEvent {
    protocol::RequestId request_id;

    nlohmann::json to_json() const {
        return {{"request_id", protocol::request_id_to_json(request_id)}};
    }
};

/**
 * @brief Outcome of a completed prompt turn.
 */
struct TurnResult {
    int turn_id = 0;
    std::vector<ContentBlock> final_blocks;
    std::string stop_reason;

    /** @brief Concatenated text of the final text blocks. */
    std::string text() const {
        std::string out;
        for (const auto& block : final_blocks) {
            out += block.text();
        }
        return out;
    }

    nlohmann::json to_json() const {
        nlohmann::json blocks = nlohmann::json::array();
        for (const auto& block : final_blocks) {
            blocks.push_back(block.to_json());
        }
        return {{"turn_id", turn_id}, {"final_blocks", blocks}, {"stop_reason", stop_reason}};
    }
};

// ============================================================================
// Event Sink
// ============================================================================

/**
 * @brief Receiver of engine events.
 *
 * Callbacks run on the transport read thread (or the permission timer
 * thread for timeouts) and must not block. Calling SessionController
 * methods that wait on the agent from inside a callback deadlocks.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_status(const StatusEvent& event) = 0;
    virtual void on_draft(const DraftEvent& event) = 0;
    virtual void on_thought(const ThoughtEvent& event) = 0;
    virtual void on_request(const PermissionPromptEvent& event) = 0;
    virtual void on_request_timeout(const RequestTimeoutEvent& event) = 0;
    virtual void on_turn_complete(const TurnResult& result) = 0;

    virtual void on_session_state(SessionState /*state*/) {}
};

/** @brief Sink that discards everything. */
class NullEventSink final : public EventSink {
public:
    void on_status(const StatusEvent&) override {}
    void on_draft(const DraftEvent&) override {}
    void on_thought(const ThoughtEvent&) override {}
    void on_request(const PermissionPromptEvent&) override {}
    void on_request_timeout(const RequestTimeoutEvent&) override {}
    void on_turn_complete(const TurnResult&) override {}
};

} // namespace engine
} // namespace acp
