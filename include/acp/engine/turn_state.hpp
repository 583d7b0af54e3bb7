#pragma once

#include "../types.hpp"
#include "content_block.hpp"
#include "tool_call_registry.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace acp {
namespace engine {

/**
 * @brief Everything accumulated during one prompt turn.
 *
 * Holds the intermediate buffers (draft, thought, plan), the final answer
 * blocks, and the turn's tool calls. Created when a prompt is sent and
 * discarded when its response arrives.
 *
 * @threadsafety Not thread-safe, except for the cancellation token which may
 *               be set from any thread.
 */
class TurnState {
public:
    /**
     * @param turn_id Id of the session/prompt request
     * @param answer_after_tool_calls When true, final blocks streamed before the
     *        turn's first tool call are narration and are dropped once that
     *        tool call shows up
     */
    explicit TurnState(int turn_id, bool answer_after_tool_calls = true)
        : turn_id_(turn_id)
        , answer_after_tool_calls_(answer_after_tool_calls)
        , created_at_(std::chrono::steady_clock::now())
        , cancel_token_(std::make_shared<std::atomic<bool>>(false)) {}

    int turn_id() const { return turn_id_; }
    std::chrono::steady_clock::time_point created_at() const { return created_at_; }

    // ========================================================================
    // Buffers
    // ========================================================================

    /**
     * @brief Apply streamed text to the buffer of a non-final channel.
     *
     * Final text is mirrored into the draft buffer, which serves as the live
     * preview of the answer.
     *
     * @return The buffer contents after the update
     */
    const std::string& apply_text(Channel channel, const std::string& text, StreamMode mode) {
        std::string& buffer = buffer_for(channel);
        if (mode == StreamMode::Replace) {
            buffer = text;
        } else {
            buffer += text;
        }
        return buffer;
    }

    void append_final(ContentBlock block) {
        final_blocks_.push_back(std::move(block));
    }

    void replace_final(std::vector<ContentBlock> blocks) {
        final_blocks_ = std::move(blocks);
    }

    const std::string& draft_text() const { return draft_; }
    const std::string& thought_text() const { return thought_; }
    const std::string& plan_text() const { return plan_; }
    const std::vector<ContentBlock>& final_blocks() const { return final_blocks_; }

    /** @brief Concatenated text of every final text block. */
    std::string final_text() const {
        std::string out;
        for (const auto& block : final_blocks_) {
            out += block.text();
        }
        return out;
    }

    // ========================================================================
    // Tool Calls
    // ========================================================================

    const ToolCallRecord& observe_tool_call(const std::string& id, const ToolCallFields& fields,
                                            ToolCallOrigin origin) {
        if (!saw_tool_call_) {
            saw_tool_call_ = true;
            if (answer_after_tool_calls_ && !final_blocks_.empty()) {
                final_blocks_.clear();
            }
        }
        tool_call_ids_seen_.insert(id);
        return tool_calls_.observe(id, fields, origin);
    }

    const ToolCallRegistry& tool_calls() const { return tool_calls_; }
    const std::set<std::string>& tool_call_ids_seen() const { return tool_call_ids_seen_; }
    bool saw_tool_call() const { return saw_tool_call_; }

    // ========================================================================
    // Cancellation
    // ========================================================================

    void cancel() { cancel_token_->store(true); }
    bool is_cancelled() const { return cancel_token_->load(); }
    std::shared_ptr<std::atomic<bool>> cancel_token() const { return cancel_token_; }

    /**
     * @brief Compact description of the turn for logging.
     *
     * Lists final block types, tool call count, answer length and a short
     * preview of the answer text.
     */
    nlohmann::json summary(size_t preview_chars = 120) const {
        nlohmann::json block_types = nlohmann::json::array();
        for (const auto& block : final_blocks_) {
            block_types.push_back(block_kind_to_string(block.kind));
        }

        std::string text = final_text();
        std::string preview = truncate_utf8(text, preview_chars);
        for (auto& c : preview) {
            if (c == '\n' || c == '\r') {
                c = ' ';
            }
        }

        return {
            {"turn_id", turn_id_},
            {"blocks", final_blocks_.size()},
            {"block_types", block_types},
            {"tool_calls", tool_call_ids_seen_.size()},
            {"text_len", text.size()},
            {"preview", preview}
        };
    }

private:
    std::string& buffer_for(Channel channel) {
        switch (channel) {
            case Channel::Thought: return thought_;
            case Channel::Plan: return plan_;
            case Channel::Draft:
            case Channel::Final: break;
        }
        return draft_;
    }

    int turn_id_;
    bool answer_after_tool_calls_;
    bool saw_tool_call_ = false;
    std::chrono::steady_clock::time_point created_at_;
    std::shared_ptr<std::atomic<bool>> cancel_token_;

    std::string draft_;
    std::string thought_;
    std::string plan_;
    std::vector<ContentBlock> final_blocks_;

    ToolCallRegistry tool_calls_;
    std::set<std::string> tool_call_ids_seen_;
};

} // namespace engine
} // namespace acp
