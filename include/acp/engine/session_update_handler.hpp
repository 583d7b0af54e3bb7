#pragma once

#include "content_classifier.hpp"
#include "events.hpp"
#include "turn_state.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace acp {
namespace engine {

/**
 * @brief Applies session/update payloads to the active turn.
 *
 * Routes message and thought chunks through the ContentClassifier into the
 * turn's buffers and final blocks, plan updates into the plan buffer, and
 * tool call notifications into the turn's ToolCallRegistry. Emits one event
 * per visible change.
 *
 * Errors in a single update are logged and the update is dropped; nothing
 * here throws into the read loop.
 */
class SessionUpdateHandler {
public:
    SessionUpdateHandler(ContentClassifier classifier, EventSink& sink)
        : classifier_(std::move(classifier))
        , sink_(sink) {}

    void handle(TurnState& turn, const nlohmann::json& update) {
        if (!update.is_object()) {
            spdlog::warn("ACP: session/update without an update object dropped");
            return;
        }
        auto type_it = update.find("sessionUpdate");
        if (type_it == update.end() || !type_it->is_string()) {
            spdlog::warn("ACP: session/update without sessionUpdate kind dropped");
            return;
        }
        const std::string type = type_it->get<std::string>();

        try {
            if (type == "agent_message_chunk" || type == "agent_thought_chunk") {
                handle_chunk(turn, type, update);
            } else if (type == "plan") {
                handle_plan(turn, update);
            } else if (type == "tool_call") {
                handle_tool_call(turn, update, ToolCallOrigin::Create);
            } else if (type == "tool_call_update") {
                handle_tool_call(turn, update, ToolCallOrigin::Update);
            } else {
                spdlog::debug("ACP: ignoring session/update kind '{}'", type);
            }
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("ACP: malformed session/update '{}' dropped: {}", type, e.what());
        }
    }

    const ContentClassifier& classifier() const { return classifier_; }

private:
    void handle_chunk(TurnState& turn, const std::string& type, const nlohmann::json& update) {
        std::vector<nlohmann::json> raw_blocks;
        if (auto it = update.find("content"); it != update.end()) {
            flatten_content(*it, raw_blocks);
        }
        if (raw_blocks.empty()) {
            spdlog::debug("ACP: {} without content", type);
            return;
        }

        StreamMode mode = ContentClassifier::stream_mode(update, &raw_blocks.front())
                              .value_or(StreamMode::Append);

        std::vector<ContentBlock> finals;
        std::string final_text;
        std::string draft_text;
        std::string thought_text;
        std::string plan_text;
        bool has_draft = false, has_thought = false, has_plan = false;

        for (const auto& raw : raw_blocks) {
            Channel channel = classifier_.classify(type, update, &raw);
            auto block = ContentBlock::from_json(raw, channel);
            if (!block) {
                spdlog::warn("ACP: unsupported content block dropped: {}", acp::truncate_utf8(raw.dump(), 200));
                continue;
            }

            switch (channel) {
                case Channel::Final:
                    final_text += block->text();
                    finals.push_back(std::move(*block));
                    break;
                case Channel::Draft:
                    draft_text += block->text();
                    has_draft = true;
                    break;
                case Channel::Thought:
                    thought_text += block->text();
                    has_thought = true;
                    break;
                case Channel::Plan:
                    plan_text += block->text();
                    has_plan = true;
                    break;
            }
        }

        const int turn_id = turn.turn_id();

        if (!finals.empty()) {
            if (mode == StreamMode::Replace) {
                turn.replace_final(std::move(finals));
            } else {
                for (auto& block : finals) {
                    turn.append_final(std::move(block));
                }
            }
            // The draft buffer previews the answer while it streams
            if (!final_text.empty() || mode == StreamMode::Replace) {
                turn.apply_text(Channel::Draft, final_text, mode);
                sink_.on_draft(DraftEvent{turn_id, final_text, mode, DraftKind::Draft});
            }
        }
        if (has_draft) {
            turn.apply_text(Channel::Draft, draft_text, mode);
            sink_.on_draft(DraftEvent{turn_id, draft_text, mode, DraftKind::Draft});
        }
        if (has_thought) {
            const auto& snapshot = turn.apply_text(Channel::Thought, thought_text, mode);
            sink_.on_thought(ThoughtEvent{turn_id, snapshot});
        }
        if (has_plan) {
            emit_plan(turn, plan_text, mode);
        }
    }

    void handle_plan(TurnState& turn, const nlohmann::json& update) {
        auto entries = update.find("entries");
        if (entries != update.end() && entries->is_array()) {
            std::vector<std::string> lines;
            for (const auto& entry : *entries) {
                if (!entry.is_object()) {
                    continue;
                }
                auto content = entry.find("content");
                if (content != entry.end() && content->is_string() && !content->get_ref<const std::string&>().empty()) {
                    lines.push_back(content->get<std::string>());
                }
            }
            std::string text;
            for (size_t i = 0; i < lines.size(); ++i) {
                if (i > 0) {
                    text += "\n";
                }
                text += lines[i];
            }
            // An entries list is always the complete plan
            StreamMode mode = ContentClassifier::stream_mode(update).value_or(StreamMode::Replace);
            emit_plan(turn, text, mode);
            return;
        }

        std::vector<nlohmann::json> raw_blocks;
        if (auto it = update.find("content"); it != update.end()) {
            flatten_content(*it, raw_blocks);
        }
        std::string text;
        for (const auto& raw : raw_blocks) {
            if (auto block = ContentBlock::from_json(raw, Channel::Plan)) {
                text += block->text();
            }
        }
        if (raw_blocks.empty()) {
            spdlog::debug("ACP: plan update without entries or content");
            return;
        }
        StreamMode mode = ContentClassifier::stream_mode(update, &raw_blocks.front())
                              .value_or(StreamMode::Append);
        emit_plan(turn, text, mode);
    }

    void emit_plan(TurnState& turn, const std::string& text, StreamMode mode) {
        const auto& snapshot = turn.apply_text(Channel::Plan, text, mode);
        sink_.on_draft(DraftEvent{turn.turn_id(), text, mode, DraftKind::Plan});

        StatusEvent status;
        status.turn_id = turn.turn_id();
        status.kind = StatusKind::Plan;
        status.title = "Plan updated";
        status.detail = snapshot;
        sink_.on_status(status);
    }

    void handle_tool_call(TurnState& turn, const nlohmann::json& update, ToolCallOrigin origin) {
        auto id_it = update.find("toolCallId");
        if (id_it == update.end() || !id_it->is_string() || id_it->get_ref<const std::string&>().empty()) {
            spdlog::warn("ACP: tool call update without toolCallId dropped");
            return;
        }

        const auto& record = turn.observe_tool_call(
            id_it->get<std::string>(), ToolCallFields::from_update(update), origin);

        StatusEvent status;
        status.turn_id = turn.turn_id();
        status.kind = StatusKind::ToolCall;
        status.title = record.display_title();
        status.tool_call = record;
        if (record.status) {
            status.detail = tool_call_status_to_string(*record.status);
        }
        sink_.on_status(status);
    }

    ContentClassifier classifier_;
    EventSink& sink_;
};

} // namespace engine
} // namespace acp
