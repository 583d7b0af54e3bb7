#pragma once

#include "../types.hpp"
#include "content_block.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace acp {
namespace engine {

/**
 * @brief Decides the channel of streamed content from metadata only.
 *
 * Lookup order for a block inside a session/update:
 *   1. "segment", "kind", "channel", "role" on the update
 *   2. "segment", "channel", "role" on the block itself
 *   3. the block's annotations (a segment/thinking/intent annotation, or
 *      any annotation whose kind is a known tag)
 *   4. the update type: agent_thought_chunk -> Thought, plan -> Plan,
 *      everything else -> Final
 *
 * Text is never inspected. Thought tags come from a configurable allowlist;
 * "plan", "draft" and "final" always name their own channels.
 *
 * @threadsafety Immutable after construction; safe to share.
 */
class ContentClassifier {
public:
    static std::vector<std::string> default_thought_tags() {
        return acp::default_thought_tags();
    }

    explicit ContentClassifier(const std::vector<std::string>& thought_tags = default_thought_tags()) {
        for (const auto& tag : thought_tags) {
            thought_tags_.insert(lower(tag));
        }
    }

    /**
     * @brief Map one tag to a channel, or nullopt if it is not recognized.
     */
    std::optional<Channel> channel_for_tag(const std::string& tag) const {
        auto t = lower(tag);
        if (t == "plan") return Channel::Plan;
        if (t == "draft") return Channel::Draft;
        if (t == "final") return Channel::Final;
        if (thought_tags_.count(t) > 0) return Channel::Thought;
        return std::nullopt;
    }

    /**
     * @brief Channel of a block (or of the update as a whole when block is null).
     */
    Channel classify(const std::string& update_type, const nlohmann::json& update,
                     const nlohmann::json* block = nullptr) const {
        if (update_type == "plan") {
            return Channel::Plan;
        }

        for (const char* key : {"segment", "kind", "channel", "role"}) {
            if (auto channel = tag_field(update, key)) {
                return *channel;
            }
        }

        if (block && block->is_object()) {
            for (const char* key : {"segment", "channel", "role"}) {
                if (auto channel = tag_field(*block, key)) {
                    return *channel;
                }
            }
            auto ann = block->find("annotations");
            if (ann != block->end()) {
                if (auto tag = segment_kind_from_annotations(*ann)) {
                    if (auto channel = channel_for_tag(*tag)) {
                        return *channel;
                    }
                }
            }
        }

        if (update_type == "agent_thought_chunk") {
            return Channel::Thought;
        }
        return Channel::Final;
    }

    /**
     * @brief Extract a segment tag from annotations (object or array of objects).
     */
    std::optional<std::string> segment_kind_from_annotations(const nlohmann::json& annotations) const {
        std::vector<const nlohmann::json*> candidates;
        if (annotations.is_object()) {
            candidates.push_back(&annotations);
        } else if (annotations.is_array()) {
            for (const auto& a : annotations) {
                if (a.is_object()) {
                    candidates.push_back(&a);
                }
            }
        }

        for (const auto* a : candidates) {
            std::string a_type = first_string(*a, {"type", "annotation"});
            std::string kind = first_string(*a, {"kind", "segment", "role", "channel", "name", "value"});

            if (a_type == "segment" || a_type == "thinking" || a_type == "intent" ||
                thought_tags_.count(a_type) > 0) {
                return kind.empty() ? a_type : kind;
            }
            if (!kind.empty() && channel_for_tag(kind).has_value()) {
                return kind;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Explicit streaming mode of an update (or its block), if any.
     */
    static std::optional<StreamMode> stream_mode(const nlohmann::json& update,
                                                 const nlohmann::json* block = nullptr) {
        if (auto mode = mode_field(update)) {
            return mode;
        }
        if (block) {
            return mode_field(*block);
        }
        return std::nullopt;
    }

private:
    std::optional<Channel> tag_field(const nlohmann::json& obj, const char* key) const {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_string()) {
            return std::nullopt;
        }
        return channel_for_tag(it->get<std::string>());
    }

    static std::optional<StreamMode> mode_field(const nlohmann::json& obj) {
        if (!obj.is_object()) {
            return std::nullopt;
        }
        auto it = obj.find("mode");
        if (it == obj.end() || !it->is_string()) {
            return std::nullopt;
        }
        auto mode = lower(it->get<std::string>());
        if (mode == "replace") return StreamMode::Replace;
        if (mode == "append") return StreamMode::Append;
        return std::nullopt;
    }

    static std::string first_string(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
        for (const char* key : keys) {
            auto it = obj.find(key);
            if (it != obj.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
                return lower(it->get<std::string>());
            }
        }
        return "";
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::unordered_set<std::string> thought_tags_;
};

} // namespace engine
} // namespace acp
