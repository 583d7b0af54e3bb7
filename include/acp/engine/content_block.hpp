#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace acp {
namespace engine {

// ============================================================================
// Channels and Streaming Modes
// ============================================================================

/**
 * @brief Where a piece of streamed content belongs.
 *
 * Only Final content is part of the turn's answer; the other three are
 * intermediate output shown while the agent works.
 */
enum class Channel {
    Final,
    Draft,
    Thought,
    Plan
};

[[nodiscard]] inline const char* channel_to_string(Channel channel) {
    switch (channel) {
        case Channel::Final: return "final";
        case Channel::Draft: return "draft";
        case Channel::Thought: return "thought";
        case Channel::Plan: return "plan";
    }
    return "unknown";
}

/**
 * @brief How a chunk combines with its buffer.
 *
 * Replace suits agents that re-send the full text so far (snapshot
 * streaming); Append suits agents that send only new text (delta streaming).
 */
enum class StreamMode {
    Append,
    Replace
};

[[nodiscard]] inline const char* stream_mode_to_string(StreamMode mode) {
    switch (mode) {
        case StreamMode::Append: return "append";
        case StreamMode::Replace: return "replace";
    }
    return "unknown";
}

// ============================================================================
// Content Blocks
// ============================================================================

enum class BlockKind {
    Text,
    Image,
    File,
    ResourceLink,
    Resource
};

[[nodiscard]] inline const char* block_kind_to_string(BlockKind kind) {
    switch (kind) {
        case BlockKind::Text: return "text";
        case BlockKind::Image: return "image";
        case BlockKind::File: return "file";
        case BlockKind::ResourceLink: return "resource_link";
        case BlockKind::Resource: return "resource";
    }
    return "unknown";
}

/**
 * @brief Map a wire "type" to a block kind; "artifact" is an alias of "file".
 */
inline std::optional<BlockKind> block_kind_from_type(const std::string& type) {
    if (type == "text") return BlockKind::Text;
    if (type == "image") return BlockKind::Image;
    if (type == "file" || type == "artifact") return BlockKind::File;
    if (type == "resource_link") return BlockKind::ResourceLink;
    if (type == "resource") return BlockKind::Resource;
    return std::nullopt;
}

/** @brief Typed view of the standard content annotations. */
struct Annotations {
    std::vector<std::string> audience;
    std::optional<double> priority;
    std::optional<std::string> last_modified;

    bool operator==(const Annotations& other) const {
        return audience == other.audience && priority == other.priority &&
               last_modified == other.last_modified;
    }
};

inline std::optional<Annotations> parse_annotations(const nlohmann::json& block) {
    auto it = block.find("annotations");
    if (it == block.end() || !it->is_object()) {
        return std::nullopt;
    }

    Annotations annotations;
    auto audience_it = it->find("audience");
    if (audience_it != it->end() && audience_it->is_array()) {
        for (const auto& role : *audience_it) {
            if (role.is_string()) {
                annotations.audience.push_back(role.get<std::string>());
            }
        }
    }
    auto priority_it = it->find("priority");
    if (priority_it != it->end() && priority_it->is_number()) {
        annotations.priority = priority_it->get<double>();
    }
    auto modified_it = it->find("lastModified");
    if (modified_it != it->end() && modified_it->is_string()) {
        annotations.last_modified = modified_it->get<std::string>();
    }
    return annotations;
}

/**
 * @brief One classified piece of agent output.
 *
 * The payload is the block as received (annotations included), with
 * "artifact" normalized to "file". The channel is fixed when the block is
 * classified and never revisited.
 */
struct ContentBlock {
    BlockKind kind = BlockKind::Text;
    Channel channel = Channel::Final;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<Annotations> annotations;

    static ContentBlock text_block(std::string text, Channel channel = Channel::Final) {
        ContentBlock block;
        block.kind = BlockKind::Text;
        block.channel = channel;
        block.payload = nlohmann::json{{"type", "text"}, {"text", std::move(text)}};
        return block;
    }

    /**
     * @brief Build a block from a wire object; nullopt for unknown types.
     */
    static std::optional<ContentBlock> from_json(const nlohmann::json& raw, Channel channel) {
        if (!raw.is_object()) {
            return std::nullopt;
        }
        auto type_it = raw.find("type");
        if (type_it == raw.end() || !type_it->is_string()) {
            return std::nullopt;
        }
        auto kind = block_kind_from_type(type_it->get<std::string>());
        if (!kind) {
            return std::nullopt;
        }

        ContentBlock block;
        block.kind = *kind;
        block.channel = channel;
        block.payload = raw;
        block.payload["type"] = block_kind_to_string(*kind);
        block.annotations = parse_annotations(raw);
        return block;
    }

    /** @brief Text of a text block; empty for every other kind. */
    std::string text() const {
        if (kind != BlockKind::Text) {
            return "";
        }
        auto it = payload.find("text");
        if (it != payload.end() && it->is_string()) {
            return it->get<std::string>();
        }
        return "";
    }

    nlohmann::json to_json() const {
        nlohmann::json j = payload;
        j["type"] = block_kind_to_string(kind);
        j["channel"] = channel_to_string(channel);
        return j;
    }

    bool operator==(const ContentBlock& other) const {
        return kind == other.kind && channel == other.channel &&
               payload == other.payload && annotations == other.annotations;
    }

    bool operator!=(const ContentBlock& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Flatten ACP content into leaf block objects.
 *
 * Content may be a single block, an array of blocks, or a wrapper object
 * whose "content" key holds either. Objects with a recognized "type" are
 * leaves even if they carry a "content" key of their own (file blocks do).
 */
inline void flatten_content(const nlohmann::json& content, std::vector<nlohmann::json>& out, int depth = 0) {
    if (depth > 8) {
        return;
    }
    if (content.is_array()) {
        for (const auto& item : content) {
            flatten_content(item, out, depth + 1);
        }
        return;
    }
    if (!content.is_object()) {
        return;
    }

    auto type_it = content.find("type");
    if (type_it != content.end() && type_it->is_string() &&
        block_kind_from_type(type_it->get<std::string>()).has_value()) {
        out.push_back(content);
        return;
    }

    auto inner = content.find("content");
    if (inner != content.end() && (inner->is_object() || inner->is_array())) {
        flatten_content(*inner, out, depth + 1);
        return;
    }

    out.push_back(content);
}

} // namespace engine
} // namespace acp
