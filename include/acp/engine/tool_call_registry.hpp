#pragma once

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace acp {
namespace engine {

// ============================================================================
// Tool Call Status
// ============================================================================

enum class ToolCallStatus {
    Pending,
    InProgress,
    Completed,
    Failed
};

[[nodiscard]] inline const char* tool_call_status_to_string(ToolCallStatus status) {
    switch (status) {
        case ToolCallStatus::Pending: return "pending";
        case ToolCallStatus::InProgress: return "in_progress";
        case ToolCallStatus::Completed: return "completed";
        case ToolCallStatus::Failed: return "failed";
    }
    return "unknown";
}

inline std::optional<ToolCallStatus> parse_tool_call_status(const std::string& status) {
    if (status == "pending") return ToolCallStatus::Pending;
    if (status == "in_progress") return ToolCallStatus::InProgress;
    if (status == "completed") return ToolCallStatus::Completed;
    if (status == "failed") return ToolCallStatus::Failed;
    return std::nullopt;
}

inline bool is_terminal(ToolCallStatus status) {
    return status == ToolCallStatus::Completed || status == ToolCallStatus::Failed;
}

// ============================================================================
// Tool Call Fields and Records
// ============================================================================

/**
 * @brief Fields carried by one tool_call or tool_call_update notification.
 *
 * Absent and null wire values are both nullopt: they never clear a stored field.
 */
struct ToolCallFields {
    std::optional<std::string> title;
    std::optional<std::string> kind;
    std::optional<ToolCallStatus> status;
    std::optional<nlohmann::json> raw_input;
    std::optional<nlohmann::json> raw_output;
    std::optional<nlohmann::json> content;
    std::optional<nlohmann::json> locations;

    static ToolCallFields from_update(const nlohmann::json& update) {
        ToolCallFields fields;
        if (!update.is_object()) {
            return fields;
        }

        auto string_field = [&](const char* key) -> std::optional<std::string> {
            auto it = update.find(key);
            if (it != update.end() && it->is_string()) {
                return it->get<std::string>();
            }
            return std::nullopt;
        };
        auto json_field = [&](const char* key) -> std::optional<nlohmann::json> {
            auto it = update.find(key);
            if (it != update.end() && !it->is_null()) {
                return *it;
            }
            return std::nullopt;
        };

        fields.title = string_field("title");
        fields.kind = string_field("kind");
        if (auto status = string_field("status")) {
            fields.status = parse_tool_call_status(*status);
            if (!fields.status) {
                spdlog::warn("Ignoring unknown tool call status '{}'", *status);
            }
        }
        fields.raw_input = json_field("rawInput");
        fields.raw_output = json_field("rawOutput");
        fields.content = json_field("content");
        fields.locations = json_field("locations");
        return fields;
    }
};

/**
 * @brief Merged state of one tool call across all of its notifications.
 */
struct ToolCallRecord {
    std::string id;
    std::string title;
    std::string kind;
    std::optional<ToolCallStatus> status;
    nlohmann::json raw_input;       ///< null until the agent reports it
    nlohmann::json raw_output;      ///< null until the agent reports it
    nlohmann::json content = nlohmann::json::array();
    nlohmann::json locations = nlohmann::json::array();
    std::chrono::steady_clock::time_point last_updated_at{};

    std::string display_title() const {
        return title.empty() ? "Tool call" : title;
    }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"toolCallId", id},
            {"title", display_title()},
            {"content", content},
            {"locations", locations}
        };
        if (!kind.empty()) {
            j["kind"] = kind;
        }
        if (status) {
            j["status"] = tool_call_status_to_string(*status);
        }
        if (!raw_input.is_null()) {
            j["rawInput"] = raw_input;
        }
        if (!raw_output.is_null()) {
            j["rawOutput"] = raw_output;
        }
        return j;
    }

    // Timestamps are bookkeeping; two records with the same fields are equal
    bool operator==(const ToolCallRecord& other) const {
        return id == other.id && title == other.title && kind == other.kind &&
               status == other.status && raw_input == other.raw_input &&
               raw_output == other.raw_output && content == other.content &&
               locations == other.locations;
    }

    bool operator!=(const ToolCallRecord& other) const {
        return !(*this == other);
    }
};

/** @brief Which notification produced an observation. */
enum class ToolCallOrigin {
    Create,     ///< "tool_call": fills only fields not yet known
    Update      ///< "tool_call_update": overwrites with every non-null field
};

// ============================================================================
// Tool Call Registry
// ============================================================================

/**
 * @brief Per-turn map of tool call id to merged record.
 *
 * Creates and updates may arrive in any order and any number of times; the
 * record converges on the same value either way. Status only moves forward
 * (pending, then in_progress, then completed or failed) and the first
 * terminal status wins.
 *
 * @threadsafety Not thread-safe. Owned by a TurnState and driven from the
 *               transport's read thread.
 */
class ToolCallRegistry {
public:
    const ToolCallRecord& observe(const std::string& id, const ToolCallFields& fields, ToolCallOrigin origin) {
        auto [it, inserted] = records_.try_emplace(id);
        ToolCallRecord& record = it->second;
        if (inserted) {
            record.id = id;
            order_.push_back(id);
        }

        // A creation fills only what no earlier notification has set, even
        // when that earlier value was empty
        bool overwrite = origin == ToolCallOrigin::Update;
        unsigned& known = known_[id];

        merge_field(fields.title, record.title, known, kTitle, overwrite);
        merge_field(fields.kind, record.kind, known, kKind, overwrite);
        merge_field(fields.raw_input, record.raw_input, known, kRawInput, overwrite);
        merge_field(fields.raw_output, record.raw_output, known, kRawOutput, overwrite);
        merge_field(fields.content, record.content, known, kContent, overwrite);
        merge_field(fields.locations, record.locations, known, kLocations, overwrite);
        if (fields.status) {
            record.status = merge_status(record.status, *fields.status);
        }

        record.last_updated_at = std::chrono::steady_clock::now();
        return record;
    }

    const ToolCallRecord* find(const std::string& id) const {
        auto it = records_.find(id);
        return it == records_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& id) const {
        return records_.count(id) > 0;
    }

    size_t size() const {
        return records_.size();
    }

    /** @brief Ids in first-seen order. */
    const std::vector<std::string>& ids() const {
        return order_;
    }

private:
    enum FieldBit : unsigned {
        kTitle = 1u << 0,
        kKind = 1u << 1,
        kRawInput = 1u << 2,
        kRawOutput = 1u << 3,
        kContent = 1u << 4,
        kLocations = 1u << 5
    };

    template<typename T>
    static void merge_field(const std::optional<T>& incoming, T& stored, unsigned& known,
                            FieldBit bit, bool overwrite) {
        if (!incoming || (!overwrite && (known & bit))) {
            return;
        }
        stored = *incoming;
        known |= bit;
    }

    static int rank(ToolCallStatus status) {
        switch (status) {
            case ToolCallStatus::Pending: return 0;
            case ToolCallStatus::InProgress: return 1;
            case ToolCallStatus::Completed:
            case ToolCallStatus::Failed: return 2;
        }
        return 0;
    }

    static ToolCallStatus merge_status(std::optional<ToolCallStatus> current, ToolCallStatus incoming) {
        if (!current) {
            return incoming;
        }
        return rank(incoming) > rank(*current) ? incoming : *current;
    }

    std::map<std::string, ToolCallRecord> records_;
    std::map<std::string, unsigned> known_;    ///< FieldBits set so far, per id
    std::vector<std::string> order_;
};

} // namespace engine
} // namespace acp
