#pragma once

#include "../protocol/types.hpp"
#include "../types.hpp"
#include "events.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

namespace acp {
namespace engine {

// ============================================================================
// Permission Types
// ============================================================================

enum class PermissionResolution {
    Approved,
    Denied,
    Cancelled,
    TimedOut
};

[[nodiscard]] inline const char* permission_resolution_to_string(PermissionResolution resolution) {
    switch (resolution) {
        case PermissionResolution::Approved: return "approved";
        case PermissionResolution::Denied: return "denied";
        case PermissionResolution::Cancelled: return "cancelled";
        case PermissionResolution::TimedOut: return "timed_out";
    }
    return "unknown";
}

/**
 * @brief A user's answer to a permission prompt.
 */
struct PermissionDecision {
    enum class Kind {
        Approve,        ///< First allow option offered
        Deny,           ///< First reject option offered
        SelectOption,   ///< A specific option id
        Cancel
    };

    Kind kind = Kind::Approve;
    std::string option_id;

    static PermissionDecision approve() { return {Kind::Approve, ""}; }
    static PermissionDecision deny() { return {Kind::Deny, ""}; }
    static PermissionDecision cancel() { return {Kind::Cancel, ""}; }
    static PermissionDecision select(std::string option_id) { return {Kind::SelectOption, std::move(option_id)}; }

    /**
     * @brief Parse a free-form answer: an outcome word or an option id.
     */
    static PermissionDecision from_string(const std::string& value) {
        if (value == "approved" || value == "approve" || value == "allow") return approve();
        if (value == "denied" || value == "deny" || value == "reject") return deny();
        if (value == "cancelled" || value == "cancel") return cancel();
        return select(value);
    }
};

/**
 * @brief A pending session/request_permission from the agent.
 */
struct PermissionRequest {
    protocol::RequestId request_id;
    std::optional<int> turn_id;                 ///< Turn active when the request arrived
    std::string tool_call_ref;
    std::string title;
    nlohmann::json tool_call = nlohmann::json::object();
    std::vector<PermissionOption> options;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point deadline;
    bool cancellation_requested = false;
    std::optional<PermissionResolution> resolution;

    /**
     * @brief Build a request from session/request_permission params.
     *
     * The title falls back from the tool call's title to its kind, then to
     * the request's own title, then to "Permission request".
     */
    static PermissionRequest from_params(const protocol::RequestId& id, const nlohmann::json& params) {
        PermissionRequest request;
        request.request_id = id;
        request.created_at = std::chrono::steady_clock::now();

        if (!params.is_object()) {
            request.title = "Permission request";
            return request;
        }

        auto tool_call = params.find("toolCall");
        if (tool_call != params.end() && tool_call->is_object()) {
            request.tool_call = *tool_call;
        }

        auto string_of = [](const nlohmann::json& obj, const char* key) -> std::string {
            auto it = obj.find(key);
            if (it != obj.end() && it->is_string()) {
                return it->get<std::string>();
            }
            return "";
        };

        request.tool_call_ref = string_of(request.tool_call, "toolCallId");
        request.title = string_of(request.tool_call, "title");
        if (request.title.empty()) request.title = string_of(request.tool_call, "kind");
        if (request.title.empty()) request.title = string_of(params, "title");
        if (request.title.empty()) request.title = "Permission request";

        auto options = params.find("options");
        if (options != params.end() && options->is_array()) {
            for (const auto& opt : *options) {
                if (!opt.is_object()) {
                    continue;
                }
                PermissionOption option;
                option.option_id = string_of(opt, "optionId");
                option.name = string_of(opt, "name");
                option.kind = string_of(opt, "kind");
                if (option.option_id.empty()) {
                    spdlog::warn("ACP: permission option without optionId ignored");
                    continue;
                }
                request.options.push_back(std::move(option));
            }
        }
        return request;
    }

    PermissionPromptEvent to_event() const {
        return PermissionPromptEvent{request_id, turn_id, title, tool_call_ref, tool_call, options, deadline};
    }
};

// ============================================================================
// Permission Broker
// ============================================================================

/**
 * @brief Owns pending permission requests and answers each exactly once.
 *
 * A request leaves the pending map through exactly one of resolve(),
 * cancel() or the deadline timer. Whichever takes it out of the map (under
 * the lock) sends the single response; the others find nothing and return
 * false. Responses and sink events are delivered after the lock is released.
 *
 * Wire results sent to the agent:
 *   approved/denied    {"outcome":{"outcome":"selected","optionId":"..."}}
 *   cancelled/timeout  {"outcome":{"outcome":"cancelled"}}
 *
 * @threadsafety Thread-safe. open() is called from the read thread,
 *               resolve()/cancel() from any thread, timeouts fire on an
 *               internal timer thread.
 */
class PermissionBroker {
public:
    using Responder = std::function<void(const protocol::RequestId&, const nlohmann::json& result)>;

    struct Config {
        std::chrono::milliseconds timeout{std::chrono::seconds(300)};
        std::optional<acp::Config::AutoApprove> auto_approve;
        bool start_timer = true;        ///< Tests may drive expiry through sweep()
    };

    static constexpr const char* kDefaultAllowOption = "allow-once";
    static constexpr const char* kDefaultRejectOption = "reject-once";
    static constexpr size_t kHistoryLimit = 256;

    PermissionBroker(Config config, EventSink& sink, Responder responder)
        : config_(std::move(config))
        , sink_(sink)
        , responder_(std::move(responder)) {
        if (config_.start_timer) {
            timer_thread_ = std::thread([this]() { timer_loop(); });
        }
    }

    ~PermissionBroker() {
        shutdown();
    }

    PermissionBroker(const PermissionBroker&) = delete;
    PermissionBroker& operator=(const PermissionBroker&) = delete;

    /**
     * @brief Register a request, or approve it at once if auto-approve accepts it.
     */
    void open(PermissionRequest request) {
        auto now = std::chrono::steady_clock::now();
        request.created_at = now;
        request.deadline = now + config_.timeout;

        if (auto_approves(request)) {
            spdlog::info("ACP: auto-approving permission request '{}'", request.title);
            finish(request, PermissionResolution::Approved, pick_option(request, true));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.count(request.request_id) > 0) {
                spdlog::warn("ACP: duplicate permission request id {} ignored",
                             protocol::request_id_to_string(request.request_id));
                return;
            }
            pending_.emplace(request.request_id, request);
        }
        cv_.notify_all();

        spdlog::debug("ACP: permission request {} opened: {}",
                      protocol::request_id_to_string(request.request_id), request.title);
        sink_.on_request(request.to_event());
    }

    /**
     * @brief Answer a pending request.
     *
     * @return false if the request is no longer pending, or the option id is
     *         not one the agent offered (the request stays pending).
     */
    bool resolve(const protocol::RequestId& id, const PermissionDecision& decision) {
        if (decision.kind == PermissionDecision::Kind::Cancel) {
            return cancel(id);
        }

        std::optional<PermissionRequest> request;
        std::string option_id;
        PermissionResolution resolution = PermissionResolution::Approved;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it == pending_.end()) {
                return false;
            }

            switch (decision.kind) {
                case PermissionDecision::Kind::Approve:
                    option_id = pick_option(it->second, true);
                    break;
                case PermissionDecision::Kind::Deny:
                    option_id = pick_option(it->second, false);
                    resolution = PermissionResolution::Denied;
                    break;
                case PermissionDecision::Kind::SelectOption: {
                    const PermissionOption* option = find_option(it->second, decision.option_id);
                    if (!option && !it->second.options.empty()) {
                        spdlog::warn("ACP: option '{}' not offered for permission request {}",
                                     decision.option_id, protocol::request_id_to_string(id));
                        return false;
                    }
                    option_id = decision.option_id;
                    if (option && is_reject_kind(option->kind)) {
                        resolution = PermissionResolution::Denied;
                    }
                    break;
                }
                case PermissionDecision::Kind::Cancel:
                    break;
            }

            request = std::move(it->second);
            pending_.erase(it);
        }
        cv_.notify_all();

        finish(*request, resolution, option_id);
        return true;
    }

    /**
     * @brief Cancel one pending request, answering it with a cancelled outcome.
     */
    bool cancel(const protocol::RequestId& id) {
        std::optional<PermissionRequest> request;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it == pending_.end()) {
                return false;
            }
            it->second.cancellation_requested = true;
            request = std::move(it->second);
            pending_.erase(it);
        }
        cv_.notify_all();

        finish(*request, PermissionResolution::Cancelled, "");
        return true;
    }

    /** @brief Cancel every request opened during the given turn. */
    size_t cancel_turn(int turn_id) {
        return cancel_where([turn_id](const PermissionRequest& r) {
            return r.turn_id.has_value() && *r.turn_id == turn_id;
        });
    }

    size_t cancel_all() {
        return cancel_where([](const PermissionRequest&) { return true; });
    }

    /**
     * @brief Time out every request whose deadline is at or before now.
     *
     * Called by the timer thread; exposed so tests can expire requests
     * without sleeping.
     */
    size_t sweep(std::chrono::steady_clock::time_point now) {
        std::vector<PermissionRequest> expired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->second.deadline <= now) {
                    expired.push_back(std::move(it->second));
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (auto& request : expired) {
            spdlog::warn("ACP: permission request {} timed out",
                         protocol::request_id_to_string(request.request_id));
            finish(request, PermissionResolution::TimedOut, "");
            sink_.on_request_timeout(RequestTimeoutEvent{request.request_id});
        }
        return expired.size();
    }

    bool is_pending(const protocol::RequestId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.count(id) > 0;
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    std::optional<PermissionRequest> find(const protocol::RequestId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Terminal state of a recently finished request, if remembered.
     */
    std::optional<PermissionResolution> resolution_of(const protocol::RequestId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
            if (it->first == id) {
                return it->second;
            }
        }
        return std::nullopt;
    }

    /** @brief Stop the timer thread. Pending requests are left untouched. */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (timer_thread_.joinable()) {
            timer_thread_.join();
        }
    }

    /** @brief Result payload for a terminal resolution. */
    static nlohmann::json outcome_result(PermissionResolution resolution, const std::string& option_id) {
        if (resolution == PermissionResolution::Approved || resolution == PermissionResolution::Denied) {
            return {{"outcome", {{"outcome", "selected"}, {"optionId", option_id}}}};
        }
        return {{"outcome", {{"outcome", "cancelled"}}}};
    }

private:
    // A throwing predicate counts as a decline; the user is asked instead
    bool auto_approves(const PermissionRequest& request) const {
        if (!config_.auto_approve) {
            return false;
        }
        try {
            return (*config_.auto_approve)(request.title, request.tool_call);
        } catch (const std::exception& e) {
            spdlog::warn("ACP: auto-approve check failed for '{}': {}", request.title, e.what());
            return false;
        }
    }

    static bool is_allow_kind(const std::string& kind) {
        return kind == "allow_once" || kind == "allow_always";
    }

    static bool is_reject_kind(const std::string& kind) {
        return kind == "reject_once" || kind == "reject_always";
    }

    static const PermissionOption* find_option(const PermissionRequest& request, const std::string& option_id) {
        for (const auto& option : request.options) {
            if (option.option_id == option_id) {
                return &option;
            }
        }
        return nullptr;
    }

    static std::string pick_option(const PermissionRequest& request, bool allow) {
        for (const auto& option : request.options) {
            if (allow ? is_allow_kind(option.kind) : is_reject_kind(option.kind)) {
                return option.option_id;
            }
        }
        return allow ? kDefaultAllowOption : kDefaultRejectOption;
    }

    template<typename Predicate>
    size_t cancel_where(Predicate predicate) {
        std::vector<PermissionRequest> cancelled;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (predicate(it->second)) {
                    it->second.cancellation_requested = true;
                    cancelled.push_back(std::move(it->second));
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        cv_.notify_all();

        for (auto& request : cancelled) {
            finish(request, PermissionResolution::Cancelled, "");
        }
        return cancelled.size();
    }

    // Sends the one response for a request already removed from the map
    void finish(PermissionRequest& request, PermissionResolution resolution, const std::string& option_id) {
        request.resolution = resolution;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            history_.emplace_back(request.request_id, resolution);
            if (history_.size() > kHistoryLimit) {
                history_.pop_front();
            }
        }

        spdlog::info("ACP: permission request {} {}{}",
                     protocol::request_id_to_string(request.request_id),
                     permission_resolution_to_string(resolution),
                     option_id.empty() ? "" : " (" + option_id + ")");

        if (responder_) {
            responder_(request.request_id, outcome_result(resolution, option_id));
        }
    }

    void timer_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            if (pending_.empty()) {
                cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
                continue;
            }

            auto next = pending_.begin()->second.deadline;
            for (const auto& [id, request] : pending_) {
                next = std::min(next, request.deadline);
            }

            if (cv_.wait_until(lock, next) == std::cv_status::timeout && !stopping_) {
                lock.unlock();
                sweep(std::chrono::steady_clock::now());
                lock.lock();
            }
        }
    }

    Config config_;
    EventSink& sink_;
    Responder responder_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<protocol::RequestId, PermissionRequest> pending_;
    std::deque<std::pair<protocol::RequestId, PermissionResolution>> history_;
    bool stopping_ = false;
    std::thread timer_thread_;
};

} // namespace engine
} // namespace acp
