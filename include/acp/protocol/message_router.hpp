#pragma once

#include "../types.hpp"
#include "types.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace acp {
namespace protocol {

/**
 * @brief Async request correlation for outbound JSON-RPC requests.
 *
 * Maps outgoing request IDs to std::promise objects so that responses
 * from the transport can be routed back to the correct caller.
 * Thread-safe: create_pending_request() is called from caller threads,
 * route_response() is called from the transport read thread.
 */
class MessageRouter {
public:
    using ResultFuture = std::future<Expected<nlohmann::json>>;

    /**
     * @brief Create a pending request and return its future.
     *
     * Generates a unique integer ID, stores a promise, and returns the
     * request ID along with a future that will resolve when the response arrives.
     */
    std::pair<int, ResultFuture> create_pending_request() {
        int id = next_id_.fetch_add(1, std::memory_order_relaxed);
        auto promise = std::make_shared<std::promise<Expected<nlohmann::json>>>();
        auto future = promise->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_[id] = std::move(promise);
        }

        return {id, std::move(future)};
    }

    /**
     * @brief Route a response frame to its pending request.
     *
     * @return false if no request with that id is pending (the response is dropped).
     */
    bool route_response(const Response& response) {
        if (!std::holds_alternative<int>(response.id)) {
            spdlog::warn("ACP: response with unknown id {} dropped", request_id_to_string(response.id));
            return false;
        }
        int id = std::get<int>(response.id);

        auto promise = take(id);
        if (!promise) {
            spdlog::warn("ACP: response with unknown id {} dropped", id);
            return false;
        }

        if (response.is_error()) {
            std::optional<std::string> context;
            if (response.error->data.has_value()) {
                context = response.error->data->dump();
            }
            promise->set_value(tl::unexpected(Error{
                ErrorCode::AgentError,
                "JSON-RPC error " + std::to_string(response.error->code) + ": " + response.error->message,
                std::move(context)
            }));
        } else if (response.result.has_value()) {
            promise->set_value(*response.result);
        } else {
            promise->set_value(nlohmann::json::object());
        }
        return true;
    }

    /**
     * @brief Resolve a pending request locally with an error (e.g. the write failed).
     */
    bool fail(int id, Error error) {
        auto promise = take(id);
        if (!promise) {
            return false;
        }
        promise->set_value(tl::unexpected(std::move(error)));
        return true;
    }

    /**
     * @brief Forget a pending request without resolving it.
     *
     * Used when the waiting caller gave up; a late response for the id is
     * then treated as unmatched.
     */
    bool abandon(int id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.erase(id) > 0;
    }

    /**
     * @brief Fail all pending requests with the given error.
     *
     * Called on disconnect and shutdown so no future is left dangling.
     */
    void cancel_all(ErrorCode code, const std::string& reason) {
        std::unordered_map<int, std::shared_ptr<std::promise<Expected<nlohmann::json>>>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending.swap(pending_);
        }
        for (auto& [id, promise] : pending) {
            promise->set_value(tl::unexpected(Error{code, reason}));
        }
    }

    /**
     * @brief Get the number of pending (in-flight) requests.
     */
    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    std::shared_ptr<std::promise<Expected<nlohmann::json>>> take(int id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return nullptr;
        }
        auto promise = std::move(it->second);
        pending_.erase(it);
        return promise;
    }

    std::atomic<int> next_id_{1};
    mutable std::mutex mutex_;
    std::unordered_map<int, std::shared_ptr<std::promise<Expected<nlohmann::json>>>> pending_;
};

} // namespace protocol
} // namespace acp
