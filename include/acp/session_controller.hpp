#pragma once

#include "types.hpp"
#include "engine/content_classifier.hpp"
#include "engine/events.hpp"
#include "engine/permission_broker.hpp"
#include "engine/session_update_handler.hpp"
#include "engine/turn_state.hpp"
#include "protocol/capabilities.hpp"
#include "protocol/frame_classifier.hpp"
#include "protocol/json_rpc.hpp"
#include "protocol/message_router.hpp"
#include "transport/itransport.hpp"
#include "transport/stdio_transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <variant>

namespace acp {

/**
 * @brief Options for a single prompt turn.
 */
struct PromptOptions {
    std::optional<std::chrono::milliseconds> timeout;  ///< No deadline when unset
};

/**
 * @brief Owns one agent subprocess and drives ACP sessions against it.
 *
 * The SessionController spawns the agent, performs the initialize and
 * session/new handshake, and runs prompt turns. Everything the agent sends
 * arrives on the transport's read thread, which is the only writer of turn
 * state: responses resolve pending futures, session/update notifications
 * feed the active TurnState, and permission requests go to the broker.
 *
 * Thread Model:
 * - Calling threads: start(), prompt(), cancel(), respond_permission(), stop()
 * - Read thread: frame classification and dispatch, EventSink callbacks
 * - Permission timer thread: permission timeouts
 * - Supervisor thread: tears the session down once the disconnect grace
 *   period elapses
 *
 * Only one prompt runs at a time; a second concurrent prompt() fails fast
 * with AgentBusy.
 *
 * Example Usage:
 * @code
 * acp::Config config;
 * config.agent_command = "copilot --acp";
 *
 * auto controller = acp::SessionController::create(config, std::make_shared<MySink>());
 * if (!controller) {
 *     std::cerr << controller.error().to_string() << std::endl;
 *     return 1;
 * }
 *
 * auto result = (*controller)->prompt("Summarize README.md");
 * if (result) {
 *     std::cout << result->text() << std::endl;
 * }
 * @endcode
 */
class SessionController {
public:
    using TransportFactory =
        std::function<Expected<std::shared_ptr<transport::ITransport>>(const Config&)>;

    /**
     * @brief Factory method to create a SessionController.
     *
     * Validates the configuration. The agent is spawned lazily by start()
     * or the first prompt().
     *
     * @param config Engine configuration
     * @param sink Receiver of engine events (a NullEventSink when null)
     * @param factory Transport factory (spawns the configured command when empty)
     */
    static Expected<std::unique_ptr<SessionController>> create(
        Config config,
        std::shared_ptr<engine::EventSink> sink = nullptr,
        TransportFactory factory = {}
    ) {
        auto validation = config.validate();
        if (!validation) {
            return tl::unexpected(validation.error());
        }

        if (!sink) {
            sink = std::make_shared<engine::NullEventSink>();
        }
        if (!factory) {
            factory = &SessionController::spawn_stdio_transport;
        }

        return std::unique_ptr<SessionController>(
            new SessionController(std::move(config), std::move(sink), std::move(factory)));
    }

    ~SessionController() {
        stop();
        {
            std::lock_guard<std::mutex> lock(supervisor_mutex_);
            supervisor_stop_ = true;
        }
        supervisor_cv_.notify_all();
        if (supervisor_thread_.joinable()) {
            supervisor_thread_.join();
        }
        broker_.reset();
    }

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Spawn the agent and open a session.
     *
     * No-op when already Ready. Also clears the restart-failure counter, so
     * an explicit start() is always attempted.
     */
    Expected<void> start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        consecutive_failures_ = 0;
        if (is_ready_locked()) {
            return {};
        }
        return start_locked();
    }

    /**
     * @brief Cancel outstanding work and shut the agent down.
     */
    void stop() {
        cancel();

        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        disarm_grace();
        if (state_.load() == SessionState::Stopped && !current_transport()) {
            return;
        }
        teardown_locked(ErrorCode::AgentNotRunning, "Session stopped");
        set_state(SessionState::Stopped);
    }

    // ========================================================================
    // Prompt Turns
    // ========================================================================

    /**
     * @brief Send a text prompt and wait for the turn to finish.
     *
     * @return The turn's final blocks, or InvalidConfig, AgentBusy, RequestCancelled,
     *         RequestTimeout, AgentDisconnected, AgentError
     */
    Expected<engine::TurnResult> prompt(const std::string& text, PromptOptions options = {}) {
        return prompt_blocks(nlohmann::json::array({{{"type", "text"}, {"text", text}}}), options);
    }

    /**
     * @brief Send a prompt made of ACP content blocks.
     */
    Expected<engine::TurnResult> prompt_blocks(const nlohmann::json& blocks, PromptOptions options = {}) {
        if (!blocks.is_array() || blocks.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Prompt must be a non-empty array of content blocks"});
        }

        // Serialize before any turn state exists so a bad prompt leaves nothing behind
        std::string prompt_json;
        try {
            prompt_json = blocks.dump();
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Prompt is not valid UTF-8", e.what()});
        }

        std::unique_lock<std::mutex> busy(prompt_mutex_, std::try_to_lock);
        if (!busy.owns_lock()) {
            return tl::unexpected(Error{ErrorCode::AgentBusy, "A prompt is already in progress"});
        }

        auto started = ensure_started();
        if (!started) {
            return tl::unexpected(started.error());
        }

        auto sid = session_id();
        if (!sid) {
            return tl::unexpected(Error{ErrorCode::NoActiveSession, "No ACP session is open"});
        }

        auto [id, future] = router_.create_pending_request();
        auto turn = std::make_unique<engine::TurnState>(id, config_.answer_after_tool_calls);
        auto token = turn->cancel_token();
        {
            std::lock_guard<std::mutex> lock(turn_mutex_);
            active_turn_ = std::move(turn);
        }
        {
            std::lock_guard<std::mutex> lock(cancel_mutex_);
            active_cancel_ = token;
            active_turn_id_ = id;
        }

        emit_status(id, engine::StatusKind::TurnStarted, "Turn started", truncate_utf8(prompt_json, 120));

        protocol::Request request;
        request.id = id;
        request.method = "session/prompt";
        request.params = {{"sessionId", *sid}, {"prompt", blocks}};

        auto sent = send_frame(protocol::JsonRpc::encode_request(request));
        if (!sent) {
            router_.fail(id, sent.error());
        }

        auto deadline = deadline_after(options.timeout);

        std::optional<Error> interrupted;
        while (future.wait_for(kPromptPoll) != std::future_status::ready) {
            if (token->load()) {
                interrupted = Error{ErrorCode::RequestCancelled, "Prompt cancelled"};
            } else if (std::chrono::steady_clock::now() >= deadline) {
                interrupted = Error{ErrorCode::RequestTimeout, "Prompt timed out"};
            } else {
                continue;
            }
            // A response routed in the meantime wins over the interruption
            if (router_.abandon(id)) {
                break;
            }
            interrupted.reset();
        }

        auto finished = finish_turn();

        if (interrupted) {
            if (interrupted->code == ErrorCode::RequestTimeout) {
                broker_->cancel_turn(id);
                send_session_cancel();
            }
            emit_status(id, engine::StatusKind::TurnCancelled, "Turn cancelled", interrupted->message);
            spdlog::info("ACP turn {} ended: {}", id, interrupted->message);
            return tl::unexpected(*interrupted);
        }

        auto response = future.get();
        if (!response) {
            emit_status(id, engine::StatusKind::TurnFailed, "Turn failed", response.error().message);
            spdlog::error("ACP turn {} failed: {}", id, response.error().to_string());
            if (response.error().message.find("Concurrent prompts") != std::string::npos) {
                spdlog::warn("ACP agent rejected a concurrent prompt, restarting it");
                restart();
            }
            return tl::unexpected(response.error());
        }

        engine::TurnResult result;
        result.turn_id = id;
        result.final_blocks = finished->final_blocks();
        if (response->is_object()) {
            auto reason = response->find("stopReason");
            if (reason != response->end() && reason->is_string()) {
                result.stop_reason = reason->get<std::string>();
            }
        }
        if (result.final_blocks.empty()) {
            result.final_blocks = blocks_from_result(*response);
            for (auto& block : result.final_blocks) {
                finished->append_final(block);
            }
        }

        sink_->on_turn_complete(result);
        emit_status(id, engine::StatusKind::TurnCompleted, "Turn completed", result.stop_reason);
        spdlog::info("ACP turn {} complete: {}", id,
                     finished->summary().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return result;
    }

    /**
     * @brief Cancel the active turn, if any.
     *
     * Cancels the turn's permission requests and notifies the agent with
     * session/cancel. The waiting prompt() returns RequestCancelled.
     *
     * @return false when no turn is active
     */
    bool cancel() {
        std::shared_ptr<std::atomic<bool>> token;
        int turn_id = 0;
        {
            std::lock_guard<std::mutex> lock(cancel_mutex_);
            token = active_cancel_;
            turn_id = active_turn_id_;
        }
        if (!token || token->exchange(true)) {
            return false;
        }

        spdlog::info("ACP: cancelling turn {}", turn_id);
        broker_->cancel_turn(turn_id);
        send_session_cancel();
        return true;
    }

    /**
     * @brief Answer a pending permission request.
     *
     * @return false if the request is no longer pending
     */
    bool respond_permission(const protocol::RequestId& request_id, const engine::PermissionDecision& decision) {
        return broker_->resolve(request_id, decision);
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    SessionState state() const { return state_.load(); }

    std::optional<std::string> session_id() const {
        std::lock_guard<std::mutex> lock(info_mutex_);
        return session_id_;
    }

    std::optional<protocol::InitializeResult> agent_info() const {
        std::lock_guard<std::mutex> lock(info_mutex_);
        return init_result_;
    }

    bool is_busy() const {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        return active_cancel_ != nullptr;
    }

    size_t pending_permissions() const { return broker_->pending_count(); }

    const Config& get_config() const { return config_; }

private:
    static constexpr auto kPromptPoll = std::chrono::milliseconds(50);
    static constexpr size_t kWireLogLimit = 500;

    SessionController(Config config, std::shared_ptr<engine::EventSink> sink, TransportFactory factory)
        : config_(std::move(config))
        , sink_(std::move(sink))
        , factory_(std::move(factory))
        , update_handler_(engine::ContentClassifier(config_.thought_tags), *sink_) {
        engine::PermissionBroker::Config broker_config;
        broker_config.timeout = config_.permission_timeout;
        broker_config.auto_approve = config_.auto_approve;
        broker_ = std::make_unique<engine::PermissionBroker>(
            std::move(broker_config), *sink_,
            [this](const protocol::RequestId& id, const nlohmann::json& result) {
                auto sent = send_frame(protocol::JsonRpc::encode_result(id, result));
                if (!sent) {
                    spdlog::warn("ACP: could not answer permission request {}: {}",
                                 protocol::request_id_to_string(id), sent.error().message);
                }
            });

        supervisor_thread_ = std::thread([this]() { supervisor_loop(); });
    }

    static Expected<std::shared_ptr<transport::ITransport>> spawn_stdio_transport(const Config& config) {
        auto command = transport::StdioTransport::from_command_line(config.agent_command);
        if (!command) {
            return tl::unexpected(command.error());
        }
        return std::shared_ptr<transport::ITransport>(
            std::make_shared<transport::StdioTransport>(std::move(*command)));
    }

    // ========================================================================
    // Lifecycle (lifecycle_mutex_ held)
    // ========================================================================

    bool is_ready_locked() const {
        auto t = current_transport();
        return state_.load() == SessionState::Ready && t && t->is_connected();
    }

    Expected<void> ensure_started() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (is_ready_locked()) {
            return {};
        }
        if (consecutive_failures_ >= config_.max_restart_attempts) {
            return tl::unexpected(Error{
                ErrorCode::AgentRestartFailed,
                "Agent failed to start " + std::to_string(consecutive_failures_) + " times in a row"
            });
        }
        return start_locked();
    }

    Expected<void> start_locked() {
        disarm_grace();
        teardown_locked(ErrorCode::AgentDisconnected, "Agent restarting");

        set_state(SessionState::Starting);

        auto created = factory_(config_);
        if (!created) {
            return start_failed(created.error());
        }
        auto transport = std::move(*created);

        const std::uint64_t generation = ++generation_;
        transport->set_receive_callback([this, generation](const std::string& line) {
            if (generation == generation_.load()) {
                handle_line(line);
            }
        });
        transport->set_error_callback([this, generation](const std::string& message) {
            on_transport_error(generation, message);
        });

        auto connected = transport->connect();
        if (!connected) {
            return start_failed(connected.error());
        }
        {
            std::lock_guard<std::mutex> lock(transport_mutex_);
            transport_ = transport;
        }

        set_state(SessionState::Initializing);

        auto init_response = request("initialize", protocol::build_initialize_params(config_));
        if (!init_response) {
            teardown_locked(ErrorCode::HandshakeFailed, "initialize failed");
            return start_failed(Error{ErrorCode::HandshakeFailed,
                                      "initialize failed: " + init_response.error().message,
                                      init_response.error().context});
        }
        auto init = protocol::parse_initialize_result(*init_response);
        if (!init) {
            teardown_locked(ErrorCode::HandshakeFailed, "initialize failed");
            return start_failed(init.error());
        }
        if (init->protocol_version != config_.protocol_version) {
            spdlog::warn("ACP agent speaks protocol version {}, client requested {}",
                         init->protocol_version, config_.protocol_version);
        }

        nlohmann::json session_params = {
            {"cwd", config_.working_directory},
            {"mcpServers", config_.mcp_servers}
        };
        auto session_response = request("session/new", session_params);
        if (!session_response) {
            teardown_locked(ErrorCode::HandshakeFailed, "session/new failed");
            return start_failed(Error{ErrorCode::HandshakeFailed,
                                      "session/new failed: " + session_response.error().message,
                                      session_response.error().context});
        }
        auto sid = session_response->is_object() ? session_response->find("sessionId") : session_response->end();
        if (!session_response->is_object() || sid == session_response->end() || !sid->is_string()) {
            teardown_locked(ErrorCode::HandshakeFailed, "session/new failed");
            return start_failed(Error{ErrorCode::HandshakeFailed, "session/new returned no sessionId",
                                      session_response->dump()});
        }

        {
            std::lock_guard<std::mutex> lock(info_mutex_);
            session_id_ = sid->get<std::string>();
            init_result_ = *init;
        }
        consecutive_failures_ = 0;

        spdlog::info("ACP session {} ready (agent: {} {})", sid->get<std::string>(),
                     init->agent_info.name.empty() ? "unknown" : init->agent_info.name,
                     init->agent_info.version);
        set_state(SessionState::Ready);
        return {};
    }

    Expected<void> start_failed(Error error) {
        ++consecutive_failures_;
        spdlog::error("ACP agent start failed ({} of {}): {}", consecutive_failures_,
                      config_.max_restart_attempts, error.to_string());
        set_state(SessionState::Stopped);
        return tl::unexpected(std::move(error));
    }

    /**
     * @brief Drop the current transport and fail everything waiting on it.
     *
     * Permission requests are cancelled while the transport can still carry
     * the answers.
     */
    void teardown_locked(ErrorCode code, const std::string& reason) {
        broker_->cancel_all();

        std::shared_ptr<transport::ITransport> transport;
        {
            std::lock_guard<std::mutex> lock(transport_mutex_);
            transport.swap(transport_);
        }
        ++generation_;

        router_.cancel_all(code, reason);
        {
            std::lock_guard<std::mutex> lock(info_mutex_);
            session_id_.reset();
        }

        if (transport) {
            transport->disconnect();
        }
    }

    void restart() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        auto restarted = start_locked();
        if (!restarted) {
            spdlog::error("ACP agent restart failed: {}", restarted.error().to_string());
        }
    }

    // ========================================================================
    // Disconnect Handling
    // ========================================================================

    // Runs on the read thread of the dying transport; never joins it
    void on_transport_error(std::uint64_t generation, const std::string& message) {
        if (generation != generation_.load()) {
            return;
        }

        spdlog::error("ACP agent disconnected: {}", message);
        set_state(SessionState::Restarting);

        router_.cancel_all(ErrorCode::AgentDisconnected, "Agent disconnected: " + message);
        broker_->cancel_all();

        {
            std::lock_guard<std::mutex> lock(supervisor_mutex_);
            grace_deadline_ = std::chrono::steady_clock::now() + config_.disconnect_grace;
        }
        supervisor_cv_.notify_all();
    }

    void disarm_grace() {
        {
            std::lock_guard<std::mutex> lock(supervisor_mutex_);
            grace_deadline_.reset();
        }
        supervisor_cv_.notify_all();
    }

    void supervisor_loop() {
        std::unique_lock<std::mutex> lock(supervisor_mutex_);
        while (!supervisor_stop_) {
            if (!grace_deadline_) {
                supervisor_cv_.wait(lock, [this]() { return supervisor_stop_ || grace_deadline_.has_value(); });
                continue;
            }

            auto deadline = *grace_deadline_;
            bool changed = supervisor_cv_.wait_until(lock, deadline, [this, deadline]() {
                return supervisor_stop_ || !grace_deadline_ || *grace_deadline_ != deadline;
            });
            if (changed) {
                continue;
            }
            grace_deadline_.reset();
            lock.unlock();

            {
                std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
                if (state_.load() == SessionState::Restarting) {
                    spdlog::info("ACP disconnect grace period elapsed, tearing the session down");
                    teardown_locked(ErrorCode::AgentDisconnected, "Agent disconnected");
                    set_state(SessionState::Stopped);
                }
            }

            lock.lock();
        }
    }

    // ========================================================================
    // Outbound
    // ========================================================================

    std::shared_ptr<transport::ITransport> current_transport() const {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        return transport_;
    }

    Expected<void> send_frame(const std::string& line) {
        auto transport = current_transport();
        if (!transport) {
            return tl::unexpected(Error{ErrorCode::AgentNotRunning, "Agent is not running"});
        }
        if (config_.verbose_wire_logging) {
            spdlog::debug("ACP > {}", truncate_utf8(line, kWireLogLimit));
        }
        return transport->send(line);
    }

    Expected<nlohmann::json> request(const std::string& method, const nlohmann::json& params) {
        auto [id, future] = router_.create_pending_request();

        protocol::Request req;
        req.id = id;
        req.method = method;
        req.params = params;

        auto sent = send_frame(protocol::JsonRpc::encode_request(req));
        if (!sent) {
            router_.fail(id, sent.error());
        }

        if (future.wait_for(config_.request_timeout) != std::future_status::ready) {
            if (router_.abandon(id)) {
                return tl::unexpected(Error{ErrorCode::RequestTimeout, method + " timed out"});
            }
        }
        return future.get();
    }

    void send_session_cancel() {
        if (!config_.send_session_cancel) {
            return;
        }
        auto sid = session_id();
        if (!sid) {
            return;
        }
        auto sent = send_frame(protocol::JsonRpc::encode_notification("session/cancel", {{"sessionId", *sid}}));
        if (!sent) {
            spdlog::warn("ACP: session/cancel not delivered: {}", sent.error().message);
        }
    }

    void send_error(const protocol::RequestId& id, int code, const std::string& message) {
        auto sent = send_frame(protocol::JsonRpc::encode_error(id, code, message));
        if (!sent) {
            spdlog::warn("ACP: error response for {} not delivered: {}",
                         protocol::request_id_to_string(id), sent.error().message);
        }
    }

    // ========================================================================
    // Inbound (read thread)
    // ========================================================================

    void handle_line(const std::string& line) {
        if (config_.verbose_wire_logging) {
            spdlog::debug("ACP < {}", truncate_utf8(line, kWireLogLimit));
        }

        for (const auto& frame : protocol::FrameClassifier::parse_line(line)) {
            if (const auto* response = std::get_if<protocol::Response>(&frame)) {
                router_.route_response(*response);
            } else if (const auto* req = std::get_if<protocol::Request>(&frame)) {
                handle_request(*req);
            } else if (const auto* note = std::get_if<protocol::Notification>(&frame)) {
                handle_notification(*note);
            }
        }
    }

    void handle_request(const protocol::Request& req) {
        if (req.method == "session/request_permission") {
            auto permission = engine::PermissionRequest::from_params(req.id, req.params);
            {
                std::lock_guard<std::mutex> lock(cancel_mutex_);
                if (active_cancel_) {
                    permission.turn_id = active_turn_id_;
                }
            }
            broker_->open(std::move(permission));
            return;
        }

        if (protocol::is_rejected_method(req.method)) {
            spdlog::warn("ACP: rejecting unsupported agent request {}", req.method);
            send_error(req.id, protocol::error_codes::MethodNotFound, "Method not supported: " + req.method);
            return;
        }

        spdlog::warn("ACP: unknown agent request {}", req.method);
        send_error(req.id, protocol::error_codes::MethodNotFound, "Method not found: " + req.method);
    }

    void handle_notification(const protocol::Notification& note) {
        if (note.method != "session/update") {
            spdlog::debug("ACP: ignoring notification {}", note.method);
            return;
        }

        auto sid = session_id();
        auto sid_it = note.params.find("sessionId");
        if (sid && sid_it != note.params.end() && sid_it->is_string() && sid_it->get<std::string>() != *sid) {
            spdlog::warn("ACP: session/update for unknown session {} dropped", sid_it->dump());
            return;
        }

        auto update = note.params.find("update");
        if (update == note.params.end()) {
            spdlog::warn("ACP: session/update without update dropped");
            return;
        }

        std::lock_guard<std::mutex> lock(turn_mutex_);
        if (!active_turn_) {
            spdlog::debug("ACP: session/update outside of a turn dropped");
            return;
        }
        update_handler_.handle(*active_turn_, *update);
    }

    // ========================================================================
    // Helpers
    // ========================================================================

    std::unique_ptr<engine::TurnState> finish_turn() {
        {
            std::lock_guard<std::mutex> lock(cancel_mutex_);
            active_cancel_.reset();
            active_turn_id_ = 0;
        }
        std::lock_guard<std::mutex> lock(turn_mutex_);
        return std::move(active_turn_);
    }

    void set_state(SessionState state) {
        if (state_.exchange(state) == state) {
            return;
        }
        spdlog::info("ACP session state: {}", session_state_to_string(state));
        sink_->on_session_state(state);
    }

    void emit_status(int turn_id, engine::StatusKind kind, std::string title, std::string detail) {
        engine::StatusEvent event;
        event.turn_id = turn_id;
        event.kind = kind;
        event.title = std::move(title);
        event.detail = std::move(detail);
        sink_->on_status(event);
    }

    /**
     * @brief Final blocks carried by the prompt response itself.
     *
     * Used when the agent streamed no final content. Looks at "content",
     * then "message.content", "message.text" and "text".
     */
    static std::vector<engine::ContentBlock> blocks_from_result(const nlohmann::json& result) {
        std::vector<engine::ContentBlock> blocks;
        if (!result.is_object()) {
            return blocks;
        }

        auto from_content = [&blocks](const nlohmann::json& content) {
            std::vector<nlohmann::json> raw;
            engine::flatten_content(content, raw);
            for (const auto& item : raw) {
                if (auto block = engine::ContentBlock::from_json(item, engine::Channel::Final)) {
                    blocks.push_back(std::move(*block));
                }
            }
        };
        auto text_of = [](const nlohmann::json& obj, const char* key) -> std::optional<std::string> {
            auto it = obj.find(key);
            if (it != obj.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
                return it->get<std::string>();
            }
            return std::nullopt;
        };

        if (auto it = result.find("content"); it != result.end()) {
            from_content(*it);
        }
        auto message = result.find("message");
        if (blocks.empty() && message != result.end() && message->is_object()) {
            if (auto it = message->find("content"); it != message->end()) {
                from_content(*it);
            }
            if (blocks.empty()) {
                if (auto text = text_of(*message, "text")) {
                    blocks.push_back(engine::ContentBlock::text_block(*text));
                }
            }
        }
        if (blocks.empty()) {
            if (auto text = text_of(result, "text")) {
                blocks.push_back(engine::ContentBlock::text_block(*text));
            }
        }
        return blocks;
    }

    static std::chrono::steady_clock::time_point deadline_after(std::optional<std::chrono::milliseconds> timeout) {
        using Clock = std::chrono::steady_clock;
        auto now = Clock::now();
        if (!timeout) {
            return Clock::time_point::max();
        }
        auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
        if (*timeout >= headroom) {
            return Clock::time_point::max();
        }
        return now + *timeout;
    }

    Config config_;
    std::shared_ptr<engine::EventSink> sink_;
    TransportFactory factory_;

    protocol::MessageRouter router_;
    engine::SessionUpdateHandler update_handler_;
    std::unique_ptr<engine::PermissionBroker> broker_;

    // Lifecycle
    std::mutex lifecycle_mutex_;                    ///< Serializes start/stop/teardown; never taken on the read thread
    std::atomic<SessionState> state_{SessionState::Stopped};
    std::atomic<std::uint64_t> generation_{0};      ///< Bumped per transport; stale callbacks are ignored
    int consecutive_failures_ = 0;

    mutable std::mutex transport_mutex_;
    std::shared_ptr<transport::ITransport> transport_;

    mutable std::mutex info_mutex_;
    std::optional<std::string> session_id_;
    std::optional<protocol::InitializeResult> init_result_;

    // Turns
    std::mutex prompt_mutex_;                       ///< Held for the whole of a prompt turn
    std::mutex turn_mutex_;
    std::unique_ptr<engine::TurnState> active_turn_;
    mutable std::mutex cancel_mutex_;
    std::shared_ptr<std::atomic<bool>> active_cancel_;
    int active_turn_id_ = 0;

    // Disconnect grace
    std::mutex supervisor_mutex_;
    std::condition_variable supervisor_cv_;
    std::optional<std::chrono::steady_clock::time_point> grace_deadline_;
    bool supervisor_stop_ = false;
    std::thread supervisor_thread_;
};

} // namespace acp
