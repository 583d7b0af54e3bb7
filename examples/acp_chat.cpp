/**
 * ACP Chat Application
 *
 * Interactive CLI that drives an Agent Client Protocol agent through the
 * ACP engine, streaming its thoughts, plan and tool calls to the console.
 *
 * Usage:
 *   ./acp_chat [options]
 *
 * Options:
 *   --agent <command>            Agent command line (default: $ACP_AGENT)
 *   --cwd <dir>                  Working directory for the session (default: .)
 *   --permission-timeout <sec>   Seconds before a permission prompt times out (default: 300)
 *   --auto-approve <title>       Approve permission requests with this title (repeatable)
 *   --show-thoughts              Print thought text as it streams
 *   --verbose                    Debug logging, including every wire frame
 *   --help                       Show this help message
 */

#include "acp/acp.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

// Global flag for Ctrl+C handling
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
    }
}

struct CLIArgs {
    std::string agent_command;
    std::string working_directory = ".";
    int permission_timeout = 300;
    std::set<std::string> auto_approve;
    bool show_thoughts = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "ACP Chat Application\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --agent <command>            Agent command line (default: $ACP_AGENT)\n";
    std::cout << "  --cwd <dir>                  Working directory for the session (default: .)\n";
    std::cout << "  --permission-timeout <sec>   Seconds before a permission prompt times out (default: 300)\n";
    std::cout << "  --auto-approve <title>       Approve permission requests with this title (repeatable)\n";
    std::cout << "  --show-thoughts              Print thought text as it streams\n";
    std::cout << "  --verbose                    Debug logging, including every wire frame\n";
    std::cout << "  --help                       Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " --agent \"copilot --acp\" --cwd ~/src/project\n\n";
    std::cout << "Interactive Commands:\n";
    std::cout << "  /quit, /exit    Exit the application\n";
    std::cout << "  /cancel         Cancel the running turn\n";
    std::cout << "  /help           Show available commands\n";
    std::cout << "  y / n / <id>    Answer a pending permission request\n";
    std::cout << "  Ctrl+C          Cancel the running turn\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    if (const char* env = std::getenv("ACP_AGENT")) {
        args.agent_command = env;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--agent" && i + 1 < argc) {
            args.agent_command = argv[++i];
        }
        else if (arg == "--cwd" && i + 1 < argc) {
            args.working_directory = argv[++i];
        }
        else if (arg == "--permission-timeout" && i + 1 < argc) {
            args.permission_timeout = std::stoi(argv[++i]);
        }
        else if (arg == "--auto-approve" && i + 1 < argc) {
            args.auto_approve.insert(argv[++i]);
        }
        else if (arg == "--show-thoughts") {
            args.show_thoughts = true;
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }

    if (args.agent_command.empty()) {
        std::cerr << "No agent command given (use --agent or set ACP_AGENT)\n";
        args.help = true;
    }

    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

// ============================================================================
// Console Event Sink
// ============================================================================

/**
 * Prints engine events as they arrive and remembers the permission request
 * currently waiting for an answer.
 */
class ConsoleSink : public acp::engine::EventSink {
public:
    explicit ConsoleSink(bool show_thoughts) : show_thoughts_(show_thoughts) {}

    void on_status(const acp::engine::StatusEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event.kind == acp::engine::StatusKind::ToolCall) {
            std::cout << "\n  [tool] " << event.title;
            if (!event.detail.empty()) {
                std::cout << " (" << event.detail << ")";
            }
            std::cout << "\n";
        } else if (event.kind == acp::engine::StatusKind::Plan) {
            std::cout << "\n  [plan]\n" << event.detail << "\n";
        }
        std::cout.flush();
    }

    void on_draft(const acp::engine::DraftEvent&) override {}

    void on_thought(const acp::engine::ThoughtEvent& event) override {
        if (!show_thoughts_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "\n  [thinking] " << event.text << "\n" << std::flush;
    }

    void on_request(const acp::engine::PermissionPromptEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = event.request_id;
        std::cout << "\n  [permission] " << event.title << "\n";
        for (const auto& option : event.options) {
            std::cout << "    " << option.option_id << "  " << option.name << " (" << option.kind << ")\n";
        }
        std::cout << "  Answer y, n or an option id: " << std::flush;
    }

    void on_request_timeout(const acp::engine::RequestTimeoutEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ == event.request_id) {
            pending_.reset();
        }
        std::cout << "\n  [permission timed out]\n" << std::flush;
    }

    void on_turn_complete(const acp::engine::TurnResult& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "\nAgent: " << result.text() << "\n";
        for (const auto& block : result.final_blocks) {
            if (block.kind != acp::engine::BlockKind::Text) {
                std::cout << "  [" << acp::engine::block_kind_to_string(block.kind) << "] "
                          << block.payload.value("uri", block.payload.value("name", "")) << "\n";
            }
        }
        if (!result.stop_reason.empty()) {
            std::cout << "  (" << result.stop_reason << ")\n";
        }
        std::cout.flush();
    }

    void on_session_state(acp::SessionState state) override {
        if (state == acp::SessionState::Restarting) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cout << "\n  [agent disconnected]\n" << std::flush;
        }
    }

    std::optional<acp::protocol::RequestId> take_pending() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = pending_;
        pending_.reset();
        return id;
    }

private:
    bool show_thoughts_;
    std::mutex mutex_;
    std::optional<acp::protocol::RequestId> pending_;
};

int main(int argc, char** argv) {
    // Parse arguments first before any other operations
    CLIArgs args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return args.agent_command.empty() ? 1 : 0;
    }

    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);

    // Setup signal handler
    std::signal(SIGINT, signal_handler);

    // Build acp::Config from CLI args
    acp::Config config;
    config.agent_command = args.agent_command;
    config.working_directory = args.working_directory;
    config.permission_timeout = std::chrono::seconds(args.permission_timeout);
    config.verbose_wire_logging = args.verbose;
    if (!args.auto_approve.empty()) {
        auto titles = args.auto_approve;
        config.auto_approve = [titles](const std::string& title, const nlohmann::json&) {
            return titles.count(title) > 0;
        };
    }

    auto sink = std::make_shared<ConsoleSink>(args.show_thoughts);
    auto controller_result = acp::SessionController::create(config, sink);
    if (!controller_result) {
        std::cerr << "Error: " << controller_result.error().to_string() << "\n";
        return 1;
    }
    auto controller = std::move(*controller_result);

    std::cout << "Starting agent...\n";
    auto started = controller->start();
    if (!started) {
        std::cerr << "Error: " << started.error().to_string() << "\n";
        return 1;
    }

    // Ctrl+C cancels the running turn instead of killing the process
    std::atomic<bool> running{true};
    std::thread interrupt_watcher([&]() {
        while (running) {
            if (g_interrupted.exchange(false)) {
                if (controller->cancel()) {
                    std::cout << "\n[Turn cancelled]\n" << std::flush;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::cout << "\n";
    print_separator();
    std::cout << "ACP Chat\n";
    print_separator();
    std::cout << "Agent: " << config.agent_command << "\n";
    if (auto info = controller->agent_info(); info && !info->agent_info.name.empty()) {
        std::cout << "Agent info: " << info->agent_info.name << " " << info->agent_info.version << "\n";
    }
    std::cout << "Session: " << controller->session_id().value_or("(none)") << "\n";
    print_separator();
    std::cout << "\nType your message and press Enter. Type '/quit' to exit.\n";

    std::future<acp::Expected<acp::engine::TurnResult>> turn;
    auto turn_running = [&turn]() {
        return turn.valid() && turn.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    };

    std::string line;
    while (true) {
        if (!turn_running()) {
            if (turn.valid()) {
                auto result = turn.get();
                if (!result) {
                    std::cerr << "\nError: " << result.error().to_string() << "\n";
                }
            }
            std::cout << "\nYou: " << std::flush;
        }

        if (!std::getline(std::cin, line)) {
            break;  // EOF or error
        }

        // Trim whitespace
        line.erase(0, line.find_first_not_of(" \t\n\r"));
        line.erase(line.find_last_not_of(" \t\n\r") + 1);

        if (line.empty()) {
            continue;
        }

        if (line == "/quit" || line == "/exit") {
            std::cout << "Goodbye!\n";
            break;
        }
        if (line == "/cancel") {
            if (!controller->cancel()) {
                std::cout << "No turn is running.\n";
            }
            continue;
        }
        if (line == "/help") {
            std::cout << "\nAvailable commands:\n";
            std::cout << "  /quit, /exit    Exit the application\n";
            std::cout << "  /cancel         Cancel the running turn\n";
            std::cout << "  /help           Show this help\n";
            continue;
        }

        // While a turn runs, input answers permission requests
        if (turn_running()) {
            auto pending = sink->take_pending();
            if (!pending) {
                std::cout << "The agent is working; /cancel to stop it.\n";
                continue;
            }
            acp::engine::PermissionDecision decision =
                line == "y" ? acp::engine::PermissionDecision::approve()
                : line == "n" ? acp::engine::PermissionDecision::deny()
                : acp::engine::PermissionDecision::from_string(line);
            if (!controller->respond_permission(*pending, decision)) {
                std::cout << "That permission request is no longer pending.\n";
            }
            continue;
        }

        turn = std::async(std::launch::async, [&controller, line]() {
            return controller->prompt(line);
        });
    }

    running = false;
    controller->cancel();
    if (turn.valid()) {
        turn.wait();
    }
    interrupt_watcher.join();
    controller->stop();

    std::cout << "\n";
    return 0;
}
