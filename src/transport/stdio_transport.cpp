#include "acp/transport/stdio_transport.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4200)
#endif

#include <subprocess.h>

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#include <chrono>
#include <cstring>
#include <spdlog/spdlog.h>
#include <system_error>

namespace acp {
namespace transport {

namespace {

constexpr auto kExitWait = std::chrono::seconds(2);
constexpr auto kExitPoll = std::chrono::milliseconds(50);

// Reads newline-delimited lines until EOF, error, or keep_going() turns false.
// Trailing '\r' is stripped; empty lines are skipped.
template<typename KeepGoing, typename OnLine>
void read_lines(FILE* fp, KeepGoing keep_going, OnLine on_line) {
    std::string buffer;
    char chunk[4096];

    while (keep_going()) {
        if (!fgets(chunk, sizeof(chunk), fp)) {
            if (feof(fp) || ferror(fp)) {
                break;
            }
            continue;
        }
        buffer.append(chunk, strlen(chunk));

        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }
            on_line(line);
        }
    }
}

} // namespace

Expected<StdioTransport::Config> StdioTransport::from_command_line(const std::string& command_line) {
    std::vector<std::string> parts;
    std::string current;
    bool in_token = false;
    char quote = '\0';

    for (size_t i = 0; i < command_line.size(); ++i) {
        char c = command_line[i];

        if (quote == '\'') {
            if (c == '\'') {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }

        if (c == '\\') {
            if (i + 1 >= command_line.size()) {
                return tl::unexpected(Error{ErrorCode::InvalidCommand, "Trailing backslash in agent command", command_line});
            }
            char next = command_line[++i];
            // Inside double quotes a backslash only escapes \, " and $
            if (quote == '"' && next != '\\' && next != '"' && next != '$') {
                current += '\\';
            }
            current += next;
            in_token = true;
            continue;
        }

        if (quote == '"') {
            if (c == '"') {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
        } else if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (in_token) {
                parts.push_back(std::move(current));
                current.clear();
                in_token = false;
            }
        } else {
            current += c;
            in_token = true;
        }
    }

    if (quote != '\0') {
        return tl::unexpected(Error{ErrorCode::InvalidCommand, "Unterminated quote in agent command", command_line});
    }
    if (in_token) {
        parts.push_back(std::move(current));
    }
    if (parts.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidCommand, "Agent command is empty"});
    }

    Config config;
    config.command = std::move(parts.front());
    config.args.assign(std::make_move_iterator(parts.begin() + 1), std::make_move_iterator(parts.end()));
    return config;
}

StdioTransport::StdioTransport(Config config)
    : config_(std::move(config))
    , process_(std::make_unique<subprocess_s>()) {}

StdioTransport::~StdioTransport() {
    disconnect();
}

Expected<void> StdioTransport::connect() {
    if (connected_.load()) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "Already connected"});
    }

    // subprocess_create expects a null-terminated array of C strings.
    // Reserve upfront so no reallocation invalidates the c_str() pointers.
    std::vector<const char*> cmd_parts;
    cmd_parts.reserve(config_.args.size() + 2);
    cmd_parts.push_back(config_.command.c_str());
    for (const auto& arg : config_.args) {
        cmd_parts.push_back(arg.c_str());
    }
    cmd_parts.push_back(nullptr);

    int options = subprocess_option_inherit_environment |
                  subprocess_option_search_user_path;

    *process_ = subprocess_s{};
    if (subprocess_create(cmd_parts.data(), options, process_.get()) != 0) {
        return tl::unexpected(Error{
            ErrorCode::AgentSpawnFailed,
            "Failed to spawn agent: " + config_.command
        });
    }

    stdin_fp_ = subprocess_stdin(process_.get());
    connected_.store(true);

    try {
        read_thread_ = std::thread([this]() { read_loop(); });
        stderr_thread_ = std::thread([this]() { stderr_loop(); });
    } catch (const std::system_error& e) {
        connected_.store(false);
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            stdin_fp_ = nullptr;
        }
        subprocess_terminate(process_.get());
        if (read_thread_.joinable()) {
            read_thread_.join();
        }
        subprocess_destroy(process_.get());
        return tl::unexpected(Error{
            ErrorCode::TransportFailed,
            std::string("Failed to start reader threads: ") + e.what()
        });
    }

    spdlog::info("ACP agent started: {}", config_.command);
    return {};
}

void StdioTransport::disconnect() {
    if (!read_thread_.joinable() && !stderr_thread_.joinable()) {
        connected_.store(false);
        return;
    }

    // Signal the read loop to stop; it will no longer report an unexpected exit
    connected_.store(false);

    // Close stdin under the I/O lock so send() never writes to a closed handle.
    // subprocess_destroy() would close it again, so detach it from process_.
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (stdin_fp_) {
            fclose(stdin_fp_);
            stdin_fp_ = nullptr;
            process_->stdin_file = nullptr;
        }
    }

    // Give the agent a moment to exit on EOF, then kill it so the readers see EOF
    auto deadline = std::chrono::steady_clock::now() + kExitWait;
    while (subprocess_alive(process_.get()) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kExitPoll);
    }
    if (subprocess_alive(process_.get())) {
        spdlog::warn("ACP agent did not exit after stdin closed, terminating");
        subprocess_terminate(process_.get());
    }

    if (read_thread_.joinable()) {
        read_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }

    int exit_code = 0;
    if (subprocess_join(process_.get(), &exit_code) == 0) {
        spdlog::info("ACP agent stopped (exit code {})", exit_code);
    }
    subprocess_destroy(process_.get());
}

bool StdioTransport::is_connected() const {
    return connected_.load();
}

Expected<void> StdioTransport::send(const std::string& message) {
    if (!connected_.load()) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "Not connected"});
    }

    std::string line = message + "\n";

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!stdin_fp_) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "Agent stdin not available"});
    }

    size_t written = fwrite(line.c_str(), 1, line.size(), stdin_fp_);
    if (written != line.size() || fflush(stdin_fp_) != 0) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "Failed to write to agent stdin"});
    }

    return {};
}

void StdioTransport::set_receive_callback(ReceiveCallback callback) {
    receive_callback_ = std::move(callback);
}

void StdioTransport::set_error_callback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

void StdioTransport::read_loop() {
    FILE* stdout_fp = subprocess_stdout(process_.get());
    if (!stdout_fp) {
        if (error_callback_) {
            error_callback_("Failed to get agent stdout");
        }
        return;
    }

    read_lines(stdout_fp,
               [this]() { return connected_.load(); },
               [this](const std::string& line) {
                   if (receive_callback_) {
                       receive_callback_(line);
                   }
               });

    // Leaving the loop while still "connected" means the agent died
    if (connected_.exchange(false)) {
        if (error_callback_) {
            error_callback_("Agent exited unexpectedly");
        }
    }
}

void StdioTransport::stderr_loop() {
    FILE* stderr_fp = subprocess_stderr(process_.get());
    if (!stderr_fp) {
        return;
    }

    read_lines(stderr_fp,
               []() { return true; },
               [](const std::string& line) {
                   spdlog::debug("ACP agent stderr: {}", line);
               });
}

} // namespace transport
} // namespace acp
