#pragma once

#include "itransport.hpp"
#include "../types.hpp"
#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Forward declaration for subprocess.h
struct subprocess_s;

namespace acp {
namespace transport {

/**
 * @brief Agent transport over subprocess stdin/stdout.
 *
 * Spawns the agent and exchanges newline-delimited JSON over its stdin and
 * stdout. The agent's stderr is drained line by line into the debug log so
 * a chatty agent can never block on a full pipe.
 *
 * Threading model:
 * - A background read thread continuously reads stdout and invokes receive_callback
 * - A second thread drains stderr
 * - send() is thread-safe (protected by mutex)
 * - connect()/disconnect() are not thread-safe and must not be called from
 *   the callbacks
 */
class StdioTransport : public ITransport {
public:
    struct Config {
        std::string command;                ///< Executable (resolved against PATH)
        std::vector<std::string> args;      ///< Arguments (e.g. {"--acp"})
    };

    /**
     * @brief Split a shell-like command string into a transport Config.
     *
     * Supports single quotes, double quotes and backslash escapes; no
     * variable expansion or globbing.
     */
    static Expected<Config> from_command_line(const std::string& command_line);

    explicit StdioTransport(Config config);
    ~StdioTransport() override;

    // Non-copyable, non-movable
    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;
    StdioTransport(StdioTransport&&) = delete;
    StdioTransport& operator=(StdioTransport&&) = delete;

    Expected<void> connect() override;
    void disconnect() override;
    bool is_connected() const override;
    Expected<void> send(const std::string& message) override;

    void set_receive_callback(ReceiveCallback callback) override;
    void set_error_callback(ErrorCallback callback) override;

    const Config& get_config() const { return config_; }

private:
    void read_loop();
    void stderr_loop();

    Config config_;
    std::unique_ptr<subprocess_s> process_;
    std::atomic<bool> connected_{false};
    std::thread read_thread_;
    std::thread stderr_thread_;
    std::mutex io_mutex_;         ///< Guards stdin_fp_ across send() and disconnect()
    FILE* stdin_fp_ = nullptr;    ///< Cached at connect(), nulled at disconnect()
    ReceiveCallback receive_callback_;
    ErrorCallback error_callback_;
};

} // namespace transport
} // namespace acp
