#pragma once

#include "../types.hpp"
#include <functional>
#include <string>

namespace acp {
namespace transport {

/**
 * @brief Abstract interface for agent transports.
 *
 * A transport moves newline-delimited JSON between the engine and one agent.
 *
 * Threading model:
 * - connect()/disconnect() called from the owning controller
 * - send() may be called from any thread (must be thread-safe)
 * - receive_callback invoked from the transport's read thread, one line at a time
 * - error_callback invoked from the read thread when the agent goes away
 *   without disconnect() having been called
 */
class ITransport {
public:
    using ReceiveCallback = std::function<void(const std::string&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    virtual ~ITransport() = default;

    virtual Expected<void> connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual Expected<void> send(const std::string& message) = 0;

    virtual void set_receive_callback(ReceiveCallback callback) = 0;
    virtual void set_error_callback(ErrorCallback callback) = 0;
};

} // namespace transport
} // namespace acp
