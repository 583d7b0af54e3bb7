#pragma once

/**
 * @file acp.hpp
 * @brief Main convenience header for the ACP engine
 *
 * Include this single header to get access to all public engine APIs.
 *
 * The ACP engine drives an Agent Client Protocol agent (a coding assistant
 * running as a subprocess) over newline-delimited JSON-RPC on stdio. It
 * separates the agent's streamed output into final answer blocks and
 * intermediate draft, thought and plan text, tracks tool calls, and brokers
 * permission requests.
 *
 * Quick Start:
 * @code
 * #include <acp/acp.hpp>
 *
 * int main() {
 *     acp::Config config;
 *     config.agent_command = "copilot --acp";
 *
 *     auto controller = acp::SessionController::create(config);
 *     if (!controller) {
 *         std::cerr << "Error: " << controller.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto result = (*controller)->prompt("Hello!");
 *     if (result) {
 *         std::cout << "Agent: " << result->text() << std::endl;
 *     } else {
 *         std::cerr << "Error: " << result.error().to_string() << std::endl;
 *     }
 *
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - acp::SessionController: Owns the agent subprocess and runs prompt turns
 * - acp::Config: Agent command, timeouts, handshake and classification settings
 * - acp::engine::EventSink: Receives draft, thought, status and permission events
 * - acp::engine::TurnResult: Final answer blocks of a completed turn
 * - acp::Error: Structured error handling
 *
 * Thread Safety:
 * - SessionController methods are thread-safe
 * - EventSink callbacks execute on the transport read thread
 */

// Core types
#include "types.hpp"

// Public API
#include "session_controller.hpp"

// Events (implement EventSink to observe turns)
#include "engine/events.hpp"

// Transport interface (for custom transports and testing)
#include "transport/itransport.hpp"
#include "transport/stdio_transport.hpp"

// Engine and protocol components (optional, for advanced usage)
#include "engine/content_classifier.hpp"
#include "engine/permission_broker.hpp"
#include "engine/tool_call_registry.hpp"
#include "engine/turn_state.hpp"
#include "protocol/frame_classifier.hpp"
#include "protocol/json_rpc.hpp"

/**
 * @namespace acp
 * @brief Main namespace for the ACP engine
 *
 * Internal implementation details are in nested namespaces:
 * - acp::protocol - JSON-RPC framing, correlation and capability negotiation
 * - acp::engine - Turn state, content classification, tool calls, permissions
 * - acp::transport - Subprocess transport
 */
