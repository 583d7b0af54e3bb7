#include <gtest/gtest.h>
#include "acp/session_controller.hpp"
#include "fixtures/acp_messages.hpp"
#include "mocks/mock_agent_transport.hpp"
#include "mocks/recording_event_sink.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

using namespace acp;
using acp::engine::PermissionDecision;
using acp::engine::StatusKind;
using acp::protocol::RequestId;
using acp::testing::MockAgentTransport;
using acp::testing::RecordingEventSink;
namespace fixtures = acp::testing::acp_fixtures;
using json = nlohmann::json;

namespace {

template<typename Predicate>
bool wait_for(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

std::vector<std::string> as_lines(const std::vector<json>& updates) {
    std::vector<std::string> lines;
    for (const auto& update : updates) {
        lines.push_back(fixtures::session_update(update));
    }
    return lines;
}

} // namespace

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.agent_command = "mock-agent --acp";
        config_.working_directory = "/work";
        sink_ = std::make_shared<RecordingEventSink>();
    }

    /**
     * @brief Controller whose factory hands out scripted mock agents.
     *
     * Every spawned mock answers the handshake and then runs configure_.
     */
    std::unique_ptr<SessionController> make_controller() {
        auto factory = [this](const Config&) -> Expected<std::shared_ptr<transport::ITransport>> {
            auto mock = std::make_shared<MockAgentTransport>();
            mock->should_fail_connect = fail_connect_;
            mock->on_method("initialize", [](const json& frame) {
                return std::vector<std::string>{fixtures::initialize_response(frame["id"])};
            });
            mock->on_method("session/new", [](const json& frame) {
                return std::vector<std::string>{fixtures::session_new_response(frame["id"])};
            });
            if (configure_) {
                configure_(*mock);
            }
            std::lock_guard<std::mutex> lock(transports_mutex_);
            transports_.push_back(mock);
            return std::shared_ptr<transport::ITransport>(mock);
        };

        auto controller = SessionController::create(config_, sink_, factory);
        EXPECT_TRUE(controller.has_value());
        if (!controller) {
            return nullptr;
        }
        return std::move(*controller);
    }

    /** @brief Answer every session/prompt with these updates, then a response. */
    void reply_to_prompt(std::vector<json> updates, json result = {{"stopReason", "end_turn"}}) {
        configure_ = [updates, result](MockAgentTransport& mock) {
            mock.on_method("session/prompt", [updates, result](const json& frame) {
                auto lines = as_lines(updates);
                lines.push_back(fixtures::result_line(frame["id"], result));
                return lines;
            });
        };
    }

    /** @brief Stream these lines on session/prompt and never answer it. */
    void stall_prompt(std::vector<std::string> lines = {}) {
        configure_ = [lines](MockAgentTransport& mock) {
            mock.on_method("session/prompt", [lines](const json&) { return lines; });
        };
    }

    std::shared_ptr<MockAgentTransport> agent_at(size_t index) {
        std::lock_guard<std::mutex> lock(transports_mutex_);
        return index < transports_.size() ? transports_[index] : nullptr;
    }

    std::shared_ptr<MockAgentTransport> last_transport() {
        std::lock_guard<std::mutex> lock(transports_mutex_);
        return transports_.empty() ? nullptr : transports_.back();
    }

    size_t spawn_count() {
        std::lock_guard<std::mutex> lock(transports_mutex_);
        return transports_.size();
    }

    Config config_;
    std::shared_ptr<RecordingEventSink> sink_;
    std::function<void(MockAgentTransport&)> configure_;
    bool fail_connect_ = false;

    std::mutex transports_mutex_;
    std::vector<std::shared_ptr<MockAgentTransport>> transports_;
};

// ============================================================================
// Creation and Handshake Tests
// ============================================================================

TEST_F(SessionControllerTest, CreateRejectsInvalidConfig) {
    config_.agent_command = "";
    auto controller = SessionController::create(config_, sink_);
    ASSERT_FALSE(controller.has_value());
    EXPECT_EQ(controller.error().code, ErrorCode::InvalidCommand);
}

TEST_F(SessionControllerTest, CreateDoesNotSpawn) {
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);
    EXPECT_EQ(spawn_count(), 0u);
    EXPECT_EQ(controller->state(), SessionState::Stopped);
    EXPECT_FALSE(controller->session_id().has_value());
}

TEST_F(SessionControllerTest, StartPerformsHandshake) {
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto started = controller->start();
    ASSERT_TRUE(started.has_value()) << started.error().to_string();

    EXPECT_EQ(controller->state(), SessionState::Ready);
    EXPECT_EQ(controller->session_id(), std::string(fixtures::kSessionId));
    ASSERT_TRUE(controller->agent_info().has_value());
    EXPECT_EQ(controller->agent_info()->agent_info.name, "mock-agent");
    EXPECT_TRUE(controller->agent_info()->capabilities.load_session);

    auto mock = last_transport();
    auto init = mock->sent_with_method("initialize");
    ASSERT_EQ(init.size(), 1u);
    EXPECT_EQ(init[0]["params"]["protocolVersion"], 1);
    EXPECT_EQ(init[0]["params"]["clientCapabilities"]["fs"]["readTextFile"], false);
    EXPECT_EQ(init[0]["params"]["clientCapabilities"]["terminal"], false);

    auto session_new = mock->sent_with_method("session/new");
    ASSERT_EQ(session_new.size(), 1u);
    EXPECT_EQ(session_new[0]["params"]["cwd"], "/work");
    EXPECT_TRUE(session_new[0]["params"]["mcpServers"].is_array());

    std::vector<SessionState> expected{SessionState::Starting, SessionState::Initializing, SessionState::Ready};
    EXPECT_EQ(sink_->states(), expected);

    // Already ready: no second spawn
    EXPECT_TRUE(controller->start().has_value());
    EXPECT_EQ(spawn_count(), 1u);
}

TEST_F(SessionControllerTest, InitializeErrorFailsHandshake) {
    configure_ = [](MockAgentTransport& mock) {
        mock.on_method("initialize", [](const json& frame) {
            return std::vector<std::string>{fixtures::error_line(frame["id"], -32603, "boom")};
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto started = controller->start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::HandshakeFailed);
    EXPECT_EQ(controller->state(), SessionState::Stopped);
    EXPECT_EQ(last_transport()->disconnect_count.load(), 1);
}

TEST_F(SessionControllerTest, SessionNewWithoutIdFailsHandshake) {
    configure_ = [](MockAgentTransport& mock) {
        mock.on_method("session/new", [](const json& frame) {
            return std::vector<std::string>{fixtures::result_line(frame["id"], json::object())};
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto started = controller->start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::HandshakeFailed);
    EXPECT_FALSE(controller->session_id().has_value());
}

TEST_F(SessionControllerTest, StopShutsTheAgentDown) {
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);
    ASSERT_TRUE(controller->start().has_value());

    controller->stop();
    EXPECT_EQ(controller->state(), SessionState::Stopped);
    EXPECT_FALSE(controller->session_id().has_value());
    EXPECT_EQ(last_transport()->disconnect_count.load(), 1);
}

// ============================================================================
// Prompt Turn Tests
// ============================================================================

TEST_F(SessionControllerTest, PromptStartsTheAgentLazily) {
    reply_to_prompt({fixtures::message_chunk("Hi")});
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("hello");
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->text(), "Hi");
    EXPECT_EQ(result->stop_reason, "end_turn");
    EXPECT_EQ(spawn_count(), 1u);

    auto prompts = last_transport()->sent_with_method("session/prompt");
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0]["params"]["sessionId"], fixtures::kSessionId);
    EXPECT_EQ(prompts[0]["params"]["prompt"][0]["type"], "text");
    EXPECT_EQ(prompts[0]["params"]["prompt"][0]["text"], "hello");
    EXPECT_EQ(result->turn_id, prompts[0]["id"].get<int>());
}

TEST_F(SessionControllerTest, EmitsTurnEvents) {
    reply_to_prompt({fixtures::message_chunk("Hi")});
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    ASSERT_TRUE(controller->prompt("hello").has_value());

    EXPECT_EQ(sink_->count_status(StatusKind::TurnStarted), 1u);
    EXPECT_EQ(sink_->count_status(StatusKind::TurnCompleted), 1u);
    auto results = sink_->results();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].text(), "Hi");
    EXPECT_FALSE(controller->is_busy());
}

TEST_F(SessionControllerTest, RejectsEmptyPromptBlocks) {
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt_blocks(json::array());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(spawn_count(), 0u);
}

TEST_F(SessionControllerTest, SnapshotStreamingYieldsLastSnapshot) {
    std::vector<json> updates;
    for (const char* text : {"H", "He", "Hello"}) {
        auto chunk = fixtures::message_chunk(text);
        chunk["mode"] = "replace";
        updates.push_back(chunk);
    }
    reply_to_prompt(updates);
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("greet");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->final_blocks.size(), 1u);
    EXPECT_EQ(result->text(), "Hello");
}

TEST_F(SessionControllerTest, DeltaStreamingConcatenates) {
    reply_to_prompt({fixtures::message_chunk("Hello "), fixtures::message_chunk("World")});
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("greet");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text(), "Hello World");
}

TEST_F(SessionControllerTest, ThoughtsStayOutOfTheAnswer) {
    json segmented = {
        {"sessionUpdate", "agent_message_chunk"},
        {"content", {{"type", "text"}, {"text", "secret reasoning"}, {"segment", "thought"}}}
    };
    reply_to_prompt({fixtures::thought_chunk("thinking hard"), segmented, fixtures::message_chunk("Answer")});
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("question");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text(), "Answer");
    for (const auto& block : result->final_blocks) {
        EXPECT_EQ(block.channel, engine::Channel::Final);
    }

    auto thoughts = sink_->thoughts();
    ASSERT_FALSE(thoughts.empty());
    EXPECT_EQ(thoughts.back().text, "thinking hardsecret reasoning");
}

TEST_F(SessionControllerTest, FallsBackToResultContent) {
    reply_to_prompt({}, {{"stopReason", "end_turn"}, {"content", json::array({fixtures::text_block("From result")})}});
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("question");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text(), "From result");
}

TEST_F(SessionControllerTest, FallsBackToResultMessageText) {
    reply_to_prompt({}, {{"stopReason", "end_turn"}, {"message", {{"text", "From message"}}}});
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("question");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text(), "From message");
}

TEST_F(SessionControllerTest, UpdatesForOtherSessionsAreDropped) {
    configure_ = [](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [](const json& frame) {
            return std::vector<std::string>{
                fixtures::session_update(fixtures::message_chunk("leak"), "other-session"),
                fixtures::session_update(fixtures::message_chunk("mine")),
                fixtures::prompt_response(frame["id"])
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("question");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text(), "mine");
}

TEST_F(SessionControllerTest, MalformedLinesAreSkipped) {
    configure_ = [](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [](const json& frame) {
            return std::vector<std::string>{
                fixtures::malformed_json(),
                "[1, 2, 3]",
                fixtures::session_update(fixtures::message_chunk("ok")),
                fixtures::prompt_response(frame["id"])
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("question");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text(), "ok");
}

TEST_F(SessionControllerTest, InvalidUtf8LineDoesNotStopLaterFrames) {
    configure_ = [](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [](const json& frame) {
            return std::vector<std::string>{
                fixtures::session_update(fixtures::message_chunk("before ")),
                fixtures::invalid_utf8_update(),
                fixtures::session_update(fixtures::message_chunk("after")),
                fixtures::prompt_response(frame["id"])
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("question");
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->text(), "before after");
    EXPECT_EQ(controller->state(), SessionState::Ready);
}

TEST_F(SessionControllerTest, LongNonAsciiAnswerCompletes) {
    std::vector<json> updates{fixtures::message_chunk("a")};
    std::string expected = "a";
    for (int i = 0; i < 80; ++i) {
        updates.push_back(fixtures::message_chunk("\xC3\xA9"));
        expected += "\xC3\xA9";
    }
    reply_to_prompt(updates);
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    std::string question;
    for (int i = 0; i < 100; ++i) {
        question += "\xC3\xBC";  // U+00FC
    }

    Expected<engine::TurnResult> result = tl::unexpected(Error{ErrorCode::Unknown, "not run"});
    ASSERT_NO_THROW(result = controller->prompt(question));
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->text(), expected);

    // Status details are cut on character boundaries
    for (const auto& status : sink_->statuses()) {
        EXPECT_NO_THROW(json(status.detail).dump());
    }
}

TEST_F(SessionControllerTest, InvalidUtf8PromptIsRejectedCleanly) {
    reply_to_prompt({fixtures::message_chunk("fine")});
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    Expected<engine::TurnResult> bad = tl::unexpected(Error{ErrorCode::Unknown, "not run"});
    ASSERT_NO_THROW(bad = controller->prompt("bad \xFF byte"));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidConfig);
    EXPECT_FALSE(controller->is_busy());
    EXPECT_EQ(spawn_count(), 0u);

    auto good = controller->prompt("good");
    ASSERT_TRUE(good.has_value()) << good.error().to_string();
    EXPECT_EQ(good->text(), "fine");
    EXPECT_EQ(last_transport()->sent_with_method("session/prompt").size(), 1u);
}

TEST_F(SessionControllerTest, NarrationBeforeToolCallIsNotTheAnswer) {
    reply_to_prompt({
        fixtures::message_chunk("Let me check the file. "),
        fixtures::tool_call("tc1", "Read file", "pending"),
        fixtures::tool_call_update("tc1", "completed"),
        fixtures::message_chunk("Done")
    });
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("check it");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->final_blocks.size(), 1u);
    EXPECT_EQ(result->text(), "Done");
}

TEST_F(SessionControllerTest, NarrationIsKeptWhenConfigured) {
    config_.answer_after_tool_calls = false;
    reply_to_prompt({
        fixtures::message_chunk("Let me check the file. "),
        fixtures::tool_call("tc1", "Read file", "pending"),
        fixtures::message_chunk("Done")
    });
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("check it");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text(), "Let me check the file. Done");
}

TEST_F(SessionControllerTest, SequentialTurnsDoNotShareState) {
    std::atomic<int> prompt_count{0};
    configure_ = [&prompt_count](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [&prompt_count](const json& frame) {
            if (prompt_count++ == 0) {
                return std::vector<std::string>{
                    fixtures::session_update(fixtures::tool_call("tc1", "Run tests", "pending")),
                    fixtures::session_update(fixtures::message_chunk("first")),
                    fixtures::prompt_response(frame["id"])
                };
            }
            return std::vector<std::string>{
                fixtures::session_update(fixtures::tool_call_update("tc1", "completed")),
                fixtures::session_update(fixtures::message_chunk("second")),
                fixtures::prompt_response(frame["id"])
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto first = controller->prompt("one");
    auto second = controller->prompt("two");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first->text(), "first");
    EXPECT_EQ(second->text(), "second");
    EXPECT_NE(first->turn_id, second->turn_id);

    auto events = sink_->tool_call_events("tc1");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].turn_id, first->turn_id);
    EXPECT_EQ(events[0].title, "Run tests");
    // The second turn starts a fresh registry: the title is not carried over
    EXPECT_EQ(events[1].turn_id, second->turn_id);
    EXPECT_EQ(events[1].title, "Tool call");
}

// ============================================================================
// Agent Request Tests
// ============================================================================

TEST_F(SessionControllerTest, RejectsFileSystemTerminalAndUnknownRequests) {
    configure_ = [](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [](const json& frame) {
            return std::vector<std::string>{
                fixtures::agent_request(50, "fs/read_text_file"),
                fixtures::agent_request(51, "terminal/create"),
                fixtures::agent_request("x-52", "custom/unknown"),
                fixtures::prompt_response(frame["id"])
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);
    ASSERT_TRUE(controller->prompt("read a file").has_value());

    auto mock = last_transport();
    auto fs = mock->responses_for(50);
    ASSERT_EQ(fs.size(), 1u);
    EXPECT_EQ(fs[0]["error"]["code"], -32601);
    EXPECT_EQ(fs[0]["error"]["message"], "Method not supported: fs/read_text_file");
    EXPECT_FALSE(fs[0].contains("result"));

    auto terminal = mock->responses_for(51);
    ASSERT_EQ(terminal.size(), 1u);
    EXPECT_EQ(terminal[0]["error"]["code"], -32601);

    auto unknown = mock->responses_for("x-52");
    ASSERT_EQ(unknown.size(), 1u);
    EXPECT_EQ(unknown[0]["error"]["code"], -32601);
    EXPECT_EQ(unknown[0]["error"]["message"], "Method not found: custom/unknown");
}

TEST_F(SessionControllerTest, PermissionApprovalCompletesToolCall) {
    auto prompt_id = std::make_shared<std::atomic<int>>(0);
    configure_ = [prompt_id](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [prompt_id](const json& frame) {
            *prompt_id = frame["id"].get<int>();
            return std::vector<std::string>{
                fixtures::session_update(fixtures::tool_call("tc1", "Run tests", "pending")),
                fixtures::permission_request(77)
            };
        });
        mock.on_response([prompt_id](const json& frame) {
            if (frame["id"] != 77 || !frame.contains("result")) {
                return std::vector<std::string>{};
            }
            return std::vector<std::string>{
                fixtures::session_update(fixtures::tool_call_update("tc1", "in_progress")),
                fixtures::session_update(fixtures::tool_call_update("tc1", "completed")),
                fixtures::session_update(fixtures::message_chunk("Done")),
                fixtures::prompt_response(prompt_id->load())
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto future = std::async(std::launch::async, [&controller]() { return controller->prompt("run the tests"); });

    ASSERT_TRUE(wait_for([this]() { return !sink_->requests().empty(); }));
    auto request = sink_->requests()[0];
    EXPECT_EQ(request.request_id, RequestId{77});
    EXPECT_EQ(request.title, "Run tests");
    EXPECT_EQ(request.tool_call_id, "tc1");
    EXPECT_EQ(request.turn_id, prompt_id->load());
    EXPECT_EQ(controller->pending_permissions(), 1u);

    EXPECT_TRUE(controller->respond_permission(RequestId{77}, PermissionDecision::approve()));

    auto result = future.get();
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    ASSERT_EQ(result->final_blocks.size(), 1u);
    EXPECT_EQ(result->final_blocks[0].text(), "Done");

    auto answers = last_transport()->responses_for(77);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0]["result"]["outcome"]["outcome"], "selected");
    EXPECT_EQ(answers[0]["result"]["outcome"]["optionId"], "opt-allow");

    auto events = sink_->tool_call_events("tc1");
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].detail, "pending");
    EXPECT_EQ(events[1].detail, "in_progress");
    EXPECT_EQ(events[2].detail, "completed");

    // Answered exactly once
    EXPECT_FALSE(controller->respond_permission(RequestId{77}, PermissionDecision::deny()));
    EXPECT_EQ(last_transport()->responses_for(77).size(), 1u);
}

TEST_F(SessionControllerTest, AutoApproveAnswersImmediately) {
    config_.auto_approve = [](const std::string& title, const json&) { return title == "Run tests"; };
    configure_ = [](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [](const json& frame) {
            return std::vector<std::string>{
                fixtures::permission_request(77),
                fixtures::session_update(fixtures::message_chunk("ran")),
                fixtures::prompt_response(frame["id"])
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    ASSERT_TRUE(controller->prompt("run").has_value());
    EXPECT_TRUE(sink_->requests().empty());

    auto answers = last_transport()->responses_for(77);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0]["result"]["outcome"]["optionId"], "opt-allow");
}

// ============================================================================
// Busy, Cancel and Timeout Tests
// ============================================================================

TEST_F(SessionControllerTest, SecondConcurrentPromptIsBusy) {
    stall_prompt();
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto future = std::async(std::launch::async, [&controller]() { return controller->prompt("slow"); });
    ASSERT_TRUE(wait_for([&controller]() { return controller->is_busy(); }));

    auto second = controller->prompt("impatient");
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::AgentBusy);

    EXPECT_TRUE(controller->cancel());
    auto first = future.get();
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::RequestCancelled);
}

TEST_F(SessionControllerTest, CancelAbortsTurnAndItsPermissions) {
    stall_prompt({
        fixtures::session_update(fixtures::message_chunk("partial")),
        fixtures::permission_request(77)
    });
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto future = std::async(std::launch::async, [&controller]() { return controller->prompt("work"); });
    ASSERT_TRUE(wait_for([this]() { return !sink_->requests().empty(); }));

    EXPECT_TRUE(controller->cancel());
    EXPECT_FALSE(controller->cancel());

    auto result = future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);

    auto mock = last_transport();
    auto answers = mock->responses_for(77);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0]["result"]["outcome"]["outcome"], "cancelled");

    auto cancels = mock->sent_with_method("session/cancel");
    ASSERT_EQ(cancels.size(), 1u);
    EXPECT_EQ(cancels[0]["params"]["sessionId"], fixtures::kSessionId);
    EXPECT_FALSE(cancels[0].contains("id"));

    EXPECT_EQ(controller->pending_permissions(), 0u);
    EXPECT_EQ(sink_->count_status(StatusKind::TurnCancelled), 1u);
    EXPECT_TRUE(sink_->results().empty());
    EXPECT_FALSE(controller->is_busy());
}

TEST_F(SessionControllerTest, CancelWithoutTurnIsNoOp) {
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);
    ASSERT_TRUE(controller->start().has_value());

    EXPECT_FALSE(controller->cancel());
    EXPECT_TRUE(last_transport()->sent_with_method("session/cancel").empty());
}

TEST_F(SessionControllerTest, PromptTimeoutCancelsTurn) {
    stall_prompt();
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    PromptOptions options;
    options.timeout = std::chrono::milliseconds(150);
    auto result = controller->prompt("slow", options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestTimeout);
    EXPECT_EQ(last_transport()->sent_with_method("session/cancel").size(), 1u);
    EXPECT_FALSE(controller->is_busy());

    // The session stays usable
    EXPECT_EQ(controller->state(), SessionState::Ready);
}

TEST_F(SessionControllerTest, HugePromptTimeoutDoesNotExpire) {
    stall_prompt();
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    PromptOptions options;
    options.timeout = std::chrono::milliseconds::max();
    auto future = std::async(std::launch::async, [&controller, options]() {
        return controller->prompt("slow", options);
    });

    ASSERT_TRUE(wait_for([this]() {
        auto mock = last_transport();
        return mock && !mock->sent_with_method("session/prompt").empty();
    }));
    EXPECT_EQ(future.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

    EXPECT_TRUE(controller->cancel());
    auto result = future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
}

TEST_F(SessionControllerTest, AgentErrorFailsTurn) {
    configure_ = [](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [](const json& frame) {
            return std::vector<std::string>{fixtures::error_line(frame["id"], -32602, "Invalid params")};
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto result = controller->prompt("bad");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AgentError);
    EXPECT_NE(result.error().message.find("-32602"), std::string::npos);
    EXPECT_EQ(sink_->count_status(StatusKind::TurnFailed), 1u);
    EXPECT_EQ(spawn_count(), 1u);
}

TEST_F(SessionControllerTest, ConcurrentPromptsErrorRestartsAgent) {
    auto prompt_count = std::make_shared<std::atomic<int>>(0);
    configure_ = [prompt_count](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [prompt_count](const json& frame) {
            if ((*prompt_count)++ == 0) {
                return std::vector<std::string>{
                    fixtures::error_line(frame["id"], -32000, "Concurrent prompts are not supported")};
            }
            return std::vector<std::string>{
                fixtures::session_update(fixtures::message_chunk("recovered")),
                fixtures::prompt_response(frame["id"])
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto failed = controller->prompt("first");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::AgentError);

    EXPECT_EQ(spawn_count(), 2u);
    EXPECT_EQ(agent_at(0)->disconnect_count.load(), 1);
    EXPECT_EQ(controller->state(), SessionState::Ready);

    auto result = controller->prompt("second");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text(), "recovered");
    EXPECT_EQ(spawn_count(), 2u);
}

// ============================================================================
// Disconnect and Restart Tests
// ============================================================================

TEST_F(SessionControllerTest, DisconnectFailsPendingPromptAndRespawnsOnNextCall) {
    std::atomic<bool> stall_first{true};
    configure_ = [&stall_first](MockAgentTransport& mock) {
        mock.on_method("session/prompt", [&stall_first](const json& frame) {
            if (stall_first.exchange(false)) {
                return std::vector<std::string>{fixtures::permission_request(77)};
            }
            return std::vector<std::string>{
                fixtures::session_update(fixtures::message_chunk("back")),
                fixtures::prompt_response(frame["id"])
            };
        });
    };
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto future = std::async(std::launch::async, [&controller]() { return controller->prompt("work"); });
    ASSERT_TRUE(wait_for([this]() { return !sink_->requests().empty(); }));

    auto first_agent = last_transport();
    first_agent->inject_error("Agent exited unexpectedly");

    auto result = future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AgentDisconnected);
    EXPECT_EQ(controller->state(), SessionState::Restarting);
    EXPECT_EQ(controller->pending_permissions(), 0u);

    auto retried = controller->prompt("again");
    ASSERT_TRUE(retried.has_value()) << retried.error().to_string();
    EXPECT_EQ(retried->text(), "back");
    EXPECT_EQ(spawn_count(), 2u);
    EXPECT_EQ(first_agent->disconnect_count.load(), 1);
    EXPECT_EQ(controller->state(), SessionState::Ready);
}

TEST_F(SessionControllerTest, GracePeriodElapsesIntoStopped) {
    config_.disconnect_grace = std::chrono::seconds(0);
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);
    ASSERT_TRUE(controller->start().has_value());

    auto agent = last_transport();
    agent->inject_error("Agent exited unexpectedly");

    ASSERT_TRUE(wait_for([&controller]() { return controller->state() == SessionState::Stopped; }));
    EXPECT_FALSE(controller->session_id().has_value());
    EXPECT_EQ(agent->disconnect_count.load(), 1);
}

TEST_F(SessionControllerTest, RestartAttemptsAreCapped) {
    config_.max_restart_attempts = 2;
    fail_connect_ = true;
    auto controller = make_controller();
    ASSERT_NE(controller, nullptr);

    auto first = controller->prompt("one");
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::AgentSpawnFailed);

    auto second = controller->prompt("two");
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::AgentSpawnFailed);

    auto third = controller->prompt("three");
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().code, ErrorCode::AgentRestartFailed);
    EXPECT_EQ(spawn_count(), 2u);

    // An explicit start() tries again
    fail_connect_ = false;
    ASSERT_TRUE(controller->start().has_value());
    EXPECT_EQ(spawn_count(), 3u);
    EXPECT_EQ(controller->state(), SessionState::Ready);
}
