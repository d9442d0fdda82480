#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "session/protocol_client.hpp"
#include "support/scripted_channel.hpp"

namespace {

using costbridge::core::config::ClientConfig;
using costbridge::core::errors::ErrorCategory;
using costbridge::core::errors::get_error;
using costbridge::core::errors::get_value;
using costbridge::core::errors::is_error;
using costbridge::session::HandshakeState;
using costbridge::session::ProtocolClient;
using costbridge::testing::cost_server;
using costbridge::testing::error_line;
using costbridge::testing::result_line;
using costbridge::testing::ScriptedChannel;
using costbridge::testing::text_content;
using nlohmann::json;

using Lines = std::vector<std::string>;

ScriptedChannel echo_server() {
    return ScriptedChannel(cost_server([](const json& id, const json& params) {
        return Lines{result_line(id, text_content(params["arguments"].dump()))};
    }));
}

TEST(ProtocolClientTest, HandshakeSendsInitializeThenNotification) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    EXPECT_EQ(client.state(), HandshakeState::Uninitialized);

    auto initialized = client.initialize();
    ASSERT_FALSE(is_error(initialized));
    EXPECT_EQ(client.state(), HandshakeState::Ready);

    ASSERT_EQ(channel.sent().size(), 2u);
    const json& request = channel.sent()[0];
    EXPECT_EQ(request["method"], "initialize");
    EXPECT_EQ(request["id"], 1);
    EXPECT_EQ(request["params"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(request["params"]["capabilities"], json({{"tools", json::object()}}));
    EXPECT_EQ(request["params"]["clientInfo"]["name"], "cost-explorer-web-client");

    const json& notification = channel.sent()[1];
    EXPECT_EQ(notification["method"], "notifications/initialized");
    EXPECT_FALSE(notification.contains("id"));
}

TEST(ProtocolClientTest, RejectedInitializeClosesSession) {
    ScriptedChannel channel([](const json& request) {
        return Lines{error_line(request["id"], "unsupported protocol version")};
    });
    ProtocolClient client(channel, ClientConfig{});

    auto initialized = client.initialize();
    ASSERT_TRUE(is_error(initialized));
    EXPECT_EQ(get_error(initialized).category, ErrorCategory::Handshake);
    EXPECT_EQ(client.state(), HandshakeState::Closed);

    auto call = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(call));
    EXPECT_EQ(get_error(call).category, ErrorCategory::Handshake);
    EXPECT_EQ(get_error(call).code, "session_closed");
}

TEST(ProtocolClientTest, HandshakeTimeoutIsHandshakeError) {
    ScriptedChannel channel;  // never answers
    ProtocolClient client(channel, ClientConfig{});

    auto initialized = client.initialize();
    ASSERT_TRUE(is_error(initialized));
    EXPECT_EQ(get_error(initialized).category, ErrorCategory::Handshake);
    EXPECT_EQ(get_error(initialized).code, "read_timeout");
    EXPECT_EQ(client.state(), HandshakeState::Closed);
}

TEST(ProtocolClientTest, CallsBeforeHandshakeAreRefused) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});

    auto tools = client.list_tools();
    ASSERT_TRUE(is_error(tools));
    EXPECT_EQ(get_error(tools).category, ErrorCategory::Handshake);
    EXPECT_EQ(get_error(tools).code, "session_not_ready");
    EXPECT_TRUE(channel.sent().empty());
}

TEST(ProtocolClientTest, SecondInitializeIsRejected) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto again = client.initialize();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "already_initialized");
    EXPECT_EQ(client.state(), HandshakeState::Ready);
}

TEST(ProtocolClientTest, ListsToolsOnceAndCaches) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));
    EXPECT_FALSE(client.discovered_tools().has_value());

    auto tools = client.list_tools();
    ASSERT_FALSE(is_error(tools));
    ASSERT_EQ(get_value(tools).size(), 3u);
    EXPECT_EQ(get_value(tools)[0].name, "get_cost_and_usage");
    EXPECT_EQ(channel.sent().back()["method"], "tools/list");
    EXPECT_EQ(channel.sent().back()["id"], 2);

    const auto sent_before = channel.sent().size();
    auto cached = client.list_tools();
    ASSERT_FALSE(is_error(cached));
    EXPECT_EQ(get_value(cached).size(), 3u);
    EXPECT_EQ(channel.sent().size(), sent_before);
    EXPECT_TRUE(client.discovered_tools().has_value());
}

TEST(ProtocolClientTest, RequestIdsIncreaseAcrossCalls) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));
    ASSERT_FALSE(is_error(client.list_tools()));

    for (int i = 0; i < 3; ++i) {
        ASSERT_FALSE(is_error(client.call_tool("get_cost_and_usage", json{{"n", i}})));
    }
    EXPECT_EQ(client.last_request_id(), 5);
    EXPECT_EQ(channel.sent().back()["id"], 5);
    EXPECT_EQ(channel.sent().back()["params"]["arguments"]["n"], 2);
}

TEST(ProtocolClientTest, ParsesTextContentPayload) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json{{"metric", "AmortizedCost"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json({{"metric", "AmortizedCost"}}));
}

TEST(ProtocolClientTest, NullArgumentsAreSentAsEmptyObject) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    ASSERT_FALSE(is_error(client.call_tool("get_cost_and_usage", json())));
    EXPECT_EQ(channel.sent().back()["params"]["arguments"], json::object());
}

TEST(ProtocolClientTest, NonFiniteLiteralsInPayloadBecomeNull) {
    ScriptedChannel channel(cost_server([](const json& id, const json&) {
        return Lines{result_line(id, text_content(R"({"total": NaN, "label": "NaN"})"))};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result)["total"].is_null());
    EXPECT_EQ(get_value(result)["label"], "NaN");
}

TEST(ProtocolClientTest, BareResultIsReturnedAsIs) {
    ScriptedChannel channel(cost_server([](const json& id, const json&) {
        return Lines{result_line(id, {{"total", 3}})};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json({{"total", 3}}));
}

TEST(ProtocolClientTest, UnparseableTextIsProtocolErrorAndSessionSurvives) {
    int calls = 0;
    ScriptedChannel channel(cost_server([&calls](const json& id, const json&) {
        ++calls;
        if (calls == 1) {
            return Lines{result_line(id, text_content("Error: not json"))};
        }
        return Lines{result_line(id, text_content("{}"))};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto broken = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).category, ErrorCategory::Protocol);
    EXPECT_EQ(get_error(broken).code, "invalid_payload");
    EXPECT_NE(get_error(broken).message.find("Failed to parse MCP response"), std::string::npos);
    EXPECT_EQ(client.state(), HandshakeState::Ready);

    EXPECT_FALSE(is_error(client.call_tool("get_cost_and_usage", json::object())));
}

TEST(ProtocolClientTest, JsonRpcErrorIsToolFailure) {
    ScriptedChannel channel(cost_server([](const json& id, const json&) {
        return Lines{error_line(id, "Cost Explorer is unavailable")};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::ToolFailure);
    EXPECT_EQ(get_error(result).code, "server_error");
    EXPECT_EQ(get_error(result).message, "Cost Explorer is unavailable");
}

TEST(ProtocolClientTest, IsErrorResultIsToolFailure) {
    ScriptedChannel channel(cost_server([](const json& id, const json&) {
        json result = text_content("bad date range");
        result["isError"] = true;
        return Lines{result_line(id, result)};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "tool_error");
    EXPECT_EQ(get_error(result).message, "bad date range");
}

TEST(ProtocolClientTest, MismatchedResponseIdIsProtocolError) {
    ScriptedChannel channel(cost_server([](const json& id, const json&) {
        return Lines{result_line(id.get<int>() + 1, text_content("{}"))};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Protocol);
    EXPECT_EQ(get_error(result).code, "id_mismatch");
}

TEST(ProtocolClientTest, StrayOutputLineDoesNotDesyncLaterCalls) {
    int calls = 0;
    ScriptedChannel channel(cost_server([&calls](const json& id, const json& params) {
        ++calls;
        if (calls == 1) {
            return Lines{"Starting cost explorer...",
                         result_line(id, text_content(params["arguments"].dump()))};
        }
        return Lines{result_line(id, text_content(params["arguments"].dump()))};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto first = client.call_tool("get_cost_and_usage", json{{"call", 1}});
    ASSERT_TRUE(is_error(first));
    EXPECT_EQ(get_error(first).code, "invalid_json");
    EXPECT_EQ(client.state(), HandshakeState::Ready);

    for (int n = 2; n <= 4; ++n) {
        auto result = client.call_tool("get_cost_and_usage", json{{"call", n}});
        ASSERT_FALSE(is_error(result)) << get_error(result).message;
        EXPECT_EQ(get_value(result)["call"], n);
    }
    EXPECT_EQ(client.state(), HandshakeState::Ready);
}

TEST(ProtocolClientTest, LateResponseAfterMismatchIsDiscarded) {
    int calls = 0;
    ScriptedChannel channel(cost_server([&calls](const json& id, const json&) {
        ++calls;
        if (calls == 1) {
            return Lines{result_line(99, text_content("{}"))};
        }
        return Lines{result_line(id, text_content(R"({"ok":true})"))};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto first = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(first));
    EXPECT_EQ(get_error(first).code, "id_mismatch");
    const auto first_id = client.last_request_id();

    // The response owed to the failed call arrives ahead of the next one.
    channel.queue_line(result_line(first_id, text_content(R"({"late":true})")));
    auto second = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_FALSE(is_error(second)) << get_error(second).message;
    EXPECT_EQ(get_value(second)["ok"], true);
}

TEST(ProtocolClientTest, SkipsServerNotificationsWhileWaiting) {
    ScriptedChannel channel(cost_server([](const json& id, const json&) {
        return Lines{R"({"jsonrpc":"2.0","method":"notifications/message","params":{}})", "",
                     result_line(id, text_content(R"({"ok":true})"))};
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["ok"], true);
}

TEST(ProtocolClientTest, EndlessNotificationsAreBounded) {
    ScriptedChannel channel(cost_server([](const json&, const json&) {
        return Lines(100, R"({"jsonrpc":"2.0","method":"notifications/progress"})");
    }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "too_many_unsolicited_messages");
}

TEST(ProtocolClientTest, BrokenPipeClosesSession) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    channel.break_pipe();
    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::BrokenPipe);
    EXPECT_EQ(client.state(), HandshakeState::Closed);

    auto after = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).code, "session_closed");
}

TEST(ProtocolClientTest, ReadTimeoutClosesSession) {
    ScriptedChannel channel(cost_server([](const json&, const json&) { return Lines{}; }));
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    auto result = client.call_tool("get_cost_and_usage", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Protocol);
    EXPECT_EQ(get_error(result).code, "read_timeout");
    EXPECT_EQ(client.state(), HandshakeState::Closed);
}

TEST(ProtocolClientTest, CloseIsFinal) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));

    client.close();
    client.close();
    EXPECT_EQ(client.state(), HandshakeState::Closed);
    auto initialized = client.initialize();
    ASSERT_TRUE(is_error(initialized));
    EXPECT_EQ(get_error(initialized).code, "session_closed");
}

TEST(ProtocolClientTest, EmptyToolNameIsInvalidCall) {
    ScriptedChannel channel = echo_server();
    ProtocolClient client(channel, ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));
    const auto sent_before = channel.sent().size();

    auto result = client.call_tool("", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::InvalidCall);
    EXPECT_EQ(channel.sent().size(), sent_before);
}

}  // namespace
