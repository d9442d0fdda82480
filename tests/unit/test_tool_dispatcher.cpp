#include <deque>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "runtime/tool_dispatcher.hpp"
#include "session/protocol_client.hpp"
#include "session/tool_client.hpp"
#include "support/scripted_channel.hpp"

namespace {

using costbridge::core::errors::BridgeError;
using costbridge::core::errors::ErrorCategory;
using costbridge::core::errors::get_value;
using costbridge::core::errors::is_error;
using costbridge::core::errors::Result;
using costbridge::normalize::CalendarDate;
using costbridge::protocol::BatchEntry;
using costbridge::protocol::DispatchOutcome;
using costbridge::protocol::ResultEnvelope;
using costbridge::protocol::ToolCall;
using costbridge::protocol::ToolDescriptor;
using costbridge::runtime::DispatcherOptions;
using costbridge::runtime::kConnectionLostMessage;
using costbridge::runtime::ToolDispatcher;
using nlohmann::json;

struct RecordedCall {
    std::string name;
    json arguments;
};

// Replays queued outcomes in order; an empty queue echoes the arguments.
class FakeToolClient : public costbridge::session::ToolClient {
public:
    Result<std::vector<ToolDescriptor>> list_tools() override {
        std::vector<ToolDescriptor> tools;
        for (const auto& name : {"get_cost_and_usage", "get_cost_forecast"}) {
            ToolDescriptor tool;
            tool.name = name;
            tools.push_back(tool);
        }
        discovered_ = tools;
        return tools;
    }

    Result<json> call_tool(const std::string& name, const json& arguments) override {
        calls.push_back(RecordedCall{name, arguments});
        if (throw_next) {
            throw_next = false;
            throw std::runtime_error("boom");
        }
        if (outcomes.empty()) {
            return json{{"echo", arguments}};
        }
        Result<json> next = outcomes.front();
        outcomes.pop_front();
        return next;
    }

    std::optional<std::vector<ToolDescriptor>> discovered_tools() const override {
        return discovered_;
    }

    void close() override { closed = true; }

    std::vector<RecordedCall> calls;
    std::deque<Result<json>> outcomes;
    bool throw_next = false;
    bool closed = false;

private:
    std::optional<std::vector<ToolDescriptor>> discovered_;
};

DispatcherOptions fixed_options() {
    DispatcherOptions options;
    options.normalizer.today = CalendarDate{2025, 11, 15};
    return options;
}

ToolCall make_call(const std::string& name, const json& params = json::object()) {
    ToolCall call;
    call.tool_name = name;
    call.parameters = params;
    return call;
}

const std::vector<BatchEntry>& entries_of(const DispatchOutcome& outcome) {
    return std::get<std::vector<BatchEntry>>(outcome);
}

TEST(ToolDispatcherTest, SingleCallIsNormalizedAndWrapped) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    auto envelope = dispatcher.invoke(
        make_call("get_cost_and_usage", {{"group_by", json::array({"SERVICE"})}, {"metric", "BOTH"}}));

    EXPECT_TRUE(envelope.success);
    EXPECT_FALSE(envelope.error.has_value());
    ASSERT_EQ(client.calls.size(), 1u);
    EXPECT_EQ(client.calls[0].arguments["group_by"], "SERVICE");
    EXPECT_EQ(client.calls[0].arguments["metric"], "AmortizedCost");
    EXPECT_EQ(envelope.data["echo"]["metric"], "AmortizedCost");
    EXPECT_EQ(envelope.warnings.size(), 1u);
}

TEST(ToolDispatcherTest, ResultsAreSanitized) {
    FakeToolClient client;
    client.outcomes.push_back(
        json{{"total", std::numeric_limits<double>::quiet_NaN()}, {"count", 2}});
    ToolDispatcher dispatcher(client, fixed_options());

    auto envelope = dispatcher.invoke(make_call("get_cost_and_usage"));
    ASSERT_TRUE(envelope.success);
    EXPECT_TRUE(envelope.data["total"].is_null());
    EXPECT_EQ(envelope.data["count"], 2);
}

TEST(ToolDispatcherTest, MissingToolNameNeverReachesClient) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    auto envelope = dispatcher.invoke(make_call(""));
    EXPECT_FALSE(envelope.success);
    EXPECT_TRUE(envelope.data.is_null());
    ASSERT_TRUE(envelope.error.has_value());
    EXPECT_TRUE(client.calls.empty());
}

TEST(ToolDispatcherTest, NonObjectParametersAreInvalid) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    auto envelope = dispatcher.invoke(make_call("get_cost_and_usage", json::array({1})));
    EXPECT_FALSE(envelope.success);
    EXPECT_TRUE(client.calls.empty());
}

TEST(ToolDispatcherTest, UnknownToolRejectedOnlyAfterDiscovery) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    EXPECT_TRUE(dispatcher.invoke(make_call("describe_budget")).success);

    ASSERT_FALSE(is_error(dispatcher.list_tools()));
    auto envelope = dispatcher.invoke(make_call("describe_budget"));
    EXPECT_FALSE(envelope.success);
    EXPECT_EQ(envelope.error.value(), "Unknown tool: describe_budget");
    EXPECT_EQ(client.calls.size(), 1u);
}

TEST(ToolDispatcherTest, BrokenPipeUsesConnectionLostMessage) {
    FakeToolClient client;
    client.outcomes.push_back(BridgeError{ErrorCategory::BrokenPipe, "Broken pipe", "broken_pipe"});
    ToolDispatcher dispatcher(client, fixed_options());

    auto envelope = dispatcher.invoke(make_call("get_cost_and_usage"));
    EXPECT_FALSE(envelope.success);
    EXPECT_EQ(envelope.error.value(), kConnectionLostMessage);
}

TEST(ToolDispatcherTest, ServerErrorMessageIsSurfaced) {
    FakeToolClient client;
    client.outcomes.push_back(
        BridgeError{ErrorCategory::ToolFailure, "Cost Explorer is unavailable", "server_error"});
    ToolDispatcher dispatcher(client, fixed_options());

    auto envelope = dispatcher.invoke(make_call("get_cost_and_usage", {{"metric", "BOTH"}}));
    EXPECT_FALSE(envelope.success);
    EXPECT_EQ(envelope.error.value(), "Cost Explorer is unavailable");
    EXPECT_EQ(envelope.warnings.size(), 1u);
}

TEST(ToolDispatcherTest, ExceptionsBecomeFailureEnvelopes) {
    FakeToolClient client;
    client.throw_next = true;
    ToolDispatcher dispatcher(client, fixed_options());

    ResultEnvelope envelope;
    EXPECT_NO_THROW(envelope = dispatcher.invoke(make_call("get_cost_and_usage")));
    EXPECT_FALSE(envelope.success);
    EXPECT_NE(envelope.error.value().find("boom"), std::string::npos);
}

TEST(ToolDispatcherTest, EmptyBatchIsInvalid) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    auto outcome = dispatcher.invoke(std::vector<ToolCall>{});
    ASSERT_TRUE(std::holds_alternative<ResultEnvelope>(outcome));
    EXPECT_FALSE(std::get<ResultEnvelope>(outcome).success);
}

TEST(ToolDispatcherTest, BatchIsolatesBrokenPipeOnFirstEntry) {
    FakeToolClient client;
    client.outcomes.push_back(BridgeError{ErrorCategory::BrokenPipe, "Broken pipe", "broken_pipe"});
    client.outcomes.push_back(json{{"total", 7}});
    ToolDispatcher dispatcher(client, fixed_options());

    const std::vector<ToolCall> calls = {make_call("get_cost_and_usage", {{"metric", "AmortizedCost"}}),
                                         make_call("get_cost_and_usage", {{"metric", "BlendedCost"}})};
    auto outcome = dispatcher.invoke(calls);

    const auto& entries = entries_of(outcome);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].index, 0u);
    EXPECT_FALSE(entries[0].result.success);
    EXPECT_EQ(entries[0].result.error.value(), kConnectionLostMessage);
    EXPECT_EQ(entries[1].index, 1u);
    EXPECT_TRUE(entries[1].result.success);
    EXPECT_EQ(entries[1].result.data["total"], 7);
    EXPECT_EQ(entries[1].tool_call.parameters["metric"], "BlendedCost");
    EXPECT_EQ(client.calls.size(), 2u);
}

TEST(ToolDispatcherTest, BatchLengthAndIndexesMatchInput) {
    FakeToolClient client;
    client.outcomes.push_back(json{{"n", 0}});
    client.outcomes.push_back(BridgeError{ErrorCategory::Protocol, "bad", "invalid_payload"});
    ToolDispatcher dispatcher(client, fixed_options());

    std::vector<ToolCall> calls = {make_call("get_cost_and_usage"), make_call("get_cost_and_usage"),
                                   make_call(""), make_call("get_cost_forecast")};
    auto outcome = dispatcher.invoke(calls);

    const auto& entries = entries_of(outcome);
    ASSERT_EQ(entries.size(), calls.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].index, i);
        EXPECT_EQ(entries[i].tool_call.tool_name, calls[i].tool_name);
    }
    EXPECT_TRUE(entries[0].result.success);
    EXPECT_FALSE(entries[1].result.success);
    EXPECT_FALSE(entries[2].result.success);
    EXPECT_TRUE(entries[3].result.success);
}

TEST(ToolDispatcherTest, InvokeJsonSplitsMultiMetricQuery) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    const json payload = {{"tool_name", "get_cost_and_usage"},
                          {"parameters", {{"granularity", "MONTHLY"}}}};
    auto outcome = dispatcher.invoke_json(payload, "show amortized and blended cost");

    const auto& entries = entries_of(outcome);
    ASSERT_EQ(entries.size(), 2u);
    ASSERT_EQ(client.calls.size(), 2u);
    EXPECT_EQ(client.calls[0].arguments["metric"], "AmortizedCost");
    EXPECT_EQ(client.calls[1].arguments["metric"], "BlendedCost");
}

TEST(ToolDispatcherTest, InvokeJsonSingleObjectYieldsEnvelope) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    auto outcome = dispatcher.invoke_json(json{{"tool_name", "get_cost_and_usage"}}, "");
    ASSERT_TRUE(std::holds_alternative<ResultEnvelope>(outcome));
    EXPECT_TRUE(std::get<ResultEnvelope>(outcome).success);
}

TEST(ToolDispatcherTest, InvokeJsonSplitDisabledKeepsOneCall) {
    FakeToolClient client;
    DispatcherOptions options = fixed_options();
    options.split_enabled = false;
    ToolDispatcher dispatcher(client, options);

    auto outcome = dispatcher.invoke_json(json{{"tool_name", "get_cost_and_usage"}},
                                          "amortized and blended");
    EXPECT_TRUE(std::holds_alternative<ResultEnvelope>(outcome));
    EXPECT_EQ(client.calls.size(), 1u);
}

TEST(ToolDispatcherTest, InvokeJsonArrayIsAlwaysBatch) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    const json payload = json::array({json{{"tool_name", "get_cost_forecast"}}, json("garbage")});
    auto outcome = dispatcher.invoke_json(payload);

    const auto& entries = entries_of(outcome);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(entries[0].result.success);
    EXPECT_FALSE(entries[1].result.success);
}

TEST(ToolDispatcherTest, InvokeJsonRejectsScalars) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());

    auto outcome = dispatcher.invoke_json(json(42));
    ASSERT_TRUE(std::holds_alternative<ResultEnvelope>(outcome));
    EXPECT_FALSE(std::get<ResultEnvelope>(outcome).success);
}

TEST(ToolDispatcherTest, CloseClosesClient) {
    FakeToolClient client;
    ToolDispatcher dispatcher(client, fixed_options());
    dispatcher.close();
    EXPECT_TRUE(client.closed);
}

TEST(ToolDispatcherTest, WorksOverProtocolClient) {
    using costbridge::testing::cost_server;
    using costbridge::testing::result_line;
    using costbridge::testing::ScriptedChannel;
    using costbridge::testing::text_content;

    ScriptedChannel channel(cost_server([](const json& id, const json& params) {
        json payload{{"tool", params["name"]}, {"arguments", params["arguments"]}};
        std::string text = payload.dump();
        text.insert(text.size() - 1, ",\"peak\":NaN");
        return std::vector<std::string>{result_line(id, text_content(text))};
    }));
    costbridge::session::ProtocolClient client(channel, costbridge::core::config::ClientConfig{});
    ASSERT_FALSE(is_error(client.initialize()));
    ToolDispatcher dispatcher(client, fixed_options());
    ASSERT_FALSE(is_error(dispatcher.list_tools()));

    auto envelope = dispatcher.invoke(make_call("get_cost_forecast", {{"metric", "unblended"}}));
    ASSERT_TRUE(envelope.success);
    EXPECT_EQ(envelope.data["tool"], "get_cost_forecast");
    EXPECT_EQ(envelope.data["arguments"]["metric"], "UNBLENDED_COST");
    EXPECT_TRUE(envelope.data["peak"].is_null());

    channel.break_pipe();
    auto lost = dispatcher.invoke(make_call("get_cost_forecast"));
    EXPECT_FALSE(lost.success);
    EXPECT_EQ(lost.error.value(), kConnectionLostMessage);
}

}  // namespace
