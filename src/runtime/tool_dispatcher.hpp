#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "normalize/metric_splitter.hpp"
#include "normalize/parameter_normalizer.hpp"
#include "protocol/tool_contract.hpp"
#include "session/tool_client.hpp"

namespace costbridge::runtime {

inline constexpr const char* kConnectionLostMessage =
    "MCP server connection lost. Please try again.";

struct DispatcherOptions {
    normalize::NormalizerOptions normalizer;
    bool split_enabled = true;
    normalize::SplitPolicy split_policy;
    // Only enforced once the client has discovered a tool list.
    bool reject_unknown_tools = true;
};

// Entry point for the external collaborator. Calls run strictly one after
// another on the client's single channel. No error escapes as an exception:
// every failure becomes an envelope with success=false.
class ToolDispatcher {
public:
    explicit ToolDispatcher(session::ToolClient& client,
                            DispatcherOptions options = {});

    protocol::ResultEnvelope invoke(const protocol::ToolCall& call);

    // One entry per call, in order; a failed entry never stops the batch.
    // An empty list yields a failure envelope.
    protocol::DispatchOutcome invoke(const std::vector<protocol::ToolCall>& calls);

    // Decodes the collaborator's raw JSON (one call object or an array of
    // them). `query_text` feeds the multi-metric split of a single call.
    protocol::DispatchOutcome invoke_json(const nlohmann::json& payload,
                                          const std::string& query_text = "");

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools();

    void close();

private:
    protocol::ResultEnvelope dispatch_one(const protocol::ToolCall& call);
    protocol::ResultEnvelope guarded_dispatch(const protocol::ToolCall& call);
    core::errors::Status validate(const protocol::ToolCall& call) const;

    session::ToolClient& client_;
    DispatcherOptions options_;
    normalize::ParameterNormalizer normalizer_;
};

}  // namespace costbridge::runtime
