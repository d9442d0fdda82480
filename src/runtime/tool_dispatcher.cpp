#include "runtime/tool_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "sanitize/response_sanitizer.hpp"

namespace costbridge::runtime {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::BatchEntry;
using protocol::DispatchOutcome;
using protocol::ResultEnvelope;
using protocol::ToolCall;

namespace {

ResultEnvelope envelope_for(const BridgeError& error, std::vector<std::string> warnings) {
    CB_LOG_ERROR("ToolDispatcher: " + core::errors::to_string(error.category) + " [" +
                 error.code + "]: " + error.message);
    if (error.category == ErrorCategory::BrokenPipe) {
        return protocol::failure_envelope(kConnectionLostMessage, std::move(warnings));
    }
    return protocol::failure_envelope(error.message, std::move(warnings));
}

}  // namespace

ToolDispatcher::ToolDispatcher(session::ToolClient& client, DispatcherOptions options)
    : client_(client),
      options_(std::move(options)),
      normalizer_(options_.normalizer) {}

ResultEnvelope ToolDispatcher::invoke(const ToolCall& call) {
    return guarded_dispatch(call);
}

DispatchOutcome ToolDispatcher::invoke(const std::vector<ToolCall>& calls) {
    if (calls.empty()) {
        return envelope_for(BridgeError{ErrorCategory::InvalidCall,
                                        "At least one tool call is required.",
                                        "empty_call_list"},
                            {});
    }

    std::vector<BatchEntry> entries;
    entries.reserve(calls.size());
    for (std::size_t index = 0; index < calls.size(); ++index) {
        CB_LOG_INFO("ToolDispatcher: batch entry " + std::to_string(index + 1) + "/" +
                    std::to_string(calls.size()));
        BatchEntry entry;
        entry.tool_call = calls[index];
        entry.result = guarded_dispatch(calls[index]);
        entry.index = index;
        entries.push_back(std::move(entry));
    }
    return entries;
}

DispatchOutcome ToolDispatcher::invoke_json(const json& payload,
                                            const std::string& query_text) {
    if (payload.is_array()) {
        std::vector<ToolCall> calls;
        calls.reserve(payload.size());
        for (const auto& item : payload) {
            calls.push_back(protocol::tool_call_from_json(item));
        }
        return invoke(calls);
    }
    if (!payload.is_object()) {
        return envelope_for(BridgeError{ErrorCategory::InvalidCall,
                                        "Tool call payload must be an object or an array.",
                                        "invalid_payload"},
                            {});
    }

    const ToolCall call = protocol::tool_call_from_json(payload);
    if (!options_.split_enabled) {
        return invoke(call);
    }
    auto calls = normalize::expand_metric_calls(call, query_text, options_.split_policy);
    if (calls.size() == 1) {
        return invoke(calls.front());
    }
    return invoke(calls);
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> ToolDispatcher::list_tools() {
    return client_.list_tools();
}

void ToolDispatcher::close() {
    client_.close();
}

ResultEnvelope ToolDispatcher::guarded_dispatch(const ToolCall& call) {
    try {
        return dispatch_one(call);
    } catch (const std::exception& ex) {
        return envelope_for(BridgeError{ErrorCategory::Internal,
                                        std::string("Unexpected error: ") + ex.what(),
                                        "internal_error"},
                            {});
    }
}

ResultEnvelope ToolDispatcher::dispatch_one(const ToolCall& call) {
    auto valid = validate(call);
    if (core::errors::is_error(valid)) {
        return envelope_for(core::errors::get_error(valid), {});
    }

    auto normalized = normalizer_.normalize(call.tool_name, call.parameters);
    CB_LOG_INFO("ToolDispatcher: calling " + call.tool_name);

    auto result = client_.call_tool(call.tool_name, normalized.parameters);
    if (core::errors::is_error(result)) {
        return envelope_for(core::errors::get_error(result),
                            std::move(normalized.warnings));
    }
    return protocol::success_envelope(sanitize::sanitize(core::errors::get_value(result)),
                                      std::move(normalized.warnings));
}

core::errors::Status ToolDispatcher::validate(const ToolCall& call) const {
    if (call.tool_name.empty()) {
        return BridgeError{ErrorCategory::InvalidCall, "Tool call is missing tool_name.",
                           "missing_tool_name"};
    }
    if (!call.parameters.is_object() && !call.parameters.is_null()) {
        return BridgeError{ErrorCategory::InvalidCall,
                           "Parameters for " + call.tool_name + " must be an object.",
                           "invalid_parameters"};
    }

    if (options_.reject_unknown_tools) {
        const auto tools = client_.discovered_tools();
        if (tools.has_value()) {
            const bool known = std::any_of(
                tools->begin(), tools->end(),
                [&call](const protocol::ToolDescriptor& tool) {
                    return tool.name == call.tool_name;
                });
            if (!known) {
                return BridgeError{ErrorCategory::InvalidCall,
                                   "Unknown tool: " + call.tool_name, "unknown_tool"};
            }
        }
    }
    return core::errors::ok();
}

}  // namespace costbridge::runtime
