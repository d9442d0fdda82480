#include "protocol/tool_contract.hpp"

#include <utility>

namespace costbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

ResultEnvelope success_envelope(json data, std::vector<std::string> warnings) {
    ResultEnvelope envelope;
    envelope.success = true;
    envelope.data = std::move(data);
    envelope.warnings = std::move(warnings);
    return envelope;
}

ResultEnvelope failure_envelope(const std::string& message,
                                std::vector<std::string> warnings) {
    ResultEnvelope envelope;
    envelope.success = false;
    envelope.data = nullptr;
    envelope.error = message;
    envelope.warnings = std::move(warnings);
    return envelope;
}

json to_json(const ToolDescriptor& descriptor) {
    json payload;
    payload["name"] = descriptor.name;
    payload["description"] = descriptor.description;
    payload["inputSchema"] = descriptor.input_schema;
    return payload;
}

json to_json(const ToolCall& call) {
    json payload;
    payload["tool_name"] = call.tool_name;
    payload["parameters"] = call.parameters;
    if (!call.requested_metrics.empty()) {
        payload["requested_metrics"] = call.requested_metrics;
    }
    return payload;
}

json to_json(const ResultEnvelope& envelope) {
    json payload;
    payload["success"] = envelope.success;
    payload["data"] = envelope.data;
    payload["error"] = envelope.error.has_value() ? json(envelope.error.value()) : json();
    payload["warnings"] = envelope.warnings;
    return payload;
}

json to_json(const BatchEntry& entry) {
    json payload;
    payload["tool_call"] = to_json(entry.tool_call);
    payload["result"] = to_json(entry.result);
    payload["index"] = entry.index;
    return payload;
}

json to_json(const DispatchOutcome& outcome) {
    if (const auto* envelope = std::get_if<ResultEnvelope>(&outcome)) {
        return to_json(*envelope);
    }
    json entries = json::array();
    for (const auto& entry : std::get<std::vector<BatchEntry>>(outcome)) {
        entries.push_back(to_json(entry));
    }
    return entries;
}

ToolCall tool_call_from_json(const json& value) {
    ToolCall call;
    if (!value.is_object()) {
        call.parameters = nullptr;
        return call;
    }

    const auto name_it = value.find("tool_name");
    if (name_it != value.end() && name_it->is_string()) {
        call.tool_name = name_it->get<std::string>();
    }

    const auto params_it = value.find("parameters");
    if (params_it != value.end()) {
        call.parameters = *params_it;
    }

    const auto metrics_it = value.find("requested_metrics");
    if (metrics_it != value.end() && metrics_it->is_array()) {
        for (const auto& metric : *metrics_it) {
            if (metric.is_string()) {
                call.requested_metrics.push_back(metric.get<std::string>());
            }
        }
    }
    return call;
}

core::errors::Result<ToolDescriptor> tool_descriptor_from_json(const json& value) {
    if (!value.is_object()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Tool descriptor is not an object.",
                           "invalid_tools_list"};
    }
    const auto name_it = value.find("name");
    if (name_it == value.end() || !name_it->is_string()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Tool descriptor has no name.",
                           "invalid_tools_list"};
    }

    ToolDescriptor descriptor;
    descriptor.name = name_it->get<std::string>();
    const auto description_it = value.find("description");
    if (description_it != value.end() && description_it->is_string()) {
        descriptor.description = description_it->get<std::string>();
    }
    const auto schema_it = value.find("inputSchema");
    if (schema_it != value.end() && schema_it->is_object()) {
        descriptor.input_schema = *schema_it;
    }
    return descriptor;
}

}  // namespace costbridge::protocol
