#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace costbridge::protocol {

    // A tool as advertised by the server's tools/list response
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    // One invocation requested by the upstream interpreter
    struct ToolCall {
        std::string tool_name;
        nlohmann::json parameters = nlohmann::json::object();
        // Structured metric list, when the interpreter can provide one.
        std::vector<std::string> requested_metrics;
    };

    // The uniform shape returned to the caller
    struct ResultEnvelope {
        bool success = false;
        nlohmann::json data;  // null on failure
        std::optional<std::string> error;
        std::vector<std::string> warnings;
    };

    struct BatchEntry {
        ToolCall tool_call;
        ResultEnvelope result;
        std::size_t index = 0;
    };

    // Single call -> envelope, batch -> one entry per input call
    using DispatchOutcome = std::variant<ResultEnvelope, std::vector<BatchEntry>>;

    ResultEnvelope success_envelope(nlohmann::json data,
                                    std::vector<std::string> warnings = {});
    ResultEnvelope failure_envelope(const std::string& message,
                                    std::vector<std::string> warnings = {});

    nlohmann::json to_json(const ToolDescriptor& descriptor);
    nlohmann::json to_json(const ToolCall& call);
    nlohmann::json to_json(const ResultEnvelope& envelope);
    nlohmann::json to_json(const BatchEntry& entry);
    nlohmann::json to_json(const DispatchOutcome& outcome);

    // Tolerant decoding of the interpreter's output. A missing or non-string
    // tool_name decodes to an empty name so the dispatcher can report it per entry.
    ToolCall tool_call_from_json(const nlohmann::json& value);

    core::errors::Result<ToolDescriptor> tool_descriptor_from_json(
        const nlohmann::json& value);

} // namespace costbridge::protocol
