#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace costbridge::session {

// What the dispatcher needs from a connected tool server.
class ToolClient {
public:
    virtual ~ToolClient() = default;

    virtual core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() = 0;
    virtual core::errors::Result<nlohmann::json> call_tool(
        const std::string& name, const nlohmann::json& arguments) = 0;
    // Empty until a tools/list succeeded.
    virtual std::optional<std::vector<protocol::ToolDescriptor>> discovered_tools() const = 0;
    virtual void close() = 0;
};

}  // namespace costbridge::session
