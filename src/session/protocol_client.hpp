#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "process/line_channel.hpp"
#include "protocol/jsonrpc.hpp"
#include "protocol/tool_contract.hpp"
#include "session/tool_client.hpp"

namespace costbridge::session {

// Only moves forward: Uninitialized -> Initializing -> Ready -> Closed.
enum class HandshakeState {
    Uninitialized,
    Initializing,
    Ready,
    Closed
};

std::string to_string(HandshakeState state);

// Speaks the line-delimited JSON-RPC tool protocol over a LineChannel.
// Exactly one request is outstanding at a time; concurrent callers are
// serialized on an internal mutex.
class ProtocolClient : public ToolClient {
public:
    ProtocolClient(process::LineChannel& channel, core::config::ClientConfig config);

    // initialize request + initialized notification. Returns the server's
    // initialize result.
    core::errors::Result<nlohmann::json> initialize();

    // Discovers the tool set once; later calls return the cached list.
    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() override;

    // Returns the decoded payload: the parsed JSON of result.content[0].text,
    // or the bare result object.
    core::errors::Result<nlohmann::json> call_tool(const std::string& name,
                                                   const nlohmann::json& arguments) override;

    void close() override;

    HandshakeState state() const;
    std::int64_t last_request_id() const;
    std::optional<std::vector<protocol::ToolDescriptor>> discovered_tools() const override;

private:
    core::errors::Result<protocol::jsonrpc::Response> round_trip(
        const std::string& method, const std::optional<nlohmann::json>& params,
        std::uint32_t timeout_ms);
    core::errors::Status send(const nlohmann::json& message);
    core::errors::Result<protocol::jsonrpc::Response> receive(std::int64_t id,
                                                              std::uint32_t timeout_ms);
    core::errors::Status require_ready() const;
    void transition(HandshakeState next);
    void close_if_fatal(const core::errors::BridgeError& error);

    process::LineChannel& channel_;
    core::config::ClientConfig config_;

    mutable std::mutex mutex_;
    HandshakeState state_ = HandshakeState::Uninitialized;
    std::int64_t next_id_ = 1;
    std::int64_t last_request_id_ = 0;
    // Requests whose response line was never consumed; skipped when it shows up late.
    std::vector<std::int64_t> owed_ids_;
    std::optional<std::vector<protocol::ToolDescriptor>> tools_;
};

}  // namespace costbridge::session
