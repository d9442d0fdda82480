#pragma once

#include <memory>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "process/process_supervisor.hpp"
#include "session/protocol_client.hpp"

namespace costbridge::session {

// One supervised tool server plus the protocol client speaking to it.
// A session is not restartable; build a new one after a fatal error.
class ToolSession {
public:
    // Spawns the server and completes the initialize handshake.
    static core::errors::Result<std::unique_ptr<ToolSession>> open(
        const core::config::BridgeConfig& config);

    ~ToolSession();

    ToolSession(const ToolSession&) = delete;
    ToolSession& operator=(const ToolSession&) = delete;

    ProtocolClient& client() { return client_; }
    process::ProcessSupervisor& supervisor() { return supervisor_; }

    void close();

private:
    explicit ToolSession(const core::config::BridgeConfig& config);

    process::ProcessSupervisor supervisor_;
    ProtocolClient client_;
};

}  // namespace costbridge::session
