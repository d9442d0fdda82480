#include "session/tool_session.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace costbridge::session {

ToolSession::ToolSession(const core::config::BridgeConfig& config)
    : supervisor_(config.server), client_(supervisor_, config.client) {}

ToolSession::~ToolSession() {
    close();
}

core::errors::Result<std::unique_ptr<ToolSession>> ToolSession::open(
    const core::config::BridgeConfig& config) {
    std::unique_ptr<ToolSession> session(new ToolSession(config));

    auto started = session->supervisor_.start();
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }

    auto initialized = session->client_.initialize();
    if (core::errors::is_error(initialized)) {
        const auto& err = core::errors::get_error(initialized);
        const std::string& tail = session->supervisor_.stderr_tail();
        if (!tail.empty()) {
            CB_LOG_ERROR("ToolSession: server stderr before failure:\n" + tail);
        }
        return err;
    }
    return std::move(session);
}

void ToolSession::close() {
    client_.close();
    supervisor_.terminate();
}

}  // namespace costbridge::session
