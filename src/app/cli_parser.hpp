#pragma once
#include "protocol/bridge_request.hpp"
#include "core/errors/bridge_errors.hpp"

namespace costbridge::app::cli {
    costbridge::core::errors::Result<costbridge::protocol::BridgeRequest> parse_and_validate(int argc, char* argv[]);
}
