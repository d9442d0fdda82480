#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace costbridge::core::config {

struct ServerConfig {
    std::vector<std::string> command = {"uvx",
                                        "awslabs.cost-explorer-mcp-server@latest"};
    std::string region_variable = "AWS_REGION";
    std::optional<std::string> forced_region;
    std::string default_region = "us-east-1";
    std::vector<std::string> stripped_variable_prefixes = {"AWS_PROFILE",
                                                           "AWS_DEFAULT_PROFILE"};
    // Empty means "$HOME/.local/bin".
    std::string local_bin_dir;
    std::uint32_t startup_grace_ms = 0;
};

struct ClientConfig {
    std::string client_name = "cost-explorer-web-client";
    std::string client_version = "1.0.0";
    std::string protocol_version = "2024-11-05";
    std::uint32_t handshake_timeout_ms = 30000;
    std::uint32_t request_timeout_ms = 60000;
};

struct BridgeConfig {
    ServerConfig server;
    ClientConfig client;
};

// Overlays the keys present in `document` onto the defaults.
core::errors::Result<BridgeConfig> config_from_json(const nlohmann::json& document);

core::errors::Result<BridgeConfig> load_config_file(const std::filesystem::path& path);

// Splits "uvx some-server@latest --flag" on whitespace.
std::vector<std::string> split_command_line(const std::string& command_line);

}  // namespace costbridge::core::config
