#include "core/config/bridge_config.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace costbridge::core::config {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError invalid_config(const std::string& key, const std::string& expected) {
    return BridgeError{ErrorCategory::Input,
                       "Config key '" + key + "' must be " + expected + ".",
                       "invalid_config"};
}

std::optional<BridgeError> read_string(const json& section, const char* key,
                                       const std::string& path, std::string& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return invalid_config(path + "." + key, "a string");
    }
    out = it->get<std::string>();
    return std::nullopt;
}

std::optional<BridgeError> read_millis(const json& section, const char* key,
                                       const std::string& path, std::uint32_t& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return std::nullopt;
    }
    if (!it->is_number_unsigned()) {
        return invalid_config(path + "." + key, "a non-negative integer");
    }
    const auto value = it->get<std::uint64_t>();
    if (value > 3600000) {
        return invalid_config(path + "." + key, "at most 3600000");
    }
    out = static_cast<std::uint32_t>(value);
    return std::nullopt;
}

std::optional<BridgeError> read_string_list(const json& section, const char* key,
                                            const std::string& path,
                                            std::vector<std::string>& out) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return std::nullopt;
    }
    if (!it->is_array()) {
        return invalid_config(path + "." + key, "an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return invalid_config(path + "." + key, "an array of strings");
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return std::nullopt;
}

std::optional<BridgeError> apply_server_section(const json& section,
                                                ServerConfig& server) {
    if (!section.is_object()) {
        return invalid_config("server", "an object");
    }

    const auto command_it = section.find("command");
    if (command_it != section.end()) {
        if (command_it->is_string()) {
            server.command = split_command_line(command_it->get<std::string>());
        } else if (auto err = read_string_list(section, "command", "server",
                                               server.command)) {
            return err;
        }
        if (server.command.empty()) {
            return invalid_config("server.command", "non-empty");
        }
    }

    if (auto err = read_string(section, "region_variable", "server",
                               server.region_variable)) {
        return err;
    }
    if (auto err = read_string(section, "default_region", "server",
                               server.default_region)) {
        return err;
    }
    const auto region_it = section.find("region");
    if (region_it != section.end() && !region_it->is_null()) {
        if (!region_it->is_string()) {
            return invalid_config("server.region", "a string");
        }
        server.forced_region = region_it->get<std::string>();
    }
    if (auto err = read_string_list(section, "stripped_variable_prefixes", "server",
                                    server.stripped_variable_prefixes)) {
        return err;
    }
    if (auto err = read_string(section, "local_bin_dir", "server",
                               server.local_bin_dir)) {
        return err;
    }
    if (auto err = read_millis(section, "startup_grace_ms", "server",
                               server.startup_grace_ms)) {
        return err;
    }
    return std::nullopt;
}

std::optional<BridgeError> apply_client_section(const json& section,
                                                ClientConfig& client) {
    if (!section.is_object()) {
        return invalid_config("client", "an object");
    }
    if (auto err = read_string(section, "name", "client", client.client_name)) {
        return err;
    }
    if (auto err = read_string(section, "version", "client", client.client_version)) {
        return err;
    }
    if (auto err = read_string(section, "protocol_version", "client",
                               client.protocol_version)) {
        return err;
    }
    if (auto err = read_millis(section, "handshake_timeout_ms", "client",
                               client.handshake_timeout_ms)) {
        return err;
    }
    if (auto err = read_millis(section, "request_timeout_ms", "client",
                               client.request_timeout_ms)) {
        return err;
    }
    return std::nullopt;
}

}  // namespace

std::vector<std::string> split_command_line(const std::string& command_line) {
    std::istringstream in(command_line);
    std::vector<std::string> parts;
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

core::errors::Result<BridgeConfig> config_from_json(const json& document) {
    if (!document.is_object()) {
        return BridgeError{ErrorCategory::Input,
                           "Config document must be a JSON object.",
                           "invalid_config"};
    }

    BridgeConfig config;
    const auto server_it = document.find("server");
    if (server_it != document.end()) {
        if (auto err = apply_server_section(*server_it, config.server)) {
            return *err;
        }
    }
    const auto client_it = document.find("client");
    if (client_it != document.end()) {
        if (auto err = apply_client_section(*client_it, config.client)) {
            return *err;
        }
    }
    return config;
}

core::errors::Result<BridgeConfig> load_config_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return BridgeError{ErrorCategory::Input,
                           "Config file does not exist: " + path.string(),
                           "config_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return BridgeError{ErrorCategory::Input,
                           "Failed to open config file: " + path.string(),
                           "config_open_failed"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return BridgeError{ErrorCategory::Input,
                           "Config file is not valid JSON: " + path.string(),
                           "invalid_config",
                           "Expected an object with optional 'server' and 'client' keys."};
    }
    return config_from_json(document);
}

}  // namespace costbridge::core::config
