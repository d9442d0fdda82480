#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace costbridge::protocol {

    enum class CommandKind {
        ListTools,
        Call,
        Batch,
        Normalize
    };

    // Validated command-line input for one costbridge invocation
    struct BridgeRequest {
        CommandKind command = CommandKind::ListTools;
        std::string tool_name;
        nlohmann::json parameters = nlohmann::json::object();
        std::optional<std::string> query_text;
        nlohmann::json calls = nlohmann::json::array();
        std::optional<std::filesystem::path> config_file;
        std::optional<std::vector<std::string>> server_command;
        std::optional<uint32_t> timeout_ms; // Overrides both read timeouts
        bool verbose = false;
    };

} // namespace costbridge::protocol
