#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>
#include "core/config/bridge_config.hpp"

namespace costbridge::app::cli {

    using namespace costbridge::core::errors;
    using costbridge::protocol::BridgeRequest;
    using costbridge::protocol::CommandKind;
    using nlohmann::json;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> tool;
        std::optional<std::string> params;
        std::optional<std::string> query;
        std::optional<std::string> calls;
        std::optional<std::string> config;
        std::optional<std::string> server;
        std::optional<std::string> timeout_ms;
        bool verbose = false;
    };

    namespace {

        const char* kUsage =
            "Usage: costbridge <list-tools|call|batch|normalize> [--tool NAME] "
            "[--params JSON] [--query TEXT] [--calls JSON] [--config FILE] "
            "[--server \"CMD ARGS\"] [--timeout-ms N] [--verbose]";

        std::optional<CommandKind> command_from_string(const std::string& command) {
            if (command == "list-tools") return CommandKind::ListTools;
            if (command == "call") return CommandKind::Call;
            if (command == "batch") return CommandKind::Batch;
            if (command == "normalize") return CommandKind::Normalize;
            return std::nullopt;
        }

        BridgeError not_supported(const std::string& flag, const std::string& command) {
            return BridgeError{ErrorCategory::Input, flag + " is not supported by '" + command + "'", "flag_not_supported", kUsage};
        }

    } // namespace

    Result<BridgeRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        const auto kind = command_from_string(command);
        if (!kind.has_value()) {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* target = nullptr;
            if (args[i] == "--tool") target = &raw.tool;
            else if (args[i] == "--params") target = &raw.params;
            else if (args[i] == "--query") target = &raw.query;
            else if (args[i] == "--calls") target = &raw.calls;
            else if (args[i] == "--config") target = &raw.config;
            else if (args[i] == "--server") target = &raw.server;
            else if (args[i] == "--timeout-ms") target = &raw.timeout_ms;
            else if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }

            if (i + 1 >= args.size()) {
                return BridgeError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *target = args[++i];
        }

        // 3. Validator Phase: Enforce logic and bounds
        BridgeRequest req;
        req.command = kind.value();
        req.verbose = raw.verbose;

        const bool takes_tool = req.command == CommandKind::Call || req.command == CommandKind::Normalize;
        if (raw.tool && !takes_tool) return not_supported("--tool", command);
        if (raw.params && !takes_tool) return not_supported("--params", command);
        if (raw.query && req.command != CommandKind::Call) return not_supported("--query", command);
        if (raw.calls && req.command != CommandKind::Batch) return not_supported("--calls", command);

        if (takes_tool) {
            if (!raw.tool.has_value() || raw.tool->empty()) {
                return BridgeError{ErrorCategory::Input, "Must provide --tool for '" + command + "'", "missing_required_flag"};
            }
            req.tool_name = raw.tool.value();
        }

        if (raw.params) {
            json params = json::parse(raw.params.value(), nullptr, false);
            if (params.is_discarded()) {
                return BridgeError{ErrorCategory::Input, "--params is not valid JSON", "invalid_json"};
            }
            if (!params.is_object()) {
                return BridgeError{ErrorCategory::Input, "--params must be a JSON object", "invalid_parameters"};
            }
            req.parameters = std::move(params);
        }

        if (raw.query) req.query_text = raw.query.value();

        if (req.command == CommandKind::Batch) {
            if (!raw.calls.has_value()) {
                return BridgeError{ErrorCategory::Input, "Must provide --calls for 'batch'", "missing_required_flag"};
            }
            json calls = json::parse(raw.calls.value(), nullptr, false);
            if (calls.is_discarded()) {
                return BridgeError{ErrorCategory::Input, "--calls is not valid JSON", "invalid_json"};
            }
            if (!calls.is_array()) {
                return BridgeError{ErrorCategory::Input, "--calls must be a JSON array of tool calls", "invalid_calls",
                                   "Example: [{\"tool_name\":\"get_cost_and_usage\",\"parameters\":{}}]"};
            }
            req.calls = std::move(calls);
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > 3600000) {
                return BridgeError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 3600000."};
            }
            req.timeout_ms = timeout;
        }

        if (raw.server) {
            auto server_command = costbridge::core::config::split_command_line(raw.server.value());
            if (server_command.empty()) {
                return BridgeError{ErrorCategory::Input, "--server must name an executable", "invalid_value"};
            }
            req.server_command = std::move(server_command);
        }

        // Path validation
        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return BridgeError{ErrorCategory::Input, "Config file does not exist or is not a regular file", "invalid_path"};
            }
            req.config_file = std::move(p);
        }

        return req;
    }

} // namespace costbridge::app::cli
