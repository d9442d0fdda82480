#include <iostream>
#include <string>
#include <variant>
#include "app/cli_parser.hpp"
#include "core/config/bridge_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "normalize/parameter_normalizer.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/tool_dispatcher.hpp"
#include "session/tool_session.hpp"

namespace {

void print_json(const nlohmann::json& value) {
    std::cout << value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

bool outcome_failed(const costbridge::protocol::DispatchOutcome& outcome) {
    if (const auto* envelope =
            std::get_if<costbridge::protocol::ResultEnvelope>(&outcome)) {
        return !envelope->success;
    }
    for (const auto& entry :
         std::get<std::vector<costbridge::protocol::BatchEntry>>(outcome)) {
        if (!entry.result.success) {
            return true;
        }
    }
    return false;
}

void log_error(const std::string& what, const costbridge::core::errors::BridgeError& err) {
    CB_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        CB_LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = costbridge::core::errors;
    using costbridge::protocol::CommandKind;

    // 1. Tag every log line of this process with one session id
    costbridge::core::logging::Logger::get().set_session_id(
        costbridge::core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = costbridge::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        log_error("Input error", errors::get_error(parsed));
        return 2;
    }
    const auto& req = errors::get_value(parsed);
    if (req.verbose) {
        costbridge::core::logging::Logger::get().set_min_level(
            costbridge::core::logging::LogLevel::DEBUG);
    }

    // 3. Resolve configuration: defaults, then the config file, then flags
    costbridge::core::config::BridgeConfig config;
    if (req.config_file.has_value()) {
        auto loaded = costbridge::core::config::load_config_file(req.config_file.value());
        if (errors::is_error(loaded)) {
            log_error("Config error", errors::get_error(loaded));
            return 2;
        }
        config = errors::get_value(loaded);
    }
    if (req.server_command.has_value()) {
        config.server.command = req.server_command.value();
    }
    if (req.timeout_ms.has_value()) {
        config.client.handshake_timeout_ms = req.timeout_ms.value();
        config.client.request_timeout_ms = req.timeout_ms.value();
    }

    // 4. Offline normalization needs no server
    if (req.command == CommandKind::Normalize) {
        costbridge::normalize::ParameterNormalizer normalizer;
        auto normalized = normalizer.normalize(req.tool_name, req.parameters);
        nlohmann::json output;
        output["tool_name"] = req.tool_name;
        output["parameters"] = normalized.parameters;
        output["warnings"] = normalized.warnings;
        print_json(output);
        return 0;
    }

    // 5. Spawn the tool server and complete the handshake
    auto opened = costbridge::session::ToolSession::open(config);
    if (errors::is_error(opened)) {
        const auto& err = errors::get_error(opened);
        log_error("Failed to open tool server session", err);
        print_json(costbridge::protocol::to_json(
            costbridge::protocol::failure_envelope(err.message)));
        return err.category == errors::ErrorCategory::ProcessStart ? 3 : 4;
    }
    auto& session = *errors::get_value(opened);

    costbridge::runtime::DispatcherOptions options;
    options.split_enabled = req.query_text.has_value();
    costbridge::runtime::ToolDispatcher dispatcher(session.client(), options);

    int exit_code = 0;
    if (req.command == CommandKind::ListTools) {
        auto tools = dispatcher.list_tools();
        if (errors::is_error(tools)) {
            const auto& err = errors::get_error(tools);
            log_error("tools/list failed", err);
            print_json(costbridge::protocol::to_json(
                costbridge::protocol::failure_envelope(err.message)));
            exit_code = 1;
        } else {
            nlohmann::json listed = nlohmann::json::array();
            for (const auto& tool : errors::get_value(tools)) {
                listed.push_back(costbridge::protocol::to_json(tool));
            }
            print_json(listed);
        }
    } else {
        // Discovery enables the unknown-tool check before dispatch
        auto tools = dispatcher.list_tools();
        if (errors::is_error(tools)) {
            log_error("tools/list failed", errors::get_error(tools));
        }

        nlohmann::json payload = req.calls;
        if (req.command == CommandKind::Call) {
            payload = nlohmann::json{{"tool_name", req.tool_name},
                                     {"parameters", req.parameters}};
        }
        const auto outcome = dispatcher.invoke_json(payload, req.query_text.value_or(""));
        print_json(costbridge::protocol::to_json(outcome));
        exit_code = outcome_failed(outcome) ? 1 : 0;
    }

    session.close();
    CB_LOG_INFO("Session closed with exit code " + std::to_string(exit_code));
    return exit_code;
}
