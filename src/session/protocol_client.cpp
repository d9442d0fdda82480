#include "session/protocol_client.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"
#include "sanitize/response_sanitizer.hpp"

namespace costbridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ToolDescriptor;
namespace jsonrpc = protocol::jsonrpc;

namespace {

constexpr int kMaxUnsolicitedMessages = 64;
constexpr std::size_t kMaxOwedResponses = 16;

// Only these failures leave the server's response for the request unread.
bool response_still_owed(const BridgeError& error) {
    return error.code == "invalid_json" || error.code == "invalid_message" ||
           error.code == "missing_id" || error.code == "id_mismatch";
}

std::string preview(const std::string& text) {
    constexpr std::size_t kMaxPreview = 200;
    if (text.size() <= kMaxPreview) {
        return text;
    }
    return text.substr(0, kMaxPreview) + "...";
}

std::string content_text(const json& content) {
    std::string text;
    if (!content.is_array()) {
        return text;
    }
    for (const auto& item : content) {
        if (!item.is_object()) {
            continue;
        }
        const auto text_it = item.find("text");
        if (text_it == item.end() || !text_it->is_string()) {
            continue;
        }
        if (!text.empty()) {
            text += "\n";
        }
        text += text_it->get<std::string>();
    }
    return text;
}

core::errors::Result<json> decode_tool_result(const json& result) {
    if (!result.is_object()) {
        return result;
    }

    const auto error_flag = result.find("isError");
    if (error_flag != result.end() && error_flag->is_boolean() && error_flag->get<bool>()) {
        std::string message = content_text(result.value("content", json()));
        if (message.empty()) {
            message = "Tool reported an error.";
        }
        return BridgeError{ErrorCategory::ToolFailure, message, "tool_error"};
    }

    const auto content = result.find("content");
    if (content == result.end()) {
        return result;
    }
    if (!content->is_array() || content->empty() || !content->front().is_object() ||
        !content->front().contains("text") || !content->front()["text"].is_string()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Tool result content has no text item.", "invalid_payload"};
    }

    const std::string text = content->front()["text"].get<std::string>();
    json parsed = json::parse(sanitize::replace_non_finite_literals(text), nullptr, false);
    if (parsed.is_discarded()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Failed to parse MCP response: " + preview(text),
                           "invalid_payload"};
    }
    return parsed;
}

}  // namespace

std::string to_string(const HandshakeState state) {
    switch (state) {
        case HandshakeState::Uninitialized:
            return "uninitialized";
        case HandshakeState::Initializing:
            return "initializing";
        case HandshakeState::Ready:
            return "ready";
        case HandshakeState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

ProtocolClient::ProtocolClient(process::LineChannel& channel,
                               core::config::ClientConfig config)
    : channel_(channel), config_(std::move(config)) {}

core::errors::Result<json> ProtocolClient::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HandshakeState::Closed) {
        return BridgeError{ErrorCategory::Handshake, "Session is closed.",
                           "session_closed",
                           "Start a new tool server session to reconnect."};
    }
    if (state_ != HandshakeState::Uninitialized) {
        return BridgeError{ErrorCategory::Handshake,
                           "Session was already initialized.", "already_initialized"};
    }
    transition(HandshakeState::Initializing);

    json params;
    params["protocolVersion"] = config_.protocol_version;
    params["capabilities"] = {{"tools", json::object()}};
    params["clientInfo"] = {{"name", config_.client_name},
                            {"version", config_.client_version}};

    auto response = round_trip(jsonrpc::kMethodInitialize, params,
                               config_.handshake_timeout_ms);
    if (core::errors::is_error(response)) {
        const auto& err = core::errors::get_error(response);
        transition(HandshakeState::Closed);
        return BridgeError{ErrorCategory::Handshake, "Initialize failed: " + err.message,
                           err.code, err.hint};
    }
    const auto& decoded = core::errors::get_value(response);
    if (!decoded.result.has_value()) {
        transition(HandshakeState::Closed);
        return BridgeError{ErrorCategory::Handshake,
                           "Initialize rejected: " +
                               jsonrpc::error_message(decoded.error.value_or(json())),
                           "initialize_rejected"};
    }

    auto notified = send(jsonrpc::make_notification(jsonrpc::kMethodInitialized));
    if (core::errors::is_error(notified)) {
        const auto& err = core::errors::get_error(notified);
        transition(HandshakeState::Closed);
        return BridgeError{ErrorCategory::Handshake,
                           "Initialized notification failed: " + err.message, err.code,
                           err.hint};
    }

    transition(HandshakeState::Ready);
    const json& result = decoded.result.value();
    if (result.is_object() && result.contains("serverInfo") &&
        result["serverInfo"].is_object()) {
        const auto& info = result["serverInfo"];
        CB_LOG_INFO("ProtocolClient: connected to " + info.value("name", "unknown") +
                    " " + info.value("version", ""));
    }
    return result;
}

core::errors::Result<std::vector<ToolDescriptor>> ProtocolClient::list_tools() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = require_ready();
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }
    if (tools_.has_value()) {
        return tools_.value();
    }

    auto response = round_trip(jsonrpc::kMethodToolsList, std::nullopt,
                               config_.request_timeout_ms);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const auto& decoded = core::errors::get_value(response);
    if (!decoded.result.has_value()) {
        return BridgeError{ErrorCategory::ToolFailure,
                           jsonrpc::error_message(decoded.error.value_or(json())),
                           "server_error"};
    }

    const json& result = decoded.result.value();
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return BridgeError{ErrorCategory::Protocol,
                           "tools/list result has no tools array.",
                           "invalid_tools_list"};
    }

    std::vector<ToolDescriptor> tools;
    std::string names;
    for (const auto& item : result["tools"]) {
        auto descriptor = protocol::tool_descriptor_from_json(item);
        if (core::errors::is_error(descriptor)) {
            CB_LOG_WARN("ProtocolClient: skipping tool entry: " +
                        core::errors::get_error(descriptor).message);
            continue;
        }
        tools.push_back(core::errors::get_value(descriptor));
        names += (names.empty() ? "" : ", ") + tools.back().name;
    }
    CB_LOG_INFO("ProtocolClient: loaded " + std::to_string(tools.size()) +
                " tools: " + names);
    tools_ = tools;
    return tools;
}

core::errors::Result<json> ProtocolClient::call_tool(const std::string& name,
                                                     const json& arguments) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = require_ready();
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }
    if (name.empty()) {
        return BridgeError{ErrorCategory::InvalidCall, "Tool name cannot be empty.",
                           "missing_tool_name"};
    }

    json params;
    params["name"] = name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;

    auto response =
        round_trip(jsonrpc::kMethodToolsCall, params, config_.request_timeout_ms);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const auto& decoded = core::errors::get_value(response);
    if (!decoded.result.has_value()) {
        return BridgeError{ErrorCategory::ToolFailure,
                           jsonrpc::error_message(decoded.error.value_or(json())),
                           "server_error"};
    }
    return decode_tool_result(decoded.result.value());
}

void ProtocolClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    transition(HandshakeState::Closed);
}

HandshakeState ProtocolClient::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::int64_t ProtocolClient::last_request_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_id_;
}

std::optional<std::vector<ToolDescriptor>> ProtocolClient::discovered_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

core::errors::Result<jsonrpc::Response> ProtocolClient::round_trip(
    const std::string& method, const std::optional<json>& params,
    const std::uint32_t timeout_ms) {
    const std::int64_t id = next_id_++;
    last_request_id_ = id;

    auto sent = send(jsonrpc::make_request(id, method, params));
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    return receive(id, timeout_ms);
}

core::errors::Status ProtocolClient::send(const json& message) {
    const std::string line = message.dump();
    CB_LOG_DEBUG("ProtocolClient: -> " + line);
    auto written = channel_.write_line(line);
    if (core::errors::is_error(written)) {
        close_if_fatal(core::errors::get_error(written));
    }
    return written;
}

core::errors::Result<jsonrpc::Response> ProtocolClient::receive(
    const std::int64_t id, const std::uint32_t timeout_ms) {
    const auto started = std::chrono::steady_clock::now();
    for (int skipped = 0; skipped <= kMaxUnsolicitedMessages; ++skipped) {
        std::uint32_t remaining_ms = 0;
        if (timeout_ms > 0) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();
            // Never pass 0 here: it means "wait forever" to the channel.
            remaining_ms = elapsed >= static_cast<std::int64_t>(timeout_ms)
                               ? 1
                               : static_cast<std::uint32_t>(timeout_ms - elapsed);
        }

        auto line = channel_.read_line(remaining_ms);
        if (core::errors::is_error(line)) {
            close_if_fatal(core::errors::get_error(line));
            return core::errors::get_error(line);
        }
        const std::string& text = core::errors::get_value(line);
        CB_LOG_DEBUG("ProtocolClient: <- " + preview(text));

        auto decoded = jsonrpc::decode_line(sanitize::replace_non_finite_literals(text),
                                            id, owed_ids_);
        if (core::errors::is_error(decoded)) {
            const auto& err = core::errors::get_error(decoded);
            if (response_still_owed(err)) {
                owed_ids_.push_back(id);
                if (owed_ids_.size() > kMaxOwedResponses) {
                    owed_ids_.erase(owed_ids_.begin());
                }
            }
            return err;
        }
        const auto& message = core::errors::get_value(decoded);
        if (message.kind == jsonrpc::LineKind::Response) {
            return message.response;
        }
        if (message.kind == jsonrpc::LineKind::Stale) {
            owed_ids_.erase(
                std::remove(owed_ids_.begin(), owed_ids_.end(), message.response.id),
                owed_ids_.end());
            CB_LOG_WARN("ProtocolClient: discarded late response for request " +
                        std::to_string(message.response.id));
            continue;
        }
        CB_LOG_DEBUG("ProtocolClient: skipped unsolicited message while waiting for id " +
                     std::to_string(id));
    }

    return BridgeError{ErrorCategory::Protocol,
                       "Too many unsolicited messages while waiting for response " +
                           std::to_string(id) + ".",
                       "too_many_unsolicited_messages"};
}

core::errors::Status ProtocolClient::require_ready() const {
    if (state_ == HandshakeState::Closed) {
        return BridgeError{ErrorCategory::Handshake, "Session is closed.",
                           "session_closed",
                           "Start a new tool server session to reconnect."};
    }
    if (state_ != HandshakeState::Ready) {
        return BridgeError{ErrorCategory::Handshake,
                           "Session is not ready; run initialize first.",
                           "session_not_ready"};
    }
    return core::errors::ok();
}

void ProtocolClient::transition(const HandshakeState next) {
    if (static_cast<int>(next) <= static_cast<int>(state_)) {
        return;
    }
    CB_LOG_INFO("ProtocolClient: session transition " + to_string(state_) + " -> " +
                to_string(next));
    state_ = next;
}

void ProtocolClient::close_if_fatal(const BridgeError& error) {
    const bool timed_out =
        error.category == ErrorCategory::Protocol && error.code == "read_timeout";
    if (error.category == ErrorCategory::BrokenPipe || timed_out) {
        CB_LOG_ERROR("ProtocolClient: " + error.message);
        transition(HandshakeState::Closed);
    }
}

}  // namespace costbridge::session
