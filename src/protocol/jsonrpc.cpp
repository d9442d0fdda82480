#include "protocol/jsonrpc.hpp"

#include <algorithm>
#include <cctype>

namespace costbridge::protocol::jsonrpc {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
}

std::string preview(const std::string& line) {
    constexpr std::size_t kMaxPreview = 200;
    if (line.size() <= kMaxPreview) {
        return line;
    }
    return line.substr(0, kMaxPreview) + "...";
}

}  // namespace

json make_request(const std::int64_t id, const std::string& method,
                  const std::optional<json>& params) {
    json request;
    request["jsonrpc"] = kVersion;
    request["id"] = id;
    request["method"] = method;
    if (params.has_value()) {
        request["params"] = params.value();
    }
    return request;
}

json make_notification(const std::string& method) {
    json notification;
    notification["jsonrpc"] = kVersion;
    notification["method"] = method;
    return notification;
}

core::errors::Result<DecodedLine> decode_line(
    const std::string& line, const std::int64_t expected_id,
    const std::vector<std::int64_t>& stale_ids) {
    DecodedLine decoded;
    if (is_blank(line)) {
        decoded.kind = LineKind::Unsolicited;
        return decoded;
    }

    const json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Response is not valid JSON: " + preview(line),
                           "invalid_json"};
    }
    if (!message.is_object()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Response is not a JSON object: " + preview(line),
                           "invalid_message"};
    }

    const auto id_it = message.find("id");
    const bool has_id = id_it != message.end() && !id_it->is_null();
    if (message.contains("method")) {
        decoded.kind = LineKind::Unsolicited;
        return decoded;
    }
    if (!has_id) {
        return BridgeError{ErrorCategory::Protocol,
                           "Response has no id: " + preview(line),
                           "missing_id"};
    }
    if (id_it->is_number_integer() &&
        std::find(stale_ids.begin(), stale_ids.end(), id_it->get<std::int64_t>()) !=
            stale_ids.end()) {
        decoded.kind = LineKind::Stale;
        decoded.response.id = id_it->get<std::int64_t>();
        return decoded;
    }
    if (!id_it->is_number_integer() || id_it->get<std::int64_t>() != expected_id) {
        return BridgeError{ErrorCategory::Protocol,
                           "Response id " + id_it->dump() +
                               " does not match request id " +
                               std::to_string(expected_id),
                           "id_mismatch"};
    }

    decoded.response.id = expected_id;
    const auto result_it = message.find("result");
    if (result_it != message.end()) {
        decoded.response.result = *result_it;
    }
    const auto error_it = message.find("error");
    if (error_it != message.end()) {
        decoded.response.error = *error_it;
    }
    if (!decoded.response.result.has_value() && !decoded.response.error.has_value()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Response has neither result nor error: " + preview(line),
                           "missing_result"};
    }
    return decoded;
}

std::string error_message(const json& error) {
    if (error.is_object()) {
        const auto message_it = error.find("message");
        if (message_it != error.end() && message_it->is_string()) {
            return message_it->get<std::string>();
        }
    }
    if (error.is_string()) {
        return error.get<std::string>();
    }
    return error.dump();
}

}  // namespace costbridge::protocol::jsonrpc
