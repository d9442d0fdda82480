#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace costbridge::protocol::jsonrpc {

inline constexpr const char* kVersion = "2.0";

inline constexpr const char* kMethodInitialize = "initialize";
inline constexpr const char* kMethodInitialized = "notifications/initialized";
inline constexpr const char* kMethodToolsList = "tools/list";
inline constexpr const char* kMethodToolsCall = "tools/call";

nlohmann::json make_request(std::int64_t id, const std::string& method,
                            const std::optional<nlohmann::json>& params = std::nullopt);

nlohmann::json make_notification(const std::string& method);

enum class LineKind {
    Response,
    Unsolicited,  // notification or server-initiated request, or a blank line
    Stale         // late response to an earlier request that already failed
};

struct Response {
    std::int64_t id = 0;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> error;
};

struct DecodedLine {
    LineKind kind = LineKind::Response;
    Response response;
};

// Decodes one line read from the server. A response carrying one of
// `stale_ids` is reported as Stale. Any other response whose id differs from `expected_id`
// is a protocol error, as is a response with neither `result` nor `error`.
core::errors::Result<DecodedLine> decode_line(
    const std::string& line, std::int64_t expected_id,
    const std::vector<std::int64_t>& stale_ids = {});

// error.message when present, otherwise the serialized error object.
std::string error_message(const nlohmann::json& error);

}  // namespace costbridge::protocol::jsonrpc
