#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "normalize/calendar.hpp"

namespace costbridge::normalize {

// Forecast tools spell metrics in UPPER_SNAKE_CASE, every other cost tool
// in PascalCase.
enum class ToolFamily {
    Usage,
    Forecast
};

ToolFamily family_of(const std::string& tool_name);

// Default metric substituted for unusable metric values.
std::string default_metric(ToolFamily family);

struct NormalizerOptions {
    // Overrides the local calendar date; used by tests.
    std::optional<CalendarDate> today;
};

struct NormalizationResult {
    nlohmann::json parameters;
    std::vector<std::string> warnings;
};

// Repairs parameter shapes the upstream interpreter is known to get wrong.
// The input is never modified; every rule is idempotent, so normalizing an
// already normalized bag returns it unchanged.
class ParameterNormalizer {
public:
    explicit ParameterNormalizer(NormalizerOptions options = {});

    NormalizationResult normalize(const std::string& tool_name,
                                  const nlohmann::json& parameters) const;

private:
    CalendarDate today() const;

    NormalizerOptions options_;
};

}  // namespace costbridge::normalize
