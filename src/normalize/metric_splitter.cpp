#include "normalize/metric_splitter.hpp"

#include <algorithm>
#include <cctype>
#include "core/logging/logger.hpp"

namespace costbridge::normalize {

using protocol::ToolCall;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

bool mentions_standalone_blended(const std::string& lower) {
    std::size_t pos = lower.find("blended");
    while (pos != std::string::npos) {
        if (pos < 2 || lower.compare(pos - 2, 2, "un") != 0) {
            return true;
        }
        pos = lower.find("blended", pos + 1);
    }
    return false;
}

std::vector<ToolCall> split(const ToolCall& call, const std::vector<std::string>& metrics) {
    std::vector<ToolCall> calls;
    calls.reserve(metrics.size());
    for (const auto& metric : metrics) {
        ToolCall copy = call;
        copy.requested_metrics.clear();
        if (!copy.parameters.is_object()) {
            copy.parameters = nlohmann::json::object();
        }
        copy.parameters["metric"] = metric;
        calls.push_back(std::move(copy));
    }
    return calls;
}

}  // namespace

std::vector<std::string> detect_requested_metrics(const std::string& query_text) {
    const std::string lower = lowercase(query_text);
    std::vector<std::string> metrics;
    if (contains(lower, "amortized")) {
        metrics.emplace_back("AmortizedCost");
    }
    if (mentions_standalone_blended(lower)) {
        metrics.emplace_back("BlendedCost");
    }
    if (contains(lower, "unblended")) {
        metrics.emplace_back("UnblendedCost");
    }
    return metrics;
}

bool wants_multiple_metrics(const std::string& query_text) {
    if (detect_requested_metrics(query_text).size() >= 2) {
        return true;
    }
    const std::string lower = lowercase(query_text);
    const bool about_metrics = contains(lower, "metric") || contains(lower, "cost");
    return about_metrics && (contains(lower, "separate") || contains(lower, "both"));
}

std::vector<ToolCall> expand_metric_calls(const ToolCall& call,
                                          const std::string& query_text,
                                          const SplitPolicy& policy) {
    if (call.tool_name != policy.splittable_tool) {
        return {call};
    }

    if (!call.requested_metrics.empty()) {
        CB_LOG_INFO("MetricSplitter: splitting " + call.tool_name + " into " +
                    std::to_string(call.requested_metrics.size()) +
                    " calls from requested_metrics");
        return split(call, call.requested_metrics);
    }

    if (query_text.empty() || !wants_multiple_metrics(query_text)) {
        return {call};
    }

    std::vector<std::string> metrics = detect_requested_metrics(query_text);
    if (metrics.empty()) {
        metrics = policy.fallback_metrics;
    }
    CB_LOG_INFO("MetricSplitter: splitting " + call.tool_name + " into " +
                std::to_string(metrics.size()) + " calls from query text");
    return split(call, metrics);
}

}  // namespace costbridge::normalize
