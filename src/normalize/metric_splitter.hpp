#pragma once

#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace costbridge::normalize {

struct SplitPolicy {
    // Only this tool accepts one metric per call and is split.
    std::string splittable_tool = "get_cost_and_usage";
    std::vector<std::string> fallback_metrics = {"AmortizedCost", "BlendedCost"};
};

// Cost bases named in `query_text`, ordered AmortizedCost, BlendedCost,
// UnblendedCost.
std::vector<std::string> detect_requested_metrics(const std::string& query_text);

bool wants_multiple_metrics(const std::string& query_text);

// Expands `call` into one call per requested metric when the request asks
// for several metrics. Structured `requested_metrics` win over the text
// heuristic. Anything else comes back as a single-element list.
std::vector<protocol::ToolCall> expand_metric_calls(const protocol::ToolCall& call,
                                                    const std::string& query_text,
                                                    const SplitPolicy& policy = {});

}  // namespace costbridge::normalize
