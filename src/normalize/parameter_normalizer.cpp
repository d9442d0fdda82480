#include "normalize/parameter_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"

namespace costbridge::normalize {

using nlohmann::json;

namespace {

using Warnings = std::vector<std::string>;

const char* const kGroupByKey = "group_by";
const char* const kDateRangeKey = "date_range";
const char* const kBaselineKey = "baseline_date_range";
const char* const kComparisonKey = "comparison_date_range";
const char* const kFilterKey = "filter_expression";
const char* const kStartDate = "start_date";
const char* const kEndDate = "end_date";
const char* const kFallbackDimension = "SERVICE";

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

// "Unblended Cost", "UNBLENDED_COST" and "unblendedCost" all become
// "unblendedcost".
std::string canonical_key(const std::string& value) {
    std::string key;
    key.reserve(value.size());
    for (const unsigned char c : value) {
        if (std::isalnum(c) != 0) {
            key.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return key;
}

const std::unordered_map<std::string, std::string>& usage_metric_names() {
    static const std::unordered_map<std::string, std::string> kNames = {
        {"unblendedcost", "UnblendedCost"},
        {"unblended", "UnblendedCost"},
        {"blendedcost", "BlendedCost"},
        {"blended", "BlendedCost"},
        {"amortizedcost", "AmortizedCost"},
        {"amortized", "AmortizedCost"},
        {"netamortizedcost", "NetAmortizedCost"},
        {"netamortized", "NetAmortizedCost"},
        {"netunblendedcost", "NetUnblendedCost"},
        {"netunblended", "NetUnblendedCost"},
        {"usagequantity", "UsageQuantity"},
        {"normalizedusageamount", "NormalizedUsageAmount"},
    };
    return kNames;
}

const std::unordered_map<std::string, std::string>& forecast_metric_names() {
    static const std::unordered_map<std::string, std::string> kNames = {
        {"unblendedcost", "UNBLENDED_COST"},
        {"unblended", "UNBLENDED_COST"},
        {"blendedcost", "BLENDED_COST"},
        {"blended", "BLENDED_COST"},
        {"amortizedcost", "AMORTIZED_COST"},
        {"amortized", "AMORTIZED_COST"},
        {"netamortizedcost", "NET_AMORTIZED_COST"},
        {"netamortized", "NET_AMORTIZED_COST"},
        {"netunblendedcost", "NET_UNBLENDED_COST"},
        {"netunblended", "NET_UNBLENDED_COST"},
        {"usagequantity", "USAGE_QUANTITY"},
        {"normalizedusageamount", "NORMALIZED_USAGE_AMOUNT"},
    };
    return kNames;
}

// Tag keys the interpreter tends to pass off as dimensions.
const std::unordered_set<std::string>& pseudo_dimensions() {
    static const std::unordered_set<std::string> kNames = {
        "costcenter", "environment", "project", "team", "department", "usagetypegroup"};
    return kNames;
}

const std::unordered_map<std::string, std::string>& service_aliases() {
    static const std::unordered_map<std::string, std::string> kAliases = {
        {"EC2", "Amazon Elastic Compute Cloud - Compute"},
        {"ec2", "Amazon Elastic Compute Cloud - Compute"},
        {"Elastic Compute Cloud", "Amazon Elastic Compute Cloud - Compute"},
        {"Amazon EC2", "Amazon Elastic Compute Cloud - Compute"},
        {"RDS", "Amazon Relational Database Service"},
        {"rds", "Amazon Relational Database Service"},
        {"Relational Database", "Amazon Relational Database Service"},
        {"S3", "Amazon Simple Storage Service"},
        {"s3", "Amazon Simple Storage Service"},
        {"Simple Storage", "Amazon Simple Storage Service"},
        {"Lambda", "AWS Lambda"},
        {"lambda", "AWS Lambda"},
        {"CloudWatch", "AmazonCloudWatch"},
        {"cloudwatch", "AmazonCloudWatch"},
    };
    return kAliases;
}

const std::unordered_map<std::string, std::string>& purchase_type_aliases() {
    static const std::unordered_map<std::string, std::string> kAliases = {
        {"Reserved", "Standard Reserved Instances"},
        {"reserved", "Standard Reserved Instances"},
        {"Reserved Instances", "Standard Reserved Instances"},
        {"RI", "Standard Reserved Instances"},
        {"OnDemand", "On Demand Instances"},
        {"On-Demand", "On Demand Instances"},
        {"Spot", "Spot Instances"},
        {"SavingsPlans", "Savings Plans"},
        {"Savings Plan", "Savings Plans"},
        {"SP", "Savings Plans"},
    };
    return kAliases;
}

bool is_tag_grouping(const json& value) {
    if (!value.is_object()) {
        return false;
    }
    const auto type_it = value.find("Type");
    return type_it != value.end() && type_it->is_string() &&
           canonical_key(type_it->get<std::string>()) == "tag";
}

std::optional<std::string> string_member(const json& object, const char* key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void repair_group_by(json& params, Warnings& warnings) {
    const auto it = params.find(kGroupByKey);
    if (it == params.end()) {
        return;
    }
    json& group_by = *it;

    // Tag grouping is elided first so a collapsed sequence cannot smuggle a
    // tag key through as a dimension name.
    if (group_by.is_array()) {
        for (auto& entry : group_by) {
            if (is_tag_grouping(entry)) {
                warnings.push_back("Tag grouping is not supported in group_by; using " +
                                   std::string(kFallbackDimension) + ".");
                entry = kFallbackDimension;
            }
        }
    } else if (group_by.is_object()) {
        if (is_tag_grouping(group_by)) {
            warnings.push_back("Tag grouping is not supported in group_by; using " +
                               std::string(kFallbackDimension) + ".");
            group_by = kFallbackDimension;
        } else if (auto key = string_member(group_by, "Key")) {
            group_by = *key;
        }
    }

    if (group_by.is_array()) {
        if (group_by.empty()) {
            group_by = nullptr;
        } else if (auto key = string_member(group_by.front(), "Key")) {
            group_by = *key;
        } else if (group_by.front().is_string()) {
            json first = group_by.front();
            group_by = std::move(first);
        }
    }

    if (group_by.is_string()) {
        const std::string name = group_by.get<std::string>();
        if (pseudo_dimensions().count(canonical_key(name)) > 0) {
            warnings.push_back("'" + name + "' is not a valid group_by dimension; using " +
                               std::string(kFallbackDimension) + ".");
            group_by = kFallbackDimension;
        }
    }
}

void clamp_start_date(json& params, const CalendarDate& today, Warnings& warnings) {
    const auto it = params.find(kDateRangeKey);
    if (it == params.end() || !it->is_object()) {
        return;
    }
    const auto start_text = string_member(*it, kStartDate);
    if (!start_text.has_value()) {
        return;
    }
    const auto start = parse_iso_date(*start_text);
    if (!start.has_value() || !(today < *start)) {
        return;
    }
    const std::string clamped = format_iso_date(today);
    warnings.push_back("date_range.start_date " + *start_text +
                       " is in the future; using " + clamped + ".");
    (*it)[kStartDate] = clamped;
}

// Distinct cost bases named in free text; "blended" inside "unblended"
// does not count.
int count_cost_bases(const std::string& text) {
    const std::string lower = lowercase(text);
    int count = 0;
    if (lower.find("amortized") != std::string::npos) {
        ++count;
    }
    if (lower.find("unblended") != std::string::npos) {
        ++count;
    }
    std::size_t pos = lower.find("blended");
    while (pos != std::string::npos) {
        if (pos < 2 || lower.compare(pos - 2, 2, "un") != 0) {
            ++count;
            break;
        }
        pos = lower.find("blended", pos + 1);
    }
    return count;
}

void repair_metric(json& params, const char* key, const ToolFamily family,
                   Warnings& warnings) {
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return;
    }
    const std::string original = it->get<std::string>();
    const auto& table = family == ToolFamily::Forecast ? forecast_metric_names()
                                                       : usage_metric_names();

    const auto mapped = table.find(canonical_key(original));
    if (mapped != table.end()) {
        *it = mapped->second;
        return;
    }

    if (canonical_key(original) == "both") {
        const std::string fallback = default_metric(family);
        warnings.push_back(std::string(key) + " 'BOTH' is not supported; using " +
                           fallback + ".");
        *it = fallback;
        return;
    }

    if (count_cost_bases(original) >= 2) {
        const std::string fallback = default_metric(family);
        warnings.push_back(std::string(key) + " '" + original +
                           "' names several cost bases; using " + fallback +
                           ". Request each metric as a separate call.");
        *it = fallback;
    }
}

// An explicit target key always wins over its generic alias.
void rename_key(json& params, const char* from, const char* to) {
    const auto it = params.find(from);
    if (it == params.end() || params.contains(to)) {
        return;
    }
    json value = *it;
    params.erase(it);
    params[to] = std::move(value);
}

void rename_comparison_periods(json& params) {
    rename_key(params, "current_period", kBaselineKey);
    rename_key(params, "previous_period", kComparisonKey);
}

std::optional<CalendarDate> range_start_month(const json& range) {
    const auto start = string_member(range, kStartDate);
    if (!start.has_value()) {
        return std::nullopt;
    }
    return parse_year_month(*start);
}

void set_month_range(json& range, const CalendarDate& month_start) {
    range[kStartDate] = format_iso_date(month_start);
    range[kEndDate] = format_iso_date(add_months(month_start, 1));
}

void align_to_whole_month(json& params, const char* key) {
    const auto it = params.find(key);
    if (it == params.end() || !it->is_object()) {
        return;
    }
    const auto start = range_start_month(*it);
    if (!start.has_value()) {
        return;
    }
    set_month_range(*it, *start);
}

void exclude_current_month(json& params, const char* key, const CalendarDate& today,
                           Warnings& warnings) {
    const auto it = params.find(key);
    if (it == params.end() || !it->is_object()) {
        return;
    }
    const auto start = range_start_month(*it);
    if (!start.has_value() || !same_month(*start, today)) {
        return;
    }
    const CalendarDate previous = add_months(first_of_month(today), -1);
    warnings.push_back(std::string(key) +
                       " falls in the current, incomplete month; using " +
                       format_iso_date(previous) + ".");
    set_month_range(*it, previous);
}

void separate_colliding_ranges(json& params, Warnings& warnings) {
    const auto baseline = params.find(kBaselineKey);
    const auto comparison = params.find(kComparisonKey);
    if (baseline == params.end() || comparison == params.end() ||
        !baseline->is_object() || !comparison->is_object()) {
        return;
    }
    if (baseline->value(kStartDate, json()) != comparison->value(kStartDate, json()) ||
        baseline->value(kEndDate, json()) != comparison->value(kEndDate, json())) {
        return;
    }
    const auto start = range_start_month(*comparison);
    if (!start.has_value()) {
        return;
    }
    const CalendarDate earlier = add_months(*start, -1);
    warnings.push_back("Baseline and comparison ranges are identical; comparing against " +
                       format_iso_date(earlier) + ".");
    set_month_range(*comparison, earlier);
}

void apply_value_aliases(json& dimensions,
                         const std::unordered_map<std::string, std::string>& aliases,
                         Warnings& warnings) {
    const auto values = dimensions.find("Values");
    if (values == dimensions.end() || !values->is_array()) {
        return;
    }
    for (auto& value : *values) {
        if (!value.is_string()) {
            continue;
        }
        const auto alias = aliases.find(value.get<std::string>());
        if (alias == aliases.end()) {
            continue;
        }
        warnings.push_back("Corrected filter value '" + value.get<std::string>() +
                           "' to '" + alias->second + "'.");
        value = alias->second;
    }
}

// Returns false when the expression ends up empty and should be removed.
bool repair_filter(json& expression, Warnings& warnings) {
    if (!expression.is_object()) {
        return true;
    }

    const auto dims = expression.find("Dimensions");
    if (dims != expression.end() && dims->is_object()) {
        const auto key = string_member(*dims, "Key");
        if (key && *key == "TAG") {
            std::string encoded;
            const auto values = dims->find("Values");
            if (values != dims->end() && values->is_array() && !values->empty() &&
                values->front().is_string()) {
                encoded = values->front().get<std::string>();
            }

            const auto colon = encoded.find(':');
            if (colon != std::string::npos) {
                json tags;
                tags["Key"] = encoded.substr(0, colon);
                tags["Values"] = json::array({encoded.substr(colon + 1)});
                tags["MatchOptions"] = json::array({"EQUALS"});
                expression["Tags"] = std::move(tags);
                warnings.push_back("Rewrote TAG dimension filter '" + encoded +
                                   "' as a tag filter.");
            } else {
                warnings.push_back(
                    "Dropped TAG dimension filter without a key:value pair.");
            }
            expression.erase("Dimensions");
        } else if (key && *key == "SERVICE") {
            apply_value_aliases(*dims, service_aliases(), warnings);
        } else if (key && *key == "PURCHASE_TYPE") {
            apply_value_aliases(*dims, purchase_type_aliases(), warnings);
        }
    }

    for (const char* combinator : {"And", "Or"}) {
        const auto list = expression.find(combinator);
        if (list == expression.end() || !list->is_array()) {
            continue;
        }
        json kept = json::array();
        for (auto& child : *list) {
            if (repair_filter(child, warnings)) {
                kept.push_back(std::move(child));
            }
        }
        if (kept.empty()) {
            expression.erase(combinator);
        } else {
            *list = std::move(kept);
        }
    }

    const auto negated = expression.find("Not");
    if (negated != expression.end() && !repair_filter(*negated, warnings)) {
        expression.erase("Not");
    }

    return !expression.empty();
}

void repair_filter_expression(json& params, Warnings& warnings) {
    const auto it = params.find(kFilterKey);
    if (it == params.end() || !it->is_object()) {
        return;
    }
    if (!repair_filter(*it, warnings)) {
        params.erase(kFilterKey);
    }
}

}  // namespace

ToolFamily family_of(const std::string& tool_name) {
    return lowercase(tool_name).find("forecast") != std::string::npos
               ? ToolFamily::Forecast
               : ToolFamily::Usage;
}

std::string default_metric(const ToolFamily family) {
    return family == ToolFamily::Forecast ? "UNBLENDED_COST" : "AmortizedCost";
}

ParameterNormalizer::ParameterNormalizer(NormalizerOptions options)
    : options_(std::move(options)) {}

CalendarDate ParameterNormalizer::today() const {
    return options_.today.has_value() ? options_.today.value() : today_local();
}

NormalizationResult ParameterNormalizer::normalize(const std::string& tool_name,
                                                   const json& parameters) const {
    NormalizationResult result;
    if (parameters.is_null()) {
        result.parameters = json::object();
    } else {
        result.parameters = parameters;
    }
    if (!result.parameters.is_object()) {
        return result;
    }

    json& params = result.parameters;
    Warnings& warnings = result.warnings;
    const CalendarDate current = today();
    const ToolFamily family = family_of(tool_name);

    repair_group_by(params, warnings);
    clamp_start_date(params, current, warnings);
    repair_metric(params, "metric", family, warnings);
    repair_metric(params, "metric_for_comparison", ToolFamily::Usage, warnings);
    rename_comparison_periods(params);
    align_to_whole_month(params, kBaselineKey);
    align_to_whole_month(params, kComparisonKey);
    exclude_current_month(params, kBaselineKey, current, warnings);
    exclude_current_month(params, kComparisonKey, current, warnings);
    separate_colliding_ranges(params, warnings);
    repair_filter_expression(params, warnings);

    for (const auto& warning : warnings) {
        CB_LOG_WARN("ParameterNormalizer [" + tool_name + "]: " + warning);
    }
    return result;
}

}  // namespace costbridge::normalize
