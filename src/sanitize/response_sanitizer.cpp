#include "sanitize/response_sanitizer.hpp"

#include <cctype>
#include <cmath>

namespace costbridge::sanitize {

using nlohmann::json;

namespace {

bool is_identifier_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool token_at(const std::string& text, const std::size_t pos, const std::string& token) {
    if (text.compare(pos, token.size(), token) != 0) {
        return false;
    }
    const std::size_t end = pos + token.size();
    if (end < text.size() && is_identifier_char(text[end])) {
        return false;
    }
    return pos == 0 || !is_identifier_char(text[pos - 1]);
}

}  // namespace

json sanitize(const json& value) {
    switch (value.type()) {
        case json::value_t::object: {
            json out = json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                out[it.key()] = sanitize(it.value());
            }
            return out;
        }
        case json::value_t::array: {
            json out = json::array();
            for (const auto& item : value) {
                out.push_back(sanitize(item));
            }
            return out;
        }
        case json::value_t::number_float: {
            if (!std::isfinite(value.get<double>())) {
                return nullptr;
            }
            return value;
        }
        default:
            return value;
    }
}

std::string replace_non_finite_literals(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_string = false;
    bool escaped = false;

    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (in_string) {
            out.push_back(c);
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            ++i;
            continue;
        }

        if (c == '"') {
            in_string = true;
            out.push_back(c);
            ++i;
            continue;
        }
        if (token_at(text, i, "NaN")) {
            out += "null";
            i += 3;
            continue;
        }
        if (c == '-' && token_at(text, i + 1, "Infinity")) {
            out += "null";
            i += 9;
            continue;
        }
        if (token_at(text, i, "Infinity")) {
            out += "null";
            i += 8;
            continue;
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

}  // namespace costbridge::sanitize
