#include "reroute/core/params.hpp"

#include <sstream>

namespace reroute {

std::optional<std::string> ParamValue::to_param() const {
    if (is_string()) return as_string();
    if (is_bool()) return std::string(as_bool() ? "true" : "false");
    if (is_array()) {
        std::string joined;
        for (const auto& item : as_array()) {
            auto part = item.to_param();
            if (!part) continue;
            if (!joined.empty()) joined += '/';
            joined += *part;
        }
        return joined;
    }
    return std::nullopt;
}

std::string ParamValue::inspect() const {
    if (is_null()) return "nil";
    if (is_bool()) return as_bool() ? "true" : "false";
    if (is_string()) return "\"" + as_string() + "\"";
    if (is_array()) {
        std::ostringstream oss;
        oss << "[";
        bool first = true;
        for (const auto& item : as_array()) {
            if (!first) oss << ", ";
            oss << item.inspect();
            first = false;
        }
        oss << "]";
        return oss.str();
    }
    return reroute::inspect(as_hash());
}

Params merge_params(const Params& base, const Params& overlay) {
    Params merged = base;
    for (const auto& [key, value] : overlay) {
        merged.insert_or_assign(key, value);
    }
    return merged;
}

bool has_param(const Params& params, const std::string& key) {
    auto it = params.find(key);
    return it != params.end() && it->second.truthy();
}

std::string inspect(const Params& params) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << ", ";
        oss << key << ": " << value.inspect();
        first = false;
    }
    oss << "}";
    return oss.str();
}

} // namespace reroute
