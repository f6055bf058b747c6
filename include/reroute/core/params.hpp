#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace reroute {

// ============================================================================
// Parameter Value Type
// ============================================================================

class ParamValue;

using ParamArray = std::vector<ParamValue>;
using Params = std::map<std::string, ParamValue>;

class ParamValue {
public:
    using Variant = std::variant<std::nullptr_t, bool, std::string, ParamArray, Params>;

private:
    Variant value_;

public:
    ParamValue() : value_(nullptr) {}
    ParamValue(std::nullptr_t) : value_(nullptr) {}
    ParamValue(bool b) : value_(b) {}
    ParamValue(int i) : value_(std::to_string(i)) {}
    ParamValue(int64_t i) : value_(std::to_string(i)) {}
    ParamValue(const char* s) : value_(std::string(s)) {}
    ParamValue(std::string s) : value_(std::move(s)) {}
    ParamValue(std::string_view s) : value_(std::string(s)) {}
    ParamValue(ParamArray arr) : value_(std::move(arr)) {}
    ParamValue(Params hash) : value_(std::move(hash)) {}

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(value_); }
    bool is_bool() const { return std::holds_alternative<bool>(value_); }
    bool is_string() const { return std::holds_alternative<std::string>(value_); }
    bool is_array() const { return std::holds_alternative<ParamArray>(value_); }
    bool is_hash() const { return std::holds_alternative<Params>(value_); }

    bool as_bool() const { return std::get<bool>(value_); }
    const std::string& as_string() const { return std::get<std::string>(value_); }
    const ParamArray& as_array() const { return std::get<ParamArray>(value_); }
    const Params& as_hash() const { return std::get<Params>(value_); }

    // Null and false are falsy; every other value is truthy
    bool truthy() const {
        if (is_null()) return false;
        if (is_bool()) return as_bool();
        return true;
    }

    // String form used in URLs. Arrays join with '/' so glob segments can
    // take a list of path components; hashes and null have none.
    std::optional<std::string> to_param() const;

    // Debug rendering used in error messages
    std::string inspect() const;

    const Variant& variant() const { return value_; }

    bool operator==(const ParamValue& other) const { return value_ == other.value_; }
    bool operator!=(const ParamValue& other) const { return !(*this == other); }
};

// Entries of overlay replace entries of base
Params merge_params(const Params& base, const Params& overlay);

// True when the key exists and holds a truthy value
bool has_param(const Params& params, const std::string& key);

std::string inspect(const Params& params);

// Escapes a single value before it is substituted into a generated path
using Parameterize = std::function<std::string(std::string_view name, std::string_view value)>;

// Serializes leftover parameters into a query string
using QueryBuilder = std::function<std::string(const Params& params)>;

} // namespace reroute
