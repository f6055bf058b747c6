#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace reroute {

// ============================================================================
// Pattern Errors (compile time)
// ============================================================================

enum class PatternError {
    UnterminatedGroup = 1,
    UnbalancedGroup,
    UnknownToken,
    TrailingEscape,
    InvalidRegexp
};

// ============================================================================
// Routing Errors (generation time)
// ============================================================================

enum class RoutingError {
    NoRouteMatches = 1,
    NamedRouteNotFound,
    DuplicateRouteName,
    RouteSetFrozen,
    InvalidArguments
};

} // namespace reroute

template<>
struct std::is_error_code_enum<reroute::PatternError> : std::true_type {};

template<>
struct std::is_error_code_enum<reroute::RoutingError> : std::true_type {};

namespace reroute {

const std::error_category& pattern_error_category() noexcept;
std::error_code make_error_code(PatternError e) noexcept;

const std::error_category& routing_error_category() noexcept;
std::error_code make_error_code(RoutingError e) noexcept;

// ============================================================================
// Unified Error Type
// ============================================================================

class Error {
public:
    using Variant = std::variant<PatternError, RoutingError, std::error_code>;

private:
    Variant inner_;
    std::string message_;
    std::string route_;

public:
    Error() : inner_(std::error_code{}) {}

    Error(PatternError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(RoutingError e, std::string message = "", std::string route = "")
        : inner_(e), message_(std::move(message)), route_(std::move(route)) {}

    Error(std::error_code ec, std::string message = "")
        : inner_(ec), message_(std::move(message)) {}

    static Error pattern(PatternError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error routing(RoutingError e, std::string msg = "", std::string route = "") {
        return Error(e, std::move(msg), std::move(route));
    }

    bool is_pattern() const noexcept {
        return std::holds_alternative<PatternError>(inner_);
    }

    bool is_routing() const noexcept {
        return std::holds_alternative<RoutingError>(inner_);
    }

    bool is_system() const noexcept {
        return std::holds_alternative<std::error_code>(inner_);
    }

    PatternError pattern_error() const noexcept {
        return is_pattern() ? std::get<PatternError>(inner_) : PatternError::InvalidRegexp;
    }

    RoutingError routing_error() const noexcept {
        return is_routing() ? std::get<RoutingError>(inner_) : RoutingError::NoRouteMatches;
    }

    std::error_code code() const noexcept;

    std::string_view message() const noexcept { return message_; }

    // Name of the route the failed operation targeted, empty for searches
    std::string_view route_name() const noexcept { return route_; }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return inner_ == other.inner_;
    }

    explicit operator bool() const noexcept {
        if (is_system()) return static_cast<bool>(std::get<std::error_code>(inner_));
        return true;
    }
};

} // namespace reroute
