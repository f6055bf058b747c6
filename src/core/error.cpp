#include "reroute/core/error.hpp"

#include <sstream>

namespace reroute {

// ============================================================================
// Error Categories
// ============================================================================

namespace {

class PatternErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "reroute.pattern";
    }

    std::string message(int ev) const override {
        switch (static_cast<PatternError>(ev)) {
            case PatternError::UnterminatedGroup: return "Unterminated optional group";
            case PatternError::UnbalancedGroup: return "Unbalanced closing parenthesis";
            case PatternError::UnknownToken: return "Unknown token";
            case PatternError::TrailingEscape: return "Trailing escape character";
            case PatternError::InvalidRegexp: return "Invalid regular expression";
            default: return "Unknown pattern error";
        }
    }
};

class RoutingErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "reroute.routing";
    }

    std::string message(int ev) const override {
        switch (static_cast<RoutingError>(ev)) {
            case RoutingError::NoRouteMatches: return "No route matches";
            case RoutingError::NamedRouteNotFound: return "Named route not found";
            case RoutingError::DuplicateRouteName: return "Duplicate route name";
            case RoutingError::RouteSetFrozen: return "Route set is frozen";
            case RoutingError::InvalidArguments: return "Invalid arguments";
            default: return "Unknown routing error";
        }
    }
};

const PatternErrorCategory pattern_category_instance{};
const RoutingErrorCategory routing_category_instance{};

} // anonymous namespace

const std::error_category& pattern_error_category() noexcept {
    return pattern_category_instance;
}

const std::error_category& routing_error_category() noexcept {
    return routing_category_instance;
}

std::error_code make_error_code(PatternError e) noexcept {
    return {static_cast<int>(e), pattern_error_category()};
}

std::error_code make_error_code(RoutingError e) noexcept {
    return {static_cast<int>(e), routing_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

std::error_code Error::code() const noexcept {
    if (is_pattern()) {
        return make_error_code(std::get<PatternError>(inner_));
    }
    if (is_routing()) {
        return make_error_code(std::get<RoutingError>(inner_));
    }
    return std::get<std::error_code>(inner_);
}

std::string Error::to_string() const {
    std::ostringstream oss;

    if (is_pattern()) {
        oss << "PatternError::" << pattern_error_category().message(static_cast<int>(pattern_error()));
    } else if (is_routing()) {
        oss << "RoutingError::" << routing_error_category().message(static_cast<int>(routing_error()));
    } else {
        auto ec = std::get<std::error_code>(inner_);
        oss << "SystemError::" << ec.category().name() << ":" << ec.value() << " " << ec.message();
    }

    if (!route_.empty()) {
        oss << " [" << route_ << "]";
    }

    if (!message_.empty()) {
        oss << " - " << message_;
    }

    return oss.str();
}

} // namespace reroute
