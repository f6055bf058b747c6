#include "reroute/core/config.hpp"

#include <cstdlib>
#include <string>

namespace reroute {

namespace {

bool parse_flag(const char* value, bool fallback) {
    std::string text(value);
    if (text == "1" || text == "true" || text == "yes") return true;
    if (text == "0" || text == "false" || text == "no") return false;
    return fallback;
}

} // anonymous namespace

RouteSetOptions RouteSetOptions::from_env() {
    RouteSetOptions options;

    if (const char* level = std::getenv("REROUTE_LOG_LEVEL")) {
        options.log_level = parse_log_level(level);
    }
    if (const char* flush = std::getenv("REROUTE_FLUSH_ANALYZER")) {
        options.flush_analyzer = parse_flag(flush, options.flush_analyzer);
    }
    if (const char* only_path = std::getenv("REROUTE_ONLY_PATH")) {
        options.default_only_path = parse_flag(only_path, options.default_only_path);
    }

    return options;
}

} // namespace reroute
