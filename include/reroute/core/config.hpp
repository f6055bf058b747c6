#pragma once

#include <memory>

#include "reroute/core/logging.hpp"
#include "reroute/core/params.hpp"

namespace reroute {

// ============================================================================
// RouteSetOptions
// ============================================================================

struct RouteSetOptions {
    // Level for the route set's own logger (ignored when `logger` is given)
    LogLevel log_level = LogLevel::Warn;
    std::shared_ptr<Logger> logger;

    // Drop the key analyzer once the generation graph is built
    bool flush_analyzer = true;

    // url() returns script_name + path unless params carry only_path=false
    bool default_only_path = true;

    // Value escaping for generated paths (default: uri::escape_uri)
    Parameterize parameterize;

    // Query string builder for leftover params (default: uri::build_nested_query)
    QueryBuilder build_query;

    // REROUTE_LOG_LEVEL, REROUTE_FLUSH_ANALYZER, REROUTE_ONLY_PATH
    static RouteSetOptions from_env();
};

} // namespace reroute
