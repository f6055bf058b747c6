#pragma once

#include <string>
#include <string_view>

#include "reroute/core/params.hpp"

namespace reroute::uri {

// ============================================================================
// Escaping
// ============================================================================

// Percent-encodes everything outside the RFC 2396 path-safe set. '/' is left
// alone so glob values keep their structure.
std::string escape_uri(std::string_view value);

// Form component encoding for query keys and values (space becomes '+')
std::string escape(std::string_view value);

// ============================================================================
// Query Strings
// ============================================================================

// Rack-style nested query: {"a": ["1", "2"], "b": {"c": "d"}} becomes
// "a[]=1&a[]=2&b[c]=d". Keys are emitted in map order.
std::string build_nested_query(const Params& params);

} // namespace reroute::uri
