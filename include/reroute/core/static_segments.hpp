#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "reroute/core/named_captures.hpp"

namespace reroute {

// Leading literal path segments every match of `source` must contain, split
// on '/' and escaped '.'. Stops at the first segment holding a group,
// alternation, class, quantifier or wildcard.
//
//   ^/people/show/1$             -> [people, show, 1]
//   ^/foo/(bar|baz)/([a-z0-9]+)  -> [foo]
//   ^/foo\.([a-z]+)$             -> [foo]
//   /(?P<controller>[a-z]+)      -> []
std::vector<std::string> extract_static_segments(std::string_view source);

std::vector<std::string> extract_static_segments(const NamedCaptureIndex &regexp);

} // namespace reroute
