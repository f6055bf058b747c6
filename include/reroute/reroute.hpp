#pragma once

// Main include file for reroute

// Utilities
#include "reroute/util/expected.hpp"

// Core
#include "reroute/core/config.hpp"
#include "reroute/core/error.hpp"
#include "reroute/core/generation_graph.hpp"
#include "reroute/core/key_frequency.hpp"
#include "reroute/core/logging.hpp"
#include "reroute/core/named_captures.hpp"
#include "reroute/core/params.hpp"
#include "reroute/core/request_context.hpp"
#include "reroute/core/route.hpp"
#include "reroute/core/route_set.hpp"
#include "reroute/core/segment_pattern.hpp"
#include "reroute/core/static_segments.hpp"
#include "reroute/core/uri.hpp"
