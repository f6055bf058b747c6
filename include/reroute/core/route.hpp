#pragma once

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "reroute/core/error.hpp"
#include "reroute/core/params.hpp"
#include "reroute/core/segment_pattern.hpp"
#include "reroute/util/expected.hpp"

namespace reroute {

// ============================================================================
// URL Parts
// ============================================================================

// Request fields a route can generate
enum class UrlPart { Host, PathInfo };

std::string_view url_part_name(UrlPart part) noexcept;

// One entry per requested part; nullopt when the route has no condition on it
using GeneratedParts = std::vector<std::optional<std::string>>;

struct GenerateOptions {
  Parameterize parameterize; // Empty: values are substituted as-is
};

// ============================================================================
// RouteDefinition - What a caller registers
// ============================================================================

struct RouteDefinition {
  std::string path;                // "/people/:id(.:format)"
  std::optional<std::string> host; // ":subdomain.example.com"
  std::string name;                // Empty for unnamed routes
  Params defaults;
  Requirements requirements;
};

// ============================================================================
// Route - Compiled, immutable
// ============================================================================

enum class RouteShape {
  Static, // No parameters and no constant defaults; reachable by name only
  Dynamic
};

class Route;
using RouteHandle = std::shared_ptr<const Route>;

class Route {
  std::string name_;
  size_t index_ = 0;
  SegmentPattern path_;
  std::optional<SegmentPattern> host_;
  Params defaults_;
  Requirements requirements_;

  std::vector<std::string> required_params_;
  std::vector<std::pair<std::string, std::string>> required_defaults_;
  std::map<std::string, std::string> generation_keys_;

  Route(SegmentPattern path, std::optional<SegmentPattern> host)
      : path_(std::move(path)), host_(std::move(host)) {}

public:
  // `index` is the registration position, used as the candidate tie-break
  static expected<RouteHandle, Error> compile(RouteDefinition definition,
                                              size_t index);

  const std::string &name() const noexcept { return name_; }
  size_t index() const noexcept { return index_; }
  const SegmentPattern &path() const noexcept { return path_; }
  const SegmentPattern *host() const noexcept {
    return host_ ? &*host_ : nullptr;
  }
  const Params &defaults() const noexcept { return defaults_; }
  const Requirements &requirements() const noexcept { return requirements_; }

  RouteShape shape() const noexcept {
    return significant_params() ? RouteShape::Dynamic : RouteShape::Static;
  }

  // Parameters outside optional groups that have no default
  const std::vector<std::string> &required_params() const noexcept {
    return required_params_;
  }

  // Defaults that are not path/host segments; a request must carry exactly
  // these values for the route to generate (controller=people, ...)
  const std::vector<std::pair<std::string, std::string>> &
  required_defaults() const noexcept {
    return required_defaults_;
  }

  bool significant_params() const noexcept {
    return !required_params_.empty() || !required_defaults_.empty();
  }

  // Key -> value this route is statically known to require
  const std::map<std::string, std::string> &generation_keys() const noexcept {
    return generation_keys_;
  }

  std::vector<std::string> static_segments() const;

  // Generates the requested parts. Consumed params, and params equal to the
  // route's defaults, are removed from `params` on success.
  std::optional<GeneratedParts> generate(std::span<const UrlPart> parts,
                                         Params &params, const Params &recall,
                                         const GenerateOptions &options) const;

  // Matches a path; captures are overlaid on the route's defaults
  std::optional<Params> recognize(std::string_view path) const;
};

} // namespace reroute
