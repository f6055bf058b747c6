#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "reroute/core/error.hpp"
#include "reroute/core/named_captures.hpp"
#include "reroute/core/params.hpp"
#include "reroute/util/expected.hpp"

namespace re2 {
class RE2;
}

namespace reroute {

// Parameter name -> constraint regex source
using Requirements = std::map<std::string, std::string>;

// Capture used for ":name" segments without a requirement
inline constexpr std::string_view DEFAULT_SEGMENT_REGEXP = "[^/.?]+";

// Capture used for "*name" segments without a requirement
inline constexpr std::string_view DEFAULT_GLOB_REGEXP = ".*";

// ============================================================================
// Segment - One node of a parsed route definition
// ============================================================================

struct Segment {
  enum class Kind { Literal, Dynamic, Glob, Optional };

  Kind kind = Kind::Literal;
  std::string text; // Literal text, or parameter name for Dynamic/Glob
  std::string requirement;
  std::shared_ptr<const re2::RE2> matcher; // Full-match check on values
  std::vector<Segment> children;           // Optional only

  bool is_param() const noexcept {
    return kind == Kind::Dynamic || kind == Kind::Glob;
  }

  // Does `value` satisfy this parameter's requirement in full?
  bool accepts(std::string_view value) const;
};

// ============================================================================
// SegmentPattern - Compiled route definition string
// ============================================================================

// Grammar, left to right:
//   literal text     matched verbatim ('.' escaped, '/' plain)
//   \c               literal c
//   :name            capture of the requirement for name, or [^/.?]+
//   *name            capture of the requirement for name, or .*
//   ( ... )          optional group, nests arbitrarily
//
// "/people/:id(.:format)" compiles to ^/people/([^/.?]+)(\.([^/.?]+))?$ with
// names [id, -, format].
class SegmentPattern {
  std::string definition_;
  std::shared_ptr<const NamedCaptureIndex> regexp_;
  std::vector<Segment> segments_;

  SegmentPattern() = default;

public:
  static expected<SegmentPattern, Error>
  compile(std::string_view definition, const Requirements &requirements = {});

  const std::string &definition() const noexcept { return definition_; }
  const NamedCaptureIndex &regexp() const noexcept { return *regexp_; }
  const std::vector<Segment> &segments() const noexcept { return segments_; }

  // Every parameter name, including those inside optional groups
  std::vector<std::string> segment_names() const;

  // Parameter names outside optional groups
  std::vector<std::string> required_names() const;

  // Fills in the pattern from `params`, then `merged` (recall overlaid with
  // params), then `defaults`. Returns nullopt when a required parameter is
  // missing or a value fails its requirement. Consumed parameters are
  // removed from `params`.
  std::optional<std::string> generate(Params &params, const Params &merged,
                                      const Params &defaults,
                                      const Parameterize &parameterize) const;

  std::optional<std::map<std::string, std::string>>
  match(std::string_view path) const {
    return regexp_->match(path);
  }
};

// Strips ^ / \A and $ / \z / \Z anchors from a requirement regex
std::string strip_anchors(std::string_view requirement);

// True when the requirement matches exactly one literal string
bool is_literal_requirement(std::string_view requirement);

} // namespace reroute
