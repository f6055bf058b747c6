#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "reroute/core/error.hpp"
#include "reroute/util/expected.hpp"

namespace re2 {
class RE2;
}

namespace reroute {

// ============================================================================
// Capture Name Declarations
// ============================================================================

// Flat list: entry i names capture i + 1, nullopt for anonymous captures
using CaptureNames = std::vector<std::optional<std::string>>;

// Logical name -> 1-based capture positions, ascending
using NamedCaptures = std::map<std::string, std::vector<int>>;

// Name -> 1-based capture position
using CapturePositions = std::map<std::string, int>;

using NamesDeclaration = std::variant<std::monostate, CaptureNames, CapturePositions>;

// ============================================================================
// Source Normalization
// ============================================================================

struct NormalizedSource {
  std::string normalized;
  int captures = 0;                        // capturing groups after rewriting
  std::map<int, std::string> marker_names; // position -> "(?:<name>" marker
};

// Rewrites "(?:<name>...)" markers into plain capturing groups and
// "(?<name>...)" into the "(?P<name>...)" spelling RE2 accepts. With
// plain_groups, native named groups also become plain captures, so the
// text can be embedded next to other groups without clashing names.
NormalizedSource normalize_capture_syntax(std::string_view source,
                                          bool plain_groups = false);

// ============================================================================
// NamedCaptureIndex
// ============================================================================

// A compiled regular expression plus the canonical mapping from logical
// parameter names to capture positions.
//
// Names come from the declaration when one is given. Otherwise they are read
// from inline markers "(?:<name>...)", which are rewritten into plain
// capturing groups, and from native named groups "(?<name>...)" or
// "(?P<name>...)", whose positions are read back from RE2.
//
// A name may own several positions when it is declared in alternative
// branches; match() reports the first non-empty position that participated.
class NamedCaptureIndex {
  std::string source_;
  std::shared_ptr<const re2::RE2> regexp_;
  CaptureNames names_;
  NamedCaptures named_captures_;

  NamedCaptureIndex() = default;

public:
  static expected<NamedCaptureIndex, Error> create(std::string_view source,
                                                   NamesDeclaration names = {});

  // Source handed to RE2, after marker and native group normalization
  const std::string &source() const noexcept { return source_; }

  const re2::RE2 &to_regexp() const noexcept { return *regexp_; }

  const CaptureNames &names() const noexcept { return names_; }

  const NamedCaptures &named_captures() const noexcept {
    return named_captures_;
  }

  int capture_count() const noexcept;

  // Unanchored search; anchors in the source decide how much must match.
  // Returns name -> captured text for every name that participated.
  std::optional<std::map<std::string, std::string>>
  match(std::string_view input) const;
};

} // namespace reroute
