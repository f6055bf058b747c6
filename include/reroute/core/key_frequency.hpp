#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "reroute/core/route.hpp"

namespace reroute {

// ============================================================================
// KeyFrequencyAnalyzer
// ============================================================================

// Watches routes as they register and decides which parameter keys best
// split the catalogue for generation lookups.
//
// report() keeps the keys constrained by at least the mean number of routes
// and orders them by route count, then by number of distinct values, then by
// first registration. The order is deterministic for a given catalogue.
class KeyFrequencyAnalyzer {
public:
  // Key -> value one route is statically known to require
  using PossibleKeys = std::map<std::string, std::string>;

private:
  std::vector<PossibleKeys> possible_keys_;
  std::vector<bool> significant_;
  std::vector<std::string> first_seen_;
  mutable std::optional<std::vector<std::string>> report_;

public:
  void observe(const Route &route);

  // One table per observed route, in observation order
  const std::vector<PossibleKeys> &possible_keys() const noexcept {
    return possible_keys_;
  }

  bool significant(size_t route) const {
    return route < significant_.size() && significant_[route];
  }

  size_t size() const noexcept { return possible_keys_.size(); }

  const std::vector<std::string> &report() const;

  // Forget every observation; routes re-register from scratch
  void expire();
};

} // namespace reroute
