#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reroute/core/key_frequency.hpp"
#include "reroute/core/route.hpp"

namespace reroute {

// ============================================================================
// GenerationGraph
// ============================================================================

// Nested lookup over the generation keys. Level i branches on the value a
// route requires for keys[i]; routes without a known value sit on the
// wildcard edge and are copied under every concrete edge of that level, so a
// descent by concrete value never loses them. Leaves list candidate routes
// in registration order.
class GenerationGraph {
public:
  using Candidates = std::vector<RouteHandle>;
  using Values = std::vector<std::optional<std::string>>;

  struct Node {
    std::map<std::string, std::unique_ptr<Node>> edges;
    std::unique_ptr<Node> wildcard;
    Candidates routes; // Leaves only

    bool operator==(const Node &other) const;
  };

private:
  std::vector<std::string> keys_;
  std::unique_ptr<Node> root_;

public:
  GenerationGraph() = default;

  // `routes` must be the routes the analyzer observed, in the same order.
  // Routes without significant params are left out.
  static GenerationGraph build(std::vector<std::string> keys,
                               const KeyFrequencyAnalyzer &analyzer,
                               const std::vector<RouteHandle> &routes);

  // `values[i]` is the value for keys()[i]; nullopt (or a missing entry)
  // matches every edge of that level.
  Candidates lookup(const Values &values) const;

  const std::vector<std::string> &keys() const noexcept { return keys_; }

  // Number of distinct routes reachable from the root
  size_t size() const;

  bool operator==(const GenerationGraph &other) const;
};

} // namespace reroute
