#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "reroute/core/config.hpp"
#include "reroute/core/error.hpp"
#include "reroute/core/generation_graph.hpp"
#include "reroute/core/key_frequency.hpp"
#include "reroute/core/logging.hpp"
#include "reroute/core/params.hpp"
#include "reroute/core/request_context.hpp"
#include "reroute/core/route.hpp"
#include "reroute/util/expected.hpp"

namespace reroute {

// ============================================================================
// RouteSet - Route catalogue and URL generation
// ============================================================================

// Lifecycle: routes are added single-threaded, then rehash() publishes an
// immutable generation index (keys, graph, named routes). generate() and
// url() read a snapshot of that index and may run concurrently. Adding a
// route drops the index; generating again requires another rehash().
class RouteSet {
public:
  struct Generated {
    GeneratedParts parts;
    Params params; // Leftovers: neither consumed by the route nor defaults
  };

  struct Recognition {
    RouteHandle route;
    Params params;
  };

private:
  struct GenerationIndex {
    GenerationGraph graph;
    std::unordered_map<std::string, RouteHandle> named_routes;
  };

  RouteSetOptions options_;
  std::shared_ptr<Logger> logger_;

  std::vector<RouteHandle> routes_;
  std::unordered_map<std::string, RouteHandle> named_routes_;
  std::optional<KeyFrequencyAnalyzer> analyzer_;
  bool frozen_ = false;

  mutable std::shared_mutex index_mutex_;
  std::shared_ptr<const GenerationIndex> index_;

public:
  explicit RouteSet(RouteSetOptions options = {});

  RouteSet(const RouteSet &) = delete;
  RouteSet &operator=(const RouteSet &) = delete;

  // Compiles and registers a route. Fails on an empty path, on pattern
  // syntax errors, on a name already in use, and after freeze().
  expected<RouteHandle, Error> add_route(RouteDefinition definition);

  // Rebuilds generation keys and graph from every registered route
  void rehash();

  // rehash() if needed, drop the analyzer, reject further routes
  void freeze();

  bool built() const;
  bool frozen() const noexcept { return frozen_; }

  // Lower-level generation returning raw parts. `name` empty: search by
  // significant params. Throws std::logic_error before rehash().
  expected<Generated, Error> generate(std::span<const UrlPart> parts,
                                      std::string_view name, Params params,
                                      Params recall = {},
                                      GenerateOptions options = {}) const;

  // url(request, "people", {{"id", "1"}}) -> "/people/1"
  expected<std::string, Error> url(const RequestContext &request,
                                   std::string_view name,
                                   Params params = {}) const;

  // url(request, {{"controller", "people"}, {"id", "1"}}) -> "/people/1"
  expected<std::string, Error> url(const RequestContext &request,
                                   Params params) const;

  // First route whose path matcher accepts `path`
  std::optional<Recognition> recognize(std::string_view path) const;

  const std::vector<RouteHandle> &routes() const noexcept { return routes_; }
  RouteHandle named_route(std::string_view name) const;

  // Empty until rehash()
  std::vector<std::string> generation_keys() const;
  std::shared_ptr<const GenerationGraph> generation_graph() const;

private:
  std::shared_ptr<const GenerationIndex> snapshot() const;
  void expire();
  KeyFrequencyAnalyzer &analyzer();

  expected<std::string, Error> build_url(const RequestContext &request,
                                         std::string_view name,
                                         Params params) const;
};

} // namespace reroute
