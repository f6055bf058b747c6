#include "reroute/core/route_set.hpp"

#include <mutex>
#include <stdexcept>

#include "reroute/core/uri.hpp"

namespace reroute {

namespace {

constexpr UrlPart kUrlParts[] = {UrlPart::Host, UrlPart::PathInfo};

std::string escape_value(std::string_view, std::string_view value) {
  return uri::escape_uri(value);
}

} // anonymous namespace

RouteSet::RouteSet(RouteSetOptions options)
    : options_(std::move(options)), logger_(options_.logger) {
  if (!logger_) {
    logger_ = std::make_shared<Logger>("reroute", options_.log_level);
    logger_->add_sink(console_sink());
  }
}

// ============================================================================
// Registration
// ============================================================================

expected<RouteHandle, Error> RouteSet::add_route(RouteDefinition definition) {
  if (frozen_) {
    return unexpected(Error::routing(RoutingError::RouteSetFrozen,
                                     "cannot add " + definition.path,
                                     definition.name));
  }

  if (definition.path.empty()) {
    return unexpected(Error::routing(RoutingError::InvalidArguments,
                                     "route path is empty", definition.name));
  }

  if (!definition.name.empty() && named_routes_.count(definition.name)) {
    return unexpected(Error::routing(RoutingError::DuplicateRouteName,
                                     "route name already in use",
                                     definition.name));
  }

  auto route = Route::compile(std::move(definition), routes_.size());
  if (!route) {
    return unexpected(route.error());
  }

  expire();

  const RouteHandle &handle = *route;
  analyzer().observe(*handle);
  routes_.push_back(handle);
  if (!handle->name().empty()) {
    named_routes_.emplace(handle->name(), handle);
  }

  if (logger_->is_enabled(LogLevel::Debug)) {
    auto entry = logger_->entry(LogLevel::Debug, "route added");
    entry.field("path", handle->path().definition())
        .field("name", handle->name())
        .field("index", handle->index());
    logger_->log(entry);
  }

  return handle;
}

void RouteSet::expire() {
  std::unique_lock lock(index_mutex_);
  index_.reset();
}

KeyFrequencyAnalyzer &RouteSet::analyzer() {
  if (!analyzer_) {
    analyzer_.emplace();
    for (const auto &route : routes_) {
      analyzer_->observe(*route);
    }
  }
  return *analyzer_;
}

// ============================================================================
// Generation index
// ============================================================================

void RouteSet::rehash() {
  std::vector<std::string> keys = analyzer().report();

  auto index = std::make_shared<GenerationIndex>();
  index->graph = GenerationGraph::build(keys, analyzer(), routes_);
  index->named_routes = named_routes_;

  {
    std::unique_lock lock(index_mutex_);
    index_ = std::move(index);
  }

  if (options_.flush_analyzer) {
    analyzer_.reset();
  }

  if (logger_->is_enabled(LogLevel::Info)) {
    std::string joined;
    for (const auto &key : keys) {
      if (!joined.empty()) joined += ",";
      joined += key;
    }
    auto entry = logger_->entry(LogLevel::Info, "generation index built");
    entry.field("routes", routes_.size()).field("keys", joined);
    logger_->log(entry);
  }
}

void RouteSet::freeze() {
  if (!built()) {
    rehash();
  }
  analyzer_.reset();
  frozen_ = true;
}

bool RouteSet::built() const { return snapshot() != nullptr; }

std::shared_ptr<const RouteSet::GenerationIndex> RouteSet::snapshot() const {
  std::shared_lock lock(index_mutex_);
  return index_;
}

std::vector<std::string> RouteSet::generation_keys() const {
  auto index = snapshot();
  return index ? index->graph.keys() : std::vector<std::string>{};
}

std::shared_ptr<const GenerationGraph> RouteSet::generation_graph() const {
  auto index = snapshot();
  if (!index) {
    return nullptr;
  }
  return std::shared_ptr<const GenerationGraph>(index, &index->graph);
}

RouteHandle RouteSet::named_route(std::string_view name) const {
  auto it = named_routes_.find(std::string(name));
  return it != named_routes_.end() ? it->second : nullptr;
}

// ============================================================================
// Generation
// ============================================================================

expected<RouteSet::Generated, Error>
RouteSet::generate(std::span<const UrlPart> parts, std::string_view name,
                   Params params, Params recall,
                   GenerateOptions options) const {
  auto index = snapshot();
  if (!index) {
    throw std::logic_error("route set not finalized: call rehash() first");
  }

  if (!name.empty()) {
    auto it = index->named_routes.find(std::string(name));
    if (it == index->named_routes.end()) {
      return unexpected(Error::routing(
          RoutingError::NamedRouteNotFound,
          std::string(name) + " failed to generate from " + inspect(params),
          std::string(name)));
    }

    const RouteHandle &route = it->second;
    const std::string requested = inspect(params);
    Params route_recall = merge_params(route->defaults(), recall);
    if (auto generated = route->generate(parts, params, route_recall, options)) {
      return Generated{std::move(*generated), std::move(params)};
    }

    logger_->debug("named route " + route->name() + " rejected " + requested);
    return unexpected(Error::routing(RoutingError::NoRouteMatches,
                                     "No route matches " + requested,
                                     route->name()));
  }

  const Params merged = merge_params(recall, params);

  GenerationGraph::Values values;
  values.reserve(index->graph.keys().size());
  for (const auto &key : index->graph.keys()) {
    auto it = merged.find(key);
    if (it != merged.end() && it->second.truthy()) {
      values.push_back(it->second.to_param());
    } else {
      values.emplace_back(std::nullopt);
    }
  }

  for (const auto &candidate : index->graph.lookup(values)) {
    if (!candidate->significant_params()) {
      continue;
    }
    Params attempt = params;
    if (auto generated = candidate->generate(parts, attempt, recall, options)) {
      return Generated{std::move(*generated), std::move(attempt)};
    }
  }

  logger_->debug("no route matches " + inspect(params));
  return unexpected(Error::routing(RoutingError::NoRouteMatches,
                                   "No route matches " + inspect(params)));
}

expected<std::string, Error> RouteSet::url(const RequestContext &request,
                                           std::string_view name,
                                           Params params) const {
  return build_url(request, name, std::move(params));
}

expected<std::string, Error> RouteSet::url(const RequestContext &request,
                                           Params params) const {
  return build_url(request, {}, std::move(params));
}

expected<std::string, Error> RouteSet::build_url(const RequestContext &request,
                                                 std::string_view name,
                                                 Params params) const {
  bool only_path = options_.default_only_path;
  if (auto it = params.find("only_path"); it != params.end()) {
    only_path = it->second.truthy();
    params.erase(it);
  }

  GenerateOptions options;
  options.parameterize =
      options_.parameterize ? options_.parameterize : Parameterize(escape_value);

  auto result = generate(kUrlParts, name, std::move(params),
                         request.path_params(), std::move(options));
  if (!result) {
    return unexpected(result.error());
  }

  Params leftovers;
  for (auto &[key, value] : result->params) {
    if (value.truthy()) {
      leftovers.emplace(key, std::move(value));
    }
  }

  RequestProxy::Overrides overrides;
  const GeneratedParts &parts = result->parts;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (!parts[i]) {
      continue;
    }
    auto field = kUrlParts[i] == UrlPart::Host ? RequestProxy::Field::Host
                                               : RequestProxy::Field::PathInfo;
    overrides.emplace(field, *parts[i]);
  }
  overrides.emplace(RequestProxy::Field::QueryString,
                    options_.build_query ? options_.build_query(leftovers)
                                         : uri::build_nested_query(leftovers));

  RequestProxy proxy(request, std::move(overrides));
  return only_path ? reconstruct_path(proxy) : reconstruct_url(proxy);
}

// ============================================================================
// Recognition
// ============================================================================

std::optional<RouteSet::Recognition>
RouteSet::recognize(std::string_view path) const {
  for (const auto &route : routes_) {
    if (auto params = route->recognize(path)) {
      return Recognition{route, std::move(*params)};
    }
  }
  return std::nullopt;
}

} // namespace reroute
