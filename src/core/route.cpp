#include "reroute/core/route.hpp"

#include <algorithm>

#include "reroute/core/static_segments.hpp"

namespace reroute {

std::string_view url_part_name(UrlPart part) noexcept {
  switch (part) {
  case UrlPart::Host:
    return "host";
  case UrlPart::PathInfo:
    return "path_info";
  default:
    return "unknown";
  }
}

// ============================================================================
// Route Compilation
// ============================================================================

expected<RouteHandle, Error> Route::compile(RouteDefinition definition,
                                            size_t index) {
  auto path = SegmentPattern::compile(definition.path, definition.requirements);
  if (!path) {
    return unexpected(path.error());
  }

  std::optional<SegmentPattern> host;
  if (definition.host) {
    auto compiled = SegmentPattern::compile(*definition.host, definition.requirements);
    if (!compiled) {
      return unexpected(compiled.error());
    }
    host = std::move(*compiled);
  }

  auto route = std::shared_ptr<Route>(new Route(std::move(*path), std::move(host)));
  route->name_ = std::move(definition.name);
  route->index_ = index;
  route->defaults_ = std::move(definition.defaults);
  route->requirements_ = std::move(definition.requirements);

  std::vector<std::string> segment_names = route->path_.segment_names();
  std::vector<std::string> required = route->path_.required_names();
  if (route->host_) {
    auto host_names = route->host_->segment_names();
    segment_names.insert(segment_names.end(), host_names.begin(), host_names.end());
    auto host_required = route->host_->required_names();
    required.insert(required.end(), host_required.begin(), host_required.end());
  }

  for (const auto &name : required) {
    bool seen = std::find(route->required_params_.begin(),
                          route->required_params_.end(),
                          name) != route->required_params_.end();
    if (!seen && route->defaults_.count(name) == 0) {
      route->required_params_.push_back(name);
    }
  }

  for (const auto &[key, value] : route->defaults_) {
    bool is_segment = std::find(segment_names.begin(), segment_names.end(),
                                key) != segment_names.end();
    auto text = value.to_param();
    if (!is_segment && text) {
      route->required_defaults_.emplace_back(key, *text);
      route->generation_keys_[key] = *text;
    }
  }

  for (const auto &name : segment_names) {
    auto it = route->requirements_.find(name);
    if (it != route->requirements_.end() && is_literal_requirement(it->second)) {
      route->generation_keys_[name] = strip_anchors(it->second);
    }
  }

  return RouteHandle(std::move(route));
}

std::vector<std::string> Route::static_segments() const {
  return extract_static_segments(path_.regexp());
}

// ============================================================================
// Generation
// ============================================================================

std::optional<GeneratedParts>
Route::generate(std::span<const UrlPart> parts, Params &params,
                const Params &recall, const GenerateOptions &options) const {
  const Params merged = merge_params(recall, params);

  for (const auto &[key, value] : required_defaults_) {
    auto it = merged.find(key);
    if (it == merged.end() || it->second.to_param() != value) {
      return std::nullopt;
    }
  }

  GeneratedParts generated;
  generated.reserve(parts.size());
  bool any = false;

  for (UrlPart part : parts) {
    const SegmentPattern *condition = part == UrlPart::Host ? host() : &path_;
    if (condition == nullptr) {
      generated.emplace_back(std::nullopt);
      continue;
    }

    auto text = condition->generate(params, merged, defaults_, options.parameterize);
    if (!text) {
      return std::nullopt;
    }
    generated.emplace_back(std::move(*text));
    any = true;
  }

  if (!any) {
    return std::nullopt;
  }

  for (const auto &[key, value] : defaults_) {
    auto it = params.find(key);
    if (it != params.end() && it->second.to_param() == value.to_param()) {
      params.erase(it);
    }
  }

  return generated;
}

std::optional<Params> Route::recognize(std::string_view path) const {
  auto captures = path_.match(path);
  if (!captures) {
    return std::nullopt;
  }

  Params params = defaults_;
  for (auto &[name, value] : *captures) {
    params.insert_or_assign(name, ParamValue(std::move(value)));
  }
  return params;
}

} // namespace reroute
