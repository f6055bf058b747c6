#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "reroute/core/params.hpp"

namespace reroute {

// ============================================================================
// RequestContext - The fields URL generation reads from the current request
// ============================================================================

class RequestContext {
  std::string scheme_ = "http";
  std::string host_ = "localhost";
  uint16_t port_ = 80;
  std::string script_name_;
  std::string path_info_ = "/";
  std::string query_string_;

  // Path parameters recognized for this request, recalled when generating
  Params path_params_;

public:
  RequestContext() = default;

  std::string_view scheme() const noexcept { return scheme_; }
  std::string_view host() const noexcept { return host_; }
  uint16_t port() const noexcept { return port_; }
  std::string_view script_name() const noexcept { return script_name_; }
  std::string_view path_info() const noexcept { return path_info_; }
  std::string_view query_string() const noexcept { return query_string_; }
  const Params &path_params() const noexcept { return path_params_; }

  RequestContext &set_scheme(std::string s) { scheme_ = std::move(s); return *this; }
  RequestContext &set_host(std::string h) { host_ = std::move(h); return *this; }
  RequestContext &set_port(uint16_t p) { port_ = p; return *this; }
  RequestContext &set_script_name(std::string s) { script_name_ = std::move(s); return *this; }
  RequestContext &set_path_info(std::string p) { path_info_ = std::move(p); return *this; }
  RequestContext &set_query_string(std::string q) { query_string_ = std::move(q); return *this; }
  RequestContext &set_path_params(Params p) { path_params_ = std::move(p); return *this; }
};

// ============================================================================
// RequestProxy - Generated values layered over a RequestContext
// ============================================================================

class RequestProxy {
public:
  enum class Field { Scheme, Host, Port, ScriptName, PathInfo, QueryString };
  using Overrides = std::map<Field, std::string>;

private:
  const RequestContext &request_;
  Overrides overrides_;

  std::string_view get(Field field, std::string_view fallback) const {
    auto it = overrides_.find(field);
    return it != overrides_.end() ? std::string_view(it->second) : fallback;
  }

public:
  RequestProxy(const RequestContext &request, Overrides overrides)
      : request_(request), overrides_(std::move(overrides)) {}

  std::string_view scheme() const { return get(Field::Scheme, request_.scheme()); }
  std::string_view host() const { return get(Field::Host, request_.host()); }
  uint16_t port() const;
  std::string_view script_name() const { return get(Field::ScriptName, request_.script_name()); }
  std::string_view path_info() const { return get(Field::PathInfo, request_.path_info()); }
  std::string_view query_string() const { return get(Field::QueryString, request_.query_string()); }
};

// script_name + path_info [+ "?" + query_string]
std::string reconstruct_path(const RequestProxy &req);

// scheme://host[:port] + script_name + path_info [+ "?" + query_string]
// The port is left out when it is the scheme's default (80 http, 443 https).
std::string reconstruct_url(const RequestProxy &req);

} // namespace reroute
