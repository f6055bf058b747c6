#include "reroute/core/request_context.hpp"

#include <charconv>

namespace reroute {

uint16_t RequestProxy::port() const {
  auto it = overrides_.find(Field::Port);
  if (it == overrides_.end()) {
    return request_.port();
  }

  uint16_t value = 0;
  const std::string &text = it->second;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return request_.port();
  }
  return value;
}

namespace {

bool default_port(std::string_view scheme, uint16_t port) {
  return (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
}

} // anonymous namespace

std::string reconstruct_path(const RequestProxy &req) {
  std::string url;
  url += req.script_name();
  url += req.path_info();
  if (!req.query_string().empty()) {
    url += '?';
    url += req.query_string();
  }
  return url;
}

std::string reconstruct_url(const RequestProxy &req) {
  std::string url;
  url += req.scheme();
  url += "://";
  url += req.host();

  if (!default_port(req.scheme(), req.port())) {
    url += ':';
    url += std::to_string(req.port());
  }

  url += reconstruct_path(req);
  return url;
}

} // namespace reroute
