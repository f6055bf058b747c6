#include "reroute/core/static_segments.hpp"

#include <cctype>

namespace reroute {

namespace {

std::string_view strip_source_anchors(std::string_view source) {
  if (source.starts_with("\\A")) {
    source.remove_prefix(2);
  } else if (source.starts_with("^")) {
    source.remove_prefix(1);
  }
  if (source.ends_with("\\z") || source.ends_with("\\Z")) {
    source.remove_suffix(2);
  } else if (source.ends_with("$") && !source.ends_with("\\$")) {
    source.remove_suffix(1);
  }
  return source;
}

// Does the group opening at `pos` start with a separator? Then the segment
// before it is complete even though the rest of the path is dynamic.
bool group_starts_with_separator(std::string_view source, size_t pos) {
  std::string_view inner = source.substr(pos + 1);
  if (inner.starts_with("?:")) {
    inner.remove_prefix(2);
  }
  return inner.starts_with("/") || inner.starts_with("\\.") ||
         inner.starts_with("\\/");
}

} // anonymous namespace

std::vector<std::string> extract_static_segments(std::string_view source) {
  source = strip_source_anchors(source);

  std::vector<std::string> segments;
  std::string current;

  auto finish = [&segments, &current]() {
    if (!current.empty()) {
      segments.push_back(std::move(current));
      current.clear();
    }
  };

  for (size_t i = 0; i < source.size(); ++i) {
    char c = source[i];

    switch (c) {
    case '/':
      finish();
      break;

    case '\\': {
      if (i + 1 >= source.size()) {
        return segments;
      }
      char next = source[++i];
      if (next == '.' || next == '/') {
        finish();
      } else if (std::isalnum(static_cast<unsigned char>(next))) {
        // Class escapes (\d, \w, ...) and anchors (\b, \z) are dynamic
        return segments;
      } else {
        current += next;
      }
      break;
    }

    case '(':
      if (group_starts_with_separator(source, i)) {
        finish();
      }
      return segments;

    case ')': case '[': case ']': case '{': case '}': case '|':
    case '?': case '*': case '+': case '.': case '^': case '$':
      return segments;

    default:
      current += c;
      break;
    }
  }

  finish();
  return segments;
}

std::vector<std::string> extract_static_segments(const NamedCaptureIndex &regexp) {
  return extract_static_segments(regexp.source());
}

} // namespace reroute
