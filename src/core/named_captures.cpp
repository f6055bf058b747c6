#include "reroute/core/named_captures.hpp"

#include <algorithm>

#include <re2/re2.h>

namespace reroute {

// ============================================================================
// Source Normalization
// ============================================================================

namespace {


bool is_name_char(char c, bool first) {
  if (c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))
    return true;
  return !first && c >= '0' && c <= '9';
}

// Reads "<identifier>" starting at `pos` (just after the '<'). Returns the
// position of the closing '>' or npos when the text is not a group name.
size_t read_group_name(std::string_view src, size_t pos) {
  size_t end = pos;
  while (end < src.size() && is_name_char(src[end], end == pos)) {
    ++end;
  }
  if (end == pos || end >= src.size() || src[end] != '>') {
    return std::string_view::npos;
  }
  return end;
}

} // anonymous namespace

NormalizedSource normalize_capture_syntax(std::string_view src,
                                          bool plain_groups) {
  NormalizedSource out;
  out.normalized.reserve(src.size());

  size_t i = 0;
  while (i < src.size()) {
    char c = src[i];

    if (c == '\\') {
      out.normalized += src.substr(i, 2);
      i += 2;
      continue;
    }

    if (c == '[') {
      // Character classes may hold '(' and ')' that are not groups
      size_t start = i++;
      if (i < src.size() && src[i] == '^')
        ++i;
      if (i < src.size() && src[i] == ']')
        ++i;
      while (i < src.size() && src[i] != ']') {
        i += (src[i] == '\\') ? 2 : 1;
      }
      i = std::min(i + 1, src.size());
      out.normalized += src.substr(start, i - start);
      continue;
    }

    if (c != '(') {
      out.normalized += c;
      ++i;
      continue;
    }

    if (i + 1 >= src.size() || src[i + 1] != '?') {
      ++out.captures;
      out.normalized += '(';
      ++i;
      continue;
    }

    std::string_view rest = src.substr(i);
    if (rest.starts_with("(?:<")) {
      size_t end = read_group_name(src, i + 4);
      if (end != std::string_view::npos) {
        ++out.captures;
        out.marker_names[out.captures] =
            std::string(src.substr(i + 4, end - i - 4));
        out.normalized += '(';
        i = end + 1;
        continue;
      }
    } else if (rest.starts_with("(?P<") || rest.starts_with("(?<")) {
      size_t name_start = i + (rest[2] == 'P' ? 4 : 3);
      size_t end = read_group_name(src, name_start);
      if (end != std::string_view::npos) {
        ++out.captures;
        if (plain_groups) {
          out.normalized += '(';
          i = end + 1;
          continue;
        }
        // RE2 releases before 2023 only understand the (?P<name>) spelling
        out.normalized += "(?P<";
        out.normalized += src.substr(name_start, end - name_start);
        out.normalized += '>';
        i = end + 1;
        continue;
      }
    }

    out.normalized += "(?";
    i += 2;
  }

  return out;
}

// ============================================================================
// NamedCaptureIndex Implementation
// ============================================================================

expected<NamedCaptureIndex, Error>
NamedCaptureIndex::create(std::string_view source, NamesDeclaration names) {
  NormalizedSource scanned = normalize_capture_syntax(source);

  re2::RE2::Options options;
  options.set_log_errors(false);
  auto regexp = std::make_shared<const re2::RE2>(scanned.normalized, options);
  if (!regexp->ok()) {
    return unexpected(Error::pattern(
        PatternError::InvalidRegexp,
        regexp->error() + " in /" + scanned.normalized + "/"));
  }

  NamedCaptureIndex index;
  index.source_ = std::move(scanned.normalized);
  index.regexp_ = std::move(regexp);

  if (auto *list = std::get_if<CaptureNames>(&names)) {
    index.names_ = *list;
  } else if (auto *positions = std::get_if<CapturePositions>(&names)) {
    for (const auto &[name, position] : *positions) {
      if (position < 1) {
        return unexpected(Error::pattern(
            PatternError::InvalidRegexp,
            "capture position for '" + name + "' must be 1-based"));
      }
      if (index.names_.size() < static_cast<size_t>(position)) {
        index.names_.resize(position);
      }
      index.names_[position - 1] = name;
    }
  } else {
    const auto &engine_names = index.regexp_->CapturingGroupNames();
    if (!engine_names.empty() || !scanned.marker_names.empty()) {
      index.names_.resize(index.regexp_->NumberOfCapturingGroups());
      for (const auto &[position, name] : scanned.marker_names) {
        index.names_[position - 1] = name;
      }
      for (const auto &[position, name] : engine_names) {
        index.names_[position - 1] = name;
      }
      while (!index.names_.empty() && !index.names_.back()) {
        index.names_.pop_back();
      }
    }
  }

  for (size_t i = 0; i < index.names_.size(); ++i) {
    if (index.names_[i]) {
      index.named_captures_[*index.names_[i]].push_back(static_cast<int>(i) + 1);
    }
  }

  return index;
}

int NamedCaptureIndex::capture_count() const noexcept {
  return regexp_->NumberOfCapturingGroups();
}

std::optional<std::map<std::string, std::string>>
NamedCaptureIndex::match(std::string_view input) const {
  int count = regexp_->NumberOfCapturingGroups();
  std::vector<re2::StringPiece> groups(count + 1);

  re2::StringPiece text(input.data(), input.size());
  if (!regexp_->Match(text, 0, text.size(), re2::RE2::UNANCHORED,
                      groups.data(), count + 1)) {
    return std::nullopt;
  }

  std::map<std::string, std::string> captures;
  for (const auto &[name, positions] : named_captures_) {
    const re2::StringPiece *chosen = nullptr;
    for (int position : positions) {
      if (position > count || groups[position].data() == nullptr) {
        continue;
      }
      if (chosen == nullptr || chosen->empty()) {
        chosen = &groups[position];
      }
      if (!chosen->empty()) {
        break;
      }
    }
    if (chosen != nullptr) {
      captures[name] = std::string(chosen->data(), chosen->size());
    }
  }
  return captures;
}

} // namespace reroute
