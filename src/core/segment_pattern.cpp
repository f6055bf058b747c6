#include "reroute/core/segment_pattern.hpp"

#include <algorithm>
#include <cctype>

#include <re2/re2.h>

namespace reroute {

// ============================================================================
// Requirement Helpers
// ============================================================================

std::string strip_anchors(std::string_view requirement) {
  if (requirement.starts_with("\\A")) {
    requirement.remove_prefix(2);
  } else if (requirement.starts_with("^")) {
    requirement.remove_prefix(1);
  }

  auto escaped_at = [&](size_t pos) {
    size_t backslashes = 0;
    while (pos > backslashes && requirement[pos - backslashes - 1] == '\\') {
      ++backslashes;
    }
    return backslashes % 2 == 1;
  };

  if (requirement.ends_with("\\z") || requirement.ends_with("\\Z")) {
    if (!escaped_at(requirement.size() - 2))
      requirement.remove_suffix(2);
  } else if (requirement.ends_with("$") && !escaped_at(requirement.size() - 1)) {
    requirement.remove_suffix(1);
  }
  return std::string(requirement);
}

bool is_literal_requirement(std::string_view requirement) {
  std::string stripped = strip_anchors(requirement);
  if (stripped.empty())
    return false;
  return std::all_of(stripped.begin(), stripped.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
           c == '-' || c == '~';
  });
}

bool Segment::accepts(std::string_view value) const {
  if (!matcher)
    return true;
  return re2::RE2::FullMatch(re2::StringPiece(value.data(), value.size()),
                             *matcher);
}

// ============================================================================
// Compiler
// ============================================================================

namespace {

bool is_identifier_char(char c, bool first) {
  if (c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))
    return true;
  return !first && c >= '0' && c <= '9';
}

void append_escaped(std::string &regex, char c) {
  switch (c) {
  case '.': case '^': case '$': case '|': case '?': case '*': case '+':
  case '(': case ')': case '[': case ']': case '{': case '}': case '\\':
    regex += '\\';
    break;
  default:
    break;
  }
  regex += c;
}

class Compiler {
  std::string_view src_;
  const Requirements &requirements_;
  size_t pos_ = 0;

public:
  std::string regex;
  CaptureNames names;

  Compiler(std::string_view src, const Requirements &requirements)
      : src_(src), requirements_(requirements) {}

  expected<std::vector<Segment>, Error> parse(int depth) {
    std::vector<Segment> segments;

    auto literal = [&segments](char c) {
      if (segments.empty() || segments.back().kind != Segment::Kind::Literal) {
        segments.push_back(Segment{});
      }
      segments.back().text += c;
    };

    while (pos_ < src_.size()) {
      char c = src_[pos_];

      if (c == '\\') {
        if (pos_ + 1 >= src_.size()) {
          return unexpected(error(PatternError::TrailingEscape));
        }
        literal(src_[pos_ + 1]);
        append_escaped(regex, src_[pos_ + 1]);
        pos_ += 2;
      } else if (c == '(') {
        size_t open = pos_++;
        regex += '(';
        names.emplace_back(std::nullopt);

        auto children = parse(depth + 1);
        if (!children) {
          return unexpected(children.error());
        }
        if (pos_ >= src_.size() || src_[pos_] != ')') {
          pos_ = open;
          return unexpected(error(PatternError::UnterminatedGroup));
        }
        ++pos_;
        regex += ")?";

        Segment group;
        group.kind = Segment::Kind::Optional;
        group.children = std::move(*children);
        segments.push_back(std::move(group));
      } else if (c == ')') {
        if (depth == 0) {
          return unexpected(error(PatternError::UnbalancedGroup));
        }
        return segments;
      } else if (c == ':' || c == '*') {
        auto segment = parse_parameter(c == '*');
        if (!segment) {
          return unexpected(segment.error());
        }
        segments.push_back(std::move(*segment));
      } else {
        literal(c);
        append_escaped(regex, c);
        ++pos_;
      }
    }

    return segments;
  }

private:
  expected<Segment, Error> parse_parameter(bool glob) {
    size_t start = pos_ + 1;
    size_t end = start;
    while (end < src_.size() && is_identifier_char(src_[end], end == start)) {
      ++end;
    }
    if (end == start) {
      return unexpected(error(PatternError::UnknownToken));
    }

    Segment segment;
    segment.kind = glob ? Segment::Kind::Glob : Segment::Kind::Dynamic;
    segment.text = std::string(src_.substr(start, end - start));

    auto it = requirements_.find(segment.text);
    if (it != requirements_.end()) {
      // Names inside a requirement never name params; keep them as plain groups
      segment.requirement =
          normalize_capture_syntax(strip_anchors(it->second), true).normalized;
    } else {
      segment.requirement =
          std::string(glob ? DEFAULT_GLOB_REGEXP : DEFAULT_SEGMENT_REGEXP);
    }

    re2::RE2::Options options;
    options.set_log_errors(false);
    auto matcher = std::make_shared<const re2::RE2>(segment.requirement, options);
    if (!matcher->ok()) {
      return unexpected(Error::pattern(
          PatternError::InvalidRegexp,
          "requirement for '" + segment.text + "': " + matcher->error()));
    }

    regex += '(';
    regex += segment.requirement;
    regex += ')';
    names.emplace_back(segment.text);
    // Groups inside the requirement become anonymous positions
    int inner = normalize_capture_syntax(segment.requirement).captures;
    for (int i = 0; i < inner; ++i) {
      names.emplace_back(std::nullopt);
    }

    segment.matcher = std::move(matcher);
    pos_ = end;
    return segment;
  }

  Error error(PatternError code) const {
    return Error::pattern(code, "at offset " + std::to_string(pos_) + " in \"" +
                                    std::string(src_) + "\"");
  }
};

void collect_names(const std::vector<Segment> &segments,
                   std::vector<std::string> &out, bool descend) {
  for (const auto &segment : segments) {
    if (segment.is_param()) {
      out.push_back(segment.text);
    } else if (descend && segment.kind == Segment::Kind::Optional) {
      collect_names(segment.children, out, true);
    }
  }
}

} // anonymous namespace

expected<SegmentPattern, Error>
SegmentPattern::compile(std::string_view definition,
                        const Requirements &requirements) {
  Compiler compiler(definition, requirements);
  auto segments = compiler.parse(0);
  if (!segments) {
    return unexpected(segments.error());
  }

  auto regexp = NamedCaptureIndex::create("^" + compiler.regex + "$",
                                          std::move(compiler.names));
  if (!regexp) {
    return unexpected(regexp.error());
  }

  SegmentPattern pattern;
  pattern.definition_ = std::string(definition);
  pattern.regexp_ = std::make_shared<const NamedCaptureIndex>(std::move(*regexp));
  pattern.segments_ = std::move(*segments);
  return pattern;
}

std::vector<std::string> SegmentPattern::segment_names() const {
  std::vector<std::string> names;
  collect_names(segments_, names, true);
  return names;
}

std::vector<std::string> SegmentPattern::required_names() const {
  std::vector<std::string> names;
  collect_names(segments_, names, false);
  return names;
}

// ============================================================================
// Generation
// ============================================================================

namespace {

class Generator {
  Params &params_;
  const Params &merged_;
  const Params &defaults_;
  const Parameterize &parameterize_;

  enum class GroupCheck { Generate, Skip, ClearRemaining };

public:
  Generator(Params &params, const Params &merged, const Params &defaults,
            const Parameterize &parameterize)
      : params_(params), merged_(merged), defaults_(defaults),
        parameterize_(parameterize) {}

  std::optional<std::string> emit(const std::vector<Segment> &segments) {
    std::string out;

    for (const auto &segment : segments) {
      switch (segment.kind) {
      case Segment::Kind::Literal:
        out += segment.text;
        break;
      case Segment::Kind::Dynamic:
      case Segment::Kind::Glob: {
        auto value = escaped(segment.text, first_of(segment.text));
        if (!value || !segment.accepts(*value)) {
          return std::nullopt;
        }
        out += *value;
        break;
      }
      case Segment::Kind::Optional:
        switch (check(segment.children)) {
        case GroupCheck::Skip:
          break;
        case GroupCheck::ClearRemaining:
          erase_params(segment.children);
          break;
        case GroupCheck::Generate:
          if (auto text = emit(segment.children)) {
            out += *text;
          }
          break;
        }
        break;
      }
    }

    erase_params(segments);
    return out;
  }

private:
  static std::optional<std::string> value_in(const Params &params,
                                             const std::string &name) {
    auto it = params.find(name);
    if (it == params.end() || !it->second.truthy()) {
      return std::nullopt;
    }
    return it->second.to_param();
  }

  std::optional<std::string> first_of(const std::string &name) const {
    if (auto value = value_in(params_, name))
      return value;
    if (auto value = value_in(merged_, name))
      return value;
    return value_in(defaults_, name);
  }

  std::optional<std::string> escaped(const std::string &name,
                                     std::optional<std::string> value) const {
    if (!value || !parameterize_) {
      return value;
    }
    return parameterize_(name, *value);
  }

  // An optional group is emitted only when the caller passed one of its
  // parameters explicitly and every value in it validates. A value equal to
  // the default drops the group and everything nested in it.
  GroupCheck check(const std::vector<Segment> &children) const {
    bool all_literal =
        std::all_of(children.begin(), children.end(), [](const Segment &s) {
          return s.kind == Segment::Kind::Literal;
        });
    if (all_literal) {
      return GroupCheck::Skip;
    }

    std::vector<std::string> names;
    collect_names(children, names, true);
    bool requested = std::any_of(names.begin(), names.end(), [this](const auto &n) {
      return params_.count(n) > 0;
    });
    if (!requested) {
      return GroupCheck::Skip;
    }

    for (const auto &segment : children) {
      if (!segment.is_param()) {
        continue;
      }
      const auto &name = segment.text;
      auto merged_value = value_in(merged_, name);
      auto default_value = value_in(defaults_, name);

      auto value = escaped(name, merged_value ? merged_value : default_value);
      if (!value || !segment.accepts(*value)) {
        return GroupCheck::Skip;
      }
      if (escaped(name, merged_value) == escaped(name, default_value)) {
        return GroupCheck::ClearRemaining;
      }
    }
    return GroupCheck::Generate;
  }

  void erase_params(const std::vector<Segment> &segments) {
    for (const auto &segment : segments) {
      if (segment.is_param()) {
        params_.erase(segment.text);
      }
    }
  }
};

} // anonymous namespace

std::optional<std::string>
SegmentPattern::generate(Params &params, const Params &merged,
                         const Params &defaults,
                         const Parameterize &parameterize) const {
  for (const auto &name : required_names()) {
    if (!has_param(merged, name) && defaults.count(name) == 0) {
      return std::nullopt;
    }
  }

  Generator generator(params, merged, defaults, parameterize);
  return generator.emit(segments_);
}

} // namespace reroute
