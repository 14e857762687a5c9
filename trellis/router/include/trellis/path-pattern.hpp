#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "trellis/vector.hpp"

namespace trellis {

// One segment of a route pattern.
//   literal      "items"          matches the exact segment text
//   constrained  ":id|[0-9]+"     matches one segment fully matched by the regex, captured under "id"
//   dynamic      ":id"            matches one non-empty segment, captured under "id"
//   glob         "*rest"          matches the remaining zero or more segments, captured as a list under "rest"
struct PatternSegment {
  enum class Kind : std::uint8_t { Literal, Constrained, Dynamic, Glob };

  bool operator==(const PatternSegment&) const = default;

  Kind kind{Kind::Literal};
  std::string text;   // literal text, or parameter name
  std::string regex;  // Constrained only
};

using PathPattern = vector<PatternSegment>;

// Parses a route pattern such as "/items/:id|[0-9]+/files/*rest".
// The pattern must start with '/'. A trailing '/' is ignored, "/" is the root (no segment).
// Throws std::invalid_argument for an empty segment ("//"), an empty parameter name, an empty or invalid regex, or a
// glob which is not the last segment.
PathPattern CompilePathPattern(std::string_view pattern);

// Canonical textual form of a compiled pattern ("/" for the root).
std::string PatternToString(const PathPattern& pattern);

// Concatenates a scope prefix and a pattern: ("/checkout", "/start") -> "/checkout/start", ("/", "/a") -> "/a".
std::string JoinPatterns(std::string_view prefix, std::string_view pattern);

// Splits a request path on '/' into raw (not decoded) segments. The leading '/' is optional.
// A trailing empty segment is kept only if 'keepTrailingEmpty' is set. The root path has no segment.
void SplitPathSegments(std::string_view path, bool keepTrailingEmpty, vector<std::string_view>& out);

}  // namespace trellis
