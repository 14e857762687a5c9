#include "trellis/path-pattern.hpp"

#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "trellis/vector.hpp"

namespace trellis {

namespace {

void CheckParamName(std::string_view name, std::string_view pattern) {
  if (name.empty()) {
    throw std::invalid_argument("Empty parameter name in route pattern '" + std::string(pattern) + "'");
  }
  for (char ch : name) {
    const bool valid = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
    if (!valid) {
      throw std::invalid_argument("Invalid character in parameter name '" + std::string(name) + "' of route pattern '" +
                                  std::string(pattern) + "'");
    }
  }
}

PatternSegment CompileSegment(std::string_view segment, std::string_view pattern) {
  PatternSegment compiled;
  switch (segment.front()) {
    case ':': {
      const std::size_t pipePos = segment.find('|');
      compiled.text.assign(segment.substr(1, pipePos == std::string_view::npos ? std::string_view::npos : pipePos - 1));
      CheckParamName(compiled.text, pattern);
      if (pipePos == std::string_view::npos) {
        compiled.kind = PatternSegment::Kind::Dynamic;
        break;
      }
      compiled.kind = PatternSegment::Kind::Constrained;
      compiled.regex.assign(segment.substr(pipePos + 1));
      if (compiled.regex.empty()) {
        throw std::invalid_argument("Empty regex constraint in route pattern '" + std::string(pattern) + "'");
      }
      try {
        [[maybe_unused]] const std::regex check(compiled.regex);
      } catch (const std::regex_error& ex) {
        throw std::invalid_argument("Invalid regex '" + compiled.regex + "' in route pattern '" + std::string(pattern) +
                                    "': " + ex.what());
      }
      break;
    }
    case '*':
      compiled.kind = PatternSegment::Kind::Glob;
      compiled.text.assign(segment.substr(1));
      CheckParamName(compiled.text, pattern);
      break;
    default:
      compiled.kind = PatternSegment::Kind::Literal;
      compiled.text.assign(segment);
      break;
  }
  return compiled;
}

}  // namespace

PathPattern CompilePathPattern(std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument("Route pattern must begin with '/': '" + std::string(pattern) + "'");
  }
  if (pattern.find("//") != std::string_view::npos) {
    throw std::invalid_argument("Route pattern contains an empty segment: '" + std::string(pattern) + "'");
  }

  std::string_view rest = pattern.substr(1);
  if (!rest.empty() && rest.back() == '/') {
    rest.remove_suffix(1);
  }

  PathPattern compiled;
  while (!rest.empty()) {
    const std::size_t nextSlash = rest.find('/');
    const std::string_view segment = rest.substr(0, nextSlash);
    if (segment.empty()) {
      throw std::invalid_argument("Route pattern contains an empty segment: '" + std::string(pattern) + "'");
    }
    if (!compiled.empty() && compiled.back().kind == PatternSegment::Kind::Glob) {
      throw std::invalid_argument("Glob segment must be the last one of route pattern '" + std::string(pattern) + "'");
    }
    compiled.push_back(CompileSegment(segment, pattern));
    rest = nextSlash == std::string_view::npos ? std::string_view{} : rest.substr(nextSlash + 1);
  }
  return compiled;
}

std::string PatternToString(const PathPattern& pattern) {
  if (pattern.empty()) {
    return "/";
  }
  std::string out;
  for (const PatternSegment& segment : pattern) {
    out.push_back('/');
    switch (segment.kind) {
      case PatternSegment::Kind::Literal:
        out.append(segment.text);
        break;
      case PatternSegment::Kind::Constrained:
        out.push_back(':');
        out.append(segment.text);
        out.push_back('|');
        out.append(segment.regex);
        break;
      case PatternSegment::Kind::Dynamic:
        out.push_back(':');
        out.append(segment.text);
        break;
      case PatternSegment::Kind::Glob:
        out.push_back('*');
        out.append(segment.text);
        break;
    }
  }
  return out;
}

std::string JoinPatterns(std::string_view prefix, std::string_view pattern) {
  while (!prefix.empty() && prefix.back() == '/') {
    prefix.remove_suffix(1);
  }
  while (!pattern.empty() && pattern.front() == '/') {
    pattern.remove_prefix(1);
  }
  std::string out;
  out.reserve(prefix.size() + 1U + pattern.size());
  if (!prefix.empty() && prefix.front() != '/') {
    out.push_back('/');
  }
  out.append(prefix);
  out.push_back('/');
  out.append(pattern);
  return out;
}

void SplitPathSegments(std::string_view path, bool keepTrailingEmpty, vector<std::string_view>& out) {
  out.clear();
  if (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }
  if (path.empty()) {
    return;
  }
  for (std::size_t pos = 0;;) {
    const std::size_t nextSlash = path.find('/', pos);
    if (nextSlash == std::string_view::npos) {
      const std::string_view last = path.substr(pos);
      if (!last.empty() || keepTrailingEmpty) {
        out.push_back(last);
      }
      break;
    }
    out.push_back(path.substr(pos, nextSlash - pos));
    pos = nextSlash + 1U;
  }
}

}  // namespace trellis
