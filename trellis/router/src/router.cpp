#include "trellis/router.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/http-headers.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/match-outcome.hpp"
#include "trellis/params.hpp"
#include "trellis/path-pattern.hpp"
#include "trellis/route-matcher.hpp"
#include "trellis/route.hpp"
#include "trellis/router-config.hpp"
#include "trellis/url-decode.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

bool IsCatchAllRegex(std::string_view source) {
  return source == ".*" || source == ".+" || source == "[^/]*" || source == "[^/]+";
}

std::string RegexSegmentText(const PatternSegment& segment) { return ":" + segment.text + "|" + segment.regex; }

// Percent-decodes each segment of 'path' into 'segments'. Returns false if one holds an invalid escape sequence.
bool SplitDecodedSegments(std::string_view path, bool keepTrailingEmpty, vector<std::string>& segments) {
  vector<std::string_view> raw;
  SplitPathSegments(path, keepTrailingEmpty, raw);
  segments.reserve(raw.size());
  for (std::string_view segment : raw) {
    std::optional<std::string> decoded = url::DecodePathSegment(segment);
    if (!decoded) {
      return false;
    }
    segments.push_back(std::move(*decoded));
  }
  return true;
}

}  // namespace

Router::Router(RouterConfig config) : _config(std::move(config)) {
  _config.validate();
  _nodes.push_back(std::make_unique<RouteNode>());
  _pRootNode = _nodes.back().get();
  _pRootNode->pattern = "/";
}

Router::~Router() = default;

Router::RouteNode* Router::newNode(const RouteNode& parent, std::string_view segmentText) {
  _nodes.push_back(std::make_unique<RouteNode>());
  RouteNode* node = _nodes.back().get();
  node->pattern = JoinPatterns(parent.pattern, segmentText);
  return node;
}

Router::RouteNode* Router::ensureLiteralChild(RouteNode& node, const PatternSegment& segment) {
  const auto it = node.literalChildren.find(std::string_view(segment.text));
  if (it != node.literalChildren.end()) {
    return it->second;
  }
  RouteNode* child = newNode(node, segment.text);
  child->literal = segment.text;
  node.literalChildren.emplace(std::string_view(child->literal), child);
  return child;
}

Router::RouteNode* Router::ensureRegexChild(RouteNode& node, const PatternSegment& segment) {
  for (const RegexEdge& edge : node.regexChildren) {
    if (edge.source == segment.regex) {
      if (edge.name == segment.text) {
        return edge.child;
      }
      log::warn("Regex segment {} below {} repeats the constraint of its earlier sibling :{}, it is only reached when "
                "that branch fails deeper",
                RegexSegmentText(segment), node.pattern, edge.name);
    } else if (IsCatchAllRegex(edge.source)) {
      log::warn("Regex segment {} below {} follows the catch-all sibling :{}|{}, it is only reached when that branch "
                "fails deeper",
                RegexSegmentText(segment), node.pattern, edge.name, edge.source);
    }
  }
  RouteNode* child = newNode(node, RegexSegmentText(segment));
  node.regexChildren.push_back(RegexEdge{segment.text, segment.regex, std::regex(segment.regex), child});
  return child;
}

Router::RouteNode* Router::ensureDynamicChild(RouteNode& node, const PatternSegment& segment) {
  if (node.dynamicChild != nullptr) {
    if (node.dynamicName != segment.text) {
      throw std::invalid_argument("Conflicting parameter names :" + node.dynamicName + " and :" + segment.text +
                                  " below " + node.pattern);
    }
    return node.dynamicChild;
  }
  node.dynamicName = segment.text;
  node.dynamicChild = newNode(node, ":" + segment.text);
  return node.dynamicChild;
}

Router::RouteNode* Router::ensureGlobChild(RouteNode& node, const PatternSegment& segment) {
  if (node.globChild != nullptr) {
    if (node.globName != segment.text) {
      throw std::invalid_argument("Conflicting glob names *" + node.globName + " and *" + segment.text + " below " +
                                  node.pattern);
    }
    return node.globChild;
  }
  node.globName = segment.text;
  node.globChild = newNode(node, "*" + segment.text);
  return node.globChild;
}

Route& Router::insert(std::string_view pattern, std::unique_ptr<Route> route) {
  if (!route) {
    throw std::invalid_argument("Cannot register a null route");
  }
  if (route->matcher().methods() == 0) {
    throw std::invalid_argument("Route for '" + std::string(pattern) + "' accepts no method");
  }

  const PathPattern compiled = CompilePathPattern(pattern);

  RouteNode* node = _pRootNode;
  for (const PatternSegment& segment : compiled) {
    if (node->delegating) {
      throw std::invalid_argument("Cannot register '" + std::string(pattern) + "' below the delegated prefix " +
                                  node->pattern);
    }
    switch (segment.kind) {
      case PatternSegment::Kind::Literal:
        node = ensureLiteralChild(*node, segment);
        break;
      case PatternSegment::Kind::Constrained:
        node = ensureRegexChild(*node, segment);
        break;
      case PatternSegment::Kind::Dynamic:
        node = ensureDynamicChild(*node, segment);
        break;
      case PatternSegment::Kind::Glob:
        node = ensureGlobChild(*node, segment);
        break;
    }
  }

  if (node->delegating) {
    throw std::logic_error("Cannot register a route on " + node->pattern + ", it is delegated to another router");
  }
  if (route->delegates()) {
    if (!compiled.empty() && compiled.back().kind == PatternSegment::Kind::Glob) {
      throw std::invalid_argument("Cannot delegate the glob pattern " + node->pattern);
    }
    if (!node->routes.empty() || node->hasChildren()) {
      throw std::invalid_argument("Cannot delegate " + node->pattern + ", routes are already registered below it");
    }
    node->delegating = true;
  } else {
    applyDuplicatePolicy(*node, *route);
  }

  route->_pattern = node->pattern;
  node->routes.push_back(std::move(route));
  ++_nbRoutes;
  return *node->routes.back();
}

void Router::applyDuplicatePolicy(RouteNode& node, const Route& route) {
  const http::MethodBmp methods = route.matcher().methods();
  for (auto it = node.routes.begin(); it != node.routes.end();) {
    Route& existing = **it;
    const auto overlap = static_cast<http::MethodBmp>(existing.matcher().methods() & methods);
    if (overlap == 0 || !existing.matcher().sameHeaderConstraints(route.matcher())) {
      ++it;
      continue;
    }
    if (_config.duplicateRoutePolicy == RouterConfig::DuplicateRoutePolicy::Reject) {
      throw std::invalid_argument("Route " + http::AllowHeaderValue(overlap) + " " + node.pattern +
                                  " is already registered");
    }
    log::warn("Overwriting existing route {} {}", http::AllowHeaderValue(overlap), node.pattern);
    existing._matcher.removeMethods(overlap);
    if (existing.matcher().methods() == 0) {
      it = node.routes.erase(it);
      --_nbRoutes;
    } else {
      ++it;
    }
  }
}

const Router::RouteNode* Router::findNode(std::span<const std::string> segments, std::size_t firstSegment,
                                          vector<Capture>& captures, std::size_t& consumed) const {
  const auto nbSegments = static_cast<uint32_t>(segments.size());

  SmallVector<StackFrame, 16> stack;
  stack.push_back(StackFrame{_pRootNode, static_cast<uint32_t>(firstSegment), 0, 0});

  while (!stack.empty()) {
    StackFrame frame = stack.back();
    stack.pop_back();

    const RouteNode& node = *frame.node;
    captures.resize(frame.captureSize);

    if (frame.stage == 0) {
      // A delegated prefix answers whatever remains of the path
      if (node.delegating) {
        consumed = frame.segmentIndex;
        return &node;
      }
      if (frame.segmentIndex == nbSegments) {
        if (!node.routes.empty()) {
          consumed = nbSegments;
          return &node;
        }
        // glob matching zero segment
        if (node.globChild != nullptr && !node.globChild->routes.empty()) {
          consumed = nbSegments;
          return node.globChild;
        }
        continue;
      }
    }

    const std::string_view segment = segments[frame.segmentIndex];
    const auto nbRegex = static_cast<uint32_t>(node.regexChildren.size());
    const uint32_t stage = frame.stage++;
    const RouteNode* child = nullptr;

    if (stage == 0) {
      const auto it = node.literalChildren.find(segment);
      if (it != node.literalChildren.end()) {
        child = it->second;
      }
    } else if (stage <= nbRegex) {
      const RegexEdge& edge = node.regexChildren[stage - 1U];
      if (!segment.empty() && std::regex_match(segment.data(), segment.data() + segment.size(), edge.regex)) {
        child = edge.child;
        captures.push_back(Capture{edge.name, frame.segmentIndex, frame.segmentIndex + 1U});
      }
    } else if (stage == nbRegex + 1U) {
      if (node.dynamicChild != nullptr && !segment.empty()) {
        child = node.dynamicChild;
        captures.push_back(Capture{node.dynamicName, frame.segmentIndex, frame.segmentIndex + 1U});
      }
    } else {
      // Last alternative of this node: the glob consumes all remaining segments
      if (node.globChild != nullptr && !node.globChild->routes.empty()) {
        captures.push_back(Capture{node.globName, frame.segmentIndex, nbSegments});
        consumed = nbSegments;
        return node.globChild;
      }
      continue;
    }

    stack.push_back(frame);
    if (child != nullptr) {
      stack.push_back(StackFrame{child, frame.segmentIndex + 1U, 0, static_cast<uint32_t>(captures.size())});
    }
  }
  return nullptr;
}

MatchOutcome Router::evaluateRoutes(const RouteNode& node, http::Method method,
                                    const http::HttpHeaders* headers) const {
  std::optional<RouteNonMatch> rejection;
  const auto firstAccepting = [&node, headers, &rejection](http::Method candidate) -> const Route* {
    for (const auto& route : node.routes) {
      const auto nonMatch = route->matcher().evaluate(candidate, headers);
      if (!nonMatch) {
        return route.get();
      }
      rejection = rejection ? rejection->merge(*nonMatch) : *nonMatch;
    }
    return nullptr;
  };

  const Route* route = firstAccepting(method);
  if (route == nullptr && method == http::Method::HEAD && _config.headFallbackToGet) {
    route = firstAccepting(http::Method::GET);
  }
  if (route != nullptr) {
    return MatchOutcome::Matched(*route, {}, {});
  }

  if (rejection->status != http::StatusCodeMethodNotAllowed) {
    return MatchOutcome::Rejected(rejection->status);
  }
  http::MethodBmp allowed = rejection->allow;
  if (_config.headFallbackToGet && http::IsMethodSet(allowed, http::Method::GET)) {
    allowed = allowed | http::Method::HEAD;
  }
  return MatchOutcome::PathMatchedNoVerb(allowed);
}

MatchOutcome Router::matchImpl(http::Method method, std::span<const std::string> segments,
                               std::size_t firstSegment, const http::HttpHeaders* headers) const {
  vector<Capture> captures;
  std::size_t consumed = 0;
  const RouteNode* node = findNode(segments, firstSegment, captures, consumed);
  if (node == nullptr) {
    return {};
  }

  MatchOutcome outcome = evaluateRoutes(*node, method, headers);
  if (!outcome.matched()) {
    return outcome;
  }

  PathParams params;
  for (const Capture& capture : captures) {
    for (uint32_t segmentIdx = capture.firstSegment; segmentIdx < capture.lastSegment; ++segmentIdx) {
      params.add(capture.name, segments[segmentIdx]);
    }
  }

  RoutedPath routedPath;
  routedPath.segments.reserve(segments.size());
  for (const std::string& segment : segments) {
    routedPath.segments.push_back(segment);
  }
  routedPath.consumed = consumed;

  return MatchOutcome::Matched(*outcome.route(), std::move(params), std::move(routedPath));
}

MatchOutcome Router::matchPath(http::Method method, std::string_view path, const http::HttpHeaders* headers) const {
  vector<std::string> segments;
  if (!SplitDecodedSegments(path, _config.trailingSlashPolicy == RouterConfig::TrailingSlashPolicy::Strict,
                            segments)) {
    log::debug("Invalid percent-encoding in path {}", path);
    return MatchOutcome::Rejected(http::StatusCodeBadRequest);
  }
  return matchImpl(method, segments, 0, headers);
}

MatchOutcome Router::match(http::Method method, std::string_view path) const {
  return matchPath(method, path, nullptr);
}

MatchOutcome Router::match(const http::HttpRequest& request) const {
  return matchPath(request.method(), request.path(), &request.headers());
}

MatchOutcome Router::matchSegments(http::Method method, std::span<const std::string> segments,
                                   std::size_t firstSegment, const http::HttpHeaders* headers) const {
  return matchImpl(method, segments, firstSegment, headers);
}

}  // namespace trellis
