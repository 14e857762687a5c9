#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <regex>
#include <span>
#include <string>
#include <string_view>

#include "trellis/flat-hash-map.hpp"
#include "trellis/http-headers.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/match-outcome.hpp"
#include "trellis/params.hpp"
#include "trellis/path-pattern.hpp"
#include "trellis/route.hpp"
#include "trellis/router-config.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Segment tree matching a request path and verb to a registered Route.
// At each node, children are tried in priority order literal > regex (registration order) > dynamic > glob, with
// backtracking to the next alternative when a branch fails deeper. The first node reached with no remaining segment and
// holding routes decides the outcome.
// A Router is assembled by a RouterBuilder, then frozen: match is const and safe for concurrent callers.
class Router {
 public:
  Router(const Router&) = delete;
  Router(Router&&) = delete;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) = delete;

  ~Router();

  // Matches on path and verb only, header constraints of routes are not evaluated.
  // Segments are percent-decoded before matching: a path with an invalid escape sequence is Rejected with 400.
  [[nodiscard]] MatchOutcome match(http::Method method, std::string_view path) const;

  // Matches on path, verb and request headers (Accept, Content-Type).
  [[nodiscard]] MatchOutcome match(const http::HttpRequest& request) const;

  // Matches the already decoded path segments starting at 'firstSegment'. 'headers' may be null.
  // Used to continue routing below a delegating route.
  [[nodiscard]] MatchOutcome matchSegments(http::Method method, std::span<const std::string> segments,
                                           std::size_t firstSegment, const http::HttpHeaders* headers) const;

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  [[nodiscard]] std::size_t nbRoutes() const noexcept { return _nbRoutes; }

 private:
  friend class RouterBuilder;

  struct RouteNode;

  struct RegexEdge {
    std::string name;
    std::string source;
    std::regex regex;
    RouteNode* child;
  };

  using RouteNodeMap = flat_hash_map<std::string_view, RouteNode*>;

  struct RouteNode {
    [[nodiscard]] bool hasChildren() const noexcept {
      return !literalChildren.empty() || !regexChildren.empty() || dynamicChild != nullptr || globChild != nullptr;
    }

    std::string literal;  // segment text of a literal child, keys of the parent's literalChildren view into it
    std::string pattern;  // canonical pattern of this node
    RouteNodeMap literalChildren;
    vector<RegexEdge> regexChildren;
    std::string dynamicName;
    RouteNode* dynamicChild{nullptr};
    std::string globName;
    RouteNode* globChild{nullptr};
    vector<std::unique_ptr<Route>> routes;
    bool delegating{false};
  };

  struct Capture {
    std::string_view name;
    uint32_t firstSegment;
    uint32_t lastSegment;
  };

  struct StackFrame {
    const RouteNode* node;
    uint32_t segmentIndex;
    uint32_t stage;
    uint32_t captureSize;
  };

  explicit Router(RouterConfig config);

  Route& insert(std::string_view pattern, std::unique_ptr<Route> route);

  RouteNode* newNode(const RouteNode& parent, std::string_view segmentText);

  RouteNode* ensureLiteralChild(RouteNode& node, const PatternSegment& segment);
  RouteNode* ensureRegexChild(RouteNode& node, const PatternSegment& segment);
  RouteNode* ensureDynamicChild(RouteNode& node, const PatternSegment& segment);
  RouteNode* ensureGlobChild(RouteNode& node, const PatternSegment& segment);

  void applyDuplicatePolicy(RouteNode& node, const Route& route);

  // Depth first search of the node deciding the outcome for 'segments' from 'firstSegment'.
  // On success, 'captures' holds the bindings on the way and 'consumed' the index of the first unconsumed segment.
  const RouteNode* findNode(std::span<const std::string> segments, std::size_t firstSegment,
                            vector<Capture>& captures, std::size_t& consumed) const;

  MatchOutcome matchPath(http::Method method, std::string_view path, const http::HttpHeaders* headers) const;

  MatchOutcome matchImpl(http::Method method, std::span<const std::string> segments, std::size_t firstSegment,
                         const http::HttpHeaders* headers) const;

  MatchOutcome evaluateRoutes(const RouteNode& node, http::Method method, const http::HttpHeaders* headers) const;

  RouterConfig _config;
  vector<std::unique_ptr<RouteNode>> _nodes;
  RouteNode* _pRootNode;
  std::size_t _nbRoutes{};
};

}  // namespace trellis
