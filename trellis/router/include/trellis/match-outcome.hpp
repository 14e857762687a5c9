#pragma once

#include <cstdint>
#include <utility>

#include "trellis/http-method.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/params.hpp"
#include "trellis/route.hpp"

namespace trellis {

// Result of Router::match.
class MatchOutcome {
 public:
  enum class Kind : std::uint8_t {
    NoMatch,            // no route consumes the whole path (404)
    PathMatchedNoVerb,  // the path matched but no route accepts the verb (405)
    Rejected,           // the request headers were refused (406, 415) or the path could not be decoded (400)
    Matched
  };

  // NoMatch.
  MatchOutcome() noexcept = default;

  static MatchOutcome Matched(const Route& route, PathParams params, RoutedPath routedPath) {
    MatchOutcome outcome;
    outcome._kind = Kind::Matched;
    outcome._status = http::StatusCodeOK;
    outcome._route = &route;
    outcome._params = std::move(params);
    outcome._routedPath = std::move(routedPath);
    return outcome;
  }

  static MatchOutcome PathMatchedNoVerb(http::MethodBmp allowed) noexcept {
    MatchOutcome outcome;
    outcome._kind = Kind::PathMatchedNoVerb;
    outcome._status = http::StatusCodeMethodNotAllowed;
    outcome._allowed = allowed;
    return outcome;
  }

  static MatchOutcome Rejected(http::StatusCode status) noexcept {
    MatchOutcome outcome;
    outcome._kind = Kind::Rejected;
    outcome._status = status;
    return outcome;
  }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] bool matched() const noexcept { return _kind == Kind::Matched; }

  // Matched route, nullptr if not matched. It lives as long as the router that produced this outcome.
  [[nodiscard]] const Route* route() const noexcept { return _route; }

  // Raw captured path parameters of a matched route.
  [[nodiscard]] const PathParams& pathParams() const noexcept { return _params; }

  [[nodiscard]] const RoutedPath& routedPath() const noexcept { return _routedPath; }

  // Union of the verbs accepted at the matched path, for PathMatchedNoVerb.
  [[nodiscard]] http::MethodBmp allowedMethods() const noexcept { return _allowed; }

  // Status of the response answering this outcome when not matched, 200 when matched.
  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

 private:
  PathParams _params;
  RoutedPath _routedPath;
  const Route* _route{nullptr};
  http::StatusCode _status{http::StatusCodeNotFound};
  http::MethodBmp _allowed{};
  Kind _kind{Kind::NoMatch};
};

// Standard error response of a non matched outcome: 404, 405 with an Allow header, or the rejection status.
// Throws std::logic_error for a matched outcome.
http::HttpResponse MakeNonMatchResponse(const MatchOutcome& outcome);

}  // namespace trellis
