#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include "trellis/http-headers.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Orders two rejection statuses of the same request, returning the more specific one.
// 404 < 405 < 406 < any other client error. On a tie, 'lhs' is kept.
http::StatusCode HigherPrecedenceStatus(http::StatusCode lhs, http::StatusCode rhs) noexcept;

// Why a route refused a request whose path it matched.
struct RouteNonMatch {
  // Combination of two rejections: the more specific status and the union of the allowed verbs.
  [[nodiscard]] RouteNonMatch merge(const RouteNonMatch& other) const noexcept {
    return {HigherPrecedenceStatus(status, other.status), static_cast<http::MethodBmp>(allow | other.allow)};
  }

  bool operator==(const RouteNonMatch&) const noexcept = default;

  http::StatusCode status{http::StatusCodeNotFound};
  http::MethodBmp allow{};
};

// Request level conditions of a route, evaluated once its path matched: the verb set, and optionally the media types
// it can produce (checked against Accept) and those it consumes (checked against Content-Type).
class RouteMatcher {
 public:
  explicit RouteMatcher(http::MethodBmp methods) noexcept : _methods(methods) {}

  // Declares produced media types ("application/json"). A request whose Accept header admits none of them is
  // rejected with 406. A request without Accept admits everything.
  RouteMatcher& accepting(std::initializer_list<std::string_view> mediaTypes);

  // Declares consumed media types ("application/json", "text/*"). A request whose Content-Type matches none of them
  // is rejected with 415, as is a request without Content-Type unless 'allowMissing' is set.
  RouteMatcher& requiringContentType(std::initializer_list<std::string_view> mediaTypes, bool allowMissing = false);

  [[nodiscard]] http::MethodBmp methods() const noexcept { return _methods; }

  [[nodiscard]] const vector<std::string>& producedMediaTypes() const noexcept { return _produced; }

  [[nodiscard]] const vector<std::string>& consumedMediaTypes() const noexcept { return _consumed; }

  // Tells whether both matchers would accept and refuse exactly the same requests apart from their verbs.
  [[nodiscard]] bool sameHeaderConstraints(const RouteMatcher& other) const noexcept;

  // Returns std::nullopt if the route accepts the request, the rejection otherwise.
  // Verbs are checked first (405), then Accept (406), then Content-Type (415). A null 'headers' skips header checks.
  [[nodiscard]] std::optional<RouteNonMatch> evaluate(http::Method method, const http::HttpHeaders* headers) const;

 private:
  friend class Router;

  void removeMethods(http::MethodBmp methods) noexcept { _methods = static_cast<http::MethodBmp>(_methods & ~methods); }

  [[nodiscard]] bool acceptSatisfied(std::string_view acceptValue) const;

  [[nodiscard]] bool contentTypeSatisfied(std::string_view contentTypeValue) const;

  vector<std::string> _produced;
  vector<std::string> _consumed;
  http::MethodBmp _methods;
  bool _allowMissingContentType{false};
};

}  // namespace trellis
