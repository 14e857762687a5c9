#pragma once

#include <cstdint>

namespace trellis {

struct RouterConfig {
  enum class TrailingSlashPolicy : std::int8_t { Strict, Normalize };

  enum class DuplicateRoutePolicy : std::int8_t { Replace, Reject };

  // How a trailing slash of the request path is tokenized.
  //   Normalize: the trailing empty segment is discarded, "/p/" matches the same routes as "/p".
  //   Strict   : the trailing empty segment is kept. Only a glob can consume it, so "/p/" does not match "/p".
  // The root path "/" always has zero segments.
  // Default: Normalize
  TrailingSlashPolicy trailingSlashPolicy{TrailingSlashPolicy::Normalize};

  // What happens when a route is registered with verbs overlapping those of an earlier route with the same pattern and
  // the same header constraints.
  //   Replace: the overlapping verbs are taken from the earlier route (last registration wins), with a warning.
  //   Reject : registration fails with std::invalid_argument.
  // Default: Replace
  DuplicateRoutePolicy duplicateRoutePolicy{DuplicateRoutePolicy::Replace};

  // When no route of the matched path accepts HEAD, serve it with the GET route.
  // HEAD is then advertised in Allow whenever GET is.
  // Default: false, use getOrHead to accept both explicitly.
  bool headFallbackToGet{false};

  RouterConfig& withTrailingSlashPolicy(TrailingSlashPolicy policy);

  RouterConfig& withDuplicateRoutePolicy(DuplicateRoutePolicy policy);

  RouterConfig& withHeadFallbackToGet(bool enable = true);

  // Nothing to validate yet, kept for symmetry with the other configuration objects.
  void validate() const;
};

}  // namespace trellis
