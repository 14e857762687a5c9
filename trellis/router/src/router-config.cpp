#include "trellis/router-config.hpp"

namespace trellis {

RouterConfig& RouterConfig::withTrailingSlashPolicy(TrailingSlashPolicy policy) {
  trailingSlashPolicy = policy;
  return *this;
}

RouterConfig& RouterConfig::withDuplicateRoutePolicy(DuplicateRoutePolicy policy) {
  duplicateRoutePolicy = policy;
  return *this;
}

RouterConfig& RouterConfig::withHeadFallbackToGet(bool enable) {
  headFallbackToGet = enable;
  return *this;
}

void RouterConfig::validate() const {}

}  // namespace trellis
