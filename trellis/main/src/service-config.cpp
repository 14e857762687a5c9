#include "trellis/service-config.hpp"

namespace trellis {

ServiceConfig& ServiceConfig::withTrustRequestIdHeader(bool trust) {
  trustRequestIdHeader = trust;
  return *this;
}

ServiceConfig& ServiceConfig::withEchoRequestId(bool echo) {
  echoRequestId = echo;
  return *this;
}

ServiceConfig& ServiceConfig::withExposeFaultDetails(bool expose) {
  exposeFaultDetails = expose;
  return *this;
}

void ServiceConfig::validate() const {}

}  // namespace trellis
