#pragma once

namespace trellis {

struct ServiceConfig {
  // Use the X-Request-ID header of an incoming request, when present and not empty, as its request id.
  // Otherwise a random UUID v4 is always generated.
  // Default: true
  bool trustRequestIdHeader{true};

  // Copy the request id into an X-Request-ID header of every response.
  // Default: false
  bool echoRequestId{false};

  // Include the message of unexpected faults in the body of 500 responses.
  // Messages of HandlerError are always sent, they are meant for the client.
  // Default: false
  bool exposeFaultDetails{false};

  ServiceConfig& withTrustRequestIdHeader(bool trust = true);

  ServiceConfig& withEchoRequestId(bool echo = true);

  ServiceConfig& withExposeFaultDetails(bool expose = true);

  // Nothing can be invalid yet, kept so that embedders validate all configuration objects the same way.
  void validate() const;
};

}  // namespace trellis
