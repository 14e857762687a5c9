#pragma once

#include <string_view>

namespace trellis::http {

// Header field names are case-insensitive; they are stored here in their canonical form for emission.
inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view XRequestId = "X-Request-ID";
inline constexpr std::string_view XRuntimeMicroseconds = "X-Runtime-Microseconds";
inline constexpr std::string_view XContentTypeOptions = "X-Content-Type-Options";
inline constexpr std::string_view XFrameOptions = "X-Frame-Options";
inline constexpr std::string_view XXssProtection = "X-XSS-Protection";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeApplicationFormUrlEncoded = "application/x-www-form-urlencoded";

}  // namespace trellis::http
