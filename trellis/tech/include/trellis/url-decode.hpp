#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace trellis::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+' into 'plusAs'.
// Returns nullptr on invalid encoding (truncated % or non-hex digits) when strictInvalid is true, leaving the buffer in
// a partially modified state. In lenient mode invalid sequences are copied as is.
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

// Strict decoding of a single path segment. '+' is kept literally.
std::optional<std::string> DecodePathSegment(std::string_view encoded);

// Best effort decoding of a query string key or value ('+' becomes a space).
std::string DecodeQueryComponent(std::string_view encoded);

}  // namespace trellis::url
