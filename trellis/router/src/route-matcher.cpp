#include "trellis/route-matcher.hpp"

#include <charconv>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "trellis/http-constants.hpp"
#include "trellis/http-headers.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/string-equal-ignore-case.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

int Rank(http::StatusCode status) noexcept {
  switch (status) {
    case http::StatusCodeNotFound:
      return 0;
    case http::StatusCodeMethodNotAllowed:
      return 1;
    case http::StatusCodeNotAcceptable:
      return 2;
    default:
      return 3;
  }
}

struct MediaRange {
  std::string_view type;
  std::string_view subtype;
};

// Parses "type/subtype;params" keeping only the type and subtype. Returns std::nullopt if there is no '/'.
std::optional<MediaRange> ParseMediaRange(std::string_view value) {
  value = TrimOws(value.substr(0, value.find(';')));
  const std::size_t slashPos = value.find('/');
  if (slashPos == std::string_view::npos) {
    return std::nullopt;
  }
  return MediaRange{TrimOws(value.substr(0, slashPos)), TrimOws(value.substr(slashPos + 1))};
}

// Tells whether the 'q' parameter of an Accept element is zero, meaning "not acceptable".
bool HasZeroQuality(std::string_view element) {
  for (std::size_t semiPos = element.find(';'); semiPos != std::string_view::npos;) {
    const std::size_t nextSemi = element.find(';', semiPos + 1);
    std::string_view param = TrimOws(element.substr(semiPos + 1, nextSemi == std::string_view::npos
                                                                     ? std::string_view::npos
                                                                     : nextSemi - semiPos - 1));
    if (param.size() > 2 && tolower(param[0]) == 'q' && param[1] == '=') {
      param.remove_prefix(2);
      double quality = 1.0;
      const auto [ptr, errc] = std::from_chars(param.data(), param.data() + param.size(), quality);
      return errc == std::errc{} && quality <= 0.0;
    }
    semiPos = nextSemi;
  }
  return false;
}

// 'range' may contain wildcards, 'concrete' is compared as is.
bool RangeCovers(const MediaRange& range, const MediaRange& concrete) {
  if (range.type == "*") {
    return true;
  }
  if (!CaseInsensitiveEqual(range.type, concrete.type)) {
    return false;
  }
  return range.subtype == "*" || CaseInsensitiveEqual(range.subtype, concrete.subtype);
}

void AddMediaTypes(std::initializer_list<std::string_view> mediaTypes, vector<std::string>& out) {
  for (std::string_view mediaType : mediaTypes) {
    if (!ParseMediaRange(mediaType)) {
      throw std::invalid_argument("Invalid media type '" + std::string(mediaType) + "'");
    }
    out.emplace_back(mediaType);
  }
}

bool SameMediaTypes(const vector<std::string>& lhs, const vector<std::string>& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (!CaseInsensitiveEqual(lhs[pos], rhs[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace

http::StatusCode HigherPrecedenceStatus(http::StatusCode lhs, http::StatusCode rhs) noexcept {
  return Rank(rhs) > Rank(lhs) ? rhs : lhs;
}

RouteMatcher& RouteMatcher::accepting(std::initializer_list<std::string_view> mediaTypes) {
  AddMediaTypes(mediaTypes, _produced);
  return *this;
}

RouteMatcher& RouteMatcher::requiringContentType(std::initializer_list<std::string_view> mediaTypes,
                                                 bool allowMissing) {
  AddMediaTypes(mediaTypes, _consumed);
  _allowMissingContentType = allowMissing;
  return *this;
}

bool RouteMatcher::sameHeaderConstraints(const RouteMatcher& other) const noexcept {
  return _allowMissingContentType == other._allowMissingContentType && SameMediaTypes(_produced, other._produced) &&
         SameMediaTypes(_consumed, other._consumed);
}

std::optional<RouteNonMatch> RouteMatcher::evaluate(http::Method method, const http::HttpHeaders* headers) const {
  if (!http::IsMethodSet(_methods, method)) {
    return RouteNonMatch{http::StatusCodeMethodNotAllowed, _methods};
  }
  if (headers == nullptr) {
    return std::nullopt;
  }
  if (!_produced.empty()) {
    const auto acceptValue = headers->value(http::Accept);
    if (acceptValue && !TrimOws(*acceptValue).empty() && !acceptSatisfied(*acceptValue)) {
      return RouteNonMatch{http::StatusCodeNotAcceptable, _methods};
    }
  }
  if (!_consumed.empty()) {
    const auto contentType = headers->value(http::ContentType);
    const bool satisfied = contentType ? contentTypeSatisfied(*contentType) : _allowMissingContentType;
    if (!satisfied) {
      return RouteNonMatch{http::StatusCodeUnsupportedMediaType, _methods};
    }
  }
  return std::nullopt;
}

bool RouteMatcher::acceptSatisfied(std::string_view acceptValue) const {
  while (!acceptValue.empty()) {
    const std::size_t commaPos = acceptValue.find(',');
    const std::string_view element = acceptValue.substr(0, commaPos);
    acceptValue = commaPos == std::string_view::npos ? std::string_view{} : acceptValue.substr(commaPos + 1);

    const auto range = ParseMediaRange(element);
    if (!range || HasZeroQuality(element)) {
      continue;
    }
    for (const std::string& produced : _produced) {
      if (RangeCovers(*range, *ParseMediaRange(produced))) {
        return true;
      }
    }
  }
  return false;
}

bool RouteMatcher::contentTypeSatisfied(std::string_view contentTypeValue) const {
  const auto received = ParseMediaRange(contentTypeValue);
  if (!received || received->type == "*" || received->subtype == "*") {
    return false;
  }
  for (const std::string& consumed : _consumed) {
    if (RangeCovers(*ParseMediaRange(consumed), *received)) {
      return true;
    }
  }
  return false;
}

}  // namespace trellis
