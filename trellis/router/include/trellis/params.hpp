#pragma once

#include <charconv>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "trellis/extraction-error.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace detail {

template <class T>
concept HasFromParam = requires(std::string_view text) {
  { T::FromParam(text) } -> std::convertible_to<T>;
};

[[noreturn]] void ThrowInvalidParam(std::string_view name, std::string_view text);

[[noreturn]] void ThrowMissingParam(std::string_view name);

}  // namespace detail

// Types a parameter can be converted to. Custom types provide 'static T FromParam(std::string_view)', which may throw
// ExtractionError.
template <class T>
concept ParamType = std::same_as<T, std::string> || std::is_arithmetic_v<T> || detail::HasFromParam<T>;

// Converts the decoded text of parameter 'name' into a T. Throws ExtractionError if it does not represent one.
// bool accepts "true" / "1" and "false" / "0". Numbers must be fully consumed by std::from_chars.
template <ParamType T>
T ParseParam(std::string_view name, std::string_view text) {
  if constexpr (std::is_same_v<T, std::string>) {
    return std::string(text);
  } else if constexpr (std::is_same_v<T, bool>) {
    if (text == "true" || text == "1") {
      return true;
    }
    if (text == "false" || text == "0") {
      return false;
    }
    detail::ThrowInvalidParam(name, text);
  } else if constexpr (std::is_arithmetic_v<T>) {
    T value{};
    const char* last = text.data() + text.size();
    const auto [ptr, errc] = std::from_chars(text.data(), last, value);
    if (errc != std::errc{} || ptr != last || text.empty()) {
      detail::ThrowInvalidParam(name, text);
    }
    return value;
  } else {
    return T::FromParam(text);
  }
}

// Ordered multimap of named parameters holding decoded text. A name may be bound to several values (a glob capture, a
// repeated query key).
template <class Derived>
class ParamMap {
 public:
  struct Entry {
    std::string name;
    std::string value;
  };

  void add(std::string_view name, std::string_view value) {
    _entries.push_back(Entry{std::string(name), std::string(value)});
  }

  void append(const Derived& other) {
    for (const Entry& entry : other) {
      _entries.push_back(entry);
    }
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return value(name).has_value(); }

  // Text of the first value bound to 'name'.
  [[nodiscard]] std::optional<std::string_view> value(std::string_view name) const noexcept {
    for (const Entry& entry : _entries) {
      if (entry.name == name) {
        return std::string_view(entry.value);
      }
    }
    return std::nullopt;
  }

  // Text of all values bound to 'name', in binding order.
  [[nodiscard]] vector<std::string_view> values(std::string_view name) const {
    vector<std::string_view> ret;
    for (const Entry& entry : _entries) {
      if (entry.name == name) {
        ret.push_back(entry.value);
      }
    }
    return ret;
  }

  // First value of 'name' converted to T. Throws ExtractionError if absent or invalid.
  template <ParamType T>
  [[nodiscard]] T get(std::string_view name) const {
    const auto stored = value(name);
    if (!stored) {
      detail::ThrowMissingParam(name);
    }
    return ParseParam<T>(name, *stored);
  }

  // Like get, but an absent parameter yields std::nullopt. An invalid one still throws.
  template <ParamType T>
  [[nodiscard]] std::optional<T> getOptional(std::string_view name) const {
    const auto stored = value(name);
    if (!stored) {
      return std::nullopt;
    }
    return ParseParam<T>(name, *stored);
  }

  // All values of 'name' converted to T, possibly none.
  template <ParamType T>
  [[nodiscard]] vector<T> getAll(std::string_view name) const {
    vector<T> ret;
    for (const Entry& entry : _entries) {
      if (entry.name == name) {
        ret.push_back(ParseParam<T>(name, entry.value));
      }
    }
    return ret;
  }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] auto begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] auto end() const noexcept { return _entries.end(); }

  void clear() noexcept { _entries.clear(); }

 private:
  vector<Entry> _entries;
};

// Parameters captured from the request path, from segments the router already percent-decoded.
class PathParams : public ParamMap<PathParams> {};

// Parameters of the query string.
class QueryParams : public ParamMap<QueryParams> {};

// Parses a query string with application/x-www-form-urlencoded rules: '&' separated pairs, '+' is a space, keys and
// values are percent-decoded on a best effort basis. A pair without '=' binds an empty value, empty pairs are skipped.
QueryParams ParseQueryString(std::string_view query);

}  // namespace trellis
