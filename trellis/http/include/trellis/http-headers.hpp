#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/vector.hpp"

namespace trellis::http {

// Ordered list of header fields. Names compare case-insensitively, insertion order and duplicates are kept.
class HttpHeaders {
 public:
  struct Field {
    std::string name;
    std::string value;
  };

  HttpHeaders() noexcept = default;

  HttpHeaders(std::initializer_list<std::pair<std::string_view, std::string_view>> fields);

  // Appends a field, keeping existing ones with the same name.
  HttpHeaders& append(std::string_view name, std::string_view value);

  // Replaces all fields named 'name' by a single one (appended at the end if absent).
  HttpHeaders& set(std::string_view name, std::string_view value);

  // Removes all fields named 'name', returns the number of removed fields.
  std::size_t erase(std::string_view name);

  // First value of 'name', if any.
  [[nodiscard]] std::optional<std::string_view> value(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view valueOrEmpty(std::string_view name) const noexcept {
    return value(name).value_or(std::string_view{});
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return value(name).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  [[nodiscard]] auto begin() const noexcept { return _fields.begin(); }
  [[nodiscard]] auto end() const noexcept { return _fields.end(); }

 private:
  vector<Field> _fields;
};

}  // namespace trellis::http
