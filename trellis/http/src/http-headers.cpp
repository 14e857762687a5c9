#include "trellis/http-headers.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <utility>

#include "trellis/string-equal-ignore-case.hpp"

namespace trellis::http {

HttpHeaders::HttpHeaders(std::initializer_list<std::pair<std::string_view, std::string_view>> fields) {
  _fields.reserve(fields.size());
  for (const auto& [name, value] : fields) {
    append(name, value);
  }
}

HttpHeaders& HttpHeaders::append(std::string_view name, std::string_view value) {
  _fields.push_back(Field{std::string(name), std::string(value)});
  return *this;
}

HttpHeaders& HttpHeaders::set(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return append(name, value);
  }
  it->value.assign(value);
  // drop the duplicates after the first occurrence
  auto dupIt = std::remove_if(std::next(it), _fields.end(),
                              [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); });
  _fields.erase(dupIt, _fields.end());
  return *this;
}

std::size_t HttpHeaders::erase(std::string_view name) {
  const auto oldSize = _fields.size();
  auto it = std::remove_if(_fields.begin(), _fields.end(),
                           [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); });
  _fields.erase(it, _fields.end());
  return oldSize - _fields.size();
}

std::optional<std::string_view> HttpHeaders::value(std::string_view name) const noexcept {
  for (const Field& field : _fields) {
    if (CaseInsensitiveEqual(field.name, name)) {
      return std::string_view(field.value);
    }
  }
  return std::nullopt;
}

}  // namespace trellis::http
