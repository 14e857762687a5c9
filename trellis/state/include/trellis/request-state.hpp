#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "trellis/flat-hash-map.hpp"

namespace trellis {

// Raised when a value of the requested type is not present in a RequestState.
class StateDataAbsent : public std::logic_error {
 public:
  explicit StateDataAbsent(const std::type_info& type);

  // Demangled name of the missing type.
  [[nodiscard]] const std::string& typeName() const noexcept { return _typeName; }

 private:
  std::string _typeName;
};

// Request scoped heterogeneous container, holding at most one value per type.
// It is owned by the single request that created it and is neither copyable nor shareable across threads.
// Use snapshot() to hand independent copies of selected values to concurrent sub-tasks.
class RequestState {
 public:
  RequestState() = default;

  RequestState(const RequestState&) = delete;
  RequestState& operator=(const RequestState&) = delete;

  RequestState(RequestState&&) = default;
  RequestState& operator=(RequestState&&) = default;

  ~RequestState() = default;

  // Stores 'value', replacing any previous value of the same type.
  template <class T>
  void put(T value) {
    _slots[std::type_index(typeid(T))] = std::make_unique<TypedSlot<T>>(std::move(value));
  }

  template <class T>
  [[nodiscard]] bool has() const {
    return _slots.find(std::type_index(typeid(T))) != _slots.end();
  }

  template <class T>
  [[nodiscard]] const T* tryBorrow() const {
    const auto it = _slots.find(std::type_index(typeid(T)));
    return it == _slots.end() ? nullptr : &static_cast<const TypedSlot<T>&>(*it->second).value;
  }

  template <class T>
  [[nodiscard]] T* tryBorrowMut() {
    const auto it = _slots.find(std::type_index(typeid(T)));
    return it == _slots.end() ? nullptr : &static_cast<TypedSlot<T>&>(*it->second).value;
  }

  // Throws StateDataAbsent if no value of type T is present.
  template <class T>
  [[nodiscard]] const T& borrow() const {
    const T* ptr = tryBorrow<T>();
    if (ptr == nullptr) {
      throw StateDataAbsent(typeid(T));
    }
    return *ptr;
  }

  // Throws StateDataAbsent if no value of type T is present.
  template <class T>
  [[nodiscard]] T& borrowMut() {
    T* ptr = tryBorrowMut<T>();
    if (ptr == nullptr) {
      throw StateDataAbsent(typeid(T));
    }
    return *ptr;
  }

  // Removes and returns the value of type T, if any.
  template <class T>
  [[nodiscard]] std::optional<T> tryTake() {
    const auto it = _slots.find(std::type_index(typeid(T)));
    if (it == _slots.end()) {
      return std::nullopt;
    }
    std::optional<T> value(std::move(static_cast<TypedSlot<T>&>(*it->second).value));
    _slots.erase(it);
    return value;
  }

  // Removes and returns the value of type T. Throws StateDataAbsent if absent.
  template <class T>
  [[nodiscard]] T take() {
    std::optional<T> value = tryTake<T>();
    if (!value) {
      throw StateDataAbsent(typeid(T));
    }
    return std::move(*value);
  }

  // New independent state holding copies of the values of types Ts... present in this one.
  template <class... Ts>
  [[nodiscard]] RequestState snapshot() const {
    RequestState copy;
    (copy.copyFrom<Ts>(*this), ...);
    return copy;
  }

  [[nodiscard]] std::size_t size() const noexcept { return _slots.size(); }

  [[nodiscard]] bool empty() const noexcept { return _slots.empty(); }

 private:
  struct Slot {
    virtual ~Slot() = default;
  };

  template <class T>
  struct TypedSlot final : Slot {
    explicit TypedSlot(T val) : value(std::move(val)) {}

    T value;
  };

  template <class T>
  void copyFrom(const RequestState& other) {
    if (const T* ptr = other.tryBorrow<T>()) {
      put<T>(*ptr);
    }
  }

  flat_hash_map<std::type_index, std::unique_ptr<Slot>> _slots;
};

}  // namespace trellis
