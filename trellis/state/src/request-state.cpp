#include "trellis/request-state.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <typeinfo>

namespace trellis {

namespace {

std::string DemangledName(const std::type_info& type) {
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled(abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
                                                        &std::free);
  if (status != 0 || demangled == nullptr) {
    return type.name();
  }
  return demangled.get();
}

}  // namespace

StateDataAbsent::StateDataAbsent(const std::type_info& type)
    : std::logic_error("no value of type " + DemangledName(type) + " in request state"),
      _typeName(DemangledName(type)) {}

}  // namespace trellis
