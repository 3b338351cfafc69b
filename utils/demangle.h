#pragma once

#include <nwgraph/util/demangle.hpp>
#include <string>

template <class T>
inline auto demangle_type_name() -> std::string {
  return nw::graph::demangle(typeid(T).name(), nullptr, nullptr, nullptr);
}

// Dynamic type is used, e.g. the concrete exception type behind std::exception&.
template <class T>
inline auto demangle_type_name(const T& value) -> std::string {
  return nw::graph::demangle(typeid(value).name(), nullptr, nullptr, nullptr);
}
