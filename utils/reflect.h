#pragma once

// HINT: It's recommended to include this "heavy" header
// (which involves huge amount of metaprogramming operations)
// into some specific source file instead of using it as header-only
// to reduce compilation overhead.

#include "utils/demangle.h"
#include "utils/easylog.h"
#include "utils/utils.h"
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>
#include <rfl/internal/has_reflection_type_v.hpp>
#include <rfl/internal/is_rename.hpp>
#include <rfl/named_tuple_t.hpp>
#include <rfl/to_view.hpp>
#include <set>

namespace details {
template <class T, class = void>
struct ReflectionTypeHelper {
  using type = T;
};

// rfl::Validator<T, ...> -> T
template <class T>
struct ReflectionTypeHelper<T, std::enable_if_t<rfl::internal::has_reflection_type_v<T>>> {
  using type = typename T::ReflectionType;
};

// rfl::Rename<Name, T> -> T
template <class T>
struct ReflectionTypeHelper<T, std::enable_if_t<rfl::internal::is_rename_v<T>>> {
  using type = typename ReflectionTypeHelper<typename T::Type>::type;
};
} // namespace details

template <class T>
using ReflectionType = typename details::ReflectionTypeHelper<T>::type;

template <class Field>
using FieldReflectionType = ReflectionType<typename Field::Type>;

namespace details {
template <class Field, class TView, class Func>
inline auto for_each_field_visitor(const TView& value_view, Func&& func) {
  constexpr auto name_literal = Field::name_;
  std::invoke(func, name_literal.str(), *value_view.template get<name_literal>());
}

template <class FieldTuple, class TView, class Func, size_t... Indices>
inline auto for_each_field_impl(const TView& value_view, Func&& func, std::index_sequence<Indices...>) -> void {
  (for_each_field_visitor<std::tuple_element_t<Indices, FieldTuple>>(value_view, func), ...);
}
} // namespace details

// Invokes func(name, field) for each field of value, with the members of rfl::Flatten fields expanded.
template <class T, class Func>
inline auto for_each_field(T& value, Func&& func) -> void {
  using FieldTuple = typename rfl::named_tuple_t<T>::Fields;
  details::for_each_field_impl<FieldTuple>(rfl::to_view(value), func,
                                           std::make_index_sequence<std::tuple_size_v<FieldTuple>>{});
}

// Reads each field of value from the JSON object whose key is the field name. Absent fields are left unchanged,
// and keys that are not field names are ignored with a warning.
// Enumerators are read by name. Exceptions may be thrown for ill-formed values.
template <class T>
inline auto read_fields_from_json(T& value, const json& json_root) -> void {
  auto known_keys = std::set<std::string, std::less<>>{};
  for_each_field(value, [&]<class Field>(std::string_view key, Field& field) {
    known_keys.emplace(key);
    auto it = json_root.find(key);
    if (it == json_root.end()) {
      return;
    }
    using Value = ReflectionType<Field>;
    if constexpr (std::is_enum_v<Value>) {
      auto enum_str = it->template get<std::string>();
      auto enum_value = magic_enum::enum_cast<Value>(enum_str);
      if (!enum_value) {
        constexpr auto msg_pattern = "Invalid enumerator string '{}' for type {}.";
        throw std::invalid_argument{fmt::format(msg_pattern, enum_str, demangle_type_name<Value>())};
      }
      field = *enum_value;
    } else {
      // Triggers check during operator= for rfl::Validator types
      field = it->template get<Value>();
    }
  });
  for (const auto& item : json_root.items()) {
    if (!known_keys.contains(item.key())) {
      ELOGFMT(WARNING, "Unknown configuration key '{}' is ignored.", item.key());
    }
  }
}
