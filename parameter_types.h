#pragma once

#include "utils/result.h"
#include "utils/utils.h"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

// Scalar value of an algorithm parameter or of a scenario generation parameter.
// Values holding different alternatives are ordered by alternative index, i.e. bool < integer < floating-point < string.
// Note that integer 1 and floating-point 1.0 are different values.
using ParameterValue = std::variant<bool, int64_t, double, std::string>;

// Ordered by parameter name so that traversal (and thus every derived output) is deterministic.
using ParameterMap = std::map<std::string, ParameterValue, std::less<>>;

// Tuple of values, one for each key of a key subset, in the same order as the keys.
using ParameterValueTuple = std::vector<ParameterValue>;

// Formats as "true", "40", "0.5" or the string itself, used for file names and plot titles.
auto to_string(const ParameterValue& value) -> std::string;

auto parameter_value_to_json(const ParameterValue& value) -> json;

// Null, arrays and objects are not scalar and thus rejected.
auto parameter_value_from_json(const json& json_value) -> rfl::Result<ParameterValue>;

auto parameter_map_to_json(const ParameterMap& parameters) -> json;

auto parameter_map_from_json(const json& json_obj) -> rfl::Result<ParameterMap>;

// Returns nullptr if key is absent.
inline auto find_parameter(const ParameterMap& parameters, std::string_view key) -> const ParameterValue* {
  auto it = parameters.find(key);
  return it == parameters.end() ? nullptr : &it->second;
}
