#include "parameter_types.h"
#include <magic_enum.hpp>

namespace {
// Overload set for std::visit
template <class... Fns>
struct Overloaded : Fns... {
  using Fns::operator()...;
};
} // namespace

auto to_string(const ParameterValue& value) -> std::string {
  return std::visit(Overloaded{
                        [](bool b) -> std::string { return b ? "true" : "false"; },
                        [](int64_t i) -> std::string { return fmt::format("{}", i); },
                        [](double d) -> std::string { return fmt::format("{}", d); },
                        [](const std::string& s) -> std::string { return s; },
                    },
                    value);
}

auto parameter_value_to_json(const ParameterValue& value) -> json {
  return std::visit([](const auto& v) { return json(v); }, value);
}

auto parameter_value_from_json(const json& json_value) -> rfl::Result<ParameterValue> {
  switch (json_value.type()) {
  case json::value_t::boolean:
    return ParameterValue{json_value.get<bool>()};
  case json::value_t::number_integer:
  case json::value_t::number_unsigned:
    return ParameterValue{json_value.get<int64_t>()};
  case json::value_t::number_float:
    return ParameterValue{json_value.get<double>()};
  case json::value_t::string:
    return ParameterValue{json_value.get<std::string>()};
  default:
    constexpr auto msg_pattern = "Parameter value must be a scalar, while JSON value of type {} is given: {}";
    return rfl::Error{fmt::format(msg_pattern, magic_enum::enum_name(json_value.type()), json_value.dump())};
  }
}

auto parameter_map_to_json(const ParameterMap& parameters) -> json {
  auto res = json::object();
  for (const auto& [key, value] : parameters) {
    res[key] = parameter_value_to_json(value);
  }
  return res;
}

auto parameter_map_from_json(const json& json_obj) -> rfl::Result<ParameterMap> {
  if (!json_obj.is_object()) {
    return rfl::Error{fmt::format("Parameter map must be a JSON object, while {} is given.", json_obj.dump())};
  }
  auto res = ParameterMap{};
  for (const auto& [key, json_value] : json_obj.items()) {
    auto value = parameter_value_from_json(json_value);
    if (!value) {
      return rfl::Error{fmt::format("Invalid value of parameter '{}': {}", key, value.error()->what())};
    }
    res.emplace(key, std::move(*value));
  }
  return res;
}
