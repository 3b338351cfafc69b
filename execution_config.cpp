#include "execution_config.h"
#include "utils/easylog.h"
#include <fstream>

auto expand_parameter_grid(const AlgorithmParameterGrid& grid) -> std::vector<ExecutionConfig> {
  const auto& params = grid.parameters;
  auto n_configs = 1zu;
  for (const auto& [name, values] : params) {
    n_configs *= values.size();
  }
  auto res = make_reserved_vector<ExecutionConfig>(n_configs);
  // Odometer over the candidate lists: indices[i] is the current position in params[i].second
  auto indices = std::vector<size_t>(params.size(), 0);
  for (auto config_index : range(n_configs)) {
    auto config = ExecutionConfig{.algorithm_id = grid.algorithm_id, .config_index = config_index, .parameters = {}};
    for (auto i : range(params.size())) {
      config.parameters.emplace(params[i].first, params[i].second[indices[i]]);
    }
    res.push_back(std::move(config));
    // Increments the odometer, the last one first
    for (auto i = params.size(); i > 0; i--) {
      if (++indices[i - 1] < params[i - 1].second.size()) {
        break;
      }
      indices[i - 1] = 0;
    }
  }
  VNEPLOG_FMT_DEBUG("{} execution configs expanded for algorithm '{}'.", res.size(), grid.algorithm_id);
  return res;
}

auto expand_parameter_grid(const ParameterGrid& grid) -> std::vector<ExecutionConfig> {
  auto res = std::vector<ExecutionConfig>{};
  for (const auto& algorithm_grid : grid) {
    ranges::move(expand_parameter_grid(algorithm_grid), std::back_inserter(res));
  }
  return res;
}

auto parameter_grid_from_json(const json& json_root) -> rfl::Result<ParameterGrid> {
  if (!json_root.is_object()) {
    return rfl::Error{"Parameter grid must be a JSON object of algorithm_id -> { parameter -> [values] }."};
  }
  auto res = ParameterGrid{};
  for (const auto& [algorithm_id, json_params] : json_root.items()) {
    if (!json_params.is_object()) {
      return rfl::Error{fmt::format("Parameters of algorithm '{}' must be a JSON object.", algorithm_id)};
    }
    auto& algorithm_grid = res.emplace_back(AlgorithmParameterGrid{.algorithm_id = algorithm_id, .parameters = {}});
    for (const auto& [name, json_values] : json_params.items()) {
      if (!json_values.is_array() || json_values.empty()) {
        constexpr auto msg_pattern = "Candidate values of parameter '{}' of algorithm '{}' must be a non-empty list.";
        return rfl::Error{fmt::format(msg_pattern, name, algorithm_id)};
      }
      auto values = make_reserved_vector<ParameterValue>(json_values.size());
      for (const auto& json_value : json_values) {
        auto value = parameter_value_from_json(json_value);
        RFL_RETURN_ON_ERROR(value);
        values.push_back(std::move(*value));
      }
      algorithm_grid.parameters.emplace_back(name, std::move(values));
    }
  }
  return res;
}

auto read_parameter_grid(const std::string& path) -> rfl::Result<ParameterGrid> try {
  auto fin = std::ifstream{path};
  if (!fin.is_open()) {
    return rfl::Error{fmt::format("Failed to open parameter grid file '{}'.", path)};
  }
  return with_error_context(parameter_grid_from_json(json::parse(fin)), path);
}
RFL_RESULT_CATCH_HANDLER()

auto execution_config_to_json(const ExecutionConfig& config) -> json {
  return json{
      {"algorithm_id", config.algorithm_id},
      {"config_index", config.config_index},
      {"parameters", parameter_map_to_json(config.parameters)},
  };
}

auto execution_config_from_json(const json& json_obj) -> rfl::Result<ExecutionConfig> try {
  return parameter_map_from_json(json_obj.at("parameters")).transform([&](ParameterMap parameters) {
    return ExecutionConfig{
        .algorithm_id = json_obj.at("algorithm_id").get<std::string>(),
        .config_index = json_obj.at("config_index").get<size_t>(),
        .parameters = std::move(parameters),
    };
  });
}
RFL_RESULT_CATCH_HANDLER()

auto write_execution_configs(const std::string& path, std::span<const ExecutionConfig> configs) -> ResultVoid {
  auto fout = std::ofstream{path};
  if (!fout.is_open()) {
    return rfl::Error{fmt::format("Failed to open output file '{}'.", path)};
  }
  auto json_root = json::array();
  for (const auto& config : configs) {
    json_root.push_back(execution_config_to_json(config));
  }
  fout << json_root.dump(4);
  if (!fout) {
    return rfl::Error{fmt::format("Failed to write execution configs to '{}'.", path)};
  }
  return RESULT_VOID_SUCCESS;
}

auto read_execution_configs(const std::string& path) -> rfl::Result<std::vector<ExecutionConfig>> try {
  auto fin = std::ifstream{path};
  if (!fin.is_open()) {
    return rfl::Error{fmt::format("Failed to open execution config file '{}'.", path)};
  }
  auto json_root = json::parse(fin);
  auto res = std::vector<ExecutionConfig>{};
  for (const auto& json_obj : json_root) {
    auto config = execution_config_from_json(json_obj);
    RFL_RETURN_ON_ERROR(config);
    res.push_back(std::move(*config));
  }
  return res;
}
RFL_RESULT_CATCH_HANDLER()
