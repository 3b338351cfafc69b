#pragma once

#include "parameter_types.h"
#include <span>

// One fully-resolved set of parameters of an algorithm, i.e. one point of the expanded parameter grid.
// (algorithm_id, config_index) is unique among all the configurations expanded from the same grid.
struct ExecutionConfig {
  std::string algorithm_id;
  size_t config_index;
  ParameterMap parameters;

  auto operator==(const ExecutionConfig& rhs) const -> bool = default;
};

// Candidate values of each parameter of a single algorithm.
// The order of parameters determines the order of expansion (see below).
struct AlgorithmParameterGrid {
  std::string algorithm_id;
  std::vector<std::pair<std::string, std::vector<ParameterValue>>> parameters;
};

using ParameterGrid = std::vector<AlgorithmParameterGrid>;

// Full cross product of the candidate values, the last parameter varying fastest.
// config_index = position in the expansion.
// An algorithm without parameters yields exactly 1 configuration with empty parameters,
// while any empty candidate list yields no configuration at all.
auto expand_parameter_grid(const AlgorithmParameterGrid& grid) -> std::vector<ExecutionConfig>;

// Concatenation of the expansion of each algorithm in the given order.
auto expand_parameter_grid(const ParameterGrid& grid) -> std::vector<ExecutionConfig>;

// Format: { "<algorithm_id>": { "<parameter>": [<value>, ...], ... }, ... }
// Algorithms and parameters are taken in lexicographic order of their names.
auto parameter_grid_from_json(const json& json_root) -> rfl::Result<ParameterGrid>;

auto read_parameter_grid(const std::string& path) -> rfl::Result<ParameterGrid>;

auto execution_config_to_json(const ExecutionConfig& config) -> json;

auto execution_config_from_json(const json& json_obj) -> rfl::Result<ExecutionConfig>;

auto write_execution_configs(const std::string& path, std::span<const ExecutionConfig> configs) -> ResultVoid;

auto read_execution_configs(const std::string& path) -> rfl::Result<std::vector<ExecutionConfig>>;
