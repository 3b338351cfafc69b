#pragma once

#include "parameter_types.h"
#include <span>

// One generated problem instance. Only the generation parameters are visible here,
// since topology and demands are consumed by the solver adapters alone.
struct ScenarioInstance {
  std::string scenario_id;
  ParameterMap generation_parameters;

  auto operator==(const ScenarioInstance& rhs) const -> bool = default;
};

// Read-only collection of scenarios, sorted by scenario id.
class ScenarioStore {
public:
  ScenarioStore() = default;

  // Fails if any scenario id is duplicated.
  static auto from_scenarios(std::vector<ScenarioInstance> scenarios) -> rfl::Result<ScenarioStore>;

  // Returns nullptr if not found.
  auto find(std::string_view scenario_id) const -> const ScenarioInstance*;

  auto scenarios() const -> std::span<const ScenarioInstance> {
    return scenarios_;
  }

  auto size() const -> size_t {
    return scenarios_.size();
  }

private:
  explicit ScenarioStore(std::vector<ScenarioInstance> sorted_scenarios) : scenarios_(std::move(sorted_scenarios)) {}

  std::vector<ScenarioInstance> scenarios_;
};

// Format: { "scenarios": [ { "scenario_id": "...", "generation_parameters": { ... } }, ... ] }
auto scenario_store_from_json(const json& json_root) -> rfl::Result<ScenarioStore>;

auto read_scenario_store(const std::string& path) -> rfl::Result<ScenarioStore>;
