#include "scenario.h"
#include "utils/easylog.h"
#include <fstream>

auto ScenarioStore::from_scenarios(std::vector<ScenarioInstance> scenarios) -> rfl::Result<ScenarioStore> {
  ranges::sort(scenarios, ranges::less{}, &ScenarioInstance::scenario_id);
  for (const auto& [s0, s1] : views::adjacent<2>(scenarios)) {
    if (s0.scenario_id == s1.scenario_id) {
      return rfl::Error{fmt::format("Duplicated scenario id '{}' is disallowed.", s0.scenario_id)};
    }
  }
  return ScenarioStore{std::move(scenarios)};
}

auto ScenarioStore::find(std::string_view scenario_id) const -> const ScenarioInstance* {
  auto it = ranges::lower_bound(scenarios_, scenario_id, ranges::less{}, &ScenarioInstance::scenario_id);
  if (it == scenarios_.end() || it->scenario_id != scenario_id) {
    return nullptr;
  }
  return &*it;
}

auto scenario_store_from_json(const json& json_root) -> rfl::Result<ScenarioStore> try {
  const auto& json_scenarios = json_root.at("scenarios");
  auto scenarios = make_reserved_vector<ScenarioInstance>(json_scenarios.size());
  for (const auto& json_obj : json_scenarios) {
    auto scenario_id = json_obj.at("scenario_id").get<std::string>();
    auto generation_parameters = parameter_map_from_json(json_obj.at("generation_parameters"));
    if (!generation_parameters) {
      constexpr auto msg_pattern = "Invalid generation parameters of scenario '{}': {}";
      return rfl::Error{fmt::format(msg_pattern, scenario_id, generation_parameters.error()->what())};
    }
    scenarios.push_back({.scenario_id = std::move(scenario_id), .generation_parameters = *generation_parameters});
  }
  return ScenarioStore::from_scenarios(std::move(scenarios));
}
RFL_RESULT_CATCH_HANDLER()

auto read_scenario_store(const std::string& path) -> rfl::Result<ScenarioStore> try {
  auto fin = std::ifstream{path};
  if (!fin.is_open()) {
    return rfl::Error{fmt::format("Failed to open scenario file '{}'.", path)};
  }
  return with_error_context(scenario_store_from_json(json::parse(fin)), path).transform([&](ScenarioStore store) {
    ELOGFMT(INFO, "Done reading {} scenarios from '{}'.", store.size(), path);
    return store;
  });
}
RFL_RESULT_CATCH_HANDLER()
