#pragma once

#include "parameter_types.h"
#include "solution_payloads.h"
#include <compare>

enum class RunStatus { SUCCESS, TIMEOUT, ERROR };

// Identity of a task, and thus of its record, in the result archive.
struct ArchiveKey {
  std::string scenario_id;
  std::string algorithm_id;
  size_t config_index;

  auto operator<=>(const ArchiveKey& rhs) const = default;
};

auto to_string(const ArchiveKey& key) -> std::string;

// Outcome of one (scenario, execution config) task. Never mutated after creation.
struct ResultRecord {
  std::string scenario_id;
  std::string algorithm_id;
  size_t config_index;
  RunStatus status;
  // std::monostate unless status == SUCCESS
  RawPayload raw_payload;
  double runtime_seconds;
  // Describes the failure for TIMEOUT and ERROR records; empty otherwise.
  std::string diagnostic;

  auto key() const -> ArchiveKey {
    return {.scenario_id = scenario_id, .algorithm_id = algorithm_id, .config_index = config_index};
  }
};

// Plot-relevant data of a result record, without the solver payload.
struct PlotRecord {
  std::string scenario_id;
  std::string algorithm_id;
  size_t config_index;
  // Copied from the scenario
  ParameterMap generation_parameters;
  // Empty unless status == SUCCESS. NaN represents a missing value.
  std::map<std::string, double, std::less<>> metrics;
  RunStatus status;

  auto key() const -> ArchiveKey {
    return {.scenario_id = scenario_id, .algorithm_id = algorithm_id, .config_index = config_index};
  }

  // NaN metrics compare equal to each other.
  auto operator==(const PlotRecord& rhs) const -> bool;
};

// NaN is written as null since JSON has no representation of it.
inline auto number_to_json(double value) -> json {
  return std::isnan(value) ? json(nullptr) : json(value);
}

// Returns NaN if the metric is absent.
auto get_metric(const PlotRecord& record, std::string_view metric) -> double;

auto result_record_to_json(const ResultRecord& record) -> json;

auto result_record_from_json(const json& json_obj) -> rfl::Result<ResultRecord>;

// NaN metrics are written as null.
auto plot_record_to_json(const PlotRecord& record) -> json;

auto plot_record_from_json(const json& json_obj) -> rfl::Result<PlotRecord>;
