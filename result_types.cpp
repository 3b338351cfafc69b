#include "result_types.h"
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>

namespace {
auto status_from_json(const json& json_value) -> rfl::Result<RunStatus> {
  auto status_str = json_value.get<std::string>();
  auto status = magic_enum::enum_cast<RunStatus>(status_str);
  if (!status) {
    return rfl::Error{fmt::format("Invalid run status '{}'.", status_str)};
  }
  return *status;
}

auto metric_equal(double lhs, double rhs) -> bool {
  return (std::isnan(lhs) && std::isnan(rhs)) || lhs == rhs;
}
} // namespace

auto to_string(const ArchiveKey& key) -> std::string {
  return fmt::format("(scenario = '{}', algorithm = '{}', config #{})", key.scenario_id, key.algorithm_id,
                     key.config_index);
}

auto PlotRecord::operator==(const PlotRecord& rhs) const -> bool {
  if (key() != rhs.key() || status != rhs.status || generation_parameters != rhs.generation_parameters) {
    return false;
  }
  return ranges::equal(metrics, rhs.metrics, [](const auto& lhs_item, const auto& rhs_item) {
    return lhs_item.first == rhs_item.first && metric_equal(lhs_item.second, rhs_item.second);
  });
}

auto get_metric(const PlotRecord& record, std::string_view metric) -> double {
  auto it = record.metrics.find(metric);
  return it == record.metrics.end() ? NAN_VALUE : it->second;
}

auto result_record_to_json(const ResultRecord& record) -> json {
  auto res = json{
      {"scenario_id", record.scenario_id},
      {"algorithm_id", record.algorithm_id},
      {"config_index", record.config_index},
      {"status", std::string{magic_enum::enum_name(record.status)}},
      {"runtime_seconds", record.runtime_seconds},
      {"payload", payload_to_json(record.raw_payload)},
  };
  if (!record.diagnostic.empty()) {
    res["diagnostic"] = record.diagnostic;
  }
  return res;
}

auto result_record_from_json(const json& json_obj) -> rfl::Result<ResultRecord> try {
  auto status = status_from_json(json_obj.at("status"));
  RFL_RETURN_ON_ERROR(status);
  auto payload = payload_from_json(json_obj.at("payload"));
  RFL_RETURN_ON_ERROR(payload);
  return ResultRecord{
      .scenario_id = json_obj.at("scenario_id").get<std::string>(),
      .algorithm_id = json_obj.at("algorithm_id").get<std::string>(),
      .config_index = json_obj.at("config_index").get<size_t>(),
      .status = *status,
      .raw_payload = std::move(*payload),
      .runtime_seconds = json_obj.at("runtime_seconds").get<double>(),
      .diagnostic = json_obj.value("diagnostic", ""),
  };
}
RFL_RESULT_CATCH_HANDLER()

auto plot_record_to_json(const PlotRecord& record) -> json {
  auto metrics = json::object();
  for (const auto& [name, value] : record.metrics) {
    metrics[name] = number_to_json(value);
  }
  return json{
      {"scenario_id", record.scenario_id},
      {"algorithm_id", record.algorithm_id},
      {"config_index", record.config_index},
      {"status", std::string{magic_enum::enum_name(record.status)}},
      {"generation_parameters", parameter_map_to_json(record.generation_parameters)},
      {"metrics", std::move(metrics)},
  };
}

auto plot_record_from_json(const json& json_obj) -> rfl::Result<PlotRecord> try {
  auto status = status_from_json(json_obj.at("status"));
  RFL_RETURN_ON_ERROR(status);
  auto generation_parameters = parameter_map_from_json(json_obj.at("generation_parameters"));
  RFL_RETURN_ON_ERROR(generation_parameters);

  auto res = PlotRecord{
      .scenario_id = json_obj.at("scenario_id").get<std::string>(),
      .algorithm_id = json_obj.at("algorithm_id").get<std::string>(),
      .config_index = json_obj.at("config_index").get<size_t>(),
      .generation_parameters = std::move(*generation_parameters),
      .metrics = {},
      .status = *status,
  };
  for (const auto& [name, value] : json_obj.at("metrics").items()) {
    res.metrics.emplace(name, value.is_null() ? NAN_VALUE : value.get<double>());
  }
  return res;
}
RFL_RESULT_CATCH_HANDLER()
