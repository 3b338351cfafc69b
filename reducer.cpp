#include "reducer.h"
#include "utils/easylog.h"
#include <fstream>
#include <functional>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>

namespace {
using MetricMap = std::map<std::string, double, std::less<>>;

// Values at or below are treated as "no bound" by the solver
constexpr auto MISSING_ROOT_BOUND_THRESHOLD = -1e40;
// Values at or above are treated as "no bound" by the solver
constexpr auto MISSING_FINAL_BOUND_THRESHOLD = 1e70;
// Requests count is an integer stored as floating point
constexpr auto MIN_FEASIBLE_REQUESTS = 0.5;
// The resource type of substrate nodes. Any other type denotes an edge resource.
constexpr auto NODE_RESOURCE_TYPE = "universal"sv;

auto value_or_nan(const std::optional<double>& value) -> double {
  return value.value_or(NAN_VALUE);
}

auto value_or_nan(const std::optional<int64_t>& value) -> double {
  return value ? static_cast<double>(*value) : NAN_VALUE;
}

struct LoadSummary {
  double avg = NAN_VALUE;
  double max = NAN_VALUE;
};

template <forward_range_of<double> Range>
auto summarize_loads(Range&& loads) -> LoadSummary {
  auto res = LoadSummary{};
  auto n = 0zu;
  auto sum = 0.0;
  for (auto load : loads) {
    res.max = (n == 0) ? load : std::max(res.max, load);
    sum += load;
    n += 1;
  }
  if (n != 0) {
    res.avg = sum / n;
  }
  return res;
}

auto root_dual_bound(const ClassicMCFPayload& payload) -> double {
  auto res = std::optional<double>{};
  if (payload.root_relaxation_entry) {
    res = payload.root_relaxation_entry->objective_bound;
  }
  if (payload.temporal_log && !payload.temporal_log->empty()) {
    auto first = payload.temporal_log->front().objective_bound;
    res = res ? std::max(*res, first) : first;
  }
  return (!res || *res < MISSING_ROOT_BOUND_THRESHOLD) ? NAN_VALUE : *res;
}

auto final_dual_bound(const ClassicMCFPayload& payload) -> double {
  auto res = payload.objective_bound;
  if (payload.temporal_log && !payload.temporal_log->empty()) {
    res = ranges::min(*payload.temporal_log | views::transform(&TemporalLogEntry::objective_bound));
  }
  return (!res || *res > MISSING_FINAL_BOUND_THRESHOLD) ? NAN_VALUE : *res;
}

auto extract_metrics(const ClassicMCFPayload& payload, double record_runtime) -> MetricMap {
  auto res = MetricMap{
      {"objective_value", payload.objective_value},
      {"objective_bound", value_or_nan(payload.objective_bound)},
      {"objective_gap", value_or_nan(payload.objective_gap) * 100.0},
      {"embedding_ratio", payload.embedding_ratio * 100.0},
      {"feasible_requests", value_or_nan(payload.feasible_requests)},
      {"root_dual_bound", root_dual_bound(payload)},
      {"final_dual_bound", final_dual_bound(payload)},
  };
  res["runtime"] = (payload.temporal_log && !payload.temporal_log->empty()) //
                     ? payload.temporal_log->back().global_time
                     : record_runtime;

  auto original_requests = value_or_nan(payload.original_number_requests);
  auto feasible_requests = value_or_nan(payload.feasible_requests);
  res["cleaned_embedding_ratio"] = (std::isnan(feasible_requests) || feasible_requests <= MIN_FEASIBLE_REQUESTS)
                                     ? NAN_VALUE
                                     : payload.embedding_ratio * original_requests / feasible_requests * 100.0;

  auto all_loads = std::span<const ResourceLoad>{};
  if (payload.loads) {
    all_loads = *payload.loads;
  }
  auto is_node = [](const ResourceLoad& r) { return r.resource_type == NODE_RESOURCE_TYPE; };
  auto node_loads = summarize_loads(all_loads | views::filter(is_node) | views::transform(&ResourceLoad::load));
  auto edge_loads = summarize_loads(all_loads | views::filter(std::not_fn(is_node)) //
                                    | views::transform(&ResourceLoad::load));
  auto loads = summarize_loads(all_loads | views::transform(&ResourceLoad::load));
  res["avg_node_load"] = node_loads.avg;
  res["max_node_load"] = node_loads.max;
  res["avg_edge_load"] = edge_loads.avg;
  res["max_edge_load"] = edge_loads.max;
  res["avg_load"] = loads.avg;
  res["max_load"] = loads.max;
  return res;
}

auto total_time(const RoundingMetaData& meta_data) -> double {
  return meta_data.time_preprocessing + meta_data.time_optimization + meta_data.time_postprocessing;
}

auto extract_metrics(const RandomizedRoundingPayload& payload) -> MetricMap {
  const auto& meta = payload.meta_data;
  auto res = MetricMap{
      {"runtime_preprocessing", meta.time_preprocessing},
      {"runtime_optimization", meta.time_optimization},
      {"runtime_postprocessing", meta.time_postprocessing},
      {"runtime_total", total_time(meta)},
      {"lp_objective", meta.lp_objective_value},
      {"runtime_mdk", payload.mdk_meta_data ? total_time(*payload.mdk_meta_data) : NAN_VALUE},
  };
  auto variant_results = std::array{
      &payload.mdk_result, &payload.result_wo_violations, &payload.min_aug_result, &payload.max_profit_result};
  for (auto [variant, result] : views::zip(ROUNDING_VARIANTS, variant_results)) {
    // Loads are stored as fractions
    res[fmt::format("profit_{}", variant)] = *result ? (*result)->profit : NAN_VALUE;
    res[fmt::format("max_node_load_{}", variant)] = *result ? (*result)->max_node_load * 100.0 : NAN_VALUE;
    res[fmt::format("max_edge_load_{}", variant)] = *result ? (*result)->max_edge_load * 100.0 : NAN_VALUE;
  }
  return res;
}

struct ExtractMetricsVisitor {
  const ResultRecord& record;

  auto operator()(std::monostate) const -> rfl::Result<MetricMap> {
    return rfl::Error{fmt::format("Record {} has SUCCESS status but no payload.", to_string(record.key()))};
  }
  auto operator()(const ClassicMCFPayload& payload) const -> rfl::Result<MetricMap> {
    return extract_metrics(payload, record.runtime_seconds);
  }
  auto operator()(const RandomizedRoundingPayload& payload) const -> rfl::Result<MetricMap> {
    return extract_metrics(payload);
  }
  auto operator()(const UndecodedPayload& payload) const -> rfl::Result<MetricMap> {
    constexpr auto msg_pattern = "Payload of record {} fails to decode as family '{}': {}";
    return rfl::Error{fmt::format(msg_pattern, to_string(record.key()), payload.family, payload.error)};
  }
};
} // namespace

auto reduce(const ResultRecord& record, const ParameterMap& generation_parameters) -> rfl::Result<PlotRecord> {
  auto family = algorithm_family_of(record.algorithm_id);
  if (!family) {
    return rfl::Error{fmt::format("Unknown algorithm id '{}' of record {}.", record.algorithm_id,
                                  to_string(record.key()))};
  }
  auto res = PlotRecord{
      .scenario_id = record.scenario_id,
      .algorithm_id = record.algorithm_id,
      .config_index = record.config_index,
      .generation_parameters = generation_parameters,
      .metrics = {},
      .status = record.status,
  };
  if (record.status != RunStatus::SUCCESS) {
    return res;
  }
  if (auto payload_family_value = payload_family(record.raw_payload);
      payload_family_value && *payload_family_value != *family) {
    constexpr auto msg_pattern = "Payload family {} of record {} mismatches algorithm family {}.";
    return rfl::Error{fmt::format(msg_pattern, magic_enum::enum_name(*payload_family_value), to_string(record.key()),
                                  magic_enum::enum_name(*family))};
  }
  return std::visit(ExtractMetricsVisitor{record}, record.raw_payload).transform([&](MetricMap metrics) {
    res.metrics = std::move(metrics);
    return std::move(res);
  });
}

auto reduce_archive(const ResultArchive& archive, const ScenarioStore& scenarios, ReductionErrorPolicy policy)
    -> rfl::Result<ReductionResult> {
  auto res = ReductionResult{.records = make_reserved_vector<PlotRecord>(archive.size()), .failures = {}};
  for (const auto& [key, record] : archive.records()) {
    const auto* scenario = scenarios.find(key.scenario_id);
    auto plot_record = (scenario == nullptr)
                         ? rfl::Result<PlotRecord>{rfl::Error{
                               fmt::format("Scenario of record {} is not found.", to_string(key))}}
                         : reduce(record, scenario->generation_parameters);
    if (plot_record) {
      res.records.push_back(std::move(*plot_record));
      continue;
    }
    if (policy == ReductionErrorPolicy::ABORT) {
      return *plot_record.error();
    }
    ELOGFMT(WARNING, "Skips record that fails to reduce: {}", plot_record.error()->what());
    res.failures.push_back({.key = key, .message = plot_record.error()->what()});
  }
  ELOGFMT(INFO, "{} records reduced with {} failures.", res.records.size(), res.failures.size());
  return res;
}

auto write_plot_records(const std::string& path, std::span<const PlotRecord> records) -> ResultVoid try {
  auto json_root = json::array();
  for (const auto& record : records) {
    json_root.push_back(plot_record_to_json(record));
  }
  auto fout = std::ofstream{path};
  if (!fout.is_open()) {
    return rfl::Error{fmt::format("Failed to open output file '{}'.", path)};
  }
  auto contents = json_root.dump(4);
  fout << contents;
  if (!fout.flush()) {
    return rfl::Error{fmt::format("Failed to write to output file '{}'.", path)};
  }
  ELOGFMT(INFO, "Done writing {} plot records ({}) to '{}'.", records.size(),
          size_bytes_to_memory_str(contents.size()), path);
  return RESULT_VOID_SUCCESS;
}
RFL_RESULT_CATCH_HANDLER()

auto read_plot_records(const std::string& path) -> rfl::Result<std::vector<PlotRecord>> try {
  auto fin = std::ifstream{path};
  if (!fin.is_open()) {
    return rfl::Error{fmt::format("Failed to open reduced file '{}'.", path)};
  }
  auto json_root = json::parse(fin);
  auto res = make_reserved_vector<PlotRecord>(json_root.size());
  for (const auto& json_obj : json_root) {
    auto record = with_error_context(plot_record_from_json(json_obj), path);
    RFL_RETURN_ON_ERROR(record);
    res.push_back(std::move(*record));
  }
  ELOGFMT(INFO, "Done reading {} plot records from '{}'.", res.size(), path);
  return res;
}
RFL_RESULT_CATCH_HANDLER()
