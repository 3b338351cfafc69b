#include "comparison.h"
#include "reducer.h"
#include "utils/easylog.h"

namespace {
auto relative_profit(double profit, double baseline_objective) -> double {
  if (std::isnan(baseline_objective) || baseline_objective <= MIN_BASELINE_OBJECTIVE) {
    return NAN_VALUE;
  }
  return profit / baseline_objective * 100.0;
}

auto relative_dual_bound(double baseline_bound, double lp_objective) -> double {
  if (std::isnan(lp_objective) || lp_objective <= MIN_LP_OBJECTIVE) {
    return NAN_VALUE;
  }
  auto res = baseline_bound / lp_objective;
  return res > MAX_RELATIVE_DUAL_BOUND ? NAN_VALUE : res;
}

auto compare(const PlotRecord& baseline, const PlotRecord& other) -> PlotRecord {
  auto res = PlotRecord{
      .scenario_id = baseline.scenario_id,
      .algorithm_id = fmt::format("{}_vs_{}", baseline.algorithm_id, other.algorithm_id),
      .config_index = 0,
      .generation_parameters = baseline.generation_parameters,
      .metrics = {},
      .status = RunStatus::SUCCESS,
  };
  if (baseline.status != RunStatus::SUCCESS) {
    res.status = baseline.status;
    return res;
  }
  if (other.status != RunStatus::SUCCESS) {
    res.status = other.status;
    return res;
  }
  auto baseline_objective = get_metric(baseline, "objective_value");
  for (auto variant : ROUNDING_VARIANTS) {
    auto profit = get_metric(other, fmt::format("profit_{}", variant));
    res.metrics[fmt::format("relative_profit_{}", variant)] = relative_profit(profit, baseline_objective);
  }
  auto lp_objective = get_metric(other, "lp_objective");
  res.metrics["relative_root_dual_bound"] = relative_dual_bound(get_metric(baseline, "root_dual_bound"), lp_objective);
  res.metrics["relative_final_dual_bound"] =
      relative_dual_bound(get_metric(baseline, "final_dual_bound"), lp_objective);

  for (const auto& [name, value] : baseline.metrics) {
    res.metrics["baseline_" + name] = value;
  }
  for (const auto& [name, value] : other.metrics) {
    res.metrics["other_" + name] = value;
  }
  return res;
}
} // namespace

auto derive_comparison_records(std::span<const PlotRecord> records, const RecordSelector& baseline,
                               const RecordSelector& other) -> std::vector<PlotRecord> {
  auto baseline_records = std::map<std::string_view, const PlotRecord*>{};
  auto other_records = std::map<std::string_view, const PlotRecord*>{};
  for (const auto& r : records) {
    if (baseline.matches(r)) {
      baseline_records.emplace(r.scenario_id, &r);
    } else if (other.matches(r)) {
      other_records.emplace(r.scenario_id, &r);
    }
  }
  auto res = make_reserved_vector<PlotRecord>(std::min(baseline_records.size(), other_records.size()));
  for (const auto& [scenario_id, baseline_record] : baseline_records) {
    auto it = other_records.find(scenario_id);
    if (it == other_records.end()) {
      VNEPLOG_FMT_DEBUG("Skips scenario '{}' without record of algorithm '{}', config #{}.", scenario_id,
                        other.algorithm_id, other.config_index);
      continue;
    }
    res.push_back(compare(*baseline_record, *it->second));
  }
  ELOGFMT(INFO, "{} comparison records derived from {} baseline records and {} other records.", res.size(),
          baseline_records.size(), other_records.size());
  return res;
}
