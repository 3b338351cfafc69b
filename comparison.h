#pragma once

#include "result_types.h"
#include <span>

// Selects the plot records of one execution config.
struct RecordSelector {
  std::string algorithm_id;
  size_t config_index = 0;

  auto matches(const PlotRecord& record) const -> bool {
    return record.algorithm_id == algorithm_id && record.config_index == config_index;
  }
};

// Objective values at or below are treated as zero, with relative profit undefined.
constexpr auto MIN_BASELINE_OBJECTIVE = 1e-6;
// LP objective values at or below are treated as zero, with relative dual bounds undefined.
constexpr auto MIN_LP_OBJECTIVE = 1e-4;
// Relative dual bounds above are treated as numerically meaningless.
constexpr auto MAX_RELATIVE_DUAL_BOUND = 1'000.0;

// Pairs the baseline record (the exact MIP) and the other record (randomized rounding) of each scenario,
// and derives one comparison record per pair, with algorithm id "<baseline>_vs_<other>" and config index 0.
// Metrics of the comparison record:
//   relative_profit_<v> = profit_<v> of other / objective_value of baseline, in percent,
//                         for each rounding variant v;
//   relative_root_dual_bound, relative_final_dual_bound = dual bound of baseline / LP objective of other;
//   baseline_<m>, other_<m> = metric m of the corresponding record.
// Scenarios lacking either record are skipped. If either record is not SUCCESS, the comparison record
// takes its status (baseline first) with empty metrics.
auto derive_comparison_records(std::span<const PlotRecord> records, const RecordSelector& baseline,
                               const RecordSelector& other) -> std::vector<PlotRecord>;
