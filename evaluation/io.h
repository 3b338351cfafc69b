#pragma once

#include "evaluation.h"
#include "plot_pipeline.h"
#include "utils/easylog.h"
#include <set>

namespace eval_io {
inline auto init_easylog(const CommonEvaluationParams& params) {
  easylog::set_min_severity(params.log_severity);
  // Note: async=true may trigger a bug that the program fails to terminate after everything is finished.
  if (!params.log_output_file.empty()) {
    easylog::init_log(params.log_severity, params.log_output_file, false, params.log_console);
  }
}

// Logs the value distribution of each metric in the specifications among the records of its algorithm.
inline auto log_metric_histograms(std::span<const PlotRecord> records, const PlotSpecifications& specs,
                                  const HistogramShape& shape) -> void {
  auto visited = std::set<std::pair<std::string_view, std::string_view>>{};
  for (const auto& spec : specs.metrics) {
    if (!visited.emplace(spec.algorithm_id, spec.metric).second) {
      continue;
    }
    auto selected = records | FILTER_VIEW(_1.algorithm_id == spec.algorithm_id);
    auto values = collect_metric_values(std::vector(selected.begin(), selected.end()), spec.metric, spec.lower_bound);
    std::erase_if(values, LAMBDA_1(std::isnan(_1)));
    if (values.empty()) {
      VNEPLOG_FMT_DEBUG("No value of metric '{}' for algorithm '{}'.", spec.metric, spec.algorithm_id);
      continue;
    }
    VNEPLOG_FMT_DEBUG("Distribution of metric '{}' for algorithm '{}':\n{}", spec.metric, spec.algorithm_id,
                      make_histogram(values, shape));
  }
}
} // namespace eval_io
