#pragma once

#include "result_types.h"
#include <optional>
#include <span>

struct SummaryStatistics {
  // # of values that are not NaN
  size_t n_values;
  size_t n_nan;
  // All NaN if n_values == 0
  double min;
  double mean;
  double median;
  double max;
  // Population standard deviation
  double stddev;
};

// Values of the metric among SUCCESS records, with NaN for records lacking the metric.
// Values below lower_bound (if provided) are treated as NaN, e.g. negative objective values
// which indicate that no feasible solution is found.
auto collect_metric_values(std::span<const PlotRecord> records, std::string_view metric,
                           std::optional<double> lower_bound = std::nullopt) -> std::vector<double>;

auto summarize(std::span<const double> values) -> SummaryStatistics;

struct ECDFPoint {
  double value;
  // Fraction of values <= value, in (0, 1]
  double fraction;
};

// Empirical cumulative distribution of the values, NaN ignored. Points are sorted by value.
auto compute_ecdf(std::span<const double> values) -> std::vector<ECDFPoint>;

struct HeatmapCell {
  // # of values that are not NaN
  size_t n_values;
  // All NaN if n_values == 0
  double mean;
  double min;
  double max;
};

struct Heatmap {
  std::string x_parameter;
  std::string y_parameter;
  std::vector<ParameterValue> x_values;
  std::vector<ParameterValue> y_values;
  // cells[i][j] for y_values[i] and x_values[j]
  std::vector<std::vector<HeatmapCell>> cells;

  // Min and max of the cell means, NaN if all cells are empty
  auto mean_range() const -> std::pair<double, double>;
};

// Aggregates the metric values (see collect_metric_values() above) of records into cells by their values
// of x and y parameters. Axis values default to all the values taken by the records (see parameter_range()).
// Records lacking either parameter, or taking values out of the axes, are ignored.
auto compute_heatmap(std::span<const PlotRecord> records, std::string_view metric, std::string_view x_parameter,
                     std::string_view y_parameter, std::optional<double> lower_bound = std::nullopt,
                     std::optional<std::vector<ParameterValue>> x_values = std::nullopt,
                     std::optional<std::vector<ParameterValue>> y_values = std::nullopt) -> Heatmap;
