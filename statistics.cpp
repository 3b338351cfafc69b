#include "statistics.h"
#include "filter_engine.h"
#include "utils/easylog.h"

auto collect_metric_values(std::span<const PlotRecord> records, std::string_view metric,
                           std::optional<double> lower_bound) -> std::vector<double> {
  auto res = make_reserved_vector<double>(records.size());
  for (const auto& record : records | FILTER_VIEW(_1.status == RunStatus::SUCCESS)) {
    auto value = get_metric(record, metric);
    res.push_back((lower_bound && value < *lower_bound) ? NAN_VALUE : value);
  }
  return res;
}

auto summarize(std::span<const double> values) -> SummaryStatistics {
  auto sorted = std::vector<double>{};
  ranges::copy_if(values, std::back_inserter(sorted), LAMBDA_1(!std::isnan(_1)));
  ranges::sort(sorted);

  auto n = sorted.size();
  auto res = SummaryStatistics{
      .n_values = n,
      .n_nan = values.size() - n,
      .min = NAN_VALUE,
      .mean = NAN_VALUE,
      .median = NAN_VALUE,
      .max = NAN_VALUE,
      .stddev = NAN_VALUE,
  };
  if (n == 0) {
    return res;
  }
  res.min = sorted.front();
  res.max = sorted.back();
  res.mean = accumulate_sum(sorted) / n;
  res.median = (n % 2 == 1) ? sorted[n / 2] : (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
  auto sqr_mean_diff = views::transform([mean = res.mean](double x) { return (x - mean) * (x - mean); });
  res.stddev = std::sqrt(accumulate_sum(sorted | sqr_mean_diff) / n);
  return res;
}

auto compute_ecdf(std::span<const double> values) -> std::vector<ECDFPoint> {
  auto sorted = std::vector<double>{};
  ranges::copy_if(values, std::back_inserter(sorted), LAMBDA_1(!std::isnan(_1)));
  ranges::sort(sorted);

  auto n = static_cast<double>(sorted.size());
  auto res = make_reserved_vector<ECDFPoint>(sorted.size());
  for (auto [i, value] : views::enumerate(sorted)) {
    res.push_back({.value = value, .fraction = (i + 1) / n});
  }
  return res;
}

auto Heatmap::mean_range() const -> std::pair<double, double> {
  auto means = cells | views::join | views::transform(&HeatmapCell::mean) | FILTER_VIEW(!std::isnan(_1));
  if (ranges::empty(means)) {
    return {NAN_VALUE, NAN_VALUE};
  }
  auto [min, max] = ranges::minmax(means);
  return {min, max};
}

auto compute_heatmap(std::span<const PlotRecord> records, std::string_view metric, std::string_view x_parameter,
                     std::string_view y_parameter, std::optional<double> lower_bound,
                     std::optional<std::vector<ParameterValue>> x_values,
                     std::optional<std::vector<ParameterValue>> y_values) -> Heatmap {
  auto res = Heatmap{
      .x_parameter = std::string{x_parameter},
      .y_parameter = std::string{y_parameter},
      .x_values = x_values ? std::move(*x_values) : parameter_range(records, x_parameter),
      .y_values = y_values ? std::move(*y_values) : parameter_range(records, y_parameter),
      .cells = {},
  };
  // Values of each cell
  auto cell_values = std::vector(res.y_values.size(), std::vector(res.x_values.size(), std::vector<double>{}));
  auto n_ignored = 0zu;
  for (const auto& record : records | FILTER_VIEW(_1.status == RunStatus::SUCCESS)) {
    const auto* x = find_parameter(record.generation_parameters, x_parameter);
    const auto* y = find_parameter(record.generation_parameters, y_parameter);
    auto x_it = (x == nullptr) ? res.x_values.end() : ranges::find(res.x_values, *x);
    auto y_it = (y == nullptr) ? res.y_values.end() : ranges::find(res.y_values, *y);
    if (x_it == res.x_values.end() || y_it == res.y_values.end()) {
      n_ignored += 1;
      continue;
    }
    auto value = get_metric(record, metric);
    if (!std::isnan(value) && !(lower_bound && value < *lower_bound)) {
      cell_values[y_it - res.y_values.begin()][x_it - res.x_values.begin()].push_back(value);
    }
  }
  if (n_ignored != 0) {
    VNEPLOG_FMT_DEBUG("{} records ignored in heatmap of '{}' with axes ({}, {}).", n_ignored, metric, x_parameter,
                      y_parameter);
  }

  res.cells.reserve(cell_values.size());
  for (const auto& row : cell_values) {
    auto& cells = res.cells.emplace_back();
    for (const auto& values : row) {
      auto stats = summarize(values);
      cells.push_back({.n_values = stats.n_values, .mean = stats.mean, .min = stats.min, .max = stats.max});
    }
  }
  return res;
}
