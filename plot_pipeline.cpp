#include "plot_pipeline.h"
#include "utils/easylog.h"
#include <fstream>
#include <nlohmann/json.hpp>
#include <rfl/json.hpp>

namespace {
constexpr auto DEFAULT_DECIMALS = 1;

auto make_metric_spec(std::string name, std::string metric, std::string_view algorithm_id, double vmin, double vmax,
                      std::optional<int> decimals = std::nullopt) -> MetricSpecification {
  auto filename = metric;
  return {
      .name = std::move(name),
      .filename = std::move(filename),
      .metric = std::move(metric),
      .algorithm_id = std::string{algorithm_id},
      .vmin = vmin,
      .vmax = vmax,
      .lower_bound = std::nullopt,
      .decimals = decimals,
  };
}

auto values_to_json(std::span<const ParameterValue> values) -> json {
  auto res = json::array();
  for (const auto& v : values) {
    res.push_back(parameter_value_to_json(v));
  }
  return res;
}

template <class Func>
auto cells_to_json(const Heatmap& heatmap, Func&& cell_value) -> json {
  auto res = json::array();
  for (const auto& row : heatmap.cells) {
    auto& json_row = res.emplace_back(json::array());
    for (const auto& cell : row) {
      json_row.push_back(cell_value(cell));
    }
  }
  return res;
}

auto summary_to_json(const SummaryStatistics& stats) -> json {
  return json{
      {"n_values", stats.n_values},
      {"n_nan", stats.n_nan},
      {"min", number_to_json(stats.min)},
      {"mean", number_to_json(stats.mean)},
      {"median", number_to_json(stats.median)},
      {"max", number_to_json(stats.max)},
      {"stddev", number_to_json(stats.stddev)},
  };
}

auto heatmap_to_json(const Heatmap& heatmap, const AxesSpecification& axes, int decimals) -> json {
  auto [observed_min, observed_max] = heatmap.mean_range();
  return json{
      {"folder_name", axes.folder_name},
      {"x_parameter", axes.x_parameter},
      {"y_parameter", axes.y_parameter},
      {"x_title", axes.x_title},
      {"y_title", axes.y_title},
      {"x_values", values_to_json(heatmap.x_values)},
      {"y_values", values_to_json(heatmap.y_values)},
      {"mean", cells_to_json(heatmap, [&](const HeatmapCell& c) {
         return number_to_json(round_to_decimals(c.mean, decimals));
       })},
      {"min", cells_to_json(heatmap, [](const HeatmapCell& c) { return number_to_json(c.min); })},
      {"max", cells_to_json(heatmap, [](const HeatmapCell& c) { return number_to_json(c.max); })},
      {"n_values", cells_to_json(heatmap, [](const HeatmapCell& c) { return json(c.n_values); })},
      {"observed_range", json::array({number_to_json(observed_min), number_to_json(observed_max)})},
  };
}

auto axis_values_of(const PlotOptions& options, std::string_view parameter)
    -> std::optional<std::vector<ParameterValue>> {
  auto it = options.axis_values.find(parameter);
  if (it == options.axis_values.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto make_metric_plot_data(const FilterGroup& group, const MetricSpecification& spec, const PlotOptions& options)
    -> std::optional<json> {
  auto records = group.members | FILTER_VIEW(_1.algorithm_id == spec.algorithm_id);
  auto selected = std::vector<PlotRecord>(records.begin(), records.end());
  if (selected.empty()) {
    VNEPLOG_FMT_TRACE("No record of algorithm '{}' for metric '{}'.", spec.algorithm_id, spec.metric);
    return std::nullopt;
  }
  auto decimals = spec.decimals.value_or(DEFAULT_DECIMALS);
  auto values = collect_metric_values(selected, spec.metric, spec.lower_bound);

  auto json_ecdf = json::array();
  for (auto [value, fraction] : compute_ecdf(values)) {
    json_ecdf.push_back(json::array({value, fraction}));
  }
  auto json_heatmaps = json::array();
  for (const auto& axes : options.specifications.axes) {
    auto conflicts = ranges::any_of(group.key_subset, LAMBDA_1(_1 == axes.x_parameter || _1 == axes.y_parameter));
    if (conflicts) {
      VNEPLOG_FMT_TRACE("Skips heatmap {} of '{}' which conflicts with the filter.", axes.folder_name, spec.metric);
      continue;
    }
    auto heatmap = compute_heatmap(selected, spec.metric, axes.x_parameter, axes.y_parameter, spec.lower_bound,
                                   axis_values_of(options, axes.x_parameter), axis_values_of(options, axes.y_parameter));
    if (heatmap.x_values.empty() || heatmap.y_values.empty()) {
      VNEPLOG_FMT_TRACE("Skips heatmap {} of '{}' without axis values.", axes.folder_name, spec.metric);
      continue;
    }
    json_heatmaps.push_back(heatmap_to_json(heatmap, axes, decimals));
  }
  return json{
      {"name", spec.name},
      {"filename", spec.filename},
      {"metric", spec.metric},
      {"algorithm_id", spec.algorithm_id},
      {"vmin", spec.vmin},
      {"vmax", spec.vmax},
      {"decimals", decimals},
      {"n_records", selected.size()},
      {"summary", summary_to_json(summarize(values))},
      {"ecdf", std::move(json_ecdf)},
      {"heatmaps", std::move(json_heatmaps)},
  };
}
} // namespace

auto default_plot_specifications() -> PlotSpecifications {
  constexpr auto MCF = CLASSIC_MCF_ALGORITHM_ID;
  constexpr auto RR = RANDOMIZED_ROUNDING_ALGORITHM_ID;
  auto comparison = fmt::format("{}_vs_{}", MCF, RR);

  auto objective_gap = make_metric_spec("MIP_MCF: Objective Gap [%]", "objective_gap", MCF, 0.0, 20.0);
  objective_gap.lower_bound = -1e-5;

  auto res = PlotSpecifications{};
  res.metrics = {
      make_metric_spec("MIP_MCF: Max Node Load [%]", "max_node_load", MCF, 0.0, 100.0),
      make_metric_spec("MIP_MCF: Max Edge Load [%]", "max_edge_load", MCF, 0.0, 100.0),
      std::move(objective_gap),
      make_metric_spec("MIP_MCF: Runtime [s]", "runtime", MCF, 0.0, 7'200.0, 0),
      make_metric_spec("MIP_MCF: Acceptance Ratio [%]", "embedding_ratio", MCF, 0.0, 100.0),
      make_metric_spec("MIP_MCF: Avg. Node Load [%]", "avg_node_load", MCF, 0.0, 60.0),
      make_metric_spec("MIP_MCF: Avg. Edge Load [%]", "avg_edge_load", MCF, 25.0, 75.0),
      make_metric_spec("MIP_MCF: Max Load [%]", "max_load", MCF, 0.0, 100.0),
      make_metric_spec("MIP_MCF: Avg. Load [%]", "avg_load", MCF, 0.0, 100.0),
      make_metric_spec("#Feasible Requests", "feasible_requests", MCF, 0.0, 100.0, 0),
      make_metric_spec("MIP_MCF: Cleaned Acceptance Ratio [%]", "cleaned_embedding_ratio", MCF, 0.0, 100.0),
      make_metric_spec("LP: Runtime Pre-Processing [s]", "runtime_preprocessing", RR, 0.0, 50.0),
      make_metric_spec("LP: Runtime Optimization [s]", "runtime_optimization", RR, 0.0, 300.0, 2),
      make_metric_spec("LP: Runtime Post-Processing [s]", "runtime_postprocessing", RR, 0.0, 180.0, 0),
      make_metric_spec("LP: Total Runtime [s]", "runtime_total", RR, 0.0, 300.0, 2),
      make_metric_spec("Runtime MDK [s]", "runtime_mdk", RR, 0.0, 7'260.0),
      make_metric_spec("Profit(RR_MDK) / Profit(MIP_MCF) [%]", "relative_profit_mdk", comparison, 65.0, 100.0),
      make_metric_spec("Profit(RR_Heuristic) / Profit(MIP_MCF) [%]", "relative_profit_wo_viol", comparison, 65.0,
                       100.0),
      make_metric_spec("Profit(RR_MinLoad) / Profit(MIP_MCF) [%]", "relative_profit_min_aug", comparison, 95.0, 145.0,
                       0),
      make_metric_spec("Profit(RR_MaxProfit) / Profit(MIP_MCF) [%]", "relative_profit_max_profit", comparison, 95.0,
                       145.0, 0),
      make_metric_spec("Root Dual Bound of MIP_MCF / LP Bound", "relative_root_dual_bound", comparison, 1.0, 5.0, 2),
      make_metric_spec("Final Dual Bound of MIP_MCF / LP Bound", "relative_final_dual_bound", comparison, 1.0, 5.0, 2),
  };
  auto make_axes = [](std::string x, std::string y, std::string x_title, std::string y_title, std::string folder) {
    return AxesSpecification{.x_parameter = std::move(x),
                             .y_parameter = std::move(y),
                             .x_title = std::move(x_title),
                             .y_title = std::move(y_title),
                             .folder_name = std::move(folder)};
  };
  res.axes = {
      make_axes("number_of_requests", "edge_resource_factor", "Number of Requests", "Edge Resource Factor",
                "AXES_NO_REQ_vs_EDGE_RF"),
      make_axes("node_resource_factor", "edge_resource_factor", "Node Resource Factor", "Edge Resource Factor",
                "AXES_RESOURCES"),
      make_axes("number_of_requests", "node_resource_factor", "Number of Requests", "Node Resource Factor",
                "AXES_NO_REQ_vs_NODE_RF"),
      make_axes("number_of_requests", "topology", "Number of Requests", "Substrate", "AXES_NO_REQ_vs_SUBSTRATES"),
      make_axes("edge_resource_factor", "topology", "Edge Resource Factor", "Substrate", "AXES_EDGE_RF_vs_SUBSTRATES"),
      make_axes("node_resource_factor", "topology", "Node Resource Factor", "Substrate", "AXES_NODE_RF_vs_SUBSTRATES"),
  };
  return res;
}

auto read_plot_specifications(const std::string& path) -> rfl::Result<PlotSpecifications> try {
  auto fin = std::ifstream{path};
  if (!fin.is_open()) {
    return rfl::Error{fmt::format("Failed to open plot specification file '{}'.", path)};
  }
  auto contents = std::string(std::istreambuf_iterator<char>{fin}, std::istreambuf_iterator<char>{});
  return with_error_context(rfl::json::read<PlotSpecifications>(contents), path);
}
RFL_RESULT_CATCH_HANDLER()

auto round_to_decimals(double value, int decimals) -> double {
  if (std::isnan(value)) {
    return value;
  }
  auto scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

auto output_path_for_group(const FilterGroup& group, const std::filesystem::path& output_dir,
                           const PlotOptions& options) -> std::filesystem::path {
  auto res = output_dir;
  for (const auto& [key, value] : group.key_values) {
    res /= fmt::format("{}_{}", key, to_string(value));
  }
  return res / fmt::format("{}_{}.{}", options.title, filter_group_title(group), options.output_filetype);
}

auto make_plot_data(const FilterGroup& group, const PlotOptions& options) -> json {
  auto json_metrics = json::array();
  for (const auto& spec : options.specifications.metrics) {
    if (auto json_metric = make_metric_plot_data(group, spec, options)) {
      json_metrics.push_back(std::move(*json_metric));
    }
  }
  return json{
      {"title", fmt::format("{}_{}", options.title, filter_group_title(group))},
      {"filter", parameter_map_to_json(group.key_values)},
      {"n_records", group.members.size()},
      {"metrics", std::move(json_metrics)},
  };
}

auto JsonPlotRenderer::render(const json& plot_data, const std::filesystem::path& path) -> ResultVoid try {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  auto fout = std::ofstream{path};
  if (!fout.is_open()) {
    return rfl::Error{fmt::format("Failed to open plot file '{}'.", path.string())};
  }
  fout << plot_data.dump(indent_);
  if (!fout.flush()) {
    return rfl::Error{fmt::format("Failed to write to plot file '{}'.", path.string())};
  }
  return RESULT_VOID_SUCCESS;
}
RFL_RESULT_CATCH_HANDLER()

auto render_group(const FilterGroup& group, const std::filesystem::path& output_dir, const PlotOptions& options,
                  PlotRenderer& renderer) -> rfl::Result<RenderedFile> try {
  if (group.members.empty()) {
    return rfl::Error{fmt::format("Group '{}' has no member.", filter_group_title(group))};
  }
  auto path = output_path_for_group(group, output_dir, options);
  if (!options.overwrite_existing_files && std::filesystem::exists(path)) {
    ELOGFMT(INFO, "Skips generation of '{}' which exists already.", path.string());
    return RenderedFile{.path = std::move(path), .skipped = true};
  }
  auto plot_data = make_plot_data(group, options);
  return renderer.render(plot_data, path).transform([&](auto) {
    VNEPLOG_FMT_DEBUG("Plot of {} records written to '{}'.", group.members.size(), path.string());
    return RenderedFile{.path = path, .skipped = false};
  });
}
RFL_RESULT_CATCH_HANDLER()

auto render_all(std::span<const FilterGroup> groups, const std::filesystem::path& output_dir,
                const PlotOptions& options, PlotRenderer& renderer) -> RenderReport {
  auto res = RenderReport{};
  for (const auto& group : groups) {
    if (group.members.empty()) {
      ELOGFMT(WARNING, "Skips group '{}' without any member.", filter_group_title(group));
      res.n_empty += 1;
      continue;
    }
    auto rendered = render_group(group, output_dir, options, renderer);
    if (!rendered) {
      ELOGFMT(ERROR, "Failed to render group '{}': {}", filter_group_title(group), rendered.error()->what());
      res.failures.push_back({.group_title = filter_group_title(group), .message = rendered.error()->what()});
    } else if (rendered->skipped) {
      res.n_skipped += 1;
    } else {
      res.written.push_back(std::move(rendered->path));
    }
  }
  ELOGFMT(INFO, "{} plot files written, {} skipped, {} empty groups, {} failures.", res.written.size(), res.n_skipped,
          res.n_empty, res.failures.size());
  return res;
}
