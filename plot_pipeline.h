#pragma once

#include "filter_engine.h"
#include "statistics.h"
#include <filesystem>
#include <optional>

// Describes one metric to be plotted.
struct MetricSpecification {
  // Title of the plot
  std::string name;
  // Prefix of the plot entries
  std::string filename;
  // Name of the metric in plot records
  std::string metric;
  // Only records of this algorithm are taken into account.
  std::string algorithm_id;
  // Value range of the color scale of heatmaps
  double vmin;
  double vmax;
  // Values below are discarded if provided.
  std::optional<double> lower_bound;
  // # of decimals of the displayed values, 1 by default
  std::optional<int> decimals;
};

// Describes the axes of heatmaps.
struct AxesSpecification {
  std::string x_parameter;
  std::string y_parameter;
  std::string x_title;
  std::string y_title;
  std::string folder_name;
};

struct PlotSpecifications {
  std::vector<MetricSpecification> metrics;
  std::vector<AxesSpecification> axes;
};

// Heatmaps of the ClassicMCF, RandomizedRoundingTriumvirate and comparison metrics on the resource factors,
// the number of requests and the substrate topologies.
auto default_plot_specifications() -> PlotSpecifications;

auto read_plot_specifications(const std::string& path) -> rfl::Result<PlotSpecifications>;

struct PlotOptions {
  // Prefix of output file names
  std::string title = "evaluation";
  // Extension of output files
  std::string output_filetype = "json";
  bool overwrite_existing_files = false;
  PlotSpecifications specifications;
  // Axis values of heatmaps per parameter. Parameters absent here take the values of the group members.
  std::map<std::string, std::vector<ParameterValue>, std::less<>> axis_values;
};

// Rounds to the given # of decimals. NaN is kept as is.
auto round_to_decimals(double value, int decimals) -> double;

// <output_dir>/<k1>_<v1>/<k2>_<v2>/<title>_<k1>_<v1>_<k2>_<v2>.<ext>, or <output_dir>/<title>_no_filter.<ext>
auto output_path_for_group(const FilterGroup& group, const std::filesystem::path& output_dir,
                           const PlotOptions& options) -> std::filesystem::path;

// Plot data of a group: for each metric specification, the summary statistics, the ECDF, and one heatmap per
// axes specification whose parameters are not among the filter keys of the group.
auto make_plot_data(const FilterGroup& group, const PlotOptions& options) -> json;

// Consumes plot data to produce the output file.
class PlotRenderer {
public:
  virtual ~PlotRenderer() = default;

  virtual auto render(const json& plot_data, const std::filesystem::path& path) -> ResultVoid = 0;
};

// Writes the plot data as is, for external charting tools.
class JsonPlotRenderer : public PlotRenderer {
public:
  explicit JsonPlotRenderer(int indent = 2) : indent_(indent) {}

  auto render(const json& plot_data, const std::filesystem::path& path) -> ResultVoid override;

private:
  int indent_;
};

struct RenderedFile {
  std::filesystem::path path;
  // Whether the file exists already and is thus left untouched
  bool skipped;
};

// Fails for groups without members, or if the renderer fails.
auto render_group(const FilterGroup& group, const std::filesystem::path& output_dir, const PlotOptions& options,
                  PlotRenderer& renderer) -> rfl::Result<RenderedFile>;

struct RenderFailure {
  std::string group_title;
  std::string message;
};

struct RenderReport {
  std::vector<std::filesystem::path> written;
  // # of groups whose output files exist already
  size_t n_skipped = 0;
  // # of groups without any member
  size_t n_empty = 0;
  std::vector<RenderFailure> failures;
};

// Renders every group. Failure of one group never prevents the others from rendering.
auto render_all(std::span<const FilterGroup> groups, const std::filesystem::path& output_dir,
                const PlotOptions& options, PlotRenderer& renderer) -> RenderReport;
