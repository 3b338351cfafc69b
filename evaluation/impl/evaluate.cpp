#include "comparison.h"
#include "evaluation/frameworks.h"
#include "reducer.h"
#include <fmt/ranges.h>

namespace {
auto prepare_records(const EvaluateParams& params, std::vector<PlotRecord> records)
    -> rfl::Result<std::vector<PlotRecord>> {
  if (params.exclude_config.empty()) {
    return std::move(records);
  }
  return read_record_exclusions(params.exclude_config).and_then([&](RecordExclusions exclusions) {
    return exclude_records(std::move(records), exclusions);
  });
}

auto prepare_plot_options(const EvaluateParams& params, std::span<const PlotRecord> records)
    -> rfl::Result<PlotOptions> {
  auto specs = params.plot_spec_file.empty() ? rfl::Result<PlotSpecifications>{default_plot_specifications()}
                                             : read_plot_specifications(params.plot_spec_file);
  return specs.transform([&](PlotSpecifications specs) {
    ELOGFMT(DEBUG, "Plot specifications: {:4}", specs);
    auto res = PlotOptions{
        .title = params.output_title,
        .output_filetype = params.output_filetype,
        .overwrite_existing_files = params.overwrite_existing_files,
        .specifications = std::move(specs),
        .axis_values = {},
    };
    // Heatmaps share the same axes in all groups
    for (const auto& axes : res.specifications.axes) {
      for (const auto& parameter : {axes.x_parameter, axes.y_parameter}) {
        if (!res.axis_values.contains(parameter)) {
          res.axis_values.emplace(parameter, parameter_range(records, parameter));
        }
      }
    }
    return res;
  });
}

auto do_evaluate(const EvaluateParams& params) -> ResultVoid {
  auto baseline = RecordSelector{.algorithm_id = params.baseline_algorithm_id,
                                 .config_index = params.baseline_config_index};
  auto other = RecordSelector{.algorithm_id = params.other_algorithm_id, .config_index = params.other_config_index};

  return read_plot_records(params.input_file)
      .and_then([&](std::vector<PlotRecord> records) { return prepare_records(params, std::move(records)); })
      .and_then([&](std::vector<PlotRecord> records) {
        // Only the selected configs of each algorithm, plus the comparison between them, are plotted.
        auto plot_records = derive_comparison_records(records, baseline, other);
        ranges::copy_if(records, std::back_inserter(plot_records),
                        [&](const PlotRecord& r) { return baseline.matches(r) || other.matches(r); });

        return prepare_plot_options(params, records).and_then([&](PlotOptions options) -> ResultVoid {
          eval_io::log_metric_histograms(plot_records, options.specifications, params.common->histogram_shape());

          auto groups = group_records(plot_records, params.filter_keys, params.max_depth_filter);
          ELOGFMT(INFO, "{} groups of {} records with filter keys {} and max depth {}.", groups.size(),
                  plot_records.size(), params.filter_keys, params.max_depth_filter);

          auto renderer = JsonPlotRenderer{};
          auto report = render_all(groups, params.output_dir, options, renderer);
          if (!report.failures.empty()) {
            constexpr auto msg_pattern = "Failed to render {} of {} groups. The first failure: {}";
            return rfl::Error{fmt::format(msg_pattern, report.failures.size(), groups.size(),
                                          report.failures.front().message)};
          }
          return RESULT_VOID_SUCCESS;
        });
      });
}
} // namespace

auto evaluate_main(int argc, char** argv) noexcept -> ResultVoid {
  return eval_frameworks::evaluation_framework<EvaluateParams>(argc, argv, "Evaluation", do_evaluate);
}
