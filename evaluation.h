#pragma once

#include "batch_runner.h"
#include "utils/histogram.h"
#include "utils/result.h"
#include <rfl/Flatten.hpp>
#include <ylt/easylog.hpp>

// These parameters are expected to be "inherited" with rfl::Flatten
struct CommonEvaluationParams {
  // Output file of log.
  std::string log_output_file;
  // Log level, DEBUG or INFO recommended.
  easylog::Severity log_severity = easylog::Severity::DEBUG;
  // Whether or not to output log message to stdout.
  bool log_console = false;
  // Width of histograms during data distribution display.
  rfl::Validator<size_t, rfl::Minimum<1>> histogram_width = 100;
  // Height of histograms during data distribution display.
  rfl::Validator<size_t, rfl::Minimum<1>> histogram_height = 20;

  auto histogram_shape() const -> HistogramShape {
    return {.display_width = histogram_width.value(), .display_height = histogram_height.value()};
  }
};

struct ExpandGridParams {
  rfl::Flatten<CommonEvaluationParams> common;
  // JSON file of algorithm_id -> { parameter -> [values] }
  std::string input_file;
  // JSON file of the expanded execution configs
  std::string output_file;

  static auto parse_from_args(int argc, char** argv) noexcept -> rfl::Result<ExpandGridParams>;
};

struct ReduceArchiveParams {
  rfl::Flatten<CommonEvaluationParams> common;
  std::string scenario_file;
  // JSON Lines file of result records
  std::string archive_file;
  // JSON file of plot records
  std::string output_file;
  // Stops at the first record that fails to reduce, instead of skipping it
  bool abort_on_reduction_error = false;

  static auto parse_from_args(int argc, char** argv) noexcept -> rfl::Result<ReduceArchiveParams>;
};

struct EvaluateParams {
  rfl::Flatten<CommonEvaluationParams> common;
  // JSON file of plot records
  std::string input_file;
  std::string output_dir;
  // Generation parameters by which records are grouped
  std::vector<std::string> filter_keys;
  // Max # of filter keys combined
  size_t max_depth_filter = 2;
  std::string baseline_algorithm_id = std::string{CLASSIC_MCF_ALGORITHM_ID};
  size_t baseline_config_index = 0;
  std::string other_algorithm_id = std::string{RANDOMIZED_ROUNDING_ALGORITHM_ID};
  size_t other_config_index = 0;
  // JSON file of excluded generation parameter values and scenario ids. No exclusion if empty.
  std::string exclude_config;
  // JSON file of metric and axes specifications. Default specifications are used if empty.
  std::string plot_spec_file;
  std::string output_title = "evaluation";
  std::string output_filetype = "json";
  bool overwrite_existing_files = false;

  static auto parse_from_args(int argc, char** argv) noexcept -> rfl::Result<EvaluateParams>;
};

auto expand_grid_main(int argc, char** argv) noexcept -> ResultVoid;

auto reduce_archive_main(int argc, char** argv) noexcept -> ResultVoid;

auto evaluate_main(int argc, char** argv) noexcept -> ResultVoid;
