#include "evaluation.h"
#include "utils/argparse_helper.h"

namespace {
template <class ParamsType, size_t N>
auto parse_evaluation_params(int argc, char** argv, std::string_view program_name,
                             const std::array<std::string_view, N>& required_members) noexcept
    -> rfl::Result<ParamsType> {
  auto options = ArgumentParserOptions{
      .program_name = program_name,
      .has_config = true,
      .required_members = required_members,
  };
  return parse_from_args_generic<ParamsType>(argc, argv, options);
}
} // namespace

auto ExpandGridParams::parse_from_args(int argc, char** argv) noexcept -> rfl::Result<ExpandGridParams> {
  constexpr auto required = std::array{"input_file"sv, "output_file"sv};
  return parse_evaluation_params<ExpandGridParams>(argc, argv, "vnep_expand_grid", required);
}

auto ReduceArchiveParams::parse_from_args(int argc, char** argv) noexcept -> rfl::Result<ReduceArchiveParams> {
  constexpr auto required = std::array{"scenario_file"sv, "archive_file"sv, "output_file"sv};
  return parse_evaluation_params<ReduceArchiveParams>(argc, argv, "vnep_reduce", required);
}

auto EvaluateParams::parse_from_args(int argc, char** argv) noexcept -> rfl::Result<EvaluateParams> {
  constexpr auto required = std::array{"input_file"sv, "output_dir"sv};
  return parse_evaluation_params<EvaluateParams>(argc, argv, "vnep_evaluate", required)
      .and_then([](EvaluateParams params) -> rfl::Result<EvaluateParams> {
        ranges::sort(params.filter_keys);
        if (auto it = ranges::adjacent_find(params.filter_keys); it != params.filter_keys.end()) {
          return rfl::Error{fmt::format("Duplicated filter key '{}' is disallowed.", *it)};
        }
        if (params.baseline_algorithm_id == params.other_algorithm_id &&
            params.baseline_config_index == params.other_config_index) {
          return rfl::Error{"Baseline and the other execution config must be different."};
        }
        return params;
      });
}
