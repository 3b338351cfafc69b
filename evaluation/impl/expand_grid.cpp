#include "evaluation/frameworks.h"
#include "execution_config.h"

namespace {
auto do_expand_grid(const ExpandGridParams& params) -> ResultVoid {
  return read_parameter_grid(params.input_file).and_then([&](ParameterGrid grid) {
    auto configs = std::vector<ExecutionConfig>{};
    for (const auto& algorithm_grid : grid) {
      auto expanded = expand_parameter_grid(algorithm_grid);
      ELOGFMT(INFO, "{} execution configs of algorithm '{}' with {} parameters.", expanded.size(),
              algorithm_grid.algorithm_id, algorithm_grid.parameters.size());
      ranges::move(expanded, std::back_inserter(configs));
    }
    return write_execution_configs(params.output_file, configs);
  });
}
} // namespace

auto expand_grid_main(int argc, char** argv) noexcept -> ResultVoid {
  return eval_frameworks::evaluation_framework<ExpandGridParams>(argc, argv, "Grid expansion", do_expand_grid);
}
