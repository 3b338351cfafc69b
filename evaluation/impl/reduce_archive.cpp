#include "evaluation/frameworks.h"
#include "reducer.h"
#include <filesystem>

namespace {
auto do_reduce_archive(const ReduceArchiveParams& params) -> ResultVoid {
  auto policy = params.abort_on_reduction_error ? ReductionErrorPolicy::ABORT : ReductionErrorPolicy::SKIP;

  return read_scenario_store(params.scenario_file).and_then([&](ScenarioStore scenarios) {
    return ResultArchive::open(params.archive_file)
        .and_then([&](ResultArchive archive) { return reduce_archive(archive, scenarios, policy); })
        .and_then([&](ReductionResult reduced) {
          for (const auto& [key, message] : reduced.failures) {
            ELOGFMT(WARNING, "Record {} skipped: {}", to_string(key), message);
          }
          return write_plot_records(params.output_file, reduced.records);
        })
        .transform([&](rfl::Nothing) {
          auto archive_size = std::filesystem::file_size(params.archive_file);
          auto output_size = std::filesystem::file_size(params.output_file);
          ELOGFMT(INFO, "Archive of {} reduced to {} ({:.3f}%).", size_bytes_to_memory_str(archive_size),
                  size_bytes_to_memory_str(output_size), 100.0 * output_size / std::max(archive_size, uintmax_t{1}));
          return RESULT_VOID_SUCCESS;
        });
  });
}
} // namespace

auto reduce_archive_main(int argc, char** argv) noexcept -> ResultVoid {
  return eval_frameworks::evaluation_framework<ReduceArchiveParams>(argc, argv, "Reduction", do_reduce_archive);
}
