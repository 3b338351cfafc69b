#pragma once

#include "result_archive.h"
#include "scenario.h"

// Rounding variants of the randomized rounding heuristic, as the suffix of the corresponding metrics,
// e.g. profit_mdk, max_node_load_wo_viol
constexpr auto ROUNDING_VARIANTS = std::array{"mdk"sv, "wo_viol"sv, "min_aug"sv, "max_profit"sv};

// Reduces a result record to its plot record, with generation parameters of the scenario attached.
// Pure function: the raw payload is never retained, and no rounding is performed.
//
// Metrics are extracted only from SUCCESS records; TIMEOUT and ERROR records are kept with empty metrics.
// Optional fields absent in the payload yield NaN.
// Fails if the algorithm id is unknown, or the payload does not belong to the family of the algorithm id.
auto reduce(const ResultRecord& record, const ParameterMap& generation_parameters) -> rfl::Result<PlotRecord>;

enum class ReductionErrorPolicy {
  // Collects the failure and continues with the next record
  SKIP,
  // Stops at the first failure, which is returned as error
  ABORT,
};

struct ReductionFailure {
  ArchiveKey key;
  std::string message;
};

struct ReductionResult {
  // Ordered by key
  std::vector<PlotRecord> records;
  std::vector<ReductionFailure> failures;
};

// Reduces every record in the archive. A record whose scenario is absent in the store fails to reduce.
auto reduce_archive(const ResultArchive& archive, const ScenarioStore& scenarios, ReductionErrorPolicy policy)
    -> rfl::Result<ReductionResult>;

// Format: [ { "scenario_id": ..., "metrics": { "<name>": <value or null>, ... }, ... }, ... ]
auto write_plot_records(const std::string& path, std::span<const PlotRecord> records) -> ResultVoid;

auto read_plot_records(const std::string& path) -> rfl::Result<std::vector<PlotRecord>>;
