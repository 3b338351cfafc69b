#pragma once

#include "algorithm_adapter.h"
#include "result_archive.h"
#include <memory>
#include <rfl/Validator.hpp>

// One year. Longer limits overflow the clock durations in waiting.
constexpr auto MAX_PER_TASK_TIMEOUT = 31'536'000;

struct BatchRunnerParams {
  // # of worker threads, i.e. max # of concurrent solve() calls
  rfl::Validator<uint64_t, rfl::Minimum<1>> concurrency = 1;
  // Wall-clock time limit of each (scenario, config) task in seconds
  rfl::Validator<double, rfl::ExclusiveMinimum<0>, rfl::Maximum<MAX_PER_TASK_TIMEOUT>> per_task_timeout = 7'200.0;
};

struct BatchReport {
  // # of tasks in the cross product, including the skipped ones
  size_t n_tasks;
  // # of tasks whose records are present in the archive already
  size_t n_skipped;
  size_t n_succeeded;
  size_t n_timed_out;
  size_t n_errored;
  // Wall-clock time of the whole batch in seconds
  double time_usage;
};

// Runs a single task with the given time limit, in a separate thread.
// The solve() call is abandoned (with its thread detached) on timeout, and its late result is discarded;
// The adapter, scenario and config are kept alive by the abandoned thread until it returns.
// Failures are recorded in the returned record rather than propagated.
// timeout_seconds must be in (0, MAX_PER_TASK_TIMEOUT].
auto run_single_task(std::shared_ptr<AlgorithmAdapter> adapter, const ScenarioInstance& scenario,
                     const ExecutionConfig& config, double timeout_seconds) -> ResultRecord;

// Runs every (scenario, config) task in the cross product of scenarios and configs with a bounded worker pool,
// appending the record of each finished task to the archive immediately.
// Tasks whose keys exist in the archive already are skipped.
//
// Timeout and solver failure of individual tasks are recorded as TIMEOUT and ERROR records respectively.
// Only systemic failures are returned as errors: duplicated scenario ids or duplicated
// (algorithm_id, config_index) in the input, and failure of archive writing.
// In the latter case, no more tasks are started, and the records of finished tasks remain in the archive.
auto run_batch(std::span<const ScenarioInstance> scenarios, std::span<const ExecutionConfig> configs,
               std::shared_ptr<AlgorithmAdapter> adapter, ResultArchive& archive, const BatchRunnerParams& params)
    -> rfl::Result<BatchReport>;
