#include "batch_runner.h"
#include "dump.h"
#include "utils/easylog.h"
#include "utils/worker_pool.h"
#include <atomic>
#include <future>
#include <magic_enum.hpp>
#include <mutex>
#include <nwgraph/util/timer.hpp>
#include <thread>

namespace {
auto solve_noexcept(AlgorithmAdapter& adapter, const ScenarioInstance& scenario, const ExecutionConfig& config) noexcept
    -> rfl::Result<RawPayload> try {
  return adapter.solve(scenario, config).and_then([](RawPayload payload) -> rfl::Result<RawPayload> {
    if (std::holds_alternative<std::monostate>(payload)) {
      return rfl::Error{"Solver returned an empty payload."};
    }
    return payload;
  });
}
RFL_RESULT_CATCH_HANDLER()

auto check_duplicated_keys(std::span<const ScenarioInstance> scenarios, std::span<const ExecutionConfig> configs)
    -> ResultVoid {
  auto scenario_ids = std::vector<std::string_view>{};
  for (const auto& s : scenarios) {
    scenario_ids.push_back(s.scenario_id);
  }
  ranges::sort(scenario_ids);
  if (auto it = ranges::adjacent_find(scenario_ids); it != scenario_ids.end()) {
    return rfl::Error{fmt::format("Duplicated scenario id '{}' in batch input.", *it)};
  }

  auto config_keys = std::vector<std::pair<std::string_view, size_t>>{};
  for (const auto& c : configs) {
    config_keys.emplace_back(c.algorithm_id, c.config_index);
  }
  ranges::sort(config_keys);
  if (auto it = ranges::adjacent_find(config_keys); it != config_keys.end()) {
    constexpr auto msg_pattern = "Duplicated execution config (algorithm = '{}', config #{}) in batch input.";
    return rfl::Error{fmt::format(msg_pattern, it->first, it->second)};
  }
  return RESULT_VOID_SUCCESS;
}

struct Task {
  const ScenarioInstance* scenario;
  const ExecutionConfig* config;
};
} // namespace

auto run_single_task(std::shared_ptr<AlgorithmAdapter> adapter, const ScenarioInstance& scenario,
                     const ExecutionConfig& config, double timeout_seconds) -> ResultRecord {
  BOOST_ASSERT_MSG(timeout_seconds > 0.0 && timeout_seconds <= MAX_PER_TASK_TIMEOUT,
                   "Time limit must be in range (0, MAX_PER_TASK_TIMEOUT].");
  auto res = ResultRecord{
      .scenario_id = scenario.scenario_id,
      .algorithm_id = config.algorithm_id,
      .config_index = config.config_index,
      .status = RunStatus::ERROR,
      .raw_payload = {},
      .runtime_seconds = 0.0,
      .diagnostic = {},
  };
  // Shared with the solver thread which may outlive this function on timeout
  auto promise = std::make_shared<std::promise<rfl::Result<RawPayload>>>();
  auto future = promise->get_future();

  auto timer = nw::util::seconds_timer{};
  timer.start();
  auto solver_thread = std::thread{};
  try {
    solver_thread = std::thread{[adapter, promise, scenario, config] {
      promise->set_value(solve_noexcept(*adapter, scenario, config));
    }};
  } catch (std::system_error& e) {
    res.diagnostic = fmt::format("Failed to start solver thread: {}", e.what());
    return res;
  }

  if (future.wait_for(std::chrono::duration<double>{timeout_seconds}) == std::future_status::timeout) {
    solver_thread.detach();
    res.status = RunStatus::TIMEOUT;
    res.runtime_seconds = timeout_seconds;
    res.diagnostic = fmt::format("Time limit of {:.3f} seconds exceeded.", timeout_seconds);
    return res;
  }
  solver_thread.join();
  timer.stop();
  res.runtime_seconds = timer.elapsed();

  auto payload = future.get();
  if (!payload) {
    res.diagnostic = payload.error()->what();
    return res;
  }
  res.status = RunStatus::SUCCESS;
  res.raw_payload = std::move(*payload);
  return res;
}

auto run_batch(std::span<const ScenarioInstance> scenarios, std::span<const ExecutionConfig> configs,
               std::shared_ptr<AlgorithmAdapter> adapter, ResultArchive& archive, const BatchRunnerParams& params)
    -> rfl::Result<BatchReport> {
  auto check_res = check_duplicated_keys(scenarios, configs);
  RFL_RETURN_ON_ERROR(check_res);

  auto timer = nw::util::seconds_timer{};
  timer.start();

  auto report = BatchReport{
      .n_tasks = scenarios.size() * configs.size(),
      .n_skipped = 0,
      .n_succeeded = 0,
      .n_timed_out = 0,
      .n_errored = 0,
      .time_usage = 0.0,
  };
  auto tasks = make_reserved_vector<Task>(report.n_tasks);
  for (const auto& config : configs) {
    for (const auto& scenario : scenarios) {
      auto key = ArchiveKey{
          .scenario_id = scenario.scenario_id,
          .algorithm_id = config.algorithm_id,
          .config_index = config.config_index,
      };
      if (archive.contains(key)) {
        VNEPLOG_FMT_TRACE("Skips task {} whose record exists already.", to_string(key));
        report.n_skipped += 1;
      } else {
        tasks.push_back({.scenario = &scenario, .config = &config});
      }
    }
  }
  ELOGFMT(DEBUG, "Batch runner parameters: {}", params);
  auto concurrency = std::min<size_t>(params.concurrency.value(), tasks.size());
  auto timeout_seconds = params.per_task_timeout.value();
  ELOGFMT(INFO, "Starts batch of {} tasks ({} skipped) with {} workers, time limit = {:.1f} seconds per task.",
          tasks.size(), report.n_skipped, concurrency, timeout_seconds);

  auto next_index = std::atomic<size_t>{0};
  auto failed = std::atomic<bool>{false};
  // Guards archive, report and first_error
  auto mutex = std::mutex{};
  auto first_error = std::optional<rfl::Error>{};

  auto worker_fn = [&] {
    while (!failed.load()) {
      auto i = next_index.fetch_add(1);
      if (i >= tasks.size()) {
        break;
      }
      auto [scenario, config] = tasks[i];
      auto record = run_single_task(adapter, *scenario, *config, timeout_seconds);
      auto key = record.key();
      auto status = record.status;
      if (status != RunStatus::SUCCESS) {
        ELOGFMT(WARNING, "Task {} finished with status {}: {}", to_string(key), magic_enum::enum_name(status),
                record.diagnostic);
      }

      auto lock = std::lock_guard{mutex};
      auto insert_res = archive.insert(std::move(record));
      if (!insert_res) {
        if (!first_error) {
          first_error = *insert_res.error();
        }
        failed.store(true);
        break;
      }
      switch (status) {
      case RunStatus::SUCCESS:
        report.n_succeeded += 1;
        break;
      case RunStatus::TIMEOUT:
        report.n_timed_out += 1;
        break;
      case RunStatus::ERROR:
        report.n_errored += 1;
        break;
      }
      VNEPLOG_FMT_DEBUG("Task {} done. Progress: {} / {}", to_string(key),
                        report.n_succeeded + report.n_timed_out + report.n_errored, tasks.size());
    }
  };
  auto pool_res = run_worker_pool(concurrency, worker_fn, [&] { failed.store(true); });
  timer.stop();
  report.time_usage = timer.elapsed();

  if (first_error) {
    return *first_error;
  }
  RFL_RETURN_ON_ERROR(pool_res);
  ELOGFMT(INFO, "Batch done in {:.3f} seconds: {} succeeded, {} timed out, {} errored, {} skipped.", //
          report.time_usage, report.n_succeeded, report.n_timed_out, report.n_errored, report.n_skipped);
  return report;
}
