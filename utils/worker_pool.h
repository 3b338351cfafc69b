#pragma once

#include "utils/result.h"
#include "utils/utils.h"
#include <optional>
#include <system_error>
#include <thread>

// Runs worker_fn() in n_workers threads and waits for all of them.
// If some thread fails to start, on_start_failure() is called (e.g. to tell the running workers to stop early),
// the threads started so far are joined, and the failure is returned.
template <class Thread = std::jthread, class WorkerFn, class OnStartFailureFn>
  requires(std::invocable<WorkerFn&> && std::invocable<OnStartFailureFn&>)
auto run_worker_pool(size_t n_workers, WorkerFn&& worker_fn, OnStartFailureFn&& on_start_failure) -> ResultVoid {
  auto error = std::optional<rfl::Error>{};
  {
    auto workers = make_reserved_vector<Thread>(n_workers);
    try {
      for (auto i = 0zu; i < n_workers; i++) {
        workers.emplace_back(std::ref(worker_fn));
      }
    } catch (std::system_error& e) {
      on_start_failure();
      constexpr auto msg_pattern = "Failed to start worker thread #{} of {}: {}";
      error = rfl::Error{fmt::format(msg_pattern, workers.size(), n_workers, e.what())};
    }
    for (auto& worker : workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }
  if (error) {
    return *error;
  }
  return RESULT_VOID_SUCCESS;
}
