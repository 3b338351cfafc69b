#pragma once

#include "execution_config.h"
#include "scenario.h"
#include "solution_payloads.h"

// Interface to an external solution algorithm, which is treated as a black box.
// solve() may be called concurrently from multiple threads, and may either return an error
// or throw an exception on failure.
class AlgorithmAdapter {
public:
  virtual ~AlgorithmAdapter() = default;

  virtual auto solve(const ScenarioInstance& scenario, const ExecutionConfig& config) -> rfl::Result<RawPayload> = 0;
};
