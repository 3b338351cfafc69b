#pragma once

#include "dump.h"
#include "evaluation.h"
#include "evaluation/io.h"
#include <nwgraph/util/timer.hpp>

namespace eval_frameworks {
template <class ParamsType, class DoTaskFn>
  requires(std::is_invocable_r_v<ResultVoid, DoTaskFn, const ParamsType&>) // do_task_fn(params)
auto evaluation_framework(int argc, char** argv, std::string_view task_name, DoTaskFn&& do_task_fn) -> ResultVoid try {
  auto timer = nw::util::seconds_timer{};

  // Step 1: Parses arguments from (argc, argv)
  return ParamsType::parse_from_args(argc, argv).and_then([&](ParamsType params) {
    eval_io::init_easylog(*params.common);
    ELOGFMT(INFO, "Parameters: {:4}", params);

    timer.start();
    // Step 2: Performs the task by calling do_task_fn
    return std::invoke(do_task_fn, params).transform([&](rfl::Nothing) {
      timer.stop();
      ELOGFMT(INFO, "{} done. Time usage = {:.3f} sec.", task_name, timer.elapsed());
      return RESULT_VOID_SUCCESS;
    });
  });
}
RFL_RESULT_CATCH_HANDLER() // Error handling on exceptions
} // namespace eval_frameworks
