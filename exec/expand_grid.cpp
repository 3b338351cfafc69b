#include "evaluation.h"

int main(int argc, char** argv) {
  return expand_grid_main(argc, argv)
      .and_then([](auto) {
        ELOG_INFO << "Grid expansion done.";
        return rfl::Result{0};
      })
      .or_else([](const rfl::Error& error) {
        ELOGFMT(CRITICAL, "Grid expansion halts due to error: `{}'", error.what());
        return rfl::Result{-1};
      })
      .value_or(-1);
}
