#pragma once

#include <boost/assert.hpp>
#include <boost/stacktrace.hpp>
#include <cstdlib>
#include <fmt/format.h>
#include <sstream>
#include <ylt/easylog.hpp>

namespace details {
// Reports to both stderr and the log file, then aborts.
[[noreturn]] inline void report_assert_fail(char const* expr, char const* msg, char const* function, char const* file,
                                            long line) {
  auto trace = std::ostringstream{};
  trace << boost::stacktrace::stacktrace();
  auto report = fmt::format("Assertion `{}' failed at {}:{} in function {}: {}\nStack trace:\n{}", //
                            expr, file, line, function, msg, trace.str());
  fmt::print(stderr, "{}\n", report);
  ELOGFMT(CRITICAL, "{}", report);
  easylog::flush();
  std::abort();
}
} // namespace details

namespace boost {
inline void assertion_failed(char const* expr, char const* function, char const* file, long line) {
  details::report_assert_fail(expr, "(no description)", function, file, line);
}
inline void assertion_failed_msg(char const* expr, char const* msg, char const* function, char const* file, long line) {
  details::report_assert_fail(expr, msg, function, file, line);
}
} // namespace boost
