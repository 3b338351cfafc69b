#pragma once

#include "utils/demangle.h"
#include <fmt/format.h>
#include <rfl/Result.hpp>

constexpr auto RESULT_VOID_SUCCESS = rfl::Nothing{};

using ResultVoid = rfl::Result<rfl::Nothing>;

// Returns the error of res from the enclosing function, whose return type is any rfl::Result<U>.
#define RFL_RETURN_ON_ERROR(res) \
  if (!(res)) {                  \
    return *(res).error();       \
  }

#define RFL_RESULT_CATCH_HANDLER()                                                                    \
  catch (std::exception & e) {                                                                        \
    constexpr auto msg_pattern = "Exception of type {} caught at line #{} of file {}: `{}'";          \
    return rfl::Error{fmt::format(msg_pattern, demangle_type_name(e), __LINE__, __FILE__, e.what())}; \
  }                                                                                                   \
  catch (...) {                                                                                       \
    constexpr auto msg_pattern = "Unknown exception caught at line #{} of file {}.";                  \
    return rfl::Error{fmt::format(msg_pattern, __LINE__, __FILE__)};                                  \
  }

// Prefixes the error message of a failed result with the given context, e.g. a file path or a record key.
template <class T>
inline auto with_error_context(rfl::Result<T> res, std::string_view context) -> rfl::Result<T> {
  return std::move(res).or_else([context](const rfl::Error& e) -> rfl::Result<T> {
    return rfl::Error{fmt::format("{}: {}", context, e.what())};
  });
}
