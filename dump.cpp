#include "dump.h"
#include "utils/demangle.h"
#include <nlohmann/json.hpp>
#include <rfl.hpp>
#include <rfl/json.hpp>

namespace {
template <class T>
inline auto dump_generic(const T& value, int indent = 0) noexcept -> std::string try {
  auto unindented = rfl::json::write(value);
  if (indent <= 0) {
    return unindented;
  }
  return json::parse(unindented).dump(indent);
} catch (std::exception& e) {
  return fmt::format("<DUMP ERROR: [{}] {}>", demangle_type_name(e), e.what());
} catch (...) {
  return "<DUMP ERROR: Unknown>";
}

// Returns null on failure.
template <class T>
inline auto dump_as_json_generic(const T& value) noexcept -> json {
  auto res = json::parse(rfl::json::write(value), nullptr, false);
  return res.is_discarded() ? json{} : res;
}
} // namespace

#define IMPLEMENT_DUMP_FUNCTIONS(Type)                               \
  auto dump(const Type& value, int indent) noexcept -> std::string { \
    return ::dump_generic(value, indent);                            \
  }                                                                  \
  auto dump_as_json(const Type& value) noexcept -> json {            \
    return ::dump_as_json_generic(value);                            \
  }

DUMP_REGISTERED_TYPES(IMPLEMENT_DUMP_FUNCTIONS)
#undef IMPLEMENT_DUMP_FUNCTIONS
