#pragma once

// HINT: It's recommended to include this "heavy" header
// (which involves huge amount of metaprogramming operations)
// into some specific source file instead of using it as header-only
// to reduce compilation overhead.

#include "utils/reflect.h"
#include <argparse/argparse.hpp>
#include <concepts>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fstream>
#include <rfl/Result.hpp>
#include <rfl/always_false.hpp>

using argparse::Argument;
using argparse::ArgumentParser;

struct ArgumentParserOptions {
  // Shown in the help message
  std::string_view program_name = "";
  // Whether to accept "-c FILE" or "--config FILE", whose JSON contents are read before the other arguments
  bool has_config = true;
  // String members that must be non-empty, either from the configuration file or from the command line
  std::span<const std::string_view> required_members = {};
};

namespace details {
template <class T>
auto add_argument(ArgumentParser& parser, std::string_view arg_name) -> Argument& {
  if constexpr (std::is_same_v<T, std::string>) {
    return parser.add_argument(arg_name);
  } else if constexpr (std::is_same_v<T, bool>) {
    // Bool: As flag argument
    return parser.add_argument(arg_name).implicit_value(true);
  } else if constexpr (std::is_enum_v<T>) {
    // Enumerators: by name
    return parser.add_argument(arg_name).help(fmt::format("One of {}", magic_enum::enum_names<T>()));
  } else if constexpr (std::signed_integral<T>) {
    return parser.add_argument(arg_name).template scan<'i', T>();
  } else if constexpr (std::unsigned_integral<T>) {
    return parser.add_argument(arg_name).template scan<'u', T>();
  } else if constexpr (std::is_floating_point_v<T>) {
    return parser.add_argument(arg_name).template scan<'g', T>();
  } else if constexpr (is_std_vector_v<T>) {
    // List: std::vector only.
    using ValueType = ranges::range_value_t<T>;
    static_assert(std::is_same_v<ValueType, std::string> || !ranges::range<ValueType>,
                  "Nested range is not supported.");
    return add_argument<ReflectionType<ValueType>>(parser, arg_name).nargs(argparse::nargs_pattern::any);
  } else {
    static_assert(rfl::always_false_v<T>, "Unsupported value type.");
  }
}

// Formats 'some_member' to '--some-member'
inline auto to_arg_name(std::string_view field_name) -> std::string {
  auto res = "--" + std::string{field_name};
  ranges::replace(res, '_', '-');
  return res;
}

template <class T>
auto init_argument_parser(ArgumentParser& parser) -> void {
  auto default_value = T{};
  for_each_field(default_value, [&]<class Field>(std::string_view name, Field&) {
    add_argument<ReflectionType<Field>>(parser, to_arg_name(name));
  });
}

template <class T>
auto read_argument_parser(ArgumentParser& parser, T& dest) -> void {
  for_each_field(dest, [&]<class Field>(std::string_view name, Field& field) {
    using Value = ReflectionType<Field>;
    auto arg_name = to_arg_name(name);
    if constexpr (std::is_enum_v<Value>) {
      if (auto opt = parser.present(arg_name)) {
        auto enum_value = magic_enum::enum_cast<Value>(*opt);
        if (!enum_value) {
          constexpr auto msg_pattern = "Invalid enumerator string '{}' for type {}.";
          throw std::invalid_argument{fmt::format(msg_pattern, *opt, demangle_type_name<Value>())};
        }
        field = *enum_value;
      } // Otherwise, the field is simply ignored
    } else if constexpr (std::is_same_v<Value, bool>) {
      // Flags are present with value false by default, which shall not override the config file.
      if (parser.is_used(arg_name)) {
        field = parser.get<bool>(arg_name);
      }
    } else {
      if (auto opt = parser.present<Value>(arg_name)) {
        field = *opt; // Performs check during operator= for rfl::Validator types
      }
    }
  });
}
} // namespace details

// Parses an object of type T from command line arguments: each member 'some_member' of T
// (including those in rfl::Flatten members) is read from '--some-member'.
// With options.has_config, members are read from the JSON file given by '--config' first,
// then overridden by the explicitly provided command line arguments.
template <std::default_initializable T>
auto parse_from_args_generic(int argc, char** argv, const ArgumentParserOptions& options = {}) noexcept
    -> rfl::Result<T> try {
  // Step 1: Prepares the argument parser
  auto parser = ArgumentParser(std::string{options.program_name});
  details::init_argument_parser<T>(parser);
  if (options.has_config) {
    parser.add_argument("-c", "--config").help("Configuration file as JSON format");
  }
  // Step 2: Performs parsing
  parser.parse_args(argc, argv);
  // Step 3: Reads from the configuration file, and then from the command line
  auto res = T{};
  if (auto config_path = options.has_config ? parser.present("--config") : std::nullopt) {
    auto fin = std::ifstream{*config_path};
    if (!fin.is_open()) {
      return rfl::Error{fmt::format("Failed to open configuration file '{}'.", *config_path)};
    }
    read_fields_from_json(res, json::parse(fin));
  }
  details::read_argument_parser(parser, res);
  // Step 4: Checks the required members
  auto missing = std::optional<std::string>{};
  for_each_field(res, [&]<class Field>(std::string_view name, const Field& field) {
    if constexpr (std::is_same_v<Field, std::string>) {
      if (!missing && field.empty() && ranges::contains(options.required_members, name)) {
        missing = details::to_arg_name(name);
      }
    }
  });
  if (missing) {
    return rfl::Error{fmt::format("Argument '{}' is required.", *missing)};
  }
  return res;
} catch (std::exception& e) {
  constexpr auto msg_pattern = "Exception of type '{}' caught during argument parsing: `{}'";
  return rfl::Error{fmt::format(msg_pattern, demangle_type_name(e), e.what())};
} catch (...) {
  return rfl::Error{"Unknown exception caught during argument parsing."};
}
