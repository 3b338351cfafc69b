#include "solution_payloads.h"
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>
#include <rfl.hpp>
#include <rfl/json.hpp>

namespace {
template <class T>
auto payload_data_to_json(const T& data) -> json {
  /* reflect-cpp -> yyjson -> nlohmann::json */
  return json::parse(rfl::json::write(data));
}

template <class T>
auto payload_data_from_json(std::string family, const json& json_data) -> RawPayload {
  auto data = rfl::json::read<T>(json_data.dump());
  if (!data) {
    return UndecodedPayload{.family = std::move(family), .data = json_data, .error = data.error()->what()};
  }
  return std::move(*data);
}
} // namespace

auto algorithm_family_of(std::string_view algorithm_id) -> std::optional<AlgorithmFamily> {
  if (algorithm_id == CLASSIC_MCF_ALGORITHM_ID) {
    return AlgorithmFamily::CLASSIC_MCF;
  }
  if (algorithm_id == RANDOMIZED_ROUNDING_ALGORITHM_ID) {
    return AlgorithmFamily::RANDOMIZED_ROUNDING;
  }
  return std::nullopt;
}

auto payload_family(const RawPayload& payload) -> std::optional<AlgorithmFamily> {
  struct Visitor {
    auto operator()(std::monostate) const -> std::optional<AlgorithmFamily> {
      return std::nullopt;
    }
    auto operator()(const ClassicMCFPayload&) const -> std::optional<AlgorithmFamily> {
      return AlgorithmFamily::CLASSIC_MCF;
    }
    auto operator()(const RandomizedRoundingPayload&) const -> std::optional<AlgorithmFamily> {
      return AlgorithmFamily::RANDOMIZED_ROUNDING;
    }
    auto operator()(const UndecodedPayload&) const -> std::optional<AlgorithmFamily> {
      return std::nullopt;
    }
  };
  return std::visit(Visitor{}, payload);
}

auto payload_to_json(const RawPayload& payload) -> json {
  return std::visit(
      [&]<class T>(const T& alternative) -> json {
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, UndecodedPayload>) {
          return json{{"family", alternative.family}, {"data", alternative.data}};
        } else {
          auto family = std::string{magic_enum::enum_name(*payload_family(payload))};
          return json{{"family", std::move(family)}, {"data", payload_data_to_json(alternative)}};
        }
      },
      payload);
}

auto payload_from_json(const json& json_value) -> rfl::Result<RawPayload> try {
  if (json_value.is_null()) {
    return RawPayload{};
  }
  auto family_str = json_value.at("family").get<std::string>();
  const auto& json_data = json_value.at("data");
  auto family = magic_enum::enum_cast<AlgorithmFamily>(family_str);
  if (!family) {
    auto error = fmt::format("Unknown payload family '{}'.", family_str);
    return RawPayload{UndecodedPayload{.family = std::move(family_str), .data = json_data, .error = std::move(error)}};
  }
  switch (*family) {
  case AlgorithmFamily::CLASSIC_MCF:
    return payload_data_from_json<ClassicMCFPayload>(std::move(family_str), json_data);
  case AlgorithmFamily::RANDOMIZED_ROUNDING:
    return payload_data_from_json<RandomizedRoundingPayload>(std::move(family_str), json_data);
  }
  return rfl::Error{"Unreachable payload family."};
}
RFL_RESULT_CATCH_HANDLER()
