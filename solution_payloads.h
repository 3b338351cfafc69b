#pragma once

#include "utils/result.h"
#include "utils/utils.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Algorithm families whose solution payloads are understood by the reducer.
enum class AlgorithmFamily { CLASSIC_MCF, RANDOMIZED_ROUNDING };

// Algorithm ids of the exact MIP (multi-commodity flow formulation) and of the randomized rounding heuristic
constexpr auto CLASSIC_MCF_ALGORITHM_ID = "ClassicMCF"sv;
constexpr auto RANDOMIZED_ROUNDING_ALGORITHM_ID = "RandomizedRoundingTriumvirate"sv;

// Returns std::nullopt for unknown algorithm ids.
auto algorithm_family_of(std::string_view algorithm_id) -> std::optional<AlgorithmFamily>;

// ---- ClassicMCF ----

struct TemporalLogEntry {
  // Seconds since the solver started.
  double global_time;
  double objective_value;
  double objective_bound;
};

struct ResourceLoad {
  // "universal" for substrate nodes. Edge resources are (tail, head) as (resource_type, resource_location).
  std::string resource_type;
  std::string resource_location;
  // In percent
  double load;
};

struct ClassicMCFPayload {
  double objective_value;
  std::optional<double> objective_bound;
  // Relative gap (objective_bound - objective_value) / objective_value as fraction
  std::optional<double> objective_gap;
  // # of embedded requests / # of requests, as fraction
  double embedding_ratio;
  std::optional<int64_t> original_number_requests;
  // # of requests which can be embedded on their own
  std::optional<int64_t> feasible_requests;
  std::optional<std::vector<ResourceLoad>> loads;
  std::optional<std::vector<TemporalLogEntry>> temporal_log;
  std::optional<TemporalLogEntry> root_relaxation_entry;
};

// ---- RandomizedRoundingTriumvirate ----

struct RoundingResult {
  double profit;
  // Fractions, 1.0 = exactly the capacity
  double max_node_load;
  double max_edge_load;
};

struct RoundingMetaData {
  // Seconds
  double time_preprocessing;
  double time_optimization;
  double time_postprocessing;
  // Objective of the LP relaxation, which is a dual bound of the MIP
  double lp_objective_value;
};

struct RandomizedRoundingPayload {
  RoundingMetaData meta_data;
  std::optional<RoundingMetaData> mdk_meta_data;
  // Multi-dimensional knapsack rounding
  std::optional<RoundingResult> mdk_result;
  // Heuristic rounding without capacity violations
  std::optional<RoundingResult> result_wo_violations;
  // Samples with violations: the minimal augmentation one and the maximal profit one
  std::optional<RoundingResult> min_aug_result;
  std::optional<RoundingResult> max_profit_result;
};

// Stored payload that does not decode with the schema of its family, kept as is
// so that the archive stays loadable. The reducer rejects it.
struct UndecodedPayload {
  std::string family;
  json data;
  // Why decoding failed
  std::string error;
};

// Opaque solver output. std::monostate for records without payload (timeout and error).
using RawPayload = std::variant<std::monostate, ClassicMCFPayload, RandomizedRoundingPayload, UndecodedPayload>;

// Returns std::nullopt for std::monostate and UndecodedPayload.
auto payload_family(const RawPayload& payload) -> std::optional<AlgorithmFamily>;

// Format: null, or { "family": "<AlgorithmFamily>", "data": { ... } }
auto payload_to_json(const RawPayload& payload) -> json;

// Fails only if the format above is broken. Data not matching the family yields UndecodedPayload.
auto payload_from_json(const json& json_value) -> rfl::Result<RawPayload>;
