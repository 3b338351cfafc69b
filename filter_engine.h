#pragma once

#include "result_types.h"
#include <span>

// Records sharing the same values on a subset of generation parameters.
struct FilterGroup {
  // Sorted lexicographically. Empty for the group that aggregates all records.
  std::vector<std::string> key_subset;
  // Values of each key in key_subset.
  // Empty (while key_subset is not) for the placeholder group of a subset with some key absent from all records.
  ParameterMap key_values;
  std::vector<PlotRecord> members;

  auto is_placeholder() const -> bool {
    return !key_subset.empty() && key_values.empty();
  }
};

// All the subsets of candidate_keys with size 0, 1 ... max_depth, duplicated keys ignored,
// ordered by size first and then lexicographically. Keys in each subset are sorted.
// There are sum { C(k, i) | i = 0 ... min(k, max_depth) } subsets in total where k = # of distinct keys.
auto enumerate_key_subsets(std::span<const std::string> candidate_keys, size_t max_depth)
    -> std::vector<std::vector<std::string>>;

// For each key subset in the order above, partitions the records by their values on the keys,
// yielding groups ordered by value tuple. Records without some key in the subset are excluded from its groups.
// If a key is absent from all records, a warning is logged and each subset containing it yields one placeholder group.
auto group_records(std::span<const PlotRecord> records, std::span<const std::string> candidate_keys,
                   size_t max_depth) -> std::vector<FilterGroup>;

// Sorted distinct values of the given generation parameter among the records.
auto parameter_range(std::span<const PlotRecord> records, std::string_view key) -> std::vector<ParameterValue>;

struct RecordExclusions {
  // generation parameter -> values to exclude
  std::map<std::string, std::vector<ParameterValue>, std::less<>> parameter_values;
  // Scenarios dropped from every plot
  std::vector<std::string> scenario_ids;
};

// Removes the records of excluded scenarios, and those whose generation parameters take any excluded value.
// Fails if some excluded value or scenario id is taken by no record, which is likely to be a typo.
auto exclude_records(std::vector<PlotRecord> records, const RecordExclusions& exclusions)
    -> rfl::Result<std::vector<PlotRecord>>;

// Format: { "generation_parameters": { "<parameter>": [<value>, ...], ... }, "scenario_ids": [<id>, ...] }
// Both members are optional.
auto record_exclusions_from_json(const json& json_root) -> rfl::Result<RecordExclusions>;

auto read_record_exclusions(const std::string& path) -> rfl::Result<RecordExclusions>;

// "<k1>_<v1>_<k2>_<v2>...", or "no_filter" for the group aggregating all records.
auto filter_group_title(const FilterGroup& group) -> std::string;
