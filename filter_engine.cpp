#include "filter_engine.h"
#include "utils/easylog.h"
#include <fmt/ranges.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>

namespace {
// Appends all the subsets of keys[first ...] of the given size, each with the prefix, in lexicographic order.
auto append_combinations(std::span<const std::string> keys, size_t first, size_t size,
                         std::vector<std::string>& prefix, std::vector<std::vector<std::string>>& dest) -> void {
  if (prefix.size() == size) {
    dest.push_back(prefix);
    return;
  }
  for (auto i = first; i + (size - prefix.size()) <= keys.size(); i++) {
    prefix.push_back(keys[i]);
    append_combinations(keys, i + 1, size, prefix, dest);
    prefix.pop_back();
  }
}

auto value_tuple_to_string(const ParameterValueTuple& values) -> std::string {
  auto strs = values | views::transform([](const ParameterValue& v) { return to_string(v); });
  return fmt::format("({})", fmt::join(strs, ", "));
}
} // namespace

auto enumerate_key_subsets(std::span<const std::string> candidate_keys, size_t max_depth)
    -> std::vector<std::vector<std::string>> {
  auto keys = std::vector<std::string>(candidate_keys.begin(), candidate_keys.end());
  ranges::sort(keys);
  auto [dup_first, dup_last] = ranges::unique(keys);
  keys.erase(dup_first, dup_last);

  auto res = std::vector<std::vector<std::string>>{};
  auto prefix = std::vector<std::string>{};
  for (auto size = 0zu; size <= std::min(max_depth, keys.size()); size++) {
    append_combinations(keys, 0, size, prefix, res);
  }
  return res;
}

auto group_records(std::span<const PlotRecord> records, std::span<const std::string> candidate_keys,
                   size_t max_depth) -> std::vector<FilterGroup> {
  auto absent_keys = std::set<std::string, std::less<>>{};
  for (const auto& key : candidate_keys) {
    auto present = ranges::any_of(records, [&](const PlotRecord& r) {
      return find_parameter(r.generation_parameters, key) != nullptr;
    });
    if (!present && absent_keys.insert(key).second) {
      ELOGFMT(WARNING, "Filter key '{}' is absent from all the {} records.", key, records.size());
    }
  }

  auto res = std::vector<FilterGroup>{};
  for (auto& key_subset : enumerate_key_subsets(candidate_keys, max_depth)) {
    if (ranges::any_of(key_subset, [&](const std::string& key) { return absent_keys.contains(key); })) {
      res.push_back({.key_subset = std::move(key_subset), .key_values = {}, .members = {}});
      continue;
    }
    auto partition = std::map<ParameterValueTuple, std::vector<PlotRecord>>{};
    for (const auto& record : records) {
      auto values = make_reserved_vector<ParameterValue>(key_subset.size());
      for (const auto& key : key_subset) {
        const auto* value = find_parameter(record.generation_parameters, key);
        if (value == nullptr) {
          break;
        }
        values.push_back(*value);
      }
      if (values.size() == key_subset.size()) {
        partition[std::move(values)].push_back(record);
      }
    }
    // The aggregating group always exists even without any record
    if (key_subset.empty() && partition.empty()) {
      partition.try_emplace(ParameterValueTuple{});
    }
    VNEPLOG_FMT_DEBUG("{} groups with key subset [{}].", partition.size(), fmt::join(key_subset, ", "));
    for (auto& [values, members] : partition) {
      auto group = FilterGroup{.key_subset = key_subset, .key_values = {}, .members = std::move(members)};
      for (const auto& [key, value] : views::zip(key_subset, values)) {
        group.key_values.emplace(key, value);
      }
      VNEPLOG_FMT_TRACE("Group {}: {} records.", value_tuple_to_string(values), group.members.size());
      res.push_back(std::move(group));
    }
  }
  return res;
}

auto parameter_range(std::span<const PlotRecord> records, std::string_view key) -> std::vector<ParameterValue> {
  auto values = std::set<ParameterValue>{};
  for (const auto& record : records) {
    if (const auto* value = find_parameter(record.generation_parameters, key); value != nullptr) {
      values.insert(*value);
    }
  }
  return std::vector<ParameterValue>(values.begin(), values.end());
}

auto exclude_records(std::vector<PlotRecord> records, const RecordExclusions& exclusions)
    -> rfl::Result<std::vector<PlotRecord>> {
  for (const auto& [key, excluded_values] : exclusions.parameter_values) {
    auto values = parameter_range(records, key);
    for (const auto& excluded : excluded_values) {
      if (!ranges::binary_search(values, excluded)) {
        constexpr auto msg_pattern = "Excluded value {} of parameter '{}' is not in the range {}.";
        return rfl::Error{fmt::format(msg_pattern, to_string(excluded), key, value_tuple_to_string(values))};
      }
    }
  }
  for (const auto& scenario_id : exclusions.scenario_ids) {
    if (!ranges::contains(records, scenario_id, &PlotRecord::scenario_id)) {
      return rfl::Error{fmt::format("Excluded scenario '{}' has no record.", scenario_id)};
    }
  }
  auto is_excluded = [&](const PlotRecord& record) {
    if (ranges::contains(exclusions.scenario_ids, record.scenario_id)) {
      return true;
    }
    return ranges::any_of(exclusions.parameter_values, [&](const auto& item) {
      const auto* value = find_parameter(record.generation_parameters, item.first);
      return value != nullptr && ranges::contains(item.second, *value);
    });
  };
  auto n_before = records.size();
  std::erase_if(records, is_excluded);
  ELOGFMT(INFO, "{} of {} records excluded.", n_before - records.size(), n_before);
  return std::move(records);
}

auto record_exclusions_from_json(const json& json_root) -> rfl::Result<RecordExclusions> try {
  if (!json_root.is_object()) {
    return rfl::Error{"Exclusions must be a JSON object."};
  }
  auto res = RecordExclusions{};
  if (json_root.contains("generation_parameters")) {
    const auto& json_parameters = json_root.at("generation_parameters");
    if (!json_parameters.is_object()) {
      return rfl::Error{"Excluded generation parameters must be a JSON object of parameter -> [values]."};
    }
    for (const auto& [key, json_values] : json_parameters.items()) {
      if (!json_values.is_array()) {
        return rfl::Error{fmt::format("Excluded values of parameter '{}' must be a list.", key)};
      }
      auto& values = res.parameter_values[key];
      for (const auto& json_value : json_values) {
        auto value = parameter_value_from_json(json_value);
        RFL_RETURN_ON_ERROR(value);
        values.push_back(std::move(*value));
      }
    }
  }
  if (json_root.contains("scenario_ids")) {
    res.scenario_ids = json_root.at("scenario_ids").get<std::vector<std::string>>();
  }
  for (const auto& [key, _] : json_root.items()) {
    if (key != "generation_parameters" && key != "scenario_ids") {
      ELOGFMT(WARNING, "Unknown member '{}' of exclusions is ignored.", key);
    }
  }
  return res;
}
RFL_RESULT_CATCH_HANDLER()

auto read_record_exclusions(const std::string& path) -> rfl::Result<RecordExclusions> try {
  auto fin = std::ifstream{path};
  if (!fin.is_open()) {
    return rfl::Error{fmt::format("Failed to open exclusion file '{}'.", path)};
  }
  return with_error_context(record_exclusions_from_json(json::parse(fin)), path);
}
RFL_RESULT_CATCH_HANDLER()

auto filter_group_title(const FilterGroup& group) -> std::string {
  if (group.key_values.empty()) {
    return group.key_subset.empty() ? "no_filter" : fmt::format("missing_{}", fmt::join(group.key_subset, "_"));
  }
  auto parts = group.key_values | views::transform([](const auto& item) {
                 return fmt::format("{}_{}", item.first, to_string(item.second));
               });
  return fmt::format("{}", fmt::join(parts, "_"));
}
