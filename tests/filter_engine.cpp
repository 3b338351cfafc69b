#define BOOST_TEST_MODULE "Filter Engine"
#define BOOST_TEST_DYN_LINK

#define BOOST_TEST_NO_MAIN
#define BOOST_TEST_ALTERNATIVE_INIT_API

#include "filter_engine.h"
#include "tests/sample_records.h"
#include "utils/easylog.h"
#include <boost/test/unit_test.hpp>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

using namespace sample_records;

namespace {
auto binomial(size_t n, size_t k) -> size_t {
  auto res = 1zu;
  for (auto i : range(k)) {
    res = res * (n - i) / (i + 1);
  }
  return res;
}

auto subset_str(const std::vector<std::string>& subset) -> std::string {
  return fmt::format("[{}]", fmt::join(subset, ","));
}
} // namespace

BOOST_AUTO_TEST_CASE(subset_enumeration) {
  auto keys = std::vector<std::string>{"topology", "number_of_requests", "edge_resource_factor", "node_resource_factor"};
  for (auto max_depth : range(6zu)) {
    auto subsets = enumerate_key_subsets(keys, max_depth);
    auto expected_count = 0zu;
    for (auto i : range(std::min(max_depth, keys.size()) + 1)) {
      expected_count += binomial(keys.size(), i);
    }
    BOOST_CHECK_EQUAL(subsets.size(), expected_count);
  }
  auto subsets = enumerate_key_subsets(keys, 2);
  auto strs = subsets | views::transform(subset_str);
  BOOST_CHECK_EQUAL(fmt::format("{}", fmt::join(strs, " ")),
                    "[] [edge_resource_factor] [node_resource_factor] [number_of_requests] [topology] "
                    "[edge_resource_factor,node_resource_factor] [edge_resource_factor,number_of_requests] "
                    "[edge_resource_factor,topology] [node_resource_factor,number_of_requests] "
                    "[node_resource_factor,topology] [number_of_requests,topology]");

  // Duplicated keys are ignored
  auto duplicated = std::vector<std::string>{"topology", "topology", "number_of_requests"};
  BOOST_CHECK_EQUAL(enumerate_key_subsets(duplicated, 2).size(), 1 + 2 + 1);
}

BOOST_AUTO_TEST_CASE(aggregate_all) {
  auto records = make_sample_plot_records();
  auto groups = group_records(records, std::vector<std::string>{}, 0);
  BOOST_REQUIRE_EQUAL(groups.size(), 1);
  BOOST_CHECK(groups[0].key_subset.empty());
  BOOST_CHECK(groups[0].key_values.empty());
  BOOST_CHECK(!groups[0].is_placeholder());
  BOOST_CHECK(groups[0].members == records);
  BOOST_CHECK_EQUAL(filter_group_title(groups[0]), "no_filter");

  // Still one group without any record
  auto empty_groups = group_records(std::vector<PlotRecord>{}, std::vector<std::string>{"topology"}, 0);
  BOOST_REQUIRE_EQUAL(empty_groups.size(), 1);
  BOOST_CHECK(empty_groups[0].members.empty());
}

BOOST_AUTO_TEST_CASE(partition) {
  auto records = make_sample_plot_records();
  // Record without topology
  records.push_back(make_plot_record("S-extra", std::string{CLASSIC_MCF_ALGORITHM_ID},
                                     {{"number_of_requests", int64_t{20}}}, {{"objective_value", 1.0}}));
  auto keys = std::vector<std::string>{"topology", "number_of_requests", "edge_resource_factor"};
  auto groups = group_records(records, keys, 3);
  // Groups of each subset: [] -> 1, single keys -> 2 each, pairs -> 4 each, triple -> 8
  BOOST_REQUIRE_EQUAL(groups.size(), 1 + 3 * 2 + 3 * 4 + 8);

  auto subsets = enumerate_key_subsets(keys, 3);
  for (const auto& subset : subsets) {
    BOOST_TEST_CONTEXT("subset = " << subset_str(subset)) {
      auto in_subset = groups | FILTER_VIEW(_1.key_subset == subset);
      // Each record carrying all the keys appears exactly once
      auto count = std::map<std::string, size_t>{};
      for (const auto& group : in_subset) {
        BOOST_CHECK_EQUAL(group.key_values.size(), subset.size());
        for (const auto& member : group.members) {
          count[member.scenario_id] += 1;
          for (const auto& [key, value] : group.key_values) {
            BOOST_CHECK(member.generation_parameters.at(key) == value);
          }
        }
      }
      auto has_all_keys = [&](const PlotRecord& r) {
        return ranges::all_of(subset, [&](const std::string& k) { return r.generation_parameters.contains(k); });
      };
      for (const auto& record : records) {
        BOOST_CHECK_EQUAL(count[record.scenario_id], has_all_keys(record) ? 1 : 0);
      }
    }
  }

  // Groups are ordered by value tuple
  auto by_requests = groups | FILTER_VIEW(_1.key_subset == std::vector<std::string>{"number_of_requests"});
  auto titles = by_requests | views::transform(filter_group_title);
  BOOST_CHECK_EQUAL(fmt::format("{}", fmt::join(titles, " ")), "number_of_requests_20 number_of_requests_40");
  BOOST_CHECK_EQUAL(ranges::distance(by_requests.begin(), by_requests.end()), 2);
  BOOST_CHECK_EQUAL(ranges::begin(by_requests)->members.size(), 5); // With "S-extra"
}

BOOST_AUTO_TEST_CASE(missing_key) {
  auto records = make_sample_plot_records();
  auto keys = std::vector<std::string>{"topology", "substrate_filter"};
  auto groups = group_records(records, keys, 2);
  // [] -> 1, [substrate_filter] -> placeholder, [topology] -> 2, [substrate_filter, topology] -> placeholder
  BOOST_REQUIRE_EQUAL(groups.size(), 1 + 1 + 2 + 1);
  BOOST_CHECK(groups[1].is_placeholder());
  BOOST_CHECK(groups[1].members.empty());
  BOOST_CHECK_EQUAL(subset_str(groups[1].key_subset), "[substrate_filter]");
  BOOST_CHECK(!groups[2].is_placeholder());
  BOOST_CHECK(groups[4].is_placeholder());
  BOOST_CHECK_EQUAL(subset_str(groups[4].key_subset), "[substrate_filter,topology]");
}

BOOST_AUTO_TEST_CASE(exclusion) {
  auto records = make_sample_plot_records();
  auto range_of_rf = parameter_range(records, "edge_resource_factor");
  BOOST_REQUIRE_EQUAL(range_of_rf.size(), 2);
  BOOST_CHECK(range_of_rf[0] == ParameterValue{0.5});
  BOOST_CHECK(range_of_rf[1] == ParameterValue{1.0});
  BOOST_CHECK(parameter_range(records, "absent").empty());

  auto exclusions = record_exclusions_from_json(json::parse(R"({
    "generation_parameters": {"topology": ["Iris"], "number_of_requests": [40]}
  })"));
  BOOST_REQUIRE(exclusions.has_value());
  auto remaining = exclude_records(records, *exclusions);
  BOOST_REQUIRE(remaining.has_value());
  BOOST_CHECK_EQUAL(remaining->size(), 2);
  for (const auto& record : *remaining) {
    BOOST_CHECK(record.generation_parameters.at("topology") == ParameterValue{"Geant"s});
    BOOST_CHECK(record.generation_parameters.at("number_of_requests") == ParameterValue{int64_t{20}});
  }

  // Scenario ids are dropped regardless of their parameters.
  auto by_scenario = record_exclusions_from_json(json::parse(R"({
    "generation_parameters": {"topology": ["Iris"]},
    "scenario_ids": ["S0", "S4"]
  })"));
  BOOST_REQUIRE(by_scenario.has_value());
  BOOST_CHECK_EQUAL(by_scenario->scenario_ids.size(), 2);
  auto remaining_scenarios = exclude_records(records, *by_scenario);
  BOOST_REQUIRE(remaining_scenarios.has_value());
  auto remaining_ids = *remaining_scenarios | views::transform(&PlotRecord::scenario_id);
  BOOST_CHECK_EQUAL(fmt::format("{}", fmt::join(remaining_ids, ",")), "S2,S6");

  // Excluding a value or a scenario taken by no record is an error
  auto typo = RecordExclusions{.parameter_values = {{"topology", {"Geamt"s}}}, .scenario_ids = {}};
  BOOST_CHECK(!exclude_records(records, typo).has_value());
  auto unknown_scenario = RecordExclusions{.parameter_values = {}, .scenario_ids = {"S8"}};
  BOOST_CHECK(!exclude_records(records, unknown_scenario).has_value());
  BOOST_CHECK(!record_exclusions_from_json(json::parse(R"({"scenario_ids": "S0"})")).has_value());
}

int main(int argc, char* argv[], char* envp[]) {
  easylog::set_min_severity(easylog::Severity::TRACE);
  return boost::unit_test::unit_test_main(init_unit_test, argc, argv);
}
