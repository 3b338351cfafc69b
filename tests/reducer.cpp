#define BOOST_TEST_MODULE "Reducer"
#define BOOST_TEST_DYN_LINK

#define BOOST_TEST_NO_MAIN
#define BOOST_TEST_ALTERNATIVE_INIT_API

#include "comparison.h"
#include "reducer.h"
#include "tests/sample_records.h"
#include "utils/easylog.h"
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace sample_records;

namespace {
constexpr auto TOLERANCE = 1e-9; // In percent

const auto SCENARIO = make_scenario("S0", 20, 0.5, "Geant");
const auto MCF_CONFIG = make_configs(CLASSIC_MCF_ALGORITHM_ID, 1).front();
const auto RR_CONFIG = make_configs(RANDOMIZED_ROUNDING_ALGORITHM_ID, 1).front();

auto check_metric(const PlotRecord& record, std::string_view metric, double expected) {
  BOOST_TEST_CONTEXT("metric = " << metric) {
    auto value = get_metric(record, metric);
    if (std::isnan(expected)) {
      BOOST_CHECK(std::isnan(value));
    } else {
      BOOST_CHECK_CLOSE(value, expected, TOLERANCE);
    }
  }
}
} // namespace

BOOST_AUTO_TEST_CASE(classic_mcf_metrics) {
  auto record = make_success_record(SCENARIO, MCF_CONFIG, make_mcf_payload(100.0));
  auto reduced = reduce(record, SCENARIO.generation_parameters);
  BOOST_REQUIRE(reduced.has_value());
  BOOST_CHECK(reduced->status == RunStatus::SUCCESS);
  BOOST_CHECK(reduced->generation_parameters == SCENARIO.generation_parameters);
  BOOST_CHECK(reduced->key() == record.key());

  check_metric(*reduced, "objective_value", 100.0);
  check_metric(*reduced, "objective_bound", 110.0);
  check_metric(*reduced, "objective_gap", 10.0);
  check_metric(*reduced, "embedding_ratio", 75.0);
  check_metric(*reduced, "cleaned_embedding_ratio", 100.0);
  check_metric(*reduced, "feasible_requests", 30.0);
  check_metric(*reduced, "runtime", 42.0);
  check_metric(*reduced, "avg_node_load", 50.0);
  check_metric(*reduced, "max_node_load", 60.0);
  check_metric(*reduced, "avg_edge_load", 40.0);
  check_metric(*reduced, "max_edge_load", 50.0);
  check_metric(*reduced, "avg_load", 45.0);
  check_metric(*reduced, "max_load", 60.0);
  check_metric(*reduced, "root_dual_bound", 200.0);
  check_metric(*reduced, "final_dual_bound", 110.0);
}

BOOST_AUTO_TEST_CASE(classic_mcf_missing_fields) {
  auto payload = ClassicMCFPayload{
      .objective_value = 50.0,
      .objective_bound = std::nullopt,
      .objective_gap = std::nullopt,
      .embedding_ratio = 0.5,
      .original_number_requests = std::nullopt,
      .feasible_requests = 0,
      .loads = std::nullopt,
      .temporal_log = std::nullopt,
      .root_relaxation_entry = TemporalLogEntry{0.0, 0.0, -1e100},
  };
  auto record = make_success_record(SCENARIO, MCF_CONFIG, payload);
  auto reduced = reduce(record, SCENARIO.generation_parameters);
  BOOST_REQUIRE(reduced.has_value());
  check_metric(*reduced, "objective_value", 50.0);
  check_metric(*reduced, "objective_bound", NAN_VALUE);
  check_metric(*reduced, "objective_gap", NAN_VALUE);
  check_metric(*reduced, "cleaned_embedding_ratio", NAN_VALUE);
  check_metric(*reduced, "max_node_load", NAN_VALUE);
  check_metric(*reduced, "avg_load", NAN_VALUE);
  check_metric(*reduced, "root_dual_bound", NAN_VALUE);
  check_metric(*reduced, "final_dual_bound", NAN_VALUE);
  // Falls back to the runtime of the record
  check_metric(*reduced, "runtime", record.runtime_seconds);
}

BOOST_AUTO_TEST_CASE(randomized_rounding_metrics) {
  auto record = make_success_record(SCENARIO, RR_CONFIG, make_rr_payload(120.0));
  auto reduced = reduce(record, SCENARIO.generation_parameters);
  BOOST_REQUIRE(reduced.has_value());
  check_metric(*reduced, "runtime_preprocessing", 1.0);
  check_metric(*reduced, "runtime_optimization", 2.0);
  check_metric(*reduced, "runtime_postprocessing", 3.0);
  check_metric(*reduced, "runtime_total", 6.0);
  check_metric(*reduced, "runtime_mdk", NAN_VALUE);
  check_metric(*reduced, "lp_objective", 120.0);
  check_metric(*reduced, "profit_mdk", 90.0);
  check_metric(*reduced, "max_node_load_mdk", 90.0);
  check_metric(*reduced, "max_edge_load_mdk", 80.0);
  check_metric(*reduced, "profit_wo_viol", 80.0);
  check_metric(*reduced, "profit_min_aug", NAN_VALUE);
  check_metric(*reduced, "max_node_load_min_aug", NAN_VALUE);
  check_metric(*reduced, "profit_max_profit", 120.0);
  check_metric(*reduced, "max_node_load_max_profit", 150.0);
  check_metric(*reduced, "max_edge_load_max_profit", 125.0);
}

BOOST_AUTO_TEST_CASE(determinism) {
  auto record = make_success_record(SCENARIO, MCF_CONFIG, make_mcf_payload(100.0));
  auto r1 = reduce(record, SCENARIO.generation_parameters);
  auto r2 = reduce(record, SCENARIO.generation_parameters);
  BOOST_REQUIRE(r1.has_value() && r2.has_value());
  BOOST_CHECK(*r1 == *r2);
  // Raw payload is never carried
  auto json_obj = plot_record_to_json(*r1);
  BOOST_CHECK(!json_obj.contains("payload"));
  BOOST_CHECK(!json_obj.contains("raw_payload"));
  // NaN survives serialization as null
  auto restored = plot_record_from_json(json_obj);
  BOOST_REQUIRE(restored.has_value());
  BOOST_CHECK(*restored == *r1);
}

BOOST_AUTO_TEST_CASE(reduction_errors) {
  // Payload mismatching the algorithm family
  auto mismatched = make_success_record(SCENARIO, MCF_CONFIG, make_rr_payload(120.0));
  BOOST_CHECK(!reduce(mismatched, SCENARIO.generation_parameters).has_value());
  // Unknown algorithm
  auto unknown_config = make_configs("GreedyHeuristic", 1).front();
  auto unknown = make_success_record(SCENARIO, unknown_config, make_mcf_payload(1.0));
  BOOST_CHECK(!reduce(unknown, SCENARIO.generation_parameters).has_value());
  // SUCCESS without payload
  auto empty = make_success_record(SCENARIO, MCF_CONFIG, RawPayload{});
  BOOST_CHECK(!reduce(empty, SCENARIO.generation_parameters).has_value());
}

BOOST_AUTO_TEST_CASE(failed_records_kept) {
  for (auto status : {RunStatus::TIMEOUT, RunStatus::ERROR}) {
    auto record = ResultRecord{
        .scenario_id = "S0",
        .algorithm_id = std::string{RANDOMIZED_ROUNDING_ALGORITHM_ID},
        .config_index = 0,
        .status = status,
        .raw_payload = {},
        .runtime_seconds = 1.0,
        .diagnostic = "failed",
    };
    auto reduced = reduce(record, SCENARIO.generation_parameters);
    BOOST_REQUIRE(reduced.has_value());
    BOOST_CHECK(reduced->status == status);
    BOOST_CHECK(reduced->metrics.empty());
  }
}

BOOST_AUTO_TEST_CASE(archive_reduction) {
  auto dir = TemporaryDirectory{"reduce-archive"};
  auto archive = ResultArchive::open(dir.file("results.jsonl"));
  BOOST_REQUIRE(archive.has_value());
  auto scenarios = make_sample_scenarios();
  for (const auto& scenario : scenarios) {
    BOOST_REQUIRE(archive->insert(make_success_record(scenario, MCF_CONFIG, make_mcf_payload(100.0))).has_value());
  }
  // Scenario absent from the store
  auto lost = make_scenario("S-lost", 20, 0.5, "Geant");
  BOOST_REQUIRE(archive->insert(make_success_record(lost, MCF_CONFIG, make_mcf_payload(100.0))).has_value());
  // Payload mismatch
  BOOST_REQUIRE(archive->insert(make_success_record(scenarios[0], RR_CONFIG, make_mcf_payload(1.0))).has_value());

  auto store = ScenarioStore::from_scenarios(scenarios);
  BOOST_REQUIRE(store.has_value());

  auto skipped = reduce_archive(*archive, *store, ReductionErrorPolicy::SKIP);
  BOOST_REQUIRE(skipped.has_value());
  BOOST_CHECK_EQUAL(skipped->records.size(), scenarios.size());
  BOOST_CHECK_EQUAL(skipped->failures.size(), 2);
  BOOST_CHECK(ranges::is_sorted(skipped->records, ranges::less{}, &PlotRecord::key));

  BOOST_CHECK(!reduce_archive(*archive, *store, ReductionErrorPolicy::ABORT).has_value());

  // Written and read back as a whole
  auto path = dir.file("reduced.json");
  BOOST_REQUIRE(write_plot_records(path, skipped->records).has_value());
  auto read_back = read_plot_records(path);
  BOOST_REQUIRE(read_back.has_value());
  BOOST_CHECK(*read_back == skipped->records);
}

BOOST_AUTO_TEST_CASE(undecodable_payload) {
  auto dir = TemporaryDirectory{"reduce-undecodable"};
  auto path = dir.file("results.jsonl");
  auto scenarios = make_sample_scenarios();
  {
    auto fout = std::ofstream{path};
    fout << result_record_to_json(make_success_record(scenarios[0], MCF_CONFIG, make_mcf_payload(100.0))).dump()
         << '\n';
    // ClassicMCF payload without objective_value
    auto broken = result_record_to_json(make_success_record(scenarios[1], MCF_CONFIG, make_mcf_payload(100.0)));
    broken["payload"]["data"].erase("objective_value");
    fout << broken.dump() << '\n';
  }
  // The archive stays loadable, and thus resumable.
  auto archive = ResultArchive::open(path);
  BOOST_REQUIRE(archive.has_value());
  BOOST_REQUIRE_EQUAL(archive->size(), 2);
  auto broken_key = ArchiveKey{.scenario_id = "S1", .algorithm_id = MCF_CONFIG.algorithm_id, .config_index = 0};
  BOOST_CHECK(std::holds_alternative<UndecodedPayload>(archive->find(broken_key)->raw_payload));
  BOOST_REQUIRE(archive->insert(make_success_record(scenarios[2], MCF_CONFIG, make_mcf_payload(100.0))).has_value());

  auto store = ScenarioStore::from_scenarios(scenarios);
  BOOST_REQUIRE(store.has_value());
  auto skipped = reduce_archive(*archive, *store, ReductionErrorPolicy::SKIP);
  BOOST_REQUIRE(skipped.has_value());
  BOOST_CHECK_EQUAL(skipped->records.size(), 2);
  BOOST_REQUIRE_EQUAL(skipped->failures.size(), 1);
  BOOST_CHECK(skipped->failures[0].key == broken_key);
  BOOST_CHECK(!reduce_archive(*archive, *store, ReductionErrorPolicy::ABORT).has_value());

  // Kept as stored after reloading, and written back unchanged
  auto reloaded = ResultArchive::open(path);
  BOOST_REQUIRE(reloaded.has_value());
  const auto& payload = std::get<UndecodedPayload>(reloaded->find(broken_key)->raw_payload);
  BOOST_CHECK_EQUAL(payload.family, "CLASSIC_MCF");
  BOOST_CHECK(!payload.data.contains("objective_value"));
  BOOST_CHECK(payload_to_json(payload)["data"] == payload.data);
}

BOOST_AUTO_TEST_CASE(comparison_records) {
  auto scenarios = make_sample_scenarios();
  auto records = std::vector<PlotRecord>{};
  for (const auto& scenario : scenarios | views::take(3)) {
    records.push_back(*reduce(make_success_record(scenario, MCF_CONFIG, make_mcf_payload(100.0)),
                              scenario.generation_parameters));
    records.push_back(*reduce(make_success_record(scenario, RR_CONFIG, make_rr_payload(120.0)),
                              scenario.generation_parameters));
  }
  // Baseline with zero objective
  records.push_back(*reduce(make_success_record(scenarios[3], MCF_CONFIG, make_mcf_payload(0.0)),
                            scenarios[3].generation_parameters));
  records.push_back(*reduce(make_success_record(scenarios[3], RR_CONFIG, make_rr_payload(0.0)),
                            scenarios[3].generation_parameters));
  // Baseline only
  records.push_back(*reduce(make_success_record(scenarios[4], MCF_CONFIG, make_mcf_payload(100.0)),
                            scenarios[4].generation_parameters));

  auto baseline = RecordSelector{.algorithm_id = std::string{CLASSIC_MCF_ALGORITHM_ID}, .config_index = 0};
  auto other = RecordSelector{.algorithm_id = std::string{RANDOMIZED_ROUNDING_ALGORITHM_ID}, .config_index = 0};
  auto compared = derive_comparison_records(records, baseline, other);
  BOOST_REQUIRE_EQUAL(compared.size(), 4);

  const auto& c0 = compared[0];
  BOOST_CHECK_EQUAL(c0.algorithm_id, "ClassicMCF_vs_RandomizedRoundingTriumvirate");
  BOOST_CHECK(c0.generation_parameters == scenarios[0].generation_parameters);
  check_metric(c0, "relative_profit_mdk", 90.0);
  check_metric(c0, "relative_profit_wo_viol", 80.0);
  check_metric(c0, "relative_profit_min_aug", NAN_VALUE);
  check_metric(c0, "relative_profit_max_profit", 120.0);
  check_metric(c0, "relative_root_dual_bound", 200.0 / 120.0);
  check_metric(c0, "relative_final_dual_bound", 110.0 / 120.0);
  check_metric(c0, "baseline_max_node_load", 60.0);
  check_metric(c0, "other_max_node_load_mdk", 90.0);

  const auto& c3 = compared[3];
  BOOST_CHECK_EQUAL(c3.scenario_id, "S3");
  check_metric(c3, "relative_profit_mdk", NAN_VALUE);
  check_metric(c3, "relative_root_dual_bound", NAN_VALUE);
}

int main(int argc, char* argv[], char* envp[]) {
  easylog::set_min_severity(easylog::Severity::TRACE);
  return boost::unit_test::unit_test_main(init_unit_test, argc, argv);
}
