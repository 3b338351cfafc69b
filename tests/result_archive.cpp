#define BOOST_TEST_MODULE "Result Archive"
#define BOOST_TEST_DYN_LINK

#define BOOST_TEST_NO_MAIN
#define BOOST_TEST_ALTERNATIVE_INIT_API

#include "result_archive.h"
#include "tests/sample_records.h"
#include "utils/easylog.h"
#include <boost/test/unit_test.hpp>
#include <fstream>

using namespace sample_records;

namespace {
auto read_lines(const std::string& path) -> std::vector<std::string> {
  auto fin = std::ifstream{path};
  auto res = std::vector<std::string>{};
  for (auto line = std::string{}; std::getline(fin, line);) {
    res.push_back(std::move(line));
  }
  return res;
}

auto make_sample_result_records() -> std::vector<ResultRecord> {
  auto scenarios = make_sample_scenarios();
  auto mcf_config = make_configs(CLASSIC_MCF_ALGORITHM_ID, 1).front();
  auto rr_config = make_configs(RANDOMIZED_ROUNDING_ALGORITHM_ID, 1).front();
  auto timeout_record = ResultRecord{
      .scenario_id = scenarios[1].scenario_id,
      .algorithm_id = mcf_config.algorithm_id,
      .config_index = 0,
      .status = RunStatus::TIMEOUT,
      .raw_payload = {},
      .runtime_seconds = 7200.0,
      .diagnostic = "Time limit exceeded.",
  };
  return {
      make_success_record(scenarios[0], mcf_config, make_mcf_payload(100.0)),
      make_success_record(scenarios[0], rr_config, make_rr_payload(120.0)),
      std::move(timeout_record),
  };
}
} // namespace

BOOST_AUTO_TEST_CASE(insert_and_reload) {
  auto dir = TemporaryDirectory{"archive"};
  auto path = dir.file("results.jsonl");
  auto records = make_sample_result_records();
  {
    auto archive = ResultArchive::open(path);
    BOOST_REQUIRE(archive.has_value());
    BOOST_CHECK_EQUAL(archive->size(), 0);
    for (const auto& record : records) {
      BOOST_REQUIRE(archive->insert(record).has_value());
    }
    // Each record is flushed as one line immediately
    BOOST_CHECK_EQUAL(read_lines(path).size(), 3);
    // Duplicated keys are rejected
    BOOST_CHECK(!archive->insert(records.front()).has_value());
    BOOST_CHECK_EQUAL(read_lines(path).size(), 3);
  }
  auto reloaded = ResultArchive::open(path);
  BOOST_REQUIRE(reloaded.has_value());
  BOOST_REQUIRE_EQUAL(reloaded->size(), 3);
  for (const auto& record : records) {
    BOOST_REQUIRE(reloaded->contains(record.key()));
    const auto* found = reloaded->find(record.key());
    BOOST_CHECK(found->status == record.status);
    BOOST_CHECK_EQUAL(found->diagnostic, record.diagnostic);
    BOOST_CHECK_EQUAL(found->runtime_seconds, record.runtime_seconds);
    BOOST_CHECK_EQUAL(found->raw_payload.index(), record.raw_payload.index());
  }
  const auto* mcf = reloaded->find(records[0].key());
  const auto& payload = std::get<ClassicMCFPayload>(mcf->raw_payload);
  BOOST_CHECK_EQUAL(payload.objective_value, 100.0);
  BOOST_REQUIRE(payload.loads.has_value());
  BOOST_CHECK_EQUAL(payload.loads->size(), 4);
  BOOST_CHECK(!reloaded->contains({.scenario_id = "S0", .algorithm_id = "ClassicMCF", .config_index = 1}));
}

BOOST_AUTO_TEST_CASE(truncated_last_line) {
  auto dir = TemporaryDirectory{"archive-truncated"};
  auto path = dir.file("results.jsonl");
  auto records = make_sample_result_records();
  {
    auto archive = ResultArchive::open(path);
    BOOST_REQUIRE(archive.has_value());
    BOOST_REQUIRE(archive->insert(records[0]).has_value());
    BOOST_REQUIRE(archive->insert(records[1]).has_value());
  }
  {
    // Simulates a crash during writing the 3rd record
    auto fout = std::ofstream{path, std::ios::app};
    fout << R"({"scenario_id": "S1", "algorithm_id": "Clas)";
  }
  auto archive = ResultArchive::open(path);
  BOOST_REQUIRE(archive.has_value());
  BOOST_CHECK_EQUAL(archive->size(), 2);
  // The journal is compacted, thus new records can be appended as usual.
  BOOST_CHECK_EQUAL(read_lines(path).size(), 2);
  BOOST_REQUIRE(archive->insert(records[2]).has_value());
  BOOST_CHECK_EQUAL(read_lines(path).size(), 3);
  BOOST_CHECK_EQUAL(ResultArchive::open(path)->size(), 3);
}

BOOST_AUTO_TEST_CASE(missing_line_break) {
  auto dir = TemporaryDirectory{"archive-line-break"};
  auto path = dir.file("results.jsonl");
  auto records = make_sample_result_records();
  {
    // Crash after the 2nd record is written but before its line break
    auto fout = std::ofstream{path};
    fout << result_record_to_json(records[0]).dump() << '\n' << result_record_to_json(records[1]).dump();
  }
  {
    auto archive = ResultArchive::open(path);
    BOOST_REQUIRE(archive.has_value());
    BOOST_CHECK_EQUAL(archive->size(), 2);
    BOOST_REQUIRE(archive->insert(records[2]).has_value());
  }
  BOOST_CHECK_EQUAL(read_lines(path).size(), 3);
  auto reloaded = ResultArchive::open(path);
  BOOST_REQUIRE(reloaded.has_value());
  BOOST_CHECK_EQUAL(reloaded->size(), 3);
  BOOST_CHECK(reloaded->contains(records[1].key()));
  BOOST_CHECK(reloaded->contains(records[2].key()));
}

BOOST_AUTO_TEST_CASE(corrupted_journal) {
  auto dir = TemporaryDirectory{"archive-corrupted"};
  auto records = make_sample_result_records();
  auto write_lines = [&](const std::string& path, std::span<const std::string> lines) {
    auto fout = std::ofstream{path};
    for (const auto& line : lines) {
      fout << line << '\n';
    }
  };
  auto record_lines = records | views::transform([](const ResultRecord& r) { return result_record_to_json(r).dump(); });
  auto lines = std::vector<std::string>(record_lines.begin(), record_lines.end());

  // Malformed line in the middle
  auto malformed = lines;
  malformed[1] = "{ this is not JSON";
  write_lines(dir.file("malformed.jsonl"), malformed);
  BOOST_CHECK(!ResultArchive::open(dir.file("malformed.jsonl")).has_value());

  // Valid JSON, but not a record
  auto invalid = lines;
  invalid[0] = R"({"scenario_id": "S0"})";
  write_lines(dir.file("invalid.jsonl"), invalid);
  BOOST_CHECK(!ResultArchive::open(dir.file("invalid.jsonl")).has_value());

  // Duplicated records
  auto duplicated = lines;
  duplicated.push_back(lines.front());
  write_lines(dir.file("duplicated.jsonl"), duplicated);
  BOOST_CHECK(!ResultArchive::open(dir.file("duplicated.jsonl")).has_value());
}

int main(int argc, char* argv[], char* envp[]) {
  easylog::set_min_severity(easylog::Severity::TRACE);
  return boost::unit_test::unit_test_main(init_unit_test, argc, argv);
}
