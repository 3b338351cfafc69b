#define BOOST_TEST_MODULE "Statistics"
#define BOOST_TEST_DYN_LINK

#define BOOST_TEST_NO_MAIN
#define BOOST_TEST_ALTERNATIVE_INIT_API

#include "statistics.h"
#include "tests/sample_records.h"
#include "utils/easylog.h"
#include <boost/test/unit_test.hpp>

using namespace sample_records;

BOOST_AUTO_TEST_CASE(summary) {
  auto values = std::vector<double>{4.0, NAN_VALUE, 1.0, 3.0, 2.0, NAN_VALUE};
  auto stats = summarize(values);
  BOOST_CHECK_EQUAL(stats.n_values, 4);
  BOOST_CHECK_EQUAL(stats.n_nan, 2);
  BOOST_CHECK_EQUAL(stats.min, 1.0);
  BOOST_CHECK_EQUAL(stats.max, 4.0);
  BOOST_CHECK_CLOSE(stats.mean, 2.5, 1e-9);
  BOOST_CHECK_CLOSE(stats.median, 2.5, 1e-9);
  BOOST_CHECK_CLOSE(stats.stddev, std::sqrt(1.25), 1e-9);

  auto odd = summarize(std::vector<double>{5.0, 1.0, 3.0});
  BOOST_CHECK_EQUAL(odd.median, 3.0);

  auto all_nan = summarize(std::vector<double>{NAN_VALUE, NAN_VALUE});
  BOOST_CHECK_EQUAL(all_nan.n_values, 0);
  BOOST_CHECK_EQUAL(all_nan.n_nan, 2);
  BOOST_CHECK(std::isnan(all_nan.mean));
  BOOST_CHECK(std::isnan(all_nan.min));
  BOOST_CHECK(std::isnan(all_nan.stddev));
}

BOOST_AUTO_TEST_CASE(metric_values) {
  auto records = make_sample_plot_records();
  records[1].status = RunStatus::TIMEOUT;
  records[1].metrics.clear();
  records[2].metrics.clear();

  // S1 dropped as TIMEOUT, S2 without the metric
  auto values = collect_metric_values(records, "objective_value");
  BOOST_REQUIRE_EQUAL(values.size(), 7);
  BOOST_CHECK_EQUAL(values[0], 10.0);
  BOOST_CHECK(std::isnan(values[1]));
  BOOST_CHECK_EQUAL(values[2], 40.0);

  auto bounded = collect_metric_values(records, "objective_value", 45.0);
  auto n_nan = ranges::count_if(bounded, LAMBDA_1(std::isnan(_1)));
  BOOST_CHECK_EQUAL(n_nan, 3); // S0, S2, S3
}

BOOST_AUTO_TEST_CASE(ecdf) {
  auto points = compute_ecdf(std::vector<double>{3.0, NAN_VALUE, 1.0, 2.0, 2.0});
  BOOST_REQUIRE_EQUAL(points.size(), 4);
  auto expected_values = {1.0, 2.0, 2.0, 3.0};
  auto expected_fractions = {0.25, 0.5, 0.75, 1.0};
  for (auto [point, value, fraction] : views::zip(points, expected_values, expected_fractions)) {
    BOOST_CHECK_EQUAL(point.value, value);
    BOOST_CHECK_CLOSE(point.fraction, fraction, 1e-9);
  }
  BOOST_CHECK(compute_ecdf(std::vector<double>{NAN_VALUE}).empty());
}

BOOST_AUTO_TEST_CASE(heatmap) {
  auto records = make_sample_plot_records();
  // x = number_of_requests, y = topology
  auto heatmap = compute_heatmap(records, "objective_value", "number_of_requests", "topology");
  BOOST_REQUIRE_EQUAL(heatmap.x_values.size(), 2);
  BOOST_REQUIRE_EQUAL(heatmap.y_values.size(), 2);
  BOOST_CHECK(heatmap.x_values[0] == ParameterValue{int64_t{20}});
  BOOST_CHECK(heatmap.y_values[1] == ParameterValue{"Iris"s});
  BOOST_REQUIRE_EQUAL(heatmap.cells.size(), 2);
  BOOST_REQUIRE_EQUAL(heatmap.cells[0].size(), 2);

  // Geant & 20 requests: S0 (10) and S2 (30)
  const auto& cell_00 = heatmap.cells[0][0];
  BOOST_CHECK_EQUAL(cell_00.n_values, 2);
  BOOST_CHECK_CLOSE(cell_00.mean, 20.0, 1e-9);
  BOOST_CHECK_EQUAL(cell_00.min, 10.0);
  BOOST_CHECK_EQUAL(cell_00.max, 30.0);
  // Iris & 40 requests: S5 (60) and S7 (80)
  BOOST_CHECK_CLOSE(heatmap.cells[1][1].mean, 70.0, 1e-9);

  auto [min_mean, max_mean] = heatmap.mean_range();
  BOOST_CHECK_CLOSE(min_mean, 20.0, 1e-9);
  BOOST_CHECK_CLOSE(max_mean, 70.0, 1e-9);

  // Values below the lower bound are discarded.
  auto bounded = compute_heatmap(records, "objective_value", "number_of_requests", "topology", 25.0);
  BOOST_CHECK_EQUAL(bounded.cells[0][0].n_values, 1);
  BOOST_CHECK_EQUAL(bounded.cells[0][0].mean, 30.0);
  BOOST_CHECK_EQUAL(bounded.cells[1][0].n_values, 1); // S1 (20) dropped, S3 (40) kept

  // Axis values given explicitly: empty cells for values taken by no record
  auto x_values = std::vector<ParameterValue>{int64_t{20}, int64_t{40}, int64_t{60}};
  auto extended = compute_heatmap(records, "objective_value", "number_of_requests", "topology", std::nullopt,
                                  x_values);
  BOOST_REQUIRE_EQUAL(extended.cells[0].size(), 3);
  BOOST_CHECK_EQUAL(extended.cells[0][2].n_values, 0);
  BOOST_CHECK(std::isnan(extended.cells[0][2].mean));

  // Axis absent from all records
  auto absent = compute_heatmap(records, "objective_value", "node_resource_factor", "topology");
  BOOST_CHECK(absent.x_values.empty());
  auto [absent_min, absent_max] = absent.mean_range();
  BOOST_CHECK(std::isnan(absent_min));
  BOOST_CHECK(std::isnan(absent_max));
}

int main(int argc, char* argv[], char* envp[]) {
  easylog::set_min_severity(easylog::Severity::TRACE);
  return boost::unit_test::unit_test_main(init_unit_test, argc, argv);
}
