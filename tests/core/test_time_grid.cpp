#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tide-check/core/calendar.hpp"
#include "tide-check/core/time_grid.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

using tidecheck::core::HeightUnit;
using tidecheck::core::makeUtc;
using tidecheck::core::TimeGrid;
using tidecheck::core::TimeSeries;

TEST_CASE("Regular grid includes an end on the step boundary", "[core][time_grid]") {
	const auto start = makeUtc(2021, 6, 1);
	auto grid = TimeGrid::minutes(start, start + std::chrono::hours(1));
	REQUIRE(grid.size() == 61);
	REQUIRE(grid.front() == start);
	REQUIRE(grid.back() == start + std::chrono::hours(1));

	auto coarse = TimeGrid::regular(start, start + std::chrono::minutes(25), std::chrono::minutes(10));
	REQUIRE(coarse.size() == 3);
	REQUIRE(coarse.back() == start + std::chrono::minutes(20));

	REQUIRE(TimeGrid::hours(start, start).size() == 1);
}

TEST_CASE("Regular grid rejects bad arguments", "[core][time_grid][validation]") {
	const auto start = makeUtc(2021, 6, 1);
	REQUIRE_THROWS_AS(TimeGrid::regular(start, start + std::chrono::hours(1), std::chrono::minutes(0)),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(TimeGrid::regular(start, start - std::chrono::hours(1), std::chrono::minutes(1)),
	                  std::invalid_argument);
}

TEST_CASE("Hourly resampling left joins whole hours", "[core][time_grid][hourly]") {
	const auto start = makeUtc(2021, 6, 1, 0, 30);
	std::vector<TimeSeries::TimePoint> timestamps{start, start + std::chrono::minutes(30),
	                                              start + std::chrono::minutes(100), start + std::chrono::minutes(150)};
	TimeSeries series(timestamps, {1.0, 2.0, 3.0, 4.0}, HeightUnit::Feet);

	REQUIRE(TimeGrid::ceilToHour(start) == makeUtc(2021, 6, 1, 1));
	REQUIRE(TimeGrid::ceilToHour(makeUtc(2021, 6, 1, 1)) == makeUtc(2021, 6, 1, 1));

	auto hourly = TimeGrid::resampleHourly(series);
	REQUIRE(hourly.unit() == HeightUnit::Feet);
	REQUIRE(hourly.size() == 3);
	REQUIRE(hourly.front() == makeUtc(2021, 6, 1, 1));
	REQUIRE(hourly.getValues()[0] == Catch::Approx(2.0));
	REQUIRE(std::isnan(hourly.getValues()[1]));
	REQUIRE(hourly.getValues()[2] == Catch::Approx(4.0));
}

TEST_CASE("Hourly resampling of a sub-hour series is empty", "[core][time_grid][hourly]") {
	const auto start = makeUtc(2021, 6, 1, 0, 10);
	TimeSeries series({start, start + std::chrono::minutes(20)}, {1.0, 2.0});
	REQUIRE(TimeGrid::resampleHourly(series).isEmpty());
	REQUIRE(TimeGrid::resampleHourly(TimeSeries()).isEmpty());
}
