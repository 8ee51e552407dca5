#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tide-check/align/series_aligner.hpp"
#include "tide-check/core/calendar.hpp"
#include "tide-check/core/errors.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

using tidecheck::align::SeriesAligner;
using tidecheck::core::HeightUnit;
using tidecheck::core::makeUtc;
using tidecheck::core::TimeSeries;
using tests::helpers::Wave;

TEST_CASE("Interpolating a series onto itself is the identity", "[align][aligner][interpolate]") {
	const auto reference = tests::helpers::makeTide(makeUtc(2021, 2, 1), 200, std::chrono::minutes(6), 1.0,
	                                                {Wave{tests::helpers::kM2Speed, 0.8, 45.0}});
	const auto aligner = SeriesAligner::builder().build();

	const auto result = aligner.interpolate(reference, reference);
	REQUIRE(result.getTimestamps() == reference.getTimestamps());
	for (std::size_t i = 0; i < result.size(); ++i) {
		REQUIRE(result.getValues()[i] == reference.getValues()[i]);
	}
}

TEST_CASE("Interpolation tracks the tide between grid points", "[align][aligner][interpolate]") {
	const std::vector<Wave> waves{{tests::helpers::kM2Speed, 1.0, 10.0}, {tests::helpers::kK1Speed, 0.3, 80.0}};
	const auto start = makeUtc(2021, 2, 1);
	const auto reference = tests::helpers::makeTide(start, 6 * 48 + 1, std::chrono::minutes(10), 0.5, waves);

	std::vector<TimeSeries::TimePoint> targets{start + std::chrono::minutes(7), start + std::chrono::minutes(613),
	                                           start + std::chrono::hours(47) + std::chrono::minutes(53)};
	TimeSeries::Attributes attrs;
	attrs.tags = {"a", "b", "c"};
	const TimeSeries target(targets, std::vector<double>(3, tidecheck::core::missingValue()), HeightUnit::Meters,
	                        attrs);

	const auto result = SeriesAligner::builder().build().interpolate(target, reference);
	REQUIRE(result.size() == 3);
	REQUIRE(result.tags() == attrs.tags);
	for (std::size_t i = 0; i < targets.size(); ++i) {
		REQUIRE(result.getValues()[i] == Catch::Approx(tests::helpers::tideAt(targets[i], 0.5, waves)).margin(1e-6));
	}
}

TEST_CASE("Interpolation rejects unusable references", "[align][aligner][validation]") {
	const auto aligner = SeriesAligner::builder().build();
	const auto start = makeUtc(2021, 2, 1);
	const auto reference = tests::helpers::makeSeries({0.0, 1.0, 0.0, -1.0}, std::chrono::hours(1), start);

	const auto early = tests::helpers::makeSeries({1.0}, std::chrono::hours(1), start - std::chrono::minutes(1));
	REQUIRE_THROWS_AS(aligner.interpolate(early, reference), tidecheck::core::InterpolationRangeError);

	const auto late = tests::helpers::makeSeries({1.0}, std::chrono::hours(1), start + std::chrono::hours(4));
	REQUIRE_THROWS_AS(aligner.interpolate(late, reference), tidecheck::core::InterpolationRangeError);

	REQUIRE_THROWS_AS(aligner.interpolate(reference, TimeSeries()), tidecheck::core::EmptySeriesError);

	const auto feet = tests::helpers::makeSeries({1.0}, std::chrono::hours(1), start, HeightUnit::Feet);
	REQUIRE_THROWS_AS(aligner.interpolate(feet, reference), tidecheck::core::InconsistentUnitsError);

	const auto gappy = reference.withValues({0.0, tidecheck::core::missingValue(), 0.0, -1.0});
	REQUIRE_THROWS_AS(aligner.interpolate(reference, gappy), std::invalid_argument);

	REQUIRE(aligner.interpolate(TimeSeries(), reference).isEmpty());
}

TEST_CASE("Nearest match pairs each observation with the closest event", "[align][aligner][nearest]") {
	const auto start = makeUtc(2021, 3, 1);
	const auto reference = tests::helpers::makeTaggedSeries(
	    {start, start + std::chrono::hours(6), start + std::chrono::hours(12)}, {2.0, -1.0, 2.1}, {"h", "l", "h"});
	const auto observations = tests::helpers::makeTaggedSeries(
	    {start + std::chrono::hours(2), start + std::chrono::hours(3), start + std::chrono::hours(4),
	     start + std::chrono::hours(20)},
	    {1.9, 1.8, -0.9, 2.3}, {"H", "H", "L", "H"});

	const auto matches = SeriesAligner::builder().build().nearestMatch(observations, reference);
	REQUIRE(matches.size() == 4);

	REQUIRE(matches[0].reference_time == start);
	REQUIRE(matches[0].offset == std::chrono::hours(2));
	REQUIRE(matches[0].reference == Catch::Approx(2.0));
	REQUIRE(matches[0].reference_tag == "h");
	REQUIRE(matches[0].observation_tag == "H");

	// Equidistant from 0h and 6h: the earlier event wins.
	REQUIRE(matches[1].reference_time == start);

	REQUIRE(matches[2].reference_time == start + std::chrono::hours(6));
	REQUIRE(matches[2].offset == -std::chrono::hours(2));

	REQUIRE(matches[3].reference_time == start + std::chrono::hours(12));
	REQUIRE(matches[3].reference == Catch::Approx(2.1));
}

TEST_CASE("Nearest match honours the maximum distance", "[align][aligner][nearest]") {
	const auto start = makeUtc(2021, 3, 1);
	const auto reference = tests::helpers::makeSeries({2.0, -1.0, 2.1}, std::chrono::hours(6), start);
	const auto observations = tests::helpers::makeSeries({1.9, -1.2, 2.0}, std::chrono::hours(5),
	                                                     start + std::chrono::minutes(30));

	const auto aligner = SeriesAligner::builder().withMaxDistance(std::chrono::minutes(45)).build();
	REQUIRE(aligner.maxDistance().has_value());

	const auto matches = aligner.nearestMatch(observations, reference);
	REQUIRE(matches.size() == 2);
	REQUIRE(matches[0].observation_time == start + std::chrono::minutes(30));
	REQUIRE(matches[1].observation_time == start + std::chrono::hours(5) + std::chrono::minutes(30));
	REQUIRE(matches[1].reference_time == start + std::chrono::hours(6));

	REQUIRE_THROWS_AS(SeriesAligner::builder().withMaxDistance(std::chrono::minutes(-5)).build(),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(aligner.nearestMatch(observations, TimeSeries()), tidecheck::core::EmptySeriesError);
}

TEST_CASE("Matched heights become a series at the observation times", "[align][aligner][nearest]") {
	const auto start = makeUtc(2021, 3, 1);
	const auto reference = tests::helpers::makeTaggedSeries({start, start + std::chrono::hours(6)}, {2.0, -1.0},
	                                                        {"h", "l"});
	const auto observations = tests::helpers::makeSeries({1.9, -0.8}, std::chrono::hours(5),
	                                                     start + std::chrono::minutes(20));

	const auto aligner = SeriesAligner::builder().build();
	const auto predicted =
	    SeriesAligner::toPredictedSeries(aligner.nearestMatch(observations, reference), reference.unit());

	REQUIRE(predicted.getTimestamps() == observations.getTimestamps());
	REQUIRE(predicted.getValues() == std::vector<double>{2.0, -1.0});
	REQUIRE(predicted.tag(1) == "l");
}
