#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tide-check/core/calendar.hpp"
#include "tide-check/extrema/extrema_detector.hpp"
#include "tide-check/pipeline/validation_pipeline.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

using tidecheck::core::makeUtc;
using tidecheck::core::TimeSeries;
using tidecheck::harmonics::ConstituentCatalogue;
using tidecheck::pipeline::PipelineConfig;
using tidecheck::pipeline::ValidationPipeline;
using tests::helpers::Wave;

namespace {

// Published tables round times to the minute and list each event a little late.
TimeSeries makeHighLowTable(const tidecheck::extrema::ExtremaSet &extrema, std::chrono::minutes shift,
                            double height_offset) {
	std::vector<TimeSeries::TimePoint> timestamps;
	std::vector<double> heights;
	std::vector<std::string> tags;
	for (const auto &event : extrema.events()) {
		timestamps.push_back(event.timestamp + shift);
		heights.push_back(event.height + height_offset);
		tags.push_back(event.kind == tidecheck::extrema::ExtremaKind::High ? "H" : "L");
	}
	return tests::helpers::makeTaggedSeries(std::move(timestamps), std::move(heights), std::move(tags));
}

} // namespace

TEST_CASE("High/low table validation end to end", "[integration][workflow]") {
	const auto start = makeUtc(2021, 1, 1);
	const std::vector<Wave> waves{{tests::helpers::kM2Speed, 1.3, 120.0},
	                              {tests::helpers::kS2Speed, 0.45, 300.0},
	                              {tests::helpers::kK1Speed, 0.3, 50.0}};
	const auto observed = tests::helpers::makeTide(start, 40 * 24, std::chrono::hours(1), 1.2, waves);

	PipelineConfig config;
	config.catalogue = ConstituentCatalogue::principal();
	const ValidationPipeline pipeline(config);

	const auto end = start + std::chrono::hours(24 * 15);
	const auto reconstruction = pipeline.reconstruct(observed, start, end);
	REQUIRE(reconstruction.model.constituent("M2")->amplitude == Catch::Approx(1.3).margin(1e-4));
	REQUIRE(reconstruction.model.constituent("N2")->amplitude == Catch::Approx(0.0).margin(1e-4));

	const auto table = makeHighLowTable(reconstruction.extrema, std::chrono::minutes(5), 0.1);
	const auto report = pipeline.validateHighLowTable(table, reconstruction);

	REQUIRE(report.matches.size() == table.size());
	REQUIRE(report.records.size() == table.size());
	REQUIRE(report.unmatched == 0);
	for (const auto &match : report.matches) {
		REQUIRE(match.offset == std::chrono::minutes(5));
	}
	for (const auto &record : report.records) {
		REQUIRE(record.residual == Catch::Approx(0.1).margin(1e-9));
	}

	REQUIRE(report.summary.statistics->mean == Catch::Approx(0.1).margin(1e-9));
	REQUIRE(report.summary.top.size() == 5);

	// 2021-01-01 to 2021-01-16 covers day-of-year weeks 1 and 2 plus one day of week 3.
	REQUIRE(report.weekly.size() == 3);
	std::size_t highs = 0;
	std::size_t lows = 0;
	for (const auto &week : report.weekly) {
		highs += week.highs;
		lows += week.lows;
	}
	REQUIRE(highs == reconstruction.extrema.highs().size());
	REQUIRE(lows == reconstruction.extrema.lows().size());

	SECTION("drops rows beyond the match cutoff") {
		PipelineConfig strict = config;
		strict.max_match_distance = std::chrono::minutes(2);
		const ValidationPipeline strict_pipeline(strict);

		const auto strict_report = strict_pipeline.validateHighLowTable(table, reconstruction);
		REQUIRE(strict_report.records.empty());
		REQUIRE(strict_report.unmatched == table.size());
		REQUIRE_FALSE(strict_report.summary.hasData());
	}
}

TEST_CASE("Digitized marigram validation against the hourly prediction", "[integration][workflow]") {
	const auto start = makeUtc(2021, 3, 1);
	const std::vector<Wave> waves{{tests::helpers::kM2Speed, 0.9, 10.0}, {tests::helpers::kK1Speed, 0.4, 170.0}};
	const auto observed = tests::helpers::makeTide(start, 20 * 24, std::chrono::hours(1), 0.0, waves);

	PipelineConfig config;
	config.catalogue = ConstituentCatalogue::standard().select({"M2", "K1"});
	const ValidationPipeline pipeline(config);

	const auto reconstruction = pipeline.reconstruct(observed, start, start + std::chrono::hours(24 * 7));
	const auto hourly = ValidationPipeline::hourlyPrediction(reconstruction);

	// Digitized every two hours, with a clock drift that leaves odd rows off the hour.
	std::vector<TimeSeries::TimePoint> timestamps;
	std::vector<double> heights;
	for (int h = 0; h <= 24 * 7; h += 2) {
		const auto tp = start + std::chrono::hours(h) + std::chrono::minutes(h % 4 == 0 ? 0 : 7);
		timestamps.push_back(tp);
		heights.push_back(tests::helpers::tideAt(tp, 0.05, waves));
	}
	const TimeSeries digitized(std::move(timestamps), std::move(heights));

	const auto report = pipeline.validateTimeSeries(digitized, hourly);
	REQUIRE(report.records.size() == digitized.size() / 2 + 1);
	REQUIRE(report.unmatched == digitized.size() - report.records.size());
	REQUIRE(report.summary.statistics->mean == Catch::Approx(0.05).margin(1e-6));
	REQUIRE(report.summary.statistics->max == Catch::Approx(0.05).margin(1e-6));
}
