#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tide-check/core/calendar.hpp"
#include "tide-check/harmonics/harmonic_fitter.hpp"
#include "tide-check/harmonics/tide_predictor.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

using tidecheck::core::HeightUnit;
using tidecheck::core::makeUtc;
using tidecheck::harmonics::ConstituentFit;
using tidecheck::harmonics::HarmonicModel;
using tidecheck::harmonics::TidePredictor;

namespace {

HarmonicModel makeModel(HeightUnit unit = HeightUnit::Meters) {
	std::vector<ConstituentFit> fits{{"M2", tests::helpers::kM2Speed, 1.0, 30.0}, {"K1", tests::helpers::kK1Speed, 0.4, 250.0}};
	const auto start = makeUtc(2021, 1, 1);
	return HarmonicModel(0.8, std::move(fits), HarmonicModel::FitWindow{start, start + std::chrono::hours(24 * 30)},
	                     HarmonicModel::TimePoint{}, unit, 720, 0.0);
}

} // namespace

TEST_CASE("Predictor evaluates the harmonic sum", "[harmonics][predictor]") {
	const auto model = makeModel();
	const auto tp = makeUtc(2021, 1, 10, 6, 30);

	const double expected = tests::helpers::tideAt(
	    tp, 0.8, {{tests::helpers::kM2Speed, 1.0, 30.0}, {tests::helpers::kK1Speed, 0.4, 250.0}});
	REQUIRE(TidePredictor::predictAt(model, tp) == Catch::Approx(expected).margin(1e-9));
}

TEST_CASE("Predictor fills a regular grid in the model unit", "[harmonics][predictor]") {
	const auto model = makeModel(HeightUnit::Feet);
	const auto start = makeUtc(2021, 1, 2);

	const auto prediction = TidePredictor::predictRange(model, start, start + std::chrono::hours(2), std::chrono::minutes(1));
	REQUIRE(prediction.size() == 121);
	REQUIRE(prediction.unit() == HeightUnit::Feet);
	REQUIRE(prediction.front() == start);
	REQUIRE(prediction.getValues()[60] ==
	        Catch::Approx(TidePredictor::predictAt(model, start + std::chrono::hours(1))).margin(1e-12));
	REQUIRE_FALSE(prediction.hasMissingValues());
}

TEST_CASE("Predictor extrapolates outside the fitting window", "[harmonics][predictor]") {
	const auto model = makeModel();
	const auto before = makeUtc(2020, 12, 1);
	REQUIRE_FALSE(model.covers(before));

	const auto prediction = TidePredictor::predict(model, {before, before + std::chrono::hours(1)});
	REQUIRE(prediction.size() == 2);
	REQUIRE(std::isfinite(prediction.getValues()[0]));
}

TEST_CASE("Predictor rejects unordered timestamps", "[harmonics][predictor][validation]") {
	const auto model = makeModel();
	const auto tp = makeUtc(2021, 1, 5);
	REQUIRE_THROWS_AS(TidePredictor::predict(model, {tp, tp - std::chrono::hours(1)}), std::invalid_argument);
	REQUIRE_THROWS_AS(TidePredictor::predictRange(model, tp, tp - std::chrono::hours(1), std::chrono::minutes(1)),
	                  std::invalid_argument);
	REQUIRE(TidePredictor::predict(model, {}).isEmpty());
}
