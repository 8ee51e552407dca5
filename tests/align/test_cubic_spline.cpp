#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tide-check/align/cubic_spline.hpp"
#include "tide-check/core/errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using tidecheck::align::CubicSpline;

namespace {

double cubic(double x) {
	return x * x * x - 2.0 * x * x + x + 1.0;
}

} // namespace

TEST_CASE("Spline passes through every knot", "[align][spline]") {
	const std::vector<double> x{0.0, 0.7, 1.5, 2.0, 3.2, 4.0};
	const std::vector<double> y{1.0, -0.3, 2.2, 0.4, 0.9, -1.1};
	CubicSpline spline(x, y);

	REQUIRE(spline.knots() == 6);
	REQUIRE(spline.lowerBound() == 0.0);
	REQUIRE(spline.upperBound() == 4.0);
	for (std::size_t i = 0; i < x.size(); ++i) {
		REQUIRE(spline(x[i]) == y[i]);
	}
}

TEST_CASE("Not-a-knot spline reproduces a cubic polynomial", "[align][spline]") {
	const std::vector<double> x{-1.0, -0.2, 0.5, 1.1, 2.0, 2.4, 3.5};
	std::vector<double> y;
	for (double xi : x) {
		y.push_back(cubic(xi));
	}
	CubicSpline spline(x, y);

	for (double q : {-0.9, -0.5, 0.0, 0.8, 1.7, 2.2, 3.0, 3.49}) {
		REQUIRE(spline(q) == Catch::Approx(cubic(q)).margin(1e-9));
		REQUIRE(spline.derivative(q) == Catch::Approx(3.0 * q * q - 4.0 * q + 1.0).margin(1e-8));
	}

	const auto values = spline.evaluate({0.25, 1.25});
	REQUIRE(values.size() == 2);
	REQUIRE(values[1] == Catch::Approx(cubic(1.25)).margin(1e-9));
}

TEST_CASE("Short splines degrade to lower order fits", "[align][spline]") {
	CubicSpline single({2.0}, {5.0});
	REQUIRE(single(2.0) == 5.0);
	REQUIRE(single.derivative(2.0) == 0.0);

	CubicSpline line({0.0, 2.0}, {1.0, 5.0});
	REQUIRE(line(0.5) == Catch::Approx(2.0));

	CubicSpline parabola({0.0, 1.0, 3.0}, {0.0, 1.0, 9.0});
	REQUIRE(parabola(2.0) == Catch::Approx(4.0));
	REQUIRE(parabola.derivative(2.0) == Catch::Approx(4.0));
}

TEST_CASE("Spline queries outside the knots throw", "[align][spline][range]") {
	CubicSpline spline({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 0.0, 1.0});
	REQUIRE_THROWS_AS(spline(-0.001), tidecheck::core::InterpolationRangeError);
	REQUIRE_THROWS_AS(spline(3.5), std::out_of_range);
	REQUIRE_THROWS_AS(spline(std::numeric_limits<double>::quiet_NaN()), tidecheck::core::InterpolationRangeError);

	CubicSpline single({2.0}, {5.0});
	REQUIRE_THROWS_AS(single(2.5), tidecheck::core::InterpolationRangeError);
}

TEST_CASE("Spline construction validates knots", "[align][spline][validation]") {
	REQUIRE_THROWS_AS(CubicSpline({}, {}), tidecheck::core::EmptySeriesError);
	REQUIRE_THROWS_AS(CubicSpline({0.0, 1.0}, {1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(CubicSpline({0.0, 0.0, 1.0}, {1.0, 2.0, 3.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(CubicSpline({0.0, 1.0}, {1.0, std::numeric_limits<double>::quiet_NaN()}),
	                  std::invalid_argument);
}
