#pragma once

#include <cstddef>
#include <vector>

namespace tidecheck::align {

/**
 * @class CubicSpline
 * @brief Interpolating cubic spline with not-a-knot end conditions.
 *
 * The third derivative is continuous across the second and the second-to-last
 * knots. Slopes are found with one tridiagonal solve. Two knots give the straight
 * line, three knots the parabola through them, one knot a constant.
 */
class CubicSpline {
public:
	/**
	 * @throws core::EmptySeriesError If no knots are given.
	 * @throws std::invalid_argument If sizes differ, x is not strictly increasing or y is not finite.
	 */
	CubicSpline(std::vector<double> x, std::vector<double> y);

	/**
	 * @brief Value of the spline at @p x.
	 * @throws core::InterpolationRangeError If x lies outside [front knot, back knot].
	 */
	double operator()(double x) const;

	/// First derivative of the spline at @p x (same domain rule as operator()).
	double derivative(double x) const;

	std::vector<double> evaluate(const std::vector<double> &x) const;

	double lowerBound() const {
		return x_.front();
	}

	double upperBound() const {
		return x_.back();
	}

	std::size_t knots() const {
		return x_.size();
	}

	const std::vector<double> &slopes() const {
		return slopes_;
	}

private:
	void computeSlopes();
	std::size_t segmentFor(double x) const;

	std::vector<double> x_;
	std::vector<double> y_;
	std::vector<double> slopes_;
};

} // namespace tidecheck::align
