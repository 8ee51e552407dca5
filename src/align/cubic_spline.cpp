#include "tide-check/align/cubic_spline.hpp"
#include "tide-check/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tidecheck::align {

CubicSpline::CubicSpline(std::vector<double> x, std::vector<double> y) : x_(std::move(x)), y_(std::move(y)) {
	if (x_.size() != y_.size()) {
		throw std::invalid_argument("Spline knots and values must have the same size.");
	}
	if (x_.empty()) {
		throw core::EmptySeriesError("Spline needs at least one knot.");
	}
	for (std::size_t i = 0; i < x_.size(); ++i) {
		if (!std::isfinite(x_[i]) || !std::isfinite(y_[i])) {
			throw std::invalid_argument("Spline knots and values must be finite.");
		}
		if (i > 0 && !(x_[i] > x_[i - 1])) {
			throw std::invalid_argument("Spline knots must be strictly increasing.");
		}
	}
	computeSlopes();
}

void CubicSpline::computeSlopes() {
	const std::size_t n = x_.size();
	slopes_.assign(n, 0.0);
	if (n == 1) {
		return;
	}

	std::vector<double> h(n - 1);
	std::vector<double> delta(n - 1);
	for (std::size_t i = 0; i + 1 < n; ++i) {
		h[i] = x_[i + 1] - x_[i];
		delta[i] = (y_[i + 1] - y_[i]) / h[i];
	}

	if (n == 2) {
		slopes_[0] = slopes_[1] = delta[0];
		return;
	}

	if (n == 3) {
		// Not-a-knot at both interior knots of a 3-point spline reduces to the interpolating parabola.
		const double c = (delta[1] - delta[0]) / (x_[2] - x_[0]);
		for (std::size_t i = 0; i < 3; ++i) {
			slopes_[i] = delta[0] + c * (2.0 * x_[i] - x_[0] - x_[1]);
		}
		return;
	}

	// Tridiagonal system in the knot slopes: sub (a), diagonal (b), super (c), rhs (d).
	std::vector<double> a(n, 0.0);
	std::vector<double> b(n, 0.0);
	std::vector<double> c(n, 0.0);
	std::vector<double> d(n, 0.0);

	const double d0 = h[0] + h[1];
	b[0] = h[1];
	c[0] = d0;
	d[0] = ((h[0] + 2.0 * d0) * h[1] * delta[0] + h[0] * h[0] * delta[1]) / d0;

	for (std::size_t i = 1; i + 1 < n; ++i) {
		a[i] = h[i];
		b[i] = 2.0 * (h[i - 1] + h[i]);
		c[i] = h[i - 1];
		d[i] = 3.0 * (h[i] * delta[i - 1] + h[i - 1] * delta[i]);
	}

	const double dn = h[n - 3] + h[n - 2];
	a[n - 1] = dn;
	b[n - 1] = h[n - 3];
	d[n - 1] = (h[n - 2] * h[n - 2] * delta[n - 3] + (2.0 * dn + h[n - 2]) * h[n - 3] * delta[n - 2]) / dn;

	// Thomas algorithm
	for (std::size_t i = 1; i < n; ++i) {
		const double w = a[i] / b[i - 1];
		b[i] -= w * c[i - 1];
		d[i] -= w * d[i - 1];
	}
	slopes_[n - 1] = d[n - 1] / b[n - 1];
	for (std::size_t i = n - 1; i-- > 0;) {
		slopes_[i] = (d[i] - c[i] * slopes_[i + 1]) / b[i];
	}
}

std::size_t CubicSpline::segmentFor(double x) const {
	if (!(x >= x_.front() && x <= x_.back())) {
		throw core::InterpolationRangeError("Spline query " + std::to_string(x) + " outside [" +
		                                    std::to_string(x_.front()) + ", " + std::to_string(x_.back()) + "].");
	}
	const auto it = std::upper_bound(x_.begin(), x_.end(), x);
	const auto index = static_cast<std::size_t>(it - x_.begin());
	// index >= 1 because x >= x_.front(); clamp the right end onto the last segment
	return std::min(index, x_.size() - 1) - 1;
}

double CubicSpline::operator()(double x) const {
	if (x_.size() == 1) {
		segmentFor(x);
		return y_.front();
	}
	const std::size_t i = segmentFor(x);
	if (x == x_[i]) {
		return y_[i];
	}
	if (x == x_[i + 1]) {
		return y_[i + 1];
	}
	const double h = x_[i + 1] - x_[i];
	const double delta = (y_[i + 1] - y_[i]) / h;
	const double t = x - x_[i];
	const double c2 = (3.0 * delta - 2.0 * slopes_[i] - slopes_[i + 1]) / h;
	const double c3 = (slopes_[i] + slopes_[i + 1] - 2.0 * delta) / (h * h);
	return y_[i] + t * (slopes_[i] + t * (c2 + t * c3));
}

double CubicSpline::derivative(double x) const {
	if (x_.size() == 1) {
		segmentFor(x);
		return 0.0;
	}
	const std::size_t i = segmentFor(x);
	const double h = x_[i + 1] - x_[i];
	const double delta = (y_[i + 1] - y_[i]) / h;
	const double t = x - x_[i];
	const double c2 = (3.0 * delta - 2.0 * slopes_[i] - slopes_[i + 1]) / h;
	const double c3 = (slopes_[i] + slopes_[i + 1] - 2.0 * delta) / (h * h);
	return slopes_[i] + t * (2.0 * c2 + 3.0 * t * c3);
}

std::vector<double> CubicSpline::evaluate(const std::vector<double> &x) const {
	std::vector<double> values;
	values.reserve(x.size());
	for (double xi : x) {
		values.push_back((*this)(xi));
	}
	return values;
}

} // namespace tidecheck::align
