#include "tide-check/harmonics/harmonic_fitter.hpp"
#include "tide-check/core/calendar.hpp"
#include "tide-check/core/errors.hpp"
#include "tide-check/utils/logging.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tidecheck::harmonics {

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
// Pivots below this fraction of the largest one count as rank loss.
constexpr double kRankThreshold = 1e-10;

double wrapDegrees(double degrees) {
	const double wrapped = std::fmod(degrees, 360.0);
	return wrapped < 0.0 ? wrapped + 360.0 : wrapped;
}

double hoursBetween(const HarmonicFitter::TimePoint &from, const HarmonicFitter::TimePoint &to) {
	const std::chrono::duration<double, std::ratio<3600>> elapsed = to - from;
	return elapsed.count();
}

} // namespace

// --- Fitter Implementation ---

HarmonicFitter::HarmonicFitter(ConstituentCatalogue catalogue, TimePoint epoch, bool subtract_msl,
                               std::chrono::minutes msl_window, double rayleigh_factor)
    : catalogue_(std::move(catalogue)), epoch_(epoch), subtract_msl_(subtract_msl), msl_window_(msl_window),
      rayleigh_factor_(rayleigh_factor) {
}

double HarmonicFitter::minimumSpanHours() const {
	double span = 360.0 / catalogue_.slowestSpeed();
	if (rayleigh_factor_ > 0.0 && catalogue_.size() > 1) {
		span = std::max(span, rayleigh_factor_ * 360.0 / catalogue_.minimumSeparation());
	}
	return span;
}

std::vector<double> HarmonicFitter::runningMean(const std::vector<TimePoint> &timestamps,
                                                const std::vector<double> &values, std::chrono::minutes window) {
	if (timestamps.size() != values.size()) {
		throw std::invalid_argument("Timestamps and values must have the same size.");
	}
	const auto half = std::chrono::duration_cast<std::chrono::system_clock::duration>(window) / 2;
	std::vector<double> means(values.size(), 0.0);

	std::size_t lo = 0;
	std::size_t hi = 0;
	double sum = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		while (hi < values.size() && timestamps[hi] - timestamps[i] <= half) {
			sum += values[hi];
			++hi;
		}
		while (timestamps[i] - timestamps[lo] > half) {
			sum -= values[lo];
			++lo;
		}
		means[i] = sum / static_cast<double>(hi - lo);
	}
	return means;
}

HarmonicModel HarmonicFitter::fit(const core::TimeSeries &series) const {
	if (series.isEmpty()) {
		throw core::EmptySeriesError("Cannot fit harmonic constituents to an empty series.");
	}

	const auto clean = series.sanitized(core::TimeSeries::MissingValuePolicy::Drop);
	const std::size_t n = clean.size();
	const std::size_t k = catalogue_.size();
	const std::size_t cols = unknowns();
	if (n < cols) {
		throw core::InsufficientDataError("Harmonic fit needs at least " + std::to_string(cols) +
		                                  " observations for " + std::to_string(k) + " constituents, got " +
		                                  std::to_string(n) + ".");
	}

	const auto &timestamps = clean.getTimestamps();
	const double span_hours = hoursBetween(timestamps.front(), timestamps.back());
	const double min_span = minimumSpanHours();
	if (span_hours < min_span) {
		throw core::InsufficientDataError("Observations span " + std::to_string(span_hours) +
		                                  " h but the catalogue needs at least " + std::to_string(min_span) +
		                                  " h.");
	}

	std::vector<double> heights = clean.getValues();
	if (subtract_msl_) {
		const auto msl = runningMean(timestamps, heights, msl_window_);
		for (std::size_t i = 0; i < n; ++i) {
			heights[i] -= msl[i];
		}
		TIDECHECK_DEBUG("Subtracted running mean sea level over a {} minute window.", msl_window_.count());
	}

	Eigen::MatrixXd design(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(cols));
	Eigen::VectorXd observed(static_cast<Eigen::Index>(n));
	for (std::size_t row = 0; row < n; ++row) {
		const auto r = static_cast<Eigen::Index>(row);
		const double t = hoursBetween(epoch_, timestamps[row]);
		design(r, 0) = 1.0;
		for (std::size_t c = 0; c < k; ++c) {
			const double arg = catalogue_.at(c).speed_deg_per_hour * kDegToRad * t;
			design(r, static_cast<Eigen::Index>(2 * c + 1)) = std::cos(arg);
			design(r, static_cast<Eigen::Index>(2 * c + 2)) = std::sin(arg);
		}
		observed[r] = heights[row];
	}

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr = design.colPivHouseholderQr();
	qr.setThreshold(kRankThreshold);
	if (qr.rank() < static_cast<Eigen::Index>(cols)) {
		throw core::InsufficientDataError("Harmonic design matrix is rank deficient (rank " +
		                                  std::to_string(qr.rank()) + " of " + std::to_string(cols) +
		                                  "); the observations cannot separate the catalogue constituents.");
	}
	const Eigen::VectorXd coefficients = qr.solve(observed);
	const Eigen::VectorXd residuals = observed - design * coefficients;
	const double rms = std::sqrt(residuals.squaredNorm() / static_cast<double>(n));

	std::vector<ConstituentFit> fits;
	fits.reserve(k);
	for (std::size_t c = 0; c < k; ++c) {
		const double a = coefficients[static_cast<Eigen::Index>(2 * c + 1)];
		const double b = coefficients[static_cast<Eigen::Index>(2 * c + 2)];
		ConstituentFit fit;
		fit.name = catalogue_.at(c).name;
		fit.speed_deg_per_hour = catalogue_.at(c).speed_deg_per_hour;
		fit.amplitude = std::hypot(a, b);
		fit.phase_deg = wrapDegrees(std::atan2(b, a) / kDegToRad);
		fits.push_back(std::move(fit));
	}

	TIDECHECK_INFO("Harmonic fit: {} constituents over {} observations ({} to {}), mean level {:.4f} {}, rms {:.4f}.",
	               k, n, core::formatUtc(timestamps.front()), core::formatUtc(timestamps.back()), coefficients[0],
	               core::toString(series.unit()), rms);

	return HarmonicModel(coefficients[0], std::move(fits), HarmonicModel::FitWindow{timestamps.front(), timestamps.back()},
	                     epoch_, series.unit(), n, rms);
}

// --- Builder Implementation ---

HarmonicFitterBuilder &HarmonicFitterBuilder::withCatalogue(ConstituentCatalogue catalogue) {
	catalogue_ = std::move(catalogue);
	return *this;
}

HarmonicFitterBuilder &HarmonicFitterBuilder::withEpoch(TimePoint epoch) {
	epoch_ = epoch;
	return *this;
}

HarmonicFitterBuilder &HarmonicFitterBuilder::withMeanSeaLevelSubtraction(bool enabled) {
	subtract_msl_ = enabled;
	return *this;
}

HarmonicFitterBuilder &HarmonicFitterBuilder::withMeanSeaLevelWindow(std::chrono::minutes window) {
	msl_window_ = window;
	return *this;
}

HarmonicFitterBuilder &HarmonicFitterBuilder::withNodalCorrection(bool enabled) {
	nodal_ = enabled;
	return *this;
}

HarmonicFitterBuilder &HarmonicFitterBuilder::withRayleighFactor(double factor) {
	rayleigh_factor_ = factor;
	return *this;
}

HarmonicFitter HarmonicFitterBuilder::build() const {
	if (nodal_) {
		throw std::invalid_argument("Nodal amplitude/phase modulation is not supported; leave it disabled.");
	}
	if (msl_window_ <= std::chrono::minutes::zero()) {
		throw std::invalid_argument("Mean sea level window must be positive.");
	}
	if (!std::isfinite(rayleigh_factor_) || rayleigh_factor_ < 0.0) {
		throw std::invalid_argument("Rayleigh factor must be non-negative.");
	}
	TIDECHECK_DEBUG("Building harmonic fitter with {} constituents, msl subtraction = {}, rayleigh = {}.",
	                catalogue_.size(), subtract_msl_, rayleigh_factor_);
	return HarmonicFitter(catalogue_, epoch_, subtract_msl_, msl_window_, rayleigh_factor_);
}

} // namespace tidecheck::harmonics
