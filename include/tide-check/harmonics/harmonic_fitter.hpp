#pragma once

#include "tide-check/core/time_series.hpp"
#include "tide-check/harmonics/constituent_catalogue.hpp"
#include "tide-check/harmonics/harmonic_model.hpp"

#include <chrono>
#include <vector>

namespace tidecheck::harmonics {

class HarmonicFitterBuilder; // Forward declaration

/**
 * @class HarmonicFitter
 * @brief Fits a fixed catalogue of tidal constituents to an observed water-level series.
 *
 * For every constituent with speed w the design matrix gets the columns
 * cos(w t) and sin(w t), t being hours since the epoch, next to a column of ones
 * for the mean level. The linear least-squares problem is solved with a
 * column-pivoting Householder QR. Missing heights are dropped before fitting.
 *
 * The fitter holds configuration only; every call to fit() returns a new model.
 */
class HarmonicFitter {
public:
	friend class HarmonicFitterBuilder;
	using TimePoint = core::TimeSeries::TimePoint;

	/**
	 * @brief Fits the catalogue to @p series.
	 * @throws core::EmptySeriesError If the series has no samples.
	 * @throws core::InsufficientDataError If there are fewer finite samples than unknowns,
	 *         the samples span too short a time, or the design matrix is rank deficient.
	 */
	HarmonicModel fit(const core::TimeSeries &series) const;

	/// Number of unknowns solved for: two per constituent plus the mean level.
	std::size_t unknowns() const {
		return 2 * catalogue_.size() + 1;
	}

	/**
	 * @brief Shortest span in hours that the fitter accepts.
	 *
	 * This is one period of the slowest constituent, raised to the Rayleigh
	 * span (factor * 360 / smallest speed separation) when a Rayleigh factor is set.
	 */
	double minimumSpanHours() const;

	const ConstituentCatalogue &catalogue() const {
		return catalogue_;
	}

	TimePoint epoch() const {
		return epoch_;
	}

	bool subtractsMeanSeaLevel() const {
		return subtract_msl_;
	}

	/// Centered running mean of @p values over @p window, evaluated at each timestamp.
	static std::vector<double> runningMean(const std::vector<TimePoint> &timestamps, const std::vector<double> &values,
	                                       std::chrono::minutes window);

private:
	HarmonicFitter(ConstituentCatalogue catalogue, TimePoint epoch, bool subtract_msl, std::chrono::minutes msl_window,
	               double rayleigh_factor);

	ConstituentCatalogue catalogue_;
	TimePoint epoch_;
	bool subtract_msl_;
	std::chrono::minutes msl_window_;
	double rayleigh_factor_;
};

/**
 * @class HarmonicFitterBuilder
 * @brief A builder for fluently configuring and creating HarmonicFitter instances.
 */
class HarmonicFitterBuilder {
public:
	using TimePoint = HarmonicFitter::TimePoint;

	/**
	 * @brief Sets the constituent catalogue used as design frequencies.
	 */
	HarmonicFitterBuilder &withCatalogue(ConstituentCatalogue catalogue);

	/**
	 * @brief Sets the reference instant for t = 0 (default: 1970-01-01T00:00Z).
	 */
	HarmonicFitterBuilder &withEpoch(TimePoint epoch);

	/**
	 * @brief Subtracts a running mean sea level from the observations before fitting.
	 */
	HarmonicFitterBuilder &withMeanSeaLevelSubtraction(bool enabled);

	/**
	 * @brief Window of the running mean used by mean-sea-level subtraction.
	 */
	HarmonicFitterBuilder &withMeanSeaLevelWindow(std::chrono::minutes window);

	/**
	 * @brief Requests 18.6-year nodal modulation. Only `false` is supported.
	 */
	HarmonicFitterBuilder &withNodalCorrection(bool enabled);

	/**
	 * @brief Requires the span to resolve every pair of constituents (0 disables the check).
	 */
	HarmonicFitterBuilder &withRayleighFactor(double factor);

	/**
	 * @brief Creates the configured fitter.
	 * @throws std::invalid_argument If the configuration is invalid.
	 */
	HarmonicFitter build() const;

private:
	ConstituentCatalogue catalogue_ = ConstituentCatalogue::standard();
	TimePoint epoch_{};
	bool subtract_msl_ = false;
	std::chrono::minutes msl_window_{24 * 60 + 50};
	bool nodal_ = false;
	double rayleigh_factor_ = 0.0;
};

} // namespace tidecheck::harmonics
