#pragma once

#include "tide-check/core/time_series.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tidecheck::harmonics {

/**
 * @struct ConstituentFit
 * @brief Fitted amplitude and phase of one constituent.
 *
 * The constituent contributes amplitude * cos(speed * t - phase) to the tide,
 * with t in hours since the model epoch. Phase is in degrees, in [0, 360).
 */
struct ConstituentFit {
	std::string name;
	double speed_deg_per_hour = 0.0;
	double amplitude = 0.0;
	double phase_deg = 0.0;
};

/**
 * @class HarmonicModel
 * @brief Immutable result of a harmonic fit: mean level plus fitted constituents.
 */
class HarmonicModel {
public:
	using TimePoint = core::TimeSeries::TimePoint;

	struct FitWindow {
		TimePoint start{};
		TimePoint end{};
	};

	HarmonicModel(double mean_level, std::vector<ConstituentFit> constituents, FitWindow window, TimePoint epoch,
	              core::HeightUnit unit, std::size_t observations, double residual_rms)
	    : mean_level_(mean_level), constituents_(std::move(constituents)), window_(window), epoch_(epoch),
	      unit_(unit), observations_(observations), residual_rms_(residual_rms) {
	}

	double meanLevel() const {
		return mean_level_;
	}

	const std::vector<ConstituentFit> &constituents() const {
		return constituents_;
	}

	/// Fit for the named constituent, if the model carries it.
	std::optional<ConstituentFit> constituent(const std::string &name) const {
		for (const auto &fit : constituents_) {
			if (fit.name == name) {
				return fit;
			}
		}
		return std::nullopt;
	}

	const FitWindow &fitWindow() const {
		return window_;
	}

	/// Reference instant for t = 0 in the harmonic arguments.
	TimePoint epoch() const {
		return epoch_;
	}

	core::HeightUnit unit() const {
		return unit_;
	}

	/// Number of finite observations the fit used.
	std::size_t observations() const {
		return observations_;
	}

	/// Root mean square of observed minus fitted heights over the fitting window.
	double residualRms() const {
		return residual_rms_;
	}

	bool covers(const TimePoint &tp) const {
		return window_.start <= tp && tp <= window_.end;
	}

	/// Hours between the model epoch and @p tp.
	double hoursSinceEpoch(const TimePoint &tp) const {
		const std::chrono::duration<double, std::ratio<3600>> elapsed = tp - epoch_;
		return elapsed.count();
	}

private:
	double mean_level_;
	std::vector<ConstituentFit> constituents_;
	FitWindow window_;
	TimePoint epoch_;
	core::HeightUnit unit_;
	std::size_t observations_;
	double residual_rms_;
};

} // namespace tidecheck::harmonics
