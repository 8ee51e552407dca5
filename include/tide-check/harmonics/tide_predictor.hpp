#pragma once

#include "tide-check/core/time_grid.hpp"
#include "tide-check/core/time_series.hpp"
#include "tide-check/harmonics/harmonic_model.hpp"

#include <vector>

namespace tidecheck::harmonics {

/**
 * @class TidePredictor
 * @brief Evaluates a HarmonicModel on arbitrary instants.
 *
 * height(t) = mean + sum_i amplitude_i * cos(speed_i * t - phase_i), with t in hours
 * since the model epoch. Instants outside the fitting window are extrapolated.
 */
class TidePredictor final {
public:
	using TimePoint = core::TimeSeries::TimePoint;

	static double predictAt(const HarmonicModel &model, const TimePoint &tp);

	/**
	 * @brief Predicts the model at every timestamp.
	 * @throws std::invalid_argument If the timestamps are not strictly increasing.
	 */
	static core::TimeSeries predict(const HarmonicModel &model, std::vector<TimePoint> timestamps);

	/**
	 * @brief Dense prediction over TimeGrid::regular(start, end, step).
	 */
	static core::TimeSeries predictRange(const HarmonicModel &model, const TimePoint &start, const TimePoint &end,
	                                     core::TimeGrid::Step step);
};

} // namespace tidecheck::harmonics
