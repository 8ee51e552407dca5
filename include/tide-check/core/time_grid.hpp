#pragma once

#include "tide-check/core/time_series.hpp"

#include <chrono>
#include <vector>

namespace tidecheck::core {

/**
 * @class TimeGrid
 * @brief Builds regular time sequences used for dense prediction and hourly resampling.
 */
class TimeGrid final {
public:
	using TimePoint = TimeSeries::TimePoint;
	using Step = std::chrono::system_clock::duration;

	/**
	 * @brief Every instant start + k*step that does not pass @p end.
	 *
	 * @p end is part of the grid when it falls exactly on a step boundary.
	 * @throws std::invalid_argument If step is not positive or end precedes start.
	 */
	static std::vector<TimePoint> regular(const TimePoint &start, const TimePoint &end, Step step);

	/// One-minute grid between start and end, inclusive.
	static std::vector<TimePoint> minutes(const TimePoint &start, const TimePoint &end);

	/// One-hour grid between start and end, inclusive.
	static std::vector<TimePoint> hours(const TimePoint &start, const TimePoint &end);

	/// First whole UTC hour at or after @p tp.
	static TimePoint ceilToHour(const TimePoint &tp);

	/**
	 * @brief Left-joins a whole-hour grid onto @p series.
	 *
	 * The grid runs from the first whole hour at or after the first sample to the
	 * last sample. Hours without a sample at exactly that instant are missing.
	 * Unit, time zone and metadata are carried over; tags are dropped.
	 */
	static TimeSeries resampleHourly(const TimeSeries &series);
};

} // namespace tidecheck::core
