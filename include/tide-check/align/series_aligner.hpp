#pragma once

#include "tide-check/core/time_series.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tidecheck::align {

/**
 * @struct MatchedPair
 * @brief One observation and the reference event nearest to it in time.
 */
struct MatchedPair {
	core::TimeSeries::TimePoint observation_time{};
	double observed = 0.0;
	core::TimeSeries::TimePoint reference_time{};
	double reference = 0.0;
	/// observation_time - reference_time
	std::chrono::system_clock::duration offset{0};
	std::string observation_tag;
	std::string reference_tag;
};

/**
 * @class SeriesAligner
 * @brief Maps one irregularly timed series onto the timestamps of another.
 *
 * Two modes are offered. interpolate() evaluates a not-a-knot cubic spline through
 * a dense reference (the prediction grid) at the target's own timestamps.
 * nearestMatch() pairs each observation with the reference event closest in time,
 * ties going to the earlier event, optionally within a maximum distance.
 */
class SeriesAligner {
public:
	class Builder {
	public:
		/// Observations with no reference event within @p distance are dropped (default: no cutoff).
		Builder &withMaxDistance(std::chrono::system_clock::duration distance);
		SeriesAligner build() const;

	private:
		std::optional<std::chrono::system_clock::duration> max_distance_;
	};

	static Builder builder();

	/**
	 * @brief Spline values of @p reference at every timestamp of @p target.
	 *
	 * Only the target timestamps are used. The result carries the target's tags.
	 * @throws core::EmptySeriesError If the reference is empty.
	 * @throws core::InconsistentUnitsError If the two series use different units.
	 * @throws core::InterpolationRangeError If a target timestamp lies outside the reference span.
	 * @throws std::invalid_argument If the reference contains missing heights.
	 */
	core::TimeSeries interpolate(const core::TimeSeries &target, const core::TimeSeries &reference) const;

	/**
	 * @brief Pairs each observation with its nearest reference event.
	 * @throws core::EmptySeriesError If the reference is empty.
	 * @throws core::InconsistentUnitsError If the two series use different units.
	 */
	std::vector<MatchedPair> nearestMatch(const core::TimeSeries &observations, const core::TimeSeries &reference) const;

	/**
	 * @brief Matched reference heights stamped with the observation times, ready for a residual join.
	 */
	static core::TimeSeries toPredictedSeries(const std::vector<MatchedPair> &matches, core::HeightUnit unit);

	const std::optional<std::chrono::system_clock::duration> &maxDistance() const {
		return max_distance_;
	}

private:
	explicit SeriesAligner(std::optional<std::chrono::system_clock::duration> max_distance);

	std::optional<std::chrono::system_clock::duration> max_distance_;
};

} // namespace tidecheck::align
