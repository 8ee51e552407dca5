#include "tide-check/align/series_aligner.hpp"
#include "tide-check/align/cubic_spline.hpp"
#include "tide-check/core/calendar.hpp"
#include "tide-check/core/errors.hpp"
#include "tide-check/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tidecheck::align {

namespace {

using TimePoint = core::TimeSeries::TimePoint;

double hoursBetween(const TimePoint &from, const TimePoint &to) {
	const std::chrono::duration<double, std::ratio<3600>> elapsed = to - from;
	return elapsed.count();
}

void requireSameUnit(const core::TimeSeries &lhs, const core::TimeSeries &rhs) {
	if (lhs.unit() != rhs.unit()) {
		throw core::InconsistentUnitsError(std::string("Cannot align a series in ") + core::toString(lhs.unit()) +
		                                   " with a reference in " + core::toString(rhs.unit()) + ".");
	}
}

std::chrono::system_clock::duration absoluteDifference(const TimePoint &a, const TimePoint &b) {
	return a > b ? a - b : b - a;
}

} // namespace

SeriesAligner::SeriesAligner(std::optional<std::chrono::system_clock::duration> max_distance)
    : max_distance_(max_distance) {
}

SeriesAligner::Builder &SeriesAligner::Builder::withMaxDistance(std::chrono::system_clock::duration distance) {
	max_distance_ = distance;
	return *this;
}

SeriesAligner SeriesAligner::Builder::build() const {
	if (max_distance_ && *max_distance_ < std::chrono::system_clock::duration::zero()) {
		throw std::invalid_argument("Maximum match distance must not be negative.");
	}
	return SeriesAligner(max_distance_);
}

SeriesAligner::Builder SeriesAligner::builder() {
	return Builder();
}

core::TimeSeries SeriesAligner::interpolate(const core::TimeSeries &target, const core::TimeSeries &reference) const {
	if (reference.isEmpty()) {
		throw core::EmptySeriesError("Cannot interpolate onto an empty reference series.");
	}
	requireSameUnit(target, reference);
	if (reference.hasMissingValues()) {
		throw std::invalid_argument("Interpolation reference must not contain missing heights.");
	}

	const auto &target_times = target.getTimestamps();
	if (!target.isEmpty() && (target.front() < reference.front() || target.back() > reference.back())) {
		throw core::InterpolationRangeError("Target span " + core::formatUtc(target.front()) + " to " +
		                                    core::formatUtc(target.back()) + " exceeds the reference span " +
		                                    core::formatUtc(reference.front()) + " to " +
		                                    core::formatUtc(reference.back()) + ".");
	}

	const auto origin = reference.front();
	std::vector<double> knots;
	knots.reserve(reference.size());
	for (const auto &tp : reference.getTimestamps()) {
		knots.push_back(hoursBetween(origin, tp));
	}
	const CubicSpline spline(std::move(knots), reference.getValues());

	std::vector<double> values;
	values.reserve(target_times.size());
	for (const auto &tp : target_times) {
		values.push_back(spline(hoursBetween(origin, tp)));
	}

	TIDECHECK_DEBUG("Interpolated {} timestamps from a {} point reference.", values.size(), reference.size());
	return target.withValues(std::move(values));
}

std::vector<MatchedPair> SeriesAligner::nearestMatch(const core::TimeSeries &observations,
                                                     const core::TimeSeries &reference) const {
	if (reference.isEmpty()) {
		throw core::EmptySeriesError("Cannot match observations against an empty reference series.");
	}
	requireSameUnit(observations, reference);

	const auto &ref_times = reference.getTimestamps();
	const auto &ref_values = reference.getValues();
	const auto &obs_times = observations.getTimestamps();
	const auto &obs_values = observations.getValues();

	std::vector<MatchedPair> matches;
	matches.reserve(observations.size());
	std::size_t dropped = 0;
	for (std::size_t i = 0; i < observations.size(); ++i) {
		const auto &tp = obs_times[i];
		const auto it = std::lower_bound(ref_times.begin(), ref_times.end(), tp);
		auto best = static_cast<std::size_t>(it - ref_times.begin());
		if (best == ref_times.size()) {
			best = ref_times.size() - 1;
		} else if (best > 0 && absoluteDifference(tp, ref_times[best - 1]) <= absoluteDifference(tp, ref_times[best])) {
			// ties resolve to the earlier reference event
			best = best - 1;
		}

		const auto distance = absoluteDifference(tp, ref_times[best]);
		if (max_distance_ && distance > *max_distance_) {
			++dropped;
			continue;
		}

		MatchedPair pair;
		pair.observation_time = tp;
		pair.observed = obs_values[i];
		pair.reference_time = ref_times[best];
		pair.reference = ref_values[best];
		pair.offset = tp - ref_times[best];
		pair.observation_tag = observations.tag(i);
		pair.reference_tag = reference.tag(best);
		matches.push_back(std::move(pair));
	}

	if (dropped > 0) {
		TIDECHECK_DEBUG("Nearest match dropped {} of {} observations beyond the maximum distance.", dropped,
		                observations.size());
	}
	return matches;
}

core::TimeSeries SeriesAligner::toPredictedSeries(const std::vector<MatchedPair> &matches, core::HeightUnit unit) {
	std::vector<TimePoint> timestamps;
	std::vector<double> heights;
	core::TimeSeries::Attributes attrs;
	timestamps.reserve(matches.size());
	heights.reserve(matches.size());
	attrs.tags.reserve(matches.size());
	for (const auto &pair : matches) {
		timestamps.push_back(pair.observation_time);
		heights.push_back(pair.reference);
		attrs.tags.push_back(pair.reference_tag);
	}
	bool tagged = std::any_of(attrs.tags.begin(), attrs.tags.end(), [](const std::string &t) { return !t.empty(); });
	if (!tagged) {
		attrs.tags.clear();
	}
	return core::TimeSeries(std::move(timestamps), std::move(heights), unit, std::move(attrs));
}

} // namespace tidecheck::align
