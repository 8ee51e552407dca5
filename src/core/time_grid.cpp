#include "tide-check/core/time_grid.hpp"
#include "tide-check/utils/logging.hpp"

#include <stdexcept>

namespace tidecheck::core {

std::vector<TimeGrid::TimePoint> TimeGrid::regular(const TimePoint &start, const TimePoint &end, Step step) {
	if (step <= Step::zero()) {
		throw std::invalid_argument("Time grid step must be positive.");
	}
	if (end < start) {
		throw std::invalid_argument("Time grid end must not precede start.");
	}

	const auto count = static_cast<std::size_t>((end - start) / step) + 1;
	std::vector<TimePoint> grid;
	grid.reserve(count);
	for (std::size_t k = 0; k < count; ++k) {
		grid.push_back(start + step * static_cast<long long>(k));
	}
	return grid;
}

std::vector<TimeGrid::TimePoint> TimeGrid::minutes(const TimePoint &start, const TimePoint &end) {
	return regular(start, end, std::chrono::minutes(1));
}

std::vector<TimeGrid::TimePoint> TimeGrid::hours(const TimePoint &start, const TimePoint &end) {
	return regular(start, end, std::chrono::hours(1));
}

TimeGrid::TimePoint TimeGrid::ceilToHour(const TimePoint &tp) {
	return TimePoint{} + std::chrono::ceil<std::chrono::hours>(tp.time_since_epoch());
}

TimeSeries TimeGrid::resampleHourly(const TimeSeries &series) {
	TimeSeries::Attributes attrs;
	attrs.metadata = series.metadata();
	attrs.timezone = series.timezone();
	if (series.isEmpty()) {
		return TimeSeries({}, {}, series.unit(), std::move(attrs));
	}

	const auto first_hour = ceilToHour(series.front());
	if (first_hour > series.back()) {
		return TimeSeries({}, {}, series.unit(), std::move(attrs));
	}

	auto grid = hours(first_hour, series.back());
	std::vector<double> values;
	values.reserve(grid.size());
	std::size_t matched = 0;
	for (const auto &hour : grid) {
		const auto index = series.indexOf(hour);
		if (index) {
			values.push_back(series.getValues()[*index]);
			++matched;
		} else {
			values.push_back(missingValue());
		}
	}
	TIDECHECK_DEBUG("Hourly resampling kept {} of {} grid hours.", matched, grid.size());
	return TimeSeries(std::move(grid), std::move(values), series.unit(), std::move(attrs));
}

} // namespace tidecheck::core
