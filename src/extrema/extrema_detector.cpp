#include "tide-check/extrema/extrema_detector.hpp"
#include "tide-check/utils/logging.hpp"

#include <stdexcept>

namespace tidecheck::extrema {

const char *toTag(ExtremaKind kind) {
	return kind == ExtremaKind::High ? "h" : "l";
}

std::vector<ExtremaEvent> ExtremaSet::highs() const {
	std::vector<ExtremaEvent> result;
	for (const auto &event : events_) {
		if (event.kind == ExtremaKind::High) {
			result.push_back(event);
		}
	}
	return result;
}

std::vector<ExtremaEvent> ExtremaSet::lows() const {
	std::vector<ExtremaEvent> result;
	for (const auto &event : events_) {
		if (event.kind == ExtremaKind::Low) {
			result.push_back(event);
		}
	}
	return result;
}

core::TimeSeries ExtremaSet::toSeries() const {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	std::vector<double> heights;
	core::TimeSeries::Attributes attrs;
	timestamps.reserve(events_.size());
	heights.reserve(events_.size());
	attrs.tags.reserve(events_.size());
	for (const auto &event : events_) {
		timestamps.push_back(event.timestamp);
		heights.push_back(event.height);
		attrs.tags.emplace_back(toTag(event.kind));
	}
	return core::TimeSeries(std::move(timestamps), std::move(heights), unit_, std::move(attrs));
}

ExtremaDetector::ExtremaDetector(std::chrono::system_clock::duration min_separation)
    : min_separation_(min_separation) {
}

ExtremaDetector::Builder &ExtremaDetector::Builder::withMinimumSeparation(std::chrono::system_clock::duration separation) {
	min_separation_ = separation;
	return *this;
}

ExtremaDetector ExtremaDetector::Builder::build() const {
	if (min_separation_ < std::chrono::system_clock::duration::zero()) {
		throw std::invalid_argument("Minimum extrema separation must not be negative.");
	}
	return ExtremaDetector(min_separation_);
}

ExtremaDetector::Builder ExtremaDetector::builder() {
	return Builder();
}

ExtremaSet ExtremaDetector::detect(const core::TimeSeries &series) const {
	const auto &heights = series.getValues();
	const auto &timestamps = series.getTimestamps();
	const std::size_t n = heights.size();
	if (series.hasMissingValues()) {
		throw std::invalid_argument("Extrema detection requires a series without missing heights.");
	}
	if (n < 3) {
		return ExtremaSet({}, series.unit());
	}
	if (!series.inferFrequency()) {
		TIDECHECK_DEBUG("Extrema detection on an irregularly spaced series of {} samples.", n);
	}

	std::vector<ExtremaEvent> candidates;
	std::size_t i = 1;
	while (i + 1 < n) {
		// Flat run [i, j] of equal heights; reported at its first sample.
		std::size_t j = i;
		while (j + 1 < n && heights[j + 1] == heights[i]) {
			++j;
		}
		if (j + 1 >= n) {
			break; // run touches the last sample
		}
		const double left = heights[i - 1];
		const double right = heights[j + 1];
		const double value = heights[i];
		if (left != value) {
			if (left < value && right < value) {
				candidates.push_back(ExtremaEvent{timestamps[i], value, ExtremaKind::High});
			} else if (left > value && right > value) {
				candidates.push_back(ExtremaEvent{timestamps[i], value, ExtremaKind::Low});
			}
		}
		i = j + 1;
	}

	auto events = collapseRuns(candidates);
	if (min_separation_ > std::chrono::system_clock::duration::zero()) {
		events = dropCloseEvents(std::move(events));
	}

	TIDECHECK_DEBUG("Detected {} extrema ({} candidates) over {} samples.", events.size(), candidates.size(), n);
	return ExtremaSet(std::move(events), series.unit());
}

std::vector<ExtremaEvent> ExtremaDetector::collapseRuns(const std::vector<ExtremaEvent> &candidates) {
	std::vector<ExtremaEvent> events;
	events.reserve(candidates.size());
	for (const auto &candidate : candidates) {
		if (events.empty() || events.back().kind != candidate.kind) {
			events.push_back(candidate);
			continue;
		}
		auto &current = events.back();
		const bool more_extreme = candidate.kind == ExtremaKind::High ? candidate.height > current.height
		                                                              : candidate.height < current.height;
		if (more_extreme) {
			current = candidate;
		}
	}
	return events;
}

std::vector<ExtremaEvent> ExtremaDetector::dropCloseEvents(std::vector<ExtremaEvent> events) const {
	std::size_t dropped = 0;
	std::size_t k = 0;
	while (k + 1 < events.size()) {
		if (events[k + 1].timestamp - events[k].timestamp < min_separation_) {
			// Removing an adjacent high/low pair keeps the remaining kinds alternating.
			events.erase(events.begin() + static_cast<std::ptrdiff_t>(k),
			             events.begin() + static_cast<std::ptrdiff_t>(k + 2));
			dropped += 2;
			if (k > 0) {
				--k;
			}
			continue;
		}
		++k;
	}
	if (dropped > 0) {
		TIDECHECK_DEBUG("Dropped {} extrema closer than the minimum separation.", dropped);
	}
	return events;
}

} // namespace tidecheck::extrema
