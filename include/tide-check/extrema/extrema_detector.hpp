#pragma once

#include "tide-check/core/time_series.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace tidecheck::extrema {

enum class ExtremaKind {
	High,
	Low
};

/// "h" for High, "l" for Low, the markers used by published high/low tables.
const char *toTag(ExtremaKind kind);

struct ExtremaEvent {
	core::TimeSeries::TimePoint timestamp{};
	double height = 0.0;
	ExtremaKind kind = ExtremaKind::High;
};

/**
 * @class ExtremaSet
 * @brief Ordered high/low events detected on one predicted series.
 */
class ExtremaSet {
public:
	ExtremaSet() = default;
	ExtremaSet(std::vector<ExtremaEvent> events, core::HeightUnit unit) : events_(std::move(events)), unit_(unit) {
	}

	const std::vector<ExtremaEvent> &events() const {
		return events_;
	}

	std::size_t size() const {
		return events_.size();
	}

	bool empty() const {
		return events_.empty();
	}

	core::HeightUnit unit() const {
		return unit_;
	}

	std::vector<ExtremaEvent> highs() const;
	std::vector<ExtremaEvent> lows() const;

	/// Event times and heights as a series tagged "h"/"l".
	core::TimeSeries toSeries() const;

private:
	std::vector<ExtremaEvent> events_;
	core::HeightUnit unit_ = core::HeightUnit::Meters;
};

/**
 * @class ExtremaDetector
 * @brief Reports local maxima (high tide) and minima (low tide) of a dense predicted series.
 *
 * A run of equal heights (often a single sample) is a high when the samples on
 * either side of it are both lower; a flat top is reported once, at its first
 * sample, and a shoulder is not reported. Lows mirror this. The first and last samples are never reported. Runs of same-kind
 * detections are collapsed to their most extreme member, so kinds alternate.
 */
class ExtremaDetector {
public:
	class Builder {
	public:
		/// Drops adjacent high/low pairs closer together than @p separation (default: off).
		Builder &withMinimumSeparation(std::chrono::system_clock::duration separation);
		ExtremaDetector build() const;

	private:
		std::chrono::system_clock::duration min_separation_{0};
	};

	static Builder builder();

	/**
	 * @brief Detects alternating high/low events.
	 * @throws std::invalid_argument If the series contains missing heights.
	 */
	ExtremaSet detect(const core::TimeSeries &series) const;

	std::chrono::system_clock::duration minimumSeparation() const {
		return min_separation_;
	}

private:
	explicit ExtremaDetector(std::chrono::system_clock::duration min_separation);

	static std::vector<ExtremaEvent> collapseRuns(const std::vector<ExtremaEvent> &candidates);
	std::vector<ExtremaEvent> dropCloseEvents(std::vector<ExtremaEvent> events) const;

	std::chrono::system_clock::duration min_separation_;
};

} // namespace tidecheck::extrema
