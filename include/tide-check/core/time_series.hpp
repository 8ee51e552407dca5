#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tidecheck::core {

/// Linear unit shared by every height in one series.
enum class HeightUnit {
	Meters,
	Feet
};

inline const char *toString(HeightUnit unit) {
	switch (unit) {
	case HeightUnit::Meters:
		return "m";
	case HeightUnit::Feet:
		return "ft";
	default:
		return "?";
	}
}

/// Marker for a missing height. Missing is distinct from zero.
inline double missingValue() {
	return std::numeric_limits<double>::quiet_NaN();
}

inline bool isMissing(double value) {
	return !std::isfinite(value);
}

struct TimeZoneInfo {
	std::string name = "UTC";
	std::optional<std::chrono::minutes> utc_offset;
};

/// Optional metadata, time zone and per-sample tags attached to a TimeSeries.
struct SeriesAttributes {
	std::unordered_map<std::string, std::string> metadata;
	TimeZoneInfo timezone;
	std::vector<std::string> tags;
};

/**
 * @class TimeSeries
 * @brief An ordered, immutable sequence of (timestamp, height) samples.
 *
 * Timestamps and heights live in separate vectors for cache-efficient numerical
 * processing. Timestamps are UTC instants and must be strictly increasing.
 * Heights share one HeightUnit; a missing height is stored as NaN. An optional
 * tag column carries one string per sample (e.g. "h"/"l" markers from a
 * published high/low table).
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;
	using Metadata = std::unordered_map<std::string, std::string>;

	using TimeZoneInfo = core::TimeZoneInfo;
	using Attributes = SeriesAttributes;

	enum class MissingValuePolicy {
		Error,
		Drop
	};

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of strictly increasing time points.
	 * @param values A vector of corresponding heights (NaN marks a missing height).
	 * @param unit The unit shared by all heights.
	 * @param attributes Optional metadata, time zone and per-sample tags.
	 * @throws std::invalid_argument If sizes differ or timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, HeightUnit unit = HeightUnit::Meters,
	           Attributes attributes = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), unit_(unit) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
		applyAttributes(std::move(attributes));
	}

	TimeSeries() = default;

	/**
	 * @brief Gets the timestamps.
	 * @return A const reference to the vector of timestamps.
	 */
	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	/**
	 * @brief Gets the heights.
	 * @return A const reference to the vector of heights.
	 */
	const std::vector<Value> &getValues() const {
		return values_;
	}

	HeightUnit unit() const {
		return unit_;
	}

	const TimeZoneInfo &timezone() const {
		return timezone_;
	}

	const Metadata &metadata() const {
		return metadata_;
	}

	bool hasTags() const {
		return !tags_.empty();
	}

	const std::vector<std::string> &tags() const {
		return tags_;
	}

	/// Tag of sample @p index, or an empty string when the series carries no tags.
	const std::string &tag(std::size_t index) const {
		static const std::string empty_tag;
		if (tags_.empty()) {
			return empty_tag;
		}
		if (index >= tags_.size()) {
			throw std::out_of_range("Requested tag exceeds the time series length.");
		}
		return tags_[index];
	}

	Attributes attributes() const {
		Attributes attrs;
		attrs.metadata = metadata_;
		attrs.timezone = timezone_;
		attrs.tags = tags_;
		return attrs;
	}

	/**
	 * @brief Gets the number of samples in the series.
	 */
	std::size_t size() const {
		return timestamps_.size();
	}

	/**
	 * @brief Checks if the time series is empty.
	 */
	bool isEmpty() const {
		return size() == 0;
	}

	const TimePoint &front() const {
		if (isEmpty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return timestamps_.front();
	}

	const TimePoint &back() const {
		if (isEmpty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return timestamps_.back();
	}

	/// Index of @p tp if it is one of the sample timestamps.
	std::optional<std::size_t> indexOf(const TimePoint &tp) const {
		const auto it = std::lower_bound(timestamps_.begin(), timestamps_.end(), tp);
		if (it == timestamps_.end() || *it != tp) {
			return std::nullopt;
		}
		return static_cast<std::size_t>(it - timestamps_.begin());
	}

	bool hasMissingValues() const {
		return std::any_of(values_.begin(), values_.end(), [](double v) { return isMissing(v); });
	}

	std::size_t finiteCount() const {
		return static_cast<std::size_t>(
		    std::count_if(values_.begin(), values_.end(), [](double v) { return !isMissing(v); }));
	}

	std::optional<std::chrono::nanoseconds> inferFrequency(std::chrono::nanoseconds tolerance = std::chrono::nanoseconds{0}) const {
		if (timestamps_.size() < 2) {
			return std::nullopt;
		}
		const auto normalized_tolerance =
		    (tolerance >= std::chrono::nanoseconds::zero()) ? tolerance : -tolerance;
		const std::chrono::nanoseconds base_diff = timestamps_[1] - timestamps_[0];
		for (std::size_t i = 1; i + 1 < timestamps_.size(); ++i) {
			const std::chrono::nanoseconds diff = timestamps_[i + 1] - timestamps_[i];
			const auto delta = diff > base_diff ? diff - base_diff : base_diff - diff;
			if (delta > normalized_tolerance) {
				return std::nullopt;
			}
		}
		return base_diff;
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}
		std::vector<std::size_t> indices(end - start);
		for (std::size_t i = 0; i < indices.size(); ++i) {
			indices[i] = start + i;
		}
		return select(indices);
	}

	/// Samples whose timestamp lies in [start, end).
	TimeSeries between(const TimePoint &start, const TimePoint &end) const {
		if (end < start) {
			throw std::invalid_argument("Window end must not precede window start.");
		}
		const auto first = std::lower_bound(timestamps_.begin(), timestamps_.end(), start);
		const auto last = std::lower_bound(first, timestamps_.end(), end);
		return slice(static_cast<std::size_t>(first - timestamps_.begin()),
		             static_cast<std::size_t>(last - timestamps_.begin()));
	}

	/// Same timestamps, unit and attributes with a new set of heights.
	TimeSeries withValues(std::vector<Value> values) const {
		return TimeSeries(timestamps_, std::move(values), unit_, attributes());
	}

	TimeSeries sanitized(MissingValuePolicy policy = MissingValuePolicy::Error) const {
		switch (policy) {
		case MissingValuePolicy::Error:
			if (hasMissingValues()) {
				throw std::invalid_argument("TimeSeries contains missing values.");
			}
			return *this;
		case MissingValuePolicy::Drop: {
			std::vector<std::size_t> keep_indices;
			keep_indices.reserve(size());
			for (std::size_t i = 0; i < size(); ++i) {
				if (!isMissing(values_[i])) {
					keep_indices.push_back(i);
				}
			}
			return select(keep_indices);
		}
		default:
			throw std::logic_error("Unsupported missing value policy.");
		}
	}

private:
	TimeSeries select(const std::vector<std::size_t> &indices) const {
		std::vector<TimePoint> new_timestamps;
		std::vector<Value> new_values;
		new_timestamps.reserve(indices.size());
		new_values.reserve(indices.size());
		Attributes attrs;
		attrs.metadata = metadata_;
		attrs.timezone = timezone_;
		if (!tags_.empty()) {
			attrs.tags.reserve(indices.size());
		}
		for (auto index : indices) {
			new_timestamps.push_back(timestamps_[index]);
			new_values.push_back(values_[index]);
			if (!tags_.empty()) {
				attrs.tags.push_back(tags_[index]);
			}
		}
		return TimeSeries(std::move(new_timestamps), std::move(new_values), unit_, std::move(attrs));
	}

	void applyAttributes(Attributes attributes) {
		if (!attributes.tags.empty() && attributes.tags.size() != timestamps_.size()) {
			throw std::invalid_argument("Tags must match the number of samples.");
		}
		validateTimezone(attributes.timezone);
		metadata_ = std::move(attributes.metadata);
		timezone_ = std::move(attributes.timezone);
		tags_ = std::move(attributes.tags);
	}

	static void validateTimezone(const TimeZoneInfo &timezone) {
		if (timezone.name.empty()) {
			throw std::invalid_argument("Timezone name must not be empty.");
		}
		if (timezone.utc_offset) {
			const auto offset = timezone.utc_offset->count();
			const auto min_offset = -24 * 60;
			const auto max_offset = 24 * 60;
			if (offset < min_offset || offset > max_offset) {
				throw std::invalid_argument("Timezone UTC offset must be within [-24h, 24h].");
			}
		}
	}

	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	HeightUnit unit_ = HeightUnit::Meters;
	Metadata metadata_;
	TimeZoneInfo timezone_;
	std::vector<std::string> tags_;
};

} // namespace tidecheck::core
