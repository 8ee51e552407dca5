#pragma once

#include "tide-check/core/calendar.hpp"
#include "tide-check/core/time_series.hpp"
#include "tide-check/utils/statistics.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tidecheck::residuals {

/**
 * @struct ResidualRecord
 * @brief One observation joined with its prediction. residual = observed - predicted.
 *
 * residual is NaN when either height is missing.
 */
struct ResidualRecord {
	core::TimeSeries::TimePoint timestamp{};
	double observed = 0.0;
	double predicted = 0.0;
	double residual = 0.0;
	std::optional<std::string> label;
};

struct ResidualSummary {
	std::size_t total_records = 0;
	/// Empty when no record has a finite residual ("no data").
	std::optional<utils::DescriptiveStatistics> statistics;
	/// Largest residuals by magnitude, largest first.
	std::vector<ResidualRecord> top;

	bool hasData() const {
		return statistics.has_value();
	}
};

struct WeeklySummary {
	/// Zero when the bucket pools records from several years.
	int year = 0;
	int week = 0;
	ResidualSummary summary;
	std::size_t highs = 0;
	std::size_t lows = 0;
};

/**
 * @class ResidualAnalyzer
 * @brief Joins observed and predicted heights and summarizes the residuals overall and per week.
 */
class ResidualAnalyzer final {
public:
	/**
	 * @brief Inner join by exact timestamp.
	 *
	 * Timestamps found in only one series are dropped. Rows with a missing height on
	 * either side are kept with a missing residual. Tags of @p observed become labels,
	 * falling back to the tags of @p predicted.
	 * @throws core::InconsistentUnitsError If the series use different units.
	 */
	static std::vector<ResidualRecord> join(const core::TimeSeries &observed, const core::TimeSeries &predicted);

	static ResidualSummary summarize(const std::vector<ResidualRecord> &records, std::size_t top_n = 5);

	/**
	 * @brief One summary per week that holds at least one record, in chronological order.
	 */
	static std::vector<WeeklySummary> summarizeByWeek(const std::vector<ResidualRecord> &records, std::size_t top_n = 5,
	                                                  core::WeekNumbering numbering = core::WeekNumbering::DayOfYear);

	/**
	 * @brief Summaries for the requested week numbers, in the requested order.
	 *
	 * Records of the same week number from different years are pooled, as a
	 * per-week report over a single season expects; such a bucket reports year 0.
	 * Weeks without records are reported with zero counts and no data.
	 */
	static std::vector<WeeklySummary> summarizeWeeks(const std::vector<ResidualRecord> &records,
	                                                 const std::vector<int> &weeks, std::size_t top_n = 5,
	                                                 core::WeekNumbering numbering = core::WeekNumbering::DayOfYear);

	/// Minutes from each sample to the next one; the last entry is missing.
	static std::vector<double> intervals(const core::TimeSeries &series);

	/// True for "h" or "high" in any letter case.
	static bool isHighLabel(const std::string &label);

	/// True for "l" or "low" in any letter case.
	static bool isLowLabel(const std::string &label);
};

} // namespace tidecheck::residuals
