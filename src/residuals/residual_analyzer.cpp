#include "tide-check/residuals/residual_analyzer.hpp"
#include "tide-check/core/errors.hpp"
#include "tide-check/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace tidecheck::residuals {

namespace {

std::string lowercase(const std::string &text) {
	std::string result(text);
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return result;
}

void countLabels(const std::vector<ResidualRecord> &records, WeeklySummary &summary) {
	for (const auto &record : records) {
		if (!record.label) {
			continue;
		}
		if (ResidualAnalyzer::isHighLabel(*record.label)) {
			++summary.highs;
		} else if (ResidualAnalyzer::isLowLabel(*record.label)) {
			++summary.lows;
		}
	}
}

} // namespace

std::vector<ResidualRecord> ResidualAnalyzer::join(const core::TimeSeries &observed, const core::TimeSeries &predicted) {
	if (observed.unit() != predicted.unit()) {
		throw core::InconsistentUnitsError(std::string("Cannot compare observations in ") +
		                                   core::toString(observed.unit()) + " with predictions in " +
		                                   core::toString(predicted.unit()) + ".");
	}

	const auto &obs_times = observed.getTimestamps();
	const auto &pred_times = predicted.getTimestamps();
	const auto &obs_values = observed.getValues();
	const auto &pred_values = predicted.getValues();

	std::vector<ResidualRecord> records;
	records.reserve(std::min(obs_times.size(), pred_times.size()));
	std::size_t i = 0;
	std::size_t j = 0;
	while (i < obs_times.size() && j < pred_times.size()) {
		if (obs_times[i] < pred_times[j]) {
			++i;
			continue;
		}
		if (pred_times[j] < obs_times[i]) {
			++j;
			continue;
		}

		ResidualRecord record;
		record.timestamp = obs_times[i];
		record.observed = obs_values[i];
		record.predicted = pred_values[j];
		record.residual = (core::isMissing(record.observed) || core::isMissing(record.predicted))
		                      ? core::missingValue()
		                      : record.observed - record.predicted;
		if (!observed.tag(i).empty()) {
			record.label = observed.tag(i);
		} else if (!predicted.tag(j).empty()) {
			record.label = predicted.tag(j);
		}
		records.push_back(std::move(record));
		++i;
		++j;
	}
	return records;
}

ResidualSummary ResidualAnalyzer::summarize(const std::vector<ResidualRecord> &records, std::size_t top_n) {
	ResidualSummary summary;
	summary.total_records = records.size();

	std::vector<std::size_t> usable;
	std::vector<double> residuals;
	for (std::size_t i = 0; i < records.size(); ++i) {
		if (std::isfinite(records[i].residual)) {
			usable.push_back(i);
			residuals.push_back(records[i].residual);
		}
	}
	if (residuals.empty()) {
		return summary;
	}
	summary.statistics = utils::Statistics::describe(residuals);

	const auto ranks_before = [&records](std::size_t lhs, std::size_t rhs) {
		const double a = std::abs(records[lhs].residual);
		const double b = std::abs(records[rhs].residual);
		if (a != b) {
			return a > b;
		}
		return records[lhs].timestamp < records[rhs].timestamp;
	};
	const std::size_t count = std::min(top_n, usable.size());
	std::partial_sort(usable.begin(), usable.begin() + static_cast<std::ptrdiff_t>(count), usable.end(), ranks_before);
	summary.top.reserve(count);
	for (std::size_t k = 0; k < count; ++k) {
		summary.top.push_back(records[usable[k]]);
	}
	return summary;
}

std::vector<WeeklySummary> ResidualAnalyzer::summarizeByWeek(const std::vector<ResidualRecord> &records,
                                                             std::size_t top_n, core::WeekNumbering numbering) {
	std::map<core::WeekKey, std::vector<ResidualRecord>> buckets;
	for (const auto &record : records) {
		buckets[core::weekKey(record.timestamp, numbering)].push_back(record);
	}

	std::vector<WeeklySummary> result;
	result.reserve(buckets.size());
	for (const auto &entry : buckets) {
		WeeklySummary weekly;
		weekly.year = entry.first.year;
		weekly.week = entry.first.week;
		weekly.summary = summarize(entry.second, top_n);
		countLabels(entry.second, weekly);
		if (!weekly.summary.hasData()) {
			TIDECHECK_WARN("Week {} of {} has {} records and no usable residual.", weekly.week, weekly.year,
			               weekly.summary.total_records);
		}
		result.push_back(std::move(weekly));
	}
	return result;
}

std::vector<WeeklySummary> ResidualAnalyzer::summarizeWeeks(const std::vector<ResidualRecord> &records,
                                                            const std::vector<int> &weeks, std::size_t top_n,
                                                            core::WeekNumbering numbering) {
	std::map<int, std::vector<ResidualRecord>> buckets;
	for (const auto &record : records) {
		buckets[core::weekOfYear(record.timestamp, numbering)].push_back(record);
	}

	std::vector<WeeklySummary> result;
	result.reserve(weeks.size());
	for (int week : weeks) {
		WeeklySummary weekly;
		weekly.week = week;
		const auto it = buckets.find(week);
		if (it == buckets.end()) {
			TIDECHECK_WARN("Week {} has no records.", week);
			result.push_back(std::move(weekly));
			continue;
		}
		weekly.year = core::weekKey(it->second.front().timestamp, numbering).year;
		for (const auto &record : it->second) {
			if (core::weekKey(record.timestamp, numbering).year != weekly.year) {
				weekly.year = 0;
				break;
			}
		}
		weekly.summary = summarize(it->second, top_n);
		countLabels(it->second, weekly);
		if (!weekly.summary.hasData()) {
			TIDECHECK_WARN("Week {} has {} records and no usable residual.", week, weekly.summary.total_records);
		}
		result.push_back(std::move(weekly));
	}
	return result;
}

std::vector<double> ResidualAnalyzer::intervals(const core::TimeSeries &series) {
	const auto &timestamps = series.getTimestamps();
	std::vector<double> minutes(timestamps.size(), core::missingValue());
	for (std::size_t i = 0; i + 1 < timestamps.size(); ++i) {
		const std::chrono::duration<double, std::ratio<60>> gap = timestamps[i + 1] - timestamps[i];
		minutes[i] = gap.count();
	}
	return minutes;
}

bool ResidualAnalyzer::isHighLabel(const std::string &label) {
	const auto lower = lowercase(label);
	return lower == "h" || lower == "high";
}

bool ResidualAnalyzer::isLowLabel(const std::string &label) {
	const auto lower = lowercase(label);
	return lower == "l" || lower == "low";
}

} // namespace tidecheck::residuals
