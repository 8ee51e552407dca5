#include "tide-check/core/calendar.hpp"
#include "tide-check/core/time_series.hpp"
#include "tide-check/pipeline/validation_pipeline.hpp"
#include "tide-check/residuals/residual_analyzer.hpp"
#include "tide-check/utils/logging.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>

using namespace tidecheck;

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

double astronomicalTide(const core::TimeSeries::TimePoint &tp) {
	const std::chrono::duration<double, std::ratio<3600>> t = tp.time_since_epoch();
	return 3.1 + 2.4 * std::cos((28.9841042 * t.count() - 130.0) * kDegToRad) +
	       0.8 * std::cos((30.0 * t.count() - 160.0) * kDegToRad) +
	       0.5 * std::cos((15.0410686 * t.count() - 20.0) * kDegToRad);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	// Tide-gauge record in feet, every 6 minutes for 40 days.
	const auto start = core::makeUtc(2019, 9, 1);
	std::vector<core::TimeSeries::TimePoint> times;
	std::vector<double> heights;
	for (int k = 0; k < 40 * 240; ++k) {
		times.push_back(start + std::chrono::minutes(6 * k));
		heights.push_back(astronomicalTide(times.back()));
	}
	const core::TimeSeries gauge(times, heights, core::HeightUnit::Feet);

	pipeline::PipelineConfig config;
	config.catalogue = harmonics::ConstituentCatalogue::standard().select({"M2", "S2", "K1"});
	config.subtract_mean_sea_level = false;
	const pipeline::ValidationPipeline validation(config);

	const auto end = start + std::chrono::hours(24 * 21);
	const auto reconstruction = validation.reconstruct(gauge, start, end);
	const auto hourly = pipeline::ValidationPipeline::hourlyPrediction(reconstruction);

	// Digitized marigram: hourly readings with a storm surge in the second week and a few unreadable hours.
	std::mt19937 rng(2019);
	std::normal_distribution<double> reading_error(0.0, 0.05);
	std::vector<core::TimeSeries::TimePoint> digitized_times;
	std::vector<double> digitized_heights;
	for (const auto &tp : hourly.getTimestamps()) {
		const double days = std::chrono::duration<double, std::ratio<86400>>(tp - start).count();
		const double surge = (days > 8.0 && days < 11.0) ? 1.2 * std::sin((days - 8.0) / 3.0 * 3.14159265) : 0.0;
		double height = astronomicalTide(tp) + surge + reading_error(rng);
		if (static_cast<int>(days * 24.0) % 97 == 5) {
			height = core::missingValue();
		}
		digitized_times.push_back(tp);
		digitized_heights.push_back(height);
	}
	const core::TimeSeries digitized(std::move(digitized_times), std::move(digitized_heights),
	                                 core::HeightUnit::Feet);

	const auto report = validation.validateTimeSeries(digitized, hourly);

	std::cout << "\n=== Digitized marigram against the hourly prediction ===\n\n";
	std::cout << std::fixed << std::setprecision(3);
	for (const auto &week : report.weekly) {
		std::cout << "  week " << std::setw(2) << week.week << ": ";
		if (!week.summary.hasData()) {
			std::cout << "no data\n";
			continue;
		}
		const auto &stats = *week.summary.statistics;
		std::cout << "mean " << stats.mean << " ft, max " << stats.max << " ft, largest at "
		          << core::formatUtc(week.summary.top.front().timestamp) << "\n";
	}

	const auto weeks = residuals::ResidualAnalyzer::summarizeWeeks(report.records, {35, 36, 37, 38});
	std::cout << "\n  requested weeks without records:";
	for (const auto &week : weeks) {
		if (week.summary.total_records == 0) {
			std::cout << " " << week.week;
		}
	}
	std::cout << "\n";
	return 0;
}
