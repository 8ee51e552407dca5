#include "tide-check/core/calendar.hpp"
#include "tide-check/core/time_series.hpp"
#include "tide-check/pipeline/validation_pipeline.hpp"
#include "tide-check/utils/logging.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace tidecheck;

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

// Gauge record: M2, S2, N2, K1 and O1 around a 1.4 m mean level, hourly, with sensor noise.
core::TimeSeries makeGaugeRecord(core::TimeSeries::TimePoint start, int hours) {
	struct Term {
		double speed;
		double amplitude;
		double phase;
	};
	const std::vector<Term> terms{{28.9841042, 1.12, 48.0},
	                              {30.0, 0.36, 92.0},
	                              {28.4397295, 0.24, 21.0},
	                              {15.0410686, 0.31, 204.0},
	                              {13.9430356, 0.22, 188.0}};
	std::mt19937 rng(42);
	std::normal_distribution<double> noise(0.0, 0.02);

	std::vector<core::TimeSeries::TimePoint> timestamps;
	std::vector<double> heights;
	for (int h = 0; h < hours; ++h) {
		const auto tp = start + std::chrono::hours(h);
		const std::chrono::duration<double, std::ratio<3600>> t = tp.time_since_epoch();
		double height = 1.4;
		for (const auto &term : terms) {
			height += term.amplitude * std::cos((term.speed * t.count() - term.phase) * kDegToRad);
		}
		timestamps.push_back(tp);
		heights.push_back(height + noise(rng));
	}
	return core::TimeSeries(std::move(timestamps), std::move(heights));
}

// Published table: every predicted event, rounded to the minute and offset by a few minutes and centimetres.
core::TimeSeries makePublishedTable(const extrema::ExtremaSet &events) {
	std::mt19937 rng(7);
	std::uniform_int_distribution<int> minutes(-12, 12);
	std::normal_distribution<double> error(0.03, 0.04);

	std::vector<core::TimeSeries::TimePoint> timestamps;
	std::vector<double> heights;
	core::TimeSeries::Attributes attrs;
	for (const auto &event : events.events()) {
		const auto rounded = std::chrono::round<std::chrono::minutes>(event.timestamp);
		timestamps.push_back(rounded + std::chrono::minutes(minutes(rng)));
		heights.push_back(event.height + error(rng));
		attrs.tags.emplace_back(event.kind == extrema::ExtremaKind::High ? "H" : "L");
	}
	return core::TimeSeries(std::move(timestamps), std::move(heights), events.unit(), std::move(attrs));
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printSummary(const residuals::ResidualSummary &summary) {
	if (!summary.hasData()) {
		std::cout << "  no data (" << summary.total_records << " records)\n";
		return;
	}
	const auto &stats = *summary.statistics;
	std::cout << std::fixed << std::setprecision(3);
	std::cout << "  records " << summary.total_records << " | mean " << stats.mean << " | median " << stats.median
	          << " | max " << stats.max << " | min " << stats.min << " | rms " << stats.rms << "\n";
	for (const auto &record : summary.top) {
		std::cout << "    " << core::formatUtc(record.timestamp) << "  " << record.label.value_or("-")
		          << "  observed " << record.observed << "  predicted " << record.predicted << "  residual "
		          << record.residual << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	const auto start = core::makeUtc(2021, 7, 1);
	const auto gauge = makeGaugeRecord(start, 45 * 24);

	pipeline::PipelineConfig config;
	config.catalogue = harmonics::ConstituentCatalogue::principal().select({"M2", "S2", "N2", "K1", "O1"});
	config.max_match_distance = std::chrono::hours(2);
	const pipeline::ValidationPipeline validation(config);

	printHeader("Harmonic reconstruction");
	const auto reconstruction = validation.reconstruct(gauge, start, start + std::chrono::hours(24 * 28));
	std::cout << "  mean level " << reconstruction.model.meanLevel() << " m, fit rms "
	          << reconstruction.model.residualRms() << " m\n";
	for (const auto &fit : reconstruction.model.constituents()) {
		std::cout << "  " << std::setw(4) << std::left << fit.name << " amplitude " << std::fixed
		          << std::setprecision(3) << fit.amplitude << " m, phase " << std::setprecision(1) << fit.phase_deg
		          << " deg\n";
		std::cout.unsetf(std::ios::floatfield);
	}
	std::cout << "  " << reconstruction.extrema.highs().size() << " highs, " << reconstruction.extrema.lows().size()
	          << " lows\n";

	const auto table = makePublishedTable(reconstruction.extrema);
	const auto report = validation.validateHighLowTable(table, reconstruction);

	printHeader("Published high/low table against the reconstruction");
	printSummary(report.summary);

	printHeader("Weekly summaries");
	for (const auto &week : report.weekly) {
		std::cout << "  week " << week.week << " of " << week.year << ": " << week.highs << " highs, " << week.lows
		          << " lows\n";
		printSummary(week.summary);
	}
	return 0;
}
