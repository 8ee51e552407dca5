#pragma once

#include "tide-check/align/series_aligner.hpp"
#include "tide-check/core/calendar.hpp"
#include "tide-check/core/time_grid.hpp"
#include "tide-check/core/time_series.hpp"
#include "tide-check/extrema/extrema_detector.hpp"
#include "tide-check/harmonics/constituent_catalogue.hpp"
#include "tide-check/harmonics/harmonic_fitter.hpp"
#include "tide-check/harmonics/harmonic_model.hpp"
#include "tide-check/residuals/residual_analyzer.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace tidecheck::pipeline {

struct PipelineConfig {
	harmonics::ConstituentCatalogue catalogue = harmonics::ConstituentCatalogue::standard();
	core::TimeSeries::TimePoint epoch{};
	bool subtract_mean_sea_level = false;
	double rayleigh_factor = 0.0;
	core::TimeGrid::Step prediction_step = std::chrono::minutes(1);
	std::chrono::system_clock::duration extrema_min_separation{0};
	std::size_t top_n = 5;
	core::WeekNumbering week_numbering = core::WeekNumbering::DayOfYear;
	/// Table rows further than this from every predicted extremum are left unmatched.
	std::optional<std::chrono::system_clock::duration> max_match_distance;
};

struct Reconstruction {
	harmonics::HarmonicModel model;
	/// Model evaluated on the regular prediction grid.
	core::TimeSeries prediction;
	extrema::ExtremaSet extrema;
	/// Prediction interpolated at the observed timestamps that fall inside the grid.
	core::TimeSeries astro_tide;
};

struct ValidationReport {
	std::vector<residuals::ResidualRecord> records;
	residuals::ResidualSummary summary;
	std::vector<residuals::WeeklySummary> weekly;
	/// Nearest-match pairs; empty for timestamp-joined validation.
	std::vector<align::MatchedPair> matches;
	/// Input rows that produced no record.
	std::size_t unmatched = 0;
};

/**
 * @class ValidationPipeline
 * @brief Runs the fit, predict, detect, align and summarize stages end to end.
 */
class ValidationPipeline {
public:
	/**
	 * @throws std::invalid_argument If the configuration is rejected by one of the stage builders.
	 */
	explicit ValidationPipeline(PipelineConfig config = PipelineConfig());

	/**
	 * @brief Fits @p observed and predicts the tide between @p start and @p end.
	 * @throws core::InsufficientDataError If the observations cannot support the fit.
	 */
	Reconstruction reconstruct(const core::TimeSeries &observed, const core::TimeSeries::TimePoint &start,
	                           const core::TimeSeries::TimePoint &end) const;

	/// Whole-hour view of the dense prediction, missing where the grid has no sample on the hour.
	static core::TimeSeries hourlyPrediction(const Reconstruction &reconstruction);

	/**
	 * @brief Compares a digitized series with a prediction at exactly shared timestamps.
	 */
	ValidationReport validateTimeSeries(const core::TimeSeries &digitized, const core::TimeSeries &predicted) const;

	/**
	 * @brief Matches each row of a high/low table to the nearest predicted extremum.
	 * @throws core::EmptySeriesError If the reconstruction holds no extrema.
	 */
	ValidationReport validateHighLowTable(const core::TimeSeries &table, const Reconstruction &reconstruction) const;

	const PipelineConfig &config() const {
		return config_;
	}

private:
	ValidationReport summarize(std::vector<residuals::ResidualRecord> records, std::size_t inputs) const;

	PipelineConfig config_;
	harmonics::HarmonicFitter fitter_;
	extrema::ExtremaDetector detector_;
	align::SeriesAligner aligner_;
};

} // namespace tidecheck::pipeline
