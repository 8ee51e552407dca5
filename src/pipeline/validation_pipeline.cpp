#include "tide-check/pipeline/validation_pipeline.hpp"
#include "tide-check/harmonics/tide_predictor.hpp"
#include "tide-check/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tidecheck::pipeline {

namespace {

harmonics::HarmonicFitter makeFitter(const PipelineConfig &config) {
	return harmonics::HarmonicFitterBuilder()
	    .withCatalogue(config.catalogue)
	    .withEpoch(config.epoch)
	    .withMeanSeaLevelSubtraction(config.subtract_mean_sea_level)
	    .withRayleighFactor(config.rayleigh_factor)
	    .build();
}

align::SeriesAligner makeAligner(const PipelineConfig &config) {
	auto builder = align::SeriesAligner::builder();
	if (config.max_match_distance) {
		builder.withMaxDistance(*config.max_match_distance);
	}
	return builder.build();
}

} // namespace

ValidationPipeline::ValidationPipeline(PipelineConfig config)
    : config_(std::move(config)), fitter_(makeFitter(config_)),
      detector_(extrema::ExtremaDetector::builder().withMinimumSeparation(config_.extrema_min_separation).build()),
      aligner_(makeAligner(config_)) {
	if (config_.prediction_step <= core::TimeGrid::Step::zero()) {
		throw std::invalid_argument("Prediction step must be positive.");
	}
}

Reconstruction ValidationPipeline::reconstruct(const core::TimeSeries &observed,
                                               const core::TimeSeries::TimePoint &start,
                                               const core::TimeSeries::TimePoint &end) const {
	auto model = fitter_.fit(observed);
	auto prediction = harmonics::TidePredictor::predictRange(model, start, end, config_.prediction_step);
	auto events = detector_.detect(prediction);

	const auto &times = observed.getTimestamps();
	const auto first = std::lower_bound(times.begin(), times.end(), prediction.front());
	const auto last = std::upper_bound(times.begin(), times.end(), prediction.back());
	const auto inside = observed.slice(static_cast<std::size_t>(first - times.begin()),
	                                   static_cast<std::size_t>(last - times.begin()));
	auto astro_tide = aligner_.interpolate(inside, prediction);

	TIDECHECK_INFO("Reconstructed {} prediction points, {} extrema, {} astronomical tide values.", prediction.size(),
	               events.size(), astro_tide.size());
	return Reconstruction{std::move(model), std::move(prediction), std::move(events), std::move(astro_tide)};
}

core::TimeSeries ValidationPipeline::hourlyPrediction(const Reconstruction &reconstruction) {
	return core::TimeGrid::resampleHourly(reconstruction.prediction);
}

ValidationReport ValidationPipeline::validateTimeSeries(const core::TimeSeries &digitized,
                                                        const core::TimeSeries &predicted) const {
	auto records = residuals::ResidualAnalyzer::join(digitized, predicted);
	return summarize(std::move(records), digitized.size());
}

ValidationReport ValidationPipeline::validateHighLowTable(const core::TimeSeries &table,
                                                          const Reconstruction &reconstruction) const {
	const auto reference = reconstruction.extrema.toSeries();
	auto matches = aligner_.nearestMatch(table, reference);
	const auto predicted = align::SeriesAligner::toPredictedSeries(matches, reference.unit());
	auto report = summarize(residuals::ResidualAnalyzer::join(table, predicted), table.size());
	report.matches = std::move(matches);
	return report;
}

ValidationReport ValidationPipeline::summarize(std::vector<residuals::ResidualRecord> records,
                                               std::size_t inputs) const {
	ValidationReport report;
	report.unmatched = inputs - std::min(inputs, records.size());
	report.summary = residuals::ResidualAnalyzer::summarize(records, config_.top_n);
	report.weekly = residuals::ResidualAnalyzer::summarizeByWeek(records, config_.top_n, config_.week_numbering);
	report.records = std::move(records);

	if (report.summary.hasData()) {
		const auto &stats = *report.summary.statistics;
		TIDECHECK_INFO("Validated {} records over {} weeks: mean {:.3f}, median {:.3f}, max {:.3f}, min {:.3f}.",
		               report.records.size(), report.weekly.size(), stats.mean, stats.median, stats.max, stats.min);
	} else {
		TIDECHECK_WARN("Validation produced {} records and no usable residual.", report.records.size());
	}
	return report;
}

} // namespace tidecheck::pipeline
