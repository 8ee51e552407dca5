#include "tide-check/harmonics/tide_predictor.hpp"
#include "tide-check/core/calendar.hpp"
#include "tide-check/utils/logging.hpp"

#include <cmath>

namespace tidecheck::harmonics {

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

struct RadianTerm {
	double amplitude;
	double speed_rad_per_hour;
	double phase_rad;
};

std::vector<RadianTerm> radianTerms(const HarmonicModel &model) {
	std::vector<RadianTerm> terms;
	terms.reserve(model.constituents().size());
	for (const auto &fit : model.constituents()) {
		terms.push_back(RadianTerm{fit.amplitude, fit.speed_deg_per_hour * kDegToRad, fit.phase_deg * kDegToRad});
	}
	return terms;
}

double evaluate(double mean_level, const std::vector<RadianTerm> &terms, double t_hours) {
	double height = mean_level;
	for (const auto &term : terms) {
		height += term.amplitude * std::cos(term.speed_rad_per_hour * t_hours - term.phase_rad);
	}
	return height;
}

} // namespace

double TidePredictor::predictAt(const HarmonicModel &model, const TimePoint &tp) {
	return evaluate(model.meanLevel(), radianTerms(model), model.hoursSinceEpoch(tp));
}

core::TimeSeries TidePredictor::predict(const HarmonicModel &model, std::vector<TimePoint> timestamps) {
	const auto terms = radianTerms(model);
	std::vector<double> heights;
	heights.reserve(timestamps.size());
	for (const auto &tp : timestamps) {
		heights.push_back(evaluate(model.meanLevel(), terms, model.hoursSinceEpoch(tp)));
	}

	if (!timestamps.empty() && (!model.covers(timestamps.front()) || !model.covers(timestamps.back()))) {
		TIDECHECK_DEBUG("Prediction {} to {} extrapolates beyond the fitting window {} to {}.",
		                core::formatUtc(timestamps.front()), core::formatUtc(timestamps.back()),
		                core::formatUtc(model.fitWindow().start), core::formatUtc(model.fitWindow().end));
	}
	return core::TimeSeries(std::move(timestamps), std::move(heights), model.unit());
}

core::TimeSeries TidePredictor::predictRange(const HarmonicModel &model, const TimePoint &start, const TimePoint &end,
                                             core::TimeGrid::Step step) {
	auto grid = core::TimeGrid::regular(start, end, step);
	TIDECHECK_DEBUG("Predicting {} grid points from {} to {}.", grid.size(), core::formatUtc(start),
	                core::formatUtc(end));
	return predict(model, std::move(grid));
}

} // namespace tidecheck::harmonics
