#include "tide-check/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace tidecheck::utils {

namespace {

void validate_non_empty(const std::vector<double> &values) {
	if (values.empty()) {
		throw std::invalid_argument("Statistics require a non-empty input.");
	}
}

} // namespace

double Statistics::mean(const std::vector<double> &values) {
	validate_non_empty(values);
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Statistics::median(std::vector<double> values) {
	validate_non_empty(values);

	const std::size_t n = values.size();
	const std::size_t mid = n / 2;

	// nth_element gives an O(n) median
	std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
	const double mid_val = values[mid];
	if (n % 2 == 1) {
		return mid_val;
	}
	// Even count: average with the largest element of the lower half
	const double lower_max = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
	return (lower_max + mid_val) / 2.0;
}

double Statistics::max(const std::vector<double> &values) {
	validate_non_empty(values);
	return *std::max_element(values.begin(), values.end());
}

double Statistics::min(const std::vector<double> &values) {
	validate_non_empty(values);
	return *std::min_element(values.begin(), values.end());
}

double Statistics::meanAbsolute(const std::vector<double> &values) {
	validate_non_empty(values);
	double sum = 0.0;
	for (double v : values) {
		sum += std::abs(v);
	}
	return sum / static_cast<double>(values.size());
}

double Statistics::rms(const std::vector<double> &values) {
	validate_non_empty(values);
	double sum = 0.0;
	for (double v : values) {
		sum += v * v;
	}
	return std::sqrt(sum / static_cast<double>(values.size()));
}

DescriptiveStatistics Statistics::describe(const std::vector<double> &values) {
	validate_non_empty(values);
	DescriptiveStatistics stats;
	stats.count = values.size();
	stats.mean = mean(values);
	stats.median = median(values);
	stats.max = max(values);
	stats.min = min(values);
	stats.mean_absolute = meanAbsolute(values);
	stats.rms = rms(values);
	return stats;
}

std::vector<double> Statistics::finite(const std::vector<double> &values) {
	std::vector<double> result;
	result.reserve(values.size());
	std::copy_if(values.begin(), values.end(), std::back_inserter(result), [](double v) { return std::isfinite(v); });
	return result;
}

} // namespace tidecheck::utils
