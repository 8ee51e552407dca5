#pragma once

#include <cstddef>
#include <vector>

namespace tidecheck::utils {

struct DescriptiveStatistics {
	std::size_t count = 0;
	double mean = 0.0;
	double median = 0.0;
	double max = 0.0;
	double min = 0.0;
	double mean_absolute = 0.0;
	double rms = 0.0;
};

/**
 * @brief Summary statistics over finite values.
 *
 * Every function throws std::invalid_argument on an empty input so that callers
 * never receive a NaN computed over nothing.
 */
class Statistics final {
public:
	static double mean(const std::vector<double> &values);
	static double median(std::vector<double> values);
	static double max(const std::vector<double> &values);
	static double min(const std::vector<double> &values);
	static double meanAbsolute(const std::vector<double> &values);
	static double rms(const std::vector<double> &values);

	static DescriptiveStatistics describe(const std::vector<double> &values);

	/// Copies the finite entries of @p values, dropping missing ones.
	static std::vector<double> finite(const std::vector<double> &values);
};

} // namespace tidecheck::utils
