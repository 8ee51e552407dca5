#pragma once

#include <stdexcept>
#include <string>

namespace tidecheck::core {

/**
 * @brief Raised when a series is too short, too sparse or spans too little time
 * to determine the requested tidal constituents.
 */
class InsufficientDataError : public std::invalid_argument {
public:
	explicit InsufficientDataError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief Raised when an interpolation query falls outside the reference domain.
 */
class InterpolationRangeError : public std::out_of_range {
public:
	explicit InterpolationRangeError(const std::string &message) : std::out_of_range(message) {
	}
};

/**
 * @brief Raised when an operation that needs samples receives an empty series.
 */
class EmptySeriesError : public std::invalid_argument {
public:
	explicit EmptySeriesError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief Raised when two series being compared carry different height units.
 */
class InconsistentUnitsError : public std::invalid_argument {
public:
	explicit InconsistentUnitsError(const std::string &message) : std::invalid_argument(message) {
	}
};

} // namespace tidecheck::core
