#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tidecheck::harmonics {

/**
 * @struct Constituent
 * @brief A named tidal constituent with its angular speed in degrees per solar hour.
 */
struct Constituent {
	std::string name;
	double speed_deg_per_hour = 0.0;

	/// Period in hours (360 / speed).
	double periodHours() const {
		return 360.0 / speed_deg_per_hour;
	}
};

/**
 * @class ConstituentCatalogue
 * @brief A fixed, validated list of constituents used as design frequencies by the fitter.
 *
 * The catalogue is checked once on construction: names must be non-empty and
 * unique, speeds finite and positive, and no two speeds may coincide (equal
 * speeds make the least-squares design matrix singular).
 */
class ConstituentCatalogue {
public:
	/// Minimum separation between two speeds, in degrees per hour.
	static constexpr double kSpeedTolerance = 1e-7;

	/**
	 * @throws std::invalid_argument If the list is empty or violates the catalogue rules.
	 */
	explicit ConstituentCatalogue(std::vector<Constituent> constituents);

	/// The 60-constituent analysis set (the 37 NOAA constituents plus compound and minor tides).
	static const ConstituentCatalogue &standard();

	/// The eight principal semidiurnal and diurnal constituents.
	static const ConstituentCatalogue &principal();

	/**
	 * @brief A sub-catalogue of this catalogue in the requested order.
	 * @throws std::invalid_argument If a name is unknown.
	 */
	ConstituentCatalogue select(const std::vector<std::string> &names) const;

	const std::vector<Constituent> &constituents() const {
		return constituents_;
	}

	std::size_t size() const {
		return constituents_.size();
	}

	const Constituent &at(std::size_t index) const {
		return constituents_.at(index);
	}

	/**
	 * @throws std::out_of_range If the name is not in the catalogue.
	 */
	const Constituent &find(const std::string &name) const;

	bool contains(const std::string &name) const;

	/// Speed of the slowest constituent.
	double slowestSpeed() const;

	/// Smallest speed difference between any two constituents, or 0 for a single constituent.
	double minimumSeparation() const;

private:
	std::vector<Constituent> constituents_;
};

} // namespace tidecheck::harmonics
