#include "tide-check/harmonics/constituent_catalogue.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace tidecheck::harmonics {

namespace {

std::vector<Constituent> standardConstituents() {
	return {
	    // Long period
	    {"SA", 0.0410686},
	    {"SSA", 0.0821373},
	    {"MSM", 0.4715211},
	    {"MM", 0.5443747},
	    {"MSF", 1.0158958},
	    {"MF", 1.0980331},
	    // Diurnal
	    {"2Q1", 12.8542862},
	    {"SIG1", 12.9271398},
	    {"Q1", 13.3986609},
	    {"RHO", 13.4715145},
	    {"O1", 13.9430356},
	    {"MP1", 14.0251729},
	    {"M1", 14.4966939},
	    {"P1", 14.9589314},
	    {"S1", 15.0000000},
	    {"K1", 15.0410686},
	    {"PSI1", 15.0821353},
	    {"PHI1", 15.1232059},
	    {"THE1", 15.5125897},
	    {"J1", 15.5854433},
	    {"SO1", 16.0569644},
	    {"OO1", 16.1391017},
	    // Semidiurnal
	    {"OQ2", 27.3416964},
	    {"MNS2", 27.4238337},
	    {"2N2", 27.8953548},
	    {"MU2", 27.9682084},
	    {"N2", 28.4397295},
	    {"NU2", 28.5125831},
	    {"M2", 28.9841042},
	    {"MKS2", 29.0662415},
	    {"LAM2", 29.4556253},
	    {"L2", 29.5284789},
	    {"T2", 29.9589333},
	    {"S2", 30.0000000},
	    {"R2", 30.0410667},
	    {"K2", 30.0821373},
	    {"MSN2", 30.5443747},
	    {"ETA2", 30.6265120},
	    {"2SM2", 31.0158958},
	    // Terdiurnal
	    {"2MK3", 42.9271398},
	    {"M3", 43.4761563},
	    {"SO3", 43.9430356},
	    {"MK3", 44.0251729},
	    {"SK3", 45.0410686},
	    // Quarter diurnal
	    {"MN4", 57.4238337},
	    {"M4", 57.9682084},
	    {"SN4", 58.4397295},
	    {"MS4", 58.9841042},
	    {"MK4", 59.0662415},
	    {"S4", 60.0000000},
	    {"SK4", 60.0821373},
	    // Fifth diurnal
	    {"2MK5", 73.0092770},
	    {"2SK5", 75.0410686},
	    // Sixth diurnal
	    {"2MN6", 86.4079380},
	    {"M6", 86.9523127},
	    {"2MS6", 87.9682084},
	    {"2SM6", 88.9841042},
	    {"MSK6", 89.0662415},
	    {"S6", 90.0000000},
	    // Eighth diurnal
	    {"M8", 115.9364166},
	};
}

} // namespace

ConstituentCatalogue::ConstituentCatalogue(std::vector<Constituent> constituents)
    : constituents_(std::move(constituents)) {
	if (constituents_.empty()) {
		throw std::invalid_argument("Constituent catalogue must not be empty.");
	}

	std::unordered_set<std::string> names;
	for (const auto &constituent : constituents_) {
		if (constituent.name.empty()) {
			throw std::invalid_argument("Constituent names must not be empty.");
		}
		if (!names.insert(constituent.name).second) {
			throw std::invalid_argument("Duplicate constituent '" + constituent.name + "' in catalogue.");
		}
		if (!std::isfinite(constituent.speed_deg_per_hour) || constituent.speed_deg_per_hour <= 0.0) {
			throw std::invalid_argument("Constituent '" + constituent.name + "' must have a positive speed.");
		}
	}

	if (constituents_.size() > 1 && minimumSeparation() < kSpeedTolerance) {
		throw std::invalid_argument("Constituent catalogue contains two constituents with the same speed.");
	}
}

const ConstituentCatalogue &ConstituentCatalogue::standard() {
	static const ConstituentCatalogue catalogue(standardConstituents());
	return catalogue;
}

const ConstituentCatalogue &ConstituentCatalogue::principal() {
	static const ConstituentCatalogue catalogue =
	    standard().select({"M2", "S2", "N2", "K2", "K1", "O1", "P1", "Q1"});
	return catalogue;
}

ConstituentCatalogue ConstituentCatalogue::select(const std::vector<std::string> &names) const {
	std::vector<Constituent> selected;
	selected.reserve(names.size());
	for (const auto &name : names) {
		if (!contains(name)) {
			throw std::invalid_argument("Unknown constituent '" + name + "'.");
		}
		selected.push_back(find(name));
	}
	return ConstituentCatalogue(std::move(selected));
}

const Constituent &ConstituentCatalogue::find(const std::string &name) const {
	const auto it = std::find_if(constituents_.begin(), constituents_.end(),
	                             [&name](const Constituent &c) { return c.name == name; });
	if (it == constituents_.end()) {
		throw std::out_of_range("Constituent '" + name + "' not found.");
	}
	return *it;
}

bool ConstituentCatalogue::contains(const std::string &name) const {
	return std::any_of(constituents_.begin(), constituents_.end(),
	                   [&name](const Constituent &c) { return c.name == name; });
}

double ConstituentCatalogue::slowestSpeed() const {
	const auto it = std::min_element(constituents_.begin(), constituents_.end(),
	                                 [](const Constituent &a, const Constituent &b) {
		                                 return a.speed_deg_per_hour < b.speed_deg_per_hour;
	                                 });
	return it->speed_deg_per_hour;
}

double ConstituentCatalogue::minimumSeparation() const {
	if (constituents_.size() < 2) {
		return 0.0;
	}
	std::vector<double> speeds;
	speeds.reserve(constituents_.size());
	for (const auto &c : constituents_) {
		speeds.push_back(c.speed_deg_per_hour);
	}
	std::sort(speeds.begin(), speeds.end());
	double separation = std::numeric_limits<double>::infinity();
	for (std::size_t i = 1; i < speeds.size(); ++i) {
		separation = std::min(separation, speeds[i] - speeds[i - 1]);
	}
	return separation;
}

} // namespace tidecheck::harmonics
