#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tide-check/harmonics/constituent_catalogue.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using tidecheck::harmonics::Constituent;
using tidecheck::harmonics::ConstituentCatalogue;

TEST_CASE("Standard catalogue holds the 60 analysis constituents", "[harmonics][catalogue]") {
	const auto &catalogue = ConstituentCatalogue::standard();
	REQUIRE(catalogue.size() == 60);
	REQUIRE(catalogue.contains("M2"));
	REQUIRE(catalogue.contains("SA"));
	REQUIRE(catalogue.find("M2").speed_deg_per_hour == Catch::Approx(28.9841042));
	REQUIRE(catalogue.find("S2").periodHours() == Catch::Approx(12.0));
	REQUIRE(catalogue.slowestSpeed() == Catch::Approx(0.0410686));
	REQUIRE(catalogue.minimumSeparation() > ConstituentCatalogue::kSpeedTolerance);
}

TEST_CASE("Principal catalogue lists the eight major constituents", "[harmonics][catalogue]") {
	const auto &catalogue = ConstituentCatalogue::principal();
	REQUIRE(catalogue.size() == 8);
	for (const auto *name : {"M2", "S2", "N2", "K2", "K1", "O1", "P1", "Q1"}) {
		REQUIRE(catalogue.contains(name));
	}
	REQUIRE_FALSE(catalogue.contains("SA"));
}

TEST_CASE("Catalogue selection keeps the requested order", "[harmonics][catalogue]") {
	auto subset = ConstituentCatalogue::standard().select({"K1", "M2"});
	REQUIRE(subset.size() == 2);
	REQUIRE(subset.at(0).name == "K1");
	REQUIRE(subset.at(1).name == "M2");
	REQUIRE(subset.minimumSeparation() == Catch::Approx(28.9841042 - 15.0410686));

	REQUIRE_THROWS_AS(ConstituentCatalogue::standard().select({"M2", "XYZ"}), std::invalid_argument);
	REQUIRE_THROWS_AS(subset.find("S2"), std::out_of_range);
	REQUIRE(ConstituentCatalogue::standard().select({"M2"}).minimumSeparation() == Catch::Approx(0.0));
}

TEST_CASE("Catalogue validation rejects unusable constituent lists", "[harmonics][catalogue][validation]") {
	REQUIRE_THROWS_AS(ConstituentCatalogue(std::vector<Constituent>{}), std::invalid_argument);
	REQUIRE_THROWS_AS(ConstituentCatalogue(std::vector<Constituent>{{"", 28.98}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ConstituentCatalogue(std::vector<Constituent>{{"M2", 28.98}, {"M2", 30.0}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ConstituentCatalogue(std::vector<Constituent>{{"M2", -1.0}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ConstituentCatalogue(std::vector<Constituent>{{"A", 30.0}, {"B", 30.0}}), std::invalid_argument);

	ConstituentCatalogue custom(std::vector<Constituent>{{"X", 10.0}, {"Y", 20.0}});
	REQUIRE(custom.size() == 2);
}
