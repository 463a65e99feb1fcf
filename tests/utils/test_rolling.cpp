#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "downscale/utils/rolling.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using downscale::utils::centeredRollingMean;

TEST_CASE("Centered rolling mean truncates at the edges", "[utils][rolling]") {
	const auto result = centeredRollingMean({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
	const std::vector<double> expected{1.5, 2.0, 3.0, 4.0, 4.5};
	REQUIRE(result.size() == expected.size());
	for (std::size_t i = 0; i < expected.size(); ++i) {
		REQUIRE(result[i] == Catch::Approx(expected[i]));
	}
}

TEST_CASE("Centered rolling mean wider than the series", "[utils][rolling]") {
	const auto result = centeredRollingMean({1.0, 2.0, 3.0}, 9);
	for (double value : result) {
		REQUIRE(value == Catch::Approx(2.0));
	}
}

TEST_CASE("Centered rolling mean with an even window leans left", "[utils][rolling]") {
	const auto result = centeredRollingMean({1.0, 2.0, 3.0, 4.0, 5.0}, 4);
	REQUIRE(result[0] == Catch::Approx(1.5));
	REQUIRE(result[2] == Catch::Approx(2.5));
	REQUIRE(result[4] == Catch::Approx(4.0));
}

TEST_CASE("Centered rolling mean honours min_periods", "[utils][rolling]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const auto strict = centeredRollingMean({1.0, 2.0, 3.0, 4.0}, 3, 3);
	REQUIRE(std::isnan(strict.front()));
	REQUIRE(strict[1] == Catch::Approx(2.0));
	REQUIRE(std::isnan(strict.back()));

	const auto gappy = centeredRollingMean({1.0, nan, 3.0}, 3, 2);
	REQUIRE(std::isnan(gappy[0]));
	REQUIRE(gappy[1] == Catch::Approx(2.0));
}

TEST_CASE("Centered rolling mean rejects invalid windows", "[utils][rolling]") {
	REQUIRE_THROWS_AS(centeredRollingMean({1.0}, 0), std::invalid_argument);
	REQUIRE_THROWS_AS(centeredRollingMean({1.0}, 3, 0), std::invalid_argument);
	REQUIRE_THROWS_AS(centeredRollingMean({1.0}, 3, 4), std::invalid_argument);
}
