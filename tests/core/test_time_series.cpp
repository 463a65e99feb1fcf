#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "downscale/core/time_series.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using downscale::core::TimeSeries;

TEST_CASE("TimeSeries constructs univariate data", "[core][time_series]") {
	auto series = tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0});

	REQUIRE(series.size() == 3);
	REQUIRE_FALSE(series.isEmpty());
	REQUIRE(series.dimensions() == 1);
	REQUIRE_FALSE(series.isMultivariate());
	REQUIRE(series.getValues()[1] == Catch::Approx(2.0));

	series.setLabels({"tasmax"});
	REQUIRE(series.labels() == std::vector<std::string>{"tasmax"});
	REQUIRE_THROWS_AS(series.setLabels({"a", "b"}), std::invalid_argument);

	series.setMetadata({{"station", "USW00024233"}});
	REQUIRE(series.metadata().at("station") == "USW00024233");
}

TEST_CASE("TimeSeries rejects unordered or mismatched input", "[core][time_series][error]") {
	auto timestamps = tests::helpers::makeDailyTimestamps(2000, 1, 1, 3);
	REQUIRE_THROWS_AS(TimeSeries(timestamps, std::vector<double>{1.0, 2.0}), std::invalid_argument);

	std::swap(timestamps[0], timestamps[1]);
	REQUIRE_THROWS_AS(TimeSeries(timestamps, std::vector<double>{1.0, 2.0, 3.0}), std::invalid_argument);

	auto duplicated = tests::helpers::makeDailyTimestamps(2000, 1, 1, 2);
	duplicated[1] = duplicated[0];
	REQUIRE_THROWS_AS(TimeSeries(duplicated, std::vector<double>{1.0, 2.0}), std::invalid_argument);
}

TEST_CASE("TimeSeries selects labelled columns", "[core][time_series][multivariate]") {
	auto series = tests::helpers::makeMultivariateByColumns({{1.0, 2.0, 3.0}, {10.0, 20.0, 30.0}}, {"pr", "tas"});

	REQUIRE(series.isMultivariate());
	REQUIRE(series.dimensionIndex("tas") == std::optional<std::size_t>{1});
	REQUIRE_FALSE(series.dimensionIndex("huss").has_value());

	const auto tas = series.selectDimension(1);
	REQUIRE(tas.dimensions() == 1);
	REQUIRE(tas.labels() == std::vector<std::string>{"tas"});
	REQUIRE(tas.getValues() == std::vector<double>{10.0, 20.0, 30.0});
	REQUIRE(tas.getTimestamps() == series.getTimestamps());
	REQUIRE_THROWS_AS(series.getValues(2), std::out_of_range);
}

TEST_CASE("TimeSeries withValues keeps the index", "[core][time_series]") {
	auto series = tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0});
	series.setLabels({"pr"});

	const auto replaced = series.withValues({4.0, 5.0, 6.0});
	REQUIRE(replaced.getTimestamps() == series.getTimestamps());
	REQUIRE(replaced.getValues() == std::vector<double>{4.0, 5.0, 6.0});
	REQUIRE(replaced.labels() == series.labels());
	REQUIRE_THROWS_AS(series.withValues({1.0}), std::invalid_argument);
}

TEST_CASE("TimeSeries slices and detects missing values", "[core][time_series]") {
	auto series = tests::helpers::makeUnivariateSeries({1.0, std::nan(""), 3.0, 4.0});
	REQUIRE(series.hasMissingValues());

	const auto tail = series.slice(2, 4);
	REQUIRE(tail.size() == 2);
	REQUIRE(tail.getValues() == std::vector<double>{3.0, 4.0});
	REQUIRE(tail.getTimestamps().front() == series.getTimestamps()[2]);
	REQUIRE_FALSE(tail.hasMissingValues());

	REQUIRE_THROWS_AS(series.slice(3, 2), std::invalid_argument);
	REQUIRE_THROWS_AS(series.slice(0, 5), std::out_of_range);
}
