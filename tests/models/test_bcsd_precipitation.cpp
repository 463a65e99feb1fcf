#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "downscale/core/errors.hpp"
#include "downscale/models/bcsd_precipitation.hpp"
#include "common/climate_fixtures.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace downscale;
using tests::fixtures::monthlyPrecipitation;
using tests::helpers::makeMonthlySeries;

namespace {

struct PrecipitationScenario {
	core::TimeSeries source;
	core::TimeSeries target;
	core::TimeSeries query;
};

PrecipitationScenario monthlyScenario() {
	return {makeMonthlySeries(2000, 1, monthlyPrecipitation(120, 1.3, 11)),
	        makeMonthlySeries(2000, 1, monthlyPrecipitation(120, 1.0, 12)),
	        makeMonthlySeries(2010, 1, monthlyPrecipitation(24, 1.3, 13))};
}

models::BcsdPrecipitation absoluteModel() {
	return models::BcsdPrecipitation::builder().withReturnAnoms(false).build();
}

} // namespace

TEST_CASE("BcsdPrecipitation corrects monthly precipitation", "[models][precipitation]") {
	const auto scenario = monthlyScenario();
	auto model = models::BcsdPrecipitation::builder().build();
	REQUIRE_FALSE(model.isFitted());

	model.fit(scenario.source, scenario.target);
	REQUIRE(model.isFitted());
	REQUIRE(model.state() == models::BcsdBase::FitState::Fitted);
	REQUIRE(model.targetClimatology().size() == 12);
	REQUIRE(model.quantileMappers().size() == 12);

	const auto result = model.predict(scenario.query);
	REQUIRE(result.size() == 24);
	REQUIRE(result.getTimestamps() == scenario.query.getTimestamps());
	for (double value : result.getValues()) {
		REQUIRE(std::isfinite(value));
		REQUIRE(value >= 0.0);
	}
}

TEST_CASE("BcsdPrecipitation ratio anomalies scale back to absolute values", "[models][precipitation]") {
	const auto scenario = monthlyScenario();
	auto anomalies = models::BcsdPrecipitation::builder().build();
	auto absolute = absoluteModel();
	anomalies.fit(scenario.source, scenario.target);
	absolute.fit(scenario.source, scenario.target);

	const auto ratios = anomalies.predict(scenario.query).getValues();
	const auto values = absolute.predict(scenario.query).getValues();
	const auto &climatology = anomalies.targetClimatology();
	const auto &timestamps = scenario.query.getTimestamps();
	for (std::size_t i = 0; i < values.size(); ++i) {
		const auto month = grouping::groupKey(grouping::MonthOfYear{}, timestamps[i]);
		REQUIRE(ratios[i] * climatology.at(month) == Catch::Approx(values[i]));
	}
}

TEST_CASE("BcsdPrecipitation maps the target distribution onto the query", "[models][precipitation]") {
	const auto scenario = monthlyScenario();
	auto model = absoluteModel();
	model.fit(scenario.source, scenario.target);

	// Predicting the training target reproduces it: ranks are unchanged and
	// each group maps onto its own quantiles.
	const auto result = model.predict(scenario.target);
	const auto &expected = scenario.target.getValues();
	for (std::size_t i = 0; i < expected.size(); ++i) {
		REQUIRE(result.getValues()[i] == Catch::Approx(expected[i]).epsilon(1e-9));
	}
}

TEST_CASE("BcsdPrecipitation must be fitted before use", "[models][precipitation][error]") {
	const auto scenario = monthlyScenario();
	const models::BcsdPrecipitation model;

	REQUIRE_THROWS_AS(model.predict(scenario.query), core::NotFittedError);
	REQUIRE_THROWS_AS(model.targetClimatology(), core::NotFittedError);
	REQUIRE_THROWS_AS(model.exportState(), core::NotFittedError);
	try {
		model.predict(scenario.query);
		FAIL("Expected NotFittedError");
	} catch (const core::NotFittedError &e) {
		REQUIRE(std::string(e.what()).find("target climatology") != std::string::npos);
	}
}

TEST_CASE("BcsdPrecipitation rejects a non-positive climatology", "[models][precipitation][error]") {
	auto scenario = monthlyScenario();
	auto dry_january = scenario.target.getValues();
	for (std::size_t i = 0; i < dry_january.size(); i += 12) {
		dry_january[i] = 0.0;
	}
	const auto dry_target = makeMonthlySeries(2000, 1, dry_january);

	SECTION("on a fresh model") {
		models::BcsdPrecipitation model;
		try {
			model.fit(scenario.source, dry_target);
			FAIL("Expected DomainValidityError");
		} catch (const core::DomainValidityError &e) {
			const std::string message = e.what();
			REQUIRE(message.find("Invalid value in target climatology") != std::string::npos);
			REQUIRE(message.find("group key 1") != std::string::npos);
		}
		REQUIRE_FALSE(model.isFitted());
		REQUIRE_THROWS_AS(model.targetClimatology(), core::NotFittedError);
	}

	SECTION("after a successful fit") {
		models::BcsdPrecipitation model;
		model.fit(scenario.source, scenario.target);
		REQUIRE_THROWS_AS(model.fit(scenario.source, dry_target), std::domain_error);
		REQUIRE(model.state() == models::BcsdBase::FitState::Unfit);
		REQUIRE_THROWS_AS(model.predict(scenario.query), core::NotFittedError);
	}
}

TEST_CASE("BcsdPrecipitation reports groups unseen during fit", "[models][precipitation][error]") {
	transform::QuantileMapperOptions options;
	options.min_samples = 1;
	auto model = models::BcsdPrecipitation::builder().withQuantileMapperOptions(options).build();
	model.fit(makeMonthlySeries(2000, 1, monthlyPrecipitation(6, 1.3, 1)),
	          makeMonthlySeries(2000, 1, monthlyPrecipitation(6, 1.0, 2)));
	REQUIRE(model.targetClimatology().size() == 6);

	try {
		model.predict(makeMonthlySeries(2001, 1, monthlyPrecipitation(12, 1.3, 3)));
		FAIL("Expected GroupKeyMismatchError");
	} catch (const core::GroupKeyMismatchError &e) {
		REQUIRE(e.key() == 7);
	}
}

TEST_CASE("BcsdPrecipitation rejects groups below the sample minimum", "[models][precipitation][error]") {
	models::BcsdPrecipitation model;
	REQUIRE_THROWS_AS(model.fit(makeMonthlySeries(2000, 1, monthlyPrecipitation(13, 1.3, 1)),
	                            makeMonthlySeries(2000, 1, monthlyPrecipitation(13, 1.0, 2))),
	                  core::InsufficientDataError);
	REQUIRE_FALSE(model.isFitted());
}

TEST_CASE("BcsdPrecipitation refits to the same state", "[models][precipitation]") {
	const auto scenario = monthlyScenario();
	models::BcsdPrecipitation model;
	model.fit(scenario.source, scenario.target);
	const auto first_climatology = model.targetClimatology();
	const auto first = model.predict(scenario.query).getValues();

	model.fit(scenario.source, scenario.target);
	REQUIRE(model.targetClimatology() == first_climatology);
	REQUIRE(model.predict(scenario.query).getValues() == first);
}

TEST_CASE("BcsdPrecipitation selects a labelled value column", "[models][precipitation][input]") {
	const auto scenario = monthlyScenario();
	const auto timestamps = tests::helpers::makeMonthlyTimestamps(2000, 1, 120);
	const core::TimeSeries labelled_target(timestamps, {scenario.target.getValues(), std::vector<double>(120, -1.0)},
	                                       core::TimeSeries::ValueLayout::ByColumn, {"pr", "flag"});

	models::BcsdPrecipitation ambiguous;
	REQUIRE_THROWS_AS(ambiguous.fit(scenario.source, labelled_target), core::MalformedInputError);

	auto model = models::BcsdPrecipitation::builder().withValueColumn("pr").build();
	model.fit(scenario.source, labelled_target);

	models::BcsdPrecipitation reference;
	reference.fit(scenario.source, scenario.target);
	REQUIRE(model.targetClimatology() == reference.targetClimatology());

	auto missing_column = models::BcsdPrecipitation::builder().withValueColumn("tas").build();
	REQUIRE_THROWS_AS(missing_column.fit(scenario.source, labelled_target), core::MalformedInputError);
}

TEST_CASE("BcsdPrecipitation requires a contiguous monthly index", "[models][precipitation][input]") {
	const auto scenario = monthlyScenario();
	auto timestamps = scenario.query.getTimestamps();
	timestamps.erase(timestamps.begin() + 5);
	auto values = scenario.query.getValues();
	values.pop_back();
	const core::TimeSeries gappy(timestamps, values);

	models::BcsdPrecipitation model;
	model.fit(scenario.source, scenario.target);
	REQUIRE_THROWS_AS(model.predict(gappy), core::MalformedInputError);

	const auto daily = tests::helpers::makeDailySeries(2010, 1, 1, std::vector<double>(30, 1.0));
	REQUIRE_THROWS_AS(model.predict(daily), core::MalformedInputError);
}

TEST_CASE("BcsdPrecipitation state survives export and restore", "[models][precipitation][state]") {
	const auto scenario = monthlyScenario();
	models::BcsdPrecipitation original;
	original.fit(scenario.source, scenario.target);

	auto state = original.exportState();
	REQUIRE_FALSE(state.source_climatology.has_value());

	models::BcsdPrecipitation restored;
	restored.restoreState(state);
	REQUIRE(restored.isFitted());
	REQUIRE(restored.predict(scenario.query).getValues() == original.predict(scenario.query).getValues());

	auto broken = original.exportState();
	auto means = broken.target_climatology.values();
	means[3] = -1.0;
	broken.target_climatology = models::Climatology(means);
	models::BcsdPrecipitation rejected;
	REQUIRE_THROWS_AS(rejected.restoreState(broken), core::DomainValidityError);
	REQUIRE_FALSE(rejected.isFitted());

	auto undefined = original.exportState();
	auto undefined_means = undefined.target_climatology.values();
	undefined_means[8] = std::nan("");
	undefined.target_climatology = models::Climatology(undefined_means);
	REQUIRE_THROWS_AS(rejected.restoreState(undefined), core::DomainValidityError);

	auto incomplete = original.exportState();
	incomplete.quantile_mappers.erase(5);
	REQUIRE_THROWS_AS(rejected.restoreState(incomplete), std::invalid_argument);
}

TEST_CASE("BcsdPrecipitation builder validates its configuration", "[models][precipitation][config]") {
	using Builder = models::BcsdBuilder<models::BcsdPrecipitation>;
	REQUIRE_THROWS_AS(Builder().withTrendWindow(0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(Builder().withTrendWindow(3, 4).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(Builder().withTimeGrouping(grouping::PaddedDayOfYear{-1}).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(Builder().withClimateTrendGrouping(grouping::MonthOfYear{}).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(Builder().withValueColumn("").build(), std::invalid_argument);

	transform::QuantileMapperOptions options;
	options.n_quantiles = 0;
	REQUIRE_THROWS_AS(Builder().withQuantileMapperOptions(options).build(), std::invalid_argument);

	const auto model = Builder().withTimeGrouping(grouping::DayOfMonth{}).build();
	REQUIRE(model.config().resolution() == core::Resolution::Daily);
}

TEST_CASE("BcsdPrecipitation corrects daily data across a leap day", "[models][precipitation][daily]") {
	using tests::fixtures::dailyPrecipitation;
	using tests::helpers::daysBetween;
	using tests::helpers::makeDailySeries;

	const auto training_days = daysBetween(2001, 1, 1, 2004, 1, 1);
	auto model = models::BcsdPrecipitation::builder().withTimeGrouping(grouping::PaddedDayOfYear{15}).build();
	model.fit(makeDailySeries(2001, 1, 1, dailyPrecipitation(training_days, 1.4, 21)),
	          makeDailySeries(2001, 1, 1, dailyPrecipitation(training_days, 1.0, 22)));
	REQUIRE(model.targetClimatology().size() == 366);

	const auto query = makeDailySeries(2004, 1, 1, dailyPrecipitation(366, 1.4, 23));
	const auto result = model.predict(query);
	REQUIRE(result.size() == 366);
	for (double value : result.getValues()) {
		REQUIRE(value > 0.0);
	}
}

TEST_CASE("BcsdPrecipitation scores absolute predictions", "[models][precipitation][metrics]") {
	const auto scenario = monthlyScenario();
	auto model = absoluteModel();
	model.fit(scenario.source, scenario.target);

	const auto metrics = model.score(scenario.target, scenario.target);
	REQUIRE(metrics.n == 120);
	REQUIRE(metrics.mae == Catch::Approx(0.0).margin(1e-9));

	REQUIRE_THROWS_AS(model.score(scenario.query, scenario.target), std::invalid_argument);
}
