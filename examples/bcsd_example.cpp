#include "downscale/core/calendar.hpp"
#include "downscale/core/errors.hpp"
#include "downscale/core/time_series.hpp"
#include "downscale/models/bcsd_precipitation.hpp"
#include "downscale/models/bcsd_temperature.hpp"
#include "downscale/utils/logging.hpp"
#include "downscale/utils/metrics.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using namespace downscale;

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<core::TimeSeries::TimePoint> monthlyTimestamps(int year, std::size_t months) {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(months);
	for (std::size_t i = 0; i < months; ++i) {
		const int offset = static_cast<int>(i);
		timestamps.push_back(core::calendar::fromDate(year + offset / 12, offset % 12 + 1, 1));
	}
	return timestamps;
}

// Wet winters, dry summers; the simulation is too wet by @p scale.
core::TimeSeries syntheticPrecipitation(int year, std::size_t months, double scale, unsigned seed) {
	std::mt19937 rng(seed);
	std::gamma_distribution<double> noise(4.0, 0.25);
	std::vector<double> values(months);
	for (std::size_t i = 0; i < months; ++i) {
		const double season = 80.0 + 40.0 * std::cos(2.0 * kPi * static_cast<double>(i % 12) / 12.0);
		values[i] = scale * season * noise(rng);
	}
	return core::TimeSeries(monthlyTimestamps(year, months), std::move(values));
}

core::TimeSeries syntheticTemperature(int year, std::size_t months, double offset, double warming,
                                      unsigned seed) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.2);
	std::vector<double> values(months);
	for (std::size_t i = 0; i < months; ++i) {
		const double season = 9.0 - 11.0 * std::cos(2.0 * kPi * static_cast<double>(i % 12) / 12.0);
		values[i] = offset + season + warming * static_cast<double>(i) / 12.0 + noise(rng);
	}
	return core::TimeSeries(monthlyTimestamps(year, months), std::move(values));
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printQuantiles(const std::string &label, const std::vector<double> &observed,
                    const std::vector<double> &values) {
	std::cout << "  " << std::setw(22) << std::left << label << " | ";
	for (double q : {0.1, 0.5, 0.9}) {
		std::cout << "q" << static_cast<int>(q * 100) << " bias: " << std::fixed << std::setprecision(2)
		          << std::setw(7) << utils::Metrics::quantileBias(observed, values, q) << " | ";
	}
	std::cout << "\n";
	std::cout.unsetf(std::ios::floatfield);
}

void printClimatology(const std::string &label, const models::Climatology &climatology) {
	std::cout << "  " << label << ":";
	for (const auto &entry : climatology.values()) {
		std::cout << " " << entry.first << "=" << std::fixed << std::setprecision(1) << entry.second;
	}
	std::cout << "\n";
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
#ifndef DOWNSCALE_NO_LOGGING
	utils::Logging::init(spdlog::level::warn);
#endif

	std::cout << "=== BCSD Bias Correction Examples ===\n";
	std::cout << "Correcting a synthetic climate simulation against synthetic observations\n";

	// ===================================================================
	// Scenario 1: Monthly precipitation
	// ===================================================================
	printHeader("Scenario 1: Monthly Precipitation");

	const auto simulated_pr = syntheticPrecipitation(1981, 360, 1.35, 1);
	const auto observed_pr = syntheticPrecipitation(1981, 360, 1.0, 2);

	auto precipitation = models::BcsdPrecipitation::builder().withReturnAnoms(false).build();
	precipitation.fit(simulated_pr, observed_pr);
	printClimatology("Observed climatology (mm)", precipitation.targetClimatology());

	const auto corrected_pr = precipitation.predict(simulated_pr);
	std::cout << "\nDistribution bias against the observations:\n";
	printQuantiles("Raw simulation", observed_pr.getValues(), simulated_pr.getValues());
	printQuantiles("BCSD corrected", observed_pr.getValues(), corrected_pr.getValues());

	auto ratio_model = models::BcsdPrecipitation::builder().build();
	ratio_model.fit(simulated_pr, observed_pr);
	const auto future_pr = syntheticPrecipitation(2041, 24, 1.5, 3);
	const auto ratios = ratio_model.predict(future_pr);
	std::cout << "\nFuture ratio anomalies (first 6 months):";
	for (std::size_t i = 0; i < 6; ++i) {
		std::cout << " " << std::fixed << std::setprecision(2) << ratios.getValues()[i];
	}
	std::cout << "\n";
	std::cout.unsetf(std::ios::floatfield);

	// ===================================================================
	// Scenario 2: Monthly temperature with a warming trend
	// ===================================================================
	printHeader("Scenario 2: Monthly Temperature");

	const auto simulated_tas = syntheticTemperature(1981, 360, 1.8, 0.0, 4);
	const auto observed_tas = syntheticTemperature(1981, 360, 0.0, 0.0, 5);
	const auto future_tas = syntheticTemperature(2041, 120, 1.8, 0.4, 6);

	auto temperature = models::BcsdTemperature::builder().withReturnAnoms(false).build();
	temperature.fit(simulated_tas, observed_tas);
	printClimatology("Simulated climatology (C)", temperature.sourceClimatology());
	printClimatology("Observed climatology (C) ", temperature.targetClimatology());

	const auto parts = temperature.decompose(future_tas);
	std::cout << "\nFirst year of the projection:\n";
	std::cout << "  " << std::setw(8) << std::left << "month" << std::setw(10) << "raw" << std::setw(10) << "trend"
	          << std::setw(10) << "shift" << "corrected\n";
	for (std::size_t i = 0; i < 12; ++i) {
		std::cout << "  " << std::setw(8) << std::left << (i + 1) << std::fixed << std::setprecision(2)
		          << std::setw(10) << future_tas.getValues()[i] << std::setw(10) << parts.trend[i]
		          << std::setw(10) << parts.shift[i] << parts.result[i] << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);

	const auto mean = [](const std::vector<double> &values) {
		return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
	};
	const double raw_warming = mean(future_tas.getValues()) - mean(simulated_tas.getValues());
	const double corrected_warming = mean(parts.result) - mean(observed_tas.getValues());
	std::cout << "\n  Projected change, raw:       " << std::fixed << std::setprecision(2) << raw_warming << " C\n";
	std::cout << "  Projected change, corrected: " << corrected_warming << " C\n";
	std::cout.unsetf(std::ios::floatfield);

	// ===================================================================
	// Scenario 3: Error handling
	// ===================================================================
	printHeader("Scenario 3: Error Handling");

	models::BcsdPrecipitation unfitted;
	try {
		unfitted.predict(future_pr);
	} catch (const core::NotFittedError &e) {
		std::cout << "  NotFittedError: " << e.what() << "\n";
	}

	transform::QuantileMapperOptions options;
	options.min_samples = 1;
	auto short_model = models::BcsdTemperature::builder().withQuantileMapperOptions(options).build();
	short_model.fit(syntheticTemperature(1981, 6, 1.8, 0.0, 7), syntheticTemperature(1981, 6, 0.0, 0.0, 8));
	try {
		short_model.predict(syntheticTemperature(1982, 12, 1.8, 0.0, 9));
	} catch (const core::GroupKeyMismatchError &e) {
		std::cout << "  GroupKeyMismatchError (key " << e.key() << "): " << e.what() << "\n";
	}

	std::cout << "\nDone.\n";
	return 0;
}
