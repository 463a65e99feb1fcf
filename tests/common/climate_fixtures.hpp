#pragma once

#include "common/time_series_helpers.hpp"

#include <cmath>
#include <random>
#include <vector>

namespace tests::fixtures {

constexpr double kPi = 3.14159265358979323846;

/**
 * Strictly positive monthly precipitation with a seasonal cycle, starting in
 * January.
 */
inline std::vector<double> monthlyPrecipitation(std::size_t months, double scale, unsigned seed) {
	std::mt19937 rng(seed);
	std::lognormal_distribution<double> noise(0.0, 0.4);
	std::vector<double> values(months);
	for (std::size_t i = 0; i < months; ++i) {
		const double season = 1.5 + std::cos(2.0 * kPi * static_cast<double>(i % 12) / 12.0);
		values[i] = scale * season * noise(rng);
	}
	return values;
}

inline std::vector<double> dailyPrecipitation(std::size_t days, double scale, unsigned seed) {
	std::mt19937 rng(seed);
	std::lognormal_distribution<double> noise(0.0, 0.6);
	std::vector<double> values(days);
	for (std::size_t i = 0; i < days; ++i) {
		const double season = 1.5 + std::cos(2.0 * kPi * static_cast<double>(i) / 365.25);
		values[i] = scale * season * noise(rng);
	}
	return values;
}

/**
 * Temperature with an annual cycle, an offset and a linear warming trend.
 */
inline std::vector<double> seasonalTemperature(const std::vector<helpers::TimePoint> &timestamps, double offset,
                                               double warming_per_sample, unsigned seed) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.5);
	std::vector<double> values(timestamps.size());
	for (std::size_t i = 0; i < timestamps.size(); ++i) {
		const auto date = downscale::core::calendar::toDate(timestamps[i]);
		const double phase = 2.0 * kPi * static_cast<double>(downscale::core::calendar::dayOfYear(date)) / 365.25;
		values[i] = offset + 12.0 - 10.0 * std::cos(phase) + warming_per_sample * static_cast<double>(i) + noise(rng);
	}
	return values;
}

} // namespace tests::fixtures
