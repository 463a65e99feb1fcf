#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace downscale::utils {

struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	double bias = std::numeric_limits<double>::quiet_NaN();
	std::optional<double> r_squared;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double bias(const std::vector<double> &actual, const std::vector<double> &predicted);

	// Difference between the q-quantiles of the two samples; a bias-corrected
	// series should drive this towards zero across q.
	static double quantileBias(const std::vector<double> &actual, const std::vector<double> &predicted,
	                           double q = 0.5);

	static AccuracyMetrics summarize(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace downscale::utils
