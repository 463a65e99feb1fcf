#include "downscale/utils/rolling.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace downscale::utils {

std::vector<double> centeredRollingMean(const std::vector<double> &data, std::size_t window,
                                        std::size_t min_periods) {
	if (window == 0) {
		throw std::invalid_argument("Rolling window must be at least 1.");
	}
	if (min_periods == 0 || min_periods > window) {
		throw std::invalid_argument("Rolling min_periods must be within 1..window.");
	}

	const std::size_t left = window / 2;
	const std::size_t right = window - 1 - left;
	const std::size_t n = data.size();
	std::vector<double> result(n, std::numeric_limits<double>::quiet_NaN());

	for (std::size_t i = 0; i < n; ++i) {
		const std::size_t begin = i >= left ? i - left : 0;
		const std::size_t end = std::min(n, i + right + 1);
		double sum = 0.0;
		std::size_t count = 0;
		for (std::size_t j = begin; j < end; ++j) {
			if (std::isfinite(data[j])) {
				sum += data[j];
				++count;
			}
		}
		if (count >= min_periods) {
			result[i] = sum / static_cast<double>(count);
		}
	}
	return result;
}

} // namespace downscale::utils
