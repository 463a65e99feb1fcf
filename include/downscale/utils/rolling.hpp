#pragma once

#include <cstddef>
#include <vector>

namespace downscale::utils {

/**
 * @brief Centered moving average.
 *
 * The window around position i spans i - window / 2 .. i + (window - 1 - window / 2),
 * truncated at the series edges. Windows with fewer than @p min_periods
 * finite values produce NaN.
 * @throws std::invalid_argument If window is 0 or min_periods is outside 1..window.
 */
std::vector<double> centeredRollingMean(const std::vector<double> &data, std::size_t window,
                                        std::size_t min_periods = 1);

} // namespace downscale::utils
