#pragma once

#include "downscale/core/time_series.hpp"

#include <optional>
#include <string>

namespace downscale::core {

enum class Resolution { Monthly, Daily };

const char *toString(Resolution resolution);

/**
 * @brief Reduces @p series to the single value column a model works on.
 *
 * A univariate series is returned unchanged. A multivariate series needs
 * @p column to name exactly one labelled column.
 * @throws MalformedInputError For empty series or an ambiguous column choice.
 */
TimeSeries ensureUnivariate(const TimeSeries &series, const std::optional<std::string> &column = std::nullopt);

/**
 * @brief Verifies the index advances by exactly one calendar step of @p resolution.
 * @throws MalformedInputError On gaps, repeated periods, or several samples per period.
 */
void checkDatetimeIndex(const TimeSeries &series, Resolution resolution);

} // namespace downscale::core
