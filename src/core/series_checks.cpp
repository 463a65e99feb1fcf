#include "downscale/core/series_checks.hpp"

#include "downscale/core/calendar.hpp"
#include "downscale/core/errors.hpp"
#include "downscale/utils/logging.hpp"

namespace downscale::core {

namespace {

std::string describeDate(const CalendarDate &date) {
	return std::to_string(date.year) + "-" + std::to_string(date.month) + "-" + std::to_string(date.day);
}

} // namespace

const char *toString(Resolution resolution) {
	switch (resolution) {
	case Resolution::Monthly:
		return "monthly";
	case Resolution::Daily:
		return "daily";
	}
	return "unknown";
}

TimeSeries ensureUnivariate(const TimeSeries &series, const std::optional<std::string> &column) {
	if (series.isEmpty()) {
		throw MalformedInputError("Input series must contain at least one observation.");
	}
	if (series.dimensions() == 0) {
		throw MalformedInputError("Input series has no value column.");
	}
	if (!series.isMultivariate()) {
		return series;
	}
	if (!column) {
		DOWNSCALE_WARN("Rejecting {}-column input without a value column selection.", series.dimensions());
		throw MalformedInputError("Input series has " + std::to_string(series.dimensions()) +
		                          " columns; a value column must be selected.");
	}
	const auto index = series.dimensionIndex(*column);
	if (!index) {
		throw MalformedInputError("Input series has no column labelled '" + *column + "'.");
	}
	return series.selectDimension(*index);
}

void checkDatetimeIndex(const TimeSeries &series, Resolution resolution) {
	const auto &timestamps = series.getTimestamps();
	for (std::size_t i = 1; i < timestamps.size(); ++i) {
		const auto previous = calendar::toDate(timestamps[i - 1]);
		const auto current = calendar::toDate(timestamps[i]);
		bool contiguous = false;
		if (resolution == Resolution::Monthly) {
			contiguous = calendar::monthNumber(current) == calendar::monthNumber(previous) + 1;
		} else {
			contiguous = calendar::dayNumber(timestamps[i]) == calendar::dayNumber(timestamps[i - 1]) + 1;
		}
		if (!contiguous) {
			throw MalformedInputError(std::string("Timestamps are not contiguous at ") + toString(resolution) +
			                          " resolution between " + describeDate(previous) + " and " +
			                          describeDate(current) + ".");
		}
	}
}

} // namespace downscale::core
