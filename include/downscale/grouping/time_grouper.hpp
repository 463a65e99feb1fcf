#pragma once

#include "downscale/core/errors.hpp"
#include "downscale/core/series_checks.hpp"
#include "downscale/core/time_series.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace downscale::grouping {

using core::GroupKey;
using TimePoint = core::TimeSeries::TimePoint;

/// Groups by calendar month, keys 1..12.
struct MonthOfYear {};

/// Groups by day of month, keys 1..31.
struct DayOfMonth {};

/**
 * @brief Groups by aligned day of year, keys 1..366.
 *
 * Each key is fitted on every sample within @c window days of it (wrapping
 * around the year end); at transform time a sample belongs to its own day
 * only.
 */
struct PaddedDayOfYear {
	int window = 15;
};

using TimeGrouping = std::variant<MonthOfYear, DayOfMonth, PaddedDayOfYear>;

/**
 * @brief One group: its key and the row positions (ascending) it covers.
 */
struct Group {
	GroupKey key = 0;
	std::vector<std::size_t> rows;
};

/// Groups in ascending key order.
using GroupIndex = std::vector<Group>;

constexpr int kMaxPaddingWindow = 182;
constexpr GroupKey kDaysOnAlignedAxis = 366;

/**
 * @throws std::invalid_argument If the grouping's configuration is out of range.
 */
void validate(const TimeGrouping &grouping);

/// Resolution of the data a grouping is meant for.
core::Resolution resolutionOf(const TimeGrouping &grouping);

std::string describe(const TimeGrouping &grouping);

GroupKey groupKey(const TimeGrouping &grouping, const TimePoint &timestamp);
std::vector<GroupKey> groupKeys(const TimeGrouping &grouping, const std::vector<TimePoint> &timestamps);

/**
 * @brief Partitions rows by key; every row lands in exactly one group.
 */
GroupIndex transformGroups(const TimeGrouping &grouping, const std::vector<TimePoint> &timestamps);

/**
 * @brief Rows used to fit each key's statistics.
 *
 * Equal to transformGroups() except for PaddedDayOfYear, whose groups overlap
 * and are emitted only when their padded window holds at least one row.
 */
GroupIndex fitGroups(const TimeGrouping &grouping, const std::vector<TimePoint> &timestamps);

std::vector<double> gather(const std::vector<double> &values, const std::vector<std::size_t> &rows);

} // namespace downscale::grouping
