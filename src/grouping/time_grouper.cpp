#include "downscale/grouping/time_grouper.hpp"

#include "downscale/core/calendar.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <stdexcept>

namespace downscale::grouping {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
	using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

GroupIndex toIndex(std::map<GroupKey, std::vector<std::size_t>> buckets) {
	GroupIndex index;
	index.reserve(buckets.size());
	for (auto &entry : buckets) {
		index.push_back(Group{entry.first, std::move(entry.second)});
	}
	return index;
}

int circularDistance(int lhs, int rhs) {
	const int direct = std::abs(lhs - rhs);
	return std::min(direct, kDaysOnAlignedAxis - direct);
}

} // namespace

void validate(const TimeGrouping &grouping) {
	if (const auto *padded = std::get_if<PaddedDayOfYear>(&grouping)) {
		if (padded->window < 0 || padded->window > kMaxPaddingWindow) {
			throw std::invalid_argument("PaddedDayOfYear window must be within 0.." +
			                            std::to_string(kMaxPaddingWindow) + ", got " +
			                            std::to_string(padded->window) + ".");
		}
	}
}

core::Resolution resolutionOf(const TimeGrouping &grouping) {
	return std::holds_alternative<MonthOfYear>(grouping) ? core::Resolution::Monthly : core::Resolution::Daily;
}

std::string describe(const TimeGrouping &grouping) {
	return std::visit(Overloaded{[](const MonthOfYear &) { return std::string("month-of-year"); },
	                             [](const DayOfMonth &) { return std::string("day-of-month"); },
	                             [](const PaddedDayOfYear &padded) {
		                             return "padded-day-of-year(window=" + std::to_string(padded.window) + ")";
	                             }},
	                  grouping);
}

GroupKey groupKey(const TimeGrouping &grouping, const TimePoint &timestamp) {
	const auto date = core::calendar::toDate(timestamp);
	return std::visit(Overloaded{[&](const MonthOfYear &) { return date.month; },
	                             [&](const DayOfMonth &) { return date.day; },
	                             [&](const PaddedDayOfYear &) { return core::calendar::alignedDayOfYear(date); }},
	                  grouping);
}

std::vector<GroupKey> groupKeys(const TimeGrouping &grouping, const std::vector<TimePoint> &timestamps) {
	std::vector<GroupKey> keys;
	keys.reserve(timestamps.size());
	for (const auto &timestamp : timestamps) {
		keys.push_back(groupKey(grouping, timestamp));
	}
	return keys;
}

GroupIndex transformGroups(const TimeGrouping &grouping, const std::vector<TimePoint> &timestamps) {
	std::map<GroupKey, std::vector<std::size_t>> buckets;
	const auto keys = groupKeys(grouping, timestamps);
	for (std::size_t row = 0; row < keys.size(); ++row) {
		buckets[keys[row]].push_back(row);
	}
	return toIndex(std::move(buckets));
}

GroupIndex fitGroups(const TimeGrouping &grouping, const std::vector<TimePoint> &timestamps) {
	const auto *padded = std::get_if<PaddedDayOfYear>(&grouping);
	if (!padded) {
		return transformGroups(grouping, timestamps);
	}
	validate(grouping);

	const auto days = groupKeys(grouping, timestamps);
	GroupIndex index;
	for (GroupKey key = 1; key <= kDaysOnAlignedAxis; ++key) {
		Group group{key, {}};
		for (std::size_t row = 0; row < days.size(); ++row) {
			if (circularDistance(days[row], key) <= padded->window) {
				group.rows.push_back(row);
			}
		}
		if (!group.rows.empty()) {
			index.push_back(std::move(group));
		}
	}
	return index;
}

std::vector<double> gather(const std::vector<double> &values, const std::vector<std::size_t> &rows) {
	std::vector<double> subset;
	subset.reserve(rows.size());
	for (auto row : rows) {
		subset.push_back(values.at(row));
	}
	return subset;
}

} // namespace downscale::grouping
