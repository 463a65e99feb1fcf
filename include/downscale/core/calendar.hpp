#pragma once

#include <chrono>
#include <cstdint>

namespace downscale::core {

/**
 * @brief A proleptic Gregorian calendar date in UTC.
 */
struct CalendarDate {
	int year = 1970;
	int month = 1; // 1..12
	int day = 1;   // 1..31

	bool operator==(const CalendarDate &other) const {
		return year == other.year && month == other.month && day == other.day;
	}
	bool operator!=(const CalendarDate &other) const {
		return !(*this == other);
	}
};

namespace calendar {

using TimePoint = std::chrono::system_clock::time_point;

bool isLeapYear(int year);
int daysInMonth(int year, int month);

/**
 * @brief Days since 1970-01-01 for a civil date. Valid for any date the
 * system clock can represent; the date must satisfy month in 1..12 and
 * day in 1..daysInMonth.
 * @throws std::invalid_argument for an invalid month or day.
 */
std::int64_t daysFromCivil(const CalendarDate &date);
CalendarDate civilFromDays(std::int64_t days);

/// Floor of the timestamp to whole UTC days since the epoch.
std::int64_t dayNumber(const TimePoint &tp);

CalendarDate toDate(const TimePoint &tp);
TimePoint fromDate(const CalendarDate &date);
TimePoint fromDate(int year, int month, int day);

/// Ordinal day within the year, 1..365 (366 in leap years).
int dayOfYear(const CalendarDate &date);

/**
 * @brief Day of year on a fixed 366-day axis.
 *
 * Non-leap years skip position 60 (Feb 29), so a calendar date keeps the same
 * position in every year: Mar 1 is always 61 and Dec 31 always 366.
 */
int alignedDayOfYear(const CalendarDate &date);

/// Months since January 1970, used to test monthly contiguity.
std::int64_t monthNumber(const CalendarDate &date);

} // namespace calendar
} // namespace downscale::core
