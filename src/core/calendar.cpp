#include "downscale/core/calendar.hpp"

#include <stdexcept>
#include <string>

namespace downscale::core::calendar {

namespace {

constexpr std::int64_t kNanosecondsPerDay = 86400LL * 1000000000LL;

// Cumulative days before each month in a non-leap year.
constexpr int kDaysBeforeMonth[12] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};

void validateDate(const CalendarDate &date) {
	if (date.month < 1 || date.month > 12) {
		throw std::invalid_argument("Month must be within 1..12, got " + std::to_string(date.month) + ".");
	}
	if (date.day < 1 || date.day > daysInMonth(date.year, date.month)) {
		throw std::invalid_argument("Day " + std::to_string(date.day) + " is out of range for " +
		                            std::to_string(date.year) + "-" + std::to_string(date.month) + ".");
	}
}

} // namespace

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
	static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be within 1..12, got " + std::to_string(month) + ".");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

// Howard Hinnant's days_from_civil / civil_from_days, shifted so the era
// starts on March 1.
std::int64_t daysFromCivil(const CalendarDate &date) {
	validateDate(date);
	const std::int64_t y = static_cast<std::int64_t>(date.year) - (date.month <= 2 ? 1 : 0);
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const std::int64_t yoe = y - era * 400;
	const std::int64_t mp = (date.month + 9) % 12;
	const std::int64_t doy = (153 * mp + 2) / 5 + date.day - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

CalendarDate civilFromDays(std::int64_t days) {
	days += 719468;
	const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	const std::int64_t doe = days - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	CalendarDate date;
	date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
	date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
	date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
	return date;
}

std::int64_t dayNumber(const TimePoint &tp) {
	const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
	std::int64_t quotient = ns / kNanosecondsPerDay;
	if (ns % kNanosecondsPerDay < 0) {
		--quotient;
	}
	return quotient;
}

CalendarDate toDate(const TimePoint &tp) {
	return civilFromDays(dayNumber(tp));
}

TimePoint fromDate(const CalendarDate &date) {
	const auto days = daysFromCivil(date);
	return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::hours(24 * days));
}

TimePoint fromDate(int year, int month, int day) {
	return fromDate(CalendarDate{year, month, day});
}

int dayOfYear(const CalendarDate &date) {
	validateDate(date);
	int ordinal = kDaysBeforeMonth[date.month - 1] + date.day;
	if (date.month > 2 && isLeapYear(date.year)) {
		++ordinal;
	}
	return ordinal;
}

int alignedDayOfYear(const CalendarDate &date) {
	validateDate(date);
	int ordinal = kDaysBeforeMonth[date.month - 1] + date.day;
	if (date.month > 2) {
		++ordinal;
	}
	return ordinal;
}

std::int64_t monthNumber(const CalendarDate &date) {
	return (static_cast<std::int64_t>(date.year) - 1970) * 12 + (date.month - 1);
}

} // namespace downscale::core::calendar
