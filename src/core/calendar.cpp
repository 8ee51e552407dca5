#include "tide-check/core/calendar.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace tidecheck::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400LL;

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
	std::int64_t quotient = a / b;
	if ((a % b != 0) && ((a < 0) != (b < 0))) {
		--quotient;
	}
	return quotient;
}

// Civil calendar conversions on the proleptic Gregorian calendar (H. Hinnant's algorithms).
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDate civilFromDays(std::int64_t z) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int weekdayFromDays(std::int64_t days) {
	// 1970-01-01 was a Thursday.
	const std::int64_t shifted = floorDiv(days + 3, 7) * 7;
	return static_cast<int>(days + 3 - shifted) + 1;
}

int isoWeeksInYear(int year) {
	const int jan1 = weekdayFromDays(daysFromCivil(year, 1, 1));
	if (jan1 == 4 || (isLeapYear(year) && jan1 == 3)) {
		return 53;
	}
	return 52;
}

} // namespace

TimePoint makeUtc(int year, unsigned month, unsigned day, int hour, int minute, int second) {
	if (month < 1 || month > 12 || day < 1 || day > 31) {
		throw std::invalid_argument("Calendar month or day out of range.");
	}
	const std::int64_t days = daysFromCivil(year, month, day);
	const std::int64_t seconds = days * kSecondsPerDay + static_cast<std::int64_t>(hour) * 3600 +
	                             static_cast<std::int64_t>(minute) * 60 + second;
	return TimePoint{} + std::chrono::seconds(seconds);
}

std::int64_t daysSinceEpoch(const TimePoint &tp) {
	const auto seconds = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
	return floorDiv(static_cast<std::int64_t>(seconds), kSecondsPerDay);
}

CivilDate civilDate(const TimePoint &tp) {
	return civilFromDays(daysSinceEpoch(tp));
}

int calendarYear(const TimePoint &tp) {
	return civilDate(tp).year;
}

int dayOfYear(const TimePoint &tp) {
	const auto days = daysSinceEpoch(tp);
	const auto date = civilFromDays(days);
	return static_cast<int>(days - daysFromCivil(date.year, 1, 1)) + 1;
}

int isoWeekday(const TimePoint &tp) {
	return weekdayFromDays(daysSinceEpoch(tp));
}

double hourOfDay(const TimePoint &tp) {
	const auto midnight = TimePoint{} + std::chrono::hours(24 * daysSinceEpoch(tp));
	const std::chrono::duration<double, std::ratio<3600>> since = tp - midnight;
	return since.count();
}

WeekKey weekKey(const TimePoint &tp, WeekNumbering numbering) {
	const int year = calendarYear(tp);
	const int yday = dayOfYear(tp);
	switch (numbering) {
	case WeekNumbering::DayOfYear:
		return WeekKey{year, (yday - 1) / 7 + 1};
	case WeekNumbering::Iso: {
		const int week = (yday - isoWeekday(tp) + 10) / 7;
		if (week < 1) {
			return WeekKey{year - 1, isoWeeksInYear(year - 1)};
		}
		if (week > isoWeeksInYear(year)) {
			return WeekKey{year + 1, 1};
		}
		return WeekKey{year, week};
	}
	default:
		throw std::logic_error("Unsupported week numbering.");
	}
}

int weekOfYear(const TimePoint &tp, WeekNumbering numbering) {
	return weekKey(tp, numbering).week;
}

std::string formatUtc(const TimePoint &tp) {
	const auto days = daysSinceEpoch(tp);
	const auto date = civilFromDays(days);
	const auto seconds_of_day = std::chrono::duration_cast<std::chrono::seconds>(
	                                tp - (TimePoint{} + std::chrono::hours(24 * days)))
	                                .count();
	return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}", date.year, date.month, date.day,
	                   seconds_of_day / 3600, (seconds_of_day / 60) % 60, seconds_of_day % 60);
}

} // namespace tidecheck::core
