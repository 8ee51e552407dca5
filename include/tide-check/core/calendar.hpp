#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tidecheck::core {

using TimePoint = std::chrono::system_clock::time_point;

struct CivilDate {
	int year = 1970;
	unsigned month = 1;
	unsigned day = 1;
};

/// How weeks of the year are numbered when samples are bucketed by week.
enum class WeekNumbering {
	/// Week n holds days 7(n-1)+1 .. 7n of the calendar year (range 1..53).
	DayOfYear,
	/// ISO 8601 weeks starting on Monday (range 1..53, year may differ at year ends).
	Iso
};

struct WeekKey {
	int year = 0;
	int week = 0;

	bool operator==(const WeekKey &other) const {
		return year == other.year && week == other.week;
	}
	bool operator!=(const WeekKey &other) const {
		return !(*this == other);
	}
	bool operator<(const WeekKey &other) const {
		return year != other.year ? year < other.year : week < other.week;
	}
};

/// Builds a UTC instant from calendar fields.
TimePoint makeUtc(int year, unsigned month, unsigned day, int hour = 0, int minute = 0, int second = 0);

/// Days since 1970-01-01 (floor division, valid before the epoch too).
std::int64_t daysSinceEpoch(const TimePoint &tp);

CivilDate civilDate(const TimePoint &tp);

int calendarYear(const TimePoint &tp);

/// Day of the year, 1-based.
int dayOfYear(const TimePoint &tp);

/// ISO weekday, Monday = 1 .. Sunday = 7.
int isoWeekday(const TimePoint &tp);

/// Hours since midnight UTC as a fraction (e.g. 13.5 for 13:30).
double hourOfDay(const TimePoint &tp);

WeekKey weekKey(const TimePoint &tp, WeekNumbering numbering = WeekNumbering::DayOfYear);

int weekOfYear(const TimePoint &tp, WeekNumbering numbering = WeekNumbering::DayOfYear);

/// Formats an instant as "YYYY-MM-DD HH:MM:SS" (UTC).
std::string formatUtc(const TimePoint &tp);

} // namespace tidecheck::core
