#ifndef CALENDAR_HPP_
#define CALENDAR_HPP_

#include <string>

namespace railway {

enum class Weekday {
  MONDAY,
  TUESDAY,
  WEDNESDAY,
  THURSDAY,
  FRIDAY,
  SATURDAY,
  SUNDAY
};

/**
 * Parses a three-letter weekday abbreviation ("MON", "tue", ...).
 * Throws std::invalid_argument for anything else.
 */
Weekday parseWeekday(const std::string& text);
std::string toString(Weekday day);

/**
 * Wall-clock time of day with minute resolution.
 */
struct TimeOfDay {
  int hour = 0;
  int minute = 0;

  TimeOfDay() = default;
  TimeOfDay(int h, int m);

  // Parses "HH:MM" (24-hour clock).
  static TimeOfDay parse(const std::string& text);

  // Current local time.
  static TimeOfDay now();

  int minutesSinceMidnight() const { return hour * 60 + minute; }
  std::string toString() const;

  bool operator<(const TimeOfDay& other) const {
    return minutesSinceMidnight() < other.minutesSinceMidnight();
  }
  bool operator==(const TimeOfDay& other) const {
    return hour == other.hour && minute == other.minute;
  }
  bool operator!=(const TimeOfDay& other) const { return !(*this == other); }
  bool operator<=(const TimeOfDay& other) const { return !(other < *this); }
};

/**
 * Calendar date (proleptic Gregorian).
 */
struct Date {
  int year = 1970;
  int month = 1;
  int day = 1;

  Date() = default;
  Date(int y, int m, int d);

  // Parses "YYYY-MM-DD".
  static Date parse(const std::string& text);

  Weekday weekday() const;
  std::string toString() const;

  bool operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const Date& other) const { return !(*this == other); }
};

}  // namespace railway

#endif  // CALENDAR_HPP_
