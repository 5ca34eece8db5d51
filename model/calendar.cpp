#include "calendar.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace railway {

namespace {

int parseNumber(const std::string& text, const std::string& what) {
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
  }
  try {
    return std::stoi(text);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Invalid " + what + ": '" + text + "' is too large");
  }
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

}  // namespace

Weekday parseWeekday(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "MON") return Weekday::MONDAY;
  if (upper == "TUE") return Weekday::TUESDAY;
  if (upper == "WED") return Weekday::WEDNESDAY;
  if (upper == "THU") return Weekday::THURSDAY;
  if (upper == "FRI") return Weekday::FRIDAY;
  if (upper == "SAT") return Weekday::SATURDAY;
  if (upper == "SUN") return Weekday::SUNDAY;
  throw std::invalid_argument("Invalid day: " + text);
}

std::string toString(Weekday day) {
  switch (day) {
    case Weekday::MONDAY: return "MON";
    case Weekday::TUESDAY: return "TUE";
    case Weekday::WEDNESDAY: return "WED";
    case Weekday::THURSDAY: return "THU";
    case Weekday::FRIDAY: return "FRI";
    case Weekday::SATURDAY: return "SAT";
    case Weekday::SUNDAY: return "SUN";
    default: return "UNKNOWN";
  }
}

TimeOfDay::TimeOfDay(int h, int m) : hour(h), minute(m) {
  if (h < 0 || h > 23 || m < 0 || m > 59) {
    throw std::invalid_argument("Time out of range: " + std::to_string(h) + ":" +
                                std::to_string(m));
  }
}

TimeOfDay TimeOfDay::parse(const std::string& text) {
  auto colon = text.find(':');
  if (colon == std::string::npos) {
    throw std::invalid_argument("Invalid time: '" + text + "'");
  }
  int h = parseNumber(text.substr(0, colon), "hour");
  int m = parseNumber(text.substr(colon + 1), "minute");
  return TimeOfDay(h, m);
}

TimeOfDay TimeOfDay::now() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&time_t, &local);
  return TimeOfDay(local.tm_hour, local.tm_min);
}

std::string TimeOfDay::toString() const {
  std::stringstream ss;
  ss << std::setfill('0') << std::setw(2) << hour << ":" << std::setw(2) << minute;
  return ss.str();
}

Date::Date(int y, int m, int d) : year(y), month(m), day(d) {
  if (y < 1 || m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
    throw std::invalid_argument("Date out of range: " + std::to_string(y) + "-" +
                                std::to_string(m) + "-" + std::to_string(d));
  }
}

Date Date::parse(const std::string& text) {
  auto first = text.find('-');
  auto second = first == std::string::npos ? std::string::npos : text.find('-', first + 1);
  if (second == std::string::npos) {
    throw std::invalid_argument("Invalid date: '" + text + "'");
  }
  int y = parseNumber(text.substr(0, first), "year");
  int m = parseNumber(text.substr(first + 1, second - first - 1), "month");
  int d = parseNumber(text.substr(second + 1), "day");
  return Date(y, m, d);
}

// Sakamoto's method; 0 = Sunday.
Weekday Date::weekday() const {
  static const int kOffsets[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
  int y = month < 3 ? year - 1 : year;
  int dow = (y + y / 4 - y / 100 + y / 400 + kOffsets[month - 1] + day) % 7;
  return dow == 0 ? Weekday::SUNDAY : static_cast<Weekday>(dow - 1);
}

std::string Date::toString() const {
  std::stringstream ss;
  ss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month << "-"
     << std::setw(2) << day;
  return ss.str();
}

}  // namespace railway
