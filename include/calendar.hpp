#pragma once

#include <array>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

enum class Weekday { Mon = 0, Tue, Wed, Thu, Fri, Sat, Sun };

constexpr std::array<Weekday, 7> kAllWeekdays = {
  Weekday::Mon, Weekday::Tue, Weekday::Wed, Weekday::Thu,
  Weekday::Fri, Weekday::Sat, Weekday::Sun,
};

struct CalendarDate {
  int year = 0;
  int month = 0;
  int day = 0;
};

inline bool operator==(const CalendarDate& a, const CalendarDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CalendarDate& a, const CalendarDate& b) { return !(a == b); }
inline bool operator<(const CalendarDate& a, const CalendarDate& b) {
  return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

// Year/month a document covers. Zero fields mean "any".
struct TargetMonth {
  int year = 0;
  int month = 0;

  bool isSet() const { return year > 0 && month >= 1 && month <= 12; }
  bool contains(const CalendarDate& d) const {
    return !isSet() || (d.year == year && d.month == month);
  }
};

enum class DateDisplayFormat {
  DayMonthNumeric,  // "02-02"
  DayMonthAbbrev,   // "02 Feb"
};

int daysInMonth(int year, int month);
bool isValidDate(int year, int month, int day);
Weekday weekdayOf(const CalendarDate& d);

// Accepts short ("Mon") and full ("Monday") English names, any case.
std::optional<Weekday> parseWeekday(const std::string& token);
const char* weekdayName(Weekday w);

// Accepts 3-letter ("Feb") and full ("February") English names, any case. Returns 1..12.
std::optional<int> parseMonthName(const std::string& token);
const char* monthAbbrev(int month);

// "2026-02-02"
std::string formatIsoDate(const CalendarDate& d);
std::string formatDateLabel(const CalendarDate& d, DateDisplayFormat format);

// Inverse of formatDateLabel for either format; the label carries no year.
std::optional<CalendarDate> parseDateLabel(const std::string& label, int year);

// Every date of the month falling on the given weekday, ascending.
std::vector<CalendarDate> datesOfWeekday(int year, int month, Weekday w);
