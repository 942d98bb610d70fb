#include "calendar.hpp"

#include "text_util.hpp"

#include <cstdio>
#include <regex>

namespace {

struct DateName {
  const char* abbrev;
  const char* full;
};

const DateName kWeekdayNames[] = {
  {"Mon", "Monday"}, {"Tue", "Tuesday"}, {"Wed", "Wednesday"}, {"Thu", "Thursday"},
  {"Fri", "Friday"}, {"Sat", "Saturday"}, {"Sun", "Sunday"},
};

const DateName kMonthNames[] = {
  {"Jan", "January"}, {"Feb", "February"}, {"Mar", "March"}, {"Apr", "April"},
  {"May", "May"}, {"Jun", "June"}, {"Jul", "July"}, {"Aug", "August"},
  {"Sep", "September"}, {"Oct", "October"}, {"Nov", "November"}, {"Dec", "December"},
};

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

} // namespace

int daysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

bool isValidDate(int year, int month, int day) {
  return year >= 1 && month >= 1 && month <= 12 && day >= 1 && day <= daysInMonth(year, month);
}

Weekday weekdayOf(const CalendarDate& d) {
  // Sakamoto's method; 0 = Sunday.
  static const int t[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
  int y = d.month < 3 ? d.year - 1 : d.year;
  int dow = (y + y / 4 - y / 100 + y / 400 + t[d.month - 1] + d.day) % 7;
  return static_cast<Weekday>((dow + 6) % 7);
}

std::optional<Weekday> parseWeekday(const std::string& token) {
  std::string t = trim(token);
  for (int i = 0; i < 7; ++i) {
    if (iequals(t, kWeekdayNames[i].abbrev) || iequals(t, kWeekdayNames[i].full)) {
      return static_cast<Weekday>(i);
    }
  }
  // Common 4-letter forms ("Tues", "Thur")
  if (iequals(t, "tues")) return Weekday::Tue;
  if (iequals(t, "thur") || iequals(t, "thurs")) return Weekday::Thu;
  return std::nullopt;
}

const char* weekdayName(Weekday w) {
  return kWeekdayNames[static_cast<int>(w)].abbrev;
}

std::optional<int> parseMonthName(const std::string& token) {
  std::string t = trim(token);
  if (!t.empty() && t.back() == '.') t.pop_back();
  for (int i = 0; i < 12; ++i) {
    if (iequals(t, kMonthNames[i].abbrev) || iequals(t, kMonthNames[i].full)) {
      return i + 1;
    }
  }
  if (iequals(t, "sept")) return 9;
  return std::nullopt;
}

const char* monthAbbrev(int month) {
  if (month < 1 || month > 12) return "";
  return kMonthNames[month - 1].abbrev;
}

std::string formatIsoDate(const CalendarDate& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return buf;
}

std::string formatDateLabel(const CalendarDate& d, DateDisplayFormat format) {
  char buf[16];
  if (format == DateDisplayFormat::DayMonthAbbrev) {
    std::snprintf(buf, sizeof(buf), "%02d %s", d.day, monthAbbrev(d.month));
  } else {
    std::snprintf(buf, sizeof(buf), "%02d-%02d", d.day, d.month);
  }
  return buf;
}

std::optional<CalendarDate> parseDateLabel(const std::string& label, int year) {
  static const std::regex numeric("^(\\d{1,2})-(\\d{1,2})$");
  static const std::regex abbrev("^(\\d{1,2})\\s+([A-Za-z]{3,9})$");

  std::string s = trim(label);
  std::smatch m;
  CalendarDate d;
  d.year = year;
  if (std::regex_match(s, m, numeric)) {
    d.day = std::stoi(m[1].str());
    d.month = std::stoi(m[2].str());
  } else if (std::regex_match(s, m, abbrev)) {
    auto month = parseMonthName(m[2].str());
    if (!month) return std::nullopt;
    d.day = std::stoi(m[1].str());
    d.month = *month;
  } else {
    return std::nullopt;
  }
  if (!isValidDate(d.year, d.month, d.day)) return std::nullopt;
  return d;
}

std::vector<CalendarDate> datesOfWeekday(int year, int month, Weekday w) {
  std::vector<CalendarDate> dates;
  int n = daysInMonth(year, month);
  for (int day = 1; day <= n; ++day) {
    CalendarDate d{year, month, day};
    if (weekdayOf(d) == w) dates.push_back(d);
  }
  return dates;
}
