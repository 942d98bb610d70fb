#include <catch2/catch_all.hpp>

#include "calendar.hpp"

TEST_CASE("weekdayOf follows the Gregorian calendar", "[calendar]") {
  REQUIRE(weekdayOf(CalendarDate{2026, 2, 2}) == Weekday::Mon);
  REQUIRE(weekdayOf(CalendarDate{2026, 2, 1}) == Weekday::Sun);
  REQUIRE(weekdayOf(CalendarDate{2026, 2, 28}) == Weekday::Sat);
  REQUIRE(weekdayOf(CalendarDate{2024, 2, 29}) == Weekday::Thu);
  REQUIRE(weekdayOf(CalendarDate{2000, 1, 1}) == Weekday::Sat);
}

TEST_CASE("isValidDate rejects impossible days", "[calendar]") {
  REQUIRE(isValidDate(2024, 2, 29));
  REQUIRE_FALSE(isValidDate(2026, 2, 29));
  REQUIRE_FALSE(isValidDate(2026, 2, 30));
  REQUIRE_FALSE(isValidDate(2026, 4, 31));
  REQUIRE_FALSE(isValidDate(2026, 13, 1));
  REQUIRE_FALSE(isValidDate(2026, 1, 0));
  REQUIRE(daysInMonth(1900, 2) == 28);
  REQUIRE(daysInMonth(2000, 2) == 29);
}

TEST_CASE("weekday and month names parse in any case", "[calendar]") {
  REQUIRE(parseWeekday("monday") == Weekday::Mon);
  REQUIRE(parseWeekday("TUE") == Weekday::Tue);
  REQUIRE(parseWeekday("Thurs") == Weekday::Thu);
  REQUIRE_FALSE(parseWeekday("Mo").has_value());
  REQUIRE_FALSE(parseWeekday("xyz").has_value());

  REQUIRE(parseMonthName("February") == 2);
  REQUIRE(parseMonthName("feb") == 2);
  REQUIRE(parseMonthName("Sept") == 9);
  REQUIRE_FALSE(parseMonthName("Febr").has_value());

  REQUIRE(std::string(weekdayName(Weekday::Sun)) == "Sun");
  REQUIRE(std::string(monthAbbrev(12)) == "Dec");
}

TEST_CASE("date labels format and parse back", "[calendar]") {
  CalendarDate d{2026, 2, 2};
  REQUIRE(formatIsoDate(d) == "2026-02-02");
  REQUIRE(formatDateLabel(d, DateDisplayFormat::DayMonthNumeric) == "02-02");
  REQUIRE(formatDateLabel(d, DateDisplayFormat::DayMonthAbbrev) == "02 Feb");

  REQUIRE(parseDateLabel("09-02", 2026) == CalendarDate{2026, 2, 9});
  REQUIRE(parseDateLabel("09 Feb", 2026) == CalendarDate{2026, 2, 9});
  REQUIRE_FALSE(parseDateLabel("31-02", 2026).has_value());
  REQUIRE_FALSE(parseDateLabel("Flight", 2026).has_value());
}

TEST_CASE("datesOfWeekday lists every matching day of the month", "[calendar]") {
  auto mondays = datesOfWeekday(2026, 2, Weekday::Mon);
  REQUIRE(mondays.size() == 4);
  REQUIRE(mondays.front() == CalendarDate{2026, 2, 2});
  REQUIRE(mondays.back() == CalendarDate{2026, 2, 23});

  auto sundays = datesOfWeekday(2026, 3, Weekday::Sun);
  REQUIRE(sundays.size() == 5);
  REQUIRE(sundays.front() == CalendarDate{2026, 3, 1});
}
