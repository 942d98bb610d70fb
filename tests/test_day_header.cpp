#include <catch2/catch_all.hpp>

#include "day_header.hpp"

namespace {

const TargetMonth kFeb2026{2026, 2};

} // namespace

TEST_CASE("cell headers name the weekday and the date", "[header]") {
  HeaderScan scan = scanCellHeader("Mon 2 Feb 2026", kFeb2026);
  REQUIRE(scan.recognized());
  REQUIRE(scan.header.date == CalendarDate{2026, 2, 2});
  REQUIRE(scan.header.weekday == Weekday::Mon);

  scan = scanCellHeader("  sun 22 FEB 2026 ", kFeb2026);
  REQUIRE(scan.recognized());
  REQUIRE(scan.header.weekday == Weekday::Sun);
  REQUIRE(scan.header.date.day == 22);
}

TEST_CASE("cell headers outside the target month are ignored", "[header]") {
  REQUIRE(scanCellHeader("Tue 3 Mar 2026", kFeb2026).status == HeaderScan::Status::NoMatch);
  REQUIRE(scanCellHeader("Tue 3 Feb 2025", kFeb2026).status == HeaderScan::Status::NoMatch);

  // no target: any month qualifies
  HeaderScan scan = scanCellHeader("Tue 3 Mar 2026", TargetMonth{});
  REQUIRE(scan.recognized());
  REQUIRE(scan.header.date == CalendarDate{2026, 3, 3});
}

TEST_CASE("impossible dates are reported, not recognized", "[header]") {
  HeaderScan scan = scanCellHeader("Mon 30 Feb 2026", kFeb2026);
  REQUIRE_FALSE(scan.recognized());
  REQUIRE(scan.invalidDate());

  REQUIRE(scanTextHeader("30/02/2026", kFeb2026).invalidDate());
  REQUIRE(scanDayHeader("Sat 29 Feb 2026", kFeb2026).invalidDate());
}

TEST_CASE("the explicit weekday token wins over the computed one", "[header]") {
  HeaderScan scan = scanCellHeader("Tue 2 Feb 2026", kFeb2026);
  REQUIRE(scan.recognized());
  REQUIRE(scan.header.weekday == Weekday::Tue);
}

TEST_CASE("free text dates derive the weekday from the date", "[header]") {
  HeaderScan named = scanTextHeader("2 February 2026", kFeb2026);
  REQUIRE(named.recognized());
  REQUIRE(named.header.weekday == Weekday::Mon);

  HeaderScan slash = scanTextHeader("03/02/2026", kFeb2026);
  REQUIRE(slash.recognized());
  REQUIRE(slash.header.date == CalendarDate{2026, 2, 3});
  REQUIRE(slash.header.weekday == Weekday::Tue);

  HeaderScan iso = scanTextHeader("2026-02-04", kFeb2026);
  REQUIRE(iso.recognized());
  REQUIRE(iso.header.weekday == Weekday::Wed);

  HeaderScan prefixed = scanTextHeader("Thursday, 5 Feb 2026", kFeb2026);
  REQUIRE(prefixed.recognized());
  REQUIRE(prefixed.header.weekday == Weekday::Thu);
}

TEST_CASE("lines that are not only a date are not headers", "[header]") {
  REQUIRE(scanDayHeader("DX100 FCO P PAX 07:30", kFeb2026).status == HeaderScan::Status::NoMatch);
  REQUIRE(scanDayHeader("Foo 2 Feb 2026", kFeb2026).status == HeaderScan::Status::NoMatch);
  REQUIRE(scanDayHeader("Flight Route A/D Type ETA ETD", kFeb2026).status == HeaderScan::Status::NoMatch);
  REQUIRE(scanDayHeader("", kFeb2026).status == HeaderScan::Status::NoMatch);
}

TEST_CASE("findFirstDate scans anywhere in the text", "[header]") {
  REQUIRE(findFirstDate("from 01/02/2026 to 28/02/2026") == CalendarDate{2026, 2, 1});
  REQUIRE(findFirstDate("Schedule issued 2026-01-15") == CalendarDate{2026, 1, 15});
  REQUIRE(findFirstDate("valid from 1 March 2026") == CalendarDate{2026, 3, 1});
  // 31/02 does not exist, the next date does
  REQUIRE(findFirstDate("31/02/2026 or 01/03/2026") == CalendarDate{2026, 3, 1});
  REQUIRE_FALSE(findFirstDate("DX100 FCO P PAX 07:30").has_value());
}

TEST_CASE("period banners are recognized", "[header]") {
  REQUIRE(isDateRangeBanner("from 01/02/2026 to 28/02/2026"));
  REQUIRE(isDateRangeBanner("From 1 Feb 2026 To 28 Feb 2026"));
  REQUIRE_FALSE(isDateRangeBanner("from FCO to LIN"));
  REQUIRE_FALSE(isDateRangeBanner("Mon 2 Feb 2026"));
}
