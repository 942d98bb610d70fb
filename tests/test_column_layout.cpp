#include <catch2/catch_all.hpp>

#include "column_layout.hpp"
#include "continuation_tracker.hpp"
#include "schedule_fixtures.hpp"

TEST_CASE("fixed division cuts the page into seven clamped columns", "[layout]") {
  ColumnLayoutResolver layout = ColumnLayoutResolver::fixedDivision(700.0);
  REQUIRE(layout.columnCount() == 7);
  REQUIRE_FALSE(layout.isClustered());
  REQUIRE(layout.slotFor(50.0) == 0);
  REQUIRE(layout.slotFor(150.0) == 1);
  REQUIRE(layout.slotFor(699.0) == 6);
  REQUIRE(layout.slotFor(900.0) == 6);
  REQUIRE(layout.slotFor(-5.0) == 0);
}

TEST_CASE("a page without width has no columns", "[layout]") {
  ColumnLayoutResolver layout = ColumnLayoutResolver::fixedDivision(0.0);
  REQUIRE(layout.columnCount() == 0);
  REQUIRE_FALSE(layout.recognized());
  REQUIRE(layout.slotFor(10.0) == -1);
}

TEST_CASE("clustered centers deduplicate and map to the nearest center", "[layout]") {
  ColumnLayoutResolver layout = ColumnLayoutResolver::clusteredCenters({300.0, 100.0, 102.0, 500.0}, 10.0);
  REQUIRE(layout.isClustered());
  REQUIRE(layout.centers() == std::vector<double>{100.0, 300.0, 500.0});
  REQUIRE(layout.slotFor(190.0) == 0);
  REQUIRE(layout.slotFor(210.0) == 1);
  REQUIRE(layout.slotFor(480.0) == 2);
  REQUIRE(layout.slotFor(5000.0) == 2);
}

TEST_CASE("first-page headers define the column layout", "[layout]") {
  const TargetMonth feb{2026, 2};
  Page page = tablePage(1, {
    dayTable(0, 10.0, "Sun 1 Feb 2026", {}),
    dayTable(1, 10.0, "Mon 2 Feb 2026", {}),
    dayTable(2, 10.0, "Tue 3 Feb 2026", {}),
    tableInColumn(2, 200.0, {flightCells("DX1", "FCO", "A", "PAX", "08:00", "")}),
  });

  ColumnLayoutResolver layout = resolveColumnLayout({page}, ColumnLayoutStrategy::Auto, feb);
  REQUIRE(layout.isClustered());
  REQUIRE(layout.columnCount() == 3);
  REQUIRE(layout.slotFor(page.tables[3].centerX()) == 2);

  ColumnLayoutResolver fixed = resolveColumnLayout({page}, ColumnLayoutStrategy::FixedDivision, feb);
  REQUIRE_FALSE(fixed.isClustered());
  REQUIRE(fixed.columnCount() == 7);
}

TEST_CASE("without first-page headers the layout falls back to fixed division", "[layout]") {
  const TargetMonth feb{2026, 2};
  Page page = tablePage(1, {tableInColumn(3, 10.0, {flightCells("DX1", "FCO", "A", "PAX", "08:00", "")})});

  ColumnLayoutResolver layout = resolveColumnLayout({page}, ColumnLayoutStrategy::Auto, feb);
  REQUIRE_FALSE(layout.isClustered());
  REQUIRE(layout.slotFor(page.tables[0].centerX()) == 3);

  ColumnLayoutResolver forced = resolveColumnLayout({page}, ColumnLayoutStrategy::ClusteredCenters, feb);
  REQUIRE_FALSE(forced.recognized());
}

TEST_CASE("continuation slots start unset and keep the latest header", "[layout]") {
  ContinuationTracker tracker;
  REQUIRE_FALSE(tracker.isBound(0));

  DayHeader mon{CalendarDate{2026, 2, 2}, Weekday::Mon};
  DayHeader nextMon{CalendarDate{2026, 2, 9}, Weekday::Mon};
  REQUIRE(tracker.setHeader(0, mon));
  REQUIRE(tracker.boundHeader(0) == mon);
  REQUIRE_FALSE(tracker.isBound(1));

  REQUIRE(tracker.setHeader(0, nextMon));
  REQUIRE(tracker.boundHeader(0) == nextMon);

  REQUIRE_FALSE(tracker.setHeader(7, mon));
  REQUIRE_FALSE(tracker.setHeader(-1, mon));
  REQUIRE_FALSE(tracker.boundHeader(-1).has_value());
}

TEST_CASE("a later header outside every first-page column switches to fixed division", "[layout]") {
  const TargetMonth feb{2026, 2};
  std::vector<Page> pages = {
    tablePage(1, {dayTable(6, 10.0, "Sun 1 Feb 2026", {})}),
    tablePage(2, {
      dayTable(0, 10.0, "Mon 2 Feb 2026", {}),
      dayTable(1, 10.0, "Tue 3 Feb 2026", {}),
    }),
  };

  ColumnLayoutResolver layout = resolveColumnLayout(pages, ColumnLayoutStrategy::Auto, feb);
  REQUIRE_FALSE(layout.isClustered());
  REQUIRE(layout.slotFor(pages[1].tables[0].centerX()) == 0);
  REQUIRE(layout.slotFor(pages[1].tables[1].centerX()) == 1);

  // forcing clustered keeps the first-page centers only
  ColumnLayoutResolver forced = resolveColumnLayout(pages, ColumnLayoutStrategy::ClusteredCenters, feb);
  REQUIRE(forced.isClustered());
  REQUIRE(forced.columnCount() == 1);
}

TEST_CASE("later headers in first-page columns keep the clustered layout", "[layout]") {
  const TargetMonth feb{2026, 2};
  std::vector<Page> pages = {
    tablePage(1, {dayTable(0, 10.0, "Mon 2 Feb 2026", {}), dayTable(1, 10.0, "Tue 3 Feb 2026", {})}),
    tablePage(2, {dayTable(1, 10.0, "Tue 10 Feb 2026", {})}),
  };

  ColumnLayoutResolver layout = resolveColumnLayout(pages, ColumnLayoutStrategy::Auto, feb);
  REQUIRE(layout.isClustered());
  REQUIRE(layout.columnCount() == 2);
}
