#pragma once

#include "calendar.hpp"
#include "column_layout.hpp"
#include "flight_record.hpp"
#include "page_source.hpp"
#include "parse_diagnostics.hpp"
#include "row_extractor.hpp"

#include <vector>

struct ParseOptions {
  // Unset fields are inferred from the first date printed in the document.
  TargetMonth target;
  RowStrategy strategy = RowStrategy::Auto;
  ColumnLayoutStrategy layout = ColumnLayoutStrategy::Auto;
  size_t maxPages = 366;
  size_t maxRowsPerBlock = 5000;
};

struct ParseResult {
  std::vector<FlightRecord> records;  // PAX only, document order
  ParseDiagnostics diagnostics;
  TargetMonth target;                 // month actually used
  RowStrategy strategy = RowStrategy::Auto;  // extractor actually used
};

// Walks the pages once, in order, and returns every PAX flight attributed to its day.
// A pure function of its inputs: it never throws on malformed content.
ParseResult parseFlightSchedule(const std::vector<Page>& pages, const ParseOptions& options);

// Month of the first cell-form day header ("Mon 2 Feb 2026"). Without one, the month of the
// first date printed in the document (lines, then first table cells).
TargetMonth inferTargetMonth(const std::vector<Page>& pages);
