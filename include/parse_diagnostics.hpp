#pragma once

#include <cstddef>

// Skip counters gathered during one traversal. None of these conditions is an error.
struct ParseDiagnostics {
  size_t pagesVisited = 0;
  size_t pagesSkipped = 0;           // beyond the page cap
  size_t tablesVisited = 0;
  size_t linesVisited = 0;
  size_t headersFound = 0;
  size_t invalidCalendarDates = 0;
  size_t titleRowsSkipped = 0;
  size_t rowsExtracted = 0;
  size_t rowsRejected = 0;
  size_t unattachedBlocks = 0;       // blocks/lines seen before their slot had a header
  size_t unattachedRows = 0;
  size_t nonPaxDropped = 0;
  size_t recordsKept = 0;
  bool layoutRecognized = true;

  // False means no day header was found anywhere in the document.
  bool structureRecognized() const { return layoutRecognized && headersFound > 0; }
};
