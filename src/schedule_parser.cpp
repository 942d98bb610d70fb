#include "schedule_parser.hpp"

#include "day_header.hpp"
#include "record_normalizer.hpp"
#include "text_util.hpp"

#include <spdlog/spdlog.h>

#include <iterator>
#include <memory>
#include <optional>

namespace {

TargetMonth monthOf(const CalendarDate& d) { return TargetMonth{d.year, d.month}; }

// First "Mon 2 Feb 2026" style header in the document, tables before lines on each page.
std::optional<CalendarDate> firstCellHeaderDate(const std::vector<Page>& pages) {
  for (const auto& page : pages) {
    for (const auto& table : page.tables) {
      if (table.cells.empty() || table.cells.front().empty()) continue;
      HeaderScan scan = scanCellHeader(trim(table.cells.front().front()), TargetMonth{});
      if (scan.recognized()) return scan.header.date;
    }
    for (const auto& line : page.lines) {
      HeaderScan scan = scanCellHeader(trim(line), TargetMonth{});
      if (scan.recognized()) return scan.header.date;
    }
  }
  return std::nullopt;
}

} // namespace

TargetMonth inferTargetMonth(const std::vector<Page>& pages) {
  // print stamps and period banners may fall outside the scheduled month
  if (auto d = firstCellHeaderDate(pages)) return monthOf(*d);

  for (const auto& page : pages) {
    for (const auto& line : page.lines) {
      if (auto d = findFirstDate(line)) return monthOf(*d);
    }
    for (const auto& table : page.tables) {
      if (table.cells.empty() || table.cells.front().empty()) continue;
      if (auto d = findFirstDate(table.cells.front().front())) return monthOf(*d);
    }
  }
  return TargetMonth{};
}

ParseResult parseFlightSchedule(const std::vector<Page>& pages, const ParseOptions& options) {
  ParseResult result;
  ParseDiagnostics& diag = result.diagnostics;

  result.target = options.target.isSet() ? options.target : inferTargetMonth(pages);
  if (result.target.isSet()) {
    spdlog::debug("parseFlightSchedule: target month {}-{:02d}", result.target.year, result.target.month);
  }

  ExtractorSettings settings;
  settings.target = result.target;
  settings.layout = options.layout;
  settings.maxRowsPerBlock = options.maxRowsPerBlock;

  result.strategy = options.strategy == RowStrategy::Auto ? detectRowStrategy(pages) : options.strategy;
  std::unique_ptr<RowExtractor> extractor = makeRowExtractor(result.strategy, pages, settings);

  if (auto* structured = dynamic_cast<StructuredRowExtractor*>(extractor.get())) {
    if (!structured->layout().recognized()) {
      diag.layoutRecognized = false;
      spdlog::info("parseFlightSchedule: no column layout recognized on the first page");
      return result;
    }
  }

  ContinuationTracker tracker;
  std::vector<RawRow> rows;
  for (const auto& page : pages) {
    if (diag.pagesVisited >= options.maxPages) {
      diag.pagesSkipped++;
      continue;
    }
    diag.pagesVisited++;
    std::vector<RawRow> pageRows = extractor->extractRows(page, tracker, diag);
    rows.insert(rows.end(), std::make_move_iterator(pageRows.begin()), std::make_move_iterator(pageRows.end()));
  }
  if (diag.pagesSkipped > 0) {
    spdlog::warn("parseFlightSchedule: page cap {} reached, {} page(s) skipped", options.maxPages, diag.pagesSkipped);
  }

  result.records = normalizeRows(rows, diag);

  if (!diag.structureRecognized()) {
    spdlog::info("parseFlightSchedule: no day headers found in {} page(s)", diag.pagesVisited);
  }
  spdlog::debug("parseFlightSchedule: {} strategy, {} header(s), {} row(s), {} rejected, "
                "{} unattached block(s), {} non-PAX, {} record(s)",
                rowStrategyName(result.strategy), diag.headersFound, diag.rowsExtracted,
                diag.rowsRejected, diag.unattachedBlocks, diag.nonPaxDropped, diag.recordsKept);
  return result;
}
