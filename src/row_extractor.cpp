#include "row_extractor.hpp"

#include "day_header.hpp"
#include "text_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <regex>
#include <utility>

namespace {

// Flight, Route, A/D, Type, then optional ETA and ETD.
const std::regex& flightLineRegex() {
  static const std::regex re(
    "^(\\S+)\\s+(\\S+)\\s+(\\S+)\\s+([A-Za-z]+)"
    "(?:\\s+(\\d{1,2}[:.]\\d{2}))?(?:\\s+(\\d{1,2}[:.]\\d{2}))?$");
  return re;
}

std::string cellAt(const std::vector<std::string>& row, size_t i) {
  return i < row.size() ? trim(row[i]) : std::string();
}

// Text lines carry no geometry, so they all share the first slot.
constexpr int kTextSlot = 0;

// Banner, day header or column-title line; consumes it and returns true.
bool consumeNonDataLine(const std::string& line, const TargetMonth& target,
                        ContinuationTracker& tracker, ParseDiagnostics& diag) {
  if (isDateRangeBanner(line)) return true;

  HeaderScan scan = scanDayHeader(line, target);
  if (scan.recognized()) {
    tracker.setHeader(kTextSlot, scan.header);
    diag.headersFound++;
    spdlog::debug("text header {} {}", weekdayName(scan.header.weekday), formatIsoDate(scan.header.date));
    return true;
  }
  if (scan.invalidDate()) diag.invalidCalendarDates++;

  if (isTitleLine(line)) {
    diag.titleRowsSkipped++;
    return true;
  }
  return false;
}

RawRow rowFor(const DayHeader& header) {
  RawRow row;
  row.date = header.date;
  row.weekday = header.weekday;
  return row;
}

} // namespace

bool isTitleRow(const std::vector<std::string>& cells) {
  std::string joined;
  for (const auto& c : cells) joined += c;
  return isTitleLine(joined);
}

bool isTitleLine(const std::string& line) {
  std::string joined;
  for (const auto& tok : splitWhitespace(line)) joined += tok;
  return iequals(joined, "FlightRouteA/DTypeETAETD");
}

StructuredRowExtractor::StructuredRowExtractor(ColumnLayoutResolver layout, const ExtractorSettings& settings)
  : layout_(std::move(layout)), settings_(settings) {}

std::vector<RawRow> StructuredRowExtractor::extractRows(const Page& page,
                                                        ContinuationTracker& tracker,
                                                        ParseDiagnostics& diag) const {
  std::vector<RawRow> rows;

  // top to bottom so a header is always seen before its continuation
  std::vector<size_t> order(page.tables.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return page.tables[a].y0 < page.tables[b].y0;
  });

  for (size_t idx : order) {
    const TableBlock& table = page.tables[idx];
    diag.tablesVisited++;
    if (table.cells.empty()) continue;

    int slot = layout_.slotFor(table.centerX());
    std::string firstCell = table.cells.front().empty() ? std::string() : trim(table.cells.front().front());

    HeaderScan scan = scanDayHeader(firstCell, settings_.target);
    if (scan.invalidDate()) diag.invalidCalendarDates++;

    size_t start = 0;
    if (scan.recognized() && tracker.setHeader(slot, scan.header)) {
      diag.headersFound++;
      spdlog::debug("page {}: header {} {} in column {}", page.number,
                    weekdayName(scan.header.weekday), formatIsoDate(scan.header.date), slot);
      start = 2;  // row 1 holds the column titles
    } else if (scan.invalidDate() || iequals(firstCell, "Flight")) {
      start = 1;
    }

    std::optional<DayHeader> header = tracker.boundHeader(slot);
    if (!header) {
      diag.unattachedBlocks++;
      diag.unattachedRows += table.cells.size() - std::min(start, table.cells.size());
      spdlog::debug("page {}: table at x={:.1f} has no day in column {}, skipped",
                    page.number, table.centerX(), slot);
      continue;
    }

    size_t end = table.cells.size();
    if (end - std::min(start, end) > settings_.maxRowsPerBlock) {
      spdlog::warn("page {}: table truncated to {} rows", page.number, settings_.maxRowsPerBlock);
      end = start + settings_.maxRowsPerBlock;
    }

    for (size_t r = start; r < end; ++r) {
      const auto& cells = table.cells[r];
      if (isTitleRow(cells)) {
        diag.titleRowsSkipped++;
        continue;
      }
      if (cellAt(cells, 0).empty()) {
        diag.rowsRejected++;
        continue;
      }
      RawRow row = rowFor(*header);
      row.flight = cellAt(cells, 0);
      row.route = cellAt(cells, 1);
      row.direction = cellAt(cells, 2);
      row.type = cellAt(cells, 3);
      row.eta = cellAt(cells, 4);
      row.etd = cellAt(cells, 5);
      rows.push_back(std::move(row));
      diag.rowsExtracted++;
    }
  }
  return rows;
}

TokenStreamRowExtractor::TokenStreamRowExtractor(const ExtractorSettings& settings)
  : settings_(settings) {}

std::vector<RawRow> TokenStreamRowExtractor::extractRows(const Page& page,
                                                         ContinuationTracker& tracker,
                                                         ParseDiagnostics& diag) const {
  constexpr size_t kGroup = 5;
  std::vector<RawRow> rows;

  bool capped = false;

  for (const auto& raw : page.lines) {
    std::string line = trim(raw);
    if (line.empty()) continue;
    diag.linesVisited++;
    // headers past the cap still bind, so the next page starts on the right day
    if (consumeNonDataLine(line, settings_.target, tracker, diag)) continue;
    if (capped) continue;

    std::vector<std::string> tokens = splitWhitespace(line);
    if (tokens.size() < kGroup) {
      diag.rowsRejected++;
      continue;
    }

    std::optional<DayHeader> header = tracker.boundHeader(kTextSlot);
    if (!header) {
      diag.unattachedBlocks++;
      diag.unattachedRows += tokens.size() / kGroup;
      continue;
    }

    // several flights may be packed on one line
    size_t i = 0;
    for (; i + kGroup <= tokens.size(); i += kGroup) {
      if (rows.size() >= settings_.maxRowsPerBlock) {
        spdlog::warn("page {}: row cap {} reached", page.number, settings_.maxRowsPerBlock);
        capped = true;
        break;
      }
      RawRow row = rowFor(*header);
      row.flight = tokens[i];
      row.route = tokens[i + 1];
      row.direction = tokens[i + 2];
      row.type = tokens[i + 3];
      if (parseDirection(row.direction) == Direction::Arrival) {
        row.eta = tokens[i + 4];
      } else {
        row.etd = tokens[i + 4];
      }
      rows.push_back(std::move(row));
      diag.rowsExtracted++;
    }
    if (!capped && i < tokens.size()) diag.rowsRejected++;
  }
  return rows;
}

TokenRegexRowExtractor::TokenRegexRowExtractor(const ExtractorSettings& settings)
  : settings_(settings) {}

std::vector<RawRow> TokenRegexRowExtractor::extractRows(const Page& page,
                                                        ContinuationTracker& tracker,
                                                        ParseDiagnostics& diag) const {
  std::vector<RawRow> rows;
  bool capped = false;

  for (const auto& raw : page.lines) {
    std::string line = trim(raw);
    if (line.empty()) continue;
    diag.linesVisited++;
    if (consumeNonDataLine(line, settings_.target, tracker, diag)) continue;
    if (capped) continue;

    std::smatch m;
    if (!std::regex_match(line, m, flightLineRegex())) {
      diag.rowsRejected++;
      continue;
    }

    std::optional<DayHeader> header = tracker.boundHeader(kTextSlot);
    if (!header) {
      diag.unattachedBlocks++;
      diag.unattachedRows++;
      continue;
    }
    if (rows.size() >= settings_.maxRowsPerBlock) {
      spdlog::warn("page {}: row cap {} reached", page.number, settings_.maxRowsPerBlock);
      capped = true;
      continue;
    }

    RawRow row = rowFor(*header);
    row.flight = m[1].str();
    row.route = m[2].str();
    row.direction = m[3].str();
    row.type = m[4].str();
    if (m[5].matched && m[6].matched) {
      row.eta = m[5].str();
      row.etd = m[6].str();
    } else if (m[5].matched) {
      // a lone time belongs to the flight's own direction
      if (parseDirection(row.direction) == Direction::Arrival) {
        row.eta = m[5].str();
      } else {
        row.etd = m[5].str();
      }
    }
    rows.push_back(std::move(row));
    diag.rowsExtracted++;
  }
  return rows;
}

RowStrategy detectRowStrategy(const std::vector<Page>& pages) {
  for (const auto& p : pages) {
    if (!p.tables.empty()) return RowStrategy::Structured;
  }
  for (const auto& p : pages) {
    for (const auto& line : p.lines) {
      std::smatch m;
      std::string s = trim(line);
      if (std::regex_match(s, m, flightLineRegex()) && m[5].matched && m[6].matched) {
        return RowStrategy::TokenRegex;
      }
    }
  }
  return RowStrategy::TokenStream;
}

std::unique_ptr<RowExtractor> makeRowExtractor(RowStrategy strategy,
                                               const std::vector<Page>& pages,
                                               const ExtractorSettings& settings) {
  switch (strategy) {
    case RowStrategy::Structured: {
      return std::make_unique<StructuredRowExtractor>(
        resolveColumnLayout(pages, settings.layout, settings.target), settings);
    }
    case RowStrategy::TokenStream:
      return std::make_unique<TokenStreamRowExtractor>(settings);
    case RowStrategy::TokenRegex:
      return std::make_unique<TokenRegexRowExtractor>(settings);
    case RowStrategy::Auto:
      break;
  }
  return makeRowExtractor(detectRowStrategy(pages), pages, settings);
}

const char* rowStrategyName(RowStrategy s) {
  switch (s) {
    case RowStrategy::Auto: return "auto";
    case RowStrategy::Structured: return "structured";
    case RowStrategy::TokenStream: return "token-stream";
    case RowStrategy::TokenRegex: return "token-regex";
  }
  return "auto";
}
