#pragma once

#include "column_layout.hpp"
#include "continuation_tracker.hpp"
#include "flight_record.hpp"
#include "page_source.hpp"
#include "parse_diagnostics.hpp"

#include <memory>
#include <string>
#include <vector>

enum class RowStrategy {
  Auto,
  Structured,   // table grids
  TokenStream,  // whitespace tokens sliced into 5-token groups
  TokenRegex,   // one flight per line, both times allowed
};

struct ExtractorSettings {
  TargetMonth target;
  ColumnLayoutStrategy layout = ColumnLayoutStrategy::Auto;
  size_t maxRowsPerBlock = 5000;
};

// Turns one page into flight rows attributed to a day. The tracker carries the
// day each column slot is in from one page to the next.
class RowExtractor {
 public:
  virtual ~RowExtractor() = default;

  virtual std::vector<RawRow> extractRows(const Page& page,
                                          ContinuationTracker& tracker,
                                          ParseDiagnostics& diag) const = 0;
  virtual RowStrategy strategy() const = 0;
};

class StructuredRowExtractor : public RowExtractor {
 public:
  StructuredRowExtractor(ColumnLayoutResolver layout, const ExtractorSettings& settings);

  std::vector<RawRow> extractRows(const Page& page,
                                  ContinuationTracker& tracker,
                                  ParseDiagnostics& diag) const override;
  RowStrategy strategy() const override { return RowStrategy::Structured; }

  const ColumnLayoutResolver& layout() const { return layout_; }

 private:
  ColumnLayoutResolver layout_;
  ExtractorSettings settings_;
};

class TokenStreamRowExtractor : public RowExtractor {
 public:
  explicit TokenStreamRowExtractor(const ExtractorSettings& settings);

  std::vector<RawRow> extractRows(const Page& page,
                                  ContinuationTracker& tracker,
                                  ParseDiagnostics& diag) const override;
  RowStrategy strategy() const override { return RowStrategy::TokenStream; }

 private:
  ExtractorSettings settings_;
};

class TokenRegexRowExtractor : public RowExtractor {
 public:
  explicit TokenRegexRowExtractor(const ExtractorSettings& settings);

  std::vector<RawRow> extractRows(const Page& page,
                                  ContinuationTracker& tracker,
                                  ParseDiagnostics& diag) const override;
  RowStrategy strategy() const override { return RowStrategy::TokenRegex; }

 private:
  ExtractorSettings settings_;
};

// "Flight Route A/D Type ETA ETD" repeated at the top of a table or line.
bool isTitleRow(const std::vector<std::string>& cells);
bool isTitleLine(const std::string& line);

// Any table block means Structured; otherwise a line carrying both times means
// TokenRegex; otherwise TokenStream.
RowStrategy detectRowStrategy(const std::vector<Page>& pages);

// `strategy` must not be Auto. Structured resolves its column layout from the first page.
std::unique_ptr<RowExtractor> makeRowExtractor(RowStrategy strategy,
                                               const std::vector<Page>& pages,
                                               const ExtractorSettings& settings);

const char* rowStrategyName(RowStrategy s);
