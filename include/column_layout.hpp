#pragma once

#include "calendar.hpp"
#include "page_source.hpp"

#include <vector>

constexpr int kMaxColumnSlots = 7;

enum class ColumnLayoutStrategy {
  Auto,              // clustered page-1 header centers when they cover every header, fixed division otherwise
  FixedDivision,
  ClusteredCenters,
};

// Maps the horizontal center of a table to one of up to seven weekday column slots.
class ColumnLayoutResolver {
 public:
  ColumnLayoutResolver() = default;

  // slot = clamp(floor(x / (pageWidth / 7)), 0, 6). A non-positive width yields no columns.
  static ColumnLayoutResolver fixedDivision(double pageWidth);

  // Centers closer than `tolerance` are merged; each table then maps to the nearest center.
  static ColumnLayoutResolver clusteredCenters(std::vector<double> centers, double tolerance);

  // Slot in [0, columnCount()), or -1 when no columns are known.
  int slotFor(double centerX) const;

  int columnCount() const;
  bool recognized() const { return columnCount() > 0; }
  bool isClustered() const { return clustered_; }
  const std::vector<double>& centers() const { return centers_; }

 private:
  bool clustered_ = false;
  double columnWidth_ = 0.0;
  std::vector<double> centers_;
};

// Picks the layout from the first page: headers found in page-1 table first cells define
// the column centers; otherwise the page is cut into seven equal columns. Auto also falls
// back to the seven equal columns when a header on a later page sits in no page-1 column.
ColumnLayoutResolver resolveColumnLayout(const std::vector<Page>& pages,
                                         ColumnLayoutStrategy strategy,
                                         const TargetMonth& target);
