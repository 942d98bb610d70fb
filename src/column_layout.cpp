#include "column_layout.hpp"

#include "day_header.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

ColumnLayoutResolver ColumnLayoutResolver::fixedDivision(double pageWidth) {
  ColumnLayoutResolver r;
  if (pageWidth > 0) r.columnWidth_ = pageWidth / kMaxColumnSlots;
  return r;
}

ColumnLayoutResolver ColumnLayoutResolver::clusteredCenters(std::vector<double> centers, double tolerance) {
  ColumnLayoutResolver r;
  r.clustered_ = true;
  std::sort(centers.begin(), centers.end());
  for (double c : centers) {
    if (!r.centers_.empty() && c - r.centers_.back() <= tolerance) continue;
    r.centers_.push_back(c);
  }
  return r;
}

int ColumnLayoutResolver::slotFor(double centerX) const {
  if (clustered_) {
    if (centers_.empty()) return -1;
    int best = 0;
    double bestDist = std::abs(centerX - centers_[0]);
    for (size_t i = 1; i < centers_.size(); ++i) {
      double d = std::abs(centerX - centers_[i]);
      if (d < bestDist) { bestDist = d; best = static_cast<int>(i); }
    }
    return best;
  }
  if (columnWidth_ <= 0) return -1;
  int idx = static_cast<int>(std::floor(centerX / columnWidth_));
  return std::clamp(idx, 0, kMaxColumnSlots - 1);
}

int ColumnLayoutResolver::columnCount() const {
  if (clustered_) return static_cast<int>(centers_.size());
  return columnWidth_ > 0 ? kMaxColumnSlots : 0;
}

namespace {

bool hasHeaderCell(const TableBlock& t, const TargetMonth& target) {
  if (t.cells.empty() || t.cells.front().empty()) return false;
  return scanDayHeader(t.cells.front().front(), target).recognized();
}

// A later header table farther than `tolerance` from every page-1 center is a column
// page 1 never showed.
const TableBlock* findUnregisteredHeader(const std::vector<Page>& pages,
                                         const std::vector<double>& centers,
                                         double tolerance,
                                         const TargetMonth& target) {
  for (size_t p = 1; p < pages.size(); ++p) {
    for (const auto& t : pages[p].tables) {
      if (!hasHeaderCell(t, target)) continue;
      bool known = std::any_of(centers.begin(), centers.end(), [&](double c) {
        return std::abs(t.centerX() - c) <= tolerance;
      });
      if (!known) return &t;
    }
  }
  return nullptr;
}

} // namespace

ColumnLayoutResolver resolveColumnLayout(const std::vector<Page>& pages,
                                         ColumnLayoutStrategy strategy,
                                         const TargetMonth& target) {
  if (pages.empty()) return ColumnLayoutResolver{};
  const Page& firstPage = pages.front();

  if (strategy == ColumnLayoutStrategy::FixedDivision) {
    return ColumnLayoutResolver::fixedDivision(firstPage.width);
  }

  std::vector<double> headerCenters;
  double minX = 0.0, maxX = 0.0;
  for (const auto& t : firstPage.tables) {
    if (headerCenters.empty()) { minX = t.x0; maxX = t.x1; }
    minX = std::min(minX, t.x0);
    maxX = std::max(maxX, t.x1);
    if (hasHeaderCell(t, target)) headerCenters.push_back(t.centerX());
  }

  double span = firstPage.width > 0 ? firstPage.width : maxX - minX;
  double tolerance = span > 0 ? span / (4.0 * kMaxColumnSlots) : 1.0;
  ColumnLayoutResolver clustered = ColumnLayoutResolver::clusteredCenters(headerCenters, tolerance);

  if (strategy == ColumnLayoutStrategy::ClusteredCenters) {
    spdlog::debug("resolveColumnLayout: clustered layout with {} column(s)", clustered.columnCount());
    return clustered;
  }

  if (clustered.columnCount() > kMaxColumnSlots) {
    spdlog::warn("resolveColumnLayout: {} header columns exceed {}, using fixed division",
                 clustered.columnCount(), kMaxColumnSlots);
    return ColumnLayoutResolver::fixedDivision(firstPage.width);
  }
  if (!clustered.recognized()) {
    return ColumnLayoutResolver::fixedDivision(firstPage.width);
  }
  if (const TableBlock* stray = findUnregisteredHeader(pages, clustered.centers(), tolerance, target)) {
    spdlog::info("resolveColumnLayout: header at x={:.1f} matches no page {} column, using fixed division",
                 stray->centerX(), firstPage.number);
    return ColumnLayoutResolver::fixedDivision(firstPage.width);
  }
  spdlog::debug("resolveColumnLayout: {} header column(s) on page {}", clustered.columnCount(), firstPage.number);
  return clustered;
}
