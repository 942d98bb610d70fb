#include "page_source.hpp"
#include "pdftotext.hpp"
#include "text_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

struct WordBox {
  double xMin;
  double yMin;
  double xMax;
  double yMax;
  std::string text;

  double xCenter() const { return (xMin + xMax) * 0.5; }
  double yCenter() const { return (yMin + yMax) * 0.5; }
};

struct PageWords {
  double width = 0.0;
  double height = 0.0;
  std::vector<WordBox> words;
};

// Horizontal run of words inside one visual row.
struct Segment {
  double xMin;
  double xMax;
  double yMin;
  double yMax;
  std::vector<const WordBox*> words;
};

struct Block {
  double xMin;
  double xMax;
  double yMin;
  double yMax;
  size_t lastRow;
  std::vector<Segment> rows;
};

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          char* endp = nullptr;
          unsigned long code = std::strtoul(ent.c_str() + (hex ? 2 : 1), &endp, hex ? 16 : 10);
          if (endp && *endp == '\0' && code > 0 && code <= 0x7F) rep.push_back(static_cast<char>(code));
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

double attrValue(const std::string& attrs, const char* name) {
  std::string key = std::string(name) + "=\"";
  size_t pos = attrs.find(key);
  if (pos == std::string::npos) return 0.0;
  return std::strtod(attrs.c_str() + pos + key.size(), nullptr);
}

std::vector<PageWords> parseWords(const std::string& xhtml) {
  std::vector<PageWords> pages;
  std::regex tagRe("<page\\b([^>]*)>|<word\\b([^>]*)>([^<]*)</word>");

  std::sregex_iterator it(xhtml.begin(), xhtml.end(), tagRe);
  std::sregex_iterator end;
  for (; it != end; ++it) {
    const std::smatch& m = *it;
    if (m[1].matched) {
      PageWords p;
      p.width = attrValue(m[1].str(), "width");
      p.height = attrValue(m[1].str(), "height");
      pages.push_back(std::move(p));
      continue;
    }
    // Words outside any <page> get an implicit first page
    if (pages.empty()) pages.emplace_back();
    std::string attrs = m[2].str();
    WordBox w;
    w.xMin = attrValue(attrs, "xMin");
    w.yMin = attrValue(attrs, "yMin");
    w.xMax = attrValue(attrs, "xMax");
    w.yMax = attrValue(attrs, "yMax");
    w.text = decodeEntities(trim(m[3].str()));
    if (!w.text.empty()) pages.back().words.push_back(std::move(w));
  }
  return pages;
}

double median(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::nth_element(v.begin(), v.begin() + v.size()/2, v.end());
  return v[v.size()/2];
}

std::vector<std::vector<const WordBox*>> clusterRows(const std::vector<WordBox>& words, double hMed) {
  std::vector<std::vector<const WordBox*>> rows;
  if (words.empty()) return rows;

  double tol = hMed > 0 ? hMed * 0.5 : 3.0;

  std::vector<const WordBox*> sorted;
  sorted.reserve(words.size());
  for (const auto& w : words) sorted.push_back(&w);
  std::stable_sort(sorted.begin(), sorted.end(), [](const WordBox* a, const WordBox* b) {
    if (a->yCenter() == b->yCenter()) return a->xMin < b->xMin;
    return a->yCenter() < b->yCenter(); // top to bottom
  });

  double rowCenter = 0.0;
  for (const WordBox* w : sorted) {
    double yc = w->yCenter();
    if (rows.empty() || std::abs(yc - rowCenter) > tol) {
      rows.emplace_back();
      rowCenter = yc;
    }
    rows.back().push_back(w);
    // running average of the row's vertical center
    rowCenter = (rowCenter * (rows.back().size() - 1) + yc) / rows.back().size();
  }

  for (auto& r : rows) {
    std::sort(r.begin(), r.end(), [](const WordBox* a, const WordBox* b){ return a->xMin < b->xMin; });
  }
  return rows;
}

// Cuts a row (words sorted by x) wherever the gap to the previous word exceeds maxGap.
std::vector<Segment> splitRow(const std::vector<const WordBox*>& row, double maxGap) {
  std::vector<Segment> segments;
  for (const WordBox* w : row) {
    if (segments.empty() || w->xMin - segments.back().xMax > maxGap) {
      segments.push_back(Segment{w->xMin, w->xMax, w->yMin, w->yMax, {}});
    }
    Segment& s = segments.back();
    s.words.push_back(w);
    s.xMax = std::max(s.xMax, w->xMax);
    s.yMin = std::min(s.yMin, w->yMin);
    s.yMax = std::max(s.yMax, w->yMax);
  }
  return segments;
}

std::string joinWords(const std::vector<const WordBox*>& words) {
  std::string text;
  for (const WordBox* w : words) {
    if (!text.empty()) text += ' ';
    text += w->text;
  }
  return text;
}

std::vector<Block> groupBlocks(const std::vector<std::vector<const WordBox*>>& rows,
                               double blockGap, double rowGap) {
  std::vector<Block> blocks;
  for (size_t r = 0; r < rows.size(); ++r) {
    for (Segment& seg : splitRow(rows[r], blockGap)) {
      Block* target = nullptr;
      for (auto& b : blocks) {
        bool overlaps = seg.xMin < b.xMax && seg.xMax > b.xMin;
        bool adjacent = seg.yMin - b.yMax <= rowGap;
        if (overlaps && adjacent) { target = &b; break; }
      }
      if (!target) {
        blocks.push_back(Block{seg.xMin, seg.xMax, seg.yMin, seg.yMax, r, {}});
        blocks.back().rows.push_back(std::move(seg));
        continue;
      }
      if (target->lastRow == r && !target->rows.empty()) {
        // second segment of the same row landing in one block: widen that row
        Segment& last = target->rows.back();
        last.words.insert(last.words.end(), seg.words.begin(), seg.words.end());
        std::sort(last.words.begin(), last.words.end(),
                  [](const WordBox* a, const WordBox* b){ return a->xMin < b->xMin; });
        last.xMin = std::min(last.xMin, seg.xMin);
        last.xMax = std::max(last.xMax, seg.xMax);
      } else {
        target->rows.push_back(seg);
        target->lastRow = r;
      }
      target->xMin = std::min(target->xMin, seg.xMin);
      target->xMax = std::max(target->xMax, seg.xMax);
      target->yMin = std::min(target->yMin, seg.yMin);
      target->yMax = std::max(target->yMax, seg.yMax);
    }
  }
  return blocks;
}

std::vector<double> clusterColumns(const std::vector<std::vector<Segment>>& rowCells, double tol) {
  std::vector<double> centers;
  for (const auto& cells : rowCells) {
    if (cells.size() < 2) continue;
    for (const auto& c : cells) centers.push_back((c.xMin + c.xMax) * 0.5);
  }
  if (centers.empty()) return {};
  std::sort(centers.begin(), centers.end());
  std::vector<double> colCenters;
  double acc = centers.front();
  int count = 1;
  for (size_t i = 1; i < centers.size(); ++i) {
    if (centers[i] - centers[i-1] <= tol) {
      acc += centers[i]; count++;
    } else {
      colCenters.push_back(acc / count);
      acc = centers[i]; count = 1;
    }
  }
  colCenters.push_back(acc / count);
  return colCenters;
}

TableBlock buildTable(const Block& block, double cellGap, double columnTol) {
  std::vector<std::vector<Segment>> rowCells;
  rowCells.reserve(block.rows.size());
  for (const auto& row : block.rows) rowCells.push_back(splitRow(row.words, cellGap));

  std::vector<double> colCenters = clusterColumns(rowCells, columnTol);
  const size_t numCols = std::max<size_t>(colCenters.size(), 1);

  TableBlock table;
  table.x0 = block.xMin;
  table.y0 = block.yMin;
  table.x1 = block.xMax;
  table.y1 = block.yMax;
  for (const auto& cells : rowCells) {
    std::vector<std::string> row(numCols);
    if (cells.size() == 1 || colCenters.empty()) {
      // a lone cell is a heading or a flight code: it belongs in the first column
      for (const auto& c : cells) {
        if (!row[0].empty()) row[0] += ' ';
        row[0] += joinWords(c.words);
      }
    } else {
      for (const auto& c : cells) {
        double xc = (c.xMin + c.xMax) * 0.5;
        size_t bestIdx = 0;
        double bestDist = std::abs(xc - colCenters[0]);
        for (size_t k = 1; k < numCols; ++k) {
          double d = std::abs(xc - colCenters[k]);
          if (d < bestDist) { bestDist = d; bestIdx = k; }
        }
        if (!row[bestIdx].empty()) row[bestIdx] += ' ';
        row[bestIdx] += joinWords(c.words);
      }
    }
    table.cells.push_back(std::move(row));
  }
  return table;
}

} // namespace

std::vector<Page> parseBboxLayout(const std::string& xhtml, const PdfLayoutOptions& options) {
  std::vector<PageWords> pageWords = parseWords(xhtml);

  std::vector<Page> pages;
  pages.reserve(pageWords.size());
  for (size_t p = 0; p < pageWords.size(); ++p) {
    const PageWords& pw = pageWords[p];
    Page page;
    page.number = (options.firstPage > 0 ? options.firstPage : 1) + static_cast<int>(p);
    page.width = pw.width;
    page.height = pw.height;

    std::vector<double> heights;
    heights.reserve(pw.words.size());
    for (const auto& w : pw.words) heights.push_back(w.yMax - w.yMin);
    double hMed = median(heights);
    if (hMed <= 0) hMed = 8.0;

    auto rows = clusterRows(pw.words, hMed);
    for (const auto& r : rows) page.lines.push_back(joinWords(r));

    std::vector<Block> blocks = groupBlocks(rows, options.blockGapFactor * hMed, options.rowGapFactor * hMed);
    for (const auto& b : blocks) {
      page.tables.push_back(buildTable(b, options.cellGapFactor * hMed, hMed));
    }

    spdlog::debug("parseBboxLayout: page {} has {} word(s), {} line(s), {} table block(s)",
                  page.number, pw.words.size(), page.lines.size(), page.tables.size());
    pages.push_back(std::move(page));
  }
  return pages;
}

std::vector<Page> loadPdfPages(const std::string& pdfPath, const PdfLayoutOptions& options) {
  std::string flags = "-bbox-layout";
  if (options.firstPage > 0) {
    flags += " -f " + std::to_string(options.firstPage);
  }
  if (options.lastPage > 0) {
    flags += " -l " + std::to_string(options.lastPage);
  }
  return parseBboxLayout(runPdftotext(flags, pdfPath), options);
}
