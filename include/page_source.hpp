#pragma once

#include <string>
#include <vector>

// A table found on a page: bounding box in page points (y grows downwards)
// and the cell grid read out of it, top row first.
struct TableBlock {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;
  std::vector<std::vector<std::string>> cells;

  double centerX() const { return 0.5 * (x0 + x1); }
};

struct Page {
  int number = 0;
  double width = 0.0;
  double height = 0.0;
  std::vector<std::string> lines;   // reading order, trimmed, no blank lines
  std::vector<TableBlock> tables;   // may be empty for text-only sources
};

struct PdfLayoutOptions {
  int firstPage = 1;
  int lastPage = -1;  // -1 processes until the end
  // Horizontal gap, in median word heights, that separates two side-by-side tables.
  double blockGapFactor = 2.0;
  // Horizontal gap, in median word heights, that separates two cells of a row.
  double cellGapFactor = 0.8;
  // Vertical gap, in median word heights, above which a table is closed.
  double rowGapFactor = 1.8;
};

// Runs `pdftotext -bbox-layout` and rebuilds lines and table blocks from word boxes.
// Throws std::runtime_error when pdftotext is missing or fails.
std::vector<Page> loadPdfPages(const std::string& pdfPath, const PdfLayoutOptions& options);

// Parses the XHTML produced by `pdftotext -bbox-layout`.
std::vector<Page> parseBboxLayout(const std::string& xhtml, const PdfLayoutOptions& options);

// Returns the layout-preserving text of the PDF, pages separated by form feeds.
// Throws std::runtime_error on failure.
std::string extractPdfText(const std::string& pdfPath);

// Splits text on form feeds into text-only pages.
std::vector<Page> splitTextPages(const std::string& text);

// Reads a plain text dump from disk. Throws std::runtime_error if it can't be opened.
std::vector<Page> loadTextFilePages(const std::string& path);
