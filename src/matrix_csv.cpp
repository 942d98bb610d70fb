#include "matrix_csv.hpp"

#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <stdexcept>

namespace {

const char* const kKeyHeaders[] = {"Flight", "Route", "AD"};

} // namespace

std::string escapeCsvField(const std::string& field) {
  bool needQuotes = field.find_first_of(",\"\r\n") != std::string::npos;
  if (!needQuotes) return field;
  std::string escaped = "\"";
  for (char ch : field) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

void writeCsvRow(std::ostream& os, const std::vector<std::string>& row) {
  for (size_t i = 0; i < row.size(); ++i) {
    os << escapeCsvField(row[i]);
    if (i + 1 < row.size()) os << ',';
  }
  os << "\n";
}

std::vector<std::vector<std::string>> readCsvRows(std::istream& is) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool inQuotes = false;
  bool rowStarted = false;

  char ch;
  while (is.get(ch)) {
    rowStarted = true;
    if (inQuotes) {
      if (ch == '"') {
        if (is.peek() == '"') {
          is.get(ch);
          field += '"';
        } else {
          inQuotes = false;
        }
      } else {
        field += ch;
      }
      continue;
    }
    if (ch == '"') {
      inQuotes = true;
    } else if (ch == ',') {
      row.push_back(std::move(field));
      field.clear();
    } else if (ch == '\r' || ch == '\n') {
      if (ch == '\r' && is.peek() == '\n') is.get(ch);
      row.push_back(std::move(field));
      field.clear();
      rows.push_back(std::move(row));
      row.clear();
      rowStarted = false;
    } else {
      field += ch;
    }
  }
  if (rowStarted) {
    row.push_back(std::move(field));
    rows.push_back(std::move(row));
  }
  return rows;
}

void writeMatrixCsv(const FlightMatrix& matrix, std::ostream& os) {
  std::vector<std::string> header(std::begin(kKeyHeaders), std::end(kKeyHeaders));
  for (const auto& col : matrix.columns) header.push_back(col.label);
  writeCsvRow(os, header);

  for (const auto& r : matrix.rows) {
    std::vector<std::string> fields = {r.flight, r.route, directionCode(r.direction)};
    for (const auto& cell : r.cells) fields.push_back(cell.value_or(""));
    writeCsvRow(os, fields);
  }
}

void writeMatrixCsvFile(const FlightMatrix& matrix, const std::string& path) {
  std::ofstream ofs(path, std::ios::binary);
  if (!ofs) {
    throw std::runtime_error("Failed to open '" + path + "' for writing");
  }
  writeMatrixCsv(matrix, ofs);
  if (!ofs) {
    throw std::runtime_error("Failed to write '" + path + "'");
  }
}

FlightMatrix readMatrixCsv(std::istream& is, int year, DateDisplayFormat format) {
  std::vector<std::vector<std::string>> rows = readCsvRows(is);
  if (rows.empty()) {
    throw std::runtime_error("matrix CSV is empty");
  }

  const auto& header = rows.front();
  const size_t nKeys = std::size(kKeyHeaders);
  if (header.size() < nKeys) {
    throw std::runtime_error("matrix CSV header has too few columns");
  }
  for (size_t i = 0; i < nKeys; ++i) {
    if (header[i] != kKeyHeaders[i]) {
      throw std::runtime_error("unexpected matrix CSV header '" + header[i] + "'");
    }
  }

  FlightMatrix matrix;
  for (size_t i = nKeys; i < header.size(); ++i) {
    std::optional<CalendarDate> date = parseDateLabel(header[i], year);
    if (!date) {
      throw std::runtime_error("matrix CSV column '" + header[i] + "' is not a date");
    }
    matrix.columns.push_back(MatrixColumn{*date, formatDateLabel(*date, format)});
  }
  if (!matrix.columns.empty()) matrix.weekday = weekdayOf(matrix.columns.front().date);

  for (size_t r = 1; r < rows.size(); ++r) {
    const auto& fields = rows[r];
    if (fields.size() == 1 && fields[0].empty()) continue;
    if (fields.size() != header.size()) {
      throw std::runtime_error("matrix CSV row " + std::to_string(r + 1) + " has " +
                               std::to_string(fields.size()) + " fields, expected " +
                               std::to_string(header.size()));
    }
    MatrixRow row;
    row.flight = fields[0];
    row.route = fields[1];
    row.direction = parseDirection(fields[2]);
    for (size_t i = nKeys; i < fields.size(); ++i) {
      if (fields[i].empty()) {
        row.cells.emplace_back(std::nullopt);
      } else {
        row.cells.emplace_back(fields[i]);
      }
    }
    matrix.rows.push_back(std::move(row));
  }
  return matrix;
}

void writeRecordsCsv(const std::vector<FlightRecord>& records, std::ostream& os) {
  writeCsvRow(os, {"Date", "Weekday", "Flight", "Route", "AD", "Type", "ETA", "ETD"});
  for (const auto& rec : records) {
    writeCsvRow(os, {formatIsoDate(rec.date), weekdayName(rec.weekday), rec.flight, rec.route,
                     rec.directionToken, rec.type, rec.eta.value_or(""), rec.etd.value_or("")});
  }
}
