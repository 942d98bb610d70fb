#pragma once

#include "flight_matrix.hpp"
#include "flight_record.hpp"

#include <iosfwd>
#include <string>
#include <vector>

// Quotes a field containing a comma, quote, CR or LF; quotes inside are doubled.
std::string escapeCsvField(const std::string& field);
void writeCsvRow(std::ostream& os, const std::vector<std::string>& row);

// RFC 4180 reader: quoted fields may span lines; CRLF and LF both end a record.
std::vector<std::vector<std::string>> readCsvRows(std::istream& is);

// Header "Flight,Route,AD,<date labels...>", one row per flight; absent cells are empty.
void writeMatrixCsv(const FlightMatrix& matrix, std::ostream& os);

// Throws std::runtime_error if the file can't be written.
void writeMatrixCsvFile(const FlightMatrix& matrix, const std::string& path);

// Reads back what writeMatrixCsv wrote. Labels carry no year, so the caller supplies it.
// Throws std::runtime_error on a header that is not a matrix header.
FlightMatrix readMatrixCsv(std::istream& is, int year, DateDisplayFormat format);

// Flat record set: Date,Weekday,Flight,Route,AD,Type,ETA,ETD
void writeRecordsCsv(const std::vector<FlightRecord>& records, std::ostream& os);
