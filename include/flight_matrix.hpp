#pragma once

#include "calendar.hpp"
#include "flight_record.hpp"

#include <optional>
#include <string>
#include <vector>

struct MatrixOptions {
  DateDisplayFormat dateFormat = DateDisplayFormat::DayMonthNumeric;
  // Add a column for every date of the month on the weekday, with or without flights.
  bool padFullMonth = false;
  // Month used for padding; when unset it is taken from the matching records.
  TargetMonth month;
};

struct MatrixColumn {
  CalendarDate date;
  std::string label;
};

struct MatrixRow {
  std::string flight;
  std::string route;
  Direction direction = Direction::Unknown;
  std::vector<std::optional<std::string>> cells;  // one per column
};

// Flights of one weekday against that weekday's dates. Columns ascend by date, rows by
// (flight, route, direction).
struct FlightMatrix {
  Weekday weekday = Weekday::Mon;
  std::vector<MatrixColumn> columns;
  std::vector<MatrixRow> rows;

  bool empty() const { return rows.empty(); }
};

// ETA for arrivals, ETD for departures; nothing for an unknown direction or missing time.
std::optional<std::string> displayTime(const FlightRecord& rec);

// Pivots the records of one weekday. When a flight has two times on the same date the
// first one in document order wins. No matching record gives an empty matrix.
FlightMatrix buildWeekdayMatrix(const std::vector<FlightRecord>& records,
                                Weekday weekday,
                                const MatrixOptions& options);
