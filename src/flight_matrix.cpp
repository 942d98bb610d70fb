#include "flight_matrix.hpp"

#include <map>
#include <set>
#include <tuple>

namespace {

using RowKey = std::tuple<std::string, std::string, Direction>;

} // namespace

std::optional<std::string> displayTime(const FlightRecord& rec) {
  switch (rec.direction) {
    case Direction::Arrival: return rec.eta;
    case Direction::Departure: return rec.etd;
    case Direction::Unknown: break;
  }
  return std::nullopt;
}

FlightMatrix buildWeekdayMatrix(const std::vector<FlightRecord>& records,
                                Weekday weekday,
                                const MatrixOptions& options) {
  FlightMatrix matrix;
  matrix.weekday = weekday;

  std::map<RowKey, std::map<CalendarDate, std::string>> cells;
  std::set<CalendarDate> dates;
  TargetMonth month = options.month;

  for (const auto& rec : records) {
    if (rec.weekday != weekday) continue;
    std::optional<std::string> time = displayTime(rec);
    if (!time) continue;

    if (!month.isSet()) month = TargetMonth{rec.date.year, rec.date.month};
    dates.insert(rec.date);
    // emplace keeps the value already there: first in document order wins
    cells[RowKey{rec.flight, rec.route, rec.direction}].emplace(rec.date, *time);
  }

  if (options.padFullMonth && month.isSet()) {
    for (const auto& d : datesOfWeekday(month.year, month.month, weekday)) dates.insert(d);
  }

  matrix.columns.reserve(dates.size());
  for (const auto& d : dates) {
    matrix.columns.push_back(MatrixColumn{d, formatDateLabel(d, options.dateFormat)});
  }

  matrix.rows.reserve(cells.size());
  for (const auto& entry : cells) {
    MatrixRow row;
    std::tie(row.flight, row.route, row.direction) = entry.first;
    row.cells.reserve(matrix.columns.size());
    for (const auto& col : matrix.columns) {
      auto it = entry.second.find(col.date);
      if (it == entry.second.end()) {
        row.cells.emplace_back(std::nullopt);
      } else {
        row.cells.emplace_back(it->second);
      }
    }
    matrix.rows.push_back(std::move(row));
  }
  return matrix;
}
