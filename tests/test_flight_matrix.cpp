#include <catch2/catch_all.hpp>

#include "flight_matrix.hpp"

#include <map>
#include <tuple>

namespace {

FlightRecord record(int day, const std::string& flight, const std::string& route, Direction dir,
                    const std::string& eta, const std::string& etd) {
  FlightRecord r;
  r.date = CalendarDate{2026, 2, day};
  r.weekday = weekdayOf(r.date);
  r.flight = flight;
  r.route = route;
  r.direction = dir;
  r.directionToken = directionCode(dir);
  r.type = "PAX";
  if (!eta.empty()) r.eta = eta;
  if (!etd.empty()) r.etd = etd;
  return r;
}

} // namespace

TEST_CASE("displayTime picks the time of the flight's direction", "[matrix]") {
  REQUIRE(displayTime(record(2, "DX1", "FCO", Direction::Arrival, "08:10", "09:00")) == std::optional<std::string>("08:10"));
  REQUIRE(displayTime(record(2, "DX1", "FCO", Direction::Departure, "08:10", "09:00")) == std::optional<std::string>("09:00"));
  REQUIRE_FALSE(displayTime(record(2, "DX1", "FCO", Direction::Unknown, "08:10", "09:00")).has_value());
  REQUIRE_FALSE(displayTime(record(2, "DX1", "FCO", Direction::Departure, "08:10", "")).has_value());
}

TEST_CASE("matrix columns ascend by date and rows by flight, route, direction", "[matrix]") {
  std::vector<FlightRecord> records = {
    record(16, "DX200", "LIN", Direction::Departure, "", "10:00"),
    record(2, "DX100", "FCO", Direction::Departure, "", "07:30"),
    record(9, "DX100", "FCO", Direction::Arrival, "08:10", ""),
    record(2, "DX100", "BRI", Direction::Arrival, "06:00", ""),
    record(3, "DX999", "FCO", Direction::Arrival, "06:00", ""),  // Tuesday
  };

  FlightMatrix m = buildWeekdayMatrix(records, Weekday::Mon, MatrixOptions{});
  REQUIRE(m.weekday == Weekday::Mon);
  REQUIRE(m.columns.size() == 3);
  REQUIRE(m.columns[0].label == "02-02");
  REQUIRE(m.columns[1].label == "09-02");
  REQUIRE(m.columns[2].label == "16-02");
  for (size_t i = 1; i < m.columns.size(); ++i) REQUIRE(m.columns[i - 1].date < m.columns[i].date);

  REQUIRE(m.rows.size() == 4);
  for (size_t i = 1; i < m.rows.size(); ++i) {
    const auto& a = m.rows[i - 1];
    const auto& b = m.rows[i];
    REQUIRE(std::tie(a.flight, a.route, a.direction) < std::tie(b.flight, b.route, b.direction));
  }
  REQUIRE(m.rows[0].route == "BRI");
  REQUIRE(m.rows[1].direction == Direction::Arrival);
  REQUIRE(m.rows[1].cells[1] == std::optional<std::string>("08:10"));
  REQUIRE_FALSE(m.rows[1].cells[0].has_value());
  REQUIRE(m.rows[3].flight == "DX200");
  for (const auto& row : m.rows) REQUIRE(row.cells.size() == m.columns.size());
}

TEST_CASE("the first time seen wins a duplicate cell", "[matrix]") {
  std::vector<FlightRecord> records = {
    record(2, "DX100", "FCO", Direction::Departure, "", "07:30"),
    record(2, "DX100", "FCO", Direction::Departure, "", "07:45"),
  };
  FlightMatrix m = buildWeekdayMatrix(records, Weekday::Mon, MatrixOptions{});
  REQUIRE(m.rows.size() == 1);
  REQUIRE(m.rows[0].cells[0] == std::optional<std::string>("07:30"));
}

TEST_CASE("records without a usable time never fill a cell", "[matrix]") {
  std::vector<FlightRecord> records = {
    record(2, "DX100", "FCO", Direction::Unknown, "07:00", "07:30"),
    record(2, "DX101", "FCO", Direction::Arrival, "", "07:30"),
  };
  FlightMatrix m = buildWeekdayMatrix(records, Weekday::Mon, MatrixOptions{});
  REQUIRE(m.empty());
  REQUIRE(m.columns.empty());
}

TEST_CASE("every timed record lands in exactly one cell of its weekday", "[matrix]") {
  std::vector<FlightRecord> records;
  for (int day = 1; day <= 28; ++day) {
    records.push_back(record(day, "DX" + std::to_string(100 + day % 3), "FCO", Direction::Arrival, "08:00", ""));
    records.push_back(record(day, "DX500", "LIN", Direction::Departure, "", "18:00"));
    records.push_back(record(day, "DX700", "NAP", Direction::Unknown, "09:00", "10:00"));
  }

  size_t filled = 0;
  std::map<std::tuple<std::string, std::string, Direction, int>, int> seen;
  for (Weekday w : kAllWeekdays) {
    FlightMatrix m = buildWeekdayMatrix(records, w, MatrixOptions{});
    for (const auto& row : m.rows) {
      REQUIRE(row.direction != Direction::Unknown);
      for (size_t c = 0; c < row.cells.size(); ++c) {
        if (!row.cells[c]) continue;
        REQUIRE(weekdayOf(m.columns[c].date) == w);
        filled++;
        seen[{row.flight, row.route, row.direction, m.columns[c].date.day}]++;
      }
    }
  }
  REQUIRE(filled == 56);
  for (const auto& entry : seen) REQUIRE(entry.second == 1);
}

TEST_CASE("padding adds every date of the weekday in the month", "[matrix]") {
  std::vector<FlightRecord> records = {record(9, "DX100", "FCO", Direction::Arrival, "08:10", "")};

  MatrixOptions options;
  options.padFullMonth = true;
  FlightMatrix m = buildWeekdayMatrix(records, Weekday::Mon, options);
  REQUIRE(m.columns.size() == 4);
  REQUIRE(m.columns[0].date == CalendarDate{2026, 2, 2});
  REQUIRE(m.columns[3].date == CalendarDate{2026, 2, 23});
  REQUIRE_FALSE(m.rows[0].cells[0].has_value());
  REQUIRE(m.rows[0].cells[1] == std::optional<std::string>("08:10"));

  // explicit month pads even without any matching record
  options.month = TargetMonth{2026, 2};
  FlightMatrix sundays = buildWeekdayMatrix(records, Weekday::Sun, options);
  REQUIRE(sundays.empty());
  REQUIRE(sundays.columns.size() == 4);
}

TEST_CASE("labels follow the configured date format", "[matrix]") {
  std::vector<FlightRecord> records = {record(2, "DX100", "FCO", Direction::Arrival, "08:10", "")};
  MatrixOptions options;
  options.dateFormat = DateDisplayFormat::DayMonthAbbrev;
  FlightMatrix m = buildWeekdayMatrix(records, Weekday::Mon, options);
  REQUIRE(m.columns[0].label == "02 Feb");
}

TEST_CASE("a weekday without flights gives an empty matrix", "[matrix]") {
  std::vector<FlightRecord> records = {record(2, "DX100", "FCO", Direction::Arrival, "08:10", "")};
  FlightMatrix m = buildWeekdayMatrix(records, Weekday::Wed, MatrixOptions{});
  REQUIRE(m.empty());
  REQUIRE(m.columns.empty());
  REQUIRE(buildWeekdayMatrix({}, Weekday::Mon, MatrixOptions{}).empty());
}
