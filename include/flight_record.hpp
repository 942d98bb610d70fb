#pragma once

#include "calendar.hpp"

#include <optional>
#include <string>

enum class Direction { Arrival, Departure, Unknown };

// {A, ARR, ARRIVAL} and {P, D, DEP, DEPT, DEPARTURE}, any case; anything else is Unknown.
Direction parseDirection(const std::string& token);

// "A" / "D"; empty for Unknown.
const char* directionCode(Direction d);

// A flight row as laid out in the document, attributed to the day it belongs to.
// Fields are raw cell/token text; nothing is normalized yet.
struct RawRow {
  CalendarDate date;
  Weekday weekday = Weekday::Mon;
  std::string flight;
  std::string route;
  std::string direction;
  std::string type;
  std::string eta;
  std::string etd;
};

struct FlightRecord {
  CalendarDate date;
  Weekday weekday = Weekday::Mon;
  std::string flight;
  std::string route;
  Direction direction = Direction::Unknown;
  std::string directionToken;  // upper-cased A/D cell as printed ("P", "ARR", ...)
  std::string type;
  std::optional<std::string> eta;
  std::optional<std::string> etd;
};

inline bool operator==(const FlightRecord& a, const FlightRecord& b) {
  return a.date == b.date && a.weekday == b.weekday && a.flight == b.flight &&
         a.route == b.route && a.direction == b.direction &&
         a.directionToken == b.directionToken && a.type == b.type &&
         a.eta == b.eta && a.etd == b.etd;
}
inline bool operator!=(const FlightRecord& a, const FlightRecord& b) { return !(a == b); }
