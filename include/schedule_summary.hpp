#pragma once

#include "calendar.hpp"
#include "flight_record.hpp"

#include <optional>
#include <vector>

struct ScheduleSummary {
  size_t flightCount = 0;
  size_t dayCount = 0;                      // distinct dates
  std::optional<CalendarDate> firstDate;
  std::optional<CalendarDate> lastDate;
  std::vector<Weekday> weekdays;            // present in the records, Mon..Sun order
};

ScheduleSummary summarizeSchedule(const std::vector<FlightRecord>& records);
