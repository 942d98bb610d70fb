#include "schedule_summary.hpp"

#include <set>

ScheduleSummary summarizeSchedule(const std::vector<FlightRecord>& records) {
  ScheduleSummary summary;
  summary.flightCount = records.size();

  std::set<CalendarDate> dates;
  bool seen[7] = {};
  for (const auto& rec : records) {
    dates.insert(rec.date);
    seen[static_cast<int>(rec.weekday)] = true;
  }

  summary.dayCount = dates.size();
  if (!dates.empty()) {
    summary.firstDate = *dates.begin();
    summary.lastDate = *dates.rbegin();
  }
  for (Weekday w : kAllWeekdays) {
    if (seen[static_cast<int>(w)]) summary.weekdays.push_back(w);
  }
  return summary;
}
