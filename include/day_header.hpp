#pragma once

#include "calendar.hpp"

#include <optional>
#include <string>

struct DayHeader {
  CalendarDate date;
  Weekday weekday = Weekday::Mon;
};

inline bool operator==(const DayHeader& a, const DayHeader& b) {
  return a.date == b.date && a.weekday == b.weekday;
}

struct HeaderScan {
  enum class Status {
    NoMatch,
    Recognized,
    InvalidDate,  // pattern matched but the date does not exist
  };

  Status status = Status::NoMatch;
  DayHeader header;

  bool recognized() const { return status == Status::Recognized; }
  bool invalidDate() const { return status == Status::InvalidDate; }
};

// Table cell of the form "Mon 2 Feb 2026". When the target is set, only its month qualifies.
HeaderScan scanCellHeader(const std::string& cell, const TargetMonth& target);

// Free text: "2 February 2026", "02/02/2026" or "2026-02-02", optionally preceded by a
// weekday ("Monday, 2 Feb 2026"). The whole trimmed text must be the date.
HeaderScan scanTextHeader(const std::string& text, const TargetMonth& target);

// Cell form first, then free-text forms.
HeaderScan scanDayHeader(const std::string& text, const TargetMonth& target);

// First valid date mentioned anywhere in the text, in any supported form.
std::optional<CalendarDate> findFirstDate(const std::string& text);

// "from 01/02/2026 to 28/02/2026" style period banner.
bool isDateRangeBanner(const std::string& line);
