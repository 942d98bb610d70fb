#include "day_header.hpp"

#include "text_util.hpp"

#include <regex>

namespace {

// Weekday and month tokens are validated by name lookup after matching.
const char* const kWeekdayPrefix = "^(?:([A-Za-z]{3,9})\\.?,?\\s+)?";

HeaderScan makeScan(int year, int month, int day, const std::string& weekdayToken,
                    const TargetMonth& target) {
  HeaderScan scan;
  std::optional<Weekday> explicitWeekday;
  if (!weekdayToken.empty()) {
    explicitWeekday = parseWeekday(weekdayToken);
    if (!explicitWeekday) return scan;
  }
  if (!isValidDate(year, month, day)) {
    scan.status = HeaderScan::Status::InvalidDate;
    return scan;
  }
  CalendarDate date{year, month, day};
  if (!target.contains(date)) return scan;

  scan.status = HeaderScan::Status::Recognized;
  scan.header.date = date;
  scan.header.weekday = explicitWeekday ? *explicitWeekday : weekdayOf(date);
  return scan;
}

} // namespace

HeaderScan scanCellHeader(const std::string& cell, const TargetMonth& target) {
  static const std::regex cellRe("^([A-Za-z]{3})\\s+(\\d{1,2})\\s+([A-Za-z]{3,9})\\s+(\\d{4})$");

  std::string s = trim(cell);
  std::smatch m;
  if (!std::regex_match(s, m, cellRe)) return HeaderScan{};
  auto month = parseMonthName(m[3].str());
  if (!month) return HeaderScan{};
  return makeScan(std::stoi(m[4].str()), *month, std::stoi(m[2].str()), m[1].str(), target);
}

HeaderScan scanTextHeader(const std::string& text, const TargetMonth& target) {
  static const std::regex namedRe(std::string(kWeekdayPrefix) +
                                  "(\\d{1,2})\\s+([A-Za-z]{3,9})\\.?,?\\s+(\\d{4})$",
                                  std::regex::icase);
  static const std::regex slashRe(std::string(kWeekdayPrefix) + "(\\d{1,2})/(\\d{1,2})/(\\d{4})$",
                                  std::regex::icase);
  static const std::regex isoRe(std::string(kWeekdayPrefix) + "(\\d{4})-(\\d{1,2})-(\\d{1,2})$",
                                std::regex::icase);

  std::string s = trim(text);
  std::smatch m;
  if (std::regex_match(s, m, namedRe)) {
    auto month = parseMonthName(m[3].str());
    if (!month) return HeaderScan{};
    return makeScan(std::stoi(m[4].str()), *month, std::stoi(m[2].str()), m[1].str(), target);
  }
  if (std::regex_match(s, m, slashRe)) {
    return makeScan(std::stoi(m[4].str()), std::stoi(m[3].str()), std::stoi(m[2].str()), m[1].str(), target);
  }
  if (std::regex_match(s, m, isoRe)) {
    return makeScan(std::stoi(m[2].str()), std::stoi(m[3].str()), std::stoi(m[4].str()), m[1].str(), target);
  }
  return HeaderScan{};
}

HeaderScan scanDayHeader(const std::string& text, const TargetMonth& target) {
  HeaderScan cell = scanCellHeader(text, target);
  if (cell.status != HeaderScan::Status::NoMatch) return cell;
  return scanTextHeader(text, target);
}

std::optional<CalendarDate> findFirstDate(const std::string& text) {
  static const std::regex anyDateRe(
    "(\\d{1,2})\\s+([A-Za-z]{3,9})\\.?,?\\s+(\\d{4})"
    "|(\\d{1,2})/(\\d{1,2})/(\\d{4})"
    "|(\\d{4})-(\\d{1,2})-(\\d{1,2})");

  auto begin = std::sregex_iterator(text.begin(), text.end(), anyDateRe);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    const std::smatch& m = *it;
    CalendarDate d;
    if (m[1].matched) {
      auto month = parseMonthName(m[2].str());
      if (!month) continue;
      d = CalendarDate{std::stoi(m[3].str()), *month, std::stoi(m[1].str())};
    } else if (m[4].matched) {
      d = CalendarDate{std::stoi(m[6].str()), std::stoi(m[5].str()), std::stoi(m[4].str())};
    } else {
      d = CalendarDate{std::stoi(m[7].str()), std::stoi(m[8].str()), std::stoi(m[9].str())};
    }
    if (isValidDate(d.year, d.month, d.day)) return d;
  }
  return std::nullopt;
}

bool isDateRangeBanner(const std::string& line) {
  static const std::regex bannerRe("^\\s*from\\s+(.+?)\\s+to\\s+(.+?)\\s*$", std::regex::icase);

  std::smatch m;
  if (!std::regex_match(line, m, bannerRe)) return false;
  return findFirstDate(m[1].str()).has_value() && findFirstDate(m[2].str()).has_value();
}
