#include "record_normalizer.hpp"

#include "text_util.hpp"

namespace {

std::optional<std::string> optionalField(const std::string& s) {
  std::string v = toUpper(trim(s));
  if (v.empty()) return std::nullopt;
  return v;
}

} // namespace

Direction parseDirection(const std::string& token) {
  std::string t = toUpper(trim(token));
  if (t == "A" || t == "ARR" || t == "ARRIVAL") return Direction::Arrival;
  if (t == "P" || t == "D" || t == "DEP" || t == "DEPT" || t == "DEPARTURE") return Direction::Departure;
  return Direction::Unknown;
}

const char* directionCode(Direction d) {
  switch (d) {
    case Direction::Arrival: return "A";
    case Direction::Departure: return "D";
    case Direction::Unknown: break;
  }
  return "";
}

std::optional<FlightRecord> normalizeRow(const RawRow& row) {
  std::string type = toUpper(trim(row.type));
  if (type != "PAX") return std::nullopt;

  FlightRecord rec;
  rec.date = row.date;
  rec.weekday = row.weekday;
  rec.flight = trim(row.flight);
  rec.route = trim(row.route);
  rec.directionToken = toUpper(trim(row.direction));
  rec.direction = parseDirection(rec.directionToken);
  rec.type = type;
  rec.eta = optionalField(row.eta);
  rec.etd = optionalField(row.etd);
  return rec;
}

std::vector<FlightRecord> normalizeRows(const std::vector<RawRow>& rows, ParseDiagnostics& diag) {
  std::vector<FlightRecord> records;
  records.reserve(rows.size());
  for (const auto& row : rows) {
    std::optional<FlightRecord> rec = normalizeRow(row);
    if (!rec) {
      diag.nonPaxDropped++;
      continue;
    }
    records.push_back(std::move(*rec));
  }
  diag.recordsKept = records.size();
  return records;
}
