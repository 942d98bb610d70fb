#pragma once

#include "flight_record.hpp"
#include "parse_diagnostics.hpp"

#include <optional>
#include <vector>

// Upper-cases and trims Type, A/D and both times, turning empty strings into absent
// values. Returns nullopt for anything that is not a PAX flight.
std::optional<FlightRecord> normalizeRow(const RawRow& row);

// Keeps document order. Dropped rows are counted in diag.nonPaxDropped.
std::vector<FlightRecord> normalizeRows(const std::vector<RawRow>& rows, ParseDiagnostics& diag);
