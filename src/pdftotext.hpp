#pragma once

#include <string>

// Runs `pdftotext <flags> -q "<pdfPath>" -` and returns its stdout.
// Throws std::runtime_error if the tool is missing or exits non-zero.
std::string runPdftotext(const std::string& flags, const std::string& pdfPath);
