#include "flight_matrix.hpp"
#include "matrix_csv.hpp"
#include "page_source.hpp"
#include "schedule_parser.hpp"
#include "schedule_summary.hpp"
#include "text_util.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CliConfig {
  std::string inputPath;
  bool textMode = false;
  bool verbose = false;
  std::string outDir = "matrix_out";
  std::string recordsOut;
  std::vector<Weekday> weekdays;
  ParseOptions parse;
  MatrixOptions matrix;
};

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <schedule.pdf|schedule.txt>\n"
            << "  --year=YYYY --month=M        month the schedule covers (default: inferred)\n"
            << "  --strategy=S                 auto|structured|token-stream|token-regex\n"
            << "  --layout=L                   auto|fixed|clustered\n"
            << "  --date-format=F              dd-mm|dd-mon\n"
            << "  --pad-month                  one column for every date of the weekday\n"
            << "  --weekday=Mon                repeatable; default is every weekday found\n"
            << "  --text                       read a PDF through pdftotext -layout text\n"
            << "  --out-dir=dir                matrix CSV directory (default matrix_out)\n"
            << "  --records-out=file           also write the flat PAX record set\n"
            << "  -v                           debug logging\n";
}

RowStrategy parseStrategy(const std::string& v) {
  if (v == "auto") return RowStrategy::Auto;
  if (v == "structured") return RowStrategy::Structured;
  if (v == "token-stream") return RowStrategy::TokenStream;
  if (v == "token-regex") return RowStrategy::TokenRegex;
  throw std::invalid_argument("unknown strategy '" + v + "'");
}

ColumnLayoutStrategy parseLayout(const std::string& v) {
  if (v == "auto") return ColumnLayoutStrategy::Auto;
  if (v == "fixed") return ColumnLayoutStrategy::FixedDivision;
  if (v == "clustered") return ColumnLayoutStrategy::ClusteredCenters;
  throw std::invalid_argument("unknown layout '" + v + "'");
}

DateDisplayFormat parseDateFormat(const std::string& v) {
  if (v == "dd-mm") return DateDisplayFormat::DayMonthNumeric;
  if (v == "dd-mon") return DateDisplayFormat::DayMonthAbbrev;
  throw std::invalid_argument("unknown date format '" + v + "'");
}

// Accepts both "--name=value" and "--name value".
bool takeValue(const std::string& arg, const std::string& name, int& i, int argc, char** argv, std::string& value) {
  if (arg.rfind(name + "=", 0) == 0) {
    value = arg.substr(name.size() + 1);
    return true;
  }
  if (arg == name) {
    if (i + 1 >= argc) throw std::invalid_argument("missing value for " + name);
    value = argv[++i];
    return true;
  }
  return false;
}

CliConfig parseArgs(int argc, char** argv) {
  CliConfig cfg;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--verbose") {
      cfg.verbose = true;
    } else if (arg == "--text") {
      cfg.textMode = true;
    } else if (arg == "--pad-month") {
      cfg.matrix.padFullMonth = true;
    } else if (takeValue(arg, "--year", i, argc, argv, value)) {
      cfg.parse.target.year = std::stoi(value);
    } else if (takeValue(arg, "--month", i, argc, argv, value)) {
      cfg.parse.target.month = std::stoi(value);
    } else if (takeValue(arg, "--strategy", i, argc, argv, value)) {
      cfg.parse.strategy = parseStrategy(value);
    } else if (takeValue(arg, "--layout", i, argc, argv, value)) {
      cfg.parse.layout = parseLayout(value);
    } else if (takeValue(arg, "--date-format", i, argc, argv, value)) {
      cfg.matrix.dateFormat = parseDateFormat(value);
    } else if (takeValue(arg, "--weekday", i, argc, argv, value)) {
      auto w = parseWeekday(value);
      if (!w) throw std::invalid_argument("unknown weekday '" + value + "'");
      cfg.weekdays.push_back(*w);
    } else if (takeValue(arg, "--out-dir", i, argc, argv, value)) {
      cfg.outDir = value;
    } else if (takeValue(arg, "--records-out", i, argc, argv, value)) {
      cfg.recordsOut = value;
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::invalid_argument("unknown option '" + arg + "'");
    } else if (cfg.inputPath.empty()) {
      cfg.inputPath = arg;
    } else {
      throw std::invalid_argument("more than one input file given");
    }
  }
  if (cfg.parse.target.isSet() != (cfg.parse.target.year != 0 || cfg.parse.target.month != 0)) {
    throw std::invalid_argument("--year and --month must be given together");
  }
  return cfg;
}

std::vector<Page> loadPages(const CliConfig& cfg) {
  std::string ext = toLower(std::filesystem::path(cfg.inputPath).extension().string());
  if (ext != ".pdf") return loadTextFilePages(cfg.inputPath);
  if (cfg.textMode) return splitTextPages(extractPdfText(cfg.inputPath));
  return loadPdfPages(cfg.inputPath, PdfLayoutOptions{});
}

std::string formatDayMonthYear(const CalendarDate& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", d.day, d.month, d.year);
  return buf;
}

} // namespace

int main(int argc, char** argv)
{
  CliConfig cfg;
  try {
    cfg = parseArgs(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    printUsage(argv[0]);
    return 2;
  }

  if (cfg.inputPath.empty() || !std::filesystem::exists(cfg.inputPath)) {
    std::cerr << "Schedule not found: " << cfg.inputPath << "\n";
    printUsage(argv[0]);
    return 2;
  }

  spdlog::set_level(cfg.verbose ? spdlog::level::debug : spdlog::level::info);

  try {
    std::vector<Page> pages = loadPages(cfg);
    ParseResult result = parseFlightSchedule(pages, cfg.parse);
    const ParseDiagnostics& diag = result.diagnostics;

    spdlog::info("{} page(s), {} strategy, {} day header(s), {} row(s) rejected, {} unattached block(s)",
                 diag.pagesVisited, rowStrategyName(result.strategy), diag.headersFound,
                 diag.rowsRejected, diag.unattachedBlocks);

    if (result.records.empty()) {
      std::cerr << "No PAX flights found, or the schedule layout was not recognized.\n";
      return 3;
    }

    ScheduleSummary summary = summarizeSchedule(result.records);
    std::cout << "PAX flights extracted: " << summary.flightCount << "\n";
    std::cout << "Days covered: " << summary.dayCount << "\n";
    if (summary.firstDate && summary.lastDate) {
      std::cout << "Period: " << formatDayMonthYear(*summary.firstDate) << " - "
                << formatDayMonthYear(*summary.lastDate) << "\n";
    }

    if (!cfg.recordsOut.empty()) {
      std::ofstream ofs(cfg.recordsOut, std::ios::binary);
      if (!ofs) throw std::runtime_error("Failed to open '" + cfg.recordsOut + "' for writing");
      writeRecordsCsv(result.records, ofs);
      std::cout << "Wrote " << result.records.size() << " record(s) to '" << cfg.recordsOut << "'\n";
    }

    if (!std::filesystem::exists(cfg.outDir)) {
      std::filesystem::create_directories(cfg.outDir);
    }

    cfg.matrix.month = result.target;
    std::vector<Weekday> weekdays = cfg.weekdays.empty() ? summary.weekdays : cfg.weekdays;
    for (Weekday w : weekdays) {
      FlightMatrix matrix = buildWeekdayMatrix(result.records, w, cfg.matrix);
      if (matrix.empty()) {
        std::cout << weekdayName(w) << ": no PAX flights with valid times\n";
        continue;
      }
      std::string filename = cfg.outDir + "/flight_matrix_" + toLower(weekdayName(w)) + ".csv";
      writeMatrixCsvFile(matrix, filename);
      std::cout << weekdayName(w) << ": " << matrix.rows.size() << " flight(s) x "
                << matrix.columns.size() << " date(s) -> '" << filename << "'\n";
    }

    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
