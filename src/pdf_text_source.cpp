#include "page_source.hpp"
#include "pdftotext.hpp"
#include "text_util.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  int rc = std::system(test.c_str());
  return rc == 0;
}

} // namespace

std::string runPdftotext(const std::string& flags, const std::string& pdfPath) {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error(
      "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }

  std::string cmd = "pdftotext " + flags + " -q \"" + pdfPath + "\" -";
  spdlog::debug("pdftotext: running '{}'", cmd);

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("Failed to open pipe to pdftotext");
  }

  std::string output;
  char buffer[8192];
  while (true) {
    size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
    if (n > 0) output.append(buffer, n);
    if (n < sizeof(buffer)) break;
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    throw std::runtime_error("pdftotext returned non-zero exit code for '" + pdfPath + "'");
  }

  return output;
}

std::string extractPdfText(const std::string& pdfPath) {
  return runPdftotext("-layout", pdfPath);
}

std::vector<Page> splitTextPages(const std::string& text) {
  std::vector<Page> pages;
  std::regex lineBreak("\r?\n");

  size_t start = 0;
  while (start <= text.size()) {
    size_t ff = text.find('\f', start);
    std::string chunk = text.substr(start, ff == std::string::npos ? std::string::npos : ff - start);

    Page page;
    page.number = static_cast<int>(pages.size()) + 1;
    std::sregex_token_iterator it(chunk.begin(), chunk.end(), lineBreak, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
      std::string line = trim(*it);
      if (!line.empty()) page.lines.push_back(line);
    }

    // pdftotext terminates every page with a form feed, so the final chunk is usually empty
    bool trailing = ff == std::string::npos;
    if (!(trailing && page.lines.empty() && !pages.empty())) {
      pages.push_back(std::move(page));
    }

    if (trailing) break;
    start = ff + 1;
  }

  return pages;
}

std::vector<Page> loadTextFilePages(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open text file: " + path);
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  std::vector<Page> pages = splitTextPages(oss.str());
  spdlog::debug("loadTextFilePages: '{}' has {} page(s)", path, pages.size());
  return pages;
}
