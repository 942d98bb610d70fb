#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string toUpper(std::string s);
std::string toLower(std::string s);
bool iequals(const std::string& a, const std::string& b);

// Splits on any run of whitespace; never yields empty tokens.
std::vector<std::string> splitWhitespace(const std::string& s);
