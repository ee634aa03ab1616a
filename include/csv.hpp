// csv.hpp
#pragma once

#include <string>
#include <vector>

namespace traffic {

// Quotes a field only when it contains a separator, quote or newline.
std::string csv_escape(const std::string& field);

// Splits one line, honouring double-quoted fields ("" is an escaped quote).
std::vector<std::string> split_csv_line(const std::string& line);

} // namespace traffic
