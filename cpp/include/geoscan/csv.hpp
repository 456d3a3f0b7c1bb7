#pragma once

#include "geoscan/table.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace geoscan {

/**
 * Read a comma separated file with a header row.
 * Fields may be double-quoted with "" as escape. Empty cells are null.
 * A column listed in numeric_columns becomes DOUBLE when all its non-empty
 * cells parse as numbers; every other column is STRING and keeps its text
 * verbatim. Every column is nullable.
 */
Table read_csv(std::istream& in, const std::vector<std::string>& numeric_columns = {});
Table read_csv_file(const std::string& path, const std::vector<std::string>& numeric_columns = {});

// Doubles are written in their shortest round-trip form
void write_csv(const Table& table, std::ostream& out);
void write_csv_file(const Table& table, const std::string& path);

} // namespace geoscan
