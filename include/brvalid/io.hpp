#pragma once

#include <brvalid/batch.hpp>
#include <brvalid/operations.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace brvalid {

/**
 * Read one value per line. A line equal to null_token is an absent value.
 * A trailing '\r' is removed from each line.
 */
Column ReadColumn(std::istream& in, const std::string& null_token);

/**
 * Read a column from a file, or from stdin when path is "-".
 * @throws std::runtime_error if the file cannot be opened.
 */
Column ReadColumnFromPath(const std::string& path, const std::string& null_token);

/** One line per cell: true/false, the string, or null_token for absent. */
void WriteText(std::ostream& out, const std::vector<Cell>& cells,
               const std::string& null_token);

/** A single JSON array: true/false, strings, null for absent. */
void WriteJson(std::ostream& out, const std::vector<Cell>& cells);

/** Tally of an output column. */
struct CellSummary {
  uint64_t rows = 0;
  uint64_t absent = 0;
  uint64_t true_count = 0;
  uint64_t false_count = 0;
  uint64_t strings = 0;
};

CellSummary Summarize(const std::vector<Cell>& cells);

}  // namespace brvalid
