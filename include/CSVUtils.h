#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and header normalization utilities.
// Numeric conversion is left to DataSet.
struct ParseLimits {
	size_t maxFieldBytes = 1024 * 1024;               // 1 MiB
	size_t maxColumns = 20000;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one record. Quoted fields may contain the delimiter, doubled quotes and newlines.
 * @post Returns an empty vector at end of input or for a blank line.
 *       *malformed is set for an unterminated quote, *limitExceeded when a limit is hit.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  bool* limitExceeded = nullptr,
									  const ParseLimits& limits = ParseLimits{});
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
