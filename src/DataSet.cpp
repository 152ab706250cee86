#include "DataSet.h"
#include "CSVUtils.h"
#include "Statistics.h"
#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string_view>
#include <unordered_set>

namespace {
bool parseFiniteDouble(std::string_view input, double& out) {
    double parsed = 0.0;
    const char* begin = input.data();
    const char* end = begin + input.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed, std::chars_format::general);
    if (ec != std::errc{} || ptr != end || !std::isfinite(parsed)) {
        return false;
    }
    out = parsed;
    return true;
}

bool isBlankRecord(const std::vector<std::string>& row) {
    return row.empty() || (row.size() == 1 && row[0].empty());
}
}

DataSet::DataSet(const std::vector<std::string>& names, std::vector<std::vector<double>> cols)
    : columns(std::move(cols)) {
    if (names.size() != columns.size()) {
        throw Skewcycle::DatasetException("Expected " + std::to_string(names.size()) +
                                          " columns, got " + std::to_string(columns.size()));
    }
    rowCount = columns.empty() ? 0 : columns.front().size();

    std::unordered_set<std::string> seen;
    variables.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        if (columns[i].size() != rowCount) {
            throw Skewcycle::DatasetException("Column '" + names[i] + "' has " +
                                              std::to_string(columns[i].size()) + " rows, expected " +
                                              std::to_string(rowCount));
        }
        if (!seen.insert(names[i]).second) {
            throw Skewcycle::DatasetException("Duplicate variable name '" + names[i] + "'");
        }
        variables.push_back({names[i], i});
    }
}

DataSet DataSet::fromCSV(const std::string& filename, char delimiter) {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw Skewcycle::DatasetException("Invalid delimiter character");
    }

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) throw Skewcycle::IOException("Could not open file " + filename);

    CSVUtils::skipBOM(file);
    bool malformed = false;
    bool limitExceeded = false;
    std::vector<std::string> header = CSVUtils::parseCSVLine(file, delimiter, &malformed, &limitExceeded);
    if (malformed || limitExceeded || isBlankRecord(header)) {
        throw Skewcycle::DatasetException("Empty or malformed header in " + filename);
    }
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<double>> cols(header.size());
    size_t recordNumber = 1;
    while (file.peek() != EOF) {
        ++recordNumber;
        auto row = CSVUtils::parseCSVLine(file, delimiter, &malformed, &limitExceeded);
        if (malformed) {
            throw Skewcycle::DatasetException("Malformed quoted field at record " + std::to_string(recordNumber));
        }
        if (limitExceeded) {
            throw Skewcycle::DatasetException("Field or column limit exceeded at record " + std::to_string(recordNumber));
        }
        if (isBlankRecord(row)) continue;
        if (row.size() != header.size()) {
            throw Skewcycle::DatasetException("Column mismatch at record " + std::to_string(recordNumber));
        }
        for (size_t c = 0; c < row.size(); ++c) {
            double value = 0.0;
            if (!parseFiniteDouble(row[c], value)) {
                throw Skewcycle::DatasetException("Non-numeric value '" + row[c] + "' in column '" + header[c] +
                                                  "' at record " + std::to_string(recordNumber));
            }
            cols[c].push_back(value);
        }
    }

    if (cols.front().empty()) {
        throw Skewcycle::DatasetException("No data rows in " + filename);
    }
    return DataSet(header, std::move(cols));
}

const Variable* DataSet::findVariable(const std::string& name) const {
    for (const auto& v : variables) {
        if (v.name == name) return &v;
    }
    return nullptr;
}

const Variable& DataSet::getVariable(const std::string& name) const {
    const Variable* v = findVariable(name);
    if (!v) throw Skewcycle::DatasetException("Unknown variable '" + name + "'");
    return *v;
}

void DataSet::printSummary() const {
    std::cout << "Rows: " << rowCount << ", Columns: " << variables.size() << "\n";
    std::cout << std::left << std::setw(16) << "Variable"
              << std::right << std::setw(12) << "Mean"
              << std::setw(12) << "StdDev"
              << std::setw(12) << "Skewness"
              << std::setw(12) << "Kurtosis" << "\n";
    for (const auto& v : variables) {
        ColumnStats s = Statistics::calculateStats(columns[v.column]);
        std::cout << std::left << std::setw(16) << v.name
                  << std::right << std::fixed << std::setprecision(4)
                  << std::setw(12) << s.mean
                  << std::setw(12) << s.stddev
                  << std::setw(12) << s.skewness
                  << std::setw(12) << s.kurtosis << "\n";
    }
    std::cout.unsetf(std::ios::fixed);
}
