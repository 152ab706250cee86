#pragma once
#include <string>
#include <vector>
#include "SkewcycleExceptions.h"

// A named variable bound to a fixed column of the observation matrix.
// Two variables are the same variable when they point at the same column.
struct Variable {
    std::string name;
    size_t column = 0;

    bool operator==(const Variable& other) const { return column == other.column; }
    bool operator!=(const Variable& other) const { return column != other.column; }
    bool operator<(const Variable& other) const { return column < other.column; }
};

class DataSet {
public:
    DataSet() = default;

    /**
     * @brief Builds a data set from column-major samples.
     * @throws Skewcycle::DatasetException if names and columns disagree, columns are ragged
     *         or a name repeats.
     */
    DataSet(const std::vector<std::string>& names, std::vector<std::vector<double>> columns);

    /**
     * @brief Loads a numeric CSV file with a header row.
     * @throws Skewcycle::IOException if the file cannot be opened.
     * @throws Skewcycle::DatasetException on ragged rows, non-numeric cells or empty input.
     */
    static DataSet fromCSV(const std::string& filename, char delimiter = ',');

    const std::vector<Variable>& getVariables() const { return variables; }
    const Variable& getVariable(size_t column) const { return variables.at(column); }

    /**
     * @brief Looks a variable up by name.
     * @throws Skewcycle::DatasetException if the name is unknown.
     */
    const Variable& getVariable(const std::string& name) const;
    const Variable* findVariable(const std::string& name) const;

    // Data grouped by columns for cache locality in the regressions.
    const std::vector<std::vector<double>>& getColumns() const { return columns; }
    const std::vector<double>& column(const Variable& v) const { return columns.at(v.column); }
    std::vector<double>& mutableColumn(size_t index) { return columns.at(index); }

    size_t getRowCount() const { return rowCount; }
    size_t getColCount() const { return variables.size(); }

    void printSummary() const;

private:
    std::vector<Variable> variables;
    std::vector<std::vector<double>> columns;
    size_t rowCount = 0;
};
