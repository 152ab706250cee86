#pragma once
#include "DataSet.h"
#include <string>
#include <unordered_map>

enum class TransformMethod { NONE, CENTER, NONPARANORMAL };

struct PreprocessReport {
    TransformMethod method = TransformMethod::NONE;
    // Mean subtracted from each column, keyed by variable name.
    std::unordered_map<std::string, double> removedMeans;
    // Columns with tied values under the normal-score transform.
    std::unordered_map<std::string, size_t> tieCounts;
};

class Preprocessor {
public:
    static PreprocessReport run(DataSet& data, TransformMethod method);

    /**
     * @brief Subtracts each column's mean in place.
     * @post Every column has zero mean up to rounding.
     */
    static PreprocessReport center(DataSet& data);

    /**
     * @brief Replaces each value by Phi^-1(rank / (n + 1)), with average ranks for ties.
     */
    static PreprocessReport normalScores(DataSet& data);

    /**
     * @throws Skewcycle::ConfigurationException for an unknown name.
     */
    static TransformMethod parseMethod(const std::string& name);
};
