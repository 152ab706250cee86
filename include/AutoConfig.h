#pragma once
#include "SkewcycleSearch.h"
#include <string>

// Command-line host configuration. Search parameters live in SearchOptions.
struct AutoConfig {
    std::string datasetPath;
    std::string knowledgePath;
    std::string initialGraphPath;
    std::string outputPath;
    char delimiter = ',';
    // none | center | nonparanormal
    std::string transform = "center";
    SearchOptions search;

    /**
     * @brief Parses "skewcycle <data.csv> [--flag value]...". A --config file is applied
     * first; flags given on the command line override it.
     * @throws Skewcycle::ConfigurationException on usage errors or invalid values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Applies loose "key: value" lines over base. Keys are snake_case; '-' is accepted for '_'.
     * @throws Skewcycle::ConfigurationException with the line number on a bad key or value.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);
    static AutoConfig fromFile(const std::string& configPath);

    void validate() const;

    static std::string usage();
};
