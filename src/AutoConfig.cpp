#include "AutoConfig.h"
#include "CommonUtils.h"
#include "Preprocessor.h"
#include "SkewcycleExceptions.h"
#include <algorithm>
#include <fstream>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Skewcycle::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Skewcycle::SkewcycleException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Skewcycle::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Skewcycle::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(AutoConfig& config, const std::string& key, const std::string& value) {
    static const std::unordered_map<std::string, std::string AutoConfig::*> stringFields = {
        {"dataset", &AutoConfig::datasetPath},
        {"knowledge", &AutoConfig::knowledgePath},
        {"initial_graph", &AutoConfig::initialGraphPath},
        {"output", &AutoConfig::outputPath},
    };
    static const std::unordered_map<std::string, double SearchOptions::*> doubleFields = {
        {"two_cycle_alpha", &SearchOptions::twoCycleAlpha},
        {"penalty_discount", &SearchOptions::penaltyDiscount},
        {"skeleton_alpha", &SearchOptions::skeletonAlpha},
    };
    static const std::unordered_map<std::string, int SearchOptions::*> intFields = {
        {"depth", &SearchOptions::depth},
        {"max_iterations", &SearchOptions::maxIterations},
        {"max_degree", &SearchOptions::maxDegree},
    };
    static const std::unordered_map<std::string, bool SearchOptions::*> boolFields = {
        {"faithfulness_assumed", &SearchOptions::faithfulnessAssumed},
        {"symmetric_first_step", &SearchOptions::symmetricFirstStep},
        {"verbose", &SearchOptions::verbose},
    };

    if (key == "delimiter") {
        if (value.size() != 1) throw Skewcycle::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "transform") {
        config.transform = CommonUtils::toLower(CommonUtils::trim(value));
        return;
    }
    if (const auto it = stringFields.find(key); it != stringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.search.*(it->second) = parseDoubleStrict(value, key);
        return;
    }
    if (const auto it = intFields.find(key); it != intFields.end()) {
        config.search.*(it->second) = parseIntStrict(value, key);
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.search.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    throw Skewcycle::ConfigurationException("Unknown option '" + key + "'");
}
}

std::string AutoConfig::usage() {
    return "Usage: skewcycle <data.csv> [--config path] [--delimiter ,] [--knowledge path] "
           "[--initial-graph path] [--output path] [--transform none|center|nonparanormal] "
           "[--two-cycle-alpha 0..1] [--penalty-discount >0] [--depth N] [--max-iterations N] "
           "[--max-degree -1|N] [--skeleton-alpha 0..1] [--faithfulness-assumed true|false] "
           "[--symmetric-first-step true|false] [--verbose true|false]";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        throw Skewcycle::ConfigurationException(usage());
    }

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            throw Skewcycle::ConfigurationException("Unexpected argument '" + arg + "'\n" + usage());
        }
        if (i + 1 >= argc) {
            throw Skewcycle::ConfigurationException(arg + " expects a value");
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            configPath = value;
        } else {
            overrides.emplace_back(normalizeConfigKey(arg.substr(2)), value);
        }
    }

    AutoConfig config;
    if (!configPath.empty()) config = fromFile(configPath, config);
    config.datasetPath = argv[1];
    for (const auto& [key, value] : overrides) {
        assignKeyValue(config, key, value);
    }

    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath) {
    return fromFile(configPath, AutoConfig{});
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Skewcycle::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Skewcycle::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                    ": expected 'key: value'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, key, value);
        } catch (const Skewcycle::SkewcycleException& ex) {
            throw Skewcycle::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void AutoConfig::validate() const {
    if (datasetPath.empty()) {
        throw Skewcycle::ConfigurationException("dataset path is required");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw Skewcycle::ConfigurationException("delimiter cannot be a quote or line break");
    }
    Preprocessor::parseMethod(transform);
    search.validate();
}
