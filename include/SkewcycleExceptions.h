#ifndef SKEWCYCLE_EXCEPTIONS_H
#define SKEWCYCLE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Skewcycle {

class SkewcycleException : public std::runtime_error {
public:
    explicit SkewcycleException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public SkewcycleException {
public:
    explicit IOException(const std::string& message) : SkewcycleException("IO Error: " + message) {}
};

class DatasetException : public SkewcycleException {
public:
    explicit DatasetException(const std::string& message) : SkewcycleException("Dataset Error: " + message) {}
};

class ConfigurationException : public SkewcycleException {
public:
    explicit ConfigurationException(const std::string& message) : SkewcycleException("Configuration Error: " + message) {}
};

// Singular or ill-conditioned regression design. Callers treat the affected
// conditioning subset as inconclusive.
class NumericalException : public SkewcycleException {
public:
    explicit NumericalException(const std::string& message) : SkewcycleException("Numerical Error: " + message) {}
};

class InvalidGraphException : public SkewcycleException {
public:
    explicit InvalidGraphException(const std::string& message) : SkewcycleException("Invalid Graph: " + message) {}
};

} // namespace Skewcycle

#endif // SKEWCYCLE_EXCEPTIONS_H
