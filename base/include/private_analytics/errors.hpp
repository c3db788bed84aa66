#ifndef PRIVATE_ANALYTICS_ERRORS_HPP
#define PRIVATE_ANALYTICS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace private_analytics {

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

// raw attributes lack the precision needed to produce quasi-identifiers
class UngeneralizableInput : public PipelineError {
public:
    explicit UngeneralizableInput(const std::string& message) : PipelineError(message) {}
};

class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message) : PipelineError(message) {}
};

// the secure random source could not produce bytes
class EntropyFailure : public PipelineError {
public:
    explicit EntropyFailure(const std::string& message) : PipelineError(message) {}
};

// numeric field without a reviewed sensitivity bound
class UndeclaredNumericField : public PipelineError {
public:
    explicit UndeclaredNumericField(const std::string& message) : PipelineError(message) {}
};

class StorageFailure : public PipelineError {
public:
    explicit StorageFailure(const std::string& message) : PipelineError(message) {}
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_ERRORS_HPP
