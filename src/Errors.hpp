#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>

// Bad parameter ranges, unknown identifiers, malformed networks. Raised at construction.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class InvalidParameter : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

class InvalidConfig : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

class InvalidPayoffSpec : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

class UnknownStrategy : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

// Violations that only show up once a model runs. Reported as a failed trial.
class RuntimeInvariantError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EmptyPopulation : public RuntimeInvariantError {
public:
    using RuntimeInvariantError::RuntimeInvariantError;
};

class CheckpointError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif // ERRORS_HPP
