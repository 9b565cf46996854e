// src/core/Errors.hpp
//
// Exception types raised by the **CooperativeLocalizationEngine**.
//
// Only conditions that abort a run before computation starts are exceptions.
// Per-node numerical degeneracies (too few references, singular local
// systems) are recovered inside the strategies and reported through
// `SolveDiagnostics` instead.
#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief Base class of every engine error.
 */
class LocalizationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input points are inconsistent or a record cannot be parsed.
 *
 * `line()` is the 1-based record line when the error comes from the reader,
 * 0 otherwise.
 */
class MalformedInputError : public LocalizationError {
public:
    explicit MalformedInputError(const std::string& what, std::size_t line = 0)
        : LocalizationError(line == 0 ? what
                                      : "line " + std::to_string(line) + ": " + what),
          line_(line) {}
    std::size_t line() const { return line_; }

private:
    std::size_t line_;
};

/**
 * @brief Iterative output was requested from a solve-only strategy.
 */
class CapabilityMissingError : public LocalizationError {
public:
    using LocalizationError::LocalizationError;
};

/**
 * @brief No strategy is registered under the requested name.
 */
class UnknownAlgorithmError : public LocalizationError {
public:
    using LocalizationError::LocalizationError;
};

/**
 * @brief The measurement graph splits into several components.
 *
 * Raised only when the run configuration asks for a connected graph.
 */
class DisconnectedGraphError : public LocalizationError {
public:
    using LocalizationError::LocalizationError;
};

#endif // ERRORS_HPP
