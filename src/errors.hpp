#pragma once

#include <stdexcept>
#include <string>

namespace execmetrics {

// Malformed or self-contradictory reference/market data. Aborts the run.
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& message) : std::runtime_error(message) {}
};

// A single execution is structurally invalid. The execution is skipped.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// No benchmark (or no defined slippage) for a single execution. The execution is skipped.
class UnresolvedError : public std::runtime_error {
public:
    explicit UnresolvedError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace execmetrics
