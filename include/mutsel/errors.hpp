#pragma once
// Exception taxonomy shared by every component.
//
// Construction-time checks throw immediately. Iterative solvers catch
// NumericDegeneracy themselves, print a warning and return the best result
// reached so far.

#include <stdexcept>
#include <string>

namespace mutsel {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Bad shape, bad value or malformed input.
class InvalidArgument : public Error {
public:
    explicit InvalidArgument(const std::string& message) : Error(message) {}
};

// A post-condition of a construction step does not hold.
class InvariantViolation : public Error {
public:
    explicit InvariantViolation(const std::string& message) : Error(message) {}
};

// Options that are individually valid but cannot be combined.
class ConfigurationConflict : public Error {
public:
    explicit ConfigurationConflict(const std::string& message) : Error(message) {}
};

// Singular systems, underflow to zero, non-finite intermediates.
class NumericDegeneracy : public Error {
public:
    explicit NumericDegeneracy(const std::string& message) : Error(message) {}
};

}  // namespace mutsel
