#ifndef LITISIM_ERRORS_HPP
#define LITISIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace litisim {

// Base for all input validation failures. Raised before any computation starts.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// conservative <= recommended <= aggressive violated, or a bound is not finite
class InvalidDamagesRangeError : public ValidationError {
public:
    explicit InvalidDamagesRangeError(const std::string& message)
        : ValidationError(message) {}
};

// A probability-like input outside [0, 1]
class InvalidProbabilityError : public ValidationError {
public:
    explicit InvalidProbabilityError(const std::string& message)
        : ValidationError(message) {}
};

// Trial count that is not a positive integer
class InvalidTrialCountError : public ValidationError {
public:
    explicit InvalidTrialCountError(const std::string& message)
        : ValidationError(message) {}
};

// Strict CaseStrength construction from a value outside [0, 10]
class InvalidCaseStrengthError : public ValidationError {
public:
    explicit InvalidCaseStrengthError(const std::string& message)
        : ValidationError(message) {}
};

// Statistics requested over an empty sequence. Indicates a broken invariant
// upstream (empty catalog or zero trials), never a user error.
class EmptyInputError : public std::logic_error {
public:
    explicit EmptyInputError(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace litisim

#endif // LITISIM_ERRORS_HPP
