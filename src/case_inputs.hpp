#ifndef LITISIM_CASE_INPUTS_HPP
#define LITISIM_CASE_INPUTS_HPP

#include <optional>

namespace litisim {

// Damages estimate supplied by the upstream damages step.
// Immutable; conservative <= recommended <= aggressive is checked on construction.
class DamagesRange {
public:
    // Throws InvalidDamagesRangeError if the ordering is violated or any bound
    // is not a finite number
    DamagesRange(double conservative, double recommended, double aggressive);

    double conservative() const { return conservative_; }
    double recommended() const { return recommended_; }
    double aggressive() const { return aggressive_; }

    bool operator==(const DamagesRange& other) const;

private:
    double conservative_;
    double recommended_;
    double aggressive_;
};

// Case strength score on a 0-10 scale
class CaseStrength {
public:
    static constexpr int MIN = 0;
    static constexpr int MAX = 10;

    // Throws InvalidCaseStrengthError outside [MIN, MAX]
    explicit CaseStrength(int value);

    // Clamps into [MIN, MAX]; was_clamped (if given) reports whether the raw
    // value had to be adjusted
    static CaseStrength clamp(int raw, bool* was_clamped = nullptr);

    int value() const { return value_; }

    // value / 10, the weighting used in every probability formula
    double fraction() const { return static_cast<double>(value_) / MAX; }

private:
    int value_;
};

// Opponent behavioural signal. Throws InvalidProbabilityError outside [0, 1].
void validate_settlement_rate(double rate);

// Settlement rate assumed when no opponent profile is available
constexpr double DEFAULT_SETTLEMENT_RATE = 0.5;

// Resolves an optional settlement rate to a validated value
double resolve_settlement_rate(const std::optional<double>& rate);

} // namespace litisim

#endif // LITISIM_CASE_INPUTS_HPP
