#include "case_inputs.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace litisim {

// ============================================================================
// DamagesRange Implementation
// ============================================================================

DamagesRange::DamagesRange(double conservative, double recommended, double aggressive)
    : conservative_(conservative), recommended_(recommended), aggressive_(aggressive) {
    if (!std::isfinite(conservative) || !std::isfinite(recommended) ||
        !std::isfinite(aggressive)) {
        throw InvalidDamagesRangeError("Damages bounds must be finite numbers");
    }
    if (conservative > recommended || recommended > aggressive) {
        std::ostringstream oss;
        oss << "Damages range must satisfy conservative <= recommended <= aggressive"
            << " (got " << conservative << ", " << recommended << ", " << aggressive << ")";
        throw InvalidDamagesRangeError(oss.str());
    }
}

bool DamagesRange::operator==(const DamagesRange& other) const {
    return conservative_ == other.conservative_ &&
           recommended_ == other.recommended_ &&
           aggressive_ == other.aggressive_;
}

// ============================================================================
// CaseStrength Implementation
// ============================================================================

CaseStrength::CaseStrength(int value) : value_(value) {
    if (value < MIN || value > MAX) {
        throw InvalidCaseStrengthError("Case strength must be between 0 and 10, got " +
                                       std::to_string(value));
    }
}

CaseStrength CaseStrength::clamp(int raw, bool* was_clamped) {
    int clamped = raw < MIN ? MIN : (raw > MAX ? MAX : raw);
    if (was_clamped) {
        *was_clamped = (clamped != raw);
    }
    return CaseStrength(clamped);
}

// ============================================================================
// Settlement rate
// ============================================================================

void validate_settlement_rate(double rate) {
    if (!(rate >= 0.0 && rate <= 1.0)) {
        std::ostringstream oss;
        oss << "Opponent settlement rate must be in [0, 1], got " << rate;
        throw InvalidProbabilityError(oss.str());
    }
}

double resolve_settlement_rate(const std::optional<double>& rate) {
    if (!rate) {
        return DEFAULT_SETTLEMENT_RATE;
    }
    validate_settlement_rate(*rate);
    return *rate;
}

} // namespace litisim
