#include "best_response.hpp"
#include "case_inputs.hpp"
#include <cmath>

namespace litisim {

namespace {

size_t row(ClaimantStrategy s) { return static_cast<size_t>(s); }
size_t column(OpponentStrategy s) { return static_cast<size_t>(s); }

} // anonymous namespace

std::string strategy_to_string(ClaimantStrategy strategy) {
    switch (strategy) {
        case ClaimantStrategy::AggressiveLitigation: return "aggressive-litigation";
        case ClaimantStrategy::ModerateApproach: return "moderate-approach";
        case ClaimantStrategy::SettlementFocused: return "settlement-focused";
    }
    return "unknown";
}

std::string strategy_to_string(OpponentStrategy strategy) {
    switch (strategy) {
        case OpponentStrategy::FightToTrial: return "fight-to-trial";
        case OpponentStrategy::Negotiate: return "negotiate";
        case OpponentStrategy::SettleQuick: return "settle-quick";
    }
    return "unknown";
}

OpponentStrategy classify_opponent(double settlement_rate) {
    validate_settlement_rate(settlement_rate);
    if (settlement_rate > SETTLE_QUICK_ABOVE) return OpponentStrategy::SettleQuick;
    if (settlement_rate < FIGHT_TO_TRIAL_BELOW) return OpponentStrategy::FightToTrial;
    return OpponentStrategy::Negotiate;
}

double payoff_multiplier(ClaimantStrategy ours, OpponentStrategy theirs) {
    if (ours == ClaimantStrategy::AggressiveLitigation && theirs == OpponentStrategy::SettleQuick) {
        return 1.2;     // They cave, we get more
    }
    if (ours == ClaimantStrategy::SettlementFocused && theirs == OpponentStrategy::FightToTrial) {
        return 0.7;     // We want to settle, they fight
    }
    if (ours == ClaimantStrategy::ModerateApproach) {
        return 0.95;
    }
    return 1.0;
}

// ============================================================================
// PayoffMatrix Implementation
// ============================================================================

PayoffMatrix::PayoffMatrix(double optimal_expected_value) {
    for (ClaimantStrategy ours : ALL_CLAIMANT_STRATEGIES) {
        for (OpponentStrategy theirs : ALL_OPPONENT_STRATEGIES) {
            cells_[row(ours)][column(theirs)] =
                std::round(optimal_expected_value * payoff_multiplier(ours, theirs));
        }
    }
}

double PayoffMatrix::payoff(ClaimantStrategy ours, OpponentStrategy theirs) const {
    return cells_[row(ours)][column(theirs)];
}

ClaimantStrategy PayoffMatrix::best_response(OpponentStrategy theirs) const {
    ClaimantStrategy best = ALL_CLAIMANT_STRATEGIES[0];
    for (ClaimantStrategy candidate : ALL_CLAIMANT_STRATEGIES) {
        if (payoff(candidate, theirs) > payoff(best, theirs)) {
            best = candidate;
        }
    }
    return best;
}

std::string explain_response(ClaimantStrategy ours, OpponentStrategy theirs) {
    switch (ours) {
        case ClaimantStrategy::AggressiveLitigation:
            switch (theirs) {
                case OpponentStrategy::SettleQuick:
                    return "Press hard - they cave easily. Maximize settlement value.";
                case OpponentStrategy::Negotiate:
                    return "Strong position - they want to talk. Negotiate from strength.";
                case OpponentStrategy::FightToTrial:
                    return "Prepare for battle - they won't back down easily.";
            }
            break;
        case ClaimantStrategy::ModerateApproach:
            switch (theirs) {
                case OpponentStrategy::SettleQuick:
                    return "Match their pace - settle quickly but fairly.";
                case OpponentStrategy::Negotiate:
                    return "Perfect match - productive negotiations likely.";
                case OpponentStrategy::FightToTrial:
                    return "Prepare for trial but keep settlement door open.";
            }
            break;
        case ClaimantStrategy::SettlementFocused:
            switch (theirs) {
                case OpponentStrategy::SettleQuick:
                    return "Quick resolution - both sides want out.";
                case OpponentStrategy::Negotiate:
                    return "We want settlement - negotiate aggressively.";
                case OpponentStrategy::FightToTrial:
                    return "Mismatch - may need to get more aggressive.";
            }
            break;
    }
    return "Standard approach recommended.";
}

BestResponse select_best_response(double optimal_expected_value, double opponent_settlement_rate) {
    OpponentStrategy theirs = classify_opponent(opponent_settlement_rate);
    PayoffMatrix matrix(optimal_expected_value);
    ClaimantStrategy ours = matrix.best_response(theirs);

    return BestResponse{
        ours,
        theirs,
        matrix.payoff(ours, theirs),
        explain_response(ours, theirs),
        matrix
    };
}

} // namespace litisim
