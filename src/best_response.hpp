#ifndef LITISIM_BEST_RESPONSE_HPP
#define LITISIM_BEST_RESPONSE_HPP

#include <array>
#include <cstddef>
#include <string>

namespace litisim {

enum class ClaimantStrategy {
    AggressiveLitigation,
    ModerateApproach,
    SettlementFocused
};

enum class OpponentStrategy {
    FightToTrial,
    Negotiate,
    SettleQuick
};

constexpr size_t STRATEGY_COUNT = 3;

constexpr std::array<ClaimantStrategy, STRATEGY_COUNT> ALL_CLAIMANT_STRATEGIES = {
    ClaimantStrategy::AggressiveLitigation,
    ClaimantStrategy::ModerateApproach,
    ClaimantStrategy::SettlementFocused
};

constexpr std::array<OpponentStrategy, STRATEGY_COUNT> ALL_OPPONENT_STRATEGIES = {
    OpponentStrategy::FightToTrial,
    OpponentStrategy::Negotiate,
    OpponentStrategy::SettleQuick
};

std::string strategy_to_string(ClaimantStrategy strategy);   // "aggressive-litigation", ...
std::string strategy_to_string(OpponentStrategy strategy);   // "fight-to-trial", ...

// Opponent classification thresholds on the settlement rate
constexpr double SETTLE_QUICK_ABOVE = 0.7;
constexpr double FIGHT_TO_TRIAL_BELOW = 0.3;

// settle-quick if rate > 0.7, fight-to-trial if rate < 0.3, else negotiate.
// Throws InvalidProbabilityError outside [0, 1].
OpponentStrategy classify_opponent(double settlement_rate);

// Multiplier applied to the optimal expected value for a strategy pair
double payoff_multiplier(ClaimantStrategy ours, OpponentStrategy theirs);

// 3x3 payoff estimates, rows = claimant strategy, columns = opponent strategy
class PayoffMatrix {
public:
    // Every cell is round(optimal_expected_value * multiplier)
    explicit PayoffMatrix(double optimal_expected_value);

    double payoff(ClaimantStrategy ours, OpponentStrategy theirs) const;

    // Claimant strategy with the highest payoff in the given column.
    // Ties resolve to the earlier row (declaration order).
    ClaimantStrategy best_response(OpponentStrategy theirs) const;

private:
    std::array<std::array<double, STRATEGY_COUNT>, STRATEGY_COUNT> cells_;
};

// One-line rationale for playing `ours` against `theirs`
std::string explain_response(ClaimantStrategy ours, OpponentStrategy theirs);

struct BestResponse {
    ClaimantStrategy claimant_strategy;
    OpponentStrategy opponent_strategy;
    double payoff;
    std::string reasoning;
    PayoffMatrix matrix;
};

// Best response against a single inferred opponent strategy.
//
// This is deliberately not a Nash equilibrium: the opponent's strategy is
// fixed from the behavioural signal and never re-optimised against ours.
// A mutual equilibrium would need iterated best responses or an exact
// solution of the matrix game.
BestResponse select_best_response(double optimal_expected_value, double opponent_settlement_rate);

} // namespace litisim

#endif // LITISIM_BEST_RESPONSE_HPP
