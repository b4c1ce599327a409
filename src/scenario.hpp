#ifndef LITISIM_SCENARIO_HPP
#define LITISIM_SCENARIO_HPP

#include "case_inputs.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace litisim {

// The seven canonical terminal outcomes, in declaration order.
// Declaration order is also the tie-break order of the expected value ranking.
enum class ScenarioType {
    DefaultJudgment,
    EarlySettlement,
    MidSettlement,
    LateSettlement,
    TrialWin,
    TrialLoss,
    SummaryJudgmentWin
};

constexpr size_t SCENARIO_TYPE_COUNT = 7;

constexpr std::array<ScenarioType, SCENARIO_TYPE_COUNT> ALL_SCENARIO_TYPES = {
    ScenarioType::DefaultJudgment,
    ScenarioType::EarlySettlement,
    ScenarioType::MidSettlement,
    ScenarioType::LateSettlement,
    ScenarioType::TrialWin,
    ScenarioType::TrialLoss,
    ScenarioType::SummaryJudgmentWin
};

constexpr size_t scenario_index(ScenarioType type) {
    return static_cast<size_t>(type);
}

// Short machine key, e.g. "mid-settlement"
std::string scenario_key(ScenarioType type);

// Inverse of scenario_key(); empty for unknown keys
std::optional<ScenarioType> scenario_type_from_key(const std::string& key);

// Display name, e.g. "Post-Discovery Settlement"
std::string scenario_name(ScenarioType type);

bool is_settlement(ScenarioType type);

// Every outcome except a trial loss returns a nonzero recovery
inline bool is_win(ScenarioType type) {
    return type != ScenarioType::TrialLoss;
}

// One terminal outcome class materialised for a specific case
struct Scenario {
    ScenarioType type;
    std::string name;
    std::string description;
    double base_probability;    // Path likelihood given the branch is reached
    double value;               // Gross recovery
    double cost;                // Litigation cost to reach this outcome
    int duration_days;
};

// Settlement probabilities rise by this much against an opponent that
// settles more than SETTLEMENT_BONUS_THRESHOLD of its cases
constexpr double SETTLEMENT_BONUS = 0.10;
constexpr double SETTLEMENT_BONUS_THRESHOLD = 0.6;

// Case strength above which summary judgment becomes likely
constexpr int STRONG_CASE_THRESHOLD = 7;

// Fixed catalog of the seven scenarios for one case.
//
// Base probabilities are conditional path likelihoods, NOT a partition:
// they do not sum to 1. Aggregate statistics therefore come from the
// Monte Carlo simulation, never from summing probability x value here.
class ScenarioCatalog {
public:
    // Never fails: inputs are already validated by their types.
    // opponent_settlement_rate is the raw behavioural signal if known.
    static ScenarioCatalog build(const DamagesRange& damages,
                                 const CaseStrength& strength,
                                 const std::optional<double>& opponent_settlement_rate = std::nullopt);

    const Scenario& get(ScenarioType type) const;
    const std::vector<Scenario>& scenarios() const { return scenarios_; }
    size_t size() const { return scenarios_.size(); }
    bool empty() const { return scenarios_.empty(); }

    const DamagesRange& damages() const { return damages_; }
    const CaseStrength& strength() const { return strength_; }
    double settlement_bonus() const { return settlement_bonus_; }

private:
    ScenarioCatalog(const DamagesRange& damages, const CaseStrength& strength);

    DamagesRange damages_;
    CaseStrength strength_;
    double settlement_bonus_;
    std::vector<Scenario> scenarios_;
};

// Gross value formula for a scenario type (pure function of the damages range)
double scenario_value(ScenarioType type, const DamagesRange& damages);

} // namespace litisim

#endif // LITISIM_SCENARIO_HPP
