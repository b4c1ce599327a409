#ifndef LITISIM_EXPECTED_VALUE_HPP
#define LITISIM_EXPECTED_VALUE_HPP

#include "scenario.hpp"
#include <string>
#include <vector>

namespace litisim {

// One scenario annotated with its economics
struct ScenarioEvaluation {
    Scenario scenario;
    double net_value;       // value - cost
    double expected_value;  // net_value * base_probability
    double roi;             // net_value / cost; +infinity when cost is zero
    double value_per_day;   // net_value / duration; +infinity when duration is zero
};

struct ExpectedValueSummary {
    double total_expected_value;    // Sum of per-scenario expected values
    double avg_time_days;           // Probability-weighted mean duration
    double best_roi;
    double best_value_per_day;
};

// Ranking of the catalog by expected value.
// ranked() is sorted descending by expected_value; equal values keep catalog
// declaration order, so the ranking is a deterministic total order.
class ExpectedValueReport {
public:
    const std::vector<ScenarioEvaluation>& ranked() const { return ranked_; }

    // Highest expected value scenario
    const ScenarioEvaluation& optimal() const;

    const ExpectedValueSummary& summary() const { return summary_; }

    // Description of the best-ranked settlement scenario, or a generic
    // mid-case recommendation if the ranking has none
    std::string optimal_settlement_timing() const;

private:
    friend ExpectedValueReport evaluate_scenarios(const ScenarioCatalog& catalog);

    std::vector<ScenarioEvaluation> ranked_;
    ExpectedValueSummary summary_{};
};

// Throws EmptyInputError if the catalog is empty
ExpectedValueReport evaluate_scenarios(const ScenarioCatalog& catalog);

// Per-scenario economics; exposed for reuse and testing
ScenarioEvaluation evaluate_scenario(const Scenario& scenario);

} // namespace litisim

#endif // LITISIM_EXPECTED_VALUE_HPP
