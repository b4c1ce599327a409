#ifndef LITISIM_ANALYSIS_HPP
#define LITISIM_ANALYSIS_HPP

#include "best_response.hpp"
#include "case_inputs.hpp"
#include "decision_tree.hpp"
#include "expected_value.hpp"
#include "scenario.hpp"
#include "simulation.hpp"
#include "strategy.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace litisim {

// Inputs for one analysis call
struct AnalysisRequest {
    DamagesRange damages;
    int case_strength;                              // Clamped to [0, 10] with a warning
    std::optional<double> opponent_settlement_rate; // Defaults to 0.5; must lie in [0, 1]
    std::optional<long long> trials;                // Defaults to 10,000; must be positive
    std::optional<uint64_t> seed;                   // Reproducible run when set
    bool store_trials;                              // Keep raw per-trial records
    SimulationParameters params;
    std::string analysis_id;                        // Log correlation only

    AnalysisRequest(const DamagesRange& damages, int case_strength);
};

// Everything computed for one case. The tree is explanatory only.
struct Analysis {
    DamagesRange damages;
    CaseStrength strength;
    double opponent_settlement_rate;
    ScenarioCatalog catalog;
    DecisionTree tree;
    ExpectedValueReport expected_values;
    BestResponse response;
    SimulationResult simulation;
    Recommendation recommendation;
};

// Validates a raw trial count. Throws InvalidTrialCountError if not positive.
size_t validate_trial_count(long long trials);

// Full pipeline: catalog -> tree -> expected values -> best response ->
// Monte Carlo -> recommendation. All validation happens before any
// computation; validation errors propagate with no partial result.
Analysis run_analysis(const AnalysisRequest& request);

// Library entry point: returns only the recommendation
Recommendation analyze(const DamagesRange& damages,
                       int case_strength,
                       std::optional<double> opponent_settlement_rate = std::nullopt,
                       std::optional<long long> trials = std::nullopt,
                       std::optional<uint64_t> seed = std::nullopt);

} // namespace litisim

#endif // LITISIM_ANALYSIS_HPP
