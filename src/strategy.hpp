#ifndef LITISIM_STRATEGY_HPP
#define LITISIM_STRATEGY_HPP

#include "best_response.hpp"
#include "expected_value.hpp"
#include "simulation.hpp"
#include <string>
#include <vector>

namespace litisim {

struct TimingGuidance {
    std::string optimal_settlement;     // Description of the best settlement path
    double estimated_duration_days;     // Mean simulated duration, rounded
    double estimated_cost;              // Mean simulated cost, rounded
};

enum class Volatility { Low, Medium, High };

std::string volatility_to_string(Volatility v);

// stdDev > 20,000 is High, > 10,000 Medium, else Low
Volatility classify_volatility(double std_dev);

struct RiskAssessment {
    double best_case;       // P90
    double worst_case;      // P10
    double most_likely;     // Median
    Volatility volatility;
};

// Final output of one analysis. Monetary anchors are rounded to whole units.
struct Recommendation {
    std::string primary_strategy;       // Optimal scenario name
    ClaimantStrategy claimant_strategy;
    OpponentStrategy opponent_strategy;
    std::string strategy_reasoning;
    double expected_value;
    double win_probability;             // In [0, 1]

    double demand_anchor;               // P75
    double acceptance_floor;            // P25
    double target_settlement;           // Median

    TimingGuidance timing;
    RiskAssessment risk;
    std::vector<std::string> tactics;
    std::string bottom_line;
};

// Bottom-line assessment keyed on win rate
std::string assess_bottom_line(double win_rate);

// Tactical template strings for the chosen response and simulated distribution
std::vector<std::string> generate_tactics(const BestResponse& response,
                                          const SimulationStatistics& statistics);

// Merges the three analyses into one Recommendation. Pure aggregation.
Recommendation synthesize_recommendation(const ExpectedValueReport& expected_values,
                                         const BestResponse& response,
                                         const SimulationResult& simulation);

// Thousands-separated whole currency amount, e.g. "$42,500"
std::string format_currency(double amount);

} // namespace litisim

#endif // LITISIM_STRATEGY_HPP
