#include "strategy.hpp"
#include <cmath>
#include <cstdlib>
#include <string>

namespace litisim {

std::string volatility_to_string(Volatility v) {
    switch (v) {
        case Volatility::Low: return "Low";
        case Volatility::Medium: return "Medium";
        case Volatility::High: return "High";
    }
    return "Unknown";
}

Volatility classify_volatility(double std_dev) {
    if (std_dev > 20000.0) return Volatility::High;
    if (std_dev > 10000.0) return Volatility::Medium;
    return Volatility::Low;
}

std::string format_currency(double amount) {
    long long whole = std::llround(amount);
    std::string digits = std::to_string(std::llabs(whole));

    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }
    return (whole < 0 ? "-$" : "$") + grouped;
}

std::string assess_bottom_line(double win_rate) {
    if (win_rate > 0.85) {
        return "Extremely strong case. Press hard and don't settle cheap.";
    }
    if (win_rate > 0.70) {
        return "Strong case. Negotiate from position of strength.";
    }
    if (win_rate > 0.55) {
        return "Moderate case. Balance aggression with settlement flexibility.";
    }
    return "Weaker case. Focus on settlement with reasonable expectations.";
}

std::vector<std::string> generate_tactics(const BestResponse& response,
                                          const SimulationStatistics& statistics) {
    std::vector<std::string> tactics;
    tactics.push_back("Use " + strategy_to_string(response.claimant_strategy) + " approach");
    tactics.push_back("Start high: demand " + format_currency(statistics.p75()));
    tactics.push_back("Show trial readiness but signal settlement willingness");
    if (statistics.win_rate > 0.7) {
        tactics.push_back("Press hard - high win probability");
    } else {
        tactics.push_back("Be flexible - moderate win probability");
    }
    tactics.push_back("Don't accept below " + format_currency(statistics.p25()));
    return tactics;
}

Recommendation synthesize_recommendation(const ExpectedValueReport& expected_values,
                                         const BestResponse& response,
                                         const SimulationResult& simulation) {
    const SimulationStatistics& stats = simulation.statistics;
    const ScenarioEvaluation& optimal = expected_values.optimal();

    Recommendation rec;
    rec.primary_strategy = optimal.scenario.name;
    rec.claimant_strategy = response.claimant_strategy;
    rec.opponent_strategy = response.opponent_strategy;
    rec.strategy_reasoning = response.reasoning;
    rec.expected_value = std::round(optimal.expected_value);
    rec.win_probability = stats.win_rate;

    rec.demand_anchor = std::round(stats.p75());
    rec.acceptance_floor = std::round(stats.p25());
    rec.target_settlement = std::round(stats.median);

    rec.timing.optimal_settlement = expected_values.optimal_settlement_timing();
    rec.timing.estimated_duration_days = std::round(stats.avg_time_days);
    rec.timing.estimated_cost = std::round(stats.avg_cost);

    rec.risk.best_case = std::round(stats.p90());
    rec.risk.worst_case = std::round(stats.p10());
    rec.risk.most_likely = std::round(stats.median);
    rec.risk.volatility = classify_volatility(stats.std_dev);

    rec.tactics = generate_tactics(response, stats);
    rec.bottom_line = assess_bottom_line(stats.win_rate);
    return rec;
}

} // namespace litisim
