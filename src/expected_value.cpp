#include "expected_value.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>

namespace litisim {

namespace {

// Division with the documented +infinity sentinel for a zero divisor
double ratio_or_infinity(double numerator, double denominator) {
    if (denominator == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return numerator / denominator;
}

} // anonymous namespace

ScenarioEvaluation evaluate_scenario(const Scenario& scenario) {
    ScenarioEvaluation eval;
    eval.scenario = scenario;
    eval.net_value = scenario.value - scenario.cost;
    eval.expected_value = eval.net_value * scenario.base_probability;
    eval.roi = ratio_or_infinity(eval.net_value, scenario.cost);
    eval.value_per_day = ratio_or_infinity(eval.net_value,
                                           static_cast<double>(scenario.duration_days));
    return eval;
}

ExpectedValueReport evaluate_scenarios(const ScenarioCatalog& catalog) {
    if (catalog.empty()) {
        throw EmptyInputError("Cannot evaluate an empty scenario catalog");
    }

    ExpectedValueReport report;
    report.ranked_.reserve(catalog.size());
    for (const Scenario& scenario : catalog.scenarios()) {
        report.ranked_.push_back(evaluate_scenario(scenario));
    }

    // Summary is computed before sorting; none of it depends on order
    double total_probability = 0.0;
    double weighted_time = 0.0;
    ExpectedValueSummary& summary = report.summary_;
    summary.total_expected_value = 0.0;
    summary.best_roi = 0.0;
    summary.best_value_per_day = 0.0;
    for (const ScenarioEvaluation& eval : report.ranked_) {
        total_probability += eval.scenario.base_probability;
        weighted_time += eval.scenario.duration_days * eval.scenario.base_probability;
        summary.total_expected_value += eval.expected_value;
        summary.best_roi = std::max(summary.best_roi, eval.roi);
        summary.best_value_per_day = std::max(summary.best_value_per_day, eval.value_per_day);
    }
    summary.avg_time_days = total_probability > 0.0 ? weighted_time / total_probability : 0.0;

    std::stable_sort(report.ranked_.begin(), report.ranked_.end(),
                     [](const ScenarioEvaluation& a, const ScenarioEvaluation& b) {
                         return a.expected_value > b.expected_value;
                     });
    return report;
}

const ScenarioEvaluation& ExpectedValueReport::optimal() const {
    if (ranked_.empty()) {
        throw EmptyInputError("Expected value ranking is empty");
    }
    return ranked_.front();
}

std::string ExpectedValueReport::optimal_settlement_timing() const {
    for (const ScenarioEvaluation& eval : ranked_) {
        if (is_settlement(eval.scenario.type)) {
            return eval.scenario.description;
        }
    }
    return "Mid-case settlement recommended";
}

} // namespace litisim
