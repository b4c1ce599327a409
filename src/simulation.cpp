#include "simulation.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace litisim {

// ============================================================================
// SimulationParameters Implementation
// ============================================================================

SimulationParameters::SimulationParameters()
    : default_threshold(0.15),
      early_settlement_threshold(0.40),
      mid_settlement_threshold(0.75),
      summary_judgment_roll(0.30),
      late_settlement_roll(0.55),
      max_trial_win_probability(0.75) {
    noise_for(ScenarioType::DefaultJudgment) = {5000.0, 15.0, 200.0};
    noise_for(ScenarioType::EarlySettlement) = {5000.0, 20.0, 500.0};
    noise_for(ScenarioType::MidSettlement) = {8000.0, 40.0, 1500.0};
    noise_for(ScenarioType::LateSettlement) = {10000.0, 45.0, 2000.0};
    noise_for(ScenarioType::TrialWin) = {15000.0, 60.0, 3000.0};
    noise_for(ScenarioType::TrialLoss) = {0.0, 60.0, 3000.0};
    noise_for(ScenarioType::SummaryJudgmentWin) = {10000.0, 30.0, 1000.0};
}

void SimulationParameters::validate() const {
    auto in_unit = [](double v) { return v >= 0.0 && v <= 1.0; };

    if (!in_unit(default_threshold) || !in_unit(early_settlement_threshold) ||
        !in_unit(mid_settlement_threshold) || !in_unit(summary_judgment_roll) ||
        !in_unit(late_settlement_roll) || !in_unit(max_trial_win_probability)) {
        throw ValidationError("Simulation thresholds must lie in [0, 1]");
    }
    if (default_threshold > early_settlement_threshold ||
        early_settlement_threshold > mid_settlement_threshold) {
        throw ValidationError("Primary roll thresholds must be ascending");
    }
    if (summary_judgment_roll > late_settlement_roll) {
        throw ValidationError("Summary judgment roll must not exceed late settlement roll");
    }
    for (const BranchNoise& n : noise) {
        if (n.value_sd < 0.0 || n.time_sd < 0.0 || n.cost_sd < 0.0) {
            throw ValidationError("Noise standard deviations must be non-negative");
        }
    }
}

double trial_win_probability(const CaseStrength& strength, const SimulationParameters& params) {
    return strength.fraction() * params.max_trial_win_probability;
}

// ============================================================================
// Result types
// ============================================================================

SimulationStatistics::SimulationStatistics()
    : mean(0.0), median(0.0), std_dev(0.0), min(0.0), max(0.0), win_rate(0.0),
      percentiles{0.0, 0.0, 0.0, 0.0, 0.0},
      avg_time_days(0.0), avg_cost(0.0) {}

SimulationResult::SimulationResult()
    : trial_count(0), outcome_counts{}, execution_time_ms(0.0) {}

double SimulationResult::outcome_fraction(ScenarioType type) const {
    if (trial_count == 0) {
        return 0.0;
    }
    return static_cast<double>(count(type)) / static_cast<double>(trial_count);
}

double SimulationResult::percentile(double p) const {
    if (trials.empty()) {
        throw EmptyInputError("Trials were not retained; only the summary percentiles are available");
    }
    std::vector<double> values;
    values.reserve(trials.size());
    for (const SimulationTrial& t : trials) {
        values.push_back(t.value);
    }
    return stats::percentile(values, p);
}

SimulationConfig::SimulationConfig()
    : trials(DEFAULT_TRIAL_COUNT), seed(std::nullopt), store_trials(false) {}

// ============================================================================
// MonteCarloSimulator Implementation
// ============================================================================

namespace {

struct BlockTotals {
    std::array<size_t, SCENARIO_TYPE_COUNT> outcome_counts{};
    size_t wins = 0;
    double time_sum = 0.0;
    double cost_sum = 0.0;
};

} // anonymous namespace

MonteCarloSimulator::MonteCarloSimulator(const SimulationParameters& params)
    : params_(params) {
    params_.validate();
}

ScenarioType MonteCarloSimulator::draw_outcome(const CaseStrength& strength,
                                               RandomSource& rng) const {
    double roll = rng.uniform();
    if (roll < params_.default_threshold) return ScenarioType::DefaultJudgment;
    if (roll < params_.early_settlement_threshold) return ScenarioType::EarlySettlement;
    if (roll < params_.mid_settlement_threshold) return ScenarioType::MidSettlement;

    // Remaining mass: summary judgment, late settlement or trial
    double trial_roll = rng.uniform();
    if (strength.value() > STRONG_CASE_THRESHOLD && trial_roll < params_.summary_judgment_roll) {
        return ScenarioType::SummaryJudgmentWin;
    }
    if (trial_roll < params_.late_settlement_roll) {
        return ScenarioType::LateSettlement;
    }

    double win_roll = rng.uniform();
    if (win_roll < trial_win_probability(strength, params_)) {
        return ScenarioType::TrialWin;
    }
    return ScenarioType::TrialLoss;
}

SimulationTrial MonteCarloSimulator::simulate_trial(const ScenarioCatalog& catalog,
                                                    RandomSource& rng) const {
    SimulationTrial trial;
    trial.type = draw_outcome(catalog.strength(), rng);

    const Scenario& branch = catalog.get(trial.type);
    const BranchNoise& noise = params_.noise_for(trial.type);

    // A lost trial recovers exactly nothing; no draw is spent on its value
    trial.value = trial.type == ScenarioType::TrialLoss
        ? 0.0
        : stats::sample_normal(rng, branch.value, noise.value_sd);
    trial.time_days = stats::sample_normal(rng, branch.duration_days, noise.time_sd);
    trial.cost = stats::sample_normal(rng, branch.cost, noise.cost_sd);
    return trial;
}

SimulationResult MonteCarloSimulator::run(const ScenarioCatalog& catalog, size_t trials,
                                          RandomSource& rng, bool store_trials) const {
    if (trials == 0) {
        throw InvalidTrialCountError("Trial count must be a positive integer");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    SimulationResult result;
    result.trial_count = trials;

    const uint64_t master_seed = rng.next_u64();
    const size_t num_blocks = (trials + TRIAL_BLOCK_SIZE - 1) / TRIAL_BLOCK_SIZE;

    // Only the values are kept per trial; durations, costs and outcome
    // counts are reduced per block. Full records exist only on request.
    std::vector<double> values(trials);
    std::vector<BlockTotals> totals(num_blocks);
    if (store_trials) {
        result.trials.resize(trials);
    }

    // Each block writes only its own slice and its own totals; the join
    // below is the only synchronisation point
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
    for (long long b = 0; b < static_cast<long long>(num_blocks); ++b) {
        size_t block = static_cast<size_t>(b);
#else
    for (size_t block = 0; block < num_blocks; ++block) {
#endif
        RandomSource stream = RandomSource::for_stream(master_seed, block);
        BlockTotals& block_totals = totals[block];
        size_t begin = block * TRIAL_BLOCK_SIZE;
        size_t end = std::min(trials, begin + TRIAL_BLOCK_SIZE);
        for (size_t i = begin; i < end; ++i) {
            SimulationTrial trial = simulate_trial(catalog, stream);
            values[i] = trial.value;
            ++block_totals.outcome_counts[scenario_index(trial.type)];
            if (is_win(trial.type)) {
                ++block_totals.wins;
            }
            block_totals.time_sum += trial.time_days;
            block_totals.cost_sum += trial.cost;
            if (store_trials) {
                result.trials[i] = trial;
            }
        }
    }

    // Combine in block order so the sums do not depend on scheduling
    size_t wins = 0;
    double time_sum = 0.0;
    double cost_sum = 0.0;
    for (const BlockTotals& block_totals : totals) {
        for (size_t k = 0; k < SCENARIO_TYPE_COUNT; ++k) {
            result.outcome_counts[k] += block_totals.outcome_counts[k];
        }
        wins += block_totals.wins;
        time_sum += block_totals.time_sum;
        cost_sum += block_totals.cost_sum;
    }

    const double n = static_cast<double>(trials);
    SimulationStatistics& s = result.statistics;
    s.mean = stats::mean(values);
    s.std_dev = stats::std_dev(values);

    // Order statistics from one in-place sort
    std::sort(values.begin(), values.end());
    s.min = values.front();
    s.max = values.back();
    s.median = stats::median_sorted(values);
    s.percentiles[0] = stats::percentile_sorted(values, 10.0);
    s.percentiles[1] = stats::percentile_sorted(values, 25.0);
    s.percentiles[2] = stats::percentile_sorted(values, 50.0);
    s.percentiles[3] = stats::percentile_sorted(values, 75.0);
    s.percentiles[4] = stats::percentile_sorted(values, 90.0);

    s.win_rate = static_cast<double>(wins) / n;
    s.avg_time_days = time_sum / n;
    s.avg_cost = cost_sum / n;

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return result;
}

SimulationResult run_simulation(const ScenarioCatalog& catalog, const SimulationConfig& config) {
    RandomSource rng = config.seed ? RandomSource(*config.seed) : RandomSource();
    MonteCarloSimulator simulator(config.params);
    return simulator.run(catalog, config.trials, rng, config.store_trials);
}

} // namespace litisim
