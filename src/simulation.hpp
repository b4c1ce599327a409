#ifndef LITISIM_SIMULATION_HPP
#define LITISIM_SIMULATION_HPP

#include "random_source.hpp"
#include "scenario.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace litisim {

// Gaussian spread around a branch mean
struct BranchNoise {
    double value_sd;
    double time_sd;
    double cost_sd;
};

// Hand-tuned sampling constants. The defaults are the historical tuning;
// none of them is empirically validated.
struct SimulationParameters {
    // Cumulative thresholds for the primary roll
    double default_threshold;           // roll < 0.15 -> default judgment
    double early_settlement_threshold;  // roll < 0.40 -> early settlement
    double mid_settlement_threshold;    // roll < 0.75 -> mid settlement

    // Secondary roll over the remaining mass
    double summary_judgment_roll;       // < 0.30 -> summary judgment (strong cases only)
    double late_settlement_roll;        // < 0.55 -> late settlement, else trial

    // Trial win probability = case strength fraction * this ceiling
    double max_trial_win_probability;

    std::array<BranchNoise, SCENARIO_TYPE_COUNT> noise;  // Indexed by scenario_index()

    SimulationParameters();

    const BranchNoise& noise_for(ScenarioType type) const { return noise[scenario_index(type)]; }
    BranchNoise& noise_for(ScenarioType type) { return noise[scenario_index(type)]; }

    // Throws ValidationError if thresholds are outside [0, 1], not ascending,
    // or any standard deviation is negative
    void validate() const;
};

// Trial-level probability of winning once a case reaches trial.
// 0 at strength 0, max_trial_win_probability at strength 10.
double trial_win_probability(const CaseStrength& strength,
                             const SimulationParameters& params = SimulationParameters());

struct SimulationTrial {
    ScenarioType type;
    double value;
    double time_days;
    double cost;
};

struct SimulationStatistics {
    double mean;
    double median;
    double std_dev;
    double min;
    double max;
    double win_rate;                        // Fraction of trials whose outcome is_win()
    std::array<double, 5> percentiles;      // P10, P25, P50, P75, P90 of value
    double avg_time_days;
    double avg_cost;

    double p10() const { return percentiles[0]; }
    double p25() const { return percentiles[1]; }
    double p50() const { return percentiles[2]; }
    double p75() const { return percentiles[3]; }
    double p90() const { return percentiles[4]; }

    SimulationStatistics();
};

struct SimulationResult {
    size_t trial_count;
    SimulationStatistics statistics;
    std::array<size_t, SCENARIO_TYPE_COUNT> outcome_counts;  // Indexed by scenario_index()

    // Raw trials, only populated when retention was requested. Without
    // retention a run keeps one double per trial.
    std::vector<SimulationTrial> trials;

    double execution_time_ms;

    size_t count(ScenarioType type) const { return outcome_counts[scenario_index(type)]; }
    double outcome_fraction(ScenarioType type) const;

    // Arbitrary value percentile; needs retained trials.
    // Throws EmptyInputError when trials were discarded.
    double percentile(double p) const;

    SimulationResult();
};

// Trials are generated in blocks of this size, each block from its own
// random stream. The layout is independent of thread count.
constexpr size_t TRIAL_BLOCK_SIZE = 4096;

// Trial count above which analyze() warns about time and memory cost
constexpr size_t LARGE_TRIAL_COUNT = 1000000;

constexpr size_t DEFAULT_TRIAL_COUNT = 10000;

class MonteCarloSimulator {
public:
    explicit MonteCarloSimulator(const SimulationParameters& params = SimulationParameters());

    const SimulationParameters& parameters() const { return params_; }

    // Runs `trials` independent trials. The injected source only supplies the
    // master seed for the per-block streams, so a source with a fixed seed
    // reproduces the whole result bit-for-bit.
    // Throws InvalidTrialCountError when trials == 0.
    SimulationResult run(const ScenarioCatalog& catalog, size_t trials,
                         RandomSource& rng, bool store_trials = false) const;

    // Picks the outcome class for one trial by cumulative thresholds
    ScenarioType draw_outcome(const CaseStrength& strength, RandomSource& rng) const;

    // One complete trial: outcome plus noisy value, duration and cost
    SimulationTrial simulate_trial(const ScenarioCatalog& catalog, RandomSource& rng) const;

private:
    SimulationParameters params_;
};

struct SimulationConfig {
    size_t trials;
    std::optional<uint64_t> seed;   // Unseeded when empty
    bool store_trials;
    SimulationParameters params;

    SimulationConfig();
};

// Convenience wrapper: builds the random source from config.seed
SimulationResult run_simulation(const ScenarioCatalog& catalog,
                                const SimulationConfig& config = SimulationConfig());

} // namespace litisim

#endif // LITISIM_SIMULATION_HPP
