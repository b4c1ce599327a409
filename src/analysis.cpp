#include "analysis.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <map>
#include <string>
#include <utility>

namespace litisim {

namespace {

using Clock = std::chrono::high_resolution_clock;

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

} // anonymous namespace

AnalysisRequest::AnalysisRequest(const DamagesRange& damages_, int case_strength_)
    : damages(damages_),
      case_strength(case_strength_),
      opponent_settlement_rate(std::nullopt),
      trials(std::nullopt),
      seed(std::nullopt),
      store_trials(false),
      analysis_id("analysis") {}

size_t validate_trial_count(long long trials) {
    if (trials <= 0) {
        throw InvalidTrialCountError("Trial count must be a positive integer, got " +
                                     std::to_string(trials));
    }
    return static_cast<size_t>(trials);
}

Analysis run_analysis(const AnalysisRequest& request) {
    Logger& logger = Logger::get_instance();
    AnalysisContext ctx(request.analysis_id);
    ctx.stage = "validation";

    double settlement_rate;
    size_t trials;
    try {
        settlement_rate = resolve_settlement_rate(request.opponent_settlement_rate);
        trials = request.trials ? validate_trial_count(*request.trials) : DEFAULT_TRIAL_COUNT;
        request.params.validate();
    } catch (const ValidationError& e) {
        logger.log_error(ctx, e.what());
        throw;
    }

    bool clamped = false;
    CaseStrength strength = CaseStrength::clamp(request.case_strength, &clamped);
    if (clamped) {
        logger.log_warning(ctx, "Case strength " + std::to_string(request.case_strength) +
                                " outside [0, 10]; clamped to " + std::to_string(strength.value()));
    }
    if (trials > LARGE_TRIAL_COUNT) {
        logger.log_warning(ctx, "Trial count " + std::to_string(trials) +
                                " is very large; expect high memory use and run time");
    }

    logger.log_analysis_start(ctx, request.damages, strength.value(), settlement_rate,
                              trials, request.seed);

    ctx.stage = "scenarios";
    auto stage_start = Clock::now();
    ScenarioCatalog catalog = ScenarioCatalog::build(request.damages, strength,
                                                     request.opponent_settlement_rate);
    logger.log_stage_complete(ctx, elapsed_ms(stage_start),
                              {{"settlement_bonus", std::to_string(catalog.settlement_bonus())}});

    ctx.stage = "decision_tree";
    stage_start = Clock::now();
    DecisionTree tree = DecisionTree::build(request.damages, strength);
    logger.log_stage_complete(ctx, elapsed_ms(stage_start),
                              {{"nodes", std::to_string(tree.node_count())}});

    ctx.stage = "expected_value";
    stage_start = Clock::now();
    ExpectedValueReport expected_values = evaluate_scenarios(catalog);
    logger.log_stage_complete(ctx, elapsed_ms(stage_start),
                              {{"optimal", expected_values.optimal().scenario.name}});

    ctx.stage = "best_response";
    stage_start = Clock::now();
    BestResponse response = select_best_response(expected_values.optimal().expected_value,
                                                 settlement_rate);
    for (ClaimantStrategy ours : ALL_CLAIMANT_STRATEGIES) {
        std::map<std::string, std::string> cells;
        for (OpponentStrategy theirs : ALL_OPPONENT_STRATEGIES) {
            cells[strategy_to_string(theirs)] = std::to_string(response.matrix.payoff(ours, theirs));
        }
        logger.log_debug(ctx, "Payoff row " + strategy_to_string(ours), cells);
    }
    logger.log_stage_complete(ctx, elapsed_ms(stage_start),
                              {{"opponent", strategy_to_string(response.opponent_strategy)},
                               {"response", strategy_to_string(response.claimant_strategy)}});

    ctx.stage = "simulation";
    RandomSource rng = request.seed ? RandomSource(*request.seed) : RandomSource();
    MonteCarloSimulator simulator(request.params);
    SimulationResult simulation = simulator.run(catalog, trials, rng, request.store_trials);
    logger.log_simulation_complete(ctx, simulation);

    ctx.stage = "synthesis";
    Recommendation recommendation = synthesize_recommendation(expected_values, response, simulation);
    logger.log_recommendation(ctx, recommendation);

    return Analysis{
        request.damages,
        strength,
        settlement_rate,
        std::move(catalog),
        std::move(tree),
        std::move(expected_values),
        std::move(response),
        std::move(simulation),
        std::move(recommendation)
    };
}

Recommendation analyze(const DamagesRange& damages,
                       int case_strength,
                       std::optional<double> opponent_settlement_rate,
                       std::optional<long long> trials,
                       std::optional<uint64_t> seed) {
    AnalysisRequest request(damages, case_strength);
    request.opponent_settlement_rate = opponent_settlement_rate;
    request.trials = trials;
    request.seed = seed;
    return run_analysis(request).recommendation;
}

} // namespace litisim
