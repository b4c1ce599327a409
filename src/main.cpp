#include <iostream>
#include <fstream>
#include <string>
#include <optional>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include "analysis.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    std::optional<double> conservative;
    std::optional<double> recommended;
    std::optional<double> aggressive;
    std::optional<int> case_strength;
    std::optional<double> settlement_rate;
    std::optional<long long> trials;
    std::optional<uint64_t> seed;
    std::optional<std::string> log_level;
    std::string config_path;
    std::string output_path;
    bool include_tree = false;
    bool store_trials = false;
    bool compact = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "LitiSim v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Case options:\n";
    std::cerr << "  --conservative <amount>     Low end of the damages estimate\n";
    std::cerr << "  --recommended <amount>      Central damages estimate\n";
    std::cerr << "  --aggressive <amount>       High end of the damages estimate\n";
    std::cerr << "  --case-strength <0-10>      Case strength score (clamped to [0, 10])\n";
    std::cerr << "  --settlement-rate <0-1>     Opponent historical settlement rate (default: 0.5)\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --trials <n>                Monte Carlo trials (default: 10000)\n";
    std::cerr << "  --seed <n>                  Seed for a reproducible run\n";
    std::cerr << "  --store-trials              Keep raw trials and include them in the output\n\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  --config <path>             JSON config file (command-line flags take precedence)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             Write JSON results to file (default: stdout)\n";
    std::cerr << "  --tree                      Include the decision tree in the output\n";
    std::cerr << "  --compact                   Single-line JSON\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --conservative 30000 --recommended 50000 \\\n";
    std::cerr << "         --aggressive 75000 --case-strength 8 --settlement-rate 0.4 \\\n";
    std::cerr << "         --trials 10000 --seed 42 --output recommendation.json\n";
}

// std::sto* stop at the first bad character; the whole token must parse
double parse_double(const std::string& text) {
    size_t pos = 0;
    double value = std::stod(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return value;
}

long long parse_integer(const std::string& text) {
    size_t pos = 0;
    long long value = std::stoll(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("not an integer");
    }
    return value;
}

int parse_int(const std::string& text) {
    long long value = parse_integer(text);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::out_of_range("integer out of range");
    }
    return static_cast<int>(value);
}

// stoull accepts a leading minus sign and wraps around
uint64_t parse_seed(const std::string& text) {
    if (text.empty() || text[0] == '-') {
        throw std::invalid_argument("seed must be non-negative");
    }
    size_t pos = 0;
    unsigned long long value = std::stoull(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("not an integer");
    }
    return static_cast<uint64_t>(value);
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--conservative" && i + 1 < argc) {
                args.conservative = parse_double(argv[++i]);
            } else if (arg == "--recommended" && i + 1 < argc) {
                args.recommended = parse_double(argv[++i]);
            } else if (arg == "--aggressive" && i + 1 < argc) {
                args.aggressive = parse_double(argv[++i]);
            } else if (arg == "--case-strength" && i + 1 < argc) {
                args.case_strength = parse_int(argv[++i]);
            } else if (arg == "--settlement-rate" && i + 1 < argc) {
                args.settlement_rate = parse_double(argv[++i]);
            } else if (arg == "--trials" && i + 1 < argc) {
                args.trials = parse_integer(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = parse_seed(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--tree") {
                args.include_tree = true;
            } else if (arg == "--store-trials") {
                args.store_trials = true;
            } else if (arg == "--compact") {
                args.compact = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            // Parsers throw invalid_argument / out_of_range
            std::cerr << "Error: Invalid value for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.log_level && *args.log_level != "DEBUG" && *args.log_level != "INFO" &&
        *args.log_level != "WARN" && *args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

// Command-line values win over config values
template <typename T>
std::optional<T> pick(const std::optional<T>& flag, const std::optional<T>& config) {
    return flag ? flag : config;
}

bool require_case_inputs(const litisim::CaseConfig& inputs) {
    bool valid = true;
    if (!inputs.conservative) {
        std::cerr << "Error: --conservative is required (or case.damages.conservative in --config)\n";
        valid = false;
    }
    if (!inputs.recommended) {
        std::cerr << "Error: --recommended is required (or case.damages.recommended in --config)\n";
        valid = false;
    }
    if (!inputs.aggressive) {
        std::cerr << "Error: --aggressive is required (or case.damages.aggressive in --config)\n";
        valid = false;
    }
    if (!inputs.case_strength) {
        std::cerr << "Error: --case-strength is required (or case.case_strength in --config)\n";
        valid = false;
    }
    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        litisim::EngineConfig config;
        if (!args.config_path.empty()) {
            std::cerr << "Loading config: " << args.config_path << "\n";
            config = litisim::parse_engine_config_from_file(args.config_path);
        }

        litisim::CaseConfig inputs;
        inputs.conservative = pick(args.conservative, config.case_inputs.conservative);
        inputs.recommended = pick(args.recommended, config.case_inputs.recommended);
        inputs.aggressive = pick(args.aggressive, config.case_inputs.aggressive);
        inputs.case_strength = pick(args.case_strength, config.case_inputs.case_strength);
        inputs.opponent_settlement_rate =
            pick(args.settlement_rate, config.case_inputs.opponent_settlement_rate);

        if (!require_case_inputs(inputs)) {
            std::cerr << "\nUse --help for usage information.\n";
            return 1;
        }

        if (args.log_level) {
            config.logging.min_level = litisim::string_to_level(*args.log_level);
        }
        litisim::Logger::get_instance().configure(config.logging);

        litisim::AnalysisRequest request(
            litisim::DamagesRange(*inputs.conservative, *inputs.recommended, *inputs.aggressive),
            *inputs.case_strength);
        request.opponent_settlement_rate = inputs.opponent_settlement_rate;
        request.trials = pick(args.trials, config.trials);
        request.seed = pick(args.seed, config.seed);
        request.store_trials = args.store_trials || config.store_trials;
        request.params = config.params;
        request.analysis_id = "cli";

        std::cerr << "LitiSim v1.0.0\n";
        std::cerr << "Configuration:\n";
        std::cerr << "  Damages:         " << *inputs.conservative << " / "
                  << *inputs.recommended << " / " << *inputs.aggressive << "\n";
        std::cerr << "  Case strength:   " << *inputs.case_strength << "\n";
        std::cerr << "  Settlement rate: "
                  << inputs.opponent_settlement_rate.value_or(litisim::DEFAULT_SETTLEMENT_RATE) << "\n";
        std::cerr << "  Trials:          "
                  << request.trials.value_or(static_cast<long long>(litisim::DEFAULT_TRIAL_COUNT)) << "\n";
        if (request.seed) {
            std::cerr << "  Seed:            " << *request.seed << "\n";
        }
        std::cerr << "\n";

        std::cerr << "Running analysis..." << std::flush;
        litisim::Analysis analysis = litisim::run_analysis(request);
        std::cerr << " done\n";

        const litisim::Recommendation& rec = analysis.recommendation;
        std::cerr << "\nRecommendation:\n";
        std::cerr << "  Strategy:        " << rec.primary_strategy << " ("
                  << litisim::strategy_to_string(rec.claimant_strategy) << " vs "
                  << litisim::strategy_to_string(rec.opponent_strategy) << ")\n";
        std::cerr << "  Expected value:  " << litisim::format_currency(rec.expected_value) << "\n";
        std::cerr << "  Win probability: " << rec.win_probability << "\n";
        std::cerr << "  Demand:          " << litisim::format_currency(rec.demand_anchor) << "\n";
        std::cerr << "  Target:          " << litisim::format_currency(rec.target_settlement) << "\n";
        std::cerr << "  Floor:           " << litisim::format_currency(rec.acceptance_floor) << "\n";
        std::cerr << "  Volatility:      " << litisim::volatility_to_string(rec.risk.volatility) << "\n";
        std::cerr << "  Execution:       " << analysis.simulation.execution_time_ms << " ms\n";

        litisim::io::JsonOutputOptions options;
        options.pretty_print = !args.compact;
        options.include_tree = args.include_tree;
        options.include_trials = request.store_trials;

        if (args.output_path.empty()) {
            litisim::io::write_analysis_json(std::cout, analysis, options);
        } else {
            litisim::io::write_analysis_json(args.output_path, analysis, options);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        litisim::Logger::get_instance().flush();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
