#ifndef LITISIM_CONFIG_HPP
#define LITISIM_CONFIG_HPP

#include "logger.hpp"
#include "simulation.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace litisim {

/**
 * @brief Exception thrown when a config document cannot be read or has the wrong shape
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Case inputs as found in the "case" section; every field is optional
 * so command-line flags can fill the gaps
 */
struct CaseConfig {
    std::optional<double> conservative;
    std::optional<double> recommended;
    std::optional<double> aggressive;
    std::optional<int> case_strength;
    std::optional<double> opponent_settlement_rate;
};

/**
 * @brief Complete engine configuration
 *
 * Expected JSON layout (all sections and keys optional):
 *   @code
 *   {
 *     "case": {
 *       "damages": {"conservative": 30000, "recommended": 50000, "aggressive": 75000},
 *       "case_strength": 8,
 *       "opponent_settlement_rate": 0.4
 *     },
 *     "simulation": {
 *       "trials": 10000, "seed": 42, "store_trials": false,
 *       "thresholds": {"default": 0.15, "early_settlement": 0.40, "mid_settlement": 0.75,
 *                      "summary_judgment": 0.30, "late_settlement": 0.55, "max_trial_win": 0.75},
 *       "noise": {"trial-win": {"value": 15000, "time": 60, "cost": 3000}}
 *     },
 *     "logging": {"level": "INFO", "json": true, "console": true, "file": "litisim.log"}
 *   }
 *   @endcode
 */
struct EngineConfig {
    CaseConfig case_inputs;
    std::optional<long long> trials;
    std::optional<uint64_t> seed;
    bool store_trials;
    SimulationParameters params;
    LoggerConfig logging;

    EngineConfig();
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid,
 *         a key has the wrong type, or a noise entry names an unknown scenario
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * @throws ConfigParseError on malformed input (see parse_engine_config_from_file)
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

} // namespace litisim

#endif // LITISIM_CONFIG_HPP
