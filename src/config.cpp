#include "config.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace litisim {

EngineConfig::EngineConfig()
    : trials(std::nullopt), seed(std::nullopt), store_trials(false) {}

namespace {

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

template <typename T>
void read_value(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

// get<integer>() silently truncates fractions and wraps negatives
template <typename T>
void read_integer(const json& j, const char* key, std::optional<T>& out, bool non_negative) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    const json& value = j[key];
    if (!value.is_number_integer()) {
        throw ConfigParseError(std::string(key) + " must be an integer");
    }
    if (non_negative && !value.is_number_unsigned()) {
        throw ConfigParseError(std::string(key) + " must be a non-negative integer");
    }
    out = value.get<T>();
}

void parse_case(const json& j, CaseConfig& config) {
    if (j.contains("damages")) {
        const json& damages = j["damages"];
        read_optional(damages, "conservative", config.conservative);
        read_optional(damages, "recommended", config.recommended);
        read_optional(damages, "aggressive", config.aggressive);
    }
    read_integer(j, "case_strength", config.case_strength, false);
    read_optional(j, "opponent_settlement_rate", config.opponent_settlement_rate);
}

void parse_simulation(const json& j, EngineConfig& config) {
    read_integer(j, "trials", config.trials, false);
    read_integer(j, "seed", config.seed, true);
    read_value(j, "store_trials", config.store_trials);

    SimulationParameters& params = config.params;
    if (j.contains("thresholds")) {
        const json& t = j["thresholds"];
        read_value(t, "default", params.default_threshold);
        read_value(t, "early_settlement", params.early_settlement_threshold);
        read_value(t, "mid_settlement", params.mid_settlement_threshold);
        read_value(t, "summary_judgment", params.summary_judgment_roll);
        read_value(t, "late_settlement", params.late_settlement_roll);
        read_value(t, "max_trial_win", params.max_trial_win_probability);
    }

    if (j.contains("noise")) {
        for (const auto& [key, value] : j["noise"].items()) {
            std::optional<ScenarioType> type = scenario_type_from_key(key);
            if (!type) {
                throw ConfigParseError("Unknown scenario in simulation.noise: " + key);
            }
            BranchNoise& noise = params.noise_for(*type);
            read_value(value, "value", noise.value_sd);
            read_value(value, "time", noise.time_sd);
            read_value(value, "cost", noise.cost_sd);
        }
    }
}

void parse_logging(const json& j, LoggerConfig& config) {
    if (j.contains("level")) {
        config.min_level = string_to_level(j["level"].get<std::string>());
    }
    read_value(j, "json", config.enable_json);
    read_value(j, "console", config.enable_console);
    if (j.contains("file")) {
        config.log_file_path = j["file"].get<std::string>();
        config.enable_file = !config.log_file_path.empty();
    }
}

EngineConfig parse_engine_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigParseError("Config root must be a JSON object");
    }

    EngineConfig config;
    try {
        if (j.contains("case")) parse_case(j["case"], config.case_inputs);
        if (j.contains("simulation")) parse_simulation(j["simulation"], config);
        if (j.contains("logging")) parse_logging(j["logging"], config.logging);
    } catch (const json::exception& e) {
        throw ConfigParseError("Invalid config value: " + std::string(e.what()));
    }
    return config;
}

} // anonymous namespace

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream f(file_path);
    if (!f.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw ConfigParseError("Failed to parse JSON in " + file_path + ": " + std::string(e.what()));
    }
    return parse_engine_config(j);
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::exception& e) {
        throw ConfigParseError("Failed to parse JSON: " + std::string(e.what()));
    }
    return parse_engine_config(j);
}

} // namespace litisim
