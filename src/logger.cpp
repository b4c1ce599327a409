/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "case_inputs.hpp"
#include "simulation.hpp"
#include "strategy.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace litisim {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    } else {
        file_stream_.reset();
    }
}

void Logger::log_analysis_start(
    const AnalysisContext& ctx,
    const DamagesRange& damages,
    int case_strength,
    double opponent_settlement_rate,
    size_t trials,
    const std::optional<uint64_t>& seed
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "analysis_start";
    fields["analysis_id"] = ctx.analysis_id;
    fields["damages_conservative"] = std::to_string(damages.conservative());
    fields["damages_recommended"] = std::to_string(damages.recommended());
    fields["damages_aggressive"] = std::to_string(damages.aggressive());
    fields["case_strength"] = std::to_string(case_strength);
    fields["opponent_settlement_rate"] = std::to_string(opponent_settlement_rate);
    fields["trials"] = std::to_string(trials);
    fields["seed"] = seed ? std::to_string(*seed) : "none";

    log(LogLevel::INFO, "Starting analysis", fields);
}

void Logger::log_stage_complete(
    const AnalysisContext& ctx,
    double elapsed_ms,
    const std::map<std::string, std::string>& details
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "stage_complete";
    fields["analysis_id"] = ctx.analysis_id;
    fields["stage"] = ctx.stage;
    fields["elapsed_ms"] = std::to_string(elapsed_ms);
    for (const auto& [key, value] : details) {
        fields["detail." + key] = value;
    }

    log(LogLevel::INFO, "Stage complete", fields);
}

void Logger::log_simulation_complete(
    const AnalysisContext& ctx,
    const SimulationResult& result
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_complete";
    fields["analysis_id"] = ctx.analysis_id;
    fields["trials"] = std::to_string(result.trial_count);
    fields["mean"] = std::to_string(result.statistics.mean);
    fields["median"] = std::to_string(result.statistics.median);
    fields["std_dev"] = std::to_string(result.statistics.std_dev);
    fields["win_rate"] = std::to_string(result.statistics.win_rate);
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    fields["throughput_trials_per_sec"] = std::to_string(
        result.execution_time_ms > 0 ? (result.trial_count * 1000.0 / result.execution_time_ms) : 0
    );

    log(LogLevel::INFO, "Monte Carlo simulation complete", fields);
}

void Logger::log_recommendation(
    const AnalysisContext& ctx,
    const Recommendation& recommendation
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "recommendation";
    fields["analysis_id"] = ctx.analysis_id;
    fields["primary_strategy"] = recommendation.primary_strategy;
    fields["claimant_strategy"] = strategy_to_string(recommendation.claimant_strategy);
    fields["opponent_strategy"] = strategy_to_string(recommendation.opponent_strategy);
    fields["demand_anchor"] = std::to_string(recommendation.demand_anchor);
    fields["target_settlement"] = std::to_string(recommendation.target_settlement);
    fields["acceptance_floor"] = std::to_string(recommendation.acceptance_floor);

    log(LogLevel::INFO, "Recommendation produced", fields);
}

void Logger::log_error(
    const AnalysisContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["analysis_id"] = ctx.analysis_id;
    fields["stage"] = ctx.stage;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Analysis error", fields);
}

void Logger::log_warning(
    const AnalysisContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["analysis_id"] = ctx.analysis_id;
    fields["stage"] = ctx.stage;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_debug(
    const AnalysisContext& ctx,
    const std::string& message,
    const std::map<std::string, std::string>& details
) {
    std::map<std::string, std::string> fields = details;
    fields["event"] = "debug";
    fields["analysis_id"] = ctx.analysis_id;
    fields["stage"] = ctx.stage;

    log(LogLevel::DEBUG, message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string escape_json_string(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace litisim
