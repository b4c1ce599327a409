/**
 * @file logger.hpp
 * @brief Structured logging for the analysis pipeline
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output (one object per line) or plain text
 * - Context tracking (analysis id, pipeline stage)
 * - Stage timings and simulation summaries
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef LITISIM_LOGGER_HPP
#define LITISIM_LOGGER_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace litisim {

class DamagesRange;
struct SimulationResult;
struct Recommendation;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate values (payoff matrix cells, stage details)
    INFO,    ///< Analysis start/end, stage completion
    WARN,    ///< Clamped inputs, expensive trial counts
    ERROR    ///< Validation failures and exceptions
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (unknown strings map to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Escape a string for use inside a JSON string literal
 *
 * Shared by the log line formatter and the output writers.
 */
std::string escape_json_string(const std::string& str);

/**
 * @brief Analysis context attached to every event
 */
struct AnalysisContext {
    std::string analysis_id;    ///< Caller-supplied or generated identifier
    std::string stage;          ///< Current pipeline stage (scenarios, tree, ev, response, simulation, synthesis)

    AnalysisContext() : analysis_id(""), stage("") {}

    explicit AnalysisContext(const std::string& id) : analysis_id(id), stage("") {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (append mode)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("litisim.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "litisim.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   AnalysisContext ctx("case-42");
 *   logger.log_analysis_start(ctx, damages, 8, 0.5, 10000, 42);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log analysis inputs before any computation
     */
    void log_analysis_start(
        const AnalysisContext& ctx,
        const DamagesRange& damages,
        int case_strength,
        double opponent_settlement_rate,
        size_t trials,
        const std::optional<uint64_t>& seed
    );

    /**
     * @brief Log completion of one pipeline stage
     *
     * @param ctx Analysis context (ctx.stage names the stage)
     * @param elapsed_ms Stage wall time
     * @param details Extra stage-specific fields
     */
    void log_stage_complete(
        const AnalysisContext& ctx,
        double elapsed_ms,
        const std::map<std::string, std::string>& details = {}
    );

    /**
     * @brief Log Monte Carlo summary
     */
    void log_simulation_complete(
        const AnalysisContext& ctx,
        const SimulationResult& result
    );

    /**
     * @brief Log the final recommendation anchors
     */
    void log_recommendation(
        const AnalysisContext& ctx,
        const Recommendation& recommendation
    );

    /**
     * @brief Log error with context
     */
    void log_error(
        const AnalysisContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Log warning message
     */
    void log_warning(
        const AnalysisContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Log a DEBUG event with free-form fields
     */
    void log_debug(
        const AnalysisContext& ctx,
        const std::string& message,
        const std::map<std::string, std::string>& details
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace litisim

#endif // LITISIM_LOGGER_HPP
