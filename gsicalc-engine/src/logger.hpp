/**
 * @file logger.hpp
 * @brief Structured logging for projection runs
 *
 * The Logger emits one event per line with:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-lines or plain text output
 * - Run context (run id, phase)
 * - Inputs, scaled state and summary metrics of each run
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef GSICALC_LOGGER_HPP
#define GSICALC_LOGGER_HPP

#include "metrics.hpp"
#include "portfolio_scaler.hpp"
#include "projection_inputs.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace gsicalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-step values
    INFO,    ///< Run start and completion
    WARN,    ///< Skipped carry allocation, overridden settings
    ERROR    ///< Failed runs
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
 * @brief Parse log level from string
 *
 * @return false if the string names no level; level is left unchanged
 */
inline bool parse_log_level(const std::string& level_str, LogLevel& level) {
    if (level_str == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (level_str == "INFO") { level = LogLevel::INFO; return true; }
    if (level_str == "WARN") { level = LogLevel::WARN; return true; }
    if (level_str == "ERROR") { level = LogLevel::ERROR; return true; }
    return false;
}

/**
 * @brief Identifies the run an event belongs to
 */
struct RunContext {
    std::string run_id;   ///< Caller-chosen id, e.g. the config file name
    std::string phase;    ///< validate, scale, project, output

    RunContext() : run_id("default"), phase("") {}
    explicit RunContext(const std::string& id) : run_id(id), phase("") {}
    RunContext(const std::string& id, const std::string& p) : run_id(id), phase(p) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("gsicalc.log"),
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
 *   config.log_file_path = "gsicalc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("scenario_a", "project");
 *   logger.log_run_start(ctx, inputs);
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
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    const LoggerConfig& config() const { return config_; }

    /**
     * @brief Log the validated inputs of a run
     */
    void log_run_start(const RunContext& ctx, const ProjectionInputs& inputs);

    /**
     * @brief Log the starting position after scaling
     *
     * @param ctx Run context
     * @param state Scaled credit and option sleeves
     * @param master_cost_basis Cost basis the investment was scaled against
     */
    void log_portfolio_scaled(const RunContext& ctx, const ScaledState& state,
                              double master_cost_basis);

    /**
     * @brief Log values of one quarterly step (DEBUG)
     */
    void log_step(const RunContext& ctx, int step, double credit, double option,
                  double intrinsic, double total);

    /**
     * @brief Log a step whose carry could not be allocated between sleeves
     *
     * @param ctx Run context
     * @param step Quarter index (1-based)
     * @param combined_value Dragged credit + option value at that step
     */
    void log_carry_skipped(const RunContext& ctx, int step, double combined_value);

    /**
     * @brief Log run completion with summary metrics
     */
    void log_run_complete(const RunContext& ctx, const ProjectionMetrics& metrics,
                          int steps, double execution_time_ms);

    /**
     * @brief Log error with context
     */
    void log_error(const RunContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const RunContext& ctx, const std::string& warning_message);

    /**
     * @brief Log informational message with free-form fields
     */
    void log_info(const RunContext& ctx, const std::string& message,
                  const std::map<std::string, std::string>& fields = {});

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

    bool is_enabled(LogLevel level) const { return level >= config_.min_level; }

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

    void log(LogLevel level, const std::string& message,
             const RunContext& ctx, std::map<std::string, std::string> fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace gsicalc

#endif // GSICALC_LOGGER_HPP
