/**
 * @file logger.hpp
 * @brief Structured logging for the HomeCalc command-line driver
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-lines or plain-text output to stderr and/or a file
 * - Run context tracking (run ID, parameter source, phase)
 * - Run metrics (execution time, months simulated, years recorded)
 *
 * The simulation engine itself never logs; callers log around it.
 */

#ifndef HOMECALC_LOGGER_HPP
#define HOMECALC_LOGGER_HPP

#include "comparison.hpp"
#include "params.hpp"
#include "simulation.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace homecalc {

// Flat string key/value pairs attached to one log line
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-year snapshots and other detail
    INFO,    ///< Run start/end, files read and written
    WARN,    ///< Non-fatal issues
    ERROR    ///< Failures
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
 * @brief Identifies one run in the log stream
 */
struct RunContext {
    std::string run_id;          ///< Caller-chosen identifier
    std::string params_source;   ///< Parameter file path, or "defaults"
    std::string phase;           ///< load, simulate, write

    RunContext() : run_id(""), params_source("defaults"), phase("") {}

    RunContext(const std::string& id, const std::string& source)
        : run_id(id), params_source(source), phase("") {}
};

/**
 * @brief Metrics reported when a run completes
 */
struct RunMetrics {
    double execution_time_ms;
    size_t months_simulated;
    size_t years_recorded;

    RunMetrics() : execution_time_ms(0.0), months_simulated(0), years_recorded(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;          ///< Minimum log level to output
    bool enable_console;         ///< Log to stderr
    bool enable_file;            ///< Log to file
    std::string log_file_path;   ///< File path for logs
    bool enable_json;            ///< JSON lines (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("homecalc.log"),
          enable_json(true) {}
};

/**
 * @brief Singleton structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("run-1", "params.json");
 *   logger.log_simulation_start(ctx, params);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration, (re)opening or closing the log file
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a parameter record loaded from a file
     */
    void log_params_loaded(const RunContext& ctx, const SimulationParams& params);

    /**
     * @brief Log the key inputs of a run about to start
     */
    void log_simulation_start(const RunContext& ctx, const SimulationParams& params);

    /**
     * @brief Log one year-end snapshot (DEBUG)
     */
    void log_yearly_snapshot(const RunContext& ctx, const YearlyRecord& record);

    /**
     * @brief Log the outcome of a finished run
     */
    void log_simulation_complete(
        const RunContext& ctx,
        const SimulationSummary& summary,
        const ScenarioComparison& comparison,
        const RunMetrics& metrics
    );

    /**
     * @brief Log an output file written by the driver
     *
     * @param format "json" or "parquet"
     * @param path Destination path
     * @param rows Number of records written
     */
    void log_output_written(
        const RunContext& ctx,
        const std::string& format,
        const std::string& path,
        size_t rows
    );

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void log_error(const RunContext& ctx, const std::string& error_message);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // event, run_id and (when set) phase
    LogFields base_fields(const std::string& event, const RunContext& ctx) const;

    void log(LogLevel level, const std::string& message, const LogFields& fields);
    std::string render(LogLevel level, const std::string& message, const LogFields& fields) const;
    std::string get_timestamp() const;
    void write_output(const std::string& output);
};

} // namespace homecalc

#endif // HOMECALC_LOGGER_HPP
