/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace homecalc {

namespace {

std::string format_money(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

const char* bool_string(bool value) {
    return value ? "true" : "false";
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : config_() {}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    flush();
    config_ = config;
    file_stream_.reset();

    if (!config_.enable_file) {
        return;
    }

    file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        file_stream_.reset();
    }
}

LogFields Logger::base_fields(const std::string& event, const RunContext& ctx) const {
    LogFields fields{{"event", event}, {"run_id", ctx.run_id}};
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

// ============================================================================
// Events
// ============================================================================

void Logger::log_params_loaded(const RunContext& ctx, const SimulationParams& params) {
    LogFields fields = base_fields("params_loaded", ctx);
    fields["params_source"] = ctx.params_source;
    fields["years"] = std::to_string(params.years);
    fields["budget_strategy"] = to_string(params.budget_strategy);

    log(LogLevel::INFO, "Loaded simulation parameters", fields);
}

void Logger::log_simulation_start(const RunContext& ctx, const SimulationParams& params) {
    LogFields fields = base_fields("simulation_start", ctx);
    fields["years"] = std::to_string(params.years);
    fields["home_price"] = format_money(params.home_price);
    fields["financed_amount"] = format_money(params.financed_amount());
    fields["initial_outlay"] = format_money(params.initial_outlay());
    fields["monthly_rent"] = format_money(params.monthly_rent);
    fields["budget_strategy"] = to_string(params.budget_strategy);
    fields["pay_down_mortgage_early"] = bool_string(params.pay_down_mortgage_early);
    fields["use_mortgage2"] = bool_string(params.use_mortgage2);
    fields["use_subsidized_loan"] = bool_string(params.use_subsidized_loan);
    fields["rent_out_part"] = bool_string(params.rent_out_part);

    log(LogLevel::INFO, "Starting simulation", fields);
}

void Logger::log_yearly_snapshot(const RunContext& ctx, const YearlyRecord& record) {
    if (config_.min_level > LogLevel::DEBUG) {
        return;
    }

    LogFields fields = base_fields("yearly_snapshot", ctx);
    fields["year"] = std::to_string(record.year);
    fields["home_value"] = format_money(record.home_value);
    fields["mortgage_balance"] = format_money(record.mortgage_balance);
    fields["buy_net_worth"] = format_money(record.buy_net_worth);
    fields["rent_net_worth"] = format_money(record.rent_net_worth);

    log(LogLevel::DEBUG, "Year-end snapshot", fields);
}

void Logger::log_simulation_complete(
    const RunContext& ctx,
    const SimulationSummary& summary,
    const ScenarioComparison& comparison,
    const RunMetrics& metrics
) {
    LogFields fields = base_fields("simulation_complete", ctx);
    fields["final_net_worth_buy"] = format_money(summary.final_net_worth_buy);
    fields["final_net_worth_rent"] = format_money(summary.final_net_worth_rent);
    fields["total_interest_paid"] = format_money(summary.total_interest_paid);
    fields["preferred"] = to_string(comparison.preferred);
    fields["breakeven_year"] = comparison.breakeven_year
        ? std::to_string(*comparison.breakeven_year) : "none";
    fields["execution_time_ms"] = std::to_string(metrics.execution_time_ms);
    fields["months_simulated"] = std::to_string(metrics.months_simulated);
    fields["years_recorded"] = std::to_string(metrics.years_recorded);

    log(LogLevel::INFO, "Simulation completed", fields);
}

void Logger::log_output_written(
    const RunContext& ctx,
    const std::string& format,
    const std::string& path,
    size_t rows
) {
    LogFields fields = base_fields("output_written", ctx);
    fields["format"] = format;
    fields["path"] = path;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::INFO, "Output written", fields);
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    LogFields fields = base_fields("warning", ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    LogFields fields = base_fields("error", ctx);
    fields["params_source"] = ctx.params_source;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Run failed", fields);
}

// ============================================================================
// Output
// ============================================================================

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const LogFields& fields) {
    if (level < config_.min_level) {
        return;
    }
    write_output(render(level, message, fields));
}

std::string Logger::render(LogLevel level, const std::string& message, const LogFields& fields) const {
    if (config_.enable_json) {
        nlohmann::json line(fields);
        line["timestamp"] = get_timestamp();
        line["level"] = level_to_string(level);
        line["message"] = message;
        return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::ostringstream oss;
    oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;
    if (!fields.empty()) {
        oss << " {";
        const char* sep = "";
        for (const auto& [key, value] : fields) {
            oss << sep << key << "=" << value;
            sep = ", ";
        }
        oss << "}";
    }
    return oss.str();
}

// UTC, ISO 8601 with milliseconds
std::string Logger::get_timestamp() const {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << '\n';
    }
    if (file_stream_) {
        *file_stream_ << output << '\n';
    }
}

} // namespace homecalc
