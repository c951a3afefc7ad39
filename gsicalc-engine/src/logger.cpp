/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace gsicalc {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

} // anonymous namespace

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
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_run_start(const RunContext& ctx, const ProjectionInputs& inputs) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    for (const auto& [key, value] : inputs.to_fields()) {
        fields["input." + key] = value;
    }
    fields["steps"] = std::to_string(inputs.steps());

    log(LogLevel::INFO, "Projection started", ctx, std::move(fields));
}

void Logger::log_portfolio_scaled(const RunContext& ctx, const ScaledState& state,
                                  double master_cost_basis) {
    std::map<std::string, std::string> fields;
    fields["event"] = "portfolio_scaled";
    fields["master_cost_basis"] = format_number(master_cost_basis);
    fields["ratio"] = format_number(state.ratio);
    fields["credit_value"] = format_number(state.credit_value);
    fields["option_value"] = format_number(state.option_value);
    fields["option_quantity"] = format_number(state.option_quantity);
    fields["weighted_strike"] = format_number(state.weighted_strike);
    fields["initial_nav"] = format_number(state.initial_nav);

    log(LogLevel::INFO, "Reference portfolio scaled", ctx, std::move(fields));
}

void Logger::log_step(const RunContext& ctx, int step, double credit, double option,
                      double intrinsic, double total) {
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "step";
    fields["step"] = std::to_string(step);
    fields["credit"] = format_number(credit);
    fields["option"] = format_number(option);
    fields["intrinsic"] = format_number(intrinsic);
    fields["total"] = format_number(total);

    log(LogLevel::DEBUG, "Quarter projected", ctx, std::move(fields));
}

void Logger::log_carry_skipped(const RunContext& ctx, int step, double combined_value) {
    std::map<std::string, std::string> fields;
    fields["event"] = "carry_skipped";
    fields["step"] = std::to_string(step);
    fields["combined_value"] = format_number(combined_value);

    log(LogLevel::WARN, "Carry not allocated: combined sleeve value is not positive",
        ctx, std::move(fields));
}

void Logger::log_run_complete(const RunContext& ctx, const ProjectionMetrics& metrics,
                              int steps, double execution_time_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    fields["steps"] = std::to_string(steps);
    fields["execution_time_ms"] = format_number(execution_time_ms);
    fields["initial_notional"] = format_number(metrics.initial_notional);
    fields["final_value"] = format_number(metrics.final_value);
    fields["moic"] = format_number(metrics.moic);
    fields["irr_pct"] = format_number(metrics.irr);
    fields["index_final"] = format_number(metrics.index_final);
    fields["index_moic"] = format_number(metrics.index_moic);
    fields["index_irr_pct"] = format_number(metrics.index_irr);

    log(LogLevel::INFO, "Projection completed", ctx, std::move(fields));
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Projection error", ctx, std::move(fields));
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";

    log(LogLevel::WARN, warning_message, ctx, std::move(fields));
}

void Logger::log_info(const RunContext& ctx, const std::string& message,
                      const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, ctx, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message,
                 const RunContext& ctx, std::map<std::string, std::string> fields) {
    if (!is_enabled(level)) {
        return;
    }

    fields["run_id"] = ctx.run_id;
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
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

std::string Logger::escape_json_string(const std::string& str) const {
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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
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

} // namespace gsicalc
