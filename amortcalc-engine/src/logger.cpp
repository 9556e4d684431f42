/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace amortcalc {

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

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_slice_generated(
    const LogContext& ctx,
    double principal,
    double annual_rate,
    int total_periods,
    int start_period,
    double fixed_payment,
    size_t extra_payment_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "slice_generated";
    fields["principal"] = std::to_string(principal);
    fields["annual_rate"] = std::to_string(annual_rate);
    fields["total_periods"] = std::to_string(total_periods);
    fields["start_period"] = std::to_string(start_period);
    fields["fixed_payment"] = std::to_string(fixed_payment);
    fields["extra_payment_count"] = std::to_string(extra_payment_count);

    log(LogLevel::DEBUG, "Loan slice schedule generated", std::move(fields), ctx);
}

void Logger::log_schedules_combined(
    const LogContext& ctx,
    size_t input_count,
    size_t period_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "schedules_combined";
    fields["input_count"] = std::to_string(input_count);
    fields["period_count"] = std::to_string(period_count);

    log(LogLevel::DEBUG, "Schedules combined", std::move(fields), ctx);
}

void Logger::log_adjustment_added(
    const LogContext& ctx,
    double amount,
    int period,
    size_t adjustment_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "adjustment_added";
    fields["amount"] = std::to_string(amount);
    fields["adjustment_period"] = std::to_string(period);
    fields["adjustment_count"] = std::to_string(adjustment_count);

    log(LogLevel::INFO, "Adjustment recorded", std::move(fields), ctx);
}

void Logger::log_period_advanced(
    const LogContext& ctx,
    double total_paid,
    double expected_payment
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "period_advanced";
    fields["total_paid"] = std::to_string(total_paid);
    fields["expected_payment"] = std::to_string(expected_payment);

    log(LogLevel::INFO, "Period advanced", std::move(fields), ctx);
}

void Logger::log_verification_failed(
    const LogContext& ctx,
    const std::vector<std::string>& mismatches
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "verification_failed";
    fields["mismatch_count"] = std::to_string(mismatches.size());
    for (size_t i = 0; i < std::min(mismatches.size(), size_t(5)); ++i) {
        fields["mismatch_" + std::to_string(i)] = mismatches[i];
    }

    log(LogLevel::ERROR, "Adjustment verification failed", std::move(fields), ctx);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, error_message, std::move(fields), ctx);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";

    log(LogLevel::WARN, warning_message, std::move(fields), ctx);
}

void Logger::log_info(const LogContext& ctx, const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "info";

    log(LogLevel::INFO, message, std::move(fields), ctx);
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
    std::map<std::string, std::string> fields,
    const LogContext& ctx
) {
    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    if (!ctx.component.empty()) fields["component"] = ctx.component;
    if (!ctx.subject.empty()) fields["subject"] = ctx.subject;
    if (ctx.period >= 0) fields["period"] = std::to_string(ctx.period);

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        // Plain text format
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
                    // Escape control characters
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

} // namespace amortcalc
