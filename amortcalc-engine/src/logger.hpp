/**
 * @file logger.hpp
 * @brief Structured logging for schedule generation and tranche processing
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (component, stakeholder, period)
 * - Console (stderr) and file sinks
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef AMORTCALC_LOGGER_HPP
#define AMORTCALC_LOGGER_HPP

#include <cstddef>
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <fstream>

namespace amortcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (slice generation, combination)
    INFO,    ///< Informational messages (adjustments, period advances)
    WARN,    ///< Warning messages (skipped ledger rows, unknown senders)
    ERROR    ///< Error messages (verification failures, rejected payments)
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
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Context attached to every log event
 */
struct LogContext {
    std::string component;           ///< Emitting component (loan_slice, combiner, tranche, ledger)
    std::string subject;             ///< Stakeholder or loan being processed
    int period;                      ///< Current period, -1 when not applicable

    LogContext()
        : component(""), subject(""), period(-1) {}

    explicit LogContext(const std::string& comp, const std::string& subj = "", int p = -1)
        : component(comp), subject(subj), period(p) {}
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
          log_file_path("amortcalc.log"),
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
 *   config.log_file_path = "amortcalc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx("tranche", "Alice", 3);
 *   logger.log_adjustment_added(ctx, 1500.0, 3, 1);
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
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log generation of a loan slice schedule
     */
    void log_slice_generated(
        const LogContext& ctx,
        double principal,
        double annual_rate,
        int total_periods,
        int start_period,
        double fixed_payment,
        size_t extra_payment_count
    );

    /**
     * @brief Log combination of several schedules into one
     *
     * @param ctx Log context
     * @param input_count Number of input schedules
     * @param period_count Number of periods in the combined schedule
     */
    void log_schedules_combined(
        const LogContext& ctx,
        size_t input_count,
        size_t period_count
    );

    /**
     * @brief Log an adjustment recorded against a flexible tranche
     *
     * @param ctx Log context
     * @param amount Extra payment amount (negative for underpayments)
     * @param period Period the adjustment applies to
     * @param adjustment_count Number of adjustments recorded so far
     */
    void log_adjustment_added(
        const LogContext& ctx,
        double amount,
        int period,
        size_t adjustment_count
    );

    /**
     * @brief Log the close of a period
     *
     * @param ctx Log context
     * @param total_paid Sum of payments received for the period
     * @param expected_payment Scheduled payment for the period
     */
    void log_period_advanced(
        const LogContext& ctx,
        double total_paid,
        double expected_payment
    );

    /**
     * @brief Log a failed adjustment verification
     *
     * @param ctx Log context
     * @param mismatches Row mismatch descriptions (first five are emitted)
     */
    void log_verification_failed(
        const LogContext& ctx,
        const std::vector<std::string>& mismatches
    );

    /**
     * @brief Log error with context
     */
    void log_error(const LogContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const LogContext& ctx, const std::string& warning_message);

    /**
     * @brief Log informational message
     */
    void log_info(const LogContext& ctx, const std::string& message);

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

    // Helper methods
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields,
             const LogContext& ctx);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace amortcalc

#endif // AMORTCALC_LOGGER_HPP
