#ifndef AMORTCALC_CONFIG_PARSER_HPP
#define AMORTCALC_CONFIG_PARSER_HPP

#include "loan_slice.hpp"
#include "logger.hpp"
#include "payment.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace amortcalc {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief One loan slice to build (loan mode)
 */
struct LoanConfig {
    std::string name;
    double principal = 0.0;
    int start_period = 1;
    std::map<int, double> extra_payments;   ///< Period -> amount; period 0 is a down payment
};

/**
 * @brief Jointly owned property (property mode)
 */
struct PropertyConfig {
    double purchase_cost = 0.0;
    double purchase_down_payment = 0.0;
    std::vector<Party> stakeholders;
    std::map<std::string, double> stakeholder_down_payments;
};

/**
 * @brief Bank ledger feeding payments into the property
 */
struct LedgerConfig {
    std::string path;
    std::string first_period;               ///< MM/DD/YYYY date of period 1
    std::vector<std::string> mutual_income_strings;
    bool advance_after = false;             ///< Close one more period after the last payment
    char delimiter = '\t';
};

/**
 * @brief Report settings
 */
struct OutputConfig {
    std::string view = "full";              ///< full, sideloan or baseline (property mode)
    std::string format = "text";            ///< text, summary or json
    std::string path;                       ///< Empty writes to stdout
    bool combine = false;                   ///< Emit one combined table instead of one per loan/stakeholder
};

/**
 * @brief Complete run configuration
 *
 * Exactly one of loans or property is used. Loan mode builds each listed
 * slice; property mode builds a tranche per stakeholder and optionally replays
 * a ledger.
 */
struct RunConfig {
    std::string description;
    LoanInfo loan_info{0.0, 0};
    ExtraPaymentMode mode = ExtraPaymentMode::KeepPayment;
    std::vector<LoanConfig> loans;
    std::optional<PropertyConfig> property;
    std::optional<LedgerConfig> ledger;
    OutputConfig output;
    LoggerConfig logging;
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative ledger, output and log file paths are resolved against the
 * directory of the configuration file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed run configuration
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid or
 *         the configuration is inconsistent
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed run configuration
 * @throws ConfigParseError if JSON is invalid or the configuration is inconsistent
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Checks cross-field constraints of a run configuration
 *
 * @throws ConfigParseError describing the first violated constraint
 */
void validate_run_config(const RunConfig& config);

/**
 * @brief Parses "keep_payment" or "recast"
 *
 * @throws ConfigParseError for any other value
 */
ExtraPaymentMode parse_extra_payment_mode(const std::string& value);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * If path is relative, makes it relative to the directory containing the config file.
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace amortcalc

#endif // AMORTCALC_CONFIG_PARSER_HPP
