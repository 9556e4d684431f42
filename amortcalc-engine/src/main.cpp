#include <iostream>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "config_parser.hpp"
#include "combiner.hpp"
#include "ledger.hpp"
#include "loan_slice.hpp"
#include "logger.hpp"
#include "property.hpp"
#include "tranche.hpp"
#include "io/json_writer.hpp"
#include "io/table_formatter.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    // Single loan (used when no --config is given)
    double principal = 0.0;
    double annual_rate = 0.0;
    int total_periods = 0;
    int start_period = 1;
    std::map<int, double> extra_payments;
    bool recast = false;
    bool has_principal = false;
    bool has_rate = false;
    bool has_periods = false;
    // Output
    std::string view;
    std::string format;
    std::string output_path;
    bool combine = false;
    // Logging
    std::string log_level;
    bool log_json = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "AmortCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Single loan options:\n";
    std::cerr << "  --principal <amount>        Loan principal\n";
    std::cerr << "  --rate <rate>               Annual interest rate as a fraction (0.05 = 5%)\n";
    std::cerr << "  --periods <count>           Total number of monthly periods\n";
    std::cerr << "  --start <period>            First payment period (default: 1)\n";
    std::cerr << "  --extra <period>:<amount>   Extra payment, repeatable (period 0 is a down payment)\n";
    std::cerr << "  --recast                    Recompute the payment after each extra payment\n\n";
    std::cerr << "Configuration file:\n";
    std::cerr << "  --config <path>             JSON run configuration (loans or property + ledger)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --view <name>               full, sideloan or baseline (property runs, default: full)\n";
    std::cerr << "  --format <name>             text, summary or json (default: text)\n";
    std::cerr << "  --combine                   Combine all schedules into one table\n";
    std::cerr << "  --output <path>             Output file (default: stdout)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: WARN)\n";
    std::cerr << "  --log-json                  Emit log lines as JSON\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Ten month loan with an extra payment:\n";
    std::cerr << "     " << program_name << " --principal 100000 --rate 0.5 --periods 10 \\\n";
    std::cerr << "         --extra 5:5000\n\n";
    std::cerr << "  2. Shared property with a bank ledger:\n";
    std::cerr << "     " << program_name << " --config data/sample_property.json --view sideloan \\\n";
    std::cerr << "         --format summary\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// "5:5000" -> {5, 5000.0}
bool parse_extra(const std::string& text, std::map<int, double>& extras) {
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        return false;
    }
    try {
        int period = std::stoi(text.substr(0, colon));
        double amount = std::stod(text.substr(colon + 1));
        extras[period] += amount;
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--principal" && i + 1 < argc) {
            args.principal = std::stod(argv[++i]);
            args.has_principal = true;
        } else if (arg == "--rate" && i + 1 < argc) {
            args.annual_rate = std::stod(argv[++i]);
            args.has_rate = true;
        } else if (arg == "--periods" && i + 1 < argc) {
            args.total_periods = std::stoi(argv[++i]);
            args.has_periods = true;
        } else if (arg == "--start" && i + 1 < argc) {
            args.start_period = std::stoi(argv[++i]);
        } else if (arg == "--extra" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_extra(value, args.extra_payments)) {
                std::cerr << "Error: --extra expects <period>:<amount>, got: " << value << "\n\n";
                return false;
            }
        } else if (arg == "--recast") {
            args.recast = true;
        } else if (arg == "--view" && i + 1 < argc) {
            args.view = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            args.format = argv[++i];
        } else if (arg == "--combine") {
            args.combine = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-json") {
            args.log_json = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    const bool has_loan_options = args.has_principal || args.has_rate || args.has_periods;

    if (!args.config_path.empty()) {
        if (!file_exists(args.config_path)) {
            std::cerr << "Error: Config file not found: " << args.config_path << "\n";
            valid = false;
        }
        if (has_loan_options) {
            std::cerr << "Warning: --config given, ignoring single loan options\n";
        }
    } else {
        if (!args.has_principal) {
            std::cerr << "Error: --principal is required (or use --config)\n";
            valid = false;
        }
        if (!args.has_rate) {
            std::cerr << "Error: --rate is required (or use --config)\n";
            valid = false;
        }
        if (!args.has_periods) {
            std::cerr << "Error: --periods is required (or use --config)\n";
            valid = false;
        } else if (args.total_periods <= 0) {
            std::cerr << "Error: --periods must be greater than 0\n";
            valid = false;
        }
        if (args.start_period < 1) {
            std::cerr << "Error: --start must be at least 1\n";
            valid = false;
        }
        if (!args.view.empty()) {
            std::cerr << "Warning: --view only applies to property runs\n";
        }
    }

    if (!args.format.empty() && args.format != "text" && args.format != "summary" &&
        args.format != "json") {
        std::cerr << "Error: --format must be text, summary or json\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

// Build a run configuration equivalent to the single loan options
amortcalc::RunConfig config_from_args(const CLIArgs& args) {
    amortcalc::RunConfig config;
    config.loan_info = amortcalc::LoanInfo{args.annual_rate, args.total_periods};
    config.mode = args.recast ? amortcalc::ExtraPaymentMode::Recast
                              : amortcalc::ExtraPaymentMode::KeepPayment;

    amortcalc::LoanConfig loan;
    loan.name = "loan";
    loan.principal = args.principal;
    loan.start_period = args.start_period;
    loan.extra_payments = args.extra_payments;
    config.loans.push_back(loan);

    config.logging.min_level = amortcalc::LogLevel::WARN;
    config.logging.enable_json = false;
    return config;
}

std::map<std::string, amortcalc::AmortizationTable> run_loans(const amortcalc::RunConfig& config) {
    std::vector<amortcalc::LoanSlice> slices;
    std::map<std::string, amortcalc::AmortizationTable> tables;

    for (const amortcalc::LoanConfig& loan : config.loans) {
        amortcalc::LoanSlice slice(config.loan_info, loan.principal, loan.start_period,
                                   amortcalc::ExtraPayments(loan.extra_payments), config.mode);
        std::cerr << slice.describe() << "\n";
        tables.emplace(loan.name, slice.schedule());
        slices.push_back(std::move(slice));
    }

    if (config.output.combine) {
        return {{"combined", amortcalc::combine_schedules(slices)}};
    }
    return tables;
}

std::map<std::string, amortcalc::AmortizationTable> run_property(const amortcalc::RunConfig& config) {
    const amortcalc::PropertyConfig& property_config = *config.property;

    amortcalc::PropertyParams params{
        property_config.purchase_cost,
        property_config.purchase_down_payment,
        config.loan_info,
        property_config.stakeholders,
        property_config.stakeholder_down_payments
    };
    amortcalc::Property property(params);

    std::cerr << "Property with " << property.stakeholder_names().size()
              << " stakeholders, total stake " << property.total_stake_allocated() << "\n";

    if (config.ledger) {
        const amortcalc::LedgerConfig& ledger = *config.ledger;
        std::cerr << "Reading ledger from " << ledger.path << "..." << std::flush;

        amortcalc::LedgerReader reader(property_config.stakeholders,
                                       ledger.mutual_income_strings,
                                       amortcalc::LedgerDate::parse(ledger.first_period),
                                       ledger.delimiter);
        std::vector<amortcalc::Payment> payments = reader.parse_file(ledger.path);
        std::cerr << " " << payments.size() << " payments\n";

        amortcalc::LedgerProcessor processor(property);
        processor.process_payments(std::move(payments));
        if (ledger.advance_after) {
            processor.advance_period();
        }
        std::cerr << "Ledger processed through period " << property.current_period() << "\n";
    }

    const amortcalc::TableView view = amortcalc::string_to_table_view(config.output.view);
    if (config.output.combine) {
        return {{"combined", property.combined_schedule(view)}};
    }
    return property.schedules(view);
}

void write_text(std::ostream& os, const std::map<std::string, amortcalc::AmortizationTable>& tables,
                bool summary) {
    bool first = true;
    for (const auto& [name, table] : tables) {
        if (tables.size() > 1) {
            if (!first) os << "\n";
            os << "== " << name << " ==\n";
        }
        if (summary) {
            amortcalc::io::write_summary(os, table);
        } else {
            amortcalc::io::write_table(os, table);
        }
        first = false;
    }
}

void write_output(std::ostream& os, const amortcalc::RunConfig& config,
                  const std::map<std::string, amortcalc::AmortizationTable>& tables) {
    if (config.output.format == "json") {
        amortcalc::io::write_tables_json(os, tables, config.output.view);
    } else {
        write_text(os, tables, config.output.format == "summary");
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        amortcalc::RunConfig config;
        if (!args.config_path.empty()) {
            config = amortcalc::parse_run_config_from_file(args.config_path);
        } else {
            config = config_from_args(args);
        }

        // Command line overrides
        if (!args.view.empty()) config.output.view = args.view;
        if (!args.format.empty()) config.output.format = args.format;
        if (!args.output_path.empty()) config.output.path = args.output_path;
        if (args.combine) config.output.combine = true;
        if (!args.log_level.empty()) {
            config.logging.min_level = amortcalc::string_to_level(args.log_level);
        }
        if (args.log_json) config.logging.enable_json = true;

        amortcalc::validate_run_config(config);
        amortcalc::Logger::get_instance().configure(config.logging);

        if (!config.description.empty()) {
            std::cerr << config.description << "\n";
        }

        std::map<std::string, amortcalc::AmortizationTable> tables =
            config.property ? run_property(config) : run_loans(config);

        if (config.output.path.empty()) {
            write_output(std::cout, config, tables);
        } else {
            std::ofstream file(config.output.path);
            if (!file) {
                throw std::runtime_error("Failed to open output file: " + config.output.path);
            }
            write_output(file, config, tables);
            std::cerr << "Output written to: " << config.output.path << "\n";
        }

        amortcalc::Logger::get_instance().flush();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
