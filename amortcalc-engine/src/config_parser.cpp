#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace amortcalc {

namespace {

std::vector<std::string> parse_string_list(const json& j) {
    std::vector<std::string> values;
    for (const auto& item : j) {
        values.push_back(item.get<std::string>());
    }
    return values;
}

// Extra payments are keyed by period: {"0": 20000, "5": 5000}
std::map<int, double> parse_extra_payments(const json& j) {
    std::map<int, double> extras;
    for (auto it = j.begin(); it != j.end(); ++it) {
        int period = 0;
        try {
            size_t consumed = 0;
            period = std::stoi(it.key(), &consumed);
            if (consumed != it.key().size()) {
                throw std::invalid_argument(it.key());
            }
        } catch (const std::exception&) {
            throw ConfigParseError("Extra payment period is not an integer: '" + it.key() + "'");
        }
        extras[period] = it.value().get<double>();
    }
    return extras;
}

Party parse_party(const json& j) {
    if (!j.contains("name")) {
        throw ConfigParseError("Stakeholder missing required field: name");
    }
    Party party(j["name"].get<std::string>(), j.value("role", std::string("Stakeholder")));

    if (j.contains("ledger_strings")) {
        party.ledger_strings = parse_string_list(j["ledger_strings"]);
    }
    if (j.contains("ledger_exclusions")) {
        party.ledger_exclusions = parse_string_list(j["ledger_exclusions"]);
    }
    if (j.contains("exclusion_amount")) {
        party.exclusion_amount = j["exclusion_amount"].get<double>();
    }
    return party;
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // ${VAR} or $VAR
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        // A lone '$' stays as is
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

ExtraPaymentMode parse_extra_payment_mode(const std::string& value) {
    if (value == "keep_payment") return ExtraPaymentMode::KeepPayment;
    if (value == "recast") return ExtraPaymentMode::Recast;
    throw ConfigParseError("Unknown extra payment mode: '" + value +
                           "' (expected keep_payment or recast)");
}

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("description")) {
            config.description = j["description"].get<std::string>();
        }

        // Loan terms (required)
        if (!j.contains("loan")) {
            throw ConfigParseError("Missing required field: loan");
        }
        const json& loan = j["loan"];
        if (!loan.contains("annual_rate")) {
            throw ConfigParseError("Loan missing required field: annual_rate");
        }
        if (!loan.contains("total_periods")) {
            throw ConfigParseError("Loan missing required field: total_periods");
        }
        config.loan_info.annual_rate = loan["annual_rate"].get<double>();
        config.loan_info.total_periods = loan["total_periods"].get<int>();
        if (loan.contains("mode")) {
            config.mode = parse_extra_payment_mode(loan["mode"].get<std::string>());
        }

        // Loan slices (loan mode)
        if (j.contains("loans")) {
            int index = 0;
            for (const auto& loan_json : j["loans"]) {
                LoanConfig slice;
                slice.name = loan_json.value("name", "loan_" + std::to_string(index));
                if (!loan_json.contains("principal")) {
                    throw ConfigParseError("Loan '" + slice.name + "' missing required field: principal");
                }
                slice.principal = loan_json["principal"].get<double>();
                slice.start_period = loan_json.value("start_period", 1);
                if (loan_json.contains("extra_payments")) {
                    slice.extra_payments = parse_extra_payments(loan_json["extra_payments"]);
                }
                config.loans.push_back(slice);
                ++index;
            }
        }

        // Property (property mode)
        if (j.contains("property")) {
            const json& prop = j["property"];
            PropertyConfig property;
            if (!prop.contains("purchase_cost")) {
                throw ConfigParseError("Property missing required field: purchase_cost");
            }
            property.purchase_cost = prop["purchase_cost"].get<double>();
            property.purchase_down_payment = prop.value("purchase_down_payment", 0.0);

            if (prop.contains("stakeholders")) {
                for (const auto& party_json : prop["stakeholders"]) {
                    property.stakeholders.push_back(parse_party(party_json));
                }
            }
            if (prop.contains("stakeholder_down_payments")) {
                const json& downs = prop["stakeholder_down_payments"];
                for (auto it = downs.begin(); it != downs.end(); ++it) {
                    property.stakeholder_down_payments[it.key()] = it.value().get<double>();
                }
            }
            config.property = property;
        }

        if (j.contains("ledger")) {
            const json& ledger_json = j["ledger"];
            LedgerConfig ledger;
            if (!ledger_json.contains("path")) {
                throw ConfigParseError("Ledger missing required field: path");
            }
            ledger.path = expand_environment_variables(ledger_json["path"].get<std::string>());
            if (!ledger_json.contains("first_period")) {
                throw ConfigParseError("Ledger missing required field: first_period");
            }
            ledger.first_period = ledger_json["first_period"].get<std::string>();
            if (ledger_json.contains("mutual_income_strings")) {
                ledger.mutual_income_strings = parse_string_list(ledger_json["mutual_income_strings"]);
            }
            ledger.advance_after = ledger_json.value("advance_after", false);
            if (ledger_json.contains("delimiter")) {
                std::string delimiter = ledger_json["delimiter"].get<std::string>();
                if (delimiter.size() != 1) {
                    throw ConfigParseError("Ledger delimiter must be a single character");
                }
                ledger.delimiter = delimiter[0];
            }
            config.ledger = ledger;
        }

        if (j.contains("output")) {
            const json& output = j["output"];
            config.output.view = output.value("view", config.output.view);
            config.output.format = output.value("format", config.output.format);
            config.output.combine = output.value("combine", config.output.combine);
            if (output.contains("path")) {
                config.output.path = expand_environment_variables(output["path"].get<std::string>());
            }
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(logging["level"].get<std::string>());
            }
            config.logging.enable_json = logging.value("json", config.logging.enable_json);
            config.logging.enable_console = logging.value("console", config.logging.enable_console);
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path =
                    expand_environment_variables(logging["file"].get<std::string>());
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_run_config(config);

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    if (config.ledger) {
        config.ledger->path = resolve_relative_path(config.ledger->path, file_path);
    }
    if (!config.output.path.empty()) {
        config.output.path = resolve_relative_path(config.output.path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path =
            resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

void validate_run_config(const RunConfig& config) {
    if (config.loan_info.total_periods <= 0) {
        throw ConfigParseError("Loan total_periods must be positive");
    }

    const bool has_loans = !config.loans.empty();
    const bool has_property = config.property.has_value();

    if (has_loans == has_property) {
        throw ConfigParseError("Exactly one of 'loans' or 'property' must be given");
    }

    std::set<std::string> names;
    for (const LoanConfig& loan : config.loans) {
        if (!names.insert(loan.name).second) {
            throw ConfigParseError("Duplicate loan name: " + loan.name);
        }
        if (loan.start_period < 1) {
            throw ConfigParseError("Loan '" + loan.name + "' start_period must be at least 1");
        }
        for (const auto& entry : loan.extra_payments) {
            if (entry.first < 0) {
                throw ConfigParseError("Loan '" + loan.name + "' has an extra payment at negative period " +
                                       std::to_string(entry.first));
            }
        }
    }

    if (has_property) {
        const PropertyConfig& property = *config.property;
        std::set<std::string> stakeholders;
        for (const Party& party : property.stakeholders) {
            if (!party.is_common_party() && !stakeholders.insert(party.name).second) {
                throw ConfigParseError("Duplicate stakeholder name: " + party.name);
            }
        }
        if (stakeholders.empty()) {
            throw ConfigParseError("Property needs at least one stakeholder");
        }
        if (property.purchase_down_payment > property.purchase_cost) {
            throw ConfigParseError("Purchase down payment exceeds purchase cost");
        }
    }

    if (config.ledger && !has_property) {
        throw ConfigParseError("A ledger requires a property");
    }

    static const std::set<std::string> kViews = {"full", "sideloan", "baseline"};
    if (kViews.count(config.output.view) == 0) {
        throw ConfigParseError("Unknown output view: '" + config.output.view + "'");
    }
    static const std::set<std::string> kFormats = {"text", "summary", "json"};
    if (kFormats.count(config.output.format) == 0) {
        throw ConfigParseError("Unknown output format: '" + config.output.format + "'");
    }
}

} // namespace amortcalc
