#include "ledger.hpp"
#include "io/csv_reader.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace amortcalc {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

// Amounts may carry thousands separators ("1,250.00")
double parse_amount(std::string text) {
    text.erase(std::remove(text.begin(), text.end(), ','), text.end());
    size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed != text.size() || !std::isfinite(value)) {
        throw std::invalid_argument("Invalid amount: " + text);
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// LedgerDate Implementation
// ============================================================================

LedgerDate LedgerDate::parse(const std::string& text) {
    std::tm tm_buf{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm_buf, "%m/%d/%Y");
    if (iss.fail()) {
        throw std::invalid_argument("Invalid date (expected MM/DD/YYYY): " + text);
    }
    iss >> std::ws;
    if (!iss.eof()) {
        throw std::invalid_argument("Trailing characters after date: " + text);
    }

    LedgerDate date{tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday};
    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        throw std::invalid_argument("Date out of range: " + text);
    }
    return date;
}

std::string LedgerDate::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << month << "/"
        << std::setw(2) << day << "/" << std::setw(4) << year;
    return oss.str();
}

int months_between(const LedgerDate& start, const LedgerDate& end) {
    return (end.year - start.year) * 12 + (end.month - start.month);
}

// ============================================================================
// LedgerReader Implementation
// ============================================================================

LedgerReader::LedgerReader(std::vector<Party> parties,
                           std::vector<std::string> mutual_income_strings,
                           LedgerDate first_period,
                           char delimiter)
    : parties_(std::move(parties)),
      mutual_income_strings_(std::move(mutual_income_strings)),
      first_period_(first_period),
      delimiter_(delimiter) {}

std::vector<Payment> LedgerReader::parse_file(const std::string& file_path) const {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open ledger file: " + file_path);
    }
    return parse(file);
}

std::vector<Payment> LedgerReader::parse(std::istream& is) const {
    std::vector<Payment> payments;
    Logger& logger = Logger::get_instance();
    CsvReader reader(is, delimiter_);

    while (reader.has_more()) {
        std::vector<std::string> row = reader.read_row();
        const LogContext ctx("ledger", "line " + std::to_string(reader.line_number()));

        if (row.size() < 4) {
            if (!row.empty()) {
                logger.log_warning(ctx, "Skipping malformed ledger row");
            }
            continue;
        }

        const std::string& date_str = row[0];
        const std::string& description = row[1];

        LedgerDate date{};
        double amount = 0.0;
        try {
            date = LedgerDate::parse(date_str);
            amount = parse_amount(row[2]);
        } catch (const std::exception& e) {
            // Header lines and summary rows end up here
            logger.log_warning(ctx, "Skipping ledger row: " + std::string(e.what()));
            continue;
        }

        const int period = months_between(first_period_, date) + 1;
        if (period < 0) {
            logger.log_warning(ctx, "Skipping ledger row dated before the down payment period: " +
                                    date_str);
            continue;
        }

        const Party* sender = identify_sender(description, amount);
        const bool mutual_income = is_mutual_income(description);

        if (mutual_income && sender) {
            throw LedgerError("Transaction '" + description + "' from " + sender->name +
                              " is also flagged as mutual income");
        }

        if (sender) {
            payments.emplace_back(amount, sender->name, kCommonFundName, period, date_str);
        } else if (mutual_income) {
            std::vector<const Party*> sharers;
            for (const Party& party : parties_) {
                if (!party.is_common_party()) {
                    sharers.push_back(&party);
                }
            }
            for (const Party* party : sharers) {
                payments.emplace_back(amount / static_cast<double>(sharers.size()), party->name,
                                      kCommonFundName, period, date_str);
            }
        }
    }

    return payments;
}

const Party* LedgerReader::identify_sender(const std::string& description, double amount) const {
    std::vector<const Party*> identified;

    for (const Party& party : parties_) {
        bool excluded = false;
        for (const std::string& exclusion : party.ledger_exclusions) {
            if (contains_ignore_case(description, exclusion)) {
                excluded = true;
            }
        }

        bool match = false;
        for (const std::string& marker : party.ledger_strings) {
            if (contains_ignore_case(description, marker)) {
                match = true;
            }
        }

        if (match && party.exclusion_amount && std::fabs(amount) < *party.exclusion_amount) {
            excluded = true;
        }

        if (match && !excluded) {
            identified.push_back(&party);
        }
    }

    if (identified.size() > 1) {
        std::string names;
        for (const Party* party : identified) {
            if (!names.empty()) names += ", ";
            names += party->name;
        }
        throw LedgerError("Transaction '" + description + "' matched multiple senders: " + names);
    }

    return identified.empty() ? nullptr : identified.front();
}

bool LedgerReader::is_mutual_income(const std::string& description) const {
    return std::any_of(mutual_income_strings_.begin(), mutual_income_strings_.end(),
                       [&](const std::string& marker) {
                           return contains_ignore_case(description, marker);
                       });
}

// ============================================================================
// LedgerProcessor Implementation
// ============================================================================

LedgerProcessor::LedgerProcessor(Property& property)
    : property_(property) {}

bool LedgerProcessor::process_payment(const Payment& payment) {
    if (!property_.has_stakeholder(payment.sender)) {
        Logger::get_instance().log_warning(
            LogContext("ledger", payment.sender, payment.period),
            "Payment from " + payment.sender + " ignored: not a stakeholder");
        return false;
    }

    property_.accept_payment(payment);
    return true;
}

void LedgerProcessor::process_payments(std::vector<Payment> payments) {
    std::stable_sort(payments.begin(), payments.end(),
                     [](const Payment& a, const Payment& b) { return a.period < b.period; });

    for (const Payment& payment : payments) {
        while (property_.current_period() < payment.period) {
            property_.advance_period();
        }
        process_payment(payment);
    }
}

void LedgerProcessor::advance_period() {
    property_.advance_period();
}

std::map<std::string, AmortizationTable> LedgerProcessor::tables(TableView view) const {
    return property_.schedules(view);
}

} // namespace amortcalc
