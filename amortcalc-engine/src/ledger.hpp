#ifndef AMORTCALC_LEDGER_HPP
#define AMORTCALC_LEDGER_HPP

#include "payment.hpp"
#include "property.hpp"
#include "tranche.hpp"
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace amortcalc {

// Raised when a ledger row cannot be attributed unambiguously
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}
};

struct LedgerDate {
    int year;
    int month;
    int day;

    // Parses MM/DD/YYYY; throws std::invalid_argument on malformed input
    static LedgerDate parse(const std::string& text);

    std::string to_string() const;
};

// Whole calendar months from start to end (day of month is ignored)
int months_between(const LedgerDate& start, const LedgerDate& end);

// Turns a bank ledger export into payments.
//
// Expected row layout: date, description, amount, balance (tab separated by
// default). The period of a row is the number of months since the first
// period date plus one, so rows dated in the month before the first period
// land in period 0 (down payments).
class LedgerReader {
public:
    LedgerReader(std::vector<Party> parties,
                 std::vector<std::string> mutual_income_strings,
                 LedgerDate first_period,
                 char delimiter = '\t');

    // Throws std::runtime_error if the file cannot be opened
    std::vector<Payment> parse_file(const std::string& file_path) const;

    // Rows that are short or have an unparseable date or amount are skipped.
    // Throws LedgerError when a row matches several senders, or matches a
    // sender and a mutual income marker.
    std::vector<Payment> parse(std::istream& is) const;

    // Party whose ledger strings match the description, or nullptr
    const Party* identify_sender(const std::string& description, double amount) const;

    bool is_mutual_income(const std::string& description) const;

    const std::vector<Party>& parties() const { return parties_; }
    const LedgerDate& first_period() const { return first_period_; }

private:
    std::vector<Party> parties_;
    std::vector<std::string> mutual_income_strings_;
    LedgerDate first_period_;
    char delimiter_;
};

// Feeds ledger payments into a property, advancing periods as the ledger moves on
class LedgerProcessor {
public:
    explicit LedgerProcessor(Property& property);

    // Accept a single payment; returns false if the sender is not a stakeholder
    bool process_payment(const Payment& payment);

    // Sort by period and process in order, advancing the property to each
    // payment's period first
    void process_payments(std::vector<Payment> payments);

    // Close the current period, e.g. to compute the next period before it
    // appears in the ledger
    void advance_period();

    std::map<std::string, AmortizationTable> tables(TableView view = TableView::Full) const;

private:
    Property& property_;
};

} // namespace amortcalc

#endif // AMORTCALC_LEDGER_HPP
