#ifndef AMORTCALC_PAYMENT_HPP
#define AMORTCALC_PAYMENT_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace amortcalc {

// Role name of the shared account that receives stakeholder payments
constexpr const char* kCommonPartyRole = "Common Party";

// Raised when a payment cannot be accepted or does not match its schedule
class PaymentError : public std::runtime_error {
public:
    explicit PaymentError(const std::string& message)
        : std::runtime_error(message) {}
};

// A person or entity taking part in a shared mortgage
struct Party {
    std::string name;
    std::string role;                               // e.g. "Stakeholder", "Common Party", "Bank"
    std::vector<std::string> ledger_strings;        // Substrings identifying this party in a ledger
    std::vector<std::string> ledger_exclusions;     // Substrings that rule a ledger row out
    std::optional<double> exclusion_amount;         // Matches below this absolute amount are ignored

    Party() = default;
    explicit Party(std::string party_name, std::string party_role = "");

    bool is_common_party() const { return role == kCommonPartyRole; }

    bool operator==(const Party& other) const { return name == other.name; }
    bool operator!=(const Party& other) const { return !(*this == other); }
};

// Payer/recipient pair of a tranche
struct Parties {
    Party stakeholder;
    Party common_party;
};

// Money moved from one party to another within a period
struct Payment {
    double amount;
    std::string sender;
    std::string recipient;
    int period;
    std::string date;               // Optional ledger date (MM/DD/YYYY)

    // Throws std::invalid_argument if period is negative
    Payment(double payment_amount, std::string sender_name, std::string recipient_name,
            int payment_period, std::string payment_date = "");

    std::string describe() const;
};

} // namespace amortcalc

#endif // AMORTCALC_PAYMENT_HPP
