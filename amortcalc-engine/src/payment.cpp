#include "payment.hpp"
#include <iomanip>
#include <sstream>

namespace amortcalc {

Party::Party(std::string party_name, std::string party_role)
    : name(std::move(party_name)), role(std::move(party_role)) {}

Payment::Payment(double payment_amount, std::string sender_name, std::string recipient_name,
                 int payment_period, std::string payment_date)
    : amount(payment_amount),
      sender(std::move(sender_name)),
      recipient(std::move(recipient_name)),
      period(payment_period),
      date(std::move(payment_date)) {
    if (period < 0) {
        throw std::invalid_argument("Period must be a non-negative integer");
    }
}

std::string Payment::describe() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Payment(amount=" << amount << ", sender=" << sender
        << ", recipient=" << recipient << ", period=" << period;
    if (!date.empty()) {
        oss << ", date=" << date;
    }
    oss << ")";
    return oss.str();
}

} // namespace amortcalc
