#ifndef AMORTCALC_PROPERTY_HPP
#define AMORTCALC_PROPERTY_HPP

#include "loan_slice.hpp"
#include "payment.hpp"
#include "tranche.hpp"
#include <map>
#include <string>
#include <vector>

namespace amortcalc {

// Name of the shared account every stakeholder pays into
constexpr const char* kCommonFundName = "Common Fund";

struct PropertyParams {
    double purchase_cost;
    double purchase_down_payment;                           // Paid on the house, reduces the mortgage
    LoanInfo loan_info;
    std::vector<Party> stakeholders;                        // Common parties are ignored
    std::map<std::string, double> stakeholder_down_payments;  // Accepted at period 0
};

// A property bought jointly by several stakeholders.
//
// The purchase cost and the mortgage debt are split evenly: each stakeholder
// gets a flexible tranche whose baseline is their share of the cost and whose
// nominal loan is their share of the debt.
class Property {
public:
    // Throws std::invalid_argument if there are no stakeholders
    explicit Property(const PropertyParams& params);

    // Throws std::invalid_argument for an unknown stakeholder
    void accept_payment(const std::string& stakeholder, double amount, int period);
    void accept_payment(const Payment& payment);

    // Advance every tranche by one period
    void advance_period();

    std::map<std::string, AmortizationTable> schedules(TableView view) const;

    // All stakeholders' schedules for a view combined into one
    AmortizationTable combined_schedule(TableView view) const;

    bool has_stakeholder(const std::string& name) const;
    const Tranche& tranche(const std::string& name) const;
    const std::map<std::string, Tranche>& tranches() const { return tranches_; }
    std::vector<std::string> stakeholder_names() const;

    // Sum of the stakeholders' shares of the mortgage debt
    double total_stake_allocated() const;

    int current_period() const { return current_period_; }
    const LoanInfo& loan_info() const { return loan_info_; }
    const Party& common_fund() const { return common_fund_; }

private:
    LoanInfo loan_info_;
    Party common_fund_;
    std::map<std::string, Party> stakeholders_;
    std::map<std::string, Tranche> tranches_;
    int current_period_;

    Tranche& find_tranche(const std::string& name);
};

} // namespace amortcalc

#endif // AMORTCALC_PROPERTY_HPP
