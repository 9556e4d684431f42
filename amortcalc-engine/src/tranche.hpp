#ifndef AMORTCALC_TRANCHE_HPP
#define AMORTCALC_TRANCHE_HPP

#include "loan_slice.hpp"
#include "payment.hpp"
#include "schedule.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace amortcalc {

enum class TrancheType : uint8_t {
    Fixed = 0,      // Payments must match the baseline schedule exactly
    Flexible = 1    // Payment differences become adjustments
};

// Which schedule of a tranche to report
enum class TableView : uint8_t {
    Full = 0,       // Adjusted loan (baseline plus all adjustments)
    Sideloan = 1,   // Adjusted loan minus the stakeholder's share of the real mortgage
    Baseline = 2    // Baseline loan without adjustments
};

std::string table_view_to_string(TableView view);

// Parses "full", "sideloan" or "baseline" (case-insensitive); throws std::invalid_argument otherwise
TableView string_to_table_view(const std::string& name);

// Raised when an adjusted schedule disagrees with the combination of its
// baseline and adjustment loans
class VerificationError : public std::runtime_error {
public:
    VerificationError(const std::string& message, std::vector<std::string> mismatches)
        : std::runtime_error(message), mismatches_(std::move(mismatches)) {}

    const std::vector<std::string>& mismatches() const { return mismatches_; }

private:
    std::vector<std::string> mismatches_;
};

// A stakeholder's slice of a shared mortgage.
//
// The baseline loan is what the stakeholder owes on their full share of the
// property value. Every over- or underpayment on a flexible tranche is
// recorded twice: as an extra payment on the adjusted loan, and as an offset
// loan of opposite principal starting the period after. The adjusted schedule
// must always equal baseline + offsets; verify_adjustments() checks this.
//
// Periods start at 0, the down payment period. Payments are queued with
// accept_payment() and settled by advance_period().
class Tranche {
public:
    // Throws InvalidLoanParameters if either loan cannot be built
    Tranche(const Parties& parties,
            const LoanInfo& loan_info,
            double baseline_value,
            double nominal_principal,
            TrancheType type = TrancheType::Flexible,
            double tolerance = kDefaultTolerance);

    // Queue a payment for the current period. Throws PaymentError for any other period.
    void accept_payment(const Payment& payment);

    // Settle queued payments and move to the next period.
    // Fixed: throws PaymentError unless the total matches the schedule to the cent.
    // Flexible: the difference becomes an adjustment; a negative down payment
    // or one that pays more than the outstanding balance throws PaymentError.
    // Settling a period after total_periods throws PaymentError.
    void advance_period();

    // Record an extra payment and its equivalent offset loan
    void add_adjustment_payment(const Payment& payment);

    // Record an offset loan and its equivalent extra payment. The loan must
    // share the tranche's rate and term.
    void add_adjustment_loan(const LoanSlice& loan);

    // Throws VerificationError if the regenerated adjusted schedule differs
    // from the combination of baseline and adjustment loans
    void verify_adjustments() const;

    // Schedule for a view; Full and Sideloan are verified first
    AmortizationTable schedule(TableView view) const;

    // Combination of all recorded adjustment loans
    AmortizationTable adjustment_table() const;

    // Verified adjusted schedule minus the nominal loan schedule
    AmortizationTable sideloan_table() const;

    TrancheType type() const { return type_; }
    const Parties& parties() const { return parties_; }
    int current_period() const { return current_period_; }
    const std::vector<Payment>& pending_payments() const { return pending_payments_; }
    const std::vector<LoanSlice>& adjustments() const { return adjustments_; }
    const LoanSlice& baseline() const { return baseline_; }
    const LoanSlice& nominal() const { return nominal_; }
    const LoanSlice& adjusted() const;

private:
    Parties parties_;
    TrancheType type_;
    double tolerance_;
    LoanSlice baseline_;
    LoanSlice nominal_;
    LoanSlice adjusted_;
    std::vector<LoanSlice> adjustments_;

    int current_period_;
    std::vector<Payment> pending_payments_;

    void record_adjustment(const LoanSlice& loan, const Payment& payment);
    void require_flexible(const char* operation) const;
};

} // namespace amortcalc

#endif // AMORTCALC_TRANCHE_HPP
