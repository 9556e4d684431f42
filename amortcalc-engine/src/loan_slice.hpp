#ifndef AMORTCALC_LOAN_SLICE_HPP
#define AMORTCALC_LOAN_SLICE_HPP

#include "schedule.hpp"
#include "payment.hpp"
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace amortcalc {

// Raised when loan parameters leave the payment formula undefined
class InvalidLoanParameters : public std::invalid_argument {
public:
    explicit InvalidLoanParameters(const std::string& message)
        : std::invalid_argument(message) {}
};

// Rate and term shared by every slice of a mortgage
struct LoanInfo {
    double annual_rate;             // Fraction, not percentage (0.05 = 5%)
    int total_periods;              // Schedule length in months

    bool operator==(const LoanInfo& other) const {
        return annual_rate == other.annual_rate && total_periods == other.total_periods;
    }
    bool operator!=(const LoanInfo& other) const { return !(*this == other); }
};

// How a slice responds to an extra payment
enum class ExtraPaymentMode : uint8_t {
    KeepPayment = 0,    // Fixed payment never changes; the loan pays off early
    Recast = 1          // Payment is re-amortized over the remaining periods
};

// Scheduled amounts of one period, as looked up by a tranche
struct PaymentDetails {
    double total_payment;
    double principal;
    double interest;
    double remaining_balance;
};

// Immutable period -> amount map. Copies share storage; with_added()
// returns a new map and never touches the original.
class ExtraPayments {
public:
    using Map = std::map<int, double>;

    ExtraPayments();
    ExtraPayments(std::initializer_list<Map::value_type> values);
    explicit ExtraPayments(Map values);

    // Amount recorded for a period, 0 if none
    double get(int period) const;
    bool contains(int period) const;

    size_t size() const { return values_->size(); }
    bool empty() const { return values_->empty(); }

    const Map& values() const { return *values_; }
    Map::const_iterator begin() const { return values_->begin(); }
    Map::const_iterator end() const { return values_->end(); }

    // Copy with amount added to whatever is recorded for period
    ExtraPayments with_added(int period, double amount) const;

    bool operator==(const ExtraPayments& other) const { return *values_ == *other.values_; }
    bool operator!=(const ExtraPayments& other) const { return !(*this == other); }

private:
    std::shared_ptr<const Map> values_;
};

// One loan or sub-loan. Immutable: the fixed payment and the schedule are
// derived once at construction from the parameters and extra payments.
//
// An extra payment recorded for period 0 is a down payment and reduces the
// financed principal (principal = total_value - extra_payments[0]).
// Periods before start_period are zero placeholders so that slices starting
// mid-term line up with full-term slices period by period.
class LoanSlice {
public:
    // Throws InvalidLoanParameters on non-positive total_periods, start_period < 1,
    // negative extra payment periods, non-finite amounts or monthly_rate <= -1
    LoanSlice(const LoanInfo& info,
              double total_value,
              int start_period = 1,
              ExtraPayments extra_payments = ExtraPayments(),
              ExtraPaymentMode mode = ExtraPaymentMode::KeepPayment);

    // Annuity payment retiring principal over payment_periods at monthly_rate.
    // A zero rate amortizes straight-line. Throws InvalidLoanParameters if
    // payment_periods <= 0.
    static double calculate_payment(double principal, int payment_periods, double monthly_rate);

    // New slice with amount added to the extra payment of period; the schedule
    // is regenerated and this slice is left unchanged
    LoanSlice with_extra_payment(double amount, int period) const;
    LoanSlice with_extra_payment(const Payment& payment) const;

    // Regenerate the schedule from the slice parameters
    AmortizationTable generate_schedule() const;

    // Scheduled amounts for a period. Period 0 is the down payment period and
    // reports the full value as balance. Throws std::out_of_range otherwise.
    PaymentDetails payment_for_period(int period) const;

    const LoanInfo& info() const { return info_; }
    double total_value() const { return total_value_; }
    double down_payment() const { return down_payment_; }
    double principal() const { return principal_; }
    double annual_rate() const { return info_.annual_rate; }
    double monthly_rate() const { return monthly_rate_; }
    int total_periods() const { return info_.total_periods; }
    int start_period() const { return start_period_; }
    int payment_periods() const { return payment_periods_; }
    bool is_active() const { return payment_periods_ > 0; }
    double fixed_payment() const { return fixed_payment_; }
    ExtraPaymentMode mode() const { return mode_; }
    const ExtraPayments& extra_payments() const { return extra_payments_; }
    const AmortizationTable& schedule() const { return schedule_; }

    std::string describe() const;

private:
    LoanInfo info_;
    double total_value_;
    int start_period_;
    ExtraPayments extra_payments_;
    ExtraPaymentMode mode_;

    double down_payment_;
    double principal_;
    double monthly_rate_;
    int payment_periods_;
    double fixed_payment_;
    AmortizationTable schedule_;

    void validate() const;
    double clamp_balance(double balance) const;
};

} // namespace amortcalc

#endif // AMORTCALC_LOAN_SLICE_HPP
