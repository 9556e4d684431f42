#include "loan_slice.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace amortcalc {

// ============================================================================
// ExtraPayments Implementation
// ============================================================================

ExtraPayments::ExtraPayments()
    : values_(std::make_shared<const Map>()) {}

ExtraPayments::ExtraPayments(std::initializer_list<Map::value_type> values)
    : values_(std::make_shared<const Map>(values)) {}

ExtraPayments::ExtraPayments(Map values)
    : values_(std::make_shared<const Map>(std::move(values))) {}

double ExtraPayments::get(int period) const {
    auto it = values_->find(period);
    return it == values_->end() ? 0.0 : it->second;
}

bool ExtraPayments::contains(int period) const {
    return values_->count(period) > 0;
}

ExtraPayments ExtraPayments::with_added(int period, double amount) const {
    Map copy = *values_;
    copy[period] += amount;
    return ExtraPayments(std::move(copy));
}

// ============================================================================
// LoanSlice Implementation
// ============================================================================

LoanSlice::LoanSlice(const LoanInfo& info,
                     double total_value,
                     int start_period,
                     ExtraPayments extra_payments,
                     ExtraPaymentMode mode)
    : info_(info),
      total_value_(total_value),
      start_period_(start_period),
      extra_payments_(std::move(extra_payments)),
      mode_(mode),
      down_payment_(0.0),
      principal_(0.0),
      monthly_rate_(0.0),
      payment_periods_(0),
      fixed_payment_(0.0)
{
    validate();

    down_payment_ = extra_payments_.get(0);
    principal_ = total_value_ - down_payment_;
    monthly_rate_ = info_.annual_rate / 12.0;
    payment_periods_ = info_.total_periods - start_period_ + 1;

    // A slice starting after the last period never pays
    if (payment_periods_ > 0) {
        fixed_payment_ = calculate_payment(principal_, payment_periods_, monthly_rate_);
        if (!std::isfinite(fixed_payment_)) {
            throw InvalidLoanParameters("Payment formula is undefined for annual rate " +
                                        std::to_string(info_.annual_rate));
        }
    }

    schedule_ = generate_schedule();

    Logger::get_instance().log_slice_generated(
        LogContext("loan_slice"), principal_, info_.annual_rate, info_.total_periods,
        start_period_, fixed_payment_, extra_payments_.size());
}

void LoanSlice::validate() const {
    if (info_.total_periods <= 0) {
        throw InvalidLoanParameters("Total periods must be positive, got " +
                                    std::to_string(info_.total_periods));
    }
    if (start_period_ < 1) {
        throw InvalidLoanParameters("Start period must be at least 1, got " +
                                    std::to_string(start_period_));
    }
    if (!std::isfinite(info_.annual_rate)) {
        throw InvalidLoanParameters("Annual rate must be finite");
    }
    if (info_.annual_rate / 12.0 <= -1.0) {
        throw InvalidLoanParameters("Monthly rate must be greater than -1");
    }
    if (!std::isfinite(total_value_)) {
        throw InvalidLoanParameters("Loan value must be finite");
    }
    for (const auto& [period, amount] : extra_payments_) {
        if (period < 0) {
            throw InvalidLoanParameters("Extra payment period must be non-negative, got " +
                                        std::to_string(period));
        }
        if (!std::isfinite(amount)) {
            throw InvalidLoanParameters("Extra payment for period " + std::to_string(period) +
                                        " must be finite");
        }
    }
}

double LoanSlice::calculate_payment(double principal, int payment_periods, double monthly_rate) {
    if (payment_periods <= 0) {
        throw InvalidLoanParameters("Payment periods must be positive, got " +
                                    std::to_string(payment_periods));
    }
    // Rates too small to register against 1.0 amortize straight-line
    if (monthly_rate == 0.0 || 1.0 + monthly_rate == 1.0) {
        return principal / payment_periods;
    }
    return (monthly_rate * principal) /
           (1.0 - std::pow(1.0 + monthly_rate, -payment_periods));
}

double LoanSlice::clamp_balance(double balance) const {
    // Balance never crosses zero: positive loans floor at 0, offsetting loans cap at 0
    return principal_ >= 0.0 ? std::max(0.0, balance) : std::min(0.0, balance);
}

AmortizationTable LoanSlice::generate_schedule() const {
    const int total_periods = info_.total_periods;

    std::vector<ScheduleEntry> rows;
    rows.reserve(static_cast<size_t>(total_periods));

    const int last_placeholder = std::min(start_period_ - 1, total_periods);
    for (int period = 1; period <= last_placeholder; ++period) {
        rows.push_back(zero_entry(period));
    }

    double balance = principal_;
    double payment = fixed_payment_;

    for (int period = start_period_; period <= total_periods; ++period) {
        const double interest = balance * monthly_rate_;
        const double principal_part = payment - interest;
        const double extra = extra_payments_.get(period);

        balance -= principal_part + extra;
        balance = clamp_balance(balance);

        rows.push_back(ScheduleEntry{period, payment, principal_part, interest, extra, balance});

        if (mode_ == ExtraPaymentMode::Recast && extra != 0.0) {
            const int remaining_periods = total_periods - period;
            if (remaining_periods > 0) {
                payment = calculate_payment(balance, remaining_periods, monthly_rate_);
            }
        }
    }

    return AmortizationTable(std::move(rows));
}

LoanSlice LoanSlice::with_extra_payment(double amount, int period) const {
    if (period < 0) {
        throw InvalidLoanParameters("Extra payment period must be non-negative, got " +
                                    std::to_string(period));
    }
    return LoanSlice(info_, total_value_, start_period_,
                     extra_payments_.with_added(period, amount), mode_);
}

LoanSlice LoanSlice::with_extra_payment(const Payment& payment) const {
    return with_extra_payment(payment.amount, payment.period);
}

PaymentDetails LoanSlice::payment_for_period(int period) const {
    if (period == 0) {
        return PaymentDetails{0.0, 0.0, 0.0, total_value_};
    }

    const ScheduleEntry& entry = schedule_.at_period(period);
    return PaymentDetails{entry.total_payment, entry.principal, entry.interest,
                          entry.remaining_balance};
}

std::string LoanSlice::describe() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Loan(principal=" << principal_
        << ", annual_rate=" << std::setprecision(4) << info_.annual_rate
        << std::setprecision(2)
        << ", total_periods=" << info_.total_periods
        << ", start_period=" << start_period_
        << ", monthly_payment=" << fixed_payment_
        << ", remaining_balance=" << (schedule_.empty() ? 0.0 : schedule_.back().remaining_balance)
        << ")";
    return oss.str();
}

} // namespace amortcalc
