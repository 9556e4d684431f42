#include "tranche.hpp"
#include "combiner.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace amortcalc {

namespace {

double round_cents(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

std::string format_amount(double amount) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}

} // anonymous namespace

std::string table_view_to_string(TableView view) {
    switch (view) {
        case TableView::Full: return "full";
        case TableView::Sideloan: return "sideloan";
        case TableView::Baseline: return "baseline";
        default: return "unknown";
    }
}

TableView string_to_table_view(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "full") return TableView::Full;
    if (lower == "sideloan") return TableView::Sideloan;
    if (lower == "baseline") return TableView::Baseline;
    throw std::invalid_argument("Unknown table view: " + name +
                                " (expected full, sideloan or baseline)");
}

// ============================================================================
// Tranche Implementation
// ============================================================================

Tranche::Tranche(const Parties& parties,
                 const LoanInfo& loan_info,
                 double baseline_value,
                 double nominal_principal,
                 TrancheType type,
                 double tolerance)
    : parties_(parties),
      type_(type),
      tolerance_(tolerance),
      baseline_(loan_info, baseline_value, 1, ExtraPayments(), ExtraPaymentMode::Recast),
      nominal_(loan_info, nominal_principal, 1, ExtraPayments(), ExtraPaymentMode::Recast),
      adjusted_(baseline_),
      current_period_(0)
{
    if (!(tolerance_ >= 0.0)) {
        throw std::invalid_argument("Verification tolerance must be non-negative");
    }
}

const LoanSlice& Tranche::adjusted() const {
    return adjusted_;
}

void Tranche::require_flexible(const char* operation) const {
    if (type_ != TrancheType::Flexible) {
        throw std::logic_error(std::string("Only flexible tranches support ") + operation);
    }
}

void Tranche::accept_payment(const Payment& payment) {
    if (payment.period != current_period_) {
        throw PaymentError("Payment for period " + std::to_string(payment.period) +
                           " rejected (current period: " + std::to_string(current_period_) + ")");
    }
    pending_payments_.push_back(payment);
}

void Tranche::advance_period() {
    LogContext ctx("tranche", parties_.stakeholder.name, current_period_);
    Logger& logger = Logger::get_instance();

    if (current_period_ > baseline_.info().total_periods) {
        std::string message = "Cannot settle period " + std::to_string(current_period_) +
                              " past the last period " +
                              std::to_string(baseline_.info().total_periods);
        logger.log_error(ctx, message);
        throw PaymentError(message);
    }

    double total_paid = 0.0;
    for (const Payment& payment : pending_payments_) {
        total_paid += payment.amount;
    }

    double expected_payment = 0.0;

    if (type_ == TrancheType::Fixed) {
        expected_payment = baseline_.payment_for_period(current_period_).total_payment;

        if (round_cents(total_paid) != round_cents(expected_payment)) {
            std::string message = "Fixed tranche requires exact payment of " +
                                  format_amount(expected_payment) + ", but received " +
                                  format_amount(total_paid);
            logger.log_error(ctx, message);
            throw PaymentError(message);
        }
    } else {
        expected_payment = adjusted_.payment_for_period(current_period_).total_payment;
        double difference = round_cents(total_paid - expected_payment);

        if (difference < 0.0 && current_period_ < 1) {
            std::string message = "Down payment from " + parties_.stakeholder.name +
                                  " cannot be negative";
            logger.log_error(ctx, message);
            throw PaymentError(message);
        }

        // Outstanding balance once this period's scheduled payment is made
        const double outstanding = current_period_ < 1
            ? adjusted_.principal()
            : adjusted_.payment_for_period(current_period_).remaining_balance;

        if (difference > 0.0) {
            if (difference > round_cents(outstanding)) {
                std::string message = "Payment from " + parties_.stakeholder.name +
                                      " overpays the remaining balance of " +
                                      format_amount(outstanding) + " by " +
                                      format_amount(difference - outstanding);
                logger.log_error(ctx, message);
                throw PaymentError(message);
            }
            // Paying off to the cent settles the exact balance
            if (difference == round_cents(outstanding)) {
                difference = outstanding;
            }
        }

        if (difference != 0.0) {
            add_adjustment_payment(Payment(difference, parties_.stakeholder.name,
                                           parties_.common_party.name, current_period_));
        }
    }

    logger.log_period_advanced(ctx, total_paid, expected_payment);

    pending_payments_.clear();
    ++current_period_;
}

void Tranche::add_adjustment_payment(const Payment& payment) {
    require_flexible("adjustment payments");

    LoanSlice offset(baseline_.info(), -payment.amount, payment.period + 1,
                     ExtraPayments(), ExtraPaymentMode::Recast);
    record_adjustment(offset, payment);
}

void Tranche::add_adjustment_loan(const LoanSlice& loan) {
    require_flexible("adjustment loans");

    if (loan.info() != baseline_.info()) {
        throw std::invalid_argument("Adjustment loan must share the tranche's rate and term");
    }

    Payment payment(-loan.principal(), parties_.stakeholder.name, parties_.common_party.name,
                    loan.start_period() - 1);
    record_adjustment(loan, payment);
}

void Tranche::record_adjustment(const LoanSlice& loan, const Payment& payment) {
    adjusted_ = adjusted_.with_extra_payment(payment);
    adjustments_.push_back(loan);

    Logger::get_instance().log_adjustment_added(
        LogContext("tranche", parties_.stakeholder.name, current_period_),
        payment.amount, payment.period, adjustments_.size());
}

void Tranche::verify_adjustments() const {
    if (type_ != TrancheType::Flexible) {
        return;
    }

    const AmortizationTable adjusted_schedule = adjusted_.generate_schedule();

    std::vector<AmortizationTable> parts;
    parts.reserve(adjustments_.size() + 1);
    parts.push_back(baseline_.schedule());
    for (const LoanSlice& adjustment : adjustments_) {
        parts.push_back(adjustment.schedule());
    }
    const AmortizationTable verification_schedule = combine_tables(parts);

    std::vector<std::string> mismatches =
        adjusted_schedule.compare_cash_flows(verification_schedule, tolerance_);

    if (!mismatches.empty()) {
        Logger::get_instance().log_verification_failed(
            LogContext("tranche", parties_.stakeholder.name, current_period_), mismatches);
        throw VerificationError("Adjustment verification failed: amortization tables do not match",
                                std::move(mismatches));
    }
}

AmortizationTable Tranche::schedule(TableView view) const {
    switch (view) {
        case TableView::Full:
            verify_adjustments();
            return adjusted_.schedule();
        case TableView::Sideloan:
            return sideloan_table();
        case TableView::Baseline:
            return baseline_.schedule();
    }
    throw std::invalid_argument("Unknown table view");
}

AmortizationTable Tranche::adjustment_table() const {
    return combine_schedules(adjustments_);
}

AmortizationTable Tranche::sideloan_table() const {
    verify_adjustments();
    return subtract_schedules(adjusted_.schedule(), nominal_.schedule());
}

} // namespace amortcalc
