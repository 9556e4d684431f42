#include "schedule.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace amortcalc {

// ============================================================================
// ScheduleEntry Implementation
// ============================================================================

bool ScheduleEntry::operator==(const ScheduleEntry& other) const {
    return period == other.period &&
           total_payment == other.total_payment &&
           principal == other.principal &&
           interest == other.interest &&
           extra_payment == other.extra_payment &&
           remaining_balance == other.remaining_balance;
}

ScheduleEntry zero_entry(int period) {
    return ScheduleEntry{period, 0.0, 0.0, 0.0, 0.0, 0.0};
}

// ============================================================================
// AmortizationTable Implementation
// ============================================================================

AmortizationTable::AmortizationTable(std::vector<ScheduleEntry> entries)
    : entries_(std::move(entries)) {
    for (size_t i = 1; i < entries_.size(); ++i) {
        if (entries_[i].period <= entries_[i - 1].period) {
            throw std::invalid_argument(
                "Schedule periods must be strictly increasing (period " +
                std::to_string(entries_[i].period) + " follows period " +
                std::to_string(entries_[i - 1].period) + ")");
        }
    }
}

const ScheduleEntry& AmortizationTable::front() const {
    if (entries_.empty()) {
        throw std::out_of_range("Amortization table is empty");
    }
    return entries_.front();
}

const ScheduleEntry& AmortizationTable::back() const {
    if (entries_.empty()) {
        throw std::out_of_range("Amortization table is empty");
    }
    return entries_.back();
}

const ScheduleEntry* AmortizationTable::find(int period) const {
    auto it = std::lower_bound(
        entries_.begin(), entries_.end(), period,
        [](const ScheduleEntry& entry, int p) { return entry.period < p; });
    if (it == entries_.end() || it->period != period) {
        return nullptr;
    }
    return &(*it);
}

const ScheduleEntry& AmortizationTable::at_period(int period) const {
    const ScheduleEntry* entry = find(period);
    if (!entry) {
        throw std::out_of_range("Requested period " + std::to_string(period) + " is out of range");
    }
    return *entry;
}

bool AmortizationTable::operator==(const AmortizationTable& other) const {
    return entries_ == other.entries_;
}

std::vector<std::string> AmortizationTable::compare_cash_flows(
    const AmortizationTable& other, double tolerance) const
{
    std::vector<std::string> mismatches;

    auto differs = [tolerance](double a, double b) {
        return !(std::fabs(a - b) <= tolerance);
    };

    const size_t rows = std::min(entries_.size(), other.entries_.size());
    for (size_t i = 0; i < rows; ++i) {
        const ScheduleEntry& expected = entries_[i];
        const ScheduleEntry& actual = other.entries_[i];

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        bool first = true;
        auto note = [&](const char* label, double v1, double v2) {
            if (!first) oss << "; ";
            oss << label << ": Expected " << v1 << ", got " << v2;
            first = false;
        };

        if (expected.period != actual.period) {
            if (!first) oss << "; ";
            oss << "Payment #: Expected " << expected.period << ", got " << actual.period;
            first = false;
        }
        if (differs(expected.total_payment, actual.total_payment)) {
            note("Total Payment", expected.total_payment, actual.total_payment);
        }
        if (differs(expected.principal, actual.principal)) {
            note("Principal", expected.principal, actual.principal);
        }
        if (differs(expected.interest, actual.interest)) {
            note("Interest", expected.interest, actual.interest);
        }

        if (!first) {
            mismatches.push_back("Row " + std::to_string(i + 1) + " mismatch -> " + oss.str());
        }
    }

    if (entries_.size() != other.entries_.size()) {
        mismatches.push_back("Row count mismatch -> Expected " + std::to_string(entries_.size()) +
                             ", got " + std::to_string(other.entries_.size()));
    }

    return mismatches;
}

std::vector<PaymentRange> AmortizationTable::payment_ranges() const {
    std::vector<PaymentRange> ranges;
    if (entries_.empty()) {
        return ranges;
    }

    size_t start = 0;
    for (size_t i = 1; i < entries_.size(); ++i) {
        if (entries_[i].total_payment != entries_[start].total_payment) {
            ranges.push_back(PaymentRange{start, i - 1});
            start = i;
        }
    }
    ranges.push_back(PaymentRange{start, entries_.size() - 1});
    return ranges;
}

double AmortizationTable::total_paid() const {
    double sum = 0.0;
    for (const auto& entry : entries_) {
        sum += entry.total_payment + entry.extra_payment;
    }
    return sum;
}

double AmortizationTable::total_interest() const {
    double sum = 0.0;
    for (const auto& entry : entries_) {
        sum += entry.interest;
    }
    return sum;
}

double AmortizationTable::total_extra() const {
    double sum = 0.0;
    for (const auto& entry : entries_) {
        sum += entry.extra_payment;
    }
    return sum;
}

} // namespace amortcalc
