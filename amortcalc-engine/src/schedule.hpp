#ifndef AMORTCALC_SCHEDULE_HPP
#define AMORTCALC_SCHEDULE_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace amortcalc {

// Tolerance used when comparing cash flows of schedules built along different paths
constexpr double kDefaultTolerance = 1e-6;

// One row of a loan's per-period breakdown
struct ScheduleEntry {
    int period;                     // Payment number (1-based)
    double total_payment;           // Scheduled payment for the period
    double principal;               // Portion of the payment reducing principal
    double interest;                // Portion of the payment covering interest
    double extra_payment;           // Additional principal paid this period
    double remaining_balance;       // Principal outstanding after this period

    bool operator==(const ScheduleEntry& other) const;
    bool operator!=(const ScheduleEntry& other) const { return !(*this == other); }
};

// Placeholder row for a period in which a slice is not yet active
ScheduleEntry zero_entry(int period);

// Run of consecutive rows [first, last] (indices) sharing the same total payment
struct PaymentRange {
    size_t first;
    size_t last;

    size_t length() const { return last - first + 1; }
};

// Ordered sequence of schedule entries with strictly increasing period numbers
class AmortizationTable {
public:
    using const_iterator = std::vector<ScheduleEntry>::const_iterator;

    AmortizationTable() = default;

    // Throws std::invalid_argument if periods are not strictly increasing
    explicit AmortizationTable(std::vector<ScheduleEntry> entries);

    const std::vector<ScheduleEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const ScheduleEntry& operator[](size_t index) const { return entries_[index]; }
    const ScheduleEntry& front() const;
    const ScheduleEntry& back() const;

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Entry for a period number, or nullptr if the table has no such period
    const ScheduleEntry* find(int period) const;

    // Entry for a period number; throws std::out_of_range if absent
    const ScheduleEntry& at_period(int period) const;

    // Exact element-wise equality
    bool operator==(const AmortizationTable& other) const;
    bool operator!=(const AmortizationTable& other) const { return !(*this == other); }

    // Compare the payment-flow columns (period, total payment, principal, interest)
    // row by row. Returns one description per mismatching row plus a length
    // mismatch line; an empty result means the tables agree within tolerance.
    std::vector<std::string> compare_cash_flows(const AmortizationTable& other,
                                                double tolerance = kDefaultTolerance) const;

    // Maximal runs of consecutive rows with identical total payment
    std::vector<PaymentRange> payment_ranges() const;

    // Sums over all rows
    double total_paid() const;
    double total_interest() const;
    double total_extra() const;

private:
    std::vector<ScheduleEntry> entries_;
};

} // namespace amortcalc

#endif // AMORTCALC_SCHEDULE_HPP
