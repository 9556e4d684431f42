#include "combiner.hpp"
#include "logger.hpp"
#include <algorithm>
#include <set>

namespace amortcalc {

namespace {

void accumulate(ScheduleEntry& acc, const ScheduleEntry& entry) {
    acc.total_payment += entry.total_payment;
    acc.principal += entry.principal;
    acc.interest += entry.interest;
    acc.extra_payment += entry.extra_payment;
    acc.remaining_balance += entry.remaining_balance;
}

AmortizationTable combine(const std::vector<const AmortizationTable*>& tables) {
    // Union of all input periods, ascending
    std::set<int> period_set;
    for (const AmortizationTable* table : tables) {
        for (const ScheduleEntry& entry : *table) {
            period_set.insert(entry.period);
        }
    }
    const std::vector<int> periods(period_set.begin(), period_set.end());

    std::vector<ScheduleEntry> rows(periods.size());

    // Periods are independent; within a period the inputs are always summed
    // in input order
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t i = 0; i < periods.size(); ++i) {
        ScheduleEntry acc = zero_entry(periods[i]);
        for (const AmortizationTable* table : tables) {
            const ScheduleEntry* entry = table->find(periods[i]);
            if (entry) {
                accumulate(acc, *entry);
            }
        }
        rows[i] = acc;
    }

    Logger::get_instance().log_schedules_combined(
        LogContext("combiner"), tables.size(), rows.size());

    return AmortizationTable(std::move(rows));
}

} // anonymous namespace

AmortizationTable combine_schedules(const std::vector<LoanSlice>& slices) {
    std::vector<const AmortizationTable*> tables;
    tables.reserve(slices.size());
    for (const LoanSlice& slice : slices) {
        tables.push_back(&slice.schedule());
    }
    return combine(tables);
}

AmortizationTable combine_tables(const std::vector<AmortizationTable>& tables) {
    std::vector<const AmortizationTable*> pointers;
    pointers.reserve(tables.size());
    for (const AmortizationTable& table : tables) {
        pointers.push_back(&table);
    }
    return combine(pointers);
}

AmortizationTable subtract_schedules(const AmortizationTable& minuend,
                                     const AmortizationTable& subtrahend) {
    const size_t rows = std::min(minuend.size(), subtrahend.size());

    std::vector<ScheduleEntry> difference;
    difference.reserve(rows);

    for (size_t i = 0; i < rows; ++i) {
        const ScheduleEntry& a = minuend[i];
        const ScheduleEntry& b = subtrahend[i];
        difference.push_back(ScheduleEntry{
            a.period,
            a.total_payment - b.total_payment,
            a.principal - b.principal,
            a.interest - b.interest,
            a.extra_payment - b.extra_payment,
            a.remaining_balance - b.remaining_balance
        });
    }

    return AmortizationTable(std::move(difference));
}

} // namespace amortcalc
