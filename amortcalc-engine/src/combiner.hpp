#ifndef AMORTCALC_COMBINER_HPP
#define AMORTCALC_COMBINER_HPP

#include "schedule.hpp"
#include "loan_slice.hpp"
#include <vector>

namespace amortcalc {

// Combine the schedules of several slices into one table.
//
// The entry for period p is the field-by-field sum of every input's entry for
// p; inputs without a row for p contribute nothing. Output periods are the
// union of input periods in ascending order. An empty input gives an empty
// table.
//
// Each period is summed over the inputs in the order given, so the result is
// the same with or without OpenMP.
AmortizationTable combine_schedules(const std::vector<LoanSlice>& slices);

// Same reduction over tables that are already built
AmortizationTable combine_tables(const std::vector<AmortizationTable>& tables);

// Row-wise difference minuend - subtrahend of the numeric fields, aligned by
// position and truncated to the shorter table. Period numbers come from the
// minuend.
AmortizationTable subtract_schedules(const AmortizationTable& minuend,
                                     const AmortizationTable& subtrahend);

} // namespace amortcalc

#endif // AMORTCALC_COMBINER_HPP
