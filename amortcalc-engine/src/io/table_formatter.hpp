#ifndef AMORTCALC_IO_TABLE_FORMATTER_HPP
#define AMORTCALC_IO_TABLE_FORMATTER_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include "../schedule.hpp"

namespace amortcalc {
namespace io {

// Column header of the text report
extern const char* const kTableHeader;

// Format one row with the report's fixed column widths
std::string format_row(const ScheduleEntry& entry);

// Write every row of the table, one per line
void write_table(std::ostream& os, const AmortizationTable& table, bool include_header = true);

// Write a condensed report: each run of rows with the same total payment that is
// longer than head + tail rows is shortened to its first head rows, a "..." line
// and its last tail rows
void write_summary(std::ostream& os, const AmortizationTable& table,
                   size_t head = 2, size_t tail = 2);

std::string format_table(const AmortizationTable& table, bool include_header = true);

} // namespace io
} // namespace amortcalc

#endif // AMORTCALC_IO_TABLE_FORMATTER_HPP
