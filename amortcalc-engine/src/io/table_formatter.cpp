#include "table_formatter.hpp"
#include <iomanip>
#include <sstream>

namespace amortcalc {
namespace io {

const char* const kTableHeader =
    "Payment # | Total Payment | Principal | Interest | Extra Payment | Remaining Balance";

std::string format_row(const ScheduleEntry& entry) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << std::setw(9) << entry.period << " | "
        << std::setw(13) << entry.total_payment << " | "
        << std::setw(9) << entry.principal << " | "
        << std::setw(8) << entry.interest << " | "
        << std::setw(13) << entry.extra_payment << " | "
        << std::setw(17) << entry.remaining_balance;
    return oss.str();
}

void write_table(std::ostream& os, const AmortizationTable& table, bool include_header) {
    if (include_header) {
        os << kTableHeader << "\n";
    }
    for (const ScheduleEntry& entry : table) {
        os << format_row(entry) << "\n";
    }
}

void write_summary(std::ostream& os, const AmortizationTable& table, size_t head, size_t tail) {
    if (table.empty()) {
        return;
    }

    os << kTableHeader << "\n";

    for (const PaymentRange& range : table.payment_ranges()) {
        if (range.length() > head + tail) {
            for (size_t i = range.first; i < range.first + head; ++i) {
                os << format_row(table[i]) << "\n";
            }
            os << "...\n";
            for (size_t i = range.last + 1 - tail; i <= range.last; ++i) {
                os << format_row(table[i]) << "\n";
            }
        } else {
            for (size_t i = range.first; i <= range.last; ++i) {
                os << format_row(table[i]) << "\n";
            }
        }
    }
}

std::string format_table(const AmortizationTable& table, bool include_header) {
    std::ostringstream oss;
    write_table(oss, table, include_header);
    return oss.str();
}

} // namespace io
} // namespace amortcalc
