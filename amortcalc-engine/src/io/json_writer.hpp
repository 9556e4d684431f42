#ifndef AMORTCALC_IO_JSON_WRITER_HPP
#define AMORTCALC_IO_JSON_WRITER_HPP

#include <map>
#include <ostream>
#include <string>
#include "../schedule.hpp"

namespace amortcalc {
namespace io {

// Write an AmortizationTable to JSON format
// The output includes row count, column totals and every row
void write_table_json(std::ostream& os, const AmortizationTable& table,
                      bool pretty_print = true);

// Write an AmortizationTable to JSON file
void write_table_json(const std::string& filepath, const AmortizationTable& table,
                      bool pretty_print = true);

// Write named tables (one per stakeholder) under a "tables" object, tagged with the view name
void write_tables_json(std::ostream& os, const std::map<std::string, AmortizationTable>& tables,
                       const std::string& view, bool pretty_print = true);

void write_tables_json(const std::string& filepath,
                       const std::map<std::string, AmortizationTable>& tables,
                       const std::string& view, bool pretty_print = true);

} // namespace io
} // namespace amortcalc

#endif // AMORTCALC_IO_JSON_WRITER_HPP
