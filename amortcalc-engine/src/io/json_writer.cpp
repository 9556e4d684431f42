#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace amortcalc {
namespace io {

namespace {

std::string escape(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\t': oss << "\\t"; break;
            default:   oss << c;
        }
    }
    return oss.str();
}

// Writes the table object; depth is the indentation level of its braces
void write_table_object(std::ostream& os, const AmortizationTable& table,
                        bool pretty_print, int depth) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    std::string outer;
    for (int i = 0; i < depth; ++i) outer += indent;
    const std::string inner = outer + indent;
    const std::string row_indent = inner + indent;

    os << std::fixed << std::setprecision(6);

    os << "{" << newline;
    os << inner << "\"period_count\":" << space << table.size() << "," << newline;

    // Totals section
    os << inner << "\"totals\":" << space << "{" << newline;
    os << inner << indent << "\"paid\":" << space << table.total_paid() << "," << newline;
    os << inner << indent << "\"interest\":" << space << table.total_interest() << "," << newline;
    os << inner << indent << "\"extra\":" << space << table.total_extra() << newline;
    os << inner << "}," << newline;

    // Rows
    os << inner << "\"rows\":" << space << "[";
    for (size_t i = 0; i < table.size(); ++i) {
        const ScheduleEntry& entry = table[i];
        if (i > 0) os << ",";
        os << newline << row_indent << "{"
           << "\"period\":" << space << entry.period << "," << space
           << "\"total_payment\":" << space << entry.total_payment << "," << space
           << "\"principal\":" << space << entry.principal << "," << space
           << "\"interest\":" << space << entry.interest << "," << space
           << "\"extra_payment\":" << space << entry.extra_payment << "," << space
           << "\"remaining_balance\":" << space << entry.remaining_balance
           << "}";
    }
    if (!table.empty()) {
        os << newline << inner;
    }
    os << "]" << newline;

    os << outer << "}";
}

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

void write_table_json(std::ostream& os, const AmortizationTable& table, bool pretty_print) {
    write_table_object(os, table, pretty_print, 0);
    os << (pretty_print ? "\n" : "");
}

void write_table_json(const std::string& filepath, const AmortizationTable& table,
                      bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_table_json(file, table, pretty_print);
}

void write_tables_json(std::ostream& os, const std::map<std::string, AmortizationTable>& tables,
                       const std::string& view, bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << "{" << newline;
    os << indent << "\"view\":" << space << "\"" << escape(view) << "\"," << newline;
    os << indent << "\"tables\":" << space << "{";

    bool first = true;
    for (const auto& [name, table] : tables) {
        if (!first) os << ",";
        os << newline << indent << indent << "\"" << escape(name) << "\":" << space;
        write_table_object(os, table, pretty_print, 2);
        first = false;
    }
    if (!tables.empty()) {
        os << newline << indent;
    }
    os << "}" << newline;
    os << "}" << newline;
}

void write_tables_json(const std::string& filepath,
                       const std::map<std::string, AmortizationTable>& tables,
                       const std::string& view, bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_tables_json(file, tables, view, pretty_print);
}

} // namespace io
} // namespace amortcalc
