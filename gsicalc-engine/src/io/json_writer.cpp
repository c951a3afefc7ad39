#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace gsicalc {
namespace io {

namespace {

struct Layout {
    std::string indent;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty)
        : indent(pretty ? "  " : ""), newline(pretty ? "\n" : ""), space(pretty ? " " : "") {}
};

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += "\"";
    return out;
}

void write_number_array(std::ostream& os, const std::string& name, const std::vector<double>& values,
                        const Layout& l, bool last) {
    os << l.indent << l.indent << quote(name) << ":" << l.space << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            os << "," << l.space;
        }
        os << values[i];
    }
    os << "]" << (last ? "" : ",") << l.newline;
}

} // anonymous namespace

void write_projection_result_json(std::ostream& os, const ProjectionResult& result,
                                  bool pretty_print) {
    const Layout l(pretty_print);
    const std::string& indent = l.indent;
    const std::string& newline = l.newline;
    const std::string& space = l.space;
    const ProjectionMetrics& m = result.metrics;
    const ScaledState& s = result.scaled;

    const std::ios_base::fmtflags saved_flags = os.flags();
    const std::streamsize saved_precision = os.precision();
    os << std::fixed << std::setprecision(6);

    os << "{" << newline;

    // Metrics section
    os << indent << "\"metrics\":" << space << "{" << newline;
    os << indent << indent << "\"initial_notional\":" << space << m.initial_notional << "," << newline;
    os << indent << indent << "\"final_value\":" << space << m.final_value << "," << newline;
    os << indent << indent << "\"moic\":" << space << m.moic << "," << newline;
    os << indent << indent << "\"irr\":" << space << m.irr << "," << newline;
    os << indent << indent << "\"index_final\":" << space << m.index_final << "," << newline;
    os << indent << indent << "\"index_moic\":" << space << m.index_moic << "," << newline;
    os << indent << indent << "\"index_irr\":" << space << m.index_irr << newline;
    os << indent << "}," << newline;

    // Starting position
    os << indent << "\"initial_state\":" << space << "{" << newline;
    os << indent << indent << "\"ratio\":" << space << s.ratio << "," << newline;
    os << indent << indent << "\"credit_value\":" << space << s.credit_value << "," << newline;
    os << indent << indent << "\"option_value\":" << space << s.option_value << "," << newline;
    os << indent << indent << "\"option_quantity\":" << space << s.option_quantity << "," << newline;
    os << indent << indent << "\"weighted_strike\":" << space << s.weighted_strike << "," << newline;
    os << indent << indent << "\"initial_nav\":" << space << s.initial_nav << newline;
    os << indent << "}," << newline;

    os << indent << "\"steps\":" << space << result.steps << "," << newline;

    os << indent << "\"carry_skipped_steps\":" << space << "[";
    for (size_t i = 0; i < result.carry_skipped_steps.size(); ++i) {
        if (i > 0) {
            os << "," << space;
        }
        os << result.carry_skipped_steps[i];
    }
    os << "]," << newline;

    os << indent << "\"execution_time_ms\":" << space << std::setprecision(2)
       << result.execution_time_ms << "," << newline;
    os << std::setprecision(6);

    // Series
    const ProjectionSeries& series = result.series;
    os << indent << "\"series\":" << space << "{" << newline;

    os << indent << indent << "\"labels\":" << space << "[";
    for (size_t i = 0; i < series.labels.size(); ++i) {
        if (i > 0) {
            os << "," << space;
        }
        os << quote(series.labels[i]);
    }
    os << "]," << newline;

    write_number_array(os, "strategy", series.strategy, l, false);
    write_number_array(os, "credit", series.credit, l, false);
    write_number_array(os, "options", series.options, l, false);
    write_number_array(os, "intrinsic", series.intrinsic, l, false);
    write_number_array(os, "index", series.index, l, false);
    write_number_array(os, "private_equity", series.private_equity, l, false);
    write_number_array(os, "bonds", series.bonds, l, true);

    os << indent << "}" << newline;
    os << "}" << newline;

    os.flags(saved_flags);
    os.precision(saved_precision);
}

void write_projection_result_json(const std::string& filepath, const ProjectionResult& result,
                                  bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_projection_result_json(file, result, pretty_print);
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filepath);
    }
}

} // namespace io
} // namespace gsicalc
