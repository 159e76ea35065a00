#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace xolcalc {
namespace io {

namespace {

struct Layout {
    std::string indent;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty_print)
        : indent(pretty_print ? "  " : ""),
          newline(pretty_print ? "\n" : ""),
          space(pretty_print ? " " : "") {}

    std::string pad(int depth) const {
        std::string out;
        for (int i = 0; i < depth; ++i) out += indent;
        return out;
    }
};

std::string escape(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

// JSON has no infinity; an unlimited layer is written as null
void write_limit(std::ostream& os, double limit) {
    if (limit == ReinsuranceLayer::UNLIMITED) {
        os << "null";
    } else {
        os << limit;
    }
}

void write_metrics(std::ostream& os, const RiskMetrics& m, const Layout& l, int depth) {
    std::string pad = l.pad(depth);
    os << pad << "\"expected_loss\":" << l.space << m.expected_loss << "," << l.newline;
    os << pad << "\"std_dev\":" << l.space << m.std_dev << "," << l.newline;
    os << pad << "\"var_99\":" << l.space << m.var_99 << "," << l.newline;
    os << pad << "\"tvar_99\":" << l.space << m.tvar_99 << "," << l.newline;
    os << pad << "\"trigger_probability\":" << l.space << m.trigger_probability << "," << l.newline;
    os << pad << "\"value_for_money\":" << l.space << m.value_for_money;
    if (m.claim_hit_ratio) {
        os << "," << l.newline;
        os << pad << "\"claim_hit_ratio\":" << l.space << *m.claim_hit_ratio;
    }
}

void write_scenario(std::ostream& os, const std::string& key, const ScenarioResult& r,
                    const Layout& l) {
    std::string pad = l.pad(2);
    os << l.pad(1) << "\"" << key << "\":" << l.space << "{" << l.newline;
    os << pad << "\"scenario_id\":" << l.space << r.scenario_id << "," << l.newline;
    os << pad << "\"trials\":" << l.space << r.trials << "," << l.newline;
    os << pad << "\"layer_basis\":" << l.space << "\"" << layer_basis_to_string(r.layer_basis)
       << "\"," << l.newline;
    write_metrics(os, r.metrics, l, 2);
    os << "," << l.newline;
    os << pad << "\"execution_time_ms\":" << l.space << std::setprecision(2)
       << r.execution_time_ms << std::setprecision(6) << l.newline;
    os << l.pad(1) << "}";
}

} // anonymous namespace

void write_analysis_result_json(std::ostream& os, const AnalysisResult& result,
                                const std::vector<LayerComparison>& layer_options,
                                bool pretty_print) {
    Layout l(pretty_print);

    // Number formatting is restored on the caller's stream afterwards
    std::ios_base::fmtflags saved_flags = os.flags();
    std::streamsize saved_precision = os.precision();
    os << std::fixed << std::setprecision(6);

    os << "{" << l.newline;
    write_scenario(os, "baseline", result.baseline, l);
    os << "," << l.newline;
    write_scenario(os, "stressed", result.stressed, l);

    if (!layer_options.empty()) {
        os << "," << l.newline;
        os << l.pad(1) << "\"layer_options\":" << l.space << "[" << l.newline;
        for (size_t i = 0; i < layer_options.size(); ++i) {
            const LayerComparison& c = layer_options[i];
            os << l.pad(2) << "{" << l.newline;
            os << l.pad(3) << "\"name\":" << l.space << "\"" << escape(c.option.name) << "\","
               << l.newline;
            os << l.pad(3) << "\"retention\":" << l.space << c.option.retention << "," << l.newline;
            os << l.pad(3) << "\"limit\":" << l.space;
            write_limit(os, c.option.limit);
            os << "," << l.newline;
            os << l.pad(3) << "\"premium\":" << l.space << c.option.premium << "," << l.newline;
            os << l.pad(3) << "\"layer_basis\":" << l.space << "\""
               << layer_basis_to_string(c.option.basis) << "\"," << l.newline;
            os << l.pad(3) << "\"baseline\":" << l.space << "{" << l.newline;
            write_metrics(os, c.baseline, l, 4);
            os << l.newline << l.pad(3) << "}," << l.newline;
            os << l.pad(3) << "\"stressed\":" << l.space << "{" << l.newline;
            write_metrics(os, c.stressed, l, 4);
            os << l.newline << l.pad(3) << "}" << l.newline;
            os << l.pad(2) << "}" << (i + 1 < layer_options.size() ? "," : "") << l.newline;
        }
        os << l.pad(1) << "]";
    }

    os << l.newline << "}" << l.newline;

    os.flags(saved_flags);
    os.precision(saved_precision);
}

void write_analysis_result_json(const std::string& filepath, const AnalysisResult& result,
                                const std::vector<LayerComparison>& layer_options,
                                bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_analysis_result_json(file, result, layer_options, pretty_print);
}

} // namespace io
} // namespace xolcalc
