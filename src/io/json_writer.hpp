#ifndef XOLCALC_IO_JSON_WRITER_HPP
#define XOLCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../analysis.hpp"

namespace xolcalc {
namespace io {

// Write baseline and stressed results (and any priced layer options) as JSON
void write_analysis_result_json(std::ostream& os, const AnalysisResult& result,
                                const std::vector<LayerComparison>& layer_options = {},
                                bool pretty_print = true);

// Write to a file; throws std::runtime_error if it cannot be opened
void write_analysis_result_json(const std::string& filepath, const AnalysisResult& result,
                                const std::vector<LayerComparison>& layer_options = {},
                                bool pretty_print = true);

} // namespace io
} // namespace xolcalc

#endif // XOLCALC_IO_JSON_WRITER_HPP
