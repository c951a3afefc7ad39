#ifndef GSICALC_IO_JSON_WRITER_HPP
#define GSICALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../projection.hpp"

namespace gsicalc {
namespace io {

// Write ProjectionResult as JSON: metrics, initial state, and the series as
// parallel arrays keyed by line name
void write_projection_result_json(std::ostream& os, const ProjectionResult& result,
                                  bool pretty_print = true);

// Write ProjectionResult to a JSON file
void write_projection_result_json(const std::string& filepath, const ProjectionResult& result,
                                  bool pretty_print = true);

} // namespace io
} // namespace gsicalc

#endif // GSICALC_IO_JSON_WRITER_HPP
