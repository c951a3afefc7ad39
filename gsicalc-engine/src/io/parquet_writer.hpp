#ifndef GSICALC_IO_PARQUET_WRITER_HPP
#define GSICALC_IO_PARQUET_WRITER_HPP

#include "../projection.hpp"
#include <string>

namespace gsicalc {
namespace io {

class ParquetWriter {
public:
    /**
     * Write the projection series to a Parquet file, one row per grid point.
     *
     * Output schema:
     *   - period: uint32 (0 = start)
     *   - label: utf8
     *   - strategy, credit, options, intrinsic,
     *     index, private_equity, bonds: float64
     *
     * @param result ProjectionResult whose series is written
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the file cannot be written, or the build
     *         has no Apache Arrow support
     */
    static void write_series(const ProjectionResult& result, const std::string& filepath);

    // True when built with Apache Arrow
    static bool available();
};

} // namespace io
} // namespace gsicalc

#endif // GSICALC_IO_PARQUET_WRITER_HPP
