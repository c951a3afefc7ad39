#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace gsicalc {
namespace io {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> build_double_column(const std::vector<double>& values,
                                                  const std::string& name) {
    arrow::DoubleBuilder builder;
    check(builder.AppendValues(values), "Failed to append " + name + " column");
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "Failed to finish " + name + " column");
    return array;
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_series(const ProjectionResult& result, const std::string& filepath) {
    const ProjectionSeries& series = result.series;
    if (series.size() == 0) {
        throw std::runtime_error("ProjectionResult has an empty series to write");
    }

    auto schema = arrow::schema({
        arrow::field("period", arrow::uint32()),
        arrow::field("label", arrow::utf8()),
        arrow::field("strategy", arrow::float64()),
        arrow::field("credit", arrow::float64()),
        arrow::field("options", arrow::float64()),
        arrow::field("intrinsic", arrow::float64()),
        arrow::field("index", arrow::float64()),
        arrow::field("private_equity", arrow::float64()),
        arrow::field("bonds", arrow::float64())
    });

    arrow::UInt32Builder period_builder;
    arrow::StringBuilder label_builder;
    check(period_builder.Reserve(series.size()), "Failed to reserve memory for period column");
    check(label_builder.Reserve(series.size()), "Failed to reserve memory for label column");

    for (size_t i = 0; i < series.size(); ++i) {
        check(period_builder.Append(static_cast<uint32_t>(i)), "Failed to append period");
        check(label_builder.Append(series.labels[i]), "Failed to append label");
    }

    std::shared_ptr<arrow::Array> period_array;
    check(period_builder.Finish(&period_array), "Failed to finish period column");
    std::shared_ptr<arrow::Array> label_array;
    check(label_builder.Finish(&label_array), "Failed to finish label column");

    auto table = arrow::Table::Make(schema, {
        period_array,
        label_array,
        build_double_column(series.strategy, "strategy"),
        build_double_column(series.credit, "credit"),
        build_double_column(series.options, "options"),
        build_double_column(series.intrinsic, "intrinsic"),
        build_double_column(series.index, "index"),
        build_double_column(series.private_equity, "private_equity"),
        build_double_column(series.bonds, "bonds")
    });

    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    auto open_result = arrow::io::FileOutputStream::Open(filepath);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 open_result.status().ToString());
    }
    outfile = *open_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "Failed to write Parquet table");
    check(outfile->Close(), "Failed to close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_series(const ProjectionResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DGSICALC_WITH_ARROW=ON to enable Parquet output.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace gsicalc
