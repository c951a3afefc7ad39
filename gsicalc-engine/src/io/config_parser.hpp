#ifndef GSICALC_IO_CONFIG_PARSER_HPP
#define GSICALC_IO_CONFIG_PARSER_HPP

#include "../logger.hpp"
#include "../period.hpp"
#include "../portfolio.hpp"
#include "../projection_inputs.hpp"
#include <optional>
#include <string>

namespace gsicalc {
namespace io {

/**
 * @brief Everything a run needs, as read from a JSON configuration file
 *
 * Sections and fields not present in the file keep their defaults; the
 * has_* flags tell the CLI which values came from the file.
 */
struct RunConfig {
    ProjectionInputs inputs;

    std::string portfolio_path;                        ///< CSV reference book, resolved
    std::optional<ReferencePortfolio> inline_portfolio;

    std::optional<PeriodStart> start;                  ///< "start_date": "YYYY-MM"

    std::string output_json_path;
    std::string output_parquet_path;
    bool pretty_print;

    bool has_logging;
    LoggerConfig logging;

    RunConfig();

    /**
     * @brief Reference book for the run
     *
     * Inline positions win over a CSV path; with neither, the built-in
     * demo book is used.
     *
     * @throws PortfolioLoadError if the CSV cannot be read
     */
    ReferencePortfolio load_portfolio() const;
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative paths inside the file resolve against the file's directory.
 *
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 * @throws ValidationError if "years" is not a whole number
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @param json_string JSON configuration
 * @param base_dir Directory relative paths resolve against ("" = as written)
 */
RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& base_dir = "");

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to a base directory
 *
 * Absolute paths and an empty base directory return the path unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& base_dir);

} // namespace io
} // namespace gsicalc

#endif // GSICALC_IO_CONFIG_PARSER_HPP
