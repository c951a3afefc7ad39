#include "config_parser.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace gsicalc {
namespace io {

namespace {

// Looks up the first of the given keys present in the object
const json* find_field(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end()) {
            return &*it;
        }
    }
    return nullptr;
}

void read_number(const json& obj, std::initializer_list<const char*> keys, double& target) {
    const json* value = find_field(obj, keys);
    if (!value) {
        return;
    }
    if (!value->is_number()) {
        throw ConfigParseError(std::string("Field '") + *keys.begin() + "' must be a number");
    }
    target = value->get<double>();
}

std::string read_string(const json& obj, const char* key) {
    const json& value = obj.at(key);
    if (!value.is_string()) {
        throw ConfigParseError(std::string("Field '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

void parse_inputs(const json& j, ProjectionInputs& inputs) {
    if (!j.is_object()) {
        throw ConfigParseError("'inputs' must be an object");
    }
    read_number(j, {"investment"}, inputs.investment);
    read_number(j, {"current_spot", "currentSpot"}, inputs.current_spot);
    read_number(j, {"spx_price_return", "spxPriceReturn"}, inputs.spx_price_return);
    read_number(j, {"spx_div_yield", "spxDivYield"}, inputs.spx_div_yield);
    read_number(j, {"credit_yield", "creditYield"}, inputs.credit_yield);
    read_number(j, {"volatility"}, inputs.volatility);
    read_number(j, {"mgmt_fee", "mgmtFee"}, inputs.mgmt_fee);
    read_number(j, {"carry_fee", "carryFee"}, inputs.carry_fee);
    read_number(j, {"risk_free_rate", "riskFreeRate"}, inputs.risk_free_rate);

    double years = inputs.years;
    read_number(j, {"years"}, years);
    inputs.years = years_from_double(years);
}

ReferencePosition parse_position(const json& p) {
    if (!p.is_object()) {
        throw ConfigParseError("Portfolio position must be an object");
    }
    std::string kind = read_string(p, "kind");

    double cost = 0.0;
    double value = 0.0;
    read_number(p, {"cost_basis", "CostBasis"}, cost);
    read_number(p, {"current_value", "CurrentValue"}, value);

    if (kind == "Credit") {
        return CreditPosition(cost, value);
    }
    if (kind == "Option") {
        double strike = 0.0;
        double quantity = 0.0;
        read_number(p, {"strike", "Strike"}, strike);
        read_number(p, {"quantity", "Quantity"}, quantity);
        std::string expiry = p.contains("expiration_date") ? read_string(p, "expiration_date") : "";
        return OptionPosition(cost, value, strike, quantity, expiry);
    }
    throw ConfigParseError("Unknown position kind: " + kind);
}

ReferencePortfolio parse_inline_portfolio(const json& portfolio) {
    if (!portfolio.at("positions").is_array()) {
        throw ConfigParseError("'portfolio.positions' must be an array");
    }

    std::vector<ReferencePosition> positions;
    for (const auto& p : portfolio.at("positions")) {
        positions.push_back(parse_position(p));
    }

    ReferencePortfolio sized(positions, 0.0);
    double master = sized.total_cost_basis();
    read_number(portfolio, {"master_cost_basis"}, master);
    return ReferencePortfolio(std::move(positions), master);
}

void parse_logging(const json& j, const std::string& base_dir, LoggerConfig& logging) {
    if (!j.is_object()) {
        throw ConfigParseError("'logging' must be an object");
    }
    if (j.contains("level")) {
        std::string level = read_string(j, "level");
        if (!parse_log_level(level, logging.min_level)) {
            throw ConfigParseError("Unknown log level: " + level);
        }
    }
    if (j.contains("json")) {
        if (!j.at("json").is_boolean()) {
            throw ConfigParseError("Field 'logging.json' must be a boolean");
        }
        logging.enable_json = j.at("json").get<bool>();
    }
    if (j.contains("console")) {
        if (!j.at("console").is_boolean()) {
            throw ConfigParseError("Field 'logging.console' must be a boolean");
        }
        logging.enable_console = j.at("console").get<bool>();
    }
    if (j.contains("file")) {
        logging.enable_file = true;
        logging.log_file_path =
            resolve_relative_path(expand_environment_variables(read_string(j, "file")), base_dir);
    }
}

} // anonymous namespace

RunConfig::RunConfig() : pretty_print(true), has_logging(false) {}

ReferencePortfolio RunConfig::load_portfolio() const {
    if (inline_portfolio) {
        return *inline_portfolio;
    }
    if (!portfolio_path.empty()) {
        return ReferencePortfolio::load_from_csv(portfolio_path);
    }
    return ReferencePortfolio::demo();
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated ${ in: " + value);
            }
            pos++;
        }

        // A lone '$' is kept as written
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& base_dir) {
    fs::path p(path);
    if (p.is_absolute() || base_dir.empty()) {
        return path;
    }
    return (fs::path(base_dir) / p).string();
}

RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& base_dir) {
    RunConfig config;

    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError("Failed to parse JSON: " + std::string(e.what()));
    }

    if (!j.is_object()) {
        throw ConfigParseError("Configuration root must be an object");
    }

    try {
        if (j.contains("inputs")) {
            parse_inputs(j["inputs"], config.inputs);
        }

        if (j.contains("portfolio")) {
            const json& portfolio = j["portfolio"];
            if (!portfolio.is_object()) {
                throw ConfigParseError("'portfolio' must be an object");
            }
            if (portfolio.contains("positions")) {
                config.inline_portfolio = parse_inline_portfolio(portfolio);
            } else if (portfolio.contains("source")) {
                std::string source = expand_environment_variables(read_string(portfolio, "source"));
                if (source.rfind("local://", 0) == 0) {
                    source = source.substr(8);
                }
                config.portfolio_path = resolve_relative_path(source, base_dir);
            }
        }

        if (j.contains("start_date")) {
            config.start = PeriodStart::parse(read_string(j, "start_date"));
        }

        if (j.contains("output")) {
            const json& output = j["output"];
            if (!output.is_object()) {
                throw ConfigParseError("'output' must be an object");
            }
            if (output.contains("json")) {
                config.output_json_path =
                    resolve_relative_path(expand_environment_variables(read_string(output, "json")), base_dir);
            }
            if (output.contains("parquet")) {
                config.output_parquet_path =
                    resolve_relative_path(expand_environment_variables(read_string(output, "parquet")), base_dir);
            }
            if (output.contains("pretty")) {
                if (!output.at("pretty").is_boolean()) {
                    throw ConfigParseError("Field 'output.pretty' must be a boolean");
                }
                config.pretty_print = output.at("pretty").get<bool>();
            }
        }

        if (j.contains("logging")) {
            parse_logging(j["logging"], base_dir, config.logging);
            config.has_logging = true;
        }
    } catch (const json::exception& e) {
        throw ConfigParseError("Invalid configuration: " + std::string(e.what()));
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream f(file_path);
    if (!f.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::stringstream buffer;
    buffer << f.rdbuf();

    std::string base_dir = fs::path(file_path).parent_path().string();
    return parse_run_config_from_string(buffer.str(), base_dir);
}

} // namespace io
} // namespace gsicalc
