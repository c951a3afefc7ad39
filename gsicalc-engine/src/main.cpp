#include <iostream>
#include <fstream>
#include <optional>
#include <string>
#include "logger.hpp"
#include "portfolio.hpp"
#include "projection.hpp"
#include "io/config_parser.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string portfolio_path;
    std::string output_path;
    std::string parquet_path;
    std::string start_date;
    std::string log_level;
    std::string log_file;
    bool log_text = false;
    bool compact = false;
    bool parallel = false;
    bool help = false;
    // Input overrides; unset means "config file or default"
    std::optional<double> investment;
    std::optional<double> spot;
    std::optional<double> spx_return;
    std::optional<double> spx_div;
    std::optional<double> credit_yield;
    std::optional<double> volatility;
    std::optional<double> mgmt_fee;
    std::optional<double> carry_fee;
    std::optional<double> risk_free;
    std::optional<double> years;
};

void print_usage(const char* program_name) {
    std::cerr << "GSI Calc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  --config <path>          JSON run configuration (inputs, portfolio, output, logging)\n";
    std::cerr << "  --portfolio <path>       CSV reference portfolio (default: built-in demo book)\n";
    std::cerr << "  --start <YYYY-MM>        Month of the first period label (default: current month)\n\n";
    std::cerr << "Projection inputs (percent unless noted; override the config file):\n";
    std::cerr << "  --investment <amount>    Capital invested (default: 1000000)\n";
    std::cerr << "  --spot <level>           Current index level (default: 563.22)\n";
    std::cerr << "  --spx-return <pct>       Annual index price return (default: 8)\n";
    std::cerr << "  --spx-div <pct>          Annual index dividend yield (default: 1.3)\n";
    std::cerr << "  --credit-yield <pct>     Annual credit sleeve yield (default: 5)\n";
    std::cerr << "  --volatility <pct>       Annual implied volatility (default: 15)\n";
    std::cerr << "  --mgmt-fee <pct>         Annual management fee (default: 1.5)\n";
    std::cerr << "  --carry-fee <pct>        Carry, share of profit (default: 20)\n";
    std::cerr << "  --risk-free <pct>        Annual risk-free rate (default: 4)\n";
    std::cerr << "  --years <n>              Horizon in whole years (default: 10)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>          JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>         Also write the series as Parquet (Arrow builds only)\n";
    std::cerr << "  --compact                Single-line JSON\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>      DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>        Append log events to a file\n";
    std::cerr << "  --log-text               Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --parallel               Evaluate quarters concurrently (OpenMP builds)\n";
    std::cerr << "  --help                   Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Reference scenario with the demo book:\n";
    std::cerr << "     " << program_name << " --investment 7289316.47 --years 10 --output results.json\n\n";
    std::cerr << "  2. Using a config file and a custom book:\n";
    std::cerr << "     " << program_name << " --config run.json --portfolio data/demo_portfolio.csv\n";
}

bool parse_double(const std::string& text, std::optional<double>& target) {
    size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
        return false;
    }
    target = value;
    return true;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--portfolio" && i + 1 < argc) {
                args.portfolio_path = argv[++i];
            } else if (arg == "--start" && i + 1 < argc) {
                args.start_date = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--parquet" && i + 1 < argc) {
                args.parquet_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--log-text") {
                args.log_text = true;
            } else if (arg == "--compact") {
                args.compact = true;
            } else if (arg == "--parallel") {
                args.parallel = true;
            } else if (arg == "--investment" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.investment);
            } else if (arg == "--spot" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.spot);
            } else if (arg == "--spx-return" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.spx_return);
            } else if (arg == "--spx-div" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.spx_div);
            } else if (arg == "--credit-yield" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.credit_yield);
            } else if (arg == "--volatility" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.volatility);
            } else if (arg == "--mgmt-fee" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.mgmt_fee);
            } else if (arg == "--carry-fee" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.carry_fee);
            } else if (arg == "--risk-free" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.risk_free);
            } else if (arg == "--years" && i + 1 < argc) {
                ok = parse_double(argv[++i], args.years);
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::exception&) {
            ok = false;
        }

        if (!ok) {
            std::cerr << "Error: Invalid number for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.config_path.empty() && !std::ifstream(args.config_path).good()) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.portfolio_path.empty() && !std::ifstream(args.portfolio_path).good()) {
        std::cerr << "Error: Portfolio file not found: " << args.portfolio_path << "\n";
        valid = false;
    }

    gsicalc::LogLevel level = gsicalc::LogLevel::INFO;
    if (!args.log_level.empty() && !gsicalc::parse_log_level(args.log_level, level)) {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

void apply_overrides(const CLIArgs& args, gsicalc::ProjectionInputs& inputs) {
    if (args.investment) inputs.investment = *args.investment;
    if (args.spot) inputs.current_spot = *args.spot;
    if (args.spx_return) inputs.spx_price_return = *args.spx_return;
    if (args.spx_div) inputs.spx_div_yield = *args.spx_div;
    if (args.credit_yield) inputs.credit_yield = *args.credit_yield;
    if (args.volatility) inputs.volatility = *args.volatility;
    if (args.mgmt_fee) inputs.mgmt_fee = *args.mgmt_fee;
    if (args.carry_fee) inputs.carry_fee = *args.carry_fee;
    if (args.risk_free) inputs.risk_free_rate = *args.risk_free;
    if (args.years) inputs.years = gsicalc::years_from_double(*args.years);
}

gsicalc::LoggerConfig logger_config(const CLIArgs& args, const gsicalc::io::RunConfig& run) {
    gsicalc::LoggerConfig config = run.has_logging ? run.logging : gsicalc::LoggerConfig();
    if (!args.log_level.empty()) {
        gsicalc::parse_log_level(args.log_level, config.min_level);
    }
    if (!args.log_file.empty()) {
        config.enable_file = true;
        config.log_file_path = args.log_file;
    }
    if (args.log_text) {
        config.enable_json = false;
    }
    return config;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    gsicalc::Logger& logger = gsicalc::Logger::get_instance();
    gsicalc::RunContext ctx(args.config_path.empty() ? "cli" : args.config_path);

    try {
        gsicalc::io::RunConfig run;
        if (!args.config_path.empty()) {
            run = gsicalc::io::parse_run_config_from_file(args.config_path);
        }
        logger.configure(logger_config(args, run));

        apply_overrides(args, run.inputs);
        if (!args.portfolio_path.empty()) {
            if (run.inline_portfolio) {
                logger.log_warning(ctx, "--portfolio replaces the inline portfolio of the config file");
                run.inline_portfolio.reset();
            }
            run.portfolio_path = args.portfolio_path;
        }
        if (!args.output_path.empty()) run.output_json_path = args.output_path;
        if (!args.parquet_path.empty()) run.output_parquet_path = args.parquet_path;
        if (args.compact) run.pretty_print = false;

        gsicalc::ProjectionConfig config;
        config.run_id = ctx.run_id;
        config.parallel_steps = args.parallel;
        config.log_steps = logger.is_enabled(gsicalc::LogLevel::DEBUG);
        if (!args.start_date.empty()) {
            config.start = gsicalc::PeriodStart::parse(args.start_date);
        } else if (run.start) {
            config.start = *run.start;
        } else {
            config.start = gsicalc::PeriodStart::today();
        }

        gsicalc::ReferencePortfolio portfolio = run.load_portfolio();

        gsicalc::ProjectionResult result = gsicalc::run_projection(run.inputs, portfolio, config);

        // Report summary to stderr
        const gsicalc::ProjectionMetrics& m = result.metrics;
        std::cerr << "\nResults (" << run.inputs.years << " years, " << result.steps << " quarters):\n";
        std::cerr << "  Initial notional: " << m.initial_notional << "\n";
        std::cerr << "  Final value:      " << m.final_value << "\n";
        std::cerr << "  MOIC:             " << m.moic << "x\n";
        std::cerr << "  IRR:              " << m.irr << "%\n";
        std::cerr << "  Index final:      " << m.index_final << "\n";
        std::cerr << "  Index MOIC:       " << m.index_moic << "x\n";
        std::cerr << "  Index IRR:        " << m.index_irr << "%\n";
        if (!result.carry_skipped_steps.empty()) {
            std::cerr << "  Carry skipped:    " << result.carry_skipped_steps.size() << " quarter(s)\n";
        }

        if (run.output_json_path.empty()) {
            gsicalc::io::write_projection_result_json(std::cout, result, run.pretty_print);
        } else {
            gsicalc::io::write_projection_result_json(run.output_json_path, result, run.pretty_print);
            std::cerr << "\nOutput written to: " << run.output_json_path << "\n";
        }

        if (!run.output_parquet_path.empty()) {
            gsicalc::io::ParquetWriter::write_series(result, run.output_parquet_path);
            std::cerr << "Series written to: " << run.output_parquet_path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        logger.flush();
        return 1;
    }
}
