#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "params.hpp"
#include "config_parser.hpp"
#include "simulation.hpp"
#include "comparison.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string params_path;
    std::string output_path;
    std::string parquet_yearly_path;
    std::string parquet_monthly_path;
    bool include_monthly = true;
    bool help = false;
    // Optional overrides applied on top of the parameter file
    std::optional<int> years;
    std::optional<double> home_price;
    std::optional<double> monthly_rent;
    std::optional<double> investment_rate;
    std::optional<double> inflation_rate;
    std::optional<double> salary_budget;
    bool pay_down_early = false;
    // Logging
    std::string log_level = "INFO";
    std::string log_file;
    std::string log_format = "text";
};

void print_usage(const char* program_name) {
    std::cerr << "HomeCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --params <path>             JSON parameter file (default: built-in reference case)\n\n";
    std::cerr << "Parameter overrides:\n";
    std::cerr << "  --years <n>                 Horizon in years\n";
    std::cerr << "  --home-price <value>        Purchase price\n";
    std::cerr << "  --monthly-rent <value>      Starting monthly rent\n";
    std::cerr << "  --investment-rate <pct>     Annual investment return\n";
    std::cerr << "  --inflation-rate <pct>      Annual inflation\n";
    std::cerr << "  --salary-budget <salary>    Use a salary-based budget with this monthly salary\n";
    std::cerr << "  --pay-down-early            Route budget surplus to extra mortgage principal\n";
    std::cerr << "                              (salary-based budget only)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --no-monthly                Omit the monthly series from the JSON output\n";
    std::cerr << "  --parquet-yearly <path>     Also write the yearly series as Parquet\n";
    std::cerr << "  --parquet-monthly <path>    Also write the monthly series as Parquet\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to this file\n";
    std::cerr << "  --log-format <fmt>          text or json (default: text)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Reference case to stdout:\n";
    std::cerr << "     " << program_name << "\n\n";
    std::cerr << "  2. Parameter file with JSON and Parquet output:\n";
    std::cerr << "     " << program_name << " --params data/sample_params.json \\\n";
    std::cerr << "         --output results.json --parquet-yearly yearly.parquet\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--params" && i + 1 < argc) {
                args.params_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--parquet-yearly" && i + 1 < argc) {
                args.parquet_yearly_path = argv[++i];
            } else if (arg == "--parquet-monthly" && i + 1 < argc) {
                args.parquet_monthly_path = argv[++i];
            } else if (arg == "--no-monthly") {
                args.include_monthly = false;
            } else if (arg == "--years" && i + 1 < argc) {
                args.years = std::stoi(argv[++i]);
            } else if (arg == "--home-price" && i + 1 < argc) {
                args.home_price = std::stod(argv[++i]);
            } else if (arg == "--monthly-rent" && i + 1 < argc) {
                args.monthly_rent = std::stod(argv[++i]);
            } else if (arg == "--investment-rate" && i + 1 < argc) {
                args.investment_rate = std::stod(argv[++i]);
            } else if (arg == "--inflation-rate" && i + 1 < argc) {
                args.inflation_rate = std::stod(argv[++i]);
            } else if (arg == "--salary-budget" && i + 1 < argc) {
                args.salary_budget = std::stod(argv[++i]);
            } else if (arg == "--pay-down-early") {
                args.pay_down_early = true;
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--log-format" && i + 1 < argc) {
                args.log_format = argv[++i];
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid numeric value for " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (args.log_format != "text" && args.log_format != "json") {
        std::cerr << "Error: --log-format must be text or json\n";
        valid = false;
    }

    if (!args.params_path.empty()) {
        std::ifstream f(args.params_path);
        if (!f.good()) {
            std::cerr << "Error: Parameter file not found: " << args.params_path << "\n";
            valid = false;
        }
    }

    return valid;
}

void apply_overrides(const CLIArgs& args, homecalc::SimulationParams& params) {
    if (args.years) params.years = *args.years;
    if (args.home_price) params.home_price = *args.home_price;
    if (args.monthly_rent) params.monthly_rent = *args.monthly_rent;
    if (args.investment_rate) params.investment_return_rate = *args.investment_rate;
    if (args.inflation_rate) params.inflation_rate = *args.inflation_rate;
    if (args.salary_budget) {
        params.budget_strategy = homecalc::BudgetStrategy::SalaryBased;
        params.monthly_salary = *args.salary_budget;
    }
    if (args.pay_down_early) params.pay_down_mortgage_early = true;
}

void print_summary(const homecalc::SimulationResult& result,
                   const homecalc::ScenarioComparison& comparison) {
    const auto& s = result.summary;
    std::cerr << "\nResults:\n";
    std::cerr << "  Final net worth (buy):   " << s.final_net_worth_buy << "\n";
    std::cerr << "  Final net worth (rent):  " << s.final_net_worth_rent << "\n";
    std::cerr << "  Difference (buy - rent): " << comparison.net_worth_difference << "\n";
    std::cerr << "  Preferred:               " << homecalc::to_string(comparison.preferred) << "\n";
    std::cerr << "  Breakeven year:          "
              << (comparison.breakeven_year ? std::to_string(*comparison.breakeven_year) : "none") << "\n";
    std::cerr << "  Total interest paid:     " << s.total_interest_paid << "\n";
    std::cerr << "  Total principal paid:    " << s.total_principal_paid << "\n";
    std::cerr << "  Total rent paid:         " << s.total_rent_paid << "\n";
    std::cerr << "  Initial outlay:          " << s.initial_outlay << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    homecalc::LoggerConfig log_config;
    log_config.min_level = homecalc::string_to_level(args.log_level);
    log_config.enable_json = (args.log_format == "json");
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    homecalc::Logger& logger = homecalc::Logger::get_instance();
    logger.configure(log_config);

    homecalc::RunContext ctx("homecalc-cli",
                             args.params_path.empty() ? "defaults" : args.params_path);

    try {
        // --- Load ---
        ctx.phase = "load";
        homecalc::SimulationParams params;
        if (!args.params_path.empty()) {
            params = homecalc::parse_params_from_file(args.params_path);
            logger.log_params_loaded(ctx, params);
        }

        apply_overrides(args, params);
        std::vector<std::string> errors = homecalc::validate_params(params);
        if (!errors.empty()) {
            throw homecalc::ParamsValidationError(errors);
        }

        if (params.pay_down_mortgage_early && !params.uses_salary_budget()) {
            logger.log_warning(ctx, "pay_down_mortgage_early has no effect with the auto_match budget");
        }

        // --- Simulate ---
        ctx.phase = "simulate";
        logger.log_simulation_start(ctx, params);

        auto start = std::chrono::high_resolution_clock::now();
        homecalc::SimulationResult result = homecalc::run_simulation(params);
        auto end = std::chrono::high_resolution_clock::now();

        homecalc::RunMetrics metrics;
        metrics.execution_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
        metrics.months_simulated = result.monthly.size();
        metrics.years_recorded = result.yearly.size();

        for (const auto& year : result.yearly) {
            logger.log_yearly_snapshot(ctx, year);
        }

        homecalc::ScenarioComparison comparison = homecalc::compare_scenarios(result);
        logger.log_simulation_complete(ctx, result.summary, comparison, metrics);
        print_summary(result, comparison);

        // --- Write ---
        ctx.phase = "write";
        homecalc::io::JsonWriteOptions json_options;
        json_options.include_monthly = args.include_monthly;

        if (args.output_path.empty()) {
            homecalc::io::write_simulation_result_json(std::cout, result, params, json_options);
        } else {
            homecalc::io::write_simulation_result_json(args.output_path, result, params, json_options);
            logger.log_output_written(ctx, "json", args.output_path, result.yearly.size());
        }

        if (!args.parquet_yearly_path.empty()) {
            homecalc::ParquetWriter::write_yearly(result, args.parquet_yearly_path);
            logger.log_output_written(ctx, "parquet", args.parquet_yearly_path, result.yearly.size());
        }

        if (!args.parquet_monthly_path.empty()) {
            homecalc::ParquetWriter::write_monthly(result, args.parquet_monthly_path);
            logger.log_output_written(ctx, "parquet", args.parquet_monthly_path, result.monthly.size());
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
