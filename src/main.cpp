/**
 * @file main.cpp
 * @brief Command-line driver for finperf
 *
 * Loads a portfolio configuration, reads per-symbol price files from a data
 * directory, optimizes the portfolio and prints its performance record.
 * With --security, reports one symbol against the configured benchmark instead.
 */

#include "finperf/analytics/portfolio_performance.hpp"
#include "finperf/analytics/security_performance.hpp"
#include "finperf/data/csv_data_provider.hpp"
#include "finperf/data/data_loader.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace finperf;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "finperf 1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --data-dir PATH       Directory holding <SYMBOL>.csv price files (required)\n"
              << "  --output PATH         Write the full result as JSON\n"
              << "  --frontier-csv PATH   Export the traced frontier (needs frontier_points > 0)\n"
              << "  --security SYMBOL     Report a single security against the benchmark\n"
              << "  --verbose             Print solver progress\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config portfolio.json --data-dir data/market\n"
              << "  " << program_name << " --config portfolio.json --data-dir data/market"
              << " --output result.json --frontier-csv frontier.csv\n"
              << std::endl;
}

void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       finperf: portfolio optimization and performance         \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string data_dir;
    std::string output_path;
    std::string frontier_csv;
    std::string security;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--data-dir" && i + 1 < argc)
            {
                args.data_dir = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--frontier-csv" && i + 1 < argc)
            {
                args.frontier_csv = argv[++i];
            }
            else if (arg == "--security" && i + 1 < argc)
            {
                args.security = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() && !data_dir.empty();
    }
};

void write_json(const std::string &path, const nlohmann::json &j)
{
    std::ofstream out(path);
    if (!out.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + path);
    }
    out << std::setw(2) << j << std::endl;
    std::cout << "  Result written to: " << path << "\n";
}

int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        std::cout << "[1/3] Loading configuration..." << std::endl;

        PortfolioConfig config = DataLoader::load_config(args.config_path);
        if (args.verbose)
        {
            config.optimizer.solver.verbose = true;
            std::cout << "  - Symbols: ";
            for (const auto &symbol : config.symbols)
            {
                std::cout << symbol << " ";
            }
            std::cout << "\n  - Benchmark: " << config.benchmark
                      << "\n  - Date range: " << config.start_date << " to " << config.end_date
                      << "\n  - Objective: " << optimizer::objective_to_string(config.objective) << "\n";
        }

        CsvDataProvider provider(args.data_dir);

        if (!args.security.empty())
        {
            std::cout << "[2/3] Fetching " << args.security << " and " << config.benchmark << "..." << std::endl;

            const auto stats = analytics::SecurityPerformanceStats::compute(
                args.security, config.benchmark, config.start_date, config.end_date,
                config.interval, config.confidence_level, config.risk_free_rate, provider);

            std::cout << "[3/3] Writing results..." << std::endl;

            stats.print_summary();
            if (!args.output_path.empty())
            {
                write_json(args.output_path, stats.to_json());
            }
            return 0;
        }

        std::cout << "[2/3] Fetching returns and optimizing..." << std::endl;

        const auto result = analytics::PortfolioPerformanceStats::compute(config, provider);

        std::cout << "[3/3] Writing results..." << std::endl;

        result.print_summary();

        if (!args.output_path.empty())
        {
            write_json(args.output_path, result.to_json());
        }

        if (!args.frontier_csv.empty())
        {
            if (result.get_traced_frontier().has_value())
            {
                result.get_traced_frontier()->export_to_csv(args.frontier_csv, result.get_symbols());
                std::cout << "  Frontier exported to: " << args.frontier_csv << "\n";
            }
            else
            {
                std::cerr << "Warning: --frontier-csv ignored, set frontier_points in the configuration"
                          << std::endl;
            }
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\nCompleted in " << duration << " ms\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
