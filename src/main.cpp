/// @file src/main.cpp
/// @brief TOPSIS CLI entry point.
///
/// Usage:
///   topsis <InputDataFile> <Weights> <Impacts> <ResultFileName>
///
/// Example:
///   topsis data.csv "1,1,1,2" "+,+,-,+" result.csv
///
/// Exit Codes:
///   0 — success, result file written
///   1 — wrong argument count, or any reported error ("Error: ..." on stdout)
///
/// Set TOPSIS_VERBOSE=1 for per-stage diagnostics on stderr.

#include "topsis/arguments.hpp"
#include "topsis/config.hpp"
#include "topsis/engine.hpp"
#include "topsis/validator.hpp"

#include <fmt/core.h>

#include <exception>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage: topsis <InputDataFile> <Weights> <Impacts> <ResultFileName>\n"
        "\n"
        "  InputDataFile   CSV with a header row; first column names the\n"
        "                  alternative, remaining columns are numeric criteria\n"
        "  Weights         comma-separated numbers, one per criterion (e.g. \"1,1,1,2\")\n"
        "  Impacts         comma-separated '+' (benefit) or '-' (cost) (e.g. \"+,+,-,+\")\n"
        "  ResultFileName  output CSV: the input plus 'TOPSIS Score' and 'Rank'\n"
    );
}

/// Parse, validate, evaluate and write. Returns the process exit code.
int run_topsis(const std::string& input_path,
               const std::string& weights_arg,
               const std::string& impacts_arg,
               const std::string& output_path) {
    try {
        const auto weights        = topsis::cli::parse_weights(weights_arg);
        const auto impact_symbols = topsis::cli::split_symbols(impacts_arg);

        const topsis::core::EngineConfig config = topsis::core::config_from_environment();

        topsis::validation::InputValidator::validate(
            input_path, weights, impact_symbols, config.delimiter);

        const auto impacts = topsis::cli::parse_impacts(impact_symbols);

        const topsis::core::Engine engine(config);
        engine.run(input_path, weights, impacts, output_path);
    } catch (const std::exception& ex) {
        // TopsisError and anything the standard library throws while reading
        // or writing files.
        fmt::print("Error: {}\n", ex.what());
        return 1;
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc != 5) {
        print_usage();
        return 1;
    }

    return run_topsis(std::string(argv[1]), std::string(argv[2]),
                      std::string(argv[3]), std::string(argv[4]));
}
