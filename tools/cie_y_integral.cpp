/**
 * Integrate the CIE 1931 y-bar color-matching function.
 *
 * Resamples the tabulated color-matching functions onto the build-time
 * wavelength grid and prints the trapezoidal integral of y-bar.
 *
 * Usage:
 *   cie_y_integral [TABLE]
 *
 * TABLE defaults to data/ciexyz31.csv.
 */

#include <iostream>
#include <iomanip>
#include <string>

#include "cienorm/cienorm.hpp"

using namespace cienorm;

namespace {

const char* DEFAULT_TABLE = "data/ciexyz31.csv";

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [TABLE]\n"
              << "\n"
              << "Print the trapezoidal integral of CIE 1931 y-bar over ["
              << CIENORM_WAVELENGTH_MIN << ", " << CIENORM_WAVELENGTH_MAX
              << ") nm every " << CIENORM_WAVELENGTH_STEP << " nm.\n"
              << "TABLE defaults to " << DEFAULT_TABLE << ".\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string path = DEFAULT_TABLE;

    if (argc > 2) {
        printUsage(argv[0]);
        return 2;
    }
    if (argc == 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
        path = arg;
    }

    try {
        algorithms::ResamplingOptions options;
        options.validate();

        auto table = io::loadCMF(path);
        double integral = algorithms::computeYIntegral(table, options);

        std::cout << std::setprecision(15) << integral << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
