#pragma once

/**
 * @file cienorm.hpp
 * @brief Main header for the cienorm library.
 *
 * Include this header to get access to all cienorm functionality.
 *
 * @example
 * @code
 * #include <cienorm/cienorm.hpp>
 *
 * int main() {
 *     // Load the CIE 1931 color-matching table
 *     auto table = cienorm::io::loadCMF("data/ciexyz31.csv");
 *
 *     // Integrate y-bar over [380, 780) nm at 5 nm
 *     std::cout << cienorm::algorithms::computeYIntegral(table) << "\n";
 *
 *     return 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"

// Data structures
#include "color_matching_table.hpp"

// I/O
#include "io/cmf_reader.hpp"

// Algorithms
#include "algorithms/interpolation.hpp"
#include "algorithms/sample_grid.hpp"
#include "algorithms/integration.hpp"
#include "algorithms/resampling.hpp"

/**
 * @namespace cienorm
 * @brief Root namespace for the cienorm library.
 */

/**
 * @namespace cienorm::io
 * @brief Readers for color-matching function tables.
 */

/**
 * @namespace cienorm::algorithms
 * @brief Interpolation, sampling and integration of color-matching curves.
 */
