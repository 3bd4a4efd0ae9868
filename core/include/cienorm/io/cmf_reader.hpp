#pragma once

#include "../color_matching_table.hpp"
#include <string>
#include <vector>

namespace cienorm {
namespace io {

/**
 * @brief Reader for comma-separated color-matching function tables.
 *
 * The expected layout is the CVRL "ciexyz31" table: one row per
 * wavelength, four numeric fields per row and no header:
 *
 * @code
 * 360,0.000129900000,0.000003917000,0.000606100000
 * 365,0.000232100000,0.000006965000,0.001086000000
 * @endcode
 *
 * Files are read through zlib's file API. Input that zlib recognises as
 * gzip-compressed is rejected; only the plain text table is accepted.
 *
 * Usage:
 * @code
 * CMFReader reader;
 * ColorMatchingTable table = reader.read("data/ciexyz31.csv");
 * @endcode
 */
class CMFReader {
public:
    /// Field separator
    static constexpr char DELIMITER = ',';

    /// Number of fields per row
    static constexpr std::size_t COLUMNS = 4;

    CMFReader() = default;

    /**
     * @brief Read a color-matching table file.
     *
     * @param filename Path to the plain text table
     * @return Parsed table
     * @throws DataFormatError if the file cannot be opened, is compressed,
     *         or cannot be parsed
     */
    ColorMatchingTable read(const std::string& filename);

    /**
     * @brief Parse table content from a string.
     *
     * @param content Comma-separated table text
     * @return Parsed table
     * @throws DataFormatError if parsing fails
     */
    ColorMatchingTable parseString(const std::string& content);

    /**
     * @brief Check if a file opens and parses as a color-matching table.
     */
    static bool isValidCMF(const std::string& filename);

    /**
     * @brief Get the last error message (if any).
     */
    [[nodiscard]] const std::string& lastError() const noexcept {
        return last_error_;
    }

private:
    struct Columns {
        std::vector<Wavelength> wavelengths;
        std::vector<Value> xbar;
        std::vector<Value> ybar;
        std::vector<Value> zbar;
    };

    static std::string readFile(const std::string& filename);
    static void parseLine(const std::string& line, std::size_t line_number,
                          Columns& columns);
    static Value parseField(const std::string& field, std::size_t line_number,
                            std::size_t column);

    std::string last_error_;
};

/**
 * @brief Convenience function to load a color-matching table.
 *
 * @param filename Path to the table
 * @return Parsed table
 */
inline ColorMatchingTable loadCMF(const std::string& filename) {
    CMFReader reader;
    return reader.read(filename);
}

} // namespace io
} // namespace cienorm
