#include "cienorm/io/cmf_reader.hpp"
#include <sstream>
#include <memory>
#include <cstdlib>
#include <cerrno>
#include <cmath>

#include <zlib.h>

namespace cienorm {
namespace io {

namespace {

struct GzFileCloser {
    void operator()(gzFile_s* file) const noexcept {
        if (file) gzclose(file);
    }
};

using GzFilePtr = std::unique_ptr<gzFile_s, GzFileCloser>;

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    auto begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string CMFReader::readFile(const std::string& filename) {
    GzFilePtr file(gzopen(filename.c_str(), "rb"));
    if (!file) {
        throw DataFormatError("Failed to open file: " + filename);
    }

    std::string content;
    char buffer[16384];
    int n;
    while ((n = gzread(file.get(), buffer, sizeof(buffer))) > 0) {
        // Only plain text tables are accepted; zlib would inflate gzip input
        if (content.empty() && gzdirect(file.get()) == 0) {
            throw DataFormatError("compressed input is not supported: " + filename);
        }
        content.append(buffer, static_cast<std::size_t>(n));
    }
    if (n < 0) {
        int errnum = Z_OK;
        const char* msg = gzerror(file.get(), &errnum);
        throw DataFormatError("Failed to read file: " + filename + ": " +
                              (msg ? msg : "unknown zlib error"));
    }
    return content;
}

Value CMFReader::parseField(const std::string& field, std::size_t line_number,
                            std::size_t column) {
    std::string text = trim(field);
    if (text.empty()) {
        throw DataFormatError("empty field " + std::to_string(column) +
                              " on line " + std::to_string(line_number));
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE ||
        !std::isfinite(value)) {
        throw DataFormatError("non-numeric field " + std::to_string(column) +
                              " on line " + std::to_string(line_number) +
                              ": '" + text + "'");
    }
    return value;
}

void CMFReader::parseLine(const std::string& line, std::size_t line_number,
                          Columns& columns) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, DELIMITER)) {
        fields.push_back(field);
    }
    // getline drops an empty trailing field
    if (!line.empty() && line.back() == DELIMITER) {
        fields.emplace_back();
    }

    if (fields.size() != COLUMNS) {
        throw DataFormatError("expected " + std::to_string(COLUMNS) +
                              " columns on line " + std::to_string(line_number) +
                              ", found " + std::to_string(fields.size()));
    }

    columns.wavelengths.push_back(parseField(fields[0], line_number, 1));
    columns.xbar.push_back(parseField(fields[1], line_number, 2));
    columns.ybar.push_back(parseField(fields[2], line_number, 3));
    columns.zbar.push_back(parseField(fields[3], line_number, 4));
}

ColorMatchingTable CMFReader::read(const std::string& filename) {
    try {
        return parseString(readFile(filename));
    } catch (const DataFormatError& e) {
        last_error_ = e.what();
        throw;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        throw DataFormatError(e.what());
    }
}

ColorMatchingTable CMFReader::parseString(const std::string& content) {
    try {
        Columns columns;
        std::stringstream ss(content);
        std::string line;
        std::size_t line_number = 0;

        while (std::getline(ss, line)) {
            ++line_number;
            if (trim(line).empty()) continue;
            parseLine(line, line_number, columns);
        }

        return ColorMatchingTable(std::move(columns.wavelengths),
                                  std::move(columns.xbar),
                                  std::move(columns.ybar),
                                  std::move(columns.zbar));
    } catch (const DataFormatError& e) {
        last_error_ = e.what();
        throw;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        throw DataFormatError(e.what());
    }
}

bool CMFReader::isValidCMF(const std::string& filename) {
    try {
        CMFReader reader;
        reader.read(filename);
        return true;
    } catch (const DataFormatError&) {
        return false;
    }
}

} // namespace io
} // namespace cienorm
