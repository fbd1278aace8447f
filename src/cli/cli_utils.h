/**
 * @file cli_utils.h
 * @brief Common utility functions for shs CLI commands
 *
 * @author shs Development Team
 * @date 2026-10-18
 */

#ifndef SHS_CLI_UTILS_H
#define SHS_CLI_UTILS_H

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace shs {
namespace cli {

/**
 * @brief Read file into byte vector
 */
inline std::vector<uint8_t> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return std::vector<uint8_t>(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

/**
 * @brief Read all of standard input into byte vector
 */
inline std::vector<uint8_t> read_stdin() {
    std::vector<uint8_t> data(
        (std::istreambuf_iterator<char>(std::cin)),
        std::istreambuf_iterator<char>()
    );
    if (std::cin.bad()) {
        throw std::runtime_error("Failed to read standard input");
    }
    return data;
}

/**
 * @brief Write text to file
 */
inline void write_text_file(const std::string& filename, const std::string& text) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + filename);
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}

/**
 * @brief Parse a non-negative integer option value
 *
 * Decimal, or hex after a 0x prefix. A leading 0 is still decimal.
 * Signs, whitespace, trailing characters and out-of-range values throw
 * std::invalid_argument.
 */
inline uint64_t parse_u64(const std::string& option, const std::string& value) {
    const std::string error = option + " expects a non-negative integer, got '" + value + "'";

    std::string digits = value;
    int base = 10;
    if (value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        digits = value.substr(2);
        base = 16;
    }
    if (digits.empty()) {
        throw std::invalid_argument(error);
    }
    for (char c : digits) {
        bool ok = (base == 16) ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                               : std::isdigit(static_cast<unsigned char>(c)) != 0;
        if (!ok) {
            throw std::invalid_argument(error);
        }
    }

    unsigned long long v = 0;
    try {
        v = std::stoull(digits, nullptr, base);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(option + " is out of range: '" + value + "'");
    }
    return static_cast<uint64_t>(v);
}

/**
 * @brief Parse a count option value that must be at least 1
 */
inline size_t parse_count(const std::string& option, const std::string& value) {
    uint64_t v = parse_u64(option, value);
    if (v == 0) {
        throw std::invalid_argument(option + " must be at least 1");
    }
    if (v > static_cast<uint64_t>(SIZE_MAX)) {
        throw std::invalid_argument(option + " is out of range: '" + value + "'");
    }
    return static_cast<size_t>(v);
}

/**
 * @brief Parse a positive floating-point option value
 */
inline double parse_positive_double(const std::string& option, const std::string& value) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    }
    if (pos != value.size() || !(v > 0.0)) {
        throw std::invalid_argument(option + " expects a positive number, got '" + value + "'");
    }
    return v;
}

} // namespace cli
} // namespace shs

#endif // SHS_CLI_UTILS_H
