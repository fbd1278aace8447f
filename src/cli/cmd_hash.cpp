/**
 * @file cmd_hash.cpp
 * @brief Hash subcommand implementation for shs CLI
 *
 * Input sources (exactly one, stdin when none is given):
 *   -in <file>      file contents
 *   -string <text>  literal text, no trailing newline
 *   -hexin <hex>    hex-encoded bytes
 *
 * Usage:
 *   shs hash -in file.txt
 *   shs hash -string abc -check ba7816bf...
 *   cat data.bin | shs hash -chunk 4096
 *
 * @author shs Development Team
 * @date 2026-10-18
 */

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "shs/crypto/sha256.h"
#include "shs/core/security.h"
#include "shs/utils/encoding.h"

// Use shared CLI utilities
#include "cli_utils.h"
using shs::cli::parse_count;
using shs::cli::read_file;
using shs::cli::read_stdin;

/**
 * @brief Print hash subcommand help
 */
void print_hash_help() {
    std::cout << "\nUsage: shs hash [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -in <file>         Input file path\n";
    std::cout << "  -string <text>     Hash a literal string\n";
    std::cout << "  -hexin <hex>       Hash hex-encoded bytes\n";
    std::cout << "                     (standard input is read when no source is given)\n";
    std::cout << "  -chunk <n>         Feed the input to the incremental hasher n bytes at a time\n";
    std::cout << "  -check <hex>       Compare against an expected digest (constant time)\n";
    std::cout << "  -hex               Output in hexadecimal (default)\n";
    std::cout << "  -binary            Output raw binary\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Exit status: 0 on success, 1 on error, 2 when -check does not match\n\n";
    std::cout << "Examples:\n";
    std::cout << "  shs hash -in document.pdf\n";
    std::cout << "  shs hash -string abc\n";
    std::cout << "  shs hash -in large_file.bin -chunk 65536\n";
    std::cout << "  shs hash -hexin 616263 -check ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad\n\n";
}

namespace {

/**
 * @brief Stream a file through the incremental hasher
 */
shs::SHA256Digest hash_file_chunked(const std::string& path, size_t chunk, uint64_t& total) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + path);
    }

    shs::SHA256 ctx;
    std::vector<char> buf(chunk);
    total = 0;
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            ctx.update(reinterpret_cast<const uint8_t*>(buf.data()), static_cast<size_t>(got));
            total += static_cast<uint64_t>(got);
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read input file: " + path);
    }
    return ctx.finalize();
}

shs::SHA256Digest hash_chunked(const std::vector<uint8_t>& data, size_t chunk) {
    shs::SHA256 ctx;
    for (size_t off = 0; off < data.size(); off += chunk) {
        ctx.update(data.data() + off, std::min(chunk, data.size() - off));
    }
    return ctx.finalize();
}

} // anonymous namespace

/**
 * @brief Hash subcommand handler
 */
int cmd_hash(int argc, char* argv[]) {
    std::string input_file, literal, hex_input, expected_hex, chunk_arg;
    bool have_literal = false;
    bool have_hex = false;
    bool hex_output = true;  // Default to hex

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-string" && i + 1 < argc) {
            literal = argv[++i];
            have_literal = true;
        } else if (arg == "-hexin" && i + 1 < argc) {
            hex_input = argv[++i];
            have_hex = true;
        } else if (arg == "-chunk" && i + 1 < argc) {
            chunk_arg = argv[++i];
        } else if (arg == "-check" && i + 1 < argc) {
            expected_hex = argv[++i];
        } else if (arg == "-hex") {
            hex_output = true;
        } else if (arg == "-binary") {
            hex_output = false;
        } else if (arg == "--help" || arg == "-h") {
            print_hash_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_hash_help();
            return 1;
        }
    }

    int sources = (input_file.empty() ? 0 : 1) + (have_literal ? 1 : 0) + (have_hex ? 1 : 0);
    if (sources > 1) {
        std::cerr << "Error: -in, -string and -hexin are mutually exclusive\n";
        return 1;
    }

    try {
        size_t chunk = 0;
        if (!chunk_arg.empty()) {
            chunk = parse_count("-chunk", chunk_arg);
        }

        shs::ByteVec expected;
        if (!expected_hex.empty()) {
            expected = shs::hexDecode(expected_hex);
            if (expected.size() != SHS_SHA256_DIGEST_SIZE) {
                throw std::invalid_argument("-check expects a 32-byte (64 hex character) digest");
            }
        }

        std::string source;
        uint64_t total = 0;
        shs::SHA256Digest digest;

        if (!input_file.empty() && chunk > 0) {
            source = input_file;
            digest = hash_file_chunked(input_file, chunk, total);
        } else {
            std::vector<uint8_t> data;
            if (!input_file.empty()) {
                source = input_file;
                data = read_file(input_file);
            } else if (have_literal) {
                source = "\"" + literal + "\"";
                data.assign(literal.begin(), literal.end());
            } else if (have_hex) {
                source = "hex input";
                data = shs::hexDecode(hex_input);
            } else {
                source = "stdin";
                data = read_stdin();
            }
            total = data.size();
            digest = chunk > 0 ? hash_chunked(data, chunk) : shs::SHA256::hash(data);
        }

        if (hex_output) {
            std::cout << "Input: " << source << " (" << total << " bytes)\n";
            std::cout << "Algorithm: SHA-256\n";
            std::cout << "Hash (hex): " << shs::hexEncode(digest) << "\n";
        } else {
            std::cout.write(reinterpret_cast<const char*>(digest.data()),
                            static_cast<std::streamsize>(digest.size()));
            std::cout.flush();
        }

        if (!expected.empty()) {
            bool match = shs_secure_compare(digest.data(), expected.data(), digest.size()) == 1;
            (hex_output ? std::cout : std::cerr) << "Verified: " << (match ? "OK" : "FAILED") << "\n";
            return match ? 0 : 2;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
