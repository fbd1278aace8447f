/**
 * @file cmd_ctbench.cpp
 * @brief Constant-time test subcommand for shs CLI
 *
 * Runs the built-in SHA-256 timing scenarios and prints one line per
 * scenario followed by a summary table.
 *
 * Usage:
 *   shs ctbench
 *   shs ctbench -samples 100000 -seed 0 -markdown ct_report.md
 *
 * @author shs Development Team
 * @date 2026-10-18
 */

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "shs/ct/ct_bench.h"
#include "shs/ct/sha256_scenarios.h"

#include "cli_utils.h"
using shs::cli::parse_count;
using shs::cli::parse_positive_double;
using shs::cli::parse_u64;
using shs::cli::write_text_file;

/**
 * @brief Print ctbench subcommand help
 */
void print_ctbench_help() {
    std::cout << "\nUsage: shs ctbench [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -samples <n>       Iterations per scenario (default 20000)\n";
    std::cout << "  -threshold <t>     Leak threshold on |t| (default 10)\n";
    std::cout << "  -seed <n>          RNG seed, decimal or 0x hex (default 0xdeadbeef, 0 = OS random)\n";
    std::cout << "  -only <name>       Run a single scenario\n";
    std::cout << "  -list              List scenario names and exit\n";
    std::cout << "  -markdown <file>   Also write a Markdown report\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Exit status: 0 when no leak is detected, 3 on a leak or when a scenario\n";
    std::cout << "             collected too few samples, 1 on error\n\n";
}

/**
 * @brief ctbench subcommand handler
 */
int cmd_ctbench(int argc, char* argv[]) {
    shs::ct::CtConfig config;
    std::string markdown_file, only;
    bool list_only = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            if (arg == "-samples" && i + 1 < argc) {
                config.iterations = parse_count(arg, argv[++i]);
            } else if (arg == "-threshold" && i + 1 < argc) {
                config.leak_threshold = parse_positive_double(arg, argv[++i]);
                if (config.possible_threshold > config.leak_threshold) {
                    config.possible_threshold = config.leak_threshold;
                }
            } else if (arg == "-seed" && i + 1 < argc) {
                config.seed = parse_u64(arg, argv[++i]);
            } else if (arg == "-only" && i + 1 < argc) {
                only = argv[++i];
            } else if (arg == "-list") {
                list_only = true;
            } else if (arg == "-markdown" && i + 1 < argc) {
                markdown_file = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_ctbench_help();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_ctbench_help();
                return 1;
            }
        }

        std::vector<shs::ct::CtBench> benches = shs::ct::sha256_benches();

        if (list_only) {
            for (const auto& b : benches) {
                std::cout << b.name << (b.informational ? "  (length-dependent)" : "") << "\n";
            }
            return 0;
        }

        if (!only.empty()) {
            std::vector<shs::ct::CtBench> selected;
            for (auto& b : benches) {
                if (b.name == only) {
                    selected.push_back(std::move(b));
                }
            }
            if (selected.empty()) {
                throw std::invalid_argument("unknown scenario '" + only + "' (see -list)");
            }
            benches.swap(selected);
        }

        std::cout << "\nSHA-256 constant-time tests: " << benches.size() << " scenario(s), "
                  << config.iterations << " iterations each\n\n";

        auto reports = shs::ct::run_benches(benches, config, &std::cout);

        std::cout << "\n" << shs::ct::format_text(reports) << "\n";

        if (!markdown_file.empty()) {
            write_text_file(markdown_file,
                            shs::ct::format_markdown(reports, config, "SHA-256 constant-time report"));
            std::cout << "Markdown report written to " << markdown_file << "\n";
        }

        bool passed = shs::ct::all_passed(reports);
        if (passed) {
            std::cout << "Result: PASS\n";
            return 0;
        }
        bool leak = false;
        for (const auto& r : reports) {
            leak = leak || (!r.informational && r.summary.verdict == shs::ct::Verdict::Leak);
        }
        std::cout << (leak ? "Result: FAIL (timing leak detected)\n"
                           : "Result: FAIL (too few samples, raise -samples)\n");
        return 3;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
