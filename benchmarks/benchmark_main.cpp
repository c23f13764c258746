/**
 * @file benchmark_main.cpp
 * @brief mpcint Composed Operation Benchmark Suite
 *
 * Measures wall time and backend primitive calls of each composed
 * operation at every width, on the local reference backend.
 *
 * Usage:
 *   mpcint_benchmark [group]
 *
 * Groups:
 *   all      - Run all benchmarks (default)
 *   arith    - add, sub, mul, div
 *   compare  - eq, lt (signed and unsigned), select
 *   checked  - checked add/mul with overflow bit
 *   shift    - shl, shr
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <algorithm>
#include <functional>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "mpcint/mpcint.h"

#include "benchmark_common.hpp"

using mpcint_bench::BenchmarkResult;
using mpcint_bench::Clock;
using mpcint_bench::Duration;
using mpcint_bench::Sample;

// Benchmark configuration
constexpr size_t WARMUP_ITERATIONS = 3;
constexpr size_t BENCHMARK_ITERATIONS = 50;

namespace {

const std::vector<mpcint::IntType> ALL_TYPES = {
    mpcint::kUint8, mpcint::kUint16, mpcint::kUint32, mpcint::kUint64, mpcint::kUint128, mpcint::kUint256,
    mpcint::kInt8, mpcint::kInt16, mpcint::kInt32, mpcint::kInt64, mpcint::kInt128, mpcint::kInt256,
};

using BinaryBody = std::function<void(mpcint::WordBackend&, const mpcint::WideValue&, const mpcint::WideValue&)>;

/**
 * @brief Time one binary operation on fresh full-width random operands
 */
BenchmarkResult bench_binary(mpcint::backend::LocalWordBackend& be, mpcint::IntType type,
                             const BinaryBody& body) {
    return mpcint_bench::run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
        mpcint::WideValue a = mpcint::random(be, type);
        mpcint::WideValue b = mpcint::random(be, type);
        be.reset_stats();
        auto start = Clock::now();
        body(be, a, b);
        auto end = Clock::now();
        return Sample{Duration(end - start).count(), be.stats().primitives()};
    });
}

void run_group(mpcint::backend::LocalWordBackend& be, const std::string& title,
               const std::vector<std::pair<std::string, BinaryBody>>& ops) {
    std::cout << "\n" << std::string(87, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(87, '=') << std::endl;
    mpcint_bench::print_header();

    for (const auto& op : ops) {
        for (const mpcint::IntType& type : ALL_TYPES) {
            try {
                mpcint_bench::print_result(op.first, type.name(), bench_binary(be, type, op.second));
            } catch (const mpcint::MpcError& e) {
                std::cout << std::left << std::setw(25) << op.first << std::setw(12) << type.name()
                          << "  (" << e.what() << ")" << std::endl;
            }
        }
    }
}

void benchmark_arith(mpcint::backend::LocalWordBackend& be) {
    run_group(be, "Wrapping Arithmetic", {
        {"add", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) { mpcint::add(b, x, y); }},
        {"sub", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) { mpcint::sub(b, x, y); }},
        {"mul", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) { mpcint::mul(b, x, y); }},
        {"mul (public rhs)", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue&) {
            mpcint::mul(b, x, mpcint::Operand::plain(x.type(), 3));
        }},
        {"div", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) {
            mpcint::div(b, x, mpcint::bit_or(b, y, mpcint::Operand::plain(y.type(), 1)));
        }},
    });
}

void benchmark_compare(mpcint::backend::LocalWordBackend& be) {
    run_group(be, "Comparison and Select", {
        {"eq", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) { mpcint::eq(b, x, y); }},
        {"lt", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) { mpcint::lt(b, x, y); }},
        {"max", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) { mpcint::max(b, x, y); }},
    });
}

void benchmark_checked(mpcint::backend::LocalWordBackend& be) {
    run_group(be, "Overflow-Checked Arithmetic", {
        {"checked add (bit)", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) {
            mpcint::checked_add_with_overflow_bit(b, x, y);
        }},
        {"checked sub (bit)", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) {
            mpcint::checked_sub_with_overflow_bit(b, x, y);
        }},
        {"checked mul (bit)", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue& y) {
            mpcint::checked_mul_with_overflow_bit(b, x, y);
        }},
    });
}

void benchmark_shift(mpcint::backend::LocalWordBackend& be) {
    run_group(be, "Shifts", {
        {"shl 5", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue&) { mpcint::shl(b, x, 5); }},
        {"shr 5", [](mpcint::WordBackend& b, const mpcint::WideValue& x, const mpcint::WideValue&) { mpcint::shr(b, x, 5); }},
    });
}

} // namespace

/**
 * @brief Print usage help
 */
void print_usage(const char* program_name) {
    std::cout << "\nUsage: " << program_name << " [group]\n\n";
    std::cout << "Groups:\n";
    std::cout << "  all      - Run all benchmarks (default)\n";
    std::cout << "  arith    - add, sub, mul, div\n";
    std::cout << "  compare  - eq, lt, max\n";
    std::cout << "  checked  - checked add/sub/mul with overflow bit\n";
    std::cout << "  shift    - shl, shr\n";
}

/**
 * @brief Main benchmark entry point with command-line argument support
 */
int main(int argc, char* argv[]) {
    std::string group = "all";
    if (argc > 1) {
        group = argv[1];
        std::transform(group.begin(), group.end(), group.begin(), ::tolower);
    }

    std::set<std::string> valid_groups = {"all", "arith", "compare", "checked", "shift", "help", "-h", "--help"};
    if (valid_groups.find(group) == valid_groups.end()) {
        std::cerr << "Error: Unknown group '" << group << "'\n";
        print_usage(argv[0]);
        return 1;
    }
    if (group == "help" || group == "-h" || group == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cout << "\n";
    std::cout << "+======================================================================+\n";
    std::cout << "|            mpcint Composed Operation Benchmark Suite                 |\n";
    std::cout << "|                    Version " << MPCINT_VERSION_STRING << "                                     |\n";
    std::cout << "+======================================================================+\n";
    std::cout << "\nBackend: local reference (in-process)\n";
    std::cout << "Iterations per test: " << BENCHMARK_ITERATIONS << " (warmup: " << WARMUP_ITERATIONS << ")\n";

    // The reduced-privacy division path warns on every call
    mpcint::set_log_level(spdlog::level::err);
    mpcint::backend::LocalWordBackend be(mpcint::backend::LocalBackendConfig::from_seed(2026));

    if (group == "all" || group == "arith") {
        benchmark_arith(be);
    }
    if (group == "all" || group == "compare") {
        benchmark_compare(be);
    }
    if (group == "all" || group == "checked") {
        benchmark_checked(be);
    }
    if (group == "all" || group == "shift") {
        benchmark_shift(be);
    }

    std::cout << "\nCalls column: backend primitive calls (binary ops and mux) per operation.\n";
    return 0;
}
