/**
 * @file benchmark_common.hpp
 * @brief Common utilities for mpcint benchmarks
 *
 * Provides unified benchmark output format with:
 * - Timing metrics (avg, min, throughput)
 * - Backend primitive calls per composed operation
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MPCINT_BENCHMARK_COMMON_HPP
#define MPCINT_BENCHMARK_COMMON_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

namespace mpcint_bench {

/**
 * @brief High-resolution timer types
 */
using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

/**
 * @brief Benchmark result containing timing and cost data
 */
struct BenchmarkResult {
    double avg_ms;          ///< Average time in milliseconds
    double min_ms;          ///< Minimum time in milliseconds
    double throughput;      ///< Operations per second
    uint64_t calls;         ///< Backend primitive calls per operation
    bool valid;             ///< Whether benchmark completed successfully

    BenchmarkResult() : avg_ms(0), min_ms(0), throughput(0), calls(0), valid(false) {}
    BenchmarkResult(double avg, double min_t, double tp, uint64_t c)
        : avg_ms(avg), min_ms(min_t), throughput(tp), calls(c), valid(true) {}
};

/**
 * @brief One timed sample: elapsed milliseconds and backend calls
 */
struct Sample {
    double ms;
    uint64_t calls;
};

/**
 * @brief Run benchmark and return result with statistics
 *
 * @param warmup_iters Number of warmup iterations
 * @param bench_iters Number of benchmark iterations
 * @param benchmark_func Function returning one sample
 * @return BenchmarkResult with statistics; calls from the last sample
 */
inline BenchmarkResult run_benchmark_ex(
    size_t warmup_iters,
    size_t bench_iters,
    std::function<Sample()> benchmark_func
) {
    std::vector<double> times;
    times.reserve(bench_iters);

    for (size_t i = 0; i < warmup_iters; ++i) {
        benchmark_func();
    }

    uint64_t calls = 0;
    for (size_t i = 0; i < bench_iters; ++i) {
        Sample s = benchmark_func();
        times.push_back(s.ms);
        calls = s.calls;
    }
    if (times.empty()) {
        return BenchmarkResult();
    }

    double avg = std::accumulate(times.begin(), times.end(), 0.0) /
                 static_cast<double>(times.size());
    double min_t = *std::min_element(times.begin(), times.end());
    double ops_per_sec = avg > 0 ? 1000.0 / avg : 0.0;

    return BenchmarkResult(avg, min_t, ops_per_sec, calls);
}

/**
 * @brief Print table header
 */
inline void print_header() {
    std::cout << std::left << std::setw(25) << "Operation"
              << std::setw(12) << "Type"
              << std::right
              << std::setw(13) << "Avg"
              << std::setw(13) << "Min"
              << std::setw(14) << "Throughput"
              << std::setw(10) << "Calls" << std::endl;
    std::cout << std::string(87, '-') << std::endl;
}

/**
 * @brief Print benchmark result line
 *
 * @param name Operation name
 * @param type Integer type name
 * @param result Benchmark result
 */
inline void print_result(
    const std::string& name,
    const std::string& type,
    const BenchmarkResult& result
) {
    if (!result.valid) {
        std::cout << std::left << std::setw(25) << name
                  << std::setw(12) << type
                  << "  (benchmark failed)" << std::endl;
        return;
    }

    std::cout << std::left << std::setw(25) << name
              << std::setw(12) << type
              << std::right << std::fixed << std::setprecision(3)
              << std::setw(10) << result.avg_ms << " ms"
              << std::setw(10) << result.min_ms << " ms"
              << std::setw(10) << std::setprecision(1) << result.throughput << " op/s"
              << std::setw(10) << result.calls
              << std::endl;
}

} // namespace mpcint_bench

#endif // MPCINT_BENCHMARK_COMMON_HPP
