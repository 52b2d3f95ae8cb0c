/**
 * @file benchmark_utils.hpp
 * @brief Timing and statistics helpers for the fastshard benchmarks
 */

#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <vector>
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <cmath>
#include <numeric>
#include <string>
#include <random>
#include <string_view>

namespace fastshard::bench {

class timer {
    using clock = std::chrono::high_resolution_clock;
    using time_point = clock::time_point;
    time_point start_;

public:
    timer() : start_(clock::now()) {}

    void reset() {
        start_ = clock::now();
    }

    uint64_t elapsed_ns() const {
        auto end = clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
    }

    double elapsed_ms() const {
        return elapsed_ns() / 1000000.0;
    }
};

// Statistical summary of per-operation timings
struct stats {
    double min;
    double max;
    double mean;
    double median;
    double p90;
    double p99;
    double stddev;
    size_t count;

    void print(const std::string& label, const std::string& unit = "ns") const {
        std::cout << "\n=== " << label << " ===\n";
        std::cout << "Samples: " << count << "\n";
        std::cout << "Min:     " << std::fixed << std::setprecision(2) << min << " " << unit << "\n";
        std::cout << "Median:  " << median << " " << unit << "\n";
        std::cout << "Mean:    " << mean << " " << unit << "\n";
        std::cout << "Stddev:  " << stddev << " " << unit << "\n";
        std::cout << "p90:     " << p90 << " " << unit << "\n";
        std::cout << "p99:     " << p99 << " " << unit << "\n";
        std::cout << "Max:     " << max << " " << unit << "\n";
    }

    // One row per benchmark for spreadsheet import
    void print_csv(const std::string& label) const {
        std::cout << label << ","
                  << std::fixed << std::setprecision(2)
                  << min << ","
                  << median << ","
                  << p90 << ","
                  << p99 << "\n";
    }
};

inline stats compute_stats(std::vector<double> measurements) {
    if (measurements.empty()) {
        return {0, 0, 0, 0, 0, 0, 0, 0};
    }

    std::sort(measurements.begin(), measurements.end());

    auto percentile = [&](double p) {
        size_t idx = static_cast<size_t>(p * measurements.size());
        if (idx >= measurements.size()) idx = measurements.size() - 1;
        return measurements[idx];
    };

    double sum = std::accumulate(measurements.begin(), measurements.end(), 0.0);
    double mean = sum / measurements.size();

    double sq_sum = std::accumulate(measurements.begin(), measurements.end(), 0.0,
        [mean](double acc, double val) {
            return acc + (val - mean) * (val - mean);
        });
    double stddev = std::sqrt(sq_sum / measurements.size());

    return {
        measurements.front(),
        measurements.back(),
        mean,
        percentile(0.5),
        percentile(0.90),
        percentile(0.99),
        stddev,
        measurements.size()
    };
}

// Keeps results observable so the optimizer cannot drop the measured call
template<typename T>
inline void do_not_optimize(const T& value) {
    __asm__ __volatile__("" : : "r,m"(value) : "memory");
}

/**
 * @brief Sample count from argv[1], or `fallback` when absent
 * @return false if the argument is not a positive decimal
 */
inline bool parse_samples(int argc, char* argv[], size_t fallback, size_t& samples) {
    samples = fallback;
    if (argc < 2) return true;
    std::string_view text = argv[1];
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || n == 0) {
        return false;
    }
    samples = n;
    return true;
}

/**
 * @brief Random keys of a fixed length
 */
inline std::vector<std::string> make_sized_keys(size_t count, size_t length, uint64_t seed = 42) {
    std::mt19937_64 gen(seed);
    std::uniform_int_distribution<int> byte_dist(0, 255);

    std::vector<std::string> keys;
    keys.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::string key(length, '\0');
        for (auto& c : key) {
            c = static_cast<char>(byte_dist(gen));
        }
        keys.push_back(std::move(key));
    }
    return keys;
}

/**
 * @brief Time `f` in batches and report nanoseconds per call
 *
 * A single shard() call is far below clock resolution, so each sample
 * covers `batch` calls.
 */
template<typename Func>
stats benchmark(const std::string& name, Func&& f,
                size_t samples = 200, size_t batch = 1000, size_t warmup_iterations = 10000) {
    for (size_t i = 0; i < warmup_iterations; ++i) {
        f(i);
    }

    std::vector<double> measurements;
    measurements.reserve(samples);

    size_t i = 0;
    for (size_t s = 0; s < samples; ++s) {
        timer t;
        for (size_t b = 0; b < batch; ++b, ++i) {
            f(i);
        }
        measurements.push_back(static_cast<double>(t.elapsed_ns()) / batch);
    }

    auto result = compute_stats(std::move(measurements));
    result.print(name);
    return result;
}

} // namespace fastshard::bench
