/**
 * @file bench_algorithms.cpp
 * @brief Per-algorithm comparison across key sizes
 *
 * Every engine pins a single algorithm for all lengths, so the numbers show
 * the cost of each digest path (including the XXH3 substitution for the
 * hardware-gated variants).
 */

#include "benchmark_utils.hpp"
#include <fastshard/fastshard.hpp>
#include <iostream>

using namespace fastshard;
using namespace fastshard::bench;

int main(int argc, char* argv[]) {
    std::cout << "=== fastshard Algorithm Comparison ===\n\n";

    size_t samples = 0;
    if (!parse_samples(argc, argv, 100, samples)) {
        std::cerr << "Usage: " << argv[0] << " [samples]\n";
        return 2;
    }
    const std::vector<size_t> sizes{4, 8, 16, 32, 256, 512, 1024, 4096, 32768};

    auto caps = host_capabilities();
    std::cout << "Host capabilities: " << caps.to_string() << "\n";

    std::vector<std::pair<std::string, stats>> results;

    for (auto size : sizes) {
        // Filled with 0xAA, varied in the first byte to defeat caching effects
        std::string key(size, '\xAA');

        for (auto a : all_algorithms) {
            auto engine = shard_engine::create(1024, shard_config::single(a), caps);
            if (!engine) {
                std::cerr << "Failed to build engine: " << error_message(engine.error()) << "\n";
                return 1;
            }

            std::string label = std::string{to_string(a)} + "/" + std::to_string(size);
            if (!caps.supports(a)) {
                label += " (falls back to " + std::string{to_string(engine->select(size))} + ")";
            }

            auto s = benchmark(label, [&](size_t i) {
                key[0] = static_cast<char>(i);
                do_not_optimize(engine->shard(key).value);
            }, samples);
            results.emplace_back(label, s);
        }
    }

    std::cout << "\nCSV: label,min_ns,median_ns,p90_ns,p99_ns\n";
    for (const auto& [label, s] : results) {
        s.print_csv(label);
    }

    return 0;
}
