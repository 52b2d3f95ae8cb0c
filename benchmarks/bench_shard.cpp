/**
 * @file bench_shard.cpp
 * @brief Default vs custom tier configuration, plus bulk sharding
 *
 * Usage: bench_shard [samples]
 */

#include "benchmark_utils.hpp"
#include <fastshard/fastshard.hpp>
#include <iostream>

using namespace fastshard;
using namespace fastshard::bench;

int main(int argc, char* argv[]) {
    std::cout << "=== fastshard Configured Sharding Benchmark ===\n\n";

    size_t samples = 0;
    if (!parse_samples(argc, argv, 200, samples)) {
        std::cerr << "Usage: " << argv[0] << " [samples]\n";
        return 2;
    }

    auto default_engine = shard_engine::create(1024);
    auto custom_config = parse_config("0-64:fnv1a;65-1024:xxh3|xxh3");
    if (!default_engine || !custom_config) {
        std::cerr << "Failed to build engines\n";
        return 1;
    }
    auto custom_engine = shard_engine::create(1024, std::move(*custom_config));
    if (!custom_engine) {
        std::cerr << "Failed to build custom engine: "
                  << error_message(custom_engine.error()) << "\n";
        return 1;
    }

    std::cout << "Host capabilities: " << host_capabilities().to_string() << "\n";
    std::cout << "Default config:    " << format_config(default_engine->config()) << "\n";
    std::cout << "Custom config:     " << format_config(custom_engine->config()) << "\n";

    auto small_keys = make_sized_keys(4096, 32);
    auto large_keys = make_sized_keys(4096, 512);

    auto run = [&](const std::string& name, const shard_engine& engine,
                   const std::vector<std::string>& keys) {
        return benchmark(name, [&](size_t i) {
            do_not_optimize(engine.shard(keys[i % keys.size()]).value);
        }, samples);
    };

    std::vector<std::pair<std::string, stats>> results;
    results.emplace_back("default_small", run("default_small", *default_engine, small_keys));
    results.emplace_back("custom_small", run("custom_small", *custom_engine, small_keys));
    results.emplace_back("default_large", run("default_large", *default_engine, large_keys));
    results.emplace_back("custom_large", run("custom_large", *custom_engine, large_keys));

    // Bulk path
    auto bulk_keys = make_sized_keys(1 << 20, 24);
    timer t;
    auto indices = shard_batch(*default_engine, bulk_keys);
    double ms = t.elapsed_ms();
    do_not_optimize(indices.back().value);

    std::cout << "\n=== shard_batch ===\n";
    std::cout << "Keys:    " << bulk_keys.size() << "\n";
    std::cout << "Threads: " << batch_threads() << "\n";
    std::cout << "Time:    " << std::fixed << std::setprecision(2) << ms << " ms\n";
    std::cout << "Rate:    " << (bulk_keys.size() / (ms / 1000.0)) / 1e6 << " M keys/s\n";

    std::cout << "\nCSV: label,min_ns,median_ns,p90_ns,p99_ns\n";
    for (const auto& [label, s] : results) {
        s.print_csv(label);
    }

    return 0;
}
