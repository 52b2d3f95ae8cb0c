/**
 * @file custom_config.cpp
 * @brief Building an engine with custom size tiers
 *
 * Three tiers with their own preference lists; lengths above 4096 bytes use
 * the default list.
 */

#include <fastshard/fastshard.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace fastshard;

int main() {
    auto config = shard_config::create(
        {
            tier{size_range{0, 128},
                 {algorithm::avx512, algorithm::aes_ni, algorithm::fnv1a}},
            tier{size_range{129, 1024},
                 {algorithm::avx512, algorithm::avx2, algorithm::xxh3}},
            tier{size_range{1025, 4096},
                 {algorithm::avx512, algorithm::aes_ni, algorithm::xxh3}},
        },
        {algorithm::xxh3, algorithm::fnv1a});

    if (!config) {
        std::cerr << "Invalid configuration: " << error_message(config.error()) << "\n";
        return 1;
    }

    std::cout << "Config: " << format_config(*config) << "\n";

    auto engine = shard_engine::create(1024, std::move(*config));
    if (!engine) {
        std::cerr << "Failed to create engine: " << error_message(engine.error()) << "\n";
        return 1;
    }

    std::string small_key = "small key";
    std::string medium_key(500, '\0');
    std::string large_key(2000, '\0');
    std::string huge_key(10000, '\0');

    auto report = [&](const char* label, const std::string& key) {
        auto r = engine->explain(key);
        std::cout << label << " (" << r.key_size << " bytes): shard " << r.shard.value
                  << " via " << to_string(r.selected);
        if (r.digest_algorithm != r.selected) {
            std::cout << " [" << to_string(r.digest_algorithm) << " digest]";
        }
        std::cout << "\n";
    };

    report("Small key", small_key);
    report("Medium key", medium_key);
    report("Large key", large_key);
    report("Huge key", huge_key);

    // Constructing with zero shards is rejected up front
    auto invalid = shard_engine::create(0);
    std::cout << "Zero shards: " << error_message(invalid.error()) << "\n";

    return 0;
}
