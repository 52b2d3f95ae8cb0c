/**
 * @file test_parallel.cpp
 * @brief Tests for bulk sharding and shard histograms
 */

#include <catch2/catch_test_macros.hpp>

#include <fastshard/parallel.hpp>
#include <numeric>
#include <string>
#include <vector>

using namespace fastshard;

namespace {

std::vector<std::string> make_keys(size_t n) {
    std::vector<std::string> keys;
    keys.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        // Mix of short and long keys so both default tiers are exercised
        if (i % 3 == 0) {
            keys.push_back("k" + std::to_string(i));
        } else {
            keys.push_back("long_key_prefix_for_tier_two_" + std::to_string(i));
        }
    }
    return keys;
}

} // namespace

TEST_CASE("shard_batch matches per-key sharding", "[parallel][batch]") {
    auto engine = shard_engine::create(256).value();
    auto keys = make_keys(10000);

    auto batch = shard_batch(engine, keys);

    REQUIRE(batch.size() == keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        REQUIRE(batch[i] == engine.shard(keys[i]));
    }
}

TEST_CASE("shard_batch on an empty input", "[parallel][batch]") {
    auto engine = shard_engine::create(8).value();
    std::vector<std::string> keys;

    REQUIRE(shard_batch(engine, keys).empty());
}

TEST_CASE("shard_batch accepts string views", "[parallel][batch]") {
    auto engine = shard_engine::create(32).value();
    std::vector<std::string_view> keys{"alpha", "beta", "gamma"};

    auto batch = shard_batch(engine, keys);
    REQUIRE(batch.size() == 3);
    REQUIRE(batch[1] == engine.shard("beta"));
}

TEST_CASE("shard_histogram counts every key once", "[parallel][histogram]") {
    auto engine = shard_engine::create(64, shard_config::defaults(), capability_set::none()).value();
    auto keys = make_keys(20000);

    auto counts = shard_histogram(engine, keys);

    REQUIRE(counts.size() == 64);
    REQUIRE(std::accumulate(counts.begin(), counts.end(), size_t{0}) == keys.size());

    SECTION("Reasonably even spread") {
        double expected = double(keys.size()) / counts.size();
        for (auto c : counts) {
            REQUIRE(c > expected / 3);
            REQUIRE(c < expected * 3);
        }
    }
}

TEST_CASE("batch_threads reports at least one thread", "[parallel]") {
    REQUIRE(batch_threads() >= 1);
}
