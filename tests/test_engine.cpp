/**
 * @file test_engine.cpp
 * @brief Tests for algorithm selection and the shard engine
 *
 * Expected shards are computed from independent reference digests rather
 * than from the engine itself.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>

#include <fastshard/engine.hpp>
#include <xxhash.h>
#include <limits>
#include <string>
#include <vector>

using namespace fastshard;

namespace {

uint64_t reference_fnv1a(std::string_view s) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

uint64_t reference_xxh3(std::string_view s) {
    return XXH3_64bits(s.data(), s.size());
}

shard_config fnv_small_xxh3_large() {
    return shard_config::create(
        {tier{{0, 16}, {algorithm::fnv1a}}, tier{{17, 1024}, {algorithm::xxh3}}},
        {algorithm::xxh3}).value();
}

} // namespace

// ===== SELECTION TESTS =====

TEST_CASE("select_algorithm returns the first available preference", "[engine][selection]") {
    const std::vector<algorithm> prefs{algorithm::avx512, algorithm::avx2,
                                       algorithm::aes_ni, algorithm::fnv1a,
                                       algorithm::xxh3};

    SECTION("Everything available") {
        REQUIRE(select_algorithm(prefs, capability_set::all()) == algorithm::avx512);
    }

    SECTION("Only AVX2") {
        REQUIRE(select_algorithm(prefs, capability_set{capability::avx2}) == algorithm::avx2);
    }

    SECTION("Only AES") {
        REQUIRE(select_algorithm(prefs, capability_set{capability::aes}) == algorithm::aes_ni);
    }

    SECTION("Nothing available falls through to the first software hash") {
        REQUIRE(select_algorithm(prefs, capability_set::none()) == algorithm::fnv1a);
    }

    SECTION("Software hash ahead of hardware hash wins regardless of hardware") {
        std::vector<algorithm> software_first{algorithm::xxh3, algorithm::avx512};
        REQUIRE(select_algorithm(software_first, capability_set::all()) == algorithm::xxh3);
    }
}

TEST_CASE("select_algorithm final fallback", "[engine][selection]") {
    const std::vector<algorithm> hardware_only{algorithm::avx512, algorithm::avx2,
                                               algorithm::aes_ni};

    REQUIRE(select_algorithm(hardware_only, capability_set::none()) == algorithm::xxh3);
    REQUIRE(select_algorithm(hardware_only, capability_set{capability::aes}) == algorithm::aes_ni);

    SECTION("An empty span also falls back") {
        REQUIRE(select_algorithm({}, capability_set::all()) == algorithm::xxh3);
    }
}

// ===== CONSTRUCTION TESTS =====

TEST_CASE("Zero shard count is rejected", "[engine][validation]") {
    SECTION("Default config") {
        auto engine = shard_engine::create(0);
        REQUIRE_FALSE(engine.has_value());
        REQUIRE(engine.error() == error::zero_shard_count);
    }

    SECTION("Custom config") {
        auto engine = shard_engine::create(0, fnv_small_xxh3_large(), capability_set::none());
        REQUIRE_FALSE(engine.has_value());
        REQUIRE(engine.error() == error::zero_shard_count);
    }
}

TEST_CASE("Engine construction keeps its inputs", "[engine]") {
    auto config = fnv_small_xxh3_large();
    auto engine = shard_engine::create(16, config, capability_set{capability::avx2});

    REQUIRE(engine.has_value());
    REQUIRE(engine->shards() == shard_count{16});
    REQUIRE(engine->config() == config);
    REQUIRE(engine->capabilities() == capability_set{capability::avx2});

    SECTION("Default engine uses the host capabilities and default tiers") {
        auto def = shard_engine::create(8);
        REQUIRE(def.has_value());
        REQUIRE(def->capabilities() == host_capabilities());
        REQUIRE(def->config() == shard_config::defaults());
    }
}

// ===== SHARDING TESTS =====

TEST_CASE("Tier boundaries route through the expected digest", "[engine][tiers]") {
    auto engine = shard_engine::create(16, fnv_small_xxh3_large(), capability_set::none()).value();

    SECTION("16 bytes uses FNV-1a") {
        std::string key = "abcdefghijklmnop";
        REQUIRE(key.size() == 16);
        REQUIRE(engine.select(key.size()) == algorithm::fnv1a);
        REQUIRE(engine.shard(key).value == reference_fnv1a(key) % 16);
    }

    SECTION("17 bytes uses XXH3") {
        std::string key = "abcdefghijklmnopq";
        REQUIRE(key.size() == 17);
        REQUIRE(engine.select(key.size()) == algorithm::xxh3);
        REQUIRE(engine.shard(key).value == reference_xxh3(key) % 16);
    }

    SECTION("2000 bytes is unmatched and uses the default XXH3") {
        std::string key(2000, 'z');
        REQUIRE(engine.explain(key).matched_tier == std::nullopt);
        REQUIRE(engine.shard(key).value == reference_xxh3(key) % 16);
    }

    SECTION("The two paths really differ for these keys") {
        std::string key = "abcdefghijklmnop";
        REQUIRE(reference_fnv1a(key) != reference_xxh3(key));
    }
}

TEST_CASE("Sixteen zero bytes through a single FNV tier", "[engine][scenario]") {
    auto config = shard_config::create(
        {tier{size_range::everything(), {algorithm::fnv1a}}},
        {algorithm::fnv1a}).value();
    auto engine = shard_engine::create(16, std::move(config)).value();

    std::string key(16, '\0');
    REQUIRE(engine.shard(key).value == reference_fnv1a(key) % 16);

    std::vector<std::byte> bytes(16, std::byte{0});
    REQUIRE(engine.shard(std::span<const std::byte>{bytes}).value == reference_fnv1a(key) % 16);
}

TEST_CASE("Default engine scenario", "[engine][scenario]") {
    auto engine = shard_engine::create(1024).value();
    std::string key = "small key";

    auto r = engine.explain(key);
    REQUIRE(r.key_size == 9);
    REQUIRE(r.matched_tier == 0u);
    REQUIRE(r.shard.value < 1024);
    REQUIRE(engine.shard(key) == r.shard);

    SECTION("Without hardware capabilities the small tier lands on FNV-1a") {
        auto bare = shard_engine::create(1024, shard_config::defaults(), capability_set::none()).value();
        REQUIRE(bare.select(key.size()) == algorithm::fnv1a);
        REQUIRE(bare.shard(key).value == reference_fnv1a(key) % 1024);
    }

    SECTION("With hardware capabilities the digest is XXH3") {
        auto full = shard_engine::create(1024, shard_config::defaults(), capability_set::all()).value();
        REQUIRE(full.select(key.size()) == algorithm::avx512);
        REQUIRE(full.shard(key).value == reference_xxh3(key) % 1024);
    }
}

TEST_CASE("Hardware-only preferences on bare hardware match XXH3", "[engine][fallback]") {
    auto config = shard_config::create(
        {tier{size_range::everything(), {algorithm::avx512, algorithm::avx2, algorithm::aes_ni}}},
        {algorithm::avx512, algorithm::avx2, algorithm::aes_ni}).value();
    auto engine = shard_engine::create(97, std::move(config), capability_set::none()).value();

    auto len = GENERATE(0, 1, 7, 16, 17, 100, 240, 241, 4096);
    std::string key(static_cast<size_t>(len), 'q');

    auto idx = engine.shard(key);
    REQUIRE(idx.value < 97);
    REQUIRE(idx.value == reference_xxh3(key) % 97);
}

TEST_CASE("Available hardware paths still produce the XXH3 result", "[engine][fallback]") {
    auto config = shard_config::single(algorithm::aes_ni);
    auto engine = shard_engine::create(64, std::move(config), capability_set{capability::aes}).value();

    std::string key = "substituted digest";
    auto r = engine.explain(key);

    REQUIRE(r.selected == algorithm::aes_ni);
    REQUIRE(r.digest_algorithm == algorithm::xxh3);
    REQUIRE(r.digest.value == reference_xxh3(key));
    REQUIRE(r.shard.value == reference_xxh3(key) % 64);
}

TEST_CASE("explain agrees with shard", "[engine][explain]") {
    auto engine = shard_engine::create(1000, shard_config::defaults(), capability_set::none()).value();

    auto len = GENERATE(0, 5, 16, 17, 300);
    std::string key(static_cast<size_t>(len), 'e');
    auto r = engine.explain(key);

    REQUIRE(r.key_size == key.size());
    REQUIRE(r.shard == engine.shard(key));
    REQUIRE(r.selected == engine.select(key.size()));
    REQUIRE(r.shard.value == r.digest.value % 1000);
    REQUIRE(r.matched_tier.has_value());
    REQUIRE(r.preferences == engine.config().tiers()[*r.matched_tier].algorithms);
}

TEST_CASE("Single shard maps everything to zero", "[engine][edge_cases]") {
    auto engine = shard_engine::create(1).value();

    REQUIRE(engine.shard("").value == 0);
    REQUIRE(engine.shard("anything").value == 0);
    REQUIRE(engine.shard(std::string(10000, 'x')).value == 0);
}

TEST_CASE("Empty key is a valid key", "[engine][edge_cases]") {
    auto engine = shard_engine::create(13, fnv_small_xxh3_large(), capability_set::none()).value();
    REQUIRE(engine.shard("").value == reference_fnv1a("") % 13);
}

TEST_CASE("Maximum shard count", "[engine][edge_cases]") {
    constexpr uint32_t max = std::numeric_limits<uint32_t>::max();
    auto engine = shard_engine::create(max, shard_config::single(algorithm::xxh3)).value();

    std::string key = "wide";
    REQUIRE(engine.shard(key).value == reference_xxh3(key) % max);
}
