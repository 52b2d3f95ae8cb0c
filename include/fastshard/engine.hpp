/**
 * @file engine.hpp
 * @brief The shard engine - composes tier resolution, selection and hashing
 */

#pragma once

#include "core.hpp"
#include "capabilities.hpp"
#include "hashers.hpp"
#include "tiers.hpp"
#include <vector>

namespace fastshard {

// ===== SELECTION =====

/**
 * @brief First preference the capability set can run
 *
 * fnv1a and xxh3 are always runnable, so they act as natural fallbacks when
 * present. A list of only unavailable hardware variants yields final_fallback.
 */
[[nodiscard]] constexpr algorithm select_algorithm(std::span<const algorithm> preferences,
                                                   const capability_set& caps) noexcept {
    for (auto a : preferences) {
        if (caps.supports(a)) {
            return a;
        }
    }
    return final_fallback;
}

/**
 * @struct routing
 * @brief Every decision taken for one key, for diagnostics
 */
struct routing {
    size_t key_size;
    std::optional<size_t> matched_tier;   // nullopt: default list applied
    std::vector<algorithm> preferences;
    algorithm selected;
    algorithm digest_algorithm;           // differs from selected on substitution
    hash_value digest;
    shard_index shard;
};

/**
 * @class shard_engine
 * @brief Deterministic key to shard mapping
 *
 * Immutable after construction; one instance can be shared by any number
 * of threads without synchronization.
 */
class shard_engine {
    shard_count shards_;
    shard_config config_;
    capability_set caps_;

    shard_engine(shard_count n, shard_config config, capability_set caps) noexcept
        : shards_(n), config_(std::move(config)), caps_(caps) {}

    [[nodiscard]] shard_index reduce(hash_value h) const noexcept {
        return shard_index{static_cast<uint32_t>(h.value % shards_.value)};
    }

public:
    /**
     * @brief Engine with the built-in tiers and the host's capabilities
     * @return error::zero_shard_count when n is zero
     */
    [[nodiscard]] static result<shard_engine> create(uint32_t n) {
        return create(n, shard_config::defaults());
    }

    /**
     * @brief Engine with a custom configuration
     *
     * `caps` defaults to the detected host capabilities; pass an explicit
     * set to pin selection regardless of the machine.
     */
    [[nodiscard]] static result<shard_engine> create(uint32_t n, shard_config config,
                                                     capability_set caps = host_capabilities()) {
        if (n == 0) {
            return std::unexpected(error::zero_shard_count);
        }
        return shard_engine{shard_count{n}, std::move(config), caps};
    }

    // ===== CORE OPERATIONS =====

    /**
     * @brief Algorithm used for keys of the given length
     */
    [[nodiscard]] algorithm select(size_t key_size) const noexcept {
        return select_algorithm(tier_resolver{config_}.resolve(key_size), caps_);
    }

    [[nodiscard]] shard_index shard(std::span<const std::byte> key) const noexcept {
        return reduce(digest(select(key.size()), key));
    }

    [[nodiscard]] shard_index shard(std::string_view key) const noexcept {
        return shard(as_bytes(key));
    }

    /**
     * @brief Shard a key and report how the decision was made
     */
    [[nodiscard]] routing explain(std::span<const std::byte> key) const {
        tier_resolver resolver{config_};
        auto prefs = resolver.resolve(key.size());
        auto chosen = select_algorithm(prefs, caps_);
        auto h = digest(chosen, key);

        return routing{
            key.size(),
            resolver.resolve_tier(key.size()),
            std::vector<algorithm>(prefs.begin(), prefs.end()),
            chosen,
            digest_algorithm(chosen),
            h,
            reduce(h)
        };
    }

    [[nodiscard]] routing explain(std::string_view key) const {
        return explain(as_bytes(key));
    }

    // ===== ACCESSORS =====

    [[nodiscard]] shard_count shards() const noexcept { return shards_; }
    [[nodiscard]] const shard_config& config() const noexcept { return config_; }
    [[nodiscard]] const capability_set& capabilities() const noexcept { return caps_; }
};

} // namespace fastshard
