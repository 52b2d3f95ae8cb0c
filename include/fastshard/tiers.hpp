/**
 * @file tiers.hpp
 * @brief Key-size tiers and their resolution to algorithm preferences
 */

#pragma once

#include "core.hpp"
#include <limits>
#include <vector>
#include <utility>

namespace fastshard {

/**
 * @struct size_range
 * @brief Inclusive bounds on key length
 *
 * The upper bound is inclusive as well, so a range ending at
 * unbounded_upper covers every representable length.
 */
struct size_range {
    static constexpr size_t unbounded_upper = std::numeric_limits<size_t>::max();

    size_t lower{0};
    size_t upper{unbounded_upper};

    [[nodiscard]] static constexpr size_range at_least(size_t lo) noexcept {
        return {lo, unbounded_upper};
    }

    [[nodiscard]] static constexpr size_range everything() noexcept {
        return {0, unbounded_upper};
    }

    [[nodiscard]] constexpr bool contains(size_t size) const noexcept {
        return size >= lower && size <= upper;
    }

    [[nodiscard]] constexpr bool is_unbounded() const noexcept {
        return upper == unbounded_upper;
    }

    [[nodiscard]] constexpr bool valid() const noexcept {
        return lower <= upper;
    }

    constexpr bool operator==(const size_range&) const noexcept = default;
};

/**
 * @struct tier
 * @brief A size range with its algorithm preferences, most preferred first
 */
struct tier {
    size_range range;
    std::vector<algorithm> algorithms;

    bool operator==(const tier&) const = default;
};

/**
 * @class shard_config
 * @brief Validated, immutable tier configuration
 *
 * Tiers are matched in insertion order; the first tier whose range contains
 * the key length wins, even when a later tier is narrower.
 */
class shard_config {
    std::vector<tier> tiers_;
    std::vector<algorithm> default_algorithms_;

    shard_config(std::vector<tier> tiers, std::vector<algorithm> defaults) noexcept
        : tiers_(std::move(tiers)), default_algorithms_(std::move(defaults)) {}

public:
    /**
     * @brief Check tiers and defaults without building a configuration
     * @return error::empty_algorithm_list if any preference list is empty,
     *         error::invalid_range if any tier has lower > upper
     */
    [[nodiscard]] static status validate(std::span<const tier> tiers,
                                         std::span<const algorithm> default_algorithms) noexcept {
        if (default_algorithms.empty()) {
            return std::unexpected(error::empty_algorithm_list);
        }
        for (const auto& t : tiers) {
            if (t.algorithms.empty()) {
                return std::unexpected(error::empty_algorithm_list);
            }
            if (!t.range.valid()) {
                return std::unexpected(error::invalid_range);
            }
        }
        return {};
    }

    /**
     * @brief Validate and build a configuration
     */
    [[nodiscard]] static result<shard_config> create(std::vector<tier> tiers,
                                                     std::vector<algorithm> default_algorithms) {
        if (auto ok = validate(tiers, default_algorithms); !ok) {
            return std::unexpected(ok.error());
        }
        return shard_config{std::move(tiers), std::move(default_algorithms)};
    }

    /**
     * @brief Built-in configuration
     *
     * Short keys (0..16 bytes) prefer FNV-1a over XXH3 once the hardware
     * variants are exhausted; longer keys prefer XXH3.
     */
    [[nodiscard]] static shard_config defaults() {
        std::vector<tier> tiers{
            tier{size_range{0, 16},
                 {algorithm::avx512, algorithm::avx2, algorithm::aes_ni,
                  algorithm::fnv1a, algorithm::xxh3}},
            tier{size_range::at_least(17),
                 {algorithm::avx512, algorithm::avx2, algorithm::aes_ni,
                  algorithm::xxh3, algorithm::fnv1a}}
        };
        return shard_config{std::move(tiers), {algorithm::xxh3}};
    }

    /**
     * @brief One tier covering every length, used for single-algorithm runs
     */
    [[nodiscard]] static shard_config single(algorithm a) {
        return shard_config{{tier{size_range::everything(), {a}}}, {a}};
    }

    [[nodiscard]] const std::vector<tier>& tiers() const noexcept { return tiers_; }

    [[nodiscard]] const std::vector<algorithm>& default_algorithms() const noexcept {
        return default_algorithms_;
    }

    bool operator==(const shard_config&) const = default;
};

/**
 * @class tier_resolver
 * @brief Maps a key length to its preference list
 *
 * Non-owning view over a shard_config; the config must outlive it.
 */
class tier_resolver {
    const shard_config* config_;

public:
    explicit tier_resolver(const shard_config& config) noexcept : config_(&config) {}
    tier_resolver(const shard_config&&) = delete;

    /**
     * @brief Index of the first tier containing `size`, if any
     */
    [[nodiscard]] std::optional<size_t> resolve_tier(size_t size) const noexcept {
        const auto& tiers = config_->tiers();
        for (size_t i = 0; i < tiers.size(); ++i) {
            if (tiers[i].range.contains(size)) {
                return i;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Preference list for `size`; the default list when no tier matches
     */
    [[nodiscard]] std::span<const algorithm> resolve(size_t size) const noexcept {
        if (auto idx = resolve_tier(size)) {
            return config_->tiers()[*idx].algorithms;
        }
        return config_->default_algorithms();
    }
};

} // namespace fastshard
