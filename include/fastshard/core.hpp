/**
 * @file core.hpp
 * @brief Core types and concepts for fastshard
 *
 * Strong types, error handling and the algorithm tag shared by every
 * other component.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <concepts>
#include <array>

namespace fastshard {

// ===== STRONG TYPES =====
// Avoid primitive obsession - each concept gets its own type

struct shard_index {
    uint32_t value;
    explicit constexpr shard_index(uint32_t v) noexcept : value(v) {}
    constexpr operator uint32_t() const noexcept { return value; }
    constexpr bool operator==(const shard_index&) const noexcept = default;
};

struct shard_count {
    uint32_t value;
    explicit constexpr shard_count(uint32_t v) noexcept : value(v) {}
    constexpr bool operator==(const shard_count&) const noexcept = default;
};

struct hash_value {
    uint64_t value;
    explicit constexpr hash_value(uint64_t v) noexcept : value(v) {}
    constexpr bool operator==(const hash_value&) const noexcept = default;
};

// ===== ERROR HANDLING =====

enum class error {
    success = 0,
    zero_shard_count,
    empty_algorithm_list,
    invalid_range,
    invalid_format,
    unknown_algorithm,
    unknown_capability
};

template<typename T>
using result = std::expected<T, error>;

using status = std::expected<void, error>;

[[nodiscard]] constexpr std::string_view error_message(error e) noexcept {
    switch (e) {
        case error::success: return "success";
        case error::zero_shard_count: return "shard count must be greater than zero";
        case error::empty_algorithm_list: return "algorithm preference list is empty";
        case error::invalid_range: return "size range lower bound exceeds upper bound";
        case error::invalid_format: return "malformed configuration text";
        case error::unknown_algorithm: return "unknown algorithm name";
        case error::unknown_capability: return "unknown capability name";
    }
    return "unknown error";
}

// ===== ALGORITHMS =====

/**
 * @brief Hashing strategy tag
 *
 * avx512, avx2 and aes_ni are gated on a hardware capability; fnv1a and
 * xxh3 run everywhere.
 */
enum class algorithm : uint8_t {
    avx512,
    avx2,
    aes_ni,
    fnv1a,
    xxh3
};

inline constexpr std::array<algorithm, 5> all_algorithms{
    algorithm::avx512, algorithm::avx2, algorithm::aes_ni,
    algorithm::fnv1a, algorithm::xxh3
};

// Used when a preference list contains nothing the platform can run
inline constexpr algorithm final_fallback = algorithm::xxh3;

[[nodiscard]] constexpr std::string_view to_string(algorithm a) noexcept {
    switch (a) {
        case algorithm::avx512: return "avx512";
        case algorithm::avx2: return "avx2";
        case algorithm::aes_ni: return "aesni";
        case algorithm::fnv1a: return "fnv1a";
        case algorithm::xxh3: return "xxh3";
    }
    return "unknown";
}

namespace detail {

[[nodiscard]] constexpr bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i], y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

} // namespace detail

/**
 * @brief Parse an algorithm name (case-insensitive)
 *
 * Accepts the canonical names plus "aes-ni"/"aes_ni" spellings.
 */
[[nodiscard]] constexpr result<algorithm> parse_algorithm(std::string_view name) noexcept {
    for (auto a : all_algorithms) {
        if (detail::iequals(name, to_string(a))) return a;
    }
    if (detail::iequals(name, "aes-ni") || detail::iequals(name, "aes_ni")) {
        return algorithm::aes_ni;
    }
    return std::unexpected(error::unknown_algorithm);
}

// ===== KEY VIEWS =====

[[nodiscard]] inline std::span<const std::byte> as_bytes(std::string_view sv) noexcept {
    return {reinterpret_cast<const std::byte*>(sv.data()), sv.size()};
}

// ===== CONCEPTS =====

/**
 * @concept digest_function
 * @brief Anything that turns a byte span into a 64-bit digest
 */
template<typename H>
concept digest_function = requires(const H h, std::span<const std::byte> bytes) {
    { h.hash(bytes) } -> std::convertible_to<hash_value>;
};

} // namespace fastshard
