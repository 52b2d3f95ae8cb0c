/**
 * @file hashers.hpp
 * @brief Digest primitives and per-algorithm dispatch
 */

#pragma once

#include "core.hpp"
#include <xxhash.h>

namespace fastshard {

// ===== STANDARD HASH FUNCTIONS =====

/**
 * @class fnv1a_hasher
 * @brief 64-bit FNV-1a over the raw key bytes
 *
 * Byte-at-a-time and branch free, which keeps it competitive for short keys.
 */
class fnv1a_hasher {
public:
    static constexpr uint64_t offset_basis = 14695981039346656037ULL;
    static constexpr uint64_t prime = 1099511628211ULL;

    [[nodiscard]] constexpr hash_value hash(std::span<const std::byte> key) const noexcept {
        uint64_t h = offset_basis;
        for (std::byte b : key) {
            h ^= static_cast<uint64_t>(b);
            h *= prime;
        }
        return hash_value{h};
    }

    [[nodiscard]] hash_value hash(std::string_view key) const noexcept {
        return hash(as_bytes(key));
    }
};

/**
 * @class xxh3_hasher
 * @brief XXH3 64-bit, seedless
 */
class xxh3_hasher {
public:
    [[nodiscard]] hash_value hash(std::span<const std::byte> key) const noexcept {
        return hash_value{static_cast<uint64_t>(XXH3_64bits(key.data(), key.size()))};
    }

    [[nodiscard]] hash_value hash(std::string_view key) const noexcept {
        return hash(as_bytes(key));
    }
};

// ===== ACCELERATED PATHS =====

/**
 * @brief Whether an algorithm has a dedicated digest implementation
 *
 * The SIMD and AES-NI variants currently route to the XXH3 digest. Selection
 * still honours them so that enabling a native path later does not change
 * how configurations are written.
 */
[[nodiscard]] constexpr bool has_native_path(algorithm a) noexcept {
    switch (a) {
        case algorithm::fnv1a:
        case algorithm::xxh3:
            return true;
        case algorithm::avx512:
        case algorithm::avx2:
        case algorithm::aes_ni:
            return false;
    }
    return false;
}

/**
 * @brief The algorithm whose digest is actually computed for `a`
 */
[[nodiscard]] constexpr algorithm digest_algorithm(algorithm a) noexcept {
    return has_native_path(a) ? a : final_fallback;
}

/**
 * @class accelerated_hasher
 * @brief Hardware-gated variant; substitutes the XXH3 digest
 */
template<algorithm A>
class accelerated_hasher {
    static_assert(A == algorithm::avx512 || A == algorithm::avx2 || A == algorithm::aes_ni,
                  "accelerated_hasher is only defined for hardware-gated algorithms");

    xxh3_hasher fallback_;

public:
    static constexpr algorithm tag = A;

    [[nodiscard]] hash_value hash(std::span<const std::byte> key) const noexcept {
        return fallback_.hash(key);
    }
};

using avx512_hasher = accelerated_hasher<algorithm::avx512>;
using avx2_hasher = accelerated_hasher<algorithm::avx2>;
using aesni_hasher = accelerated_hasher<algorithm::aes_ni>;

static_assert(digest_function<fnv1a_hasher>);
static_assert(digest_function<xxh3_hasher>);
static_assert(digest_function<avx2_hasher>);

// ===== DISPATCH =====

/**
 * @brief Compute the digest of `key` with algorithm `a`
 *
 * Does not consult capabilities; callers select an available algorithm first.
 */
[[nodiscard]] inline hash_value digest(algorithm a, std::span<const std::byte> key) noexcept {
    switch (a) {
        case algorithm::avx512: return avx512_hasher{}.hash(key);
        case algorithm::avx2: return avx2_hasher{}.hash(key);
        case algorithm::aes_ni: return aesni_hasher{}.hash(key);
        case algorithm::fnv1a: return fnv1a_hasher{}.hash(key);
        case algorithm::xxh3: return xxh3_hasher{}.hash(key);
    }
    return xxh3_hasher{}.hash(key);
}

[[nodiscard]] inline hash_value digest(algorithm a, std::string_view key) noexcept {
    return digest(a, as_bytes(key));
}

} // namespace fastshard
