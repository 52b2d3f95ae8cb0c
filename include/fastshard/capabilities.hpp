/**
 * @file capabilities.hpp
 * @brief Hardware capability sets - what the platform can actually run
 *
 * Selection never reads CPU flags directly. It is handed a capability_set,
 * which is either detected from the host or built by hand (tests, forced
 * configurations from the command line).
 */

#pragma once

#include "core.hpp"
#include <initializer_list>
#include <string>

namespace fastshard {

enum class capability : uint8_t {
    avx512f,
    avx2,
    aes
};

inline constexpr std::array<capability, 3> all_capabilities{
    capability::avx512f, capability::avx2, capability::aes
};

[[nodiscard]] constexpr std::string_view to_string(capability c) noexcept {
    switch (c) {
        case capability::avx512f: return "avx512f";
        case capability::avx2: return "avx2";
        case capability::aes: return "aes";
    }
    return "unknown";
}

[[nodiscard]] constexpr result<capability> parse_capability(std::string_view name) noexcept {
    for (auto c : all_capabilities) {
        if (detail::iequals(name, to_string(c))) return c;
    }
    return std::unexpected(error::unknown_capability);
}

/**
 * @brief Capability an algorithm needs, if any
 */
[[nodiscard]] constexpr std::optional<capability> required_capability(algorithm a) noexcept {
    switch (a) {
        case algorithm::avx512: return capability::avx512f;
        case algorithm::avx2: return capability::avx2;
        case algorithm::aes_ni: return capability::aes;
        case algorithm::fnv1a:
        case algorithm::xxh3:
            return std::nullopt;
    }
    return std::nullopt;
}

/**
 * @class capability_set
 * @brief Immutable set of available hardware features
 */
class capability_set {
    uint8_t bits_{0};

    static constexpr uint8_t bit(capability c) noexcept {
        return static_cast<uint8_t>(1u << static_cast<uint8_t>(c));
    }

    explicit constexpr capability_set(uint8_t bits) noexcept : bits_(bits) {}

public:
    constexpr capability_set() noexcept = default;

    constexpr capability_set(std::initializer_list<capability> caps) noexcept {
        for (auto c : caps) bits_ |= bit(c);
    }

    [[nodiscard]] static constexpr capability_set none() noexcept {
        return capability_set{};
    }

    [[nodiscard]] static constexpr capability_set all() noexcept {
        return {capability::avx512f, capability::avx2, capability::aes};
    }

    /**
     * @brief Build a set from feature names
     * @return error::unknown_capability on the first unrecognized name
     */
    template<typename Range>
    [[nodiscard]] static result<capability_set> from_names(const Range& names) {
        capability_set set;
        for (const auto& name : names) {
            auto c = parse_capability(name);
            if (!c) return std::unexpected(c.error());
            set.bits_ |= bit(*c);
        }
        return set;
    }

    [[nodiscard]] constexpr bool has(capability c) const noexcept {
        return (bits_ & bit(c)) != 0;
    }

    // Unknown names are never available
    [[nodiscard]] constexpr bool has(std::string_view name) const noexcept {
        auto c = parse_capability(name);
        return c && has(*c);
    }

    [[nodiscard]] constexpr bool supports(algorithm a) const noexcept {
        auto needed = required_capability(a);
        return !needed || has(*needed);
    }

    [[nodiscard]] constexpr capability_set with(capability c) const noexcept {
        return capability_set{static_cast<uint8_t>(bits_ | bit(c))};
    }

    [[nodiscard]] constexpr capability_set without(capability c) const noexcept {
        return capability_set{static_cast<uint8_t>(bits_ & ~bit(c))};
    }

    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

    constexpr bool operator==(const capability_set&) const noexcept = default;

    [[nodiscard]] std::string to_string() const {
        std::string out;
        for (auto c : all_capabilities) {
            if (!has(c)) continue;
            if (!out.empty()) out += ',';
            out += fastshard::to_string(c);
        }
        return out.empty() ? std::string{"none"} : out;
    }
};

// ===== HOST DETECTION =====

namespace detail {

inline capability_set detect_host_capabilities() noexcept {
    capability_set caps;
#if (defined(__x86_64__) || defined(__i386__)) && (defined(__GNUC__) || defined(__clang__))
    __builtin_cpu_init();
    if (__builtin_cpu_supports("avx512f")) caps = caps.with(capability::avx512f);
    if (__builtin_cpu_supports("avx2")) caps = caps.with(capability::avx2);
    if (__builtin_cpu_supports("aes")) caps = caps.with(capability::aes);
#endif
    return caps;
}

} // namespace detail

/**
 * @brief Capabilities of the running CPU
 *
 * Detected once per process; hardware features cannot change at runtime.
 */
[[nodiscard]] inline capability_set host_capabilities() noexcept {
    static const capability_set caps = detail::detect_host_capabilities();
    return caps;
}

} // namespace fastshard
