/**
 * @file config_format.hpp
 * @brief One-line text form of a shard_config
 *
 * Grammar:
 *   config  := tier (';' tier)* ('|' list)?
 *   tier    := lower '-' upper ':' list
 *   upper   := integer | '*' | "max"
 *   list    := name (',' name)*
 *
 * Example: "0-16:avx512,avx2,aesni,fnv1a,xxh3;17-*:xxh3,fnv1a|xxh3"
 * The default list is "xxh3" when omitted. Whitespace around tokens is
 * ignored.
 */

#pragma once

#include "core.hpp"
#include "tiers.hpp"
#include <charconv>
#include <string>
#include <vector>

namespace fastshard {

namespace detail {

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

[[nodiscard]] inline std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

[[nodiscard]] inline result<size_t> parse_size(std::string_view s) noexcept {
    s = trim(s);
    if (s == "*" || s == "max") return size_range::unbounded_upper;
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::unexpected(error::invalid_format);
    }
    return value;
}

[[nodiscard]] inline result<std::vector<algorithm>> parse_algorithm_list(std::string_view s) {
    std::vector<algorithm> algorithms;
    s = trim(s);
    if (s.empty()) {
        return std::unexpected(error::empty_algorithm_list);
    }
    for (auto name : split(s, ',')) {
        auto a = parse_algorithm(trim(name));
        if (!a) return std::unexpected(a.error());
        algorithms.push_back(*a);
    }
    return algorithms;
}

[[nodiscard]] inline result<tier> parse_tier(std::string_view s) {
    auto colon = s.find(':');
    if (colon == std::string_view::npos) {
        return std::unexpected(error::invalid_format);
    }

    auto bounds = trim(s.substr(0, colon));
    auto dash = bounds.find('-');
    if (dash == std::string_view::npos) {
        return std::unexpected(error::invalid_format);
    }

    // '*' is only meaningful as an upper bound
    auto lower_text = trim(bounds.substr(0, dash));
    if (lower_text == "*" || lower_text == "max") {
        return std::unexpected(error::invalid_format);
    }
    auto lower = parse_size(lower_text);
    if (!lower) return std::unexpected(lower.error());
    auto upper = parse_size(bounds.substr(dash + 1));
    if (!upper) return std::unexpected(upper.error());

    auto algorithms = parse_algorithm_list(s.substr(colon + 1));
    if (!algorithms) return std::unexpected(algorithms.error());

    return tier{size_range{*lower, *upper}, std::move(*algorithms)};
}

} // namespace detail

/**
 * @brief Parse the text form into a validated configuration
 * @return error::invalid_format on syntax errors, error::unknown_algorithm on
 *         unrecognized names, plus anything shard_config::create rejects
 */
[[nodiscard]] inline result<shard_config> parse_config(std::string_view text) {
    std::string_view tiers_part = text;
    std::vector<algorithm> defaults{algorithm::xxh3};

    if (auto bar = text.find('|'); bar != std::string_view::npos) {
        tiers_part = text.substr(0, bar);
        auto parsed = detail::parse_algorithm_list(text.substr(bar + 1));
        if (!parsed) return std::unexpected(parsed.error());
        defaults = std::move(*parsed);
    }

    std::vector<tier> tiers;
    if (!detail::trim(tiers_part).empty()) {
        for (auto part : detail::split(tiers_part, ';')) {
            if (detail::trim(part).empty()) {
                return std::unexpected(error::invalid_format);
            }
            auto t = detail::parse_tier(part);
            if (!t) return std::unexpected(t.error());
            tiers.push_back(std::move(*t));
        }
    }

    return shard_config::create(std::move(tiers), std::move(defaults));
}

[[nodiscard]] inline std::string format_algorithms(std::span<const algorithm> algorithms) {
    std::string out;
    for (auto a : algorithms) {
        if (!out.empty()) out += ',';
        out += to_string(a);
    }
    return out;
}

/**
 * @brief Text form of a configuration; parse_config(format_config(c)) == c
 */
[[nodiscard]] inline std::string format_config(const shard_config& config) {
    std::string out;
    for (const auto& t : config.tiers()) {
        if (!out.empty()) out += ';';
        out += std::to_string(t.range.lower);
        out += '-';
        out += t.range.is_unbounded() ? std::string{"*"} : std::to_string(t.range.upper);
        out += ':';
        out += format_algorithms(t.algorithms);
    }
    out += '|';
    out += format_algorithms(config.default_algorithms());
    return out;
}

} // namespace fastshard
