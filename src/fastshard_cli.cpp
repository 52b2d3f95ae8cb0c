/**
 * @file fastshard_cli.cpp
 * @brief Command-line interface for fastshard
 *
 * Provides:
 * - Sharding keys from arguments or stdin
 * - Routing explanations (tier, preferences, selected algorithm, digest)
 * - Host capability and configuration inspection
 * - A quick throughput benchmark
 *
 * Usage: fastshard <command> [arguments] [options]
 */

#include <fastshard/fastshard.hpp>
#include <iostream>
#include <iomanip>
#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

using namespace fastshard;

// Exit codes for consistent error handling
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_ERROR_CODE = 1;
constexpr int EXIT_INVALID_ARGS = 2;
constexpr int EXIT_INVALID_CONFIG = 3;

/**
 * @brief Display usage information
 */
void usage() {
    std::cerr << R"(fastshard - tiered, capability-aware key sharding

COMMANDS:
    shard <count> [key...]          Print the shard index of each key
                                    (reads one key per line from stdin
                                    when no keys are given)
    explain <count> <key>           Show how a key is routed
    caps                            Show host hardware capabilities
    config                          Show the active tier configuration
    bench <count> [iterations]      Time sharding for several key sizes

OPTIONS:
    --tiers <text>                  Tier configuration, e.g.
                                    "0-16:fnv1a;17-*:xxh3|xxh3"
    --caps <a,b,...>                Force capabilities (avx512f,avx2,aes)
    --no-caps                       Force an empty capability set
    --                              Treat every later argument as a key

ALGORITHMS:
    avx512, avx2, aesni, fnv1a, xxh3

EXAMPLES:
    fastshard shard 1024 user:1 user:2
    fastshard explain 16 "small key" --no-caps
    fastshard shard 64 --tiers "0-64:fnv1a|xxh3" < keys.txt
)";
}

struct cli_options {
    std::vector<std::string> positional;
    std::optional<std::string> tiers;
    std::optional<capability_set> caps;
};

/**
 * @brief Split argv into positional arguments and options
 */
result<cli_options> parse_options(int argc, char* argv[]) {
    cli_options opts;
    bool keys_only = false;
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (keys_only) {
            opts.positional.emplace_back(arg);
        } else if (arg == "--") {
            keys_only = true;
        } else if (arg == "--tiers") {
            if (i + 1 >= argc) return std::unexpected(error::invalid_format);
            opts.tiers = argv[++i];
        } else if (arg == "--caps") {
            if (i + 1 >= argc) return std::unexpected(error::invalid_format);
            auto names = detail::split(argv[++i], ',');
            std::vector<std::string_view> trimmed;
            for (auto n : names) {
                if (!detail::trim(n).empty()) trimmed.push_back(detail::trim(n));
            }
            auto set = capability_set::from_names(trimmed);
            if (!set) return std::unexpected(set.error());
            opts.caps = *set;
        } else if (arg == "--no-caps") {
            opts.caps = capability_set::none();
        } else {
            opts.positional.emplace_back(arg);
        }
    }
    return opts;
}

/**
 * @brief Parse a whole argument as an unsigned decimal
 *
 * Signs, trailing characters and out-of-range values are rejected.
 */
template<typename T>
result<T> parse_unsigned(const std::string& text) {
    T n = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(error::invalid_format);
    }
    return n;
}

result<uint32_t> parse_count(const std::string& text) {
    auto n = parse_unsigned<uint32_t>(text);
    if (n && *n == 0) {
        return std::unexpected(error::zero_shard_count);
    }
    return n;
}

result<shard_config> load_config(const cli_options& opts) {
    if (opts.tiers) {
        return parse_config(*opts.tiers);
    }
    return shard_config::defaults();
}

void print_routing(const routing& r, std::string_view key) {
    std::cout << "Key:         " << key << "\n";
    std::cout << "Length:      " << r.key_size << " bytes\n";
    if (r.matched_tier) {
        std::cout << "Tier:        #" << *r.matched_tier << "\n";
    } else {
        std::cout << "Tier:        (default list)\n";
    }
    std::cout << "Preferences: " << format_algorithms(r.preferences) << "\n";
    std::cout << "Selected:    " << to_string(r.selected) << "\n";
    std::cout << "Digest via:  " << to_string(r.digest_algorithm);
    if (r.digest_algorithm != r.selected) {
        std::cout << " (no native " << to_string(r.selected) << " path)";
    }
    std::cout << "\n";
    std::cout << "Digest:      0x" << std::hex << std::setw(16) << std::setfill('0')
              << r.digest.value << std::dec << std::setfill(' ') << "\n";
    std::cout << "Shard:       " << r.shard.value << "\n";
}

int run_bench(const shard_engine& engine, size_t iterations) {
    const std::vector<size_t> sizes{4, 8, 16, 32, 256, 1024, 4096};

    std::cout << "Capabilities: " << engine.capabilities().to_string() << "\n";
    std::cout << std::left << std::setw(10) << "Size"
              << std::setw(10) << "Algo"
              << std::setw(14) << "ns/op"
              << "MB/s\n";

    for (auto size : sizes) {
        std::string key(size, '\xAA');
        volatile uint32_t sink = 0;

        auto start = std::chrono::high_resolution_clock::now();
        for (size_t i = 0; i < iterations; ++i) {
            key[0] = static_cast<char>(i);
            sink = sink + engine.shard(key).value;
        }
        auto end = std::chrono::high_resolution_clock::now();

        double ns = std::chrono::duration<double, std::nano>(end - start).count();
        double ns_per_op = ns / static_cast<double>(iterations);
        double mb_per_s = (static_cast<double>(size) * iterations) / (ns / 1e9) / (1024.0 * 1024.0);

        std::cout << std::left << std::setw(10) << size
                  << std::setw(10) << to_string(engine.select(size))
                  << std::setw(14) << std::fixed << std::setprecision(2) << ns_per_op
                  << mb_per_s << "\n";
    }
    return EXIT_SUCCESS_CODE;
}

/**
 * @brief Main entry point for the fastshard CLI
 *
 * @return Exit code (0 for success, non-zero for error conditions)
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage();
        return EXIT_INVALID_ARGS;
    }

    std::string cmd = argv[1];

    if (cmd == "--help" || cmd == "-h") {
        usage();
        return EXIT_SUCCESS_CODE;
    }

    auto opts = parse_options(argc, argv);
    if (!opts) {
        std::cerr << "Error: " << error_message(opts.error()) << "\n";
        return EXIT_INVALID_ARGS;
    }

    auto config = load_config(*opts);
    if (!config) {
        std::cerr << "Error: invalid --tiers: " << error_message(config.error()) << "\n";
        return EXIT_INVALID_CONFIG;
    }

    auto caps = opts->caps.value_or(host_capabilities());
    const auto& args = opts->positional;

    /**
     * CAPS command - Show detected hardware features
     */
    if (cmd == "caps") {
        auto host = host_capabilities();
        std::cout << "Host capabilities: " << host.to_string() << "\n";
        for (auto a : all_algorithms) {
            std::cout << "  " << std::left << std::setw(8) << to_string(a)
                      << (host.supports(a) ? "available" : "unavailable")
                      << (has_native_path(a) ? "" : " (digest via xxh3)") << "\n";
        }
        return EXIT_SUCCESS_CODE;
    }

    /**
     * CONFIG command - Show the tier configuration in text form
     */
    if (cmd == "config") {
        std::cout << format_config(*config) << "\n";
        return EXIT_SUCCESS_CODE;
    }

    if (args.empty()) {
        usage();
        return EXIT_INVALID_ARGS;
    }

    auto count = parse_count(args[0]);
    if (!count) {
        std::cerr << "Error: shard count: " << error_message(count.error()) << "\n";
        return EXIT_INVALID_ARGS;
    }

    auto engine = shard_engine::create(*count, std::move(*config), caps);
    if (!engine) {
        std::cerr << "Error: " << error_message(engine.error()) << "\n";
        return EXIT_ERROR_CODE;
    }

    /**
     * SHARD command - Print shard index per key
     */
    if (cmd == "shard") {
        if (args.size() > 1) {
            for (size_t i = 1; i < args.size(); ++i) {
                std::cout << engine->shard(args[i]).value << "\n";
            }
            return EXIT_SUCCESS_CODE;
        }

        std::string line;
        while (std::getline(std::cin, line)) {
            std::cout << engine->shard(line).value << "\n";
        }
        return EXIT_SUCCESS_CODE;
    }

    /**
     * EXPLAIN command - Show routing decisions for one key
     */
    if (cmd == "explain" && args.size() == 2) {
        print_routing(engine->explain(args[1]), args[1]);
        return EXIT_SUCCESS_CODE;
    }

    /**
     * BENCH command - Quick throughput numbers
     */
    if (cmd == "bench") {
        size_t iterations = 1'000'000;
        if (args.size() > 1) {
            auto parsed = parse_unsigned<size_t>(args[1]);
            if (!parsed) {
                std::cerr << "Error: iterations: " << error_message(parsed.error()) << "\n";
                return EXIT_INVALID_ARGS;
            }
            if (*parsed == 0) {
                std::cerr << "Error: iterations must be greater than 0\n";
                return EXIT_INVALID_ARGS;
            }
            iterations = *parsed;
        }
        return run_bench(*engine, iterations);
    }

    usage();
    return EXIT_INVALID_ARGS;
}
