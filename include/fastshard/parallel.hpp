/**
 * @file parallel.hpp
 * @brief Bulk sharding, parallelized with OpenMP when available
 *
 * Compile with -fopenmp and define FASTSHARD_HAS_OPENMP to enable the
 * parallel loops; otherwise the same functions run sequentially.
 */

#pragma once

#include "engine.hpp"
#include <vector>
#include <string>

#ifdef FASTSHARD_HAS_OPENMP
#include <omp.h>
#endif

namespace fastshard {

/**
 * @brief Shard every key; element i equals engine.shard(keys[i])
 */
template<typename Key>
[[nodiscard]] std::vector<shard_index> shard_batch(const shard_engine& engine,
                                                   const std::vector<Key>& keys) {
    std::vector<shard_index> out(keys.size(), shard_index{0});
    const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(keys.size());

#ifdef FASTSHARD_HAS_OPENMP
    #pragma omp parallel for schedule(static, 256)
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        out[i] = engine.shard(std::string_view{keys[i]});
    }
#else
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        out[i] = engine.shard(std::string_view{keys[i]});
    }
#endif

    return out;
}

/**
 * @brief Number of keys landing on each shard
 */
template<typename Key>
[[nodiscard]] std::vector<size_t> shard_histogram(const shard_engine& engine,
                                                  const std::vector<Key>& keys) {
    std::vector<size_t> counts(engine.shards().value, 0);
    for (auto idx : shard_batch(engine, keys)) {
        ++counts[idx.value];
    }
    return counts;
}

/**
 * @brief Threads the parallel paths will use
 */
[[nodiscard]] inline int batch_threads() noexcept {
#ifdef FASTSHARD_HAS_OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

} // namespace fastshard
