/**
 * @file fastshard.hpp
 * @brief Main header for fastshard - tiered, capability-aware key sharding
 *
 * Typical use:
 *
 *   auto engine = fastshard::shard_engine::create(1024);
 *   if (engine) {
 *       auto idx = engine->shard("user:42");
 *   }
 */

#pragma once

#include "core.hpp"
#include "capabilities.hpp"
#include "hashers.hpp"
#include "tiers.hpp"
#include "engine.hpp"
#include "config_format.hpp"
#include "parallel.hpp"
