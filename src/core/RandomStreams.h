#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <string_view>

namespace EvoSim::RandomStreams {

constexpr uint32_t FNV_OFFSET_BASIS = 2166136261u;
constexpr uint32_t FNV_PRIME = 16777619u;

uint32_t fnv1a(const void* data, size_t length, uint32_t basis = FNV_OFFSET_BASIS);
uint32_t fnv1a(std::string_view tag, uint32_t basis = FNV_OFFSET_BASIS);

/**
 * @brief Derive a 32-bit seed from a base seed, a tag and a list of integer keys.
 * Identical inputs always give the same seed; the tag separates unrelated streams.
 */
uint32_t deriveSeed(uint32_t baseSeed, std::string_view tag, std::initializer_list<uint64_t> keys);

/**
 * @brief Independent generator for a keyed purpose, e.g. ("offspring", tick, idA, idB).
 */
std::mt19937 keyedStream(
    uint32_t baseSeed, std::string_view tag, std::initializer_list<uint64_t> keys);

// Uniform draw in [0, 1).
double unit(std::mt19937& rng);

// Uniform draw in [lo, hi).
double range(std::mt19937& rng, double lo, double hi);

// Uniform integer in [0, count); count must be > 0.
size_t index(std::mt19937& rng, size_t count);

} // namespace EvoSim::RandomStreams
