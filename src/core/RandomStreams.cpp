#include "RandomStreams.h"

namespace EvoSim::RandomStreams {

uint32_t fnv1a(const void* data, size_t length, uint32_t basis)
{
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t hash = basis;
    for (size_t i = 0; i < length; ++i) {
        hash ^= bytes[i];
        hash *= FNV_PRIME;
    }
    return hash;
}

uint32_t fnv1a(std::string_view tag, uint32_t basis)
{
    return fnv1a(tag.data(), tag.size(), basis);
}

uint32_t deriveSeed(uint32_t baseSeed, std::string_view tag, std::initializer_list<uint64_t> keys)
{
    // Bytes are hashed little-endian first so the seed does not depend on the host.
    const uint8_t seedBytes[4] = { static_cast<uint8_t>(baseSeed),
                                   static_cast<uint8_t>(baseSeed >> 8),
                                   static_cast<uint8_t>(baseSeed >> 16),
                                   static_cast<uint8_t>(baseSeed >> 24) };
    uint32_t hash = fnv1a(seedBytes, sizeof(seedBytes));
    hash = fnv1a(tag, hash);
    for (uint64_t key : keys) {
        uint8_t bytes[8];
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>(key >> (8 * i));
        }
        hash = fnv1a(bytes, sizeof(bytes), hash);
    }
    return hash;
}

std::mt19937 keyedStream(
    uint32_t baseSeed, std::string_view tag, std::initializer_list<uint64_t> keys)
{
    return std::mt19937(deriveSeed(baseSeed, tag, keys));
}

double unit(std::mt19937& rng)
{
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

double range(std::mt19937& rng, double lo, double hi)
{
    if (!(hi > lo)) {
        return lo;
    }
    return std::uniform_real_distribution<double>(lo, hi)(rng);
}

size_t index(std::mt19937& rng, size_t count)
{
    return std::uniform_int_distribution<size_t>(0, count - 1)(rng);
}

} // namespace EvoSim::RandomStreams
