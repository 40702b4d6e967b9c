#pragma once

#include <lumen/core/math.h>

#include <cstdint>

namespace lumen
{

// PCG-style generator. One instance per worker; never shared between threads.
struct RNG
{
    uint32_t state;
    explicit RNG(uint32_t seed) : state(seed) {}

    uint32_t nextUInt()
    {
        state = state * 747796405u + 2891336453u;
        uint32_t word = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;
        return (word >> 22u) ^ word;
    }

    float next()
    {
        return static_cast<float>(nextUInt()) / 4294967296.0f;
    }

    // Uniform in [0, 1) with 53 bits of mantissa.
    double nextDouble()
    {
        uint64_t hi = nextUInt() >> 5;
        uint64_t lo = nextUInt() >> 6;
        return (static_cast<double>(hi) * 67108864.0 + static_cast<double>(lo))
             / 9007199254740992.0;
    }

    double nextDouble(double min, double max)
    {
        return min + (max - min) * nextDouble();
    }
};

inline uint32_t hash(uint32_t x)
{
    x ^= x >> 16;
    x *= 0x45d9f3bu;
    x ^= x >> 16;
    x *= 0x45d9f3bu;
    x ^= x >> 16;
    return x;
}

// Rejection sampling inside the cube [-1,1]^3.
inline Vector3 randomInUnitSphere(RNG& rng)
{
    for (;;)
    {
        Vector3 p(rng.nextDouble(-1.0, 1.0),
                  rng.nextDouble(-1.0, 1.0),
                  rng.nextDouble(-1.0, 1.0));
        if (lengthSquared(p) < 1.0)
            return p;
    }
}

} // namespace lumen
