/**
 * SimRNG: Seeded PRNG for reproducible synthetic data.
 *
 * mulberry32 core with Box-Muller Gaussian draws. Output depends only on the
 * seed and the number of draws taken, never on the standard library, so a
 * given seed yields the same series on every platform.
 *
 * One SimRNG is owned per simulation run and passed by reference into each
 * step. It is never shared between runs and never re-seeded mid-run.
 *
 * Header-only. No dependencies beyond <cstdint> and <cmath>.
 */

#ifndef CLARO_CORE_SIM_RNG_HPP
#define CLARO_CORE_SIM_RNG_HPP

#include <cstdint>
#include <cmath>

namespace claro {

class SimRNG {
public:
    explicit SimRNG(int32_t seed = 123)
        : seed_(seed), state_(static_cast<uint32_t>(seed ? seed : 1)) {}

    SimRNG(const SimRNG&) = delete;
    SimRNG& operator=(const SimRNG&) = delete;

    /**
     * Next double in [0, 1).
     */
    double random() {
        state_ += 0x6D2B79F5u;
        uint32_t t = state_;

        t = imul(t ^ (t >> 15), t | 1u);
        t ^= t + imul(t ^ (t >> 7), t | 61u);

        ++draws_;
        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

    /**
     * Gaussian sample via Box-Muller transform.
     * Always consumes exactly two uniforms, including when stddev == 0.
     */
    double gaussian(double mean = 0.0, double stddev = 1.0) {
        double u1 = random();
        double u2 = random();
        if (u1 < 1e-10) u1 = 1e-10;
        double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
        return mean + z0 * stddev;
    }

    int32_t seed() const { return seed_; }

    /** Number of uniforms drawn since construction. */
    uint64_t draws() const { return draws_; }

private:
    static constexpr double kTwoPi = 6.283185307179586476925286766559;

    int32_t seed_;
    uint32_t state_;
    uint64_t draws_ = 0;

    // Low 32 bits of the 64-bit product
    static uint32_t imul(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(
            static_cast<uint64_t>(a) * static_cast<uint64_t>(b)
        );
    }
};

} // namespace claro

#endif // CLARO_CORE_SIM_RNG_HPP
