#pragma once

#include <cstdint>
#include <random>

namespace Tessera {

/**
 * Source of uniform draws used for weighted tie-breaking.
 * Injected into the matcher so paint results are reproducible in tests.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * Uniform draw in [0, max] (both ends inclusive).
     */
    virtual double Uniform(double max) = 0;
};

/**
 * Mersenne Twister backed source. Same seed, same sequence, on every
 * platform (no std distribution involved).
 */
class SeededRandom : public IRandomSource {
public:
    explicit SeededRandom(uint64_t seed = 0);

    double Uniform(double max) override;

    void Reseed(uint64_t seed);
    uint64_t Seed() const { return m_seed; }

private:
    uint64_t m_seed;
    std::mt19937 m_engine;
};

} // namespace Tessera
