#include "Random.h"

namespace Tessera {

// Fold a 64-bit seed into the engine's 32-bit seed
static std::mt19937::result_type FoldSeed(uint64_t seed) {
    return static_cast<std::mt19937::result_type>(
        (seed ^ (seed >> 32)) & 0xFFFFFFFFu
    );
}

SeededRandom::SeededRandom(uint64_t seed)
    : m_seed(seed), m_engine(FoldSeed(seed)) {}

double SeededRandom::Uniform(double max) {
    const double unit = static_cast<double>(m_engine()) / 4294967295.0;
    return unit * max;
}

void SeededRandom::Reseed(uint64_t seed) {
    m_seed = seed;
    m_engine.seed(FoldSeed(seed));
}

} // namespace Tessera
