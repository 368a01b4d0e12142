#include "Random.hpp"

MersenneSource::MersenneSource() {
    std::random_device rd;
    m_rng.seed(rd());
}

MersenneSource::MersenneSource(uint64_t seed) : m_rng(seed) {}

int MersenneSource::uniformInt(int low, int high) {
    std::uniform_int_distribution<int> d(low, high);
    return d(m_rng);
}
