#pragma once
#include <cstdint>
#include <random>

// Source of the secret number. The game only ever asks for one draw per session.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform integer in [low, high], both inclusive.
    virtual int uniformInt(int low, int high) = 0;
};

class MersenneSource : public RandomSource {
public:
    MersenneSource();                      // seeded from std::random_device
    explicit MersenneSource(uint64_t seed);

    int uniformInt(int low, int high) override;

private:
    std::mt19937_64 m_rng;
};
