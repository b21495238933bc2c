#pragma once

#include <cstdint>
#include <random>

namespace Pichuka::Game {

// Source of uniform values in [0, 1) used for gate placement
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual float NextUnit() = 0;
};

class MersenneRandomSource : public RandomSource {
public:
    // Seeds from std::random_device
    MersenneRandomSource();
    explicit MersenneRandomSource(uint32_t seed);

    float NextUnit() override;

private:
    std::mt19937 m_generator;
    std::uniform_real_distribution<float> m_distribution;
};

} // namespace Pichuka::Game
