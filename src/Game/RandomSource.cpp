#include "Pichuka/Game/RandomSource.hpp"

namespace Pichuka::Game {

MersenneRandomSource::MersenneRandomSource()
    : m_generator(std::random_device{}())
    , m_distribution(0.0f, 1.0f) {
}

MersenneRandomSource::MersenneRandomSource(uint32_t seed)
    : m_generator(seed)
    , m_distribution(0.0f, 1.0f) {
}

float MersenneRandomSource::NextUnit() {
    return m_distribution(m_generator);
}

} // namespace Pichuka::Game
