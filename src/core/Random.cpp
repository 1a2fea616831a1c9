#include "core/Random.hpp"

#include <utility>

namespace deaddrop {

int MersenneRandom::range(int minInclusive, int maxInclusive) {
    if (minInclusive > maxInclusive) {
        std::swap(minInclusive, maxInclusive);
    }
    std::uniform_int_distribution<int> dist(minInclusive, maxInclusive);
    return dist(m_rng);
}

} // namespace deaddrop
