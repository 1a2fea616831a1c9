#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace deaddrop {

/// Source of uniform random integers. Hosts supply their own; the
/// simulation and tests use MersenneRandom or a scripted double.
class IRandom {
public:
    virtual ~IRandom() = default;

    /// Uniform integer in [minInclusive, maxInclusive].  Bounds given in the
    /// wrong order are swapped.
    virtual int range(int minInclusive, int maxInclusive) = 0;
};

class MersenneRandom : public IRandom {
public:
    MersenneRandom() : m_rng(std::random_device{}()) {}
    explicit MersenneRandom(uint32_t seed) : m_rng(seed) {}

    int range(int minInclusive, int maxInclusive) override;

private:
    std::mt19937 m_rng;
};

/// Pick one element uniformly.  Returns nullptr for an empty sequence.
template <typename T>
const T* pickOne(const std::vector<T>& items, IRandom& rng) {
    if (items.empty()) return nullptr;
    int index = rng.range(0, static_cast<int>(items.size()) - 1);
    return &items[static_cast<size_t>(index)];
}

/// Draw `count` elements uniformly WITH replacement.  Every draw is
/// independent, so the result may repeat elements and may be longer than
/// `items`.  Returns an empty vector for an empty source or count <= 0.
template <typename T>
std::vector<T> pickMany(const std::vector<T>& items, int count, IRandom& rng) {
    std::vector<T> picked;
    if (items.empty() || count <= 0) return picked;

    picked.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        picked.push_back(*pickOne(items, rng));
    }
    return picked;
}

} // namespace deaddrop
