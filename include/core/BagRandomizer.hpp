#pragma once

#include "Types.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <random>
#include <vector>

namespace blockfall::core {

// 7-bag piece supply: the queue is always extended with a whole shuffled
// permutation of the 7 kinds, so no kind repeats inside a bag.
class BagRandomizer {
public:
    // Seeds from std::random_device
    BagRandomizer();

    // Reproducible sequence for a given seed
    explicit BagRandomizer(std::uint32_t seed);

    // Append one uniformly shuffled bag to the tail of the queue
    void refill();

    // Pop the head of the queue; refills first if fewer than 7 kinds remain
    TetrominoType draw();

    // Upcoming kinds without consuming them (at most size())
    std::vector<TetrominoType> peek(int count) const;

    std::size_t size() const noexcept { return queue_.size(); }

private:
    std::mt19937 rng_;
    std::deque<TetrominoType> queue_;
};

} // namespace blockfall::core
