#include "core/BagRandomizer.hpp"
#include <algorithm>
#include <array>
#include <cstddef>

namespace blockfall::core {

BagRandomizer::BagRandomizer()
    : BagRandomizer{std::random_device{}()}
{
}

BagRandomizer::BagRandomizer(std::uint32_t seed)
    : rng_{seed}
{
    // Two bags up front so the preview never runs dry
    refill();
    refill();
}

void BagRandomizer::refill() {
    std::array<TetrominoType, TetrominoTypeCount> bag = AllTetrominoTypes;
    std::shuffle(bag.begin(), bag.end(), rng_);
    queue_.insert(queue_.end(), bag.begin(), bag.end());
}

TetrominoType BagRandomizer::draw() {
    if (queue_.size() < static_cast<std::size_t>(TetrominoTypeCount)) {
        refill();
    }
    TetrominoType type = queue_.front();
    queue_.pop_front();
    return type;
}

std::vector<TetrominoType> BagRandomizer::peek(int count) const {
    std::vector<TetrominoType> out;
    if (count <= 0) return out;

    const std::size_t n = std::min(queue_.size(), static_cast<std::size_t>(count));
    out.assign(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(n));
    return out;
}

} // namespace blockfall::core
