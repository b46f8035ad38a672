#include "core/GameConfig.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace blockfall::core {

void GameConfig::validate() const {
    if (rows <= 0 || rows > MaxDimension) {
        throw std::invalid_argument("GameConfig: rows must be in [1, " + std::to_string(MaxDimension)
                                    + "], got " + std::to_string(rows));
    }
    if (cols <= 0 || cols > MaxDimension) {
        throw std::invalid_argument("GameConfig: cols must be in [1, " + std::to_string(MaxDimension)
                                    + "], got " + std::to_string(cols));
    }
    if (!std::isfinite(lockDelaySeconds) || lockDelaySeconds < 0.0
        || lockDelaySeconds > MaxTimerSeconds) {
        throw std::invalid_argument("GameConfig: lock delay must be between 0 and 3600 seconds");
    }
    if (!std::isfinite(dropIntervalSeconds) || dropIntervalSeconds <= 0.0
        || dropIntervalSeconds > MaxTimerSeconds) {
        throw std::invalid_argument("GameConfig: drop interval must be positive and at most 3600 seconds");
    }
    if (spawn.row < 0 || spawn.row >= rows || spawn.col < 0 || spawn.col >= cols) {
        throw std::invalid_argument("GameConfig: spawn anchor (" + std::to_string(spawn.row) + ", "
                                    + std::to_string(spawn.col) + ") is outside the grid");
    }
}

} // namespace blockfall::core
