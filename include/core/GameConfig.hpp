#pragma once

#include "Types.hpp"
#include <cstdint>
#include <optional>

namespace blockfall::core {

struct GameConfig {
    static constexpr int MaxDimension = 1000;
    static constexpr double MaxTimerSeconds = 3600.0; // lock delay and drop interval

    int rows{20};
    int cols{10};

    double lockDelaySeconds{0.5};    // grounded time before a piece locks
    double dropIntervalSeconds{0.5}; // automatic one-row descent period

    Position spawn{0, 3};            // anchor of every newly spawned piece

    std::optional<std::uint32_t> seed; // unset = seeded from std::random_device

    // Throws std::invalid_argument describing the first bad field
    void validate() const;
};

} // namespace blockfall::core
