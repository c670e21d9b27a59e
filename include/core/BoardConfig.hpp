#pragma once

#include <cstdint>

#include "Types.hpp"

namespace stackfall::core {

struct BoardConfig {
    int rows{20};
    int cols{10};
    std::uint32_t seed{0};   // 0 = seed the piece generator from std::random_device
};

// New pieces appear on the top row, roughly centred
inline Position spawnOrigin(const BoardConfig& config) noexcept {
    return Position{0, config.cols / 2};
}

} // namespace stackfall::core
