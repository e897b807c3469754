#pragma once

// Dotscape - Point Seeder
// Random initial positions and velocities for the point store

#include <dotscape/types.h>
#include <cstdint>
#include <random>
#include <vector>

namespace dotscape {

class PointSeeder {
public:
    /// Seeded from std::random_device
    PointSeeder();
    explicit PointSeeder(uint32_t seed);

    /// Speed range per axis; the sign of each component is random
    static constexpr float MIN_SPEED = 1.0f;
    static constexpr float MAX_SPEED = 3.0f;

    /**
     * @brief Generate `count` points inside `extent`
     *
     * Positions are whole pixels in [0, width) x [0, height). Each velocity
     * component has magnitude in [MIN_SPEED, MAX_SPEED) and a random sign.
     */
    std::vector<Point> generate(uint32_t count, const WindowExtent& extent);

private:
    float randomSpeed();

    std::mt19937 m_rng;
};

} // namespace dotscape
