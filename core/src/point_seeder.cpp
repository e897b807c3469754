// Dotscape - Point Seeder

#include <dotscape/point_seeder.h>
#include <algorithm>

namespace dotscape {

PointSeeder::PointSeeder()
    : m_rng(std::random_device{}()) {}

PointSeeder::PointSeeder(uint32_t seed)
    : m_rng(seed) {}

float PointSeeder::randomSpeed() {
    std::uniform_real_distribution<float> speed(MIN_SPEED, MAX_SPEED);
    std::bernoulli_distribution negative(0.5);
    float v = speed(m_rng);
    return negative(m_rng) ? -v : v;
}

std::vector<Point> PointSeeder::generate(uint32_t count, const WindowExtent& extent) {
    // Whole-pixel positions; a sub-pixel extent still yields x = 0
    int maxX = std::max(static_cast<int>(extent.width), 1) - 1;
    int maxY = std::max(static_cast<int>(extent.height), 1) - 1;
    std::uniform_int_distribution<int> xDist(0, maxX);
    std::uniform_int_distribution<int> yDist(0, maxY);

    std::vector<Point> points(count);
    for (auto& p : points) {
        p.position = glm::vec2(static_cast<float>(xDist(m_rng)), static_cast<float>(yDist(m_rng)));
        p.velocity = glm::vec2(randomSpeed(), randomSpeed());
    }
    return points;
}

} // namespace dotscape
