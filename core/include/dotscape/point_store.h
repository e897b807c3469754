#pragma once

// Dotscape - Point Store
// Fixed-capacity GPU storage buffer holding every Point

#include <dotscape/point_seeder.h>
#include <dotscape/types.h>
#include <webgpu/webgpu.h>
#include <cstdint>

namespace dotscape {

/**
 * @brief Owns the single GPU-resident array of points
 *
 * The length is fixed at init(). PhysicsStep binds the buffer read_write
 * and ParticleRenderer binds it read-only; both use byteSize() so the
 * compute shader's arrayLength() equals count().
 */
class PointStore {
public:
    PointStore() = default;
    ~PointStore();

    PointStore(const PointStore&) = delete;
    PointStore& operator=(const PointStore&) = delete;

    bool init(WGPUDevice device, WGPUQueue queue, uint32_t count,
              const WindowExtent& extent, uint32_t seed = 0);
    void cleanup();

    /// Replace the contents with fresh random points inside `extent`
    void reseed(const WindowExtent& extent);

    WGPUBuffer buffer() const { return m_buffer; }
    uint32_t count() const { return m_count; }
    uint64_t byteSize() const { return static_cast<uint64_t>(m_count) * sizeof(Point); }

private:
    WGPUQueue m_queue = nullptr;
    WGPUBuffer m_buffer = nullptr;
    uint32_t m_count = 0;
    PointSeeder m_seeder;
};

} // namespace dotscape
