// Dotscape - Point Store

#include <dotscape/point_store.h>
#include <dotscape/gpu_common.h>
#include <iostream>

namespace dotscape {

PointStore::~PointStore() {
    cleanup();
}

bool PointStore::init(WGPUDevice device, WGPUQueue queue, uint32_t count,
                      const WindowExtent& extent, uint32_t seed) {
    if (count == 0) {
        std::cerr << "[PointStore] Point count must be at least 1" << std::endl;
        return false;
    }

    m_queue = queue;
    m_count = count;
    if (seed != 0) {
        m_seeder = PointSeeder(seed);
    }

    std::vector<Point> points = m_seeder.generate(m_count, extent);
    m_buffer = gpu::createBuffer(device, queue, "Point Store", WGPUBufferUsage_Storage,
                                 byteSize(), points.data());
    if (!m_buffer) {
        std::cerr << "[PointStore] Failed to create storage buffer ("
                  << byteSize() << " bytes)" << std::endl;
        m_count = 0;
        return false;
    }

    std::cout << "[PointStore] " << m_count << " points (" << byteSize() << " bytes)" << std::endl;
    return true;
}

void PointStore::cleanup() {
    gpu::release(m_buffer);
    m_count = 0;
    m_queue = nullptr;
}

void PointStore::reseed(const WindowExtent& extent) {
    if (!m_buffer) return;
    std::vector<Point> points = m_seeder.generate(m_count, extent);
    wgpuQueueWriteBuffer(m_queue, m_buffer, 0, points.data(), static_cast<size_t>(byteSize()));
}

} // namespace dotscape
