/**
 * @file volume_provider.cpp
 * @brief Audio peak meter (miniaudio) and intensity auto-gain
 */

// Prevent Windows.h from defining min/max macros
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include <dotscape/volume_provider.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>

namespace dotscape {

// =============================================================================
// PeakMeter
// =============================================================================

void PeakMeter::record(const float* samples, size_t count) {
    float blockPeak = 0.0f;
    for (size_t i = 0; i < count; i++) {
        blockPeak = std::max(blockPeak, std::fabs(samples[i]));
    }

    // Keep the loudest block until the frame loop takes it; EMPTY loses to any peak
    float prev = m_peak.load(std::memory_order_relaxed);
    while (blockPeak > prev &&
           !m_peak.compare_exchange_weak(prev, blockPeak, std::memory_order_relaxed)) {
    }
}

std::optional<float> PeakMeter::take() {
    float level = m_peak.exchange(EMPTY, std::memory_order_relaxed);
    if (level < 0.0f) {
        return std::nullopt;
    }
    return level;
}

// =============================================================================
// AudioPeakProvider
// =============================================================================

struct AudioPeakProvider::Impl {
    ma_context context;
    ma_device device;
    bool contextInitialized = false;
    bool deviceInitialized = false;

    PeakMeter meter;
    std::atomic<bool> capturing{false};

    static void dataCallback(ma_device* pDevice, void* pOutput, const void* pInput, ma_uint32 frameCount);
};

void AudioPeakProvider::Impl::dataCallback(ma_device* pDevice, void* pOutput, const void* pInput, ma_uint32 frameCount) {
    (void)pOutput;
    Impl* impl = static_cast<Impl*>(pDevice->pUserData);

    if (pInput && impl->capturing) {
        impl->meter.record(static_cast<const float*>(pInput),
                           static_cast<size_t>(frameCount) * pDevice->capture.channels);
    }
}

AudioPeakProvider::AudioPeakProvider() : m_impl(std::make_unique<Impl>()) {}

AudioPeakProvider::~AudioPeakProvider() {
    stop();
}

bool AudioPeakProvider::start(const std::string& deviceHint) {
    if (m_impl->deviceInitialized) {
        return true;
    }

    if (ma_context_init(nullptr, 0, nullptr, &m_impl->context) != MA_SUCCESS) {
        m_lastError = "Failed to initialize audio context";
        std::cerr << "[Audio] " << m_lastError << std::endl;
        return false;
    }
    m_impl->contextInitialized = true;

    ma_device_info* playbackInfos = nullptr;
    ma_uint32 playbackCount = 0;
    ma_device_info* captureInfos = nullptr;
    ma_uint32 captureCount = 0;
    const ma_device_info* chosen = nullptr;

    if (ma_context_get_devices(&m_impl->context, &playbackInfos, &playbackCount,
                               &captureInfos, &captureCount) == MA_SUCCESS) {
        for (ma_uint32 i = 0; i < captureCount && !chosen; i++) {
            std::string name = captureInfos[i].name;
            if (!deviceHint.empty()) {
                if (name.find(deviceHint) != std::string::npos) chosen = &captureInfos[i];
            } else if (name.rfind("Monitor of", 0) == 0) {
                chosen = &captureInfos[i];
            }
        }
        if (!chosen && !deviceHint.empty()) {
            std::cerr << "[Audio] No capture device matching '" << deviceHint
                      << "', using default input" << std::endl;
        }
    }

    ma_device_config config = ma_device_config_init(ma_device_type_capture);
    config.capture.format = ma_format_f32;
    config.capture.channels = 1;
    config.capture.pDeviceID = chosen ? &chosen->id : nullptr;
    config.sampleRate = SAMPLE_RATE;
    config.periodSizeInFrames = SAMPLE_RATE / PEAK_RATE;
    config.dataCallback = &Impl::dataCallback;
    config.pUserData = m_impl.get();

    if (ma_device_init(&m_impl->context, &config, &m_impl->device) != MA_SUCCESS) {
        m_lastError = "Failed to initialize capture device";
        std::cerr << "[Audio] " << m_lastError << std::endl;
        stop();
        return false;
    }
    m_impl->deviceInitialized = true;
    m_deviceName = chosen ? chosen->name : "default input";

    m_impl->capturing = true;
    if (ma_device_start(&m_impl->device) != MA_SUCCESS) {
        m_lastError = "Failed to start capture";
        std::cerr << "[Audio] " << m_lastError << std::endl;
        stop();
        return false;
    }

    std::cout << "[Audio] Capturing peaks from " << m_deviceName << " at "
              << PEAK_RATE << " Hz" << std::endl;
    return true;
}

void AudioPeakProvider::stop() {
    m_impl->capturing = false;
    if (m_impl->deviceInitialized) {
        ma_device_uninit(&m_impl->device);
        m_impl->deviceInitialized = false;
    }
    if (m_impl->contextInitialized) {
        ma_context_uninit(&m_impl->context);
        m_impl->contextInitialized = false;
    }
}

bool AudioPeakProvider::isCapturing() const {
    return m_impl->capturing;
}

std::optional<float> AudioPeakProvider::pollVolume() {
    return m_impl->meter.take();
}

// =============================================================================
// IntensityController
// =============================================================================

float IntensityController::update(std::optional<float> volume, float dt) {
    float intensity;
    if (volume) {
        intensity = *volume * m_multiplier;
    } else {
        intensity = std::max(m_lastIntensity - dt / DECAY_SECONDS, 0.0f);
    }

    m_clamped = false;
    if (intensity > 1.0f) {
        m_multiplier /= intensity;
        intensity = 1.0f;
        m_clamped = true;
    } else if (intensity != 0.0f) {
        m_multiplier = std::min(m_multiplier + dt / DECAY_SECONDS, MAX_MULTIPLIER);
    }

    m_lastIntensity = intensity;
    return intensity;
}

} // namespace dotscape
