#pragma once

/**
 * @file volume_provider.h
 * @brief Sources of loudness samples that drive point intensity
 *
 * A provider is polled once per frame. It returns a fresh peak level when one
 * arrived since the last poll and nothing otherwise, letting the
 * IntensityController decay between samples.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace dotscape {

class VolumeProvider {
public:
    virtual ~VolumeProvider() = default;

    /// Peak amplitude (>= 0) since the last poll, or nullopt if none arrived
    virtual std::optional<float> pollVolume() = 0;

    virtual std::string name() const = 0;
};

/// Always reports the same level
class ConstantVolumeProvider : public VolumeProvider {
public:
    explicit ConstantVolumeProvider(float volume) : m_volume(volume) {}

    std::optional<float> pollVolume() override { return m_volume; }
    std::string name() const override { return "constant"; }

private:
    float m_volume;
};

/**
 * @brief Loudest block peak since the last take()
 *
 * record() runs on the audio thread and take() on the frame loop. Both the
 * level and the "nothing since last take" state live in one atomic, so a
 * block recorded while take() runs is either returned now or kept for the
 * next take, never dropped.
 */
class PeakMeter {
public:
    /// Fold the absolute peak of `count` samples into the held level
    void record(const float* samples, size_t count);

    /// Held level and reset, or nullopt if nothing was recorded since the last take
    std::optional<float> take();

private:
    static constexpr float EMPTY = -1.0f;
    std::atomic<float> m_peak{EMPTY};
};

/**
 * @brief Peak meter on a miniaudio capture device
 *
 * On PulseAudio/PipeWire the first capture device named "Monitor of ..." is
 * preferred so the meter follows what is playing; otherwise the default
 * input is used. The capture callback runs on the audio thread and
 * publishes the block peak through a PeakMeter.
 */
class AudioPeakProvider : public VolumeProvider {
public:
    /// Capture blocks per second
    static constexpr unsigned PEAK_RATE = 144;
    static constexpr unsigned SAMPLE_RATE = 48000;

    AudioPeakProvider();
    ~AudioPeakProvider() override;

    AudioPeakProvider(const AudioPeakProvider&) = delete;
    AudioPeakProvider& operator=(const AudioPeakProvider&) = delete;

    /**
     * @brief Open and start the capture device
     * @param deviceHint Substring of the device name to use, empty for auto
     * @return false if no device could be opened (see lastError())
     */
    bool start(const std::string& deviceHint = "");
    void stop();

    bool isCapturing() const;
    const std::string& deviceName() const { return m_deviceName; }
    const std::string& lastError() const { return m_lastError; }

    std::optional<float> pollVolume() override;
    std::string name() const override { return "audio"; }

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
    std::string m_deviceName;
    std::string m_lastError;
};

/**
 * @brief Auto-gain that maps volume samples to point intensity
 *
 * Per frame: a fresh sample sets intensity = sample * multiplier; no sample
 * decays the previous intensity by dt / 20. Intensity above 1 is clamped and
 * the multiplier scaled down by the overshoot; any other non-zero intensity
 * lets the multiplier creep up by dt / 20, capped at MAX_MULTIPLIER.
 */
class IntensityController {
public:
    static constexpr float DECAY_SECONDS = 20.0f;
    static constexpr float MAX_MULTIPLIER = 100.0f;

    explicit IntensityController(float initialIntensity = 0.0f)
        : m_lastIntensity(initialIntensity) {}

    /// Advance by dt seconds with an optional new sample; returns the intensity
    float update(std::optional<float> volume, float dt);

    float intensity() const { return m_lastIntensity; }
    float multiplier() const { return m_multiplier; }

    /// True if the last update clamped an overshoot
    bool clamped() const { return m_clamped; }

private:
    float m_lastIntensity;
    float m_multiplier = 1.0f;
    bool m_clamped = false;
};

} // namespace dotscape
