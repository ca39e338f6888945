#pragma once

#include "types.hpp"
#include <memory>

namespace clipshelf {

// Output device. Failures are reported through return values and logged;
// callers decide whether they are fatal.
class IAudioEngine {
public:
    virtual ~IAudioEngine() = default;

    // Opens the device for one clip format. Calling it again reopens.
    virtual bool initialize(const AudioFormat& format) = 0;
    virtual bool start() = 0;
    // Drops everything queued or buffered.
    virtual bool stop() = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;
    virtual void shutdown() = 0;

    // Queues interleaved 16-bit samples; returns without waiting for the device.
    virtual bool write_samples(const AudioBuffer& buffer) = 0;
    // Device ring size in frames.
    virtual size_t get_buffer_size() const = 0;
    virtual bool is_playing() const = 0;
    virtual void set_volume(float volume) = 0;
    virtual float get_volume() const = 0;
    // Samples queued but not yet accepted by the device.
    virtual size_t get_buffered_samples() const = 0;
};

class AlsaAudioEngine : public IAudioEngine {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    AlsaAudioEngine();
    ~AlsaAudioEngine() override;

    bool initialize(const AudioFormat& format) override;
    bool start() override;
    bool stop() override;
    bool pause() override;
    bool resume() override;
    void shutdown() override;
    bool write_samples(const AudioBuffer& buffer) override;
    size_t get_buffer_size() const override;
    bool is_playing() const override;
    void set_volume(float volume) override;
    float get_volume() const override;
    size_t get_buffered_samples() const override;
};

std::unique_ptr<IAudioEngine> create_audio_engine();

}
