#include "audio_engine.hpp"
#include <alsa/asoundlib.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace clipshelf {

namespace {

constexpr unsigned int PERIODS_PER_BUFFER = 4;
constexpr unsigned int PERIODS_PER_SECOND = 20;

bool alsa_ok(int err, const char* action) {
    if (err < 0) {
        std::cerr << "ALSA: cannot " << action << ": " << snd_strerror(err) << std::endl;
        return false;
    }
    return true;
}

}

struct AlsaAudioEngine::Impl {
    snd_pcm_t* device = nullptr;

    AudioFormat format;
    size_t ring_frames = 0;
    size_t period_frames = 0;

    std::atomic<bool> running{false};
    std::atomic<bool> paused{false};
    std::atomic<float> volume{1.0f};

    std::thread feeder;
    std::atomic<bool> feeder_exit{false};

    // Interleaved samples accepted by write_samples() but not yet handed to the device
    mutable std::mutex queue_mutex;
    std::deque<int16_t> queue;

    bool open_device() {
        if (!alsa_ok(snd_pcm_open(&device, "default", SND_PCM_STREAM_PLAYBACK, 0), "open the default device")) {
            device = nullptr;
            return false;
        }
        return true;
    }

    void close_device() {
        if (device) {
            snd_pcm_close(device);
            device = nullptr;
        }
    }

    // S16_LE interleaved, 50 ms periods, four periods in the ring so that a
    // pause silences the device quickly.
    bool configure_device() {
        snd_pcm_hw_params_t* params;
        snd_pcm_hw_params_alloca(&params);

        unsigned int rate = static_cast<unsigned int>(format.sample_rate);
        snd_pcm_uframes_t period = std::max(1u, rate / PERIODS_PER_SECOND);
        snd_pcm_uframes_t ring = period * PERIODS_PER_BUFFER;

        bool configured =
            alsa_ok(snd_pcm_hw_params_any(device, params), "query hardware parameters") &&
            alsa_ok(snd_pcm_hw_params_set_access(device, params, SND_PCM_ACCESS_RW_INTERLEAVED),
                    "select interleaved access") &&
            alsa_ok(snd_pcm_hw_params_set_format(device, params, SND_PCM_FORMAT_S16_LE),
                    "select 16-bit samples") &&
            alsa_ok(snd_pcm_hw_params_set_channels(device, params, static_cast<unsigned int>(format.channels)),
                    "set the channel count") &&
            alsa_ok(snd_pcm_hw_params_set_rate_near(device, params, &rate, nullptr), "set the sample rate") &&
            alsa_ok(snd_pcm_hw_params_set_period_size_near(device, params, &period, nullptr),
                    "set the period size") &&
            alsa_ok(snd_pcm_hw_params_set_buffer_size_near(device, params, &ring), "set the buffer size") &&
            alsa_ok(snd_pcm_hw_params(device, params), "apply hardware parameters");

        if (!configured) {
            return false;
        }

        if (rate != static_cast<unsigned int>(format.sample_rate)) {
            std::cout << "ALSA: device runs at " << rate << " Hz, clip is " << format.sample_rate << " Hz\n";
        }

        period_frames = period;
        ring_frames = ring;
        return true;
    }

    void feeder_loop() {
        const auto idle = std::chrono::milliseconds(1000 / PERIODS_PER_SECOND / 5);
        while (!feeder_exit) {
            if (running && !paused) {
                feed_device();
            }
            std::this_thread::sleep_for(idle);
        }
    }

    // Moves at most one period from the queue into the device ring.
    void feed_device() {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (queue.empty()) {
            return;
        }

        snd_pcm_sframes_t room = snd_pcm_avail_update(device);
        if (room < 0) {
            recover(static_cast<int>(room));
            return;
        }

        const size_t channels = static_cast<size_t>(format.channels);
        const size_t frames = std::min({static_cast<size_t>(room), queue.size() / channels, period_frames});
        if (frames == 0) {
            return;
        }

        const float gain = volume;
        std::vector<int16_t> chunk(frames * channels);
        std::transform(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(chunk.size()), chunk.begin(),
                       [gain](int16_t sample) { return static_cast<int16_t>(sample * gain); });

        snd_pcm_sframes_t written = snd_pcm_writei(device, chunk.data(), frames);
        if (written < 0) {
            recover(static_cast<int>(written));
            return;
        }

        queue.erase(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(written) * channels));
    }

    // Underruns and suspends are recoverable; anything else is only logged.
    void recover(int err) {
        int result = snd_pcm_recover(device, err, 1);
        if (result < 0) {
            std::cerr << "ALSA: write failed: " << snd_strerror(result) << std::endl;
        }
    }

    void stop_feeder() {
        running = false;
        feeder_exit = true;
        if (feeder.joinable()) {
            feeder.join();
        }
    }

    void clear_queue() {
        std::lock_guard<std::mutex> lock(queue_mutex);
        queue.clear();
    }
};

AlsaAudioEngine::AlsaAudioEngine() : m_impl(std::make_unique<Impl>()) {}

AlsaAudioEngine::~AlsaAudioEngine() {
    shutdown();
}

bool AlsaAudioEngine::initialize(const AudioFormat& fmt) {
    // A clip with another format needs the device reopened
    shutdown();

    if (fmt.sample_rate <= 0 || fmt.channels <= 0) {
        std::cerr << "ALSA: invalid format " << fmt.sample_rate << " Hz, " << fmt.channels << " channel(s)\n";
        return false;
    }
    m_impl->format = fmt;

    if (!m_impl->open_device()) {
        return false;
    }
    if (!m_impl->configure_device()) {
        m_impl->close_device();
        return false;
    }
    return true;
}

bool AlsaAudioEngine::start() {
    if (!m_impl->device) {
        return false;
    }

    m_impl->stop_feeder();
    if (!alsa_ok(snd_pcm_prepare(m_impl->device), "prepare the device")) {
        return false;
    }

    m_impl->paused = false;
    m_impl->running = true;
    m_impl->feeder_exit = false;
    m_impl->feeder = std::thread(&Impl::feeder_loop, m_impl.get());
    return true;
}

bool AlsaAudioEngine::stop() {
    if (!m_impl->device) {
        return false;
    }

    m_impl->stop_feeder();
    m_impl->paused = false;
    snd_pcm_drop(m_impl->device);
    m_impl->clear_queue();
    return true;
}

bool AlsaAudioEngine::pause() {
    if (!m_impl->device) {
        return false;
    }

    // Without hardware pause the ring plays out, then the feeder stays idle
    int err = snd_pcm_pause(m_impl->device, 1);
    if (err < 0) {
        std::cout << "ALSA: hardware pause unavailable (" << snd_strerror(err) << ")\n";
    }
    m_impl->paused = true;
    return true;
}

bool AlsaAudioEngine::resume() {
    if (!m_impl->device) {
        return false;
    }

    if (snd_pcm_pause(m_impl->device, 0) < 0 &&
        !alsa_ok(snd_pcm_prepare(m_impl->device), "restart the device")) {
        return false;
    }
    m_impl->paused = false;
    return true;
}

void AlsaAudioEngine::shutdown() {
    if (m_impl->device) {
        stop();
    }
    m_impl->stop_feeder();
    m_impl->close_device();
}

bool AlsaAudioEngine::write_samples(const AudioBuffer& buffer) {
    if (!m_impl->device) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_impl->queue_mutex);
    m_impl->queue.insert(m_impl->queue.end(), buffer.begin(), buffer.end());
    return true;
}

size_t AlsaAudioEngine::get_buffer_size() const {
    return m_impl->ring_frames;
}

bool AlsaAudioEngine::is_playing() const {
    return m_impl->running && !m_impl->paused;
}

void AlsaAudioEngine::set_volume(float volume) {
    m_impl->volume = std::clamp(volume, 0.0f, 1.0f);
}

float AlsaAudioEngine::get_volume() const {
    return m_impl->volume;
}

size_t AlsaAudioEngine::get_buffered_samples() const {
    std::lock_guard<std::mutex> lock(m_impl->queue_mutex);
    return m_impl->queue.size();
}

std::unique_ptr<IAudioEngine> create_audio_engine() {
    return std::make_unique<AlsaAudioEngine>();
}

}
