#include "playback_controller.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace clipshelf {

namespace {

int16_t to_pcm16(float sample) {
    return static_cast<int16_t>(std::clamp(sample, -1.0f, 1.0f) * 32767.0f);
}

void append_frame(AudioBuffer& buffer, const AudioFile& audio, size_t frame) {
    const size_t channels = static_cast<size_t>(audio.channels);
    for (size_t c = 0; c < channels; ++c) {
        buffer.push_back(to_pcm16(audio.samples[frame * channels + c]));
    }
}

}

const char* playback_state_name(PlaybackState state) {
    switch (state) {
        case PlaybackState::STOPPED: return "stopped";
        case PlaybackState::PLAYING: return "playing";
        case PlaybackState::PAUSED: return "paused";
    }
    return "unknown";
}

PlaybackController::PlaybackController(std::unique_ptr<IAudioEngine> audio_engine,
                                       PlaybackOptions options)
    : m_audio_engine(std::move(audio_engine))
    , m_options(options)
    , m_volume(std::clamp(options.volume, 0.0f, 1.0f)) {
    if (!m_audio_engine) {
        throw InvalidArgument("Playback requires an audio engine");
    }
    if (m_options.tick_interval.count() <= 0) {
        throw InvalidArgument("Playback tick interval must be positive");
    }
}

PlaybackController::~PlaybackController() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = PlaybackState::STOPPED;
        ++m_generation;
    }
    halt_tick_thread();
    m_audio_engine->shutdown();
}

void PlaybackController::play(const AudioFile& audio, PlaybackDirection direction) {
    check_not_on_tick_thread("play");

    if (audio.frame_count() == 0) {
        throw InvalidArgument("Cannot play an empty clip");
    }
    if (audio.sample_rate <= 0 || audio.channels <= 0) {
        throw InvalidArgument("Clip has an invalid format");
    }

    PlaybackState current;
    bool resuming;
    bool direction_changed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        current = m_state;
        resuming = m_state == PlaybackState::PAUSED && m_audio &&
                   m_audio->path == audio.path && m_audio->frame_count() == audio.frame_count();
        direction_changed = m_direction != direction;
    }

    if (current == PlaybackState::PLAYING || (current == PlaybackState::PAUSED && !resuming)) {
        // Last request wins
        stop();
    }

    if (resuming) {
        if (direction_changed) {
            // Buffered frames belong to the old direction
            if (!m_audio_engine->stop() || !m_audio_engine->start()) {
                throw AudioDeviceError("Cannot restart audio output");
            }
        } else if (!m_audio_engine->resume()) {
            throw AudioDeviceError("Audio device failed to resume");
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (direction_changed) {
            m_position = turned_position(direction);
            m_direction = direction;
            m_finished_writing = false;
        }
        m_state = PlaybackState::PLAYING;
        ++m_generation;
        start_tick_thread();
    } else {
        halt_tick_thread();

        auto clip = std::make_shared<const AudioFile>(audio);
        start_engine(*clip);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_audio = clip;
        m_direction = direction;
        m_position = start_position();
        m_finished_writing = false;
        m_state = PlaybackState::PLAYING;
        ++m_generation;
        start_tick_thread();
    }

    notify_state(PlaybackState::PLAYING);
}

void PlaybackController::pause() {
    check_not_on_tick_thread("pause");

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == PlaybackState::STOPPED) {
            throw InvalidState("Cannot pause: nothing is playing");
        }
        if (m_state == PlaybackState::PAUSED) {
            return;
        }
        m_state = PlaybackState::PAUSED;
        ++m_generation;
    }

    halt_tick_thread();
    if (!m_audio_engine->pause()) {
        std::cerr << "Playback: audio device refused to pause\n";
    }

    notify_state(PlaybackState::PAUSED);
}

void PlaybackController::stop() {
    check_not_on_tick_thread("stop");

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == PlaybackState::STOPPED) {
            return;
        }
        m_state = PlaybackState::STOPPED;
        ++m_generation;
        m_position = start_position();
        m_finished_writing = false;
    }

    halt_tick_thread();
    if (!m_audio_engine->stop()) {
        std::cerr << "Playback: audio device refused to stop\n";
    }

    notify_state(PlaybackState::STOPPED);
}

void PlaybackController::resume() {
    check_not_on_tick_thread("resume");

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == PlaybackState::PLAYING) {
            return;
        }
        if (m_state == PlaybackState::STOPPED) {
            throw InvalidState("Cannot resume: no paused clip");
        }
    }

    if (!m_audio_engine->resume()) {
        throw AudioDeviceError("Audio device failed to resume");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = PlaybackState::PLAYING;
        ++m_generation;
        start_tick_thread();
    }

    notify_state(PlaybackState::PLAYING);
}

PlaybackState PlaybackController::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

size_t PlaybackController::position() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_position;
}

PlaybackDirection PlaybackController::direction() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_direction;
}

void PlaybackController::set_volume(float volume) {
    float clamped = std::clamp(volume, 0.0f, 1.0f);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_volume = clamped;
    }
    m_audio_engine->set_volume(clamped);
}

float PlaybackController::volume() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_volume;
}

void PlaybackController::set_state_callback(PlaybackCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state_callback = std::move(callback);
}

void PlaybackController::set_progress_callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_progress_callback = std::move(callback);
}

bool PlaybackController::wait_until_stopped(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_state_changed.wait_for(lock, timeout, [this] {
        return m_state == PlaybackState::STOPPED;
    });
}

void PlaybackController::tick_loop(uint64_t generation) {
    try {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_generation == generation && m_state == PlaybackState::PLAYING) {
            if (m_finished_writing) {
                // Let the device drain before reporting the end of the clip
                if (m_audio_engine->get_buffered_samples() == 0) {
                    lock.unlock();
                    finish(generation);
                    return;
                }
            } else if (!write_next_chunk(lock)) {
                lock.unlock();
                finish(generation);
                return;
            }

            m_wakeup.wait_for(lock, m_options.tick_interval, [this, generation] {
                return m_generation != generation || m_state != PlaybackState::PLAYING;
            });
        }
    } catch (const std::exception& e) {
        std::cerr << "Playback: tick thread failed: " << e.what() << std::endl;
        finish(generation);
    }
}

bool PlaybackController::write_next_chunk(std::unique_lock<std::mutex>& lock) {
    auto clip = m_audio;
    const size_t frames = clip->frame_count();
    const size_t chunk = frames_per_tick();

    AudioBuffer buffer;
    buffer.reserve(chunk * static_cast<size_t>(clip->channels));

    if (m_direction == PlaybackDirection::FORWARD) {
        const size_t last = std::min(frames, m_position + chunk);
        for (size_t frame = m_position; frame < last; ++frame) {
            append_frame(buffer, *clip, frame);
        }
        m_position = last;
        m_finished_writing = last >= frames;
    } else {
        const size_t high = std::min(m_position, frames - 1);
        const size_t low = high + 1 > chunk ? high + 1 - chunk : 0;
        for (size_t frame = high + 1; frame-- > low;) {
            append_frame(buffer, *clip, frame);
        }
        if (low == 0) {
            m_finished_writing = true;
        } else {
            m_position = low - 1;
        }
    }

    const size_t position = m_position;
    ProgressCallback progress = m_progress_callback;

    lock.unlock();
    bool written = m_audio_engine->write_samples(buffer);
    if (written && progress) {
        progress(position);
    }
    lock.lock();

    if (!written) {
        std::cerr << "Playback: audio device rejected samples, stopping" << std::endl;
    }
    return written;
}

void PlaybackController::finish(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_generation != generation || m_state != PlaybackState::PLAYING) {
            return;
        }
        m_state = PlaybackState::STOPPED;
        ++m_generation;
        m_position = start_position();
        m_finished_writing = false;
    }

    if (!m_audio_engine->stop()) {
        std::cerr << "Playback: audio device refused to stop\n";
    }

    notify_state(PlaybackState::STOPPED);
}

void PlaybackController::halt_tick_thread() {
    m_wakeup.notify_all();
    if (m_tick_thread.joinable()) {
        m_tick_thread.join();
    }
    m_tick_thread_id = std::thread::id();
}

// Called with m_mutex held, so the new thread cannot notify before its id is published
void PlaybackController::start_tick_thread() {
    m_tick_thread = std::thread(&PlaybackController::tick_loop, this, m_generation);
    m_tick_thread_id = m_tick_thread.get_id();
}

void PlaybackController::start_engine(const AudioFile& audio) {
    if (!m_audio_engine->initialize(audio.format())) {
        throw AudioDeviceError("Cannot open the audio device for " + std::to_string(audio.sample_rate) +
                               " Hz, " + std::to_string(audio.channels) + " channel(s)");
    }

    m_audio_engine->set_volume(volume());

    if (!m_audio_engine->start()) {
        throw AudioDeviceError("Cannot start audio output");
    }
}

size_t PlaybackController::start_position() const {
    if (m_direction == PlaybackDirection::REVERSE && m_audio) {
        return m_audio->frame_count() - 1;
    }
    return 0;
}

// Next frame to write after turning around. Forward sessions keep the next
// unwritten frame in m_position, reverse sessions the next frame going down,
// so the clip continues from the last frame handed to the engine. With
// nothing left in the new direction the clip starts over from its far end.
size_t PlaybackController::turned_position(PlaybackDirection direction) const {
    const size_t frames = m_audio->frame_count();
    if (direction == PlaybackDirection::REVERSE) {
        const size_t next = std::min(m_position, frames);
        return next == 0 ? frames - 1 : next - 1;
    }
    if (m_finished_writing) {
        return 0;
    }
    const size_t next = m_position + 1;
    return next >= frames ? 0 : next;
}

size_t PlaybackController::frames_per_tick() const {
    const auto rate = static_cast<size_t>(m_audio->sample_rate);
    const auto tick_ms = static_cast<size_t>(m_options.tick_interval.count());
    return std::max<size_t>(1, rate * tick_ms / 1000);
}

void PlaybackController::notify_state(PlaybackState state) {
    PlaybackCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_state_callback;
    }
    m_state_changed.notify_all();

    if (callback) {
        callback(state);
    }
}

void PlaybackController::check_not_on_tick_thread(const char* operation) const {
    if (std::this_thread::get_id() == m_tick_thread_id.load()) {
        throw InvalidState(std::string("Cannot call ") + operation + " from a playback notification");
    }
}

}
