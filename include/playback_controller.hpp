#pragma once

#include "types.hpp"
#include "audio_engine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace clipshelf {

struct PlaybackOptions {
    std::chrono::milliseconds tick_interval{20};
    float volume{1.0f};
};

// Stopped / Playing / Paused state machine over one clip at a time.
//
// A background thread feeds one tick's worth of frames to the audio engine
// per tick and advances position(). pause() and stop() are observed between
// ticks. Notifications are delivered without the controller lock held, state
// changes on the calling thread (or on the tick thread when a clip runs out),
// progress on the tick thread. Controller methods must not be called from
// inside a notification.
class PlaybackController {
private:
    std::unique_ptr<IAudioEngine> m_audio_engine;
    PlaybackOptions m_options;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    mutable std::condition_variable m_state_changed;
    std::thread m_tick_thread;
    std::atomic<std::thread::id> m_tick_thread_id{std::thread::id()};

    std::shared_ptr<const AudioFile> m_audio;
    PlaybackDirection m_direction = PlaybackDirection::FORWARD;
    PlaybackState m_state = PlaybackState::STOPPED;
    size_t m_position = 0;
    bool m_finished_writing = false;
    uint64_t m_generation = 0;
    float m_volume;

    PlaybackCallback m_state_callback;
    ProgressCallback m_progress_callback;

public:
    explicit PlaybackController(std::unique_ptr<IAudioEngine> audio_engine,
                                PlaybackOptions options = PlaybackOptions());
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    // Stopped|Paused -> Playing. A clip already playing is stopped first.
    void play(const AudioFile& audio, PlaybackDirection direction);
    // Playing -> Paused. Throws InvalidState when stopped.
    void pause();
    // Playing|Paused -> Stopped, rewinding to the start for the direction.
    void stop();
    // Paused -> Playing in the stored direction. Throws InvalidState when stopped.
    void resume();

    PlaybackState state() const;
    size_t position() const;
    PlaybackDirection direction() const;

    void set_volume(float volume);
    float volume() const;

    void set_state_callback(PlaybackCallback callback);
    void set_progress_callback(ProgressCallback callback);

    // Blocks until the controller is stopped or the timeout expires.
    bool wait_until_stopped(std::chrono::milliseconds timeout) const;

private:
    void tick_loop(uint64_t generation);
    bool write_next_chunk(std::unique_lock<std::mutex>& lock);
    void finish(uint64_t generation);
    void halt_tick_thread();
    void start_tick_thread();
    void start_engine(const AudioFile& audio);
    size_t start_position() const;
    size_t turned_position(PlaybackDirection direction) const;
    size_t frames_per_tick() const;
    void notify_state(PlaybackState state);
    void check_not_on_tick_thread(const char* operation) const;
};

const char* playback_state_name(PlaybackState state);

}
