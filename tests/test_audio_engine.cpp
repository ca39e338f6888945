#include <gtest/gtest.h>
#include "audio_engine.hpp"
#include <chrono>
#include <cmath>
#include <thread>

using namespace clipshelf;

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// Needs a real ALSA device; machines without one skip.
class AudioEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = create_audio_engine();

        format.sample_rate = 44100;
        format.channels = 2;
        format.bits_per_sample = 16;

        if (!engine->initialize(format)) {
            GTEST_SKIP() << "No ALSA playback device available";
        }
    }

    void TearDown() override {
        engine->shutdown();
    }

    std::unique_ptr<IAudioEngine> engine;
    AudioFormat format;
};

TEST_F(AudioEngineTest, Initialization) {
    EXPECT_GT(engine->get_buffer_size(), 0u);
    EXPECT_FALSE(engine->is_playing());
}

TEST_F(AudioEngineTest, VolumeControl) {
    engine->set_volume(0.5f);
    EXPECT_FLOAT_EQ(engine->get_volume(), 0.5f);

    engine->set_volume(1.2f);
    EXPECT_FLOAT_EQ(engine->get_volume(), 1.0f);

    engine->set_volume(-0.1f);
    EXPECT_FLOAT_EQ(engine->get_volume(), 0.0f);
}

TEST_F(AudioEngineTest, PlaybackControl) {
    EXPECT_TRUE(engine->start());
    EXPECT_TRUE(engine->is_playing());

    EXPECT_TRUE(engine->pause());
    EXPECT_FALSE(engine->is_playing());

    EXPECT_TRUE(engine->resume());
    EXPECT_TRUE(engine->is_playing());

    EXPECT_TRUE(engine->stop());
    EXPECT_FALSE(engine->is_playing());
}

TEST_F(AudioEngineTest, WrittenSamplesDrain) {
    ASSERT_TRUE(engine->start());

    AudioBuffer buffer(2048);
    for (size_t i = 0; i < buffer.size(); i += 2) {
        buffer[i] = static_cast<int16_t>(std::sin(2.0 * M_PI * 440.0 * (i / 2) / format.sample_rate) * 16000);
        buffer[i + 1] = buffer[i];
    }

    EXPECT_TRUE(engine->write_samples(buffer));
    EXPECT_LE(engine->get_buffered_samples(), buffer.size());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (engine->get_buffered_samples() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(engine->get_buffered_samples(), 0u);
}

TEST_F(AudioEngineTest, StopDiscardsPendingSamples) {
    ASSERT_TRUE(engine->start());
    ASSERT_TRUE(engine->pause());

    EXPECT_TRUE(engine->write_samples(AudioBuffer(44100 * 2, 0)));
    EXPECT_GT(engine->get_buffered_samples(), 0u);

    EXPECT_TRUE(engine->stop());
    EXPECT_EQ(engine->get_buffered_samples(), 0u);
}

TEST_F(AudioEngineTest, ReinitializeForAnotherFormat) {
    AudioFormat mono{22050, 1, 16};
    EXPECT_TRUE(engine->initialize(mono));

    AudioFormat stereo{48000, 2, 16};
    EXPECT_TRUE(engine->initialize(stereo));
}

TEST(AudioEngineWithoutDeviceTest, CallsBeforeInitializeFail) {
    auto engine = create_audio_engine();
    EXPECT_FALSE(engine->start());
    EXPECT_FALSE(engine->stop());
    EXPECT_FALSE(engine->write_samples(AudioBuffer(16, 0)));
    EXPECT_EQ(engine->get_buffered_samples(), 0u);
    engine->shutdown();
}
