#include <gtest/gtest.h>
#include "wav_decoder.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <algorithm>

using namespace clipshelf;

class WavDecoderTest : public ::testing::Test {
protected:
    test::TempDir dir;
};

TEST_F(WavDecoderTest, WriteThenDecodePreservesFormatAndSamples) {
    AudioFile original = test::make_ramp(22050, 2, 1000);
    const std::string path = dir.file("ramp.wav");
    write_wav(original, path);

    AudioFile decoded = decode_wav(path);
    EXPECT_EQ(decoded.path, path);
    EXPECT_EQ(decoded.sample_rate, 22050);
    EXPECT_EQ(decoded.channels, 2);
    EXPECT_EQ(decoded.frame_count(), 1000u);
    EXPECT_GT(decoded.size_bytes, 0u);
    EXPECT_FALSE(decoded.derived);

    ASSERT_EQ(decoded.samples.size(), original.samples.size());
    for (size_t i = 0; i < original.samples.size(); i += 97) {
        EXPECT_FLOAT_EQ(decoded.samples[i], original.samples[i]);
    }
}

TEST_F(WavDecoderTest, ProbeReadsHeaderStats) {
    const std::string path = test::write_tone(dir.file("tone.wav"), 16000, 1, 32000);

    AudioInfo info = probe_wav(path);
    EXPECT_EQ(info.sample_rate, 16000);
    EXPECT_EQ(info.channels, 1);
    EXPECT_EQ(info.frame_count, 32000u);
    EXPECT_DOUBLE_EQ(info.duration, 2.0);
}

TEST_F(WavDecoderTest, MissingFileIsNotFound) {
    EXPECT_THROW(decode_wav(dir.file("missing.wav")), NotFoundError);
    EXPECT_THROW(probe_wav(dir.file("missing.wav")), NotFoundError);
}

TEST_F(WavDecoderTest, GarbageIsDecodeError) {
    const std::string path = dir.file("broken.wav");
    test::write_text_file(path, "this is not a RIFF file at all");

    EXPECT_THROW(decode_wav(path), DecodeError);
    EXPECT_THROW(probe_wav(path), DecodeError);
}

TEST_F(WavDecoderTest, DecodeErrorNamesTheCause) {
    const std::string path = dir.file("broken.wav");
    test::write_text_file(path, "RIFF");

    try {
        probe_wav(path);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("broken.wav"), std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::DECODE);
    }
}

TEST_F(WavDecoderTest, WriteRejectsInvalidFormat) {
    AudioFile audio;
    audio.sample_rate = 0;
    audio.channels = 1;
    EXPECT_THROW(write_wav(audio, dir.file("bad.wav")), InvalidArgument);
}

TEST_F(WavDecoderTest, WriteToMissingDirectoryIsStorageError) {
    AudioFile audio = test::make_tone(8000, 1, 100);
    EXPECT_THROW(write_wav(audio, dir.file("no/such/dir/out.wav")), StorageError);
}

TEST_F(WavDecoderTest, StreamingDecodeAndSeek) {
    const std::string path = test::write_tone(dir.file("tone.wav"), 8000, 1, 5000);

    auto decoder = create_decoder(path);
    ASSERT_NE(decoder, nullptr);
    ASSERT_TRUE(decoder->open(path));

    std::vector<float> chunk;
    ASSERT_TRUE(decoder->decode(chunk, 4096));
    EXPECT_EQ(chunk.size(), 4096u);
    ASSERT_TRUE(decoder->decode(chunk, 4096));
    EXPECT_EQ(chunk.size(), 904u);
    EXPECT_TRUE(decoder->is_eof());
    EXPECT_FALSE(decoder->decode(chunk, 4096));

    ASSERT_TRUE(decoder->seek(4000));
    EXPECT_FALSE(decoder->is_eof());
    ASSERT_TRUE(decoder->decode(chunk, 4096));
    EXPECT_EQ(chunk.size(), 1000u);

    decoder->close();
}

TEST_F(WavDecoderTest, RangeDecodeMatchesTheSameFramesOfAFullDecode) {
    // Spans a decode chunk boundary
    const std::string path = test::write_tone(dir.file("tone.wav"), 8000, 2, 10000);
    AudioFile full = decode_wav(path);

    AudioFile region = decode_wav_range(path, Selection{4000, 9000});
    EXPECT_EQ(region.sample_rate, 8000);
    EXPECT_EQ(region.channels, 2);
    EXPECT_TRUE(region.derived);
    ASSERT_EQ(region.frame_count(), 5000u);
    EXPECT_TRUE(std::equal(region.samples.begin(), region.samples.end(), full.samples.begin() + 8000));

    AudioFile tail = decode_wav_range(path, Selection{9999, 10000});
    ASSERT_EQ(tail.frame_count(), 1u);
    EXPECT_EQ(tail.samples[1], full.samples.back());
}

TEST_F(WavDecoderTest, RangeOutsideTheFileIsRejected) {
    const std::string path = test::write_tone(dir.file("tone.wav"), 8000, 1, 100);

    EXPECT_THROW(decode_wav_range(path, Selection{50, 101}), InvalidArgument);
    EXPECT_THROW(decode_wav_range(path, Selection{60, 60}), InvalidArgument);
    EXPECT_THROW(decode_wav_range(dir.file("missing.wav"), Selection{0, 1}), NotFoundError);
}

TEST_F(WavDecoderTest, NoDecoderForOtherExtensions) {
    EXPECT_EQ(create_decoder("song.mp3"), nullptr);
    EXPECT_NE(create_decoder("clip.WAV"), nullptr);
}
