#include "wav_decoder.hpp"
#include "errors.hpp"
#include "file_scanner.hpp"
#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>
#include <cstdint>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace clipshelf {

struct WavDecoder::Impl {
    AudioInfo info;
    bool is_open = false;
    bool is_eof = false;
    drwav wav;
    uint64_t current_frame = 0;
    std::string error;

    bool initialize_drwav(const std::string& file_path) {
        if (!drwav_init_file(&wav, file_path.c_str(), nullptr)) {
            error = "not a RIFF/WAVE file";
            return false;
        }

        // Compressed payloads (ADPCM, a-law, mu-law) are not supported.
        if (wav.translatedFormatTag != DR_WAVE_FORMAT_PCM &&
            wav.translatedFormatTag != DR_WAVE_FORMAT_IEEE_FLOAT) {
            error = "unsupported WAVE encoding " + std::to_string(wav.translatedFormatTag);
            drwav_uninit(&wav);
            return false;
        }

        if (wav.channels == 0 || wav.sampleRate == 0) {
            error = "invalid format chunk";
            drwav_uninit(&wav);
            return false;
        }

        info.sample_rate = static_cast<int>(wav.sampleRate);
        info.channels = static_cast<int>(wav.channels);
        info.frame_count = wav.totalPCMFrameCount;
        info.duration = static_cast<double>(wav.totalPCMFrameCount) / wav.sampleRate;
        current_frame = 0;

        return true;
    }

    void cleanup_drwav() {
        if (is_open) {
            drwav_uninit(&wav);
        }
    }
};

WavDecoder::WavDecoder() : m_impl(std::make_unique<Impl>()) {}

WavDecoder::~WavDecoder() {
    close();
}

bool WavDecoder::open(const std::string& file_path) {
    close();

    if (!std::filesystem::exists(file_path)) {
        m_impl->error = "file does not exist";
        return false;
    }

    if (!m_impl->initialize_drwav(file_path)) {
        return false;
    }

    m_impl->is_open = true;
    m_impl->is_eof = m_impl->info.frame_count == 0;
    m_impl->error.clear();

    return true;
}

bool WavDecoder::decode(std::vector<float>& buffer, size_t max_frames) {
    if (!m_impl->is_open || m_impl->is_eof) {
        return false;
    }

    const size_t channels = static_cast<size_t>(m_impl->info.channels);
    buffer.resize(max_frames * channels);

    drwav_uint64 frames_read = drwav_read_pcm_frames_f32(&m_impl->wav, max_frames, buffer.data());

    if (frames_read == 0) {
        buffer.clear();
        m_impl->is_eof = true;
        return false;
    }

    buffer.resize(static_cast<size_t>(frames_read) * channels);
    m_impl->current_frame += frames_read;

    if (m_impl->current_frame >= m_impl->info.frame_count) {
        m_impl->is_eof = true;
    }

    return true;
}

void WavDecoder::close() {
    if (m_impl->is_open) {
        m_impl->cleanup_drwav();
        m_impl->is_open = false;
        m_impl->is_eof = false;
        m_impl->current_frame = 0;
    }
}

AudioInfo WavDecoder::get_info() const {
    return m_impl->info;
}

bool WavDecoder::seek(uint64_t frame) {
    if (!m_impl->is_open || m_impl->info.frame_count == 0) {
        return false;
    }

    if (frame >= m_impl->info.frame_count) {
        frame = m_impl->info.frame_count - 1;
    }

    if (drwav_seek_to_pcm_frame(&m_impl->wav, frame)) {
        m_impl->current_frame = frame;
        m_impl->is_eof = false;
        return true;
    }

    return false;
}

bool WavDecoder::is_eof() const {
    return m_impl->is_eof;
}

std::string WavDecoder::last_error() const {
    return m_impl->error;
}

std::unique_ptr<IAudioDecoder> create_decoder(const std::string& file_path) {
    if (has_wav_extension(file_path)) {
        return std::make_unique<WavDecoder>();
    }

    return nullptr;
}

namespace {

constexpr size_t CHUNK_FRAMES = 4096;

std::unique_ptr<IAudioDecoder> open_or_throw(const std::string& file_path) {
    if (!std::filesystem::is_regular_file(file_path)) {
        throw NotFoundError("No such audio file: " + file_path);
    }

    auto decoder = create_decoder(file_path);
    if (!decoder) {
        throw DecodeError("Not a .wav file: " + file_path);
    }

    if (!decoder->open(file_path)) {
        throw DecodeError("Malformed WAV file " + file_path + ": " + decoder->last_error());
    }

    return decoder;
}

}

AudioInfo probe_wav(const std::string& file_path) {
    auto decoder = open_or_throw(file_path);
    AudioInfo info = decoder->get_info();
    decoder->close();
    return info;
}

AudioFile decode_wav(const std::string& file_path) {
    auto decoder = open_or_throw(file_path);
    AudioInfo info = decoder->get_info();

    AudioFile audio;
    audio.path = file_path;
    audio.sample_rate = info.sample_rate;
    audio.channels = info.channels;
    audio.size_bytes = std::filesystem::file_size(file_path);
    audio.samples.reserve(static_cast<size_t>(info.frame_count) * info.channels);

    std::vector<float> chunk;
    while (!decoder->is_eof() && decoder->decode(chunk, CHUNK_FRAMES)) {
        audio.samples.insert(audio.samples.end(), chunk.begin(), chunk.end());
    }
    decoder->close();

    // The header promised frames but none could be read.
    if (info.frame_count > 0 && audio.samples.empty()) {
        throw DecodeError("Failed to read audio data: " + file_path);
    }

    return audio;
}

AudioFile decode_wav_range(const std::string& file_path, const Selection& range) {
    auto decoder = open_or_throw(file_path);
    AudioInfo info = decoder->get_info();

    if (!range.is_valid_for(static_cast<size_t>(info.frame_count))) {
        throw InvalidArgument("Frame range [" + std::to_string(range.start_sample) + ", " +
                              std::to_string(range.end_sample) + ") is outside " + file_path + " (" +
                              std::to_string(info.frame_count) + " frames)");
    }
    if (!decoder->seek(range.start_sample)) {
        throw DecodeError("Cannot seek to frame " + std::to_string(range.start_sample) + " in " + file_path);
    }

    AudioFile audio;
    audio.path = file_path;
    audio.sample_rate = info.sample_rate;
    audio.channels = info.channels;
    audio.derived = true;

    const size_t channels = static_cast<size_t>(info.channels);
    audio.samples.reserve(range.length() * channels);

    size_t remaining = range.length();
    std::vector<float> chunk;
    while (remaining > 0 && decoder->decode(chunk, std::min(remaining, CHUNK_FRAMES))) {
        audio.samples.insert(audio.samples.end(), chunk.begin(), chunk.end());
        remaining -= chunk.size() / channels;
    }
    decoder->close();

    if (remaining > 0) {
        throw DecodeError("Audio data ends early in " + file_path);
    }

    return audio;
}

void write_wav(const AudioFile& audio, const std::string& file_path) {
    if (audio.sample_rate <= 0 || audio.channels <= 0) {
        throw InvalidArgument("Cannot write audio with an invalid format");
    }

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_IEEE_FLOAT;
    format.channels = static_cast<drwav_uint32>(audio.channels);
    format.sampleRate = static_cast<drwav_uint32>(audio.sample_rate);
    format.bitsPerSample = 32;

    drwav wav;
    if (!drwav_init_file_write(&wav, file_path.c_str(), &format, nullptr)) {
        throw StorageError("Cannot open for writing: " + file_path);
    }

    drwav_uint64 frames = audio.frame_count();
    drwav_uint64 frames_written = drwav_write_pcm_frames(&wav, frames, audio.samples.data());

    drwav_uninit(&wav);

    if (frames_written != frames) {
        throw StorageError("Short write to " + file_path);
    }
}

}
