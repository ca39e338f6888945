#pragma once

#include "types.hpp"
#include <memory>
#include <string>

namespace clipshelf {

class IAudioDecoder {
public:
    virtual ~IAudioDecoder() = default;
    virtual bool open(const std::string& file_path) = 0;
    virtual bool decode(std::vector<float>& buffer, size_t max_frames) = 0;
    virtual void close() = 0;
    virtual AudioInfo get_info() const = 0;
    virtual bool seek(uint64_t frame) = 0;
    virtual bool is_eof() const = 0;
    virtual std::string last_error() const = 0;
};

class WavDecoder : public IAudioDecoder {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    WavDecoder();
    ~WavDecoder() override;

    bool open(const std::string& file_path) override;
    bool decode(std::vector<float>& buffer, size_t max_frames) override;
    void close() override;
    AudioInfo get_info() const override;
    bool seek(uint64_t frame) override;
    bool is_eof() const override;
    std::string last_error() const override;
};

std::unique_ptr<IAudioDecoder> create_decoder(const std::string& file_path);

// Reads only the header. Throws NotFoundError or DecodeError.
AudioInfo probe_wav(const std::string& file_path);

// Decodes the whole file. Throws NotFoundError or DecodeError.
AudioFile decode_wav(const std::string& file_path);

// Decodes frames [start, end) only, seeking past the rest. The result is
// marked derived. Throws NotFoundError, DecodeError, or InvalidArgument for
// a range outside the file.
AudioFile decode_wav_range(const std::string& file_path, const Selection& range);

// Writes 32-bit float PCM. Throws StorageError.
void write_wav(const AudioFile& audio, const std::string& file_path);

}
