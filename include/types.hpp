#pragma once

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <functional>
#include <cstdint>
#include <cstddef>

namespace clipshelf {

enum class PlaybackState {
    STOPPED,
    PLAYING,
    PAUSED
};

enum class PlaybackDirection {
    FORWARD,
    REVERSE
};

struct AudioFormat {
    int sample_rate{44100};
    int channels{2};
    int bits_per_sample{16};
};

// Header-level stats, available without decoding the sample data.
struct AudioInfo {
    int sample_rate{0};
    int channels{0};
    uint64_t frame_count{0};
    double duration{0.0};
};

// Decoded clip. Samples are interleaved floats in [-1, 1].
struct AudioFile {
    std::string path;
    std::vector<float> samples;
    int sample_rate{0};
    int channels{1};
    uint64_t size_bytes{0};
    // Set on clips produced by the editor that have not been written to disk.
    bool derived{false};

    size_t frame_count() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }

    double duration() const {
        return sample_rate > 0 ? static_cast<double>(frame_count()) / sample_rate : 0.0;
    }

    AudioFormat format() const {
        return AudioFormat{sample_rate, channels, 16};
    }
};

struct MetadataRecord {
    std::string path;
    std::set<std::string> tags;
    std::string description;
    double cached_duration{0.0};
    int cached_sample_rate{0};
    int cached_channels{0};
    uint64_t cached_size{0};
    int64_t cached_mtime{0};  // file clock, nanoseconds
};

// Half-open frame range [start_sample, end_sample).
struct Selection {
    size_t start_sample{0};
    size_t end_sample{0};

    size_t length() const { return end_sample - start_sample; }

    bool is_valid_for(size_t frame_count) const {
        return start_sample < end_sample && end_sample <= frame_count;
    }
};

struct PeakPair {
    float min{0.0f};
    float max{0.0f};
};

struct ScannedFile {
    std::string path;
    uint64_t size_bytes{0};
    int64_t modified{0};
};

// A file or directory that could not be read or decoded.
struct FileFailure {
    std::string path;
    std::string message;
};

using FileList = std::vector<ScannedFile>;

// Files found by a directory walk. A directory listed in failures was not
// fully enumerated, so files beneath it may be missing from the list.
struct ScanResult {
    FileList files;
    std::vector<FileFailure> failures;
};

struct ReconcileReport {
    size_t added{0};
    size_t removed{0};
    size_t refreshed{0};
    std::vector<FileFailure> failures;
};

using AudioBuffer = std::vector<int16_t>;
using RecordList = std::vector<MetadataRecord>;
using Waveform = std::vector<PeakPair>;
using PlaybackCallback = std::function<void(PlaybackState)>;
using ProgressCallback = std::function<void(size_t)>;

}
