#pragma once

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace clipshelf {

enum class FilterType {
    LOW_PASS,
    HIGH_PASS,
    BAND_PASS
};

// Butterworth response applied forwards and backwards, so the result has no
// phase shift and the squared magnitude of an order-N design. Corner
// frequencies are in Hz; band-pass passes [cutoff_hz, upper_cutoff_hz].
struct FilterSpec {
    FilterType type{FilterType::LOW_PASS};
    double cutoff_hz{0.0};
    double upper_cutoff_hz{0.0};
    int order{4};
};

// Region edits. Every operation returns a new, derived AudioFile and leaves
// its input untouched.
class SoundEditor {
public:
    AudioFile crop(const AudioFile& audio, const Selection& selection) const;
    AudioFile reverse(const AudioFile& audio, const std::optional<Selection>& selection = std::nullopt) const;
    AudioFile remove(const AudioFile& audio, const Selection& selection) const;
    AudioFile gate(const AudioFile& audio, double threshold_db) const;

    AudioFile filter(const AudioFile& audio, const FilterSpec& spec) const;
    // Moves every frequency by 2^(semitones/12), keeping the duration.
    AudioFile pitch_shift(const AudioFile& audio, double semitones) const;
    // Resamples so the clip plays factor times faster at its own rate.
    // Pitch moves with the speed.
    AudioFile change_speed(const AudioFile& audio, double factor) const;
    // A random stretch of at least one second (the whole clip when shorter).
    // The same seed picks the same stretch.
    AudioFile random_snippet(const AudioFile& audio, uint32_t seed) const;

    // Writes the clip as 32-bit float WAV.
    void save(const AudioFile& audio, const std::string& file_path) const;

private:
    void validate(const AudioFile& audio, const Selection& selection) const;
    AudioFile derive(const AudioFile& audio) const;
};

const char* filter_type_name(FilterType type);
// "lowpass", "highpass" or "bandpass". Throws InvalidArgument.
FilterType parse_filter_type(const std::string& name);

}
