#include "sound_editor.hpp"
#include "errors.hpp"
#include "spectrum.hpp"
#include "wav_decoder.hpp"
#include <samplerate.h>
#include <algorithm>
#include <cmath>
#include <random>
#include <string>

namespace clipshelf {

namespace {

constexpr double PI = 3.14159265358979323846;

std::vector<double> channel_samples(const AudioFile& audio, size_t channel) {
    const size_t channels = static_cast<size_t>(audio.channels);
    std::vector<double> values(audio.frame_count());
    for (size_t frame = 0; frame < values.size(); ++frame) {
        values[frame] = audio.samples[frame * channels + channel];
    }
    return values;
}

void store_channel(AudioFile& audio, size_t channel, const std::vector<double>& values) {
    const size_t channels = static_cast<size_t>(audio.channels);
    for (size_t frame = 0; frame < values.size(); ++frame) {
        audio.samples[frame * channels + channel] = static_cast<float>(values[frame]);
    }
}

// Gain of a Butterworth design (bilinear transform, prewarped corners) run
// forwards then backwards, at omega radians per sample.
double zero_phase_gain(const FilterSpec& spec, int sample_rate, double omega) {
    const double warped = std::tan(omega / 2.0);
    auto corner = [sample_rate](double hz) { return std::tan(PI * hz / sample_rate); };

    double ratio = 0.0;
    switch (spec.type) {
        case FilterType::LOW_PASS:
            ratio = warped / corner(spec.cutoff_hz);
            break;
        case FilterType::HIGH_PASS:
            if (warped == 0.0) {
                return 0.0;
            }
            ratio = corner(spec.cutoff_hz) / warped;
            break;
        case FilterType::BAND_PASS: {
            if (warped == 0.0) {
                return 0.0;
            }
            const double low = corner(spec.cutoff_hz);
            const double high = corner(spec.upper_cutoff_hz);
            ratio = (warped * warped - low * high) / (warped * (high - low));
            break;
        }
    }
    return 1.0 / (1.0 + std::pow(std::fabs(ratio), 2.0 * spec.order));
}

void validate_filter(const FilterSpec& spec, int sample_rate) {
    if (sample_rate <= 0) {
        throw InvalidArgument("Cannot filter a clip without a sample rate");
    }
    if (spec.order < 1 || spec.order > 16) {
        throw InvalidArgument("Filter order must be between 1 and 16");
    }

    const double nyquist = sample_rate / 2.0;
    auto audible = [nyquist](double hz) { return std::isfinite(hz) && hz > 0.0 && hz < nyquist; };
    if (!audible(spec.cutoff_hz)) {
        throw InvalidArgument("Cutoff must lie between 0 and " + std::to_string(nyquist) + " Hz");
    }
    if (spec.type == FilterType::BAND_PASS &&
        (!audible(spec.upper_cutoff_hz) || spec.upper_cutoff_hz <= spec.cutoff_hz)) {
        throw InvalidArgument("Upper band edge must lie between the lower edge and " +
                              std::to_string(nyquist) + " Hz");
    }
}

}

AudioFile SoundEditor::crop(const AudioFile& audio, const Selection& selection) const {
    validate(audio, selection);

    const size_t channels = static_cast<size_t>(audio.channels);
    AudioFile result = derive(audio);
    result.samples.assign(audio.samples.begin() + selection.start_sample * channels,
                          audio.samples.begin() + selection.end_sample * channels);
    return result;
}

AudioFile SoundEditor::reverse(const AudioFile& audio, const std::optional<Selection>& selection) const {
    Selection range{0, audio.frame_count()};
    if (selection) {
        validate(audio, *selection);
        range = *selection;
    }

    AudioFile result = derive(audio);
    result.samples = audio.samples;
    if (range.length() < 2) {
        return result;
    }

    // Swap whole frames so the channels stay aligned
    const size_t channels = static_cast<size_t>(audio.channels);
    size_t left = range.start_sample;
    size_t right = range.end_sample - 1;
    while (left < right) {
        std::swap_ranges(result.samples.begin() + left * channels,
                         result.samples.begin() + (left + 1) * channels,
                         result.samples.begin() + right * channels);
        ++left;
        --right;
    }

    return result;
}

AudioFile SoundEditor::remove(const AudioFile& audio, const Selection& selection) const {
    validate(audio, selection);

    const size_t channels = static_cast<size_t>(audio.channels);
    AudioFile result = derive(audio);
    result.samples.reserve(audio.samples.size() - selection.length() * channels);
    result.samples.insert(result.samples.end(), audio.samples.begin(),
                          audio.samples.begin() + selection.start_sample * channels);
    result.samples.insert(result.samples.end(), audio.samples.begin() + selection.end_sample * channels,
                          audio.samples.end());
    return result;
}

AudioFile SoundEditor::gate(const AudioFile& audio, double threshold_db) const {
    if (!std::isfinite(threshold_db) || threshold_db > 0.0) {
        throw InvalidArgument("Gate threshold must be a finite level <= 0 dB");
    }

    AudioFile result = derive(audio);
    result.samples = audio.samples;

    float peak = 0.0f;
    for (float sample : audio.samples) {
        peak = std::max(peak, std::fabs(sample));
    }
    if (peak == 0.0f) {
        return result;
    }

    const float threshold = static_cast<float>(peak * std::pow(10.0, threshold_db / 20.0));
    for (float& sample : result.samples) {
        if (std::fabs(sample) < threshold) {
            sample = 0.0f;
        }
    }

    return result;
}

AudioFile SoundEditor::filter(const AudioFile& audio, const FilterSpec& spec) const {
    validate_filter(spec, audio.sample_rate);

    AudioFile result = derive(audio);
    result.samples = audio.samples;
    const size_t frames = audio.frame_count();
    if (frames == 0) {
        return result;
    }

    RealFft fft(frames);
    std::vector<double> gains(fft.bin_count());
    for (size_t k = 0; k < gains.size(); ++k) {
        gains[k] = zero_phase_gain(spec, audio.sample_rate, 2.0 * PI * k / frames);
    }

    for (size_t channel = 0; channel < static_cast<size_t>(audio.channels); ++channel) {
        Spectrum bins = fft.forward(channel_samples(audio, channel));
        for (size_t k = 0; k < bins.size(); ++k) {
            bins[k] *= gains[k];
        }
        store_channel(result, channel, fft.inverse(bins));
    }

    return result;
}

AudioFile SoundEditor::pitch_shift(const AudioFile& audio, double semitones) const {
    if (!std::isfinite(semitones)) {
        throw InvalidArgument("Pitch shift must be a finite number of semitones");
    }

    AudioFile result = derive(audio);
    result.samples = audio.samples;
    const size_t frames = audio.frame_count();
    if (frames == 0 || semitones == 0.0) {
        return result;
    }

    // Bin k moves to floor(k * factor). Bins landing together add up, bins
    // pushed past Nyquist are dropped.
    const double factor = std::pow(2.0, semitones / 12.0);
    RealFft fft(frames);
    for (size_t channel = 0; channel < static_cast<size_t>(audio.channels); ++channel) {
        Spectrum bins = fft.forward(channel_samples(audio, channel));
        Spectrum shifted(bins.size());
        for (size_t k = 0; k < bins.size(); ++k) {
            const auto target = static_cast<size_t>(static_cast<double>(k) * factor);
            if (target < shifted.size()) {
                shifted[target] += bins[k];
            }
        }
        store_channel(result, channel, fft.inverse(shifted));
    }

    return result;
}

AudioFile SoundEditor::change_speed(const AudioFile& audio, double factor) const {
    if (!std::isfinite(factor) || factor <= 0.0 || !src_is_valid_ratio(1.0 / factor)) {
        throw InvalidArgument("Speed factor must lie between 1/256 and 256");
    }

    AudioFile result = derive(audio);
    const size_t frames = audio.frame_count();
    if (frames == 0) {
        return result;
    }

    const double ratio = 1.0 / factor;
    const size_t channels = static_cast<size_t>(audio.channels);
    const auto capacity = static_cast<size_t>(std::ceil(static_cast<double>(frames) * ratio)) + 1;
    result.samples.resize(capacity * channels);

    SRC_DATA data{};
    data.data_in = audio.samples.data();
    data.data_out = result.samples.data();
    data.input_frames = static_cast<long>(frames);
    data.output_frames = static_cast<long>(capacity);
    data.end_of_input = 1;
    data.src_ratio = ratio;

    int err = src_simple(&data, SRC_SINC_MEDIUM_QUALITY, audio.channels);
    if (err != 0) {
        throw InvalidState(std::string("Resampling failed: ") + src_strerror(err));
    }

    result.samples.resize(static_cast<size_t>(data.output_frames_gen) * channels);
    return result;
}

AudioFile SoundEditor::random_snippet(const AudioFile& audio, uint32_t seed) const {
    const size_t frames = audio.frame_count();
    if (frames == 0) {
        throw InvalidArgument("Cannot take a snippet of an empty clip");
    }

    const size_t shortest = audio.sample_rate > 0
        ? std::min(frames, static_cast<size_t>(audio.sample_rate))
        : frames;

    std::mt19937 random_engine(seed);
    std::uniform_int_distribution<size_t> start_dist(0, frames - shortest);
    const size_t start = start_dist(random_engine);
    std::uniform_int_distribution<size_t> end_dist(start + shortest, frames);
    const size_t end = end_dist(random_engine);

    return crop(audio, Selection{start, end});
}

void SoundEditor::save(const AudioFile& audio, const std::string& file_path) const {
    write_wav(audio, file_path);
}

void SoundEditor::validate(const AudioFile& audio, const Selection& selection) const {
    if (!selection.is_valid_for(audio.frame_count())) {
        throw InvalidArgument("Selection [" + std::to_string(selection.start_sample) + ", " +
                              std::to_string(selection.end_sample) + ") is invalid for a clip of " +
                              std::to_string(audio.frame_count()) + " frames");
    }
}

AudioFile SoundEditor::derive(const AudioFile& audio) const {
    AudioFile result;
    result.path = audio.path;
    result.sample_rate = audio.sample_rate;
    result.channels = audio.channels;
    result.size_bytes = 0;
    result.derived = true;
    return result;
}

const char* filter_type_name(FilterType type) {
    switch (type) {
        case FilterType::LOW_PASS: return "lowpass";
        case FilterType::HIGH_PASS: return "highpass";
        case FilterType::BAND_PASS: return "bandpass";
    }
    return "unknown";
}

FilterType parse_filter_type(const std::string& name) {
    for (FilterType type : {FilterType::LOW_PASS, FilterType::HIGH_PASS, FilterType::BAND_PASS}) {
        if (name == filter_type_name(type)) {
            return type;
        }
    }
    throw InvalidArgument("Unknown filter '" + name + "' (lowpass, highpass or bandpass)");
}

}
