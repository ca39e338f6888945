#include "waveform_renderer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace clipshelf {

namespace {

void check_width(int target_width) {
    if (target_width < 1) {
        throw InvalidArgument("Waveform width must be at least 1 pixel, got " + std::to_string(target_width));
    }
}

}

Waveform WaveformRenderer::render(const AudioFile& audio, int target_width) const {
    check_width(target_width);
    return render_frames(audio, 0, audio.frame_count(), target_width);
}

Waveform WaveformRenderer::render_range(const AudioFile& audio, const Selection& selection,
                                        int target_width) const {
    check_width(target_width);
    if (!selection.is_valid_for(audio.frame_count())) {
        throw InvalidArgument("Selection [" + std::to_string(selection.start_sample) + ", " +
                              std::to_string(selection.end_sample) + ") is outside the clip");
    }
    return render_frames(audio, selection.start_sample, selection.length(), target_width);
}

Selection WaveformRenderer::map_pixel_range_to_samples(const AudioFile& audio, int target_width,
                                                       int pixel_start, int pixel_end) const {
    check_width(target_width);
    if (pixel_start >= pixel_end) {
        throw InvalidArgument("Pixel range is empty: " + std::to_string(pixel_start) + " >= " +
                              std::to_string(pixel_end));
    }

    const double frames = static_cast<double>(audio.frame_count());
    auto to_frame = [&](int pixel) {
        double position = std::round(pixel * frames / target_width);
        return static_cast<size_t>(std::clamp(position, 0.0, frames));
    };

    Selection selection{to_frame(pixel_start), to_frame(pixel_end)};
    if (selection.start_sample >= selection.end_sample) {
        throw InvalidArgument("Pixel range does not cover any samples");
    }

    return selection;
}

int WaveformRenderer::sample_to_pixel(const AudioFile& audio, int target_width, size_t sample) const {
    check_width(target_width);

    const size_t frames = audio.frame_count();
    if (frames == 0) {
        return 0;
    }

    auto pixel = static_cast<uint64_t>(sample) * static_cast<uint64_t>(target_width) / frames;
    return static_cast<int>(std::min<uint64_t>(pixel, static_cast<uint64_t>(target_width - 1)));
}

Waveform WaveformRenderer::render_frames(const AudioFile& audio, size_t first_frame, size_t frame_count,
                                         int target_width) const {
    Waveform peaks(static_cast<size_t>(target_width));
    if (frame_count == 0) {
        return peaks;
    }

    const size_t channels = static_cast<size_t>(audio.channels);
    const uint64_t width = static_cast<uint64_t>(target_width);

    for (uint64_t column = 0; column < width; ++column) {
        size_t begin = static_cast<size_t>(column * frame_count / width);
        size_t end = static_cast<size_t>((column + 1) * frame_count / width);

        // More columns than frames: reuse the frame under this column
        if (end <= begin) {
            begin = std::min(begin, frame_count - 1);
            end = begin + 1;
        }

        auto first = audio.samples.begin() + (first_frame + begin) * channels;
        auto last = audio.samples.begin() + (first_frame + end) * channels;
        auto extremes = std::minmax_element(first, last);

        peaks[column].min = *extremes.first;
        peaks[column].max = *extremes.second;
    }

    return peaks;
}

}
