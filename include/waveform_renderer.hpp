#pragma once

#include "types.hpp"

namespace clipshelf {

// Peak-envelope downsampling for display, and the pixel <-> frame mapping
// used to turn a drag on the waveform into a Selection.
class WaveformRenderer {
public:
    // One {min, max} pair per pixel column across all channels.
    Waveform render(const AudioFile& audio, int target_width) const;

    // Same as render() restricted to the selected frames (zoomed view).
    Waveform render_range(const AudioFile& audio, const Selection& selection, int target_width) const;

    Selection map_pixel_range_to_samples(const AudioFile& audio, int target_width,
                                         int pixel_start, int pixel_end) const;

    // Playhead column for a frame index.
    int sample_to_pixel(const AudioFile& audio, int target_width, size_t sample) const;

private:
    Waveform render_frames(const AudioFile& audio, size_t first_frame, size_t frame_count,
                           int target_width) const;
};

}
