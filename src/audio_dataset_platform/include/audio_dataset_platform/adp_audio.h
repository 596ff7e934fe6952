#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace adp {

// Decoded audio held between pipeline stages.
// Interleaved float32: samples.size() is always a multiple of channels.
// Each stage takes a buffer by value and returns a new one; the caller
// moves its buffer in and never touches it again.
struct PcmBuffer {
    std::vector<float> samples;
    int32_t sample_rate = 0;
    int32_t channels = 0;

    // Number of sample-frames (samples per channel)
    int64_t frames() const {
        if (channels <= 0) return 0;
        return static_cast<int64_t>(samples.size()) / channels;
    }

    // Length in seconds at the current sample rate
    double duration_seconds() const {
        if (sample_rate <= 0) return 0.0;
        return static_cast<double>(frames()) / sample_rate;
    }

    // Rate/channels positive and no partial frame at the tail
    bool is_well_formed() const {
        return sample_rate > 0 && channels > 0 &&
               samples.size() % static_cast<size_t>(channels) == 0;
    }
};

} // namespace adp
