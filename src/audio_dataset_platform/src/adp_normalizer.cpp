#include <audio_dataset_platform/adp_normalizer.h>
#include <audio_dataset_platform/adp_config.h>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>

namespace adp {

int64_t TargetFrames(double duration_s, int32_t sample_rate) {
    if (!(duration_s > 0.0) || sample_rate <= 0) {
        return 0;
    }
    const double frames = std::floor(duration_s * static_cast<double>(sample_rate));
    // 2^63 is exact in double; anything at or past it saturates
    if (frames >= 9223372036854775808.0) {
        return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(frames);
}

Result<PcmBuffer> Normalize(PcmBuffer input, double min_s, double max_s) {
    if (!input.is_well_formed()) {
        return Error::invalid_arg("Normalize: malformed PCM buffer");
    }
    if (min_s > max_s) {
        return Error::invalid_arg("Normalize: min duration " + std::to_string(min_s) +
                                  " exceeds max duration " + std::to_string(max_s));
    }
    if (TargetFrames(max_s, input.sample_rate) > MAX_OUTPUT_FRAMES) {
        return Error::invalid_arg("Normalize: max duration " + std::to_string(max_s) +
                                  "s is more than " + std::to_string(MAX_OUTPUT_FRAMES) + " frames");
    }

    const double duration = input.duration_seconds();
    const size_t channels = static_cast<size_t>(input.channels);

    if (duration > max_s) {
        // Hard clip: keep the leading frames, no fade
        const int64_t keep = TargetFrames(max_s, input.sample_rate);
        input.samples.resize(static_cast<size_t>(keep) * channels);
        input.samples.shrink_to_fit();
    } else if (duration < min_s) {
        // Zero-pad at the end
        const int64_t target = TargetFrames(min_s, input.sample_rate);
        if (target > input.frames()) {
            input.samples.resize(static_cast<size_t>(target) * channels, 0.0f);
        }
    }

    return std::move(input);
}

} // namespace adp
