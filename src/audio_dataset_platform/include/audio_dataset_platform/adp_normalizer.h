#pragma once

#include "adp_audio.h"
#include "adp_errors.h"
#include <cstdint>

namespace adp {

// floor(duration_s * sample_rate): frame count of a duration at a rate
int64_t TargetFrames(double duration_s, int32_t sample_rate);

// Fit a buffer into [min_s, max_s] at its current sample rate.
// Must run after resampling: the thresholds are counted in target-rate frames.
//   longer than max_s  -> hard clip to TargetFrames(max_s)
//   shorter than min_s -> zero-pad to TargetFrames(min_s)
//   otherwise          -> returned unchanged (both bounds inclusive)
// Errors: InvalidArg (malformed buffer, min_s > max_s)
Result<PcmBuffer> Normalize(PcmBuffer input, double min_s, double max_s);

} // namespace adp
