#pragma once

#include "adp_audio.h"
#include "adp_errors.h"
#include <cstdint>

namespace adp {

// Anti-aliasing filter constants (not user-tunable)
constexpr int RESAMPLE_FILTER_SIZE = 64;
constexpr int RESAMPLE_PHASE_SHIFT = 10;
constexpr double RESAMPLE_CUTOFF = 0.97;   // fraction of the lower Nyquist frequency

// Input is pushed through the filter in blocks of this many frames
constexpr int RESAMPLE_BLOCK_FRAMES = 4096;

// Convert a buffer to target_rate.
// Same rate: the input is returned untouched (no filter, bit-exact).
// Otherwise: band-limited interpolation, then the filter history is drained
// until it yields nothing more. Channel count is preserved.
// Errors: InvalidArg, ResamplerInitFailed
Result<PcmBuffer> Resample(PcmBuffer input, int32_t target_rate);

} // namespace adp
