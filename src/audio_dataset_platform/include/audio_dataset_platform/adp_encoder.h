#pragma once

#include "adp_audio.h"
#include "adp_errors.h"
#include <string>

namespace adp {

// Sample-frames handed to the encoder per AVFrame
constexpr int ENCODE_FRAME_SAMPLES = 1024;

// Write a RIFF/WAVE file: one pcm_f32le stream, buffer's rate and channels.
// Header first, samples in ENCODE_FRAME_SAMPLES chunks, then the trailer.
// A failed write may leave a partial file behind; it is not valid output.
// Errors: WriteFailed, AllocationFailed, InvalidArg
Result<void> Encode(const PcmBuffer& pcm, const std::string& output_path);

} // namespace adp
