#pragma once

#include "adp_config.h"
#include "adp_errors.h"
#include <string>

namespace adp {

// Run one file end to end: decode -> resample -> normalize -> encode.
// Stages run strictly in order; the decoder and its handles are released
// before resampling starts. Every native handle is released on every path.
// Errors: any stage's error; std::bad_alloc is reported as AllocationFailed
Result<void> ProcessFile(const std::string& input_path,
                         const std::string& output_path,
                         const ProcessorConfig& config);

Result<void> ProcessTask(const Task& task);

// FFmpeg's own log output: fatal only by default, warnings when verbose
void SetCodecLogVerbose(bool verbose);

} // namespace adp
