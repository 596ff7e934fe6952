#pragma once

#include "adp_errors.h"
#include <cstdint>
#include <string>

namespace adp {

// Upper bound on the frames one output file may hold (about 37 hours at 16 kHz).
// Keeps every duration * rate product representable as a frame count.
constexpr int64_t MAX_OUTPUT_FRAMES = 2147483647;

// Per-batch processing parameters, copied by value into every Task
struct ProcessorConfig {
    int32_t target_sample_rate = 16000;
    double min_duration_seconds = 3.0;
    double max_duration_seconds = 5.0;

    // Rejects configurations the normalizer cannot honor.
    // min > max is an error rather than "first branch wins".
    Result<void> validate() const;
};

// One unit of work: a single input file and where its result goes
struct Task {
    std::string input_path;
    std::string output_path;
    ProcessorConfig config;
};

} // namespace adp
