#include <audio_dataset_platform/adp_config.h>
#include <cmath>
#include <string>

namespace adp {

Result<void> ProcessorConfig::validate() const {
    if (target_sample_rate <= 0) {
        return Error::invalid_config("sample rate must be positive, got " +
                                     std::to_string(target_sample_rate));
    }
    if (!std::isfinite(min_duration_seconds) || min_duration_seconds < 0.0) {
        return Error::invalid_config("min duration must be a non-negative number");
    }
    if (!std::isfinite(max_duration_seconds) || max_duration_seconds <= 0.0) {
        return Error::invalid_config("max duration must be a positive number");
    }
    if (min_duration_seconds > max_duration_seconds) {
        return Error::invalid_config("min duration (" + std::to_string(min_duration_seconds) +
                                     "s) exceeds max duration (" +
                                     std::to_string(max_duration_seconds) + "s)");
    }
    if (max_duration_seconds * static_cast<double>(target_sample_rate) >
        static_cast<double>(MAX_OUTPUT_FRAMES)) {
        return Error::invalid_config("max duration (" + std::to_string(max_duration_seconds) +
                                     "s) exceeds " + std::to_string(MAX_OUTPUT_FRAMES) +
                                     " frames at " + std::to_string(target_sample_rate) + " Hz");
    }
    return Result<void>();
}

} // namespace adp
