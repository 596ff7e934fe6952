#include <audio_dataset_platform/adp_pipeline.h>
#include <audio_dataset_platform/adp_decoder.h>
#include <audio_dataset_platform/adp_encoder.h>
#include <audio_dataset_platform/adp_normalizer.h>
#include <audio_dataset_platform/adp_resampler.h>
#include "impl/ffmpeg_context.h"
#include <new>

namespace adp {

namespace {

Result<void> run_stages(const std::string& input_path,
                        const std::string& output_path,
                        const ProcessorConfig& config) {
    PcmBuffer decoded;
    {
        // Decoder scope: demuxer and codec are gone before the resampler allocates
        auto decoder = Decoder::Open(input_path);
        if (decoder.is_error()) {
            return decoder.error();
        }

        DecodeLimit limit{config.target_sample_rate, config.max_duration_seconds};
        auto pcm = decoder.value()->Decode(limit);
        if (pcm.is_error()) {
            return pcm.error();
        }
        decoded = std::move(pcm.value());
    }

    auto resampled = Resample(std::move(decoded), config.target_sample_rate);
    if (resampled.is_error()) {
        return resampled.error();
    }

    auto normalized = Normalize(std::move(resampled.value()),
                                config.min_duration_seconds,
                                config.max_duration_seconds);
    if (normalized.is_error()) {
        return normalized.error();
    }

    return Encode(normalized.value(), output_path);
}

} // anonymous namespace

Result<void> ProcessFile(const std::string& input_path,
                         const std::string& output_path,
                         const ProcessorConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return valid.error();
    }

    try {
        return run_stages(input_path, output_path, config);
    } catch (const std::bad_alloc&) {
        return Error::allocation_failed("sample buffer for " + input_path);
    }
}

Result<void> ProcessTask(const Task& task) {
    return ProcessFile(task.input_path, task.output_path, task.config);
}

void SetCodecLogVerbose(bool verbose) {
    impl::set_ffmpeg_log_verbose(verbose);
}

} // namespace adp
