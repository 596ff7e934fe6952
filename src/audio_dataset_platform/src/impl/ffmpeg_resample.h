#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libavutil/opt.h>
}

#include <audio_dataset_platform/adp_errors.h>
#include <cstdint>

namespace adp {
namespace impl {

// Anti-aliasing filter setup applied when the rates differ.
// Fixed constants: output must not depend on tuning.
struct ResampleFilter {
    int filter_size;     // taps at the lower of the two rates
    int phase_shift;     // log2 of the number of polyphase entries
    double cutoff;       // relative to the lower Nyquist frequency
};

// SwrContext wrapper
// Converts any input format/layout to interleaved float32 at the target
// rate. Channel count is preserved; only the time axis changes.
class FFmpegResampleContext {
public:
    FFmpegResampleContext() = default;
    ~FFmpegResampleContext();

    // Non-copyable
    FFmpegResampleContext(const FFmpegResampleContext&) = delete;
    FFmpegResampleContext& operator=(const FFmpegResampleContext&) = delete;

    // Move semantics
    FFmpegResampleContext(FFmpegResampleContext&& other) noexcept;
    FFmpegResampleContext& operator=(FFmpegResampleContext&& other) noexcept;

    // Initialize for conversion from the source format to float32 interleaved
    // at dst_sample_rate, keeping the source layout.
    // filter == nullptr leaves swresample defaults (format conversion only).
    Result<void> init(int src_sample_rate, const AVChannelLayout* src_ch_layout,
                      AVSampleFormat src_sample_fmt, int dst_sample_rate,
                      const ResampleFilter* filter);

    // Resample audio data
    // Returns number of output samples per channel, or a negative FFmpeg error
    // Output buffer must hold dst_max_samples * channels() floats
    int convert(const uint8_t** src_data, int src_samples,
                float* dst_data, int dst_max_samples);

    // Drain samples still held in the filter history
    // Returns 0 once nothing is left
    int flush(float* dst_data, int dst_max_samples);

    // Upper bound on output samples for in_samples more input
    int get_out_samples(int in_samples) const;

    int channels() const { return m_dst_channels; }
    SwrContext* get() const { return m_swr_ctx; }

private:
    SwrContext* m_swr_ctx = nullptr;
    int m_dst_sample_rate = 0;
    int m_dst_channels = 0;
};

} // namespace impl
} // namespace adp
