#include "ffmpeg_resample.h"
#include "ffmpeg_context.h"
#include <cassert>

namespace adp {
namespace impl {

FFmpegResampleContext::~FFmpegResampleContext() {
    if (m_swr_ctx) {
        swr_free(&m_swr_ctx);
    }
}

FFmpegResampleContext::FFmpegResampleContext(FFmpegResampleContext&& other) noexcept
    : m_swr_ctx(other.m_swr_ctx),
      m_dst_sample_rate(other.m_dst_sample_rate),
      m_dst_channels(other.m_dst_channels) {
    other.m_swr_ctx = nullptr;
    other.m_dst_sample_rate = 0;
    other.m_dst_channels = 0;
}

FFmpegResampleContext& FFmpegResampleContext::operator=(FFmpegResampleContext&& other) noexcept {
    if (this != &other) {
        if (m_swr_ctx) {
            swr_free(&m_swr_ctx);
        }
        m_swr_ctx = other.m_swr_ctx;
        m_dst_sample_rate = other.m_dst_sample_rate;
        m_dst_channels = other.m_dst_channels;
        other.m_swr_ctx = nullptr;
        other.m_dst_sample_rate = 0;
        other.m_dst_channels = 0;
    }
    return *this;
}

Result<void> FFmpegResampleContext::init(int src_sample_rate, const AVChannelLayout* src_ch_layout,
                                          AVSampleFormat src_sample_fmt, int dst_sample_rate,
                                          const ResampleFilter* filter) {
    assert(!m_swr_ctx && "Resample context already initialized");

    m_dst_sample_rate = dst_sample_rate;
    m_dst_channels = src_ch_layout->nb_channels;

    int ret = swr_alloc_set_opts2(&m_swr_ctx,
        src_ch_layout,                                // Output: same layout
        AV_SAMPLE_FMT_FLT,                            // Output: float32 interleaved
        dst_sample_rate,
        src_ch_layout,
        src_sample_fmt,
        src_sample_rate,
        0, nullptr);

    if (ret < 0 || !m_swr_ctx) {
        return ffmpeg_error(ErrorCode::ResamplerInitFailed, ret, "swr_alloc_set_opts2");
    }

    // Options must be in place before swr_init builds the filter bank
    if (filter) {
        ret = av_opt_set_int(m_swr_ctx, "filter_size", filter->filter_size, 0);
        if (ret >= 0) ret = av_opt_set_int(m_swr_ctx, "phase_shift", filter->phase_shift, 0);
        if (ret >= 0) ret = av_opt_set_double(m_swr_ctx, "cutoff", filter->cutoff, 0);
        if (ret < 0) {
            swr_free(&m_swr_ctx);
            return ffmpeg_error(ErrorCode::ResamplerInitFailed, ret, "av_opt_set (resample filter)");
        }
    }

    ret = swr_init(m_swr_ctx);
    if (ret < 0) {
        swr_free(&m_swr_ctx);
        return ffmpeg_error(ErrorCode::ResamplerInitFailed, ret,
                            "swr_init(" + std::to_string(src_sample_rate) + " -> " +
                            std::to_string(dst_sample_rate) + ")");
    }

    return Result<void>();
}

int FFmpegResampleContext::convert(const uint8_t** src_data, int src_samples,
                                   float* dst_data, int dst_max_samples) {
    assert(m_swr_ctx && "Resample context not initialized");

    uint8_t* dst_planes[1] = { reinterpret_cast<uint8_t*>(dst_data) };

    return swr_convert(m_swr_ctx, dst_planes, dst_max_samples,
                       src_data, src_samples);
}

int FFmpegResampleContext::flush(float* dst_data, int dst_max_samples) {
    assert(m_swr_ctx && "Resample context not initialized");

    uint8_t* dst_planes[1] = { reinterpret_cast<uint8_t*>(dst_data) };

    return swr_convert(m_swr_ctx, dst_planes, dst_max_samples, nullptr, 0);
}

int FFmpegResampleContext::get_out_samples(int in_samples) const {
    assert(m_swr_ctx && "Resample context not initialized");
    return swr_get_out_samples(m_swr_ctx, in_samples);
}

} // namespace impl
} // namespace adp
