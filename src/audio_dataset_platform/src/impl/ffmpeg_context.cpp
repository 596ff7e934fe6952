#include "ffmpeg_context.h"
#include <cassert>
#include <mutex>

namespace adp {
namespace impl {

Error ffmpeg_error(ErrorCode code, int errnum, const std::string& context) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    return Error{code, context + ": " + errbuf};
}

void init_ffmpeg_logging() {
    // Corrupt inputs make demuxers/decoders print per-packet warnings.
    // Those are reported once per file through Result instead.
    static std::once_flag s_ffmpeg_log_init;
    std::call_once(s_ffmpeg_log_init, [] {
        av_log_set_level(AV_LOG_FATAL);
    });
}

void set_ffmpeg_log_verbose(bool verbose) {
    init_ffmpeg_logging();
    av_log_set_level(verbose ? AV_LOG_WARNING : AV_LOG_FATAL);
}

// FFmpegFormatContext implementation

FFmpegFormatContext::~FFmpegFormatContext() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
}

FFmpegFormatContext::FFmpegFormatContext(FFmpegFormatContext&& other) noexcept
    : m_fmt_ctx(other.m_fmt_ctx),
      m_audio_stream_idx(other.m_audio_stream_idx) {
    other.m_fmt_ctx = nullptr;
    other.m_audio_stream_idx = -1;
}

FFmpegFormatContext& FFmpegFormatContext::operator=(FFmpegFormatContext&& other) noexcept {
    if (this != &other) {
        if (m_fmt_ctx) {
            avformat_close_input(&m_fmt_ctx);
        }
        m_fmt_ctx = other.m_fmt_ctx;
        m_audio_stream_idx = other.m_audio_stream_idx;
        other.m_fmt_ctx = nullptr;
        other.m_audio_stream_idx = -1;
    }
    return *this;
}

Result<void> FFmpegFormatContext::open(const std::string& path) {
    assert(!m_fmt_ctx && "Format context already opened");

    // On failure avformat_open_input frees the context and nulls the pointer
    int ret = avformat_open_input(&m_fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ErrorCode::OpenFailed, ret, "avformat_open_input(" + path + ")");
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ErrorCode::OpenFailed, ret, "avformat_find_stream_info(" + path + ")");
    }

    return Result<void>();
}

int FFmpegFormatContext::find_audio_stream() {
    assert(m_fmt_ctx && "Format context not opened");

    m_audio_stream_idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_AUDIO,
                                              -1, -1, nullptr, 0);
    return m_audio_stream_idx;
}

AVStream* FFmpegFormatContext::audio_stream() const {
    if (m_audio_stream_idx < 0) return nullptr;
    return m_fmt_ctx->streams[m_audio_stream_idx];
}

AVCodecParameters* FFmpegFormatContext::audio_codec_params() const {
    AVStream* stream = audio_stream();
    return stream ? stream->codecpar : nullptr;
}

// FFmpegOutputContext implementation

FFmpegOutputContext::~FFmpegOutputContext() {
    if (!m_fmt_ctx) {
        return;
    }
    if (m_io_open) {
        // Only reached on an error path; the caller already holds that error
        avio_closep(&m_fmt_ctx->pb);
    }
    avformat_free_context(m_fmt_ctx);
}

Result<void> FFmpegOutputContext::alloc(const char* format_name, const std::string& path) {
    assert(!m_fmt_ctx && "Output context already allocated");

    int ret = avformat_alloc_output_context2(&m_fmt_ctx, nullptr, format_name, path.c_str());
    if (ret == AVERROR(ENOMEM)) {
        return Error::allocation_failed("output format context");
    }
    if (ret < 0 || !m_fmt_ctx) {
        return ffmpeg_error(ErrorCode::WriteFailed, ret,
                            std::string("avformat_alloc_output_context2(") + format_name + ")");
    }

    // No library version tag in the header: same samples, same bytes
    m_fmt_ctx->flags |= AVFMT_FLAG_BITEXACT;
    return Result<void>();
}

Result<void> FFmpegOutputContext::open_io(const std::string& path) {
    assert(m_fmt_ctx && "Output context not allocated");

    if (m_fmt_ctx->oformat->flags & AVFMT_NOFILE) {
        return Result<void>();
    }

    int ret = avio_open(&m_fmt_ctx->pb, path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
        return ffmpeg_error(ErrorCode::WriteFailed, ret, "avio_open(" + path + ")");
    }
    m_io_open = true;
    return Result<void>();
}

Result<void> FFmpegOutputContext::finish() {
    assert(m_fmt_ctx && "Output context not allocated");

    // Trailer patches the RIFF and data chunk sizes
    int trailer_ret = av_write_trailer(m_fmt_ctx);

    int close_ret = 0;
    if (m_io_open) {
        close_ret = avio_closep(&m_fmt_ctx->pb);
        m_io_open = false;
    }

    if (trailer_ret < 0) {
        return ffmpeg_error(ErrorCode::WriteFailed, trailer_ret, "av_write_trailer");
    }
    if (close_ret < 0) {
        return ffmpeg_error(ErrorCode::WriteFailed, close_ret, "avio_closep");
    }
    return Result<void>();
}

// FFmpegCodecContext implementation

FFmpegCodecContext::~FFmpegCodecContext() {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
}

FFmpegCodecContext::FFmpegCodecContext(FFmpegCodecContext&& other) noexcept
    : m_codec_ctx(other.m_codec_ctx) {
    other.m_codec_ctx = nullptr;
}

FFmpegCodecContext& FFmpegCodecContext::operator=(FFmpegCodecContext&& other) noexcept {
    if (this != &other) {
        if (m_codec_ctx) {
            avcodec_free_context(&m_codec_ctx);
        }
        m_codec_ctx = other.m_codec_ctx;
        other.m_codec_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegCodecContext::init_decoder(const AVCodecParameters* params) {
    assert(!m_codec_ctx && "Codec context already initialized");

    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        return Error::unsupported_codec(std::string("No decoder for codec ") +
                                        avcodec_get_name(params->codec_id));
    }

    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::allocation_failed("decoder context");
    }

    int ret = avcodec_parameters_to_context(m_codec_ctx, params);
    if (ret < 0) {
        return ffmpeg_error(ErrorCode::UnsupportedCodec, ret, "avcodec_parameters_to_context");
    }

    ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ErrorCode::UnsupportedCodec, ret,
                            std::string("avcodec_open2(") + codec->name + ")");
    }

    return Result<void>();
}

Result<void> FFmpegCodecContext::init_pcm_f32_encoder(int sample_rate, int channels,
                                                      bool global_header) {
    assert(!m_codec_ctx && "Codec context already initialized");

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_PCM_F32LE);
    if (!codec) {
        return Error::write_failed("No pcm_f32le encoder in this FFmpeg build");
    }

    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::allocation_failed("encoder context");
    }

    m_codec_ctx->sample_fmt = AV_SAMPLE_FMT_FLT;
    m_codec_ctx->sample_rate = sample_rate;
    av_channel_layout_default(&m_codec_ctx->ch_layout, channels);
    m_codec_ctx->time_base = AVRational{1, sample_rate};
    m_codec_ctx->bit_rate = static_cast<int64_t>(sample_rate) * channels * 32;
    m_codec_ctx->flags |= AV_CODEC_FLAG_BITEXACT;
    if (global_header) {
        m_codec_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    int ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ErrorCode::WriteFailed, ret, "avcodec_open2(pcm_f32le)");
    }

    return Result<void>();
}

// Utility functions

Result<void> resolve_channel_layout(const AVChannelLayout* src, AVChannelLayout* dst) {
    if (src->nb_channels <= 0) {
        return Error::decode_failed("Audio stream reports no channels");
    }

    if (src->order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(dst, src->nb_channels);
        return Result<void>();
    }

    int ret = av_channel_layout_copy(dst, src);
    if (ret < 0) {
        return ffmpeg_error(ErrorCode::AllocationFailed, ret, "av_channel_layout_copy");
    }
    return Result<void>();
}

} // namespace impl
} // namespace adp
