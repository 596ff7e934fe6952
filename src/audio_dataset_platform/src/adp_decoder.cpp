#include <audio_dataset_platform/adp_decoder.h>
#include <audio_dataset_platform/adp_resampler.h>
#include "impl/ffmpeg_context.h"
#include "impl/ffmpeg_resample.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <limits>

namespace adp {

// DecoderImpl holds FFmpeg decode state for one file
class DecoderImpl {
public:
    DecoderImpl() = default;

    ~DecoderImpl() {
        av_channel_layout_uninit(&ch_layout);
    }

    DecoderImpl(const DecoderImpl&) = delete;
    DecoderImpl& operator=(const DecoderImpl&) = delete;

    impl::FFmpegFormatContext fmt_ctx;
    impl::FFmpegCodecContext codec_ctx;
    impl::FFmpegResampleContext convert_ctx;  // sample format -> interleaved float, same rate
    impl::FFmpegPacket pkt;
    impl::FFmpegFrame frame;
    AVChannelLayout ch_layout{};
    bool decoded = false;

    // Convert one decoded frame and append it to out
    Result<void> append_frame(std::vector<float>& out);

    // Pull every frame the decoder has ready
    Result<void> receive_frames(std::vector<float>& out);

    // Drain samples the format converter still holds
    Result<void> flush_converter(std::vector<float>& out);
};

Result<void> DecoderImpl::append_frame(std::vector<float>& out) {
    AVFrame* f = frame.get();
    const int channels = convert_ctx.channels();

    int max_out = convert_ctx.get_out_samples(f->nb_samples);
    if (max_out < 0) {
        return impl::ffmpeg_error(ErrorCode::DecodeFailed, max_out, "swr_get_out_samples");
    }

    size_t current_size = out.size();
    out.resize(current_size + static_cast<size_t>(max_out) * channels);

    int converted = convert_ctx.convert(const_cast<const uint8_t**>(f->extended_data),
                                        f->nb_samples,
                                        out.data() + current_size,
                                        max_out);
    if (converted < 0) {
        out.resize(current_size);
        return impl::ffmpeg_error(ErrorCode::DecodeFailed, converted, "swr_convert (decode)");
    }

    // Adjust buffer to actual output size
    out.resize(current_size + static_cast<size_t>(converted) * channels);
    return Result<void>();
}

Result<void> DecoderImpl::receive_frames(std::vector<float>& out) {
    AVCodecContext* codec = codec_ctx.get();

    while (true) {
        int ret = avcodec_receive_frame(codec, frame.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return Result<void>();
        }
        if (ret == AVERROR_INVALIDDATA) {
            // Damaged frame: drop it, frames behind it may still be queued
            continue;
        }
        if (ret < 0) {
            return impl::ffmpeg_error(ErrorCode::DecodeFailed, ret, "avcodec_receive_frame");
        }

        auto appended = append_frame(out);
        av_frame_unref(frame.get());
        if (appended.is_error()) {
            return appended.error();
        }
    }
}

Result<void> DecoderImpl::flush_converter(std::vector<float>& out) {
    constexpr int FLUSH_CHUNK_FRAMES = 1024;
    const int channels = convert_ctx.channels();

    while (true) {
        size_t current_size = out.size();
        out.resize(current_size + static_cast<size_t>(FLUSH_CHUNK_FRAMES) * channels);

        int flushed = convert_ctx.flush(out.data() + current_size, FLUSH_CHUNK_FRAMES);
        if (flushed < 0) {
            out.resize(current_size);
            return impl::ffmpeg_error(ErrorCode::DecodeFailed, flushed, "swr_convert (flush)");
        }

        out.resize(current_size + static_cast<size_t>(flushed) * channels);
        if (flushed == 0) {
            return Result<void>();
        }
    }
}

// Decoder implementation

Decoder::Decoder(std::unique_ptr<DecoderImpl> impl, DecoderInfo info)
    : m_impl(std::move(impl)), m_info(std::move(info)) {
    assert(m_impl && "Decoder impl cannot be null");
}

Decoder::~Decoder() = default;

const DecoderInfo& Decoder::info() const {
    return m_info;
}

int64_t Decoder::StopFrames(int32_t source_rate, const DecodeLimit& limit) {
    assert(source_rate > 0 && limit.target_sample_rate > 0);

    double stop = std::ceil(limit.max_duration_seconds * static_cast<double>(source_rate));

    // Identity resample: every kept sample is a decoded sample
    if (source_rate != limit.target_sample_rate) {
        // swresample widens the filter by 1/factor when downsampling
        const double factor = std::min(
            1.0, static_cast<double>(limit.target_sample_rate) * RESAMPLE_CUTOFF / source_rate);
        stop += std::ceil(RESAMPLE_FILTER_SIZE / factor);
    }

    // Past 2^63 frames there is no early stop to make
    if (!(stop < 9223372036854775808.0)) {
        return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(stop);
}

Result<std::unique_ptr<Decoder>> Decoder::Open(const std::string& path) {
    impl::init_ffmpeg_logging();

    auto impl = std::make_unique<DecoderImpl>();
    if (!impl->pkt || !impl->frame) {
        return Error::allocation_failed("packet/frame");
    }

    auto open_result = impl->fmt_ctx.open(path);
    if (open_result.is_error()) {
        return open_result.error();
    }

    // At most one audio stream is used; video/subtitle streams are ignored
    if (impl->fmt_ctx.find_audio_stream() < 0) {
        return Error::no_audio_stream(path);
    }

    auto codec_result = impl->codec_ctx.init_decoder(impl->fmt_ctx.audio_codec_params());
    if (codec_result.is_error()) {
        return codec_result.error();
    }

    AVCodecContext* codec = impl->codec_ctx.get();
    if (codec->sample_rate <= 0) {
        return Error::decode_failed("Audio stream reports no sample rate: " + path);
    }

    auto layout_result = impl::resolve_channel_layout(&codec->ch_layout, &impl->ch_layout);
    if (layout_result.is_error()) {
        return layout_result.error();
    }

    // Format conversion only: rate in == rate out
    auto convert_result = impl->convert_ctx.init(codec->sample_rate, &impl->ch_layout,
                                                 codec->sample_fmt, codec->sample_rate,
                                                 nullptr);
    if (convert_result.is_error()) {
        return convert_result.error();
    }

    DecoderInfo info;
    info.path = path;
    info.codec_name = avcodec_get_name(codec->codec_id);
    info.sample_rate = codec->sample_rate;
    info.channels = impl->ch_layout.nb_channels;

    // Duration in microseconds - try format, then stream
    AVFormatContext* fmt = impl->fmt_ctx.get();
    AVStream* stream = impl->fmt_ctx.audio_stream();
    if (fmt->duration != AV_NOPTS_VALUE) {
        info.duration_us = fmt->duration;  // AV_TIME_BASE is microseconds
    } else if (stream->duration != AV_NOPTS_VALUE) {
        info.duration_us = av_rescale_q(stream->duration, stream->time_base, AVRational{1, 1000000});
    } else {
        info.duration_us = 0;
    }

    return std::make_unique<Decoder>(std::move(impl), std::move(info));
}

Result<PcmBuffer> Decoder::Decode(const std::optional<DecodeLimit>& limit) {
    if (m_impl->decoded) {
        return Error::invalid_arg("Decoder::Decode called twice for " + m_info.path);
    }
    m_impl->decoded = true;

    if (limit && (limit->target_sample_rate <= 0 || limit->max_duration_seconds < 0.0)) {
        return Error::invalid_arg("DecodeLimit must have a positive rate and non-negative duration");
    }

    const int64_t stop_frames = limit ? StopFrames(m_info.sample_rate, *limit) : -1;

    PcmBuffer out;
    out.sample_rate = m_info.sample_rate;
    out.channels = m_info.channels;

    AVFormatContext* fmt_ctx = m_impl->fmt_ctx.get();
    AVCodecContext* codec = m_impl->codec_ctx.get();
    AVPacket* pkt = m_impl->pkt.get();
    const int stream_idx = m_impl->fmt_ctx.audio_stream_index();

    bool at_eof = false;
    while (true) {
        // Early stop: the tail would be trimmed anyway, so don't read it
        if (stop_frames >= 0 && out.frames() >= stop_frames) {
            break;
        }

        int ret = av_read_frame(fmt_ctx, pkt);
        if (ret == AVERROR_EOF) {
            at_eof = true;
            break;
        }
        if (ret < 0) {
            return impl::ffmpeg_error(ErrorCode::DecodeFailed, ret, "av_read_frame(" + m_info.path + ")");
        }

        if (pkt->stream_index != stream_idx) {
            av_packet_unref(pkt);
            continue;  // Skip non-audio packets
        }

        ret = avcodec_send_packet(codec, pkt);
        if (ret == AVERROR(EAGAIN)) {
            // Output queue full: drain it, then the same packet is accepted
            auto drained = m_impl->receive_frames(out.samples);
            if (drained.is_error()) {
                av_packet_unref(pkt);
                return drained.error();
            }
            ret = avcodec_send_packet(codec, pkt);
        }
        av_packet_unref(pkt);
        if (ret == AVERROR_INVALIDDATA) {
            continue;  // Corrupt packet: skip it, keep decoding
        }
        if (ret < 0) {
            return impl::ffmpeg_error(ErrorCode::DecodeFailed, ret, "avcodec_send_packet");
        }

        auto received = m_impl->receive_frames(out.samples);
        if (received.is_error()) {
            return received.error();
        }
    }

    if (at_eof) {
        // Flush decoder so buffered frames are not lost
        int ret = avcodec_send_packet(codec, nullptr);
        if (ret < 0 && ret != AVERROR_EOF) {
            return impl::ffmpeg_error(ErrorCode::DecodeFailed, ret, "avcodec_send_packet (flush)");
        }
        auto received = m_impl->receive_frames(out.samples);
        if (received.is_error()) {
            return received.error();
        }
    }

    auto flushed = m_impl->flush_converter(out.samples);
    if (flushed.is_error()) {
        return flushed.error();
    }

    return std::move(out);
}

Result<PcmBuffer> DecodeFile(const std::string& path, const std::optional<DecodeLimit>& limit) {
    auto decoder = Decoder::Open(path);
    if (decoder.is_error()) {
        return decoder.error();
    }
    return decoder.value()->Decode(limit);
}

} // namespace adp
