#include <audio_dataset_platform/adp_encoder.h>
#include "impl/ffmpeg_context.h"
#include <algorithm>
#include <cstddef>
#include <cstring>

namespace adp {

namespace {

// Move every packet the encoder has ready into the muxer
Result<void> drain_packets(AVCodecContext* codec, AVFormatContext* fmt, AVStream* stream,
                           AVPacket* pkt) {
    while (true) {
        int ret = avcodec_receive_packet(codec, pkt);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return Result<void>();
        }
        if (ret < 0) {
            return impl::ffmpeg_error(ErrorCode::WriteFailed, ret, "avcodec_receive_packet");
        }

        av_packet_rescale_ts(pkt, codec->time_base, stream->time_base);
        pkt->stream_index = stream->index;

        // Takes ownership of the packet data and unrefs pkt
        ret = av_interleaved_write_frame(fmt, pkt);
        if (ret < 0) {
            return impl::ffmpeg_error(ErrorCode::WriteFailed, ret, "av_interleaved_write_frame");
        }
    }
}

} // anonymous namespace

Result<void> Encode(const PcmBuffer& pcm, const std::string& output_path) {
    if (!pcm.is_well_formed()) {
        return Error::invalid_arg("Encode: malformed PCM buffer for " + output_path);
    }

    impl::init_ffmpeg_logging();

    impl::FFmpegPacket pkt;
    impl::FFmpegFrame frame;
    if (!pkt || !frame) {
        return Error::allocation_failed("packet/frame");
    }

    impl::FFmpegOutputContext out;
    auto alloc_result = out.alloc("wav", output_path);
    if (alloc_result.is_error()) {
        return alloc_result.error();
    }
    AVFormatContext* fmt = out.get();

    AVStream* stream = avformat_new_stream(fmt, nullptr);
    if (!stream) {
        return Error::allocation_failed("output stream");
    }

    impl::FFmpegCodecContext enc;
    const bool global_header = (fmt->oformat->flags & AVFMT_GLOBALHEADER) != 0;
    auto enc_result = enc.init_pcm_f32_encoder(pcm.sample_rate, pcm.channels, global_header);
    if (enc_result.is_error()) {
        return enc_result.error();
    }
    AVCodecContext* codec = enc.get();

    int ret = avcodec_parameters_from_context(stream->codecpar, codec);
    if (ret < 0) {
        return impl::ffmpeg_error(ErrorCode::WriteFailed, ret, "avcodec_parameters_from_context");
    }
    stream->time_base = codec->time_base;

    auto io_result = out.open_io(output_path);
    if (io_result.is_error()) {
        return io_result.error();
    }

    ret = avformat_write_header(fmt, nullptr);
    if (ret < 0) {
        return impl::ffmpeg_error(ErrorCode::WriteFailed, ret, "avformat_write_header(" + output_path + ")");
    }

    const int64_t total_frames = pcm.frames();
    const size_t channels = static_cast<size_t>(pcm.channels);
    AVFrame* f = frame.get();

    for (int64_t pos = 0; pos < total_frames; pos += ENCODE_FRAME_SAMPLES) {
        const int chunk = static_cast<int>(std::min<int64_t>(ENCODE_FRAME_SAMPLES, total_frames - pos));

        f->format = AV_SAMPLE_FMT_FLT;
        f->sample_rate = pcm.sample_rate;
        f->nb_samples = chunk;
        ret = av_channel_layout_copy(&f->ch_layout, &codec->ch_layout);
        if (ret < 0) {
            return impl::ffmpeg_error(ErrorCode::AllocationFailed, ret, "av_channel_layout_copy");
        }

        ret = av_frame_get_buffer(f, 0);
        if (ret < 0) {
            return impl::ffmpeg_error(ErrorCode::AllocationFailed, ret, "av_frame_get_buffer");
        }

        std::memcpy(f->data[0], pcm.samples.data() + static_cast<size_t>(pos) * channels,
                    static_cast<size_t>(chunk) * channels * sizeof(float));
        f->pts = pos;

        ret = avcodec_send_frame(codec, f);
        av_frame_unref(f);
        if (ret < 0) {
            return impl::ffmpeg_error(ErrorCode::WriteFailed, ret, "avcodec_send_frame");
        }

        auto drained = drain_packets(codec, fmt, stream, pkt.get());
        if (drained.is_error()) {
            return drained.error();
        }
    }

    // Flush encoder
    ret = avcodec_send_frame(codec, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return impl::ffmpeg_error(ErrorCode::WriteFailed, ret, "avcodec_send_frame (flush)");
    }
    auto drained = drain_packets(codec, fmt, stream, pkt.get());
    if (drained.is_error()) {
        return drained.error();
    }

    return out.finish();
}

} // namespace adp
