#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
}

#include <audio_dataset_platform/adp_errors.h>
#include <string>

namespace adp {
namespace impl {

// Convert FFmpeg error code to ADP Error of the given kind
Error ffmpeg_error(ErrorCode code, int errnum, const std::string& context);

// Silence FFmpeg's stderr chatter once per process; errors reach callers as Result
void init_ffmpeg_logging();

// Raise FFmpeg's own log level (for --verbose)
void set_ffmpeg_log_verbose(bool verbose);

// Demuxer wrapper (for Decoder)
class FFmpegFormatContext {
public:
    FFmpegFormatContext() = default;
    ~FFmpegFormatContext();

    // Non-copyable
    FFmpegFormatContext(const FFmpegFormatContext&) = delete;
    FFmpegFormatContext& operator=(const FFmpegFormatContext&) = delete;

    // Move semantics
    FFmpegFormatContext(FFmpegFormatContext&& other) noexcept;
    FFmpegFormatContext& operator=(FFmpegFormatContext&& other) noexcept;

    // Open a file and probe stream info
    Result<void> open(const std::string& path);

    // Select the best-scoring audio stream (returns -1 if none)
    int find_audio_stream();

    AVFormatContext* get() const { return m_fmt_ctx; }
    int audio_stream_index() const { return m_audio_stream_idx; }
    AVStream* audio_stream() const;
    AVCodecParameters* audio_codec_params() const;

private:
    AVFormatContext* m_fmt_ctx = nullptr;
    int m_audio_stream_idx = -1;
};

// Muxer wrapper (for Encoder)
// Owns both the AVFormatContext and its AVIOContext
class FFmpegOutputContext {
public:
    FFmpegOutputContext() = default;
    ~FFmpegOutputContext();

    // Non-copyable, non-movable (streams point back into the context)
    FFmpegOutputContext(const FFmpegOutputContext&) = delete;
    FFmpegOutputContext& operator=(const FFmpegOutputContext&) = delete;

    // Allocate a muxer for the named container
    Result<void> alloc(const char* format_name, const std::string& path);

    // Open the output file for writing
    Result<void> open_io(const std::string& path);

    // Write trailer and close the file; errors are reported, not dropped
    Result<void> finish();

    AVFormatContext* get() const { return m_fmt_ctx; }

private:
    AVFormatContext* m_fmt_ctx = nullptr;
    bool m_io_open = false;
};

// Codec context wrapper (decoder or encoder)
class FFmpegCodecContext {
public:
    FFmpegCodecContext() = default;
    ~FFmpegCodecContext();

    // Non-copyable
    FFmpegCodecContext(const FFmpegCodecContext&) = delete;
    FFmpegCodecContext& operator=(const FFmpegCodecContext&) = delete;

    // Move semantics
    FFmpegCodecContext(FFmpegCodecContext&& other) noexcept;
    FFmpegCodecContext& operator=(FFmpegCodecContext&& other) noexcept;

    // Open a decoder for the stream's codec parameters
    Result<void> init_decoder(const AVCodecParameters* params);

    // Open a float32 interleaved PCM encoder
    Result<void> init_pcm_f32_encoder(int sample_rate, int channels, bool global_header);

    AVCodecContext* get() const { return m_codec_ctx; }

private:
    AVCodecContext* m_codec_ctx = nullptr;
};

// Owning AVPacket
class FFmpegPacket {
public:
    FFmpegPacket() : m_pkt(av_packet_alloc()) {}
    ~FFmpegPacket() { av_packet_free(&m_pkt); }

    FFmpegPacket(const FFmpegPacket&) = delete;
    FFmpegPacket& operator=(const FFmpegPacket&) = delete;

    AVPacket* get() const { return m_pkt; }
    explicit operator bool() const { return m_pkt != nullptr; }

private:
    AVPacket* m_pkt;
};

// Owning AVFrame
class FFmpegFrame {
public:
    FFmpegFrame() : m_frame(av_frame_alloc()) {}
    ~FFmpegFrame() { av_frame_free(&m_frame); }

    FFmpegFrame(const FFmpegFrame&) = delete;
    FFmpegFrame& operator=(const FFmpegFrame&) = delete;

    AVFrame* get() const { return m_frame; }
    explicit operator bool() const { return m_frame != nullptr; }

private:
    AVFrame* m_frame;
};

// Channel layout for a stream: its own if ordered, else the default for its count
Result<void> resolve_channel_layout(const AVChannelLayout* src, AVChannelLayout* dst);

} // namespace impl
} // namespace adp
