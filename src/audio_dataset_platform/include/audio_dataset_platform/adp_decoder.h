#pragma once

#include "adp_audio.h"
#include "adp_errors.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace adp {

// Early-stop request: decoding ends once the decoded audio, resampled to
// target_sample_rate, would cover max_duration_seconds. Packets past that
// point are never read from disk.
struct DecodeLimit {
    int32_t target_sample_rate;
    double max_duration_seconds;
};

// Metadata of the selected audio stream
struct DecoderInfo {
    std::string path;
    std::string codec_name;
    int32_t sample_rate;     // native rate of the stream
    int32_t channels;        // native channel count
    int64_t duration_us;     // container/stream metadata; 0 if unknown
};

// Forward declaration for implementation
class DecoderImpl;

// Single-file audio decoder
// Owns the demuxer, decoder and format-conversion handles for one file.
// All of them are released when the Decoder is destroyed.
class Decoder {
public:
    ~Decoder();

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    // Open container, probe streams, select the best audio stream, open its decoder
    // Errors: OpenFailed, NoAudioStream, UnsupportedCodec, AllocationFailed
    static Result<std::unique_ptr<Decoder>> Open(const std::string& path);

    const DecoderInfo& info() const;

    // Decode the selected stream to interleaved float32 at its native rate
    // and channel count. May be called once per Decoder.
    // Errors: DecodeFailed, ResamplerInitFailed, AllocationFailed, InvalidArg
    Result<PcmBuffer> Decode(const std::optional<DecodeLimit>& limit = std::nullopt);

    // Source frames to decode before stopping for the given limit.
    // Includes the anti-aliasing filter support so the samples kept after
    // trimming never see the artificial end of input.
    static int64_t StopFrames(int32_t source_rate, const DecodeLimit& limit);

    // Internal: Constructor is public but DecoderImpl is opaque
    Decoder(std::unique_ptr<DecoderImpl> impl, DecoderInfo info);

private:
    std::unique_ptr<DecoderImpl> m_impl;
    DecoderInfo m_info;
};

// Open + Decode in one call
Result<PcmBuffer> DecodeFile(const std::string& path,
                             const std::optional<DecodeLimit>& limit = std::nullopt);

} // namespace adp
