#include <audio_dataset_platform/adp_resampler.h>
#include "impl/ffmpeg_resample.h"
#include <algorithm>
#include <cstddef>
#include <string>

namespace adp {

namespace {

// Default ordered layout for a channel count; released on scope exit
class ScopedLayout {
public:
    explicit ScopedLayout(int channels) { av_channel_layout_default(&m_layout, channels); }
    ~ScopedLayout() { av_channel_layout_uninit(&m_layout); }

    ScopedLayout(const ScopedLayout&) = delete;
    ScopedLayout& operator=(const ScopedLayout&) = delete;

    const AVChannelLayout* get() const { return &m_layout; }

private:
    AVChannelLayout m_layout{};
};

} // anonymous namespace

Result<PcmBuffer> Resample(PcmBuffer input, int32_t target_rate) {
    if (!input.is_well_formed()) {
        return Error::invalid_arg("Resample: malformed PCM buffer");
    }
    if (target_rate <= 0) {
        return Error::invalid_arg("Resample: target rate must be positive, got " +
                                  std::to_string(target_rate));
    }

    if (input.sample_rate == target_rate) {
        return std::move(input);
    }

    const int channels = input.channels;
    ScopedLayout layout(channels);

    static const impl::ResampleFilter kFilter = {
        RESAMPLE_FILTER_SIZE, RESAMPLE_PHASE_SHIFT, RESAMPLE_CUTOFF
    };

    impl::FFmpegResampleContext swr;
    auto init_result = swr.init(input.sample_rate, layout.get(), AV_SAMPLE_FMT_FLT,
                                target_rate, &kFilter);
    if (init_result.is_error()) {
        return init_result.error();
    }

    PcmBuffer out;
    out.sample_rate = target_rate;
    out.channels = channels;

    // Rough final size so the vector doesn't reallocate on every block
    const int64_t expected = static_cast<int64_t>(
        static_cast<double>(input.frames()) * target_rate / input.sample_rate);
    out.samples.reserve(static_cast<size_t>(expected + RESAMPLE_FILTER_SIZE) * channels);

    const int64_t total_frames = input.frames();
    int64_t pos = 0;
    while (pos < total_frames) {
        const int block = static_cast<int>(std::min<int64_t>(RESAMPLE_BLOCK_FRAMES, total_frames - pos));

        int max_out = swr.get_out_samples(block);
        if (max_out < 0) {
            return Error::resampler_init_failed("swr_get_out_samples failed");
        }

        const uint8_t* src_planes[1] = {
            reinterpret_cast<const uint8_t*>(input.samples.data() + pos * channels)
        };

        size_t current_size = out.samples.size();
        out.samples.resize(current_size + static_cast<size_t>(max_out) * channels);

        int converted = swr.convert(src_planes, block, out.samples.data() + current_size, max_out);
        if (converted < 0) {
            return Error::resampler_init_failed("swr_convert failed at frame " + std::to_string(pos));
        }
        out.samples.resize(current_size + static_cast<size_t>(converted) * channels);

        pos += block;
    }

    // Drain filter history until empty
    while (true) {
        int max_out = std::max(swr.get_out_samples(0), 1);

        size_t current_size = out.samples.size();
        out.samples.resize(current_size + static_cast<size_t>(max_out) * channels);

        int flushed = swr.flush(out.samples.data() + current_size, max_out);
        if (flushed < 0) {
            return Error::resampler_init_failed("swr_convert (flush) failed");
        }
        out.samples.resize(current_size + static_cast<size_t>(flushed) * channels);
        if (flushed == 0) {
            break;
        }
    }

    return std::move(out);
}

} // namespace adp
