// Tests for the ADP core: errors, Result, PcmBuffer, config, normalizer, resampler
// No file I/O here; codec round trips live in test_adp_codec

#include <QtTest>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

#include <audio_dataset_platform/adp_audio.h>
#include <audio_dataset_platform/adp_config.h>
#include <audio_dataset_platform/adp_decoder.h>
#include <audio_dataset_platform/adp_errors.h>
#include <audio_dataset_platform/adp_normalizer.h>
#include <audio_dataset_platform/adp_resampler.h>

#include "../common/test_base.h"

Q_LOGGING_CATEGORY(adpTests, "adp.tests")

namespace {

adp::PcmBuffer makeRamp(int sampleRate, int channels, int64_t frames) {
    adp::PcmBuffer pcm;
    pcm.sample_rate = sampleRate;
    pcm.channels = channels;
    pcm.samples.resize(static_cast<size_t>(frames) * channels);
    for (size_t i = 0; i < pcm.samples.size(); ++i) {
        pcm.samples[i] = static_cast<float>(i % 1000) / 1000.0f + 0.001f;
    }
    return pcm;
}

// RMS over [begin, end) of channel 0
double rms(const adp::PcmBuffer& pcm, int64_t begin, int64_t end) {
    double acc = 0.0;
    for (int64_t i = begin; i < end; ++i) {
        const double v = pcm.samples[static_cast<size_t>(i) * pcm.channels];
        acc += v * v;
    }
    return std::sqrt(acc / static_cast<double>(end - begin));
}

}

class TestADPCore : public TestBase
{
    Q_OBJECT

private slots:
    // ========================================================================
    // ERROR TYPE TESTS
    // ========================================================================

    void test_error_code_to_string_all_codes() {
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::Ok)), QString("Ok"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::OpenFailed)), QString("OpenFailed"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::NoAudioStream)), QString("NoAudioStream"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::UnsupportedCodec)), QString("UnsupportedCodec"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::DecodeFailed)), QString("DecodeFailed"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::ResamplerInitFailed)), QString("ResamplerInitFailed"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::WriteFailed)), QString("WriteFailed"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::AllocationFailed)), QString("AllocationFailed"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::DirectoryCreateFailed)), QString("DirectoryCreateFailed"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::InputEnumerationFailed)), QString("InputEnumerationFailed"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::InvalidConfig)), QString("InvalidConfig"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::InvalidArg)), QString("InvalidArg"));
        QCOMPARE(QString(adp::error_code_to_string(adp::ErrorCode::Internal)), QString("Internal"));
    }

    void test_error_factories_carry_context() {
        auto e1 = adp::Error::no_audio_stream("/data/clip.mp4");
        QCOMPARE(e1.code, adp::ErrorCode::NoAudioStream);
        QVERIFY(e1.message.find("/data/clip.mp4") != std::string::npos);

        auto e2 = adp::Error::directory_create_failed("/out/a/b");
        QCOMPARE(e2.code, adp::ErrorCode::DirectoryCreateFailed);
        QVERIFY(e2.message.find("/out/a/b") != std::string::npos);

        auto e3 = adp::Error::allocation_failed("frame");
        QCOMPARE(e3.code, adp::ErrorCode::AllocationFailed);
        QVERIFY(e3.message.find("frame") != std::string::npos);

        QCOMPARE(adp::Error::ok().code, adp::ErrorCode::Ok);
        QCOMPARE(adp::Error::invalid_config("x").code, adp::ErrorCode::InvalidConfig);
        QCOMPARE(adp::Error::write_failed("x").code, adp::ErrorCode::WriteFailed);
    }

    // ========================================================================
    // RESULT TYPE TESTS
    // ========================================================================

    void test_result_value_and_error_paths() {
        adp::Result<int> ok(42);
        QVERIFY(ok.is_ok());
        QVERIFY(!ok.is_error());
        QCOMPARE(ok.value(), 42);

        adp::Result<int> err(adp::Error::internal("boom"));
        QVERIFY(err.is_error());
        QCOMPARE(err.error().code, adp::ErrorCode::Internal);
    }

    void test_result_unwrap_throws_on_error() {
        adp::Result<int> ok(7);
        QCOMPARE(ok.unwrap(), 7);

        adp::Result<int> err(adp::Error::decode_failed("bad packet"));
        QVERIFY_EXCEPTION_THROWN(err.unwrap(), std::runtime_error);
    }

    void test_result_void() {
        adp::Result<void> ok;
        QVERIFY(ok.is_ok());

        adp::Result<void> err(adp::Error::write_failed("disk full"));
        QVERIFY(err.is_error());
        QCOMPARE(err.error().code, adp::ErrorCode::WriteFailed);
    }

    // ========================================================================
    // PCM BUFFER / CONFIG
    // ========================================================================

    void test_pcm_buffer_frames_and_duration() {
        adp::PcmBuffer pcm = makeRamp(16000, 2, 8000);
        QCOMPARE(pcm.frames(), int64_t(8000));
        QCOMPARE(pcm.duration_seconds(), 0.5);
        QVERIFY(pcm.is_well_formed());

        pcm.samples.push_back(0.0f);  // partial frame
        QVERIFY(!pcm.is_well_formed());

        adp::PcmBuffer empty;
        QCOMPARE(empty.frames(), int64_t(0));
        QCOMPARE(empty.duration_seconds(), 0.0);
        QVERIFY(!empty.is_well_formed());
    }

    void test_config_defaults_are_valid() {
        adp::ProcessorConfig config;
        QCOMPARE(config.target_sample_rate, 16000);
        QCOMPARE(config.min_duration_seconds, 3.0);
        QCOMPARE(config.max_duration_seconds, 5.0);
        QVERIFY(config.validate().is_ok());
    }

    void test_config_rejects_bad_values() {
        adp::ProcessorConfig config;

        config.min_duration_seconds = 6.0;
        auto r1 = config.validate();
        QVERIFY(r1.is_error());
        QCOMPARE(r1.error().code, adp::ErrorCode::InvalidConfig);

        config = adp::ProcessorConfig();
        config.target_sample_rate = 0;
        QCOMPARE(config.validate().error().code, adp::ErrorCode::InvalidConfig);

        config = adp::ProcessorConfig();
        config.max_duration_seconds = std::nan("");
        QCOMPARE(config.validate().error().code, adp::ErrorCode::InvalidConfig);

        config = adp::ProcessorConfig();
        config.min_duration_seconds = -1.0;
        QCOMPARE(config.validate().error().code, adp::ErrorCode::InvalidConfig);

        config = adp::ProcessorConfig();
        config.min_duration_seconds = 0.0;
        config.max_duration_seconds = 0.0;
        QCOMPARE(config.validate().error().code, adp::ErrorCode::InvalidConfig);

        // Frame count would not fit: durations are bounded by MAX_OUTPUT_FRAMES
        config = adp::ProcessorConfig();
        config.min_duration_seconds = 1e16;
        config.max_duration_seconds = 1e16;
        QCOMPARE(config.validate().error().code, adp::ErrorCode::InvalidConfig);

        config = adp::ProcessorConfig();
        config.target_sample_rate = 192000;
        config.max_duration_seconds = 12000.0;  // 2.3e9 frames
        QCOMPARE(config.validate().error().code, adp::ErrorCode::InvalidConfig);
    }

    void test_config_accepts_long_window_within_bound() {
        adp::ProcessorConfig config;
        config.max_duration_seconds = 3600.0;  // one hour at 16 kHz
        QVERIFY(config.validate().is_ok());
    }

    void test_config_min_equal_max_is_valid() {
        adp::ProcessorConfig config;
        config.min_duration_seconds = 4.0;
        config.max_duration_seconds = 4.0;
        QVERIFY(config.validate().is_ok());
    }

    // ========================================================================
    // DURATION NORMALIZER
    // ========================================================================

    void test_target_frames_floor() {
        QCOMPARE(adp::TargetFrames(3.0, 16000), int64_t(48000));
        QCOMPARE(adp::TargetFrames(2.5, 16000), int64_t(40000));
        QCOMPARE(adp::TargetFrames(1.00005, 10000), int64_t(10000));
        QCOMPARE(adp::TargetFrames(0.0, 16000), int64_t(0));
    }

    void test_target_frames_saturates() {
        QCOMPARE(adp::TargetFrames(1e16, 16000), std::numeric_limits<int64_t>::max());
        QCOMPARE(adp::TargetFrames(std::numeric_limits<double>::infinity(), 16000),
                 std::numeric_limits<int64_t>::max());
        QCOMPARE(adp::TargetFrames(std::nan(""), 16000), int64_t(0));
    }

    void test_normalize_rejects_unrepresentable_window() {
        auto result = adp::Normalize(makeRamp(16000, 1, 16000), 1e16, 1e16);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, adp::ErrorCode::InvalidArg);
    }

    void test_normalize_trims_to_max_prefix() {
        adp::PcmBuffer input = makeRamp(16000, 1, 16000 * 6);
        const std::vector<float> original = input.samples;

        auto result = adp::Normalize(std::move(input), 3.0, 5.0);
        QVERIFY(result.is_ok());
        const adp::PcmBuffer& out = result.value();
        QCOMPARE(out.frames(), int64_t(80000));
        QVERIFY(std::equal(out.samples.begin(), out.samples.end(), original.begin()));
    }

    void test_normalize_pads_with_exact_zeros() {
        adp::PcmBuffer input = makeRamp(16000, 2, 16000);
        const std::vector<float> original = input.samples;

        auto result = adp::Normalize(std::move(input), 3.0, 5.0);
        QVERIFY(result.is_ok());
        const adp::PcmBuffer& out = result.value();
        QCOMPARE(out.frames(), int64_t(48000));
        QCOMPARE(out.channels, 2);
        QVERIFY(std::equal(original.begin(), original.end(), out.samples.begin()));
        for (size_t i = original.size(); i < out.samples.size(); ++i) {
            QCOMPARE(out.samples[i], 0.0f);
        }
    }

    void test_normalize_inside_window_unchanged() {
        adp::PcmBuffer input = makeRamp(16000, 1, 64000);
        const std::vector<float> original = input.samples;

        auto result = adp::Normalize(std::move(input), 3.0, 5.0);
        QVERIFY(result.is_ok());
        QVERIFY(result.value().samples == original);
    }

    void test_normalize_bounds_are_inclusive() {
        auto atMin = adp::Normalize(makeRamp(16000, 1, 48000), 3.0, 5.0);
        QVERIFY(atMin.is_ok());
        QCOMPARE(atMin.value().frames(), int64_t(48000));

        auto atMax = adp::Normalize(makeRamp(16000, 1, 80000), 3.0, 5.0);
        QVERIFY(atMax.is_ok());
        QCOMPARE(atMax.value().frames(), int64_t(80000));
    }

    void test_normalize_min_equals_max_fixes_length() {
        auto shorter = adp::Normalize(makeRamp(16000, 1, 1000), 2.0, 2.0);
        auto longer = adp::Normalize(makeRamp(16000, 1, 90000), 2.0, 2.0);
        QVERIFY(shorter.is_ok());
        QVERIFY(longer.is_ok());
        QCOMPARE(shorter.value().frames(), int64_t(32000));
        QCOMPARE(longer.value().frames(), int64_t(32000));
    }

    void test_normalize_empty_input_pads() {
        adp::PcmBuffer empty;
        empty.sample_rate = 16000;
        empty.channels = 1;
        auto result = adp::Normalize(std::move(empty), 1.0, 5.0);
        QVERIFY(result.is_ok());
        QCOMPARE(result.value().frames(), int64_t(16000));
    }

    void test_normalize_rejects_bad_input() {
        auto inverted = adp::Normalize(makeRamp(16000, 1, 100), 5.0, 3.0);
        QVERIFY(inverted.is_error());
        QCOMPARE(inverted.error().code, adp::ErrorCode::InvalidArg);

        adp::PcmBuffer malformed = makeRamp(16000, 2, 100);
        malformed.samples.pop_back();
        auto bad = adp::Normalize(std::move(malformed), 1.0, 5.0);
        QVERIFY(bad.is_error());
        QCOMPARE(bad.error().code, adp::ErrorCode::InvalidArg);
    }

    // ========================================================================
    // RESAMPLER
    // ========================================================================

    void test_resample_identity_is_bit_exact() {
        adp::PcmBuffer input = makeSine(16000, 2, 1.0);
        const std::vector<float> original = input.samples;

        auto result = adp::Resample(std::move(input), 16000);
        QVERIFY(result.is_ok());
        QCOMPARE(result.value().sample_rate, 16000);
        QVERIFY(result.value().samples == original);
    }

    void test_resample_downsample_length() {
        auto result = adp::Resample(makeSine(44100, 1, 1.0), 16000);
        QVERIFY(result.is_ok());
        const adp::PcmBuffer& out = result.value();
        QCOMPARE(out.sample_rate, 16000);
        QCOMPARE(out.channels, 1);
        QVERIFY2(std::llabs(out.frames() - 16000) <= 2,
                 qPrintable(QString("frames=%1").arg(out.frames())));
    }

    void test_resample_upsample_preserves_channels() {
        auto result = adp::Resample(makeSine(8000, 2, 0.5, 300.0), 16000);
        QVERIFY(result.is_ok());
        const adp::PcmBuffer& out = result.value();
        QCOMPARE(out.channels, 2);
        QVERIFY(out.is_well_formed());
        QVERIFY(std::llabs(out.frames() - 8000) <= 2);
    }

    void test_resample_passes_in_band_tone() {
        // 1 kHz sits well inside the 16 kHz passband
        auto result = adp::Resample(makeSine(44100, 1, 1.0, 1000.0), 16000);
        QVERIFY(result.is_ok());
        const double level = rms(result.value(), 1000, 15000);
        QVERIFY2(std::fabs(level - 0.5 / std::sqrt(2.0)) < 0.02,
                 qPrintable(QString("rms=%1").arg(level)));
    }

    void test_resample_suppresses_out_of_band_tone() {
        // 12 kHz would alias to 4 kHz without the low-pass filter
        auto result = adp::Resample(makeSine(44100, 1, 1.0, 12000.0), 16000);
        QVERIFY(result.is_ok());
        const double level = rms(result.value(), 1000, 15000);
        QVERIFY2(level < 0.02, qPrintable(QString("rms=%1").arg(level)));
    }

    void test_resample_rejects_bad_input() {
        auto badRate = adp::Resample(makeSine(44100, 1, 0.1), 0);
        QVERIFY(badRate.is_error());
        QCOMPARE(badRate.error().code, adp::ErrorCode::InvalidArg);

        adp::PcmBuffer malformed;
        malformed.sample_rate = 44100;
        malformed.channels = 0;
        auto bad = adp::Resample(std::move(malformed), 16000);
        QVERIFY(bad.is_error());
        QCOMPARE(bad.error().code, adp::ErrorCode::InvalidArg);
    }

    // ========================================================================
    // DECODE EARLY-STOP THRESHOLD
    // ========================================================================

    void test_stop_frames_identity_rate() {
        QCOMPARE(adp::Decoder::StopFrames(16000, adp::DecodeLimit{16000, 5.0}), int64_t(80000));
    }

    void test_stop_frames_adds_filter_support() {
        // Upsampling: filter is not widened
        QCOMPARE(adp::Decoder::StopFrames(8000, adp::DecodeLimit{16000, 5.0}),
                 int64_t(40000 + adp::RESAMPLE_FILTER_SIZE));

        // Downsampling: support grows with the rate ratio
        const int64_t stop = adp::Decoder::StopFrames(44100, adp::DecodeLimit{16000, 5.0});
        QVERIFY(stop > 220500 + adp::RESAMPLE_FILTER_SIZE);
        QVERIFY(stop < 220500 + 4 * adp::RESAMPLE_FILTER_SIZE);
    }

    void test_stop_frames_saturates() {
        QCOMPARE(adp::Decoder::StopFrames(44100, adp::DecodeLimit{16000, 1e300}),
                 std::numeric_limits<int64_t>::max());
        QCOMPARE(adp::Decoder::StopFrames(16000, adp::DecodeLimit{16000, 1e16}),
                 std::numeric_limits<int64_t>::max());
    }
};

QTEST_MAIN(TestADPCore)
#include "test_adp_core.moc"
