#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QStringList>

#include <audio_dataset_platform/adp_pipeline.h>
#include "core/batch/batch_options.h"
#include "core/batch/batch_runner.h"

#include <cstdio>

Q_LOGGING_CATEGORY(adpMain, "adp.main")

namespace {

int usageError(const QCommandLineParser& parser, const QString& message)
{
    std::fprintf(stderr, "%s\n\n%s", qPrintable(message), qPrintable(parser.helpText()));
    return ADP::ExitFatal;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("audio_preprocessor");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("ADP Project");

    // Info and up by default; --verbose opens debug output
    QLoggingCategory::setFilterRules("adp.*.debug=false");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Resample and trim/pad a directory tree of audio files to 32-bit float WAV.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("input_dir", "Directory searched recursively for audio files.");
    parser.addPositionalArgument("output_dir", "Directory receiving the mirrored .wav tree.");

    QCommandLineOption sampleRateOption("sample-rate", "Target sample rate in Hz (default 16000).", "hz");
    QCommandLineOption minDurationOption("min-duration", "Shorter files are zero-padded to this many seconds (default 3.0).", "seconds");
    QCommandLineOption maxDurationOption("max-duration", "Longer files are truncated to this many seconds (default 5.0).", "seconds");
    QCommandLineOption threadsOption("threads", "Worker threads; 0 uses every core (default 0).", "n");
    QCommandLineOption configOption("config", "JSON options file applied before command-line options.", "file");
    QCommandLineOption verboseOption("verbose", "Debug logging, including FFmpeg warnings.");
    parser.addOption(sampleRateOption);
    parser.addOption(minDurationOption);
    parser.addOption(maxDurationOption);
    parser.addOption(threadsOption);
    parser.addOption(configOption);
    parser.addOption(verboseOption);

    // parse() rather than process(): usage errors exit with ExitFatal, not 1
    if (!parser.parse(app.arguments())) {
        return usageError(parser, parser.errorText());
    }
    if (parser.isSet("help")) {
        parser.showHelp(0);
    }
    if (parser.isSet("version")) {
        parser.showVersion();
    }

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("adp.*=true");
        adp::SetCodecLogVerbose(true);
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 2) {
        return usageError(parser, "Expected <input_dir> and <output_dir>.");
    }

    ADP::BatchOptions options;
    options.inputDir = positional.at(0);
    options.outputDir = positional.at(1);

    if (parser.isSet(configOption)) {
        const QString configPath = parser.value(configOption);
        auto loaded = ADP::LoadOptionsFile(configPath, options);
        if (loaded.is_error()) {
            qCCritical(adpMain, "%s", loaded.error().message.c_str());
            return ADP::ExitFatal;
        }
        qCDebug(adpMain, "Loaded options from %s", qPrintable(configPath));
    }

    bool ok = true;
    if (parser.isSet(sampleRateOption)) {
        options.sampleRate = parser.value(sampleRateOption).toInt(&ok);
        if (!ok) {
            return usageError(parser, "Invalid --sample-rate: " + parser.value(sampleRateOption));
        }
    }
    if (parser.isSet(minDurationOption)) {
        options.minDuration = parser.value(minDurationOption).toDouble(&ok);
        if (!ok) {
            return usageError(parser, "Invalid --min-duration: " + parser.value(minDurationOption));
        }
    }
    if (parser.isSet(maxDurationOption)) {
        options.maxDuration = parser.value(maxDurationOption).toDouble(&ok);
        if (!ok) {
            return usageError(parser, "Invalid --max-duration: " + parser.value(maxDurationOption));
        }
    }
    if (parser.isSet(threadsOption)) {
        options.threads = parser.value(threadsOption).toInt(&ok);
        if (!ok || options.threads < 0) {
            return usageError(parser, "Invalid --threads: " + parser.value(threadsOption));
        }
    }

    qCInfo(adpMain, "Input: %s", qPrintable(options.inputDir));
    qCInfo(adpMain, "Output: %s", qPrintable(options.outputDir));

    return ADP::RunBatch(options);
}
