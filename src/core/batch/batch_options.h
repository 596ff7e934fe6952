#pragma once

#include <audio_dataset_platform/adp_config.h>
#include <audio_dataset_platform/adp_errors.h>
#include <QString>

namespace ADP {

/**
 * Options for one batch run
 *
 * Filled from defaults, then an optional JSON options file, then the
 * command line. Durations are in seconds; threads == 0 means use the
 * available hardware parallelism.
 */
struct BatchOptions {
    QString inputDir;
    QString outputDir;
    int sampleRate = 16000;
    double minDuration = 3.0;
    double maxDuration = 5.0;
    int threads = 0;

    adp::ProcessorConfig processorConfig() const;
};

/**
 * Overlay keys from a JSON object file onto options
 *
 * Recognized keys: sample_rate, min_duration, max_duration, threads.
 * Unknown keys are ignored. Keys that are absent leave the field as is.
 *
 * @return InvalidConfig if the file is unreadable, not a JSON object,
 *         or a value has the wrong type
 */
adp::Result<void> LoadOptionsFile(const QString& path, BatchOptions& options);

}
