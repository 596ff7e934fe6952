#pragma once

#include <audio_dataset_platform/adp_config.h>
#include <audio_dataset_platform/adp_errors.h>
#include <QString>
#include <QStringList>
#include <vector>

namespace ADP {

/**
 * Input discovery
 *
 * Walks the input tree and turns every audio file into a Task whose output
 * mirrors the file's relative directory under the output root, with a
 * .wav suffix. Tasks come back sorted by input path.
 */
class TaskCollector {
public:
    /**
     * File suffixes treated as audio input (compared case-insensitively)
     */
    static const QStringList& audioExtensions();

    /**
     * Collect one task per audio file under inputDir
     *
     * Two inputs that map to the same output (song.mp3 and song.flac) keep
     * only the first in sorted order; the others are logged and skipped.
     *
     * @return Tasks in input-path order, or InputEnumerationFailed when
     *         inputDir is missing or unreadable
     */
    static adp::Result<std::vector<adp::Task>> collectTasks(const QString& inputDir,
                                                           const QString& outputDir,
                                                           const adp::ProcessorConfig& config);

    /**
     * Output path for one input: outputDir/<relative dir>/<base name>.wav
     */
    static QString outputPathFor(const QString& inputDir, const QString& outputDir,
                                 const QString& inputPath);
};

}
