#include "task_collector.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSet>
#include <algorithm>

Q_LOGGING_CATEGORY(adpCollect, "adp.collect")

namespace ADP {

const QStringList& TaskCollector::audioExtensions()
{
    static const QStringList extensions = {
        "mp3", "wav", "flac", "m4a", "ogg", "aac", "wma", "opus"
    };
    return extensions;
}

QString TaskCollector::outputPathFor(const QString& inputDir, const QString& outputDir,
                                     const QString& inputPath)
{
    const QFileInfo info(inputPath);
    const QString relativeDir = QDir(inputDir).relativeFilePath(info.absolutePath());
    const QString fileName = info.completeBaseName() + ".wav";

    QDir outRoot(outputDir);
    if (relativeDir.isEmpty() || relativeDir == ".") {
        return QDir::cleanPath(outRoot.filePath(fileName));
    }
    return QDir::cleanPath(outRoot.filePath(relativeDir + "/" + fileName));
}

adp::Result<std::vector<adp::Task>> TaskCollector::collectTasks(const QString& inputDir,
                                                               const QString& outputDir,
                                                               const adp::ProcessorConfig& config)
{
    const QFileInfo rootInfo(inputDir);
    if (!rootInfo.exists()) {
        return adp::Error::input_enumeration_failed("Input directory does not exist: " +
                                                    inputDir.toStdString());
    }
    if (!rootInfo.isDir()) {
        return adp::Error::input_enumeration_failed("Input path is not a directory: " +
                                                    inputDir.toStdString());
    }
    if (!rootInfo.isReadable()) {
        return adp::Error::input_enumeration_failed("Input directory is not readable: " +
                                                    inputDir.toStdString());
    }

    const QString rootPath = rootInfo.absoluteFilePath();
    QStringList inputs;

    // Symlinked directories are not followed (no QDirIterator::FollowSymlinks)
    QDirIterator it(rootPath, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QString suffix = QFileInfo(path).suffix();
        if (audioExtensions().contains(suffix, Qt::CaseInsensitive)) {
            inputs.append(path);
        }
    }

    std::sort(inputs.begin(), inputs.end());

    std::vector<adp::Task> tasks;
    tasks.reserve(static_cast<size_t>(inputs.size()));
    QSet<QString> claimedOutputs;

    for (const QString& inputPath : inputs) {
        const QString outputPath = outputPathFor(rootPath, outputDir, inputPath);
        if (claimedOutputs.contains(outputPath)) {
            qCWarning(adpCollect, "Skipping %s: output %s already claimed by an earlier input",
                      qPrintable(inputPath), qPrintable(outputPath));
            continue;
        }
        claimedOutputs.insert(outputPath);

        adp::Task task;
        task.input_path = inputPath.toStdString();
        task.output_path = outputPath.toStdString();
        task.config = config;
        tasks.push_back(std::move(task));
    }

    qCDebug(adpCollect, "Collected %zu tasks from %s", tasks.size(), qPrintable(rootPath));
    return std::move(tasks);
}

}
