#include "batch_runner.h"
#include "output_directories.h"
#include "task_collector.h"

#include <audio_dataset_platform/adp_worker_pool.h>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(adpBatch, "adp.batch")

namespace ADP {

namespace {

int fatal(const adp::Error& error)
{
    qCCritical(adpBatch, "%s: %s", adp::error_code_to_string(error.code), error.message.c_str());
    return ExitFatal;
}

}

int RunBatch(const BatchOptions& options)
{
    if (options.threads < 0) {
        return fatal(adp::Error::invalid_config("thread count must not be negative"));
    }

    const adp::ProcessorConfig config = options.processorConfig();
    auto valid = config.validate();
    if (valid.is_error()) {
        return fatal(valid.error());
    }

    auto collected = TaskCollector::collectTasks(options.inputDir, options.outputDir, config);
    if (collected.is_error()) {
        return fatal(collected.error());
    }
    const std::vector<adp::Task>& tasks = collected.value();

    qCInfo(adpBatch, "Found %zu audio files in %s", tasks.size(), qPrintable(options.inputDir));
    if (tasks.empty()) {
        return ExitSuccess;
    }

    auto dirs = EnsureOutputDirectories(tasks);
    if (dirs.is_error()) {
        return fatal(dirs.error());
    }

    qCInfo(adpBatch, "Target sample rate: %d Hz", config.target_sample_rate);
    qCInfo(adpBatch, "Duration range: %g - %g seconds",
           config.min_duration_seconds, config.max_duration_seconds);
    qCInfo(adpBatch, "Processing with %zu threads",
           adp::WorkerPool::ResolveThreadCount(static_cast<size_t>(options.threads), tasks.size()));

    const auto report = adp::WorkerPool::Run(
        tasks, static_cast<size_t>(options.threads),
        [](const adp::Task& task, const adp::TaskOutcome& outcome) {
            if (outcome.result.is_ok()) {
                qCInfo(adpBatch, "Processed: %s", task.input_path.c_str());
                qCDebug(adpBatch, "  -> %s (%lld ms)", task.output_path.c_str(),
                        static_cast<long long>(outcome.elapsed_ms));
            } else {
                const adp::Error& error = outcome.result.error();
                qCWarning(adpBatch, "Failed: %s: %s: %s", task.input_path.c_str(),
                          adp::error_code_to_string(error.code), error.message.c_str());
            }
        });

    qCDebug(adpBatch, "Ran on %zu worker threads", report.thread_count);
    qCInfo(adpBatch, "Processing complete! %zu succeeded, %zu failed",
           report.succeeded, report.failed);

    return report.failed == 0 ? ExitSuccess : ExitPartialFailure;
}

}
