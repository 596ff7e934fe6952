#pragma once

#include "batch_options.h"

namespace ADP {

// Process exit status of a batch
enum ExitStatus {
    ExitSuccess = 0,       // every file succeeded, or there were none
    ExitPartialFailure = 1,
    ExitFatal = 2          // bad configuration, unreadable input, output dir not creatable
};

/**
 * Run a whole batch: validate, collect, create output directories, process
 *
 * Logs each file's outcome as it completes and a final summary line.
 * Fatal errors are logged and returned before any worker starts.
 *
 * @return ExitStatus value
 */
int RunBatch(const BatchOptions& options);

}
