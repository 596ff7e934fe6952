#pragma once

#include <audio_dataset_platform/adp_config.h>
#include <audio_dataset_platform/adp_errors.h>
#include <vector>

namespace ADP {

// Create every distinct output parent directory, once, before workers start.
// Existing directories are fine. Errors: DirectoryCreateFailed (names the directory)
adp::Result<void> EnsureOutputDirectories(const std::vector<adp::Task>& tasks);

}
