#pragma once

#include "adp_config.h"
#include "adp_errors.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace adp {

// Result of one task, stored in the task's own slot
struct TaskOutcome {
    size_t index = 0;
    Result<void> result;
    int64_t elapsed_ms = 0;
};

// Outcomes are in task order regardless of completion order
struct BatchReport {
    std::vector<TaskOutcome> outcomes;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t thread_count = 0;
};

// Fixed pool of worker threads claiming tasks from a shared atomic cursor.
// Each task is claimed exactly once; a failing task never stops the others.
class WorkerPool {
public:
    using TaskFn = std::function<Result<void>(const Task&)>;

    // Called on the worker thread that ran the task; must be thread-safe
    using OutcomeFn = std::function<void(const Task&, const TaskOutcome&)>;

    // Explicit requests are capped at this many threads per hardware thread
    static constexpr size_t MAX_THREADS_PER_CORE = 8;

    // max(1, min(requested or hardware concurrency, task_count)),
    // with requested capped at MAX_THREADS_PER_CORE * hardware concurrency
    static size_t ResolveThreadCount(size_t requested, size_t task_count);

    // Blocks until every task has run and every worker is joined.
    // A std::exception thrown by task_fn becomes that task's Internal error.
    // If the OS refuses a thread, the batch runs on the ones already started
    // (or on the calling thread when none could start); thread_count reports
    // how many actually ran.
    static BatchReport Run(const std::vector<Task>& tasks,
                           size_t requested_threads,
                           const TaskFn& task_fn,
                           const OutcomeFn& on_outcome = OutcomeFn());

    // Same, running ProcessTask
    static BatchReport Run(const std::vector<Task>& tasks,
                           size_t requested_threads,
                           const OutcomeFn& on_outcome = OutcomeFn());
};

} // namespace adp
