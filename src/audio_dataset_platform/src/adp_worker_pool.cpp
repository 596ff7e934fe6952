#include <audio_dataset_platform/adp_worker_pool.h>
#include <audio_dataset_platform/adp_pipeline.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <system_error>
#include <thread>

namespace adp {

size_t WorkerPool::ResolveThreadCount(size_t requested, size_t task_count) {
    const size_t hardware = std::max<size_t>(std::thread::hardware_concurrency(), 1);  // may report 0
    size_t threads = requested;
    if (threads == 0) {
        threads = hardware;
    }
    threads = std::min(threads, hardware * MAX_THREADS_PER_CORE);
    threads = std::min(threads, task_count);
    return std::max<size_t>(threads, 1);
}

BatchReport WorkerPool::Run(const std::vector<Task>& tasks,
                            size_t requested_threads,
                            const TaskFn& task_fn,
                            const OutcomeFn& on_outcome) {
    BatchReport report;
    report.thread_count = ResolveThreadCount(requested_threads, tasks.size());
    report.outcomes.resize(tasks.size());

    // Only shared mutable state; outcome slots are disjoint per index
    std::atomic<size_t> cursor{0};

    auto worker = [&]() {
        while (true) {
            const size_t index = cursor.fetch_add(1);
            if (index >= tasks.size()) {
                return;
            }

            const Task& task = tasks[index];
            TaskOutcome& outcome = report.outcomes[index];
            outcome.index = index;

            const auto start = std::chrono::steady_clock::now();
            try {
                outcome.result = task_fn(task);
            } catch (const std::exception& e) {
                outcome.result = Error::internal(std::string("Unhandled exception: ") + e.what());
            }
            outcome.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();

            if (on_outcome) {
                on_outcome(task, outcome);
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(report.thread_count);
    for (size_t i = 0; i < report.thread_count; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error&) {
            // Out of threads: the started workers drain the cursor on their own
            break;
        }
    }

    if (workers.empty()) {
        worker();
        report.thread_count = 1;
    } else {
        report.thread_count = workers.size();
    }
    for (auto& t : workers) {
        t.join();
    }

    for (const auto& outcome : report.outcomes) {
        if (outcome.result.is_ok()) {
            ++report.succeeded;
        } else {
            ++report.failed;
        }
    }
    return report;
}

BatchReport WorkerPool::Run(const std::vector<Task>& tasks,
                            size_t requested_threads,
                            const OutcomeFn& on_outcome) {
    return Run(tasks, requested_threads, TaskFn(ProcessTask), on_outcome);
}

} // namespace adp
