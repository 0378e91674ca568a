//! # Parallel Runner Implementation
//!
//! ```text
//! run()
//!   ├─ push every path to the queue
//!   ├─ start min(jobs, files) workers
//!   │     └─ worker_thread(): pop → check_file → append result
//!   ├─ join
//!   └─ sort results by path
//! ```

#include "engine/runner.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace conform::engine {

// ============================================================================
// Interruption
// ============================================================================

namespace {

std::atomic<bool> g_interrupted{false};

} // namespace

void request_interrupt() noexcept {
    g_interrupted.store(true, std::memory_order_relaxed);
}

auto interrupt_requested() noexcept -> bool {
    return g_interrupted.load(std::memory_order_relaxed);
}

void reset_interrupt() noexcept {
    g_interrupted.store(false, std::memory_order_relaxed);
}

// ============================================================================
// WorkQueue Implementation
// ============================================================================

void WorkQueue::push(std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(path));
    cv_.notify_one();
}

auto WorkQueue::pop(int timeout_ms) -> std::optional<std::string> {
    std::unique_lock<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !queue_.empty(); });
    }

    if (queue_.empty()) {
        return std::nullopt;
    }

    std::string path = std::move(queue_.front());
    queue_.pop();
    return path;
}

void WorkQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::queue<std::string>().swap(queue_);
}

auto WorkQueue::size() -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// Runner Implementation
// ============================================================================

Runner::Runner(const FileChecker& checker, size_t jobs) : checker_(checker), jobs_(jobs) {
    if (jobs_ == 0) {
        jobs_ = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

auto Runner::run(const std::vector<std::string>& paths, std::vector<FileResult> seed)
    -> RunReport {
    results_ = std::move(seed);
    for (const auto& path : paths) {
        queue_.push(path);
    }

    size_t workers_count = std::min(jobs_, paths.size());
    CONFORM_LOG_INFO("runner", "checking " << paths.size() << " file(s) with " << workers_count
                                           << " worker(s)");

    std::vector<std::thread> workers;
    workers.reserve(workers_count);
    for (size_t i = 0; i < workers_count; ++i) {
        workers.emplace_back(&Runner::worker_thread, this);
    }
    for (auto& worker : workers) {
        worker.join();
    }

    RunReport report;
    report.interrupted = interrupt_requested();
    report.skipped = queue_.size();
    if (report.interrupted) {
        CONFORM_LOG_WARN("runner", "interrupted, " << report.skipped << " file(s) not checked");
        queue_.clear();
    }

    std::lock_guard<std::mutex> lock(results_mutex_);
    report.files = std::move(results_);
    results_.clear();
    std::stable_sort(report.files.begin(), report.files.end(),
                     [](const FileResult& a, const FileResult& b) { return a.path < b.path; });
    return report;
}

void Runner::worker_thread() {
    while (!interrupt_requested()) {
        auto path = queue_.pop(10);
        if (!path) {
            // Every path is queued before the workers start.
            break;
        }

        FileResult result;
        try {
            result = checker_.check_file(*path);
        } catch (const std::exception& e) {
            CONFORM_LOG_ERROR("runner", "internal error on " << *path << ": " << e.what());
            result = io_error_result(*path, std::string("internal error: ") + e.what());
        }

        CONFORM_LOG_DEBUG("runner", *path << ": " << file_outcome_name(result.outcome));
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_.push_back(std::move(result));
    }
}

} // namespace conform::engine
