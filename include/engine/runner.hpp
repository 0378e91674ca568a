//! # Parallel Runner
//!
//! Checks many files on a fixed-size worker pool.
//!
//! ## Components
//!
//! | Class       | Description                          |
//! |-------------|--------------------------------------|
//! | `WorkQueue` | Thread-safe path queue               |
//! | `Runner`    | Starts workers, collects results     |
//!
//! Results are appended under a mutex in completion order and sorted by
//! path at the end, so the report never depends on scheduling.
//!
//! ## Interruption
//!
//! `request_interrupt()` (called from the SIGINT handler) sets an atomic
//! flag. Workers finish the file they are on and take no more; files never
//! started are left out of the report, which is marked interrupted.

#ifndef CONFORM_ENGINE_RUNNER_HPP
#define CONFORM_ENGINE_RUNNER_HPP

#include "engine/file_checker.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace conform::engine {

// ============================================================================
// Interruption
// ============================================================================

/// Async-signal-safe: only stores to a lock-free atomic.
void request_interrupt() noexcept;
[[nodiscard]] auto interrupt_requested() noexcept -> bool;
void reset_interrupt() noexcept;

// ============================================================================
// Work Queue
// ============================================================================

class WorkQueue {
public:
    void push(std::string path);

    /// Waits up to `timeout_ms` for a path. Returns nullopt when the queue
    /// is still empty after the wait.
    [[nodiscard]] auto pop(int timeout_ms = 100) -> std::optional<std::string>;

    void clear();
    [[nodiscard]] auto size() -> size_t;

private:
    std::queue<std::string> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

// ============================================================================
// Runner
// ============================================================================

struct RunReport {
    std::vector<FileResult> files; ///< Sorted by path.
    bool interrupted = false;
    size_t skipped = 0; ///< Files never started because of the interrupt.
};

class Runner {
public:
    /// `jobs == 0` uses one worker per hardware thread.
    Runner(const FileChecker& checker, size_t jobs = 0);

    /// Checks every path. `seed` results (e.g. discovery errors) are merged
    /// into the report.
    [[nodiscard]] auto run(const std::vector<std::string>& paths,
                           std::vector<FileResult> seed = {}) -> RunReport;

    [[nodiscard]] auto jobs() const -> size_t {
        return jobs_;
    }

private:
    const FileChecker& checker_;
    size_t jobs_;
    WorkQueue queue_;
    std::mutex results_mutex_;
    std::vector<FileResult> results_;

    void worker_thread();
};

} // namespace conform::engine

#endif // CONFORM_ENGINE_RUNNER_HPP
