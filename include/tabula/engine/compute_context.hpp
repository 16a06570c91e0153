#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/logging.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tabula {

struct ComputeOptions {
    /// Executor threads; 0 means std::thread::hardware_concurrency().
    std::size_t workers = 0;
};

/// Execution environment for the distributed backend: a fixed set of executor
/// threads that run batches of partition tasks.
///
/// Executors start in the constructor and are joined by stop() or the
/// destructor, so holding the context in a scope bounds its lifetime even when
/// a stage fails. Cancelling in-flight work is the owner's job; the context
/// never retries a failed task.
class ComputeContext {
   public:
    explicit ComputeContext(ComputeOptions options = {}, LoggerPtr logger = nullptr);
    ~ComputeContext();

    ComputeContext(const ComputeContext&) = delete;
    auto operator=(const ComputeContext&) -> ComputeContext& = delete;

    [[nodiscard]] auto workers() const noexcept -> std::size_t { return worker_count_; }
    [[nodiscard]] auto running() const -> bool;

    /// Run task(0) ... task(count - 1) on the executors and wait for all of them.
    ///
    /// Returns the error of the first task that failed; tasks that have not
    /// started once a failure is recorded are skipped. An exception escaping a
    /// task is rethrown here after the batch has drained.
    /// Throws std::logic_error when the context has been stopped.
    [[nodiscard]] auto run_tasks(std::size_t count, const std::function<Status(std::size_t)>& task)
        -> Status;

    /// Join the executors. Idempotent.
    void stop();

   private:
    void executor_loop();

    LoggerPtr logger_;
    std::size_t worker_count_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

}  // namespace tabula
