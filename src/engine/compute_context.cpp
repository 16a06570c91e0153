#include <tabula/engine/compute_context.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>

namespace tabula {

namespace {

// Completion state shared by the tasks of one run_tasks() call.
struct Batch {
    std::mutex mutex;
    std::condition_variable done;
    std::size_t remaining = 0;
    std::atomic<bool> failed{false};
    std::optional<Error> first_error;
    std::exception_ptr exception;
};

}  // namespace

ComputeContext::ComputeContext(ComputeOptions options, LoggerPtr logger)
    : logger_(or_null(std::move(logger))) {
    worker_count_ = options.workers == 0
                        ? std::max<std::size_t>(1, std::thread::hardware_concurrency())
                        : options.workers;
    threads_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        threads_.emplace_back([this] { executor_loop(); });
    }
    logger_->info("Started compute context with {} executors", worker_count_);
}

ComputeContext::~ComputeContext() {
    stop();
}

auto ComputeContext::running() const -> bool {
    std::lock_guard lock(mutex_);
    return !stopping_;
}

void ComputeContext::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& th : threads_) {
        if (th.joinable()) {
            th.join();
        }
    }
    threads_.clear();
    logger_->info("Compute context stopped");
}

void ComputeContext::executor_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}

auto ComputeContext::run_tasks(std::size_t count, const std::function<Status(std::size_t)>& task)
    -> Status {
    if (count == 0) {
        return {};
    }
    auto batch = std::make_shared<Batch>();
    batch->remaining = count;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            throw std::logic_error("compute context has been stopped");
        }
        for (std::size_t i = 0; i < count; ++i) {
            queue_.emplace_back([batch, &task, i] {
                if (!batch->failed.load(std::memory_order_acquire)) {
                    try {
                        auto status = task(i);
                        if (!status) {
                            std::lock_guard guard(batch->mutex);
                            if (!batch->first_error.has_value() && !batch->exception) {
                                batch->first_error = std::move(status.error());
                            }
                            batch->failed.store(true, std::memory_order_release);
                        }
                    } catch (...) {
                        std::lock_guard guard(batch->mutex);
                        if (!batch->first_error.has_value() && !batch->exception) {
                            batch->exception = std::current_exception();
                        }
                        batch->failed.store(true, std::memory_order_release);
                    }
                }
                std::lock_guard guard(batch->mutex);
                if (--batch->remaining == 0) {
                    batch->done.notify_all();
                }
            });
        }
    }
    cv_.notify_all();
    logger_->debug("Scheduled {} tasks on {} executors", count, worker_count_);

    std::unique_lock lock(batch->mutex);
    batch->done.wait(lock, [&] { return batch->remaining == 0; });
    if (batch->exception) {
        std::rethrow_exception(batch->exception);
    }
    if (batch->first_error.has_value()) {
        return std::unexpected(std::move(*batch->first_error));
    }
    return {};
}

}  // namespace tabula
