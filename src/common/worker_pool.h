#pragma once

#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace Strata {

// Raised through the future of a task submitted after Stop()
class PoolStopped : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Fixed set of threads draining one FIFO of independent jobs, e.g. one
 * finalize per scope. Each job's result or exception comes back through its
 * future. Once Stop() begins, new jobs are refused with PoolStopped instead of
 * being queued where no worker would ever run them.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads, std::string name = "worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename Callback>
    auto Submit(Callback&& callback) -> std::future<std::invoke_result_t<std::decay_t<Callback>&>> {
        using Result = std::invoke_result_t<std::decay_t<Callback>&>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Callback>(callback));
        std::future<Result> future = task->get_future();
        std::vector<std::function<void()>> jobs;
        jobs.emplace_back([task]() { (*task)(); });
        if (!Enqueue(std::move(jobs))) {
            return Refused<Result>();
        }
        return future;
    }

    // One job per item, queued together; futures come back in item order
    template<typename Item, typename Fn>
    auto SubmitEach(const std::vector<Item>& items, Fn fn)
        -> std::vector<std::future<std::invoke_result_t<Fn&, const Item&>>> {
        using Result = std::invoke_result_t<Fn&, const Item&>;
        auto shared_fn = std::make_shared<Fn>(std::move(fn));

        std::vector<std::future<Result>> futures;
        std::vector<std::function<void()>> jobs;
        futures.reserve(items.size());
        jobs.reserve(items.size());
        for (const Item& item : items) {
            auto task = std::make_shared<std::packaged_task<Result()>>(
                [shared_fn, item]() { return (*shared_fn)(item); });
            futures.push_back(task->get_future());
            jobs.emplace_back([task]() { (*task)(); });
        }

        if (!Enqueue(std::move(jobs))) {
            for (auto& future : futures) {
                future = Refused<Result>();
            }
        }
        return futures;
    }

    // Refuses new jobs, runs everything already queued, then joins
    void Stop();

    size_t size() const { return workers_.size(); }
    size_t pending() const;

private:
    // False, leaving the queue untouched, once Stop() has begun
    bool Enqueue(std::vector<std::function<void()>> jobs);
    void WorkerLoop(size_t index);
    bool HasJobOrStopping() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
        return stopping_ || !jobs_.empty();
    }

    template<typename Result>
    std::future<Result> Refused() const {
        std::promise<Result> refused;
        refused.set_exception(std::make_exception_ptr(
            PoolStopped("WorkerPool " + name_ + " is stopped")));
        return refused.get_future();
    }

    const std::string name_;
    mutable absl::Mutex mu_;
    std::deque<std::function<void()>> jobs_ ABSL_GUARDED_BY(mu_);
    bool stopping_ ABSL_GUARDED_BY(mu_) = false;
    std::vector<std::thread> workers_;
};

} // namespace Strata
