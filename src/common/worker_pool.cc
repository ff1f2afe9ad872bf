#include "worker_pool.h"

#include <utility>

#include <glog/logging.h>

namespace Strata {

WorkerPool::WorkerPool(size_t num_threads, std::string name) : name_(std::move(name)) {
    CHECK_GT(num_threads, 0u) << "WorkerPool " << name_ << " needs at least one thread";
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerLoop, this, i);
    }
    VLOG(2) << "WorkerPool " << name_ << " started " << num_threads << " threads";
}

WorkerPool::~WorkerPool() {
    Stop();
}

bool WorkerPool::Enqueue(std::vector<std::function<void()>> jobs) {
    absl::MutexLock lock(&mu_);
    if (stopping_) {
        LOG(WARNING) << "WorkerPool " << name_ << " refused " << jobs.size() << " job(s) after Stop";
        return false;
    }
    for (auto& job : jobs) {
        jobs_.push_back(std::move(job));
    }
    return true;
}

size_t WorkerPool::pending() const {
    absl::ReaderMutexLock lock(&mu_);
    return jobs_.size();
}

void WorkerPool::Stop() {
    {
        absl::MutexLock lock(&mu_);
        stopping_ = true;
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::WorkerLoop(size_t index) {
    size_t ran = 0;
    while (true) {
        std::function<void()> job;
        {
            absl::MutexLock lock(&mu_);
            mu_.Await(absl::Condition(this, &WorkerPool::HasJobOrStopping));
            if (jobs_.empty()) {
                break;  // stopping and drained
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        // packaged_task captures the job's exception in its future
        job();
        ++ran;
    }
    VLOG(3) << "WorkerPool " << name_ << " thread " << index << " exiting after " << ran << " jobs";
}

} // namespace Strata
