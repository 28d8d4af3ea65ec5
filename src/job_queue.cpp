#include "modelfetch/job_queue.hpp"
#include "modelfetch/logger.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <memory>
#include <utility>

namespace modelfetch {

JobQueue::JobQueue(Runner runner, ControlFactory make_control)
    : runner_(std::move(runner)), make_control_(std::move(make_control)) {
    if (!make_control_) {
        make_control_ = [] { return std::make_shared<TransferControl>(); };
    }
    supervisor_ = std::thread([this] { supervise(); });
}

JobQueue::~JobQueue() { shutdown(); }

void JobQueue::enqueue(JobDescriptor job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(job));
    }
    tryAdvance();
}

void JobQueue::tryAdvance() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        detail::log(spdlog::level::debug, "Download already in progress, waiting...");
        return;
    }
    wake_.notify_one();
}

bool JobQueue::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = pending_.size();
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&id](const JobDescriptor& job) { return job.id == id; }),
                   pending_.end());
    const bool removed = pending_.size() != before;
    if (removed && pending_.empty() && !active_) {
        idle_.notify_all();
    }
    return removed;
}

JobQueue::CancelOutcome JobQueue::cancel(const std::string& id) {
    if (remove(id)) {
        return CancelOutcome::RemovedPending;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ && active_->job.id == id) {
        active_->control->cancel();
        return CancelOutcome::SignalledActive;
    }
    return CancelOutcome::NotFound;
}

bool JobQueue::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || active_->job.id != id) {
        return false;
    }
    active_->control->pause();
    return true;
}

bool JobQueue::resume(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || active_->job.id != id) {
        return false;
    }
    active_->control->resume();
    return true;
}

bool JobQueue::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ && active_->job.id == id) {
        return true;
    }
    return std::any_of(pending_.begin(), pending_.end(), [&id](const JobDescriptor& job) { return job.id == id; });
}

std::optional<std::string> JobQueue::activeId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        return std::nullopt;
    }
    return active_->job.id;
}

std::vector<std::string> JobQueue::pendingIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(pending_.size());
    std::transform(pending_.begin(), pending_.end(), std::back_inserter(ids),
                   [](const JobDescriptor& job) { return job.id; });
    return ids;
}

bool JobQueue::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return pending_.empty() && !active_; });
}

std::vector<JobDescriptor> JobQueue::shutdown() {
    std::vector<JobDescriptor> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return dropped;
        }
        stopping_ = true;
        dropped.assign(pending_.begin(), pending_.end());
        pending_.clear();
        if (active_) {
            active_->control->cancel();
        }
    }
    wake_.notify_all();

    if (supervisor_.joinable()) {
        supervisor_.join();
    }
    return dropped;
}

void JobQueue::supervise() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
        if (stopping_) {
            break;
        }

        JobDescriptor job = std::move(pending_.front());
        pending_.pop_front();
        TransferControlPtr control = make_control_();
        active_ = ActiveJob{job, control};
        lock.unlock();

        try {
            runner_(job, *control);
        } catch (const std::exception& ex) {
            detail::log(spdlog::level::err, "Transfer runner failed for {}: {}", job.id, ex.what());
        }

        lock.lock();
        active_.reset();
        detail::log(spdlog::level::info, "Download finished: {}, processing next in queue...", job.id);
        if (pending_.empty()) {
            idle_.notify_all();
        }
    }
}

} // namespace modelfetch
