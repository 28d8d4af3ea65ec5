#pragma once

#include "download_status.hpp"
#include "transfer_control.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace modelfetch {

/**
 * FIFO of pending jobs plus the single active slot. One supervisor thread
 * takes the head, runs it to completion through the runner, then takes the
 * next one, so at most one transfer runs at a time.
 */
class JobQueue {
public:
    using Runner = std::function<void(const JobDescriptor&, TransferControl&)>;
    using ControlFactory = std::function<TransferControlPtr()>;

    enum class CancelOutcome {
        RemovedPending,
        SignalledActive,
        NotFound
    };

    explicit JobQueue(Runner runner, ControlFactory make_control = {});
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    void enqueue(JobDescriptor job);
    // Wakes the supervisor. No-op while a transfer runs or the queue is empty.
    void tryAdvance();
    // Strikes a pending job. Returns false if it was not pending.
    bool remove(const std::string& id);
    CancelOutcome cancel(const std::string& id);

    bool pause(const std::string& id);
    bool resume(const std::string& id);

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::optional<std::string> activeId() const;
    [[nodiscard]] std::vector<std::string> pendingIds() const;

    // Blocks until nothing is pending or running, or the timeout expires.
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    // Cancels the active transfer, joins the supervisor and returns the jobs
    // that never started.
    std::vector<JobDescriptor> shutdown();

private:
    struct ActiveJob {
        JobDescriptor job;
        TransferControlPtr control;
    };

    void supervise();

    Runner runner_;
    ControlFactory make_control_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<JobDescriptor> pending_;
    std::optional<ActiveJob> active_;
    bool stopping_{false};
    std::thread supervisor_;
};

} // namespace modelfetch
