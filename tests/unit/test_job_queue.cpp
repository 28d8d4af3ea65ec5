#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "modelfetch/job_queue.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using modelfetch::JobDescriptor;
using modelfetch::JobQueue;
using modelfetch::TransferControl;

namespace {

// Runner that records start order and blocks each job on its own gate.
class ScriptedRunner {
public:
    void operator()(const JobDescriptor& job, TransferControl& control) {
        std::shared_ptr<Gate> gate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_.push_back(job.id);
            gate = gateFor(job.id);
        }
        const int now_running = ++running_;
        int seen = max_running_.load();
        while (now_running > seen && !max_running_.compare_exchange_weak(seen, now_running)) {
        }

        const bool released = gate->wait([&control] { return control.shouldStop(); });
        --running_;
        if (released && job.id == "throws") {
            throw std::runtime_error("runner blew up");
        }
    }

    void release(const std::string& id) {
        std::shared_ptr<Gate> gate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate = gateFor(id);
        }
        gate->open();
    }

    std::vector<std::string> started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    int maxRunning() const { return max_running_.load(); }

private:
    std::shared_ptr<Gate> gateFor(const std::string& id) {
        auto& gate = gates_[id];
        if (!gate) {
            gate = std::make_shared<Gate>();
        }
        return gate;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Gate>> gates_;
    std::vector<std::string> started_;
    std::atomic<int> running_{0};
    std::atomic<int> max_running_{0};
};

JobDescriptor job(const std::string& id) {
    return {id, "http://example.com/" + id, "/tmp/" + id, 1};
}

} // namespace

TEST_CASE("Jobs run one at a time in submission order") {
    auto runner = std::make_shared<ScriptedRunner>();
    JobQueue queue([runner](const JobDescriptor& j, TransferControl& c) { (*runner)(j, c); });

    queue.enqueue(job("a"));
    queue.enqueue(job("b"));
    queue.enqueue(job("c"));

    REQUIRE(wait_for([&] { return queue.activeId() == std::string("a"); }));
    REQUIRE(queue.pendingIds() == std::vector<std::string>{"b", "c"});

    runner->release("a");
    REQUIRE(wait_for([&] { return queue.activeId() == std::string("b"); }));
    runner->release("b");
    runner->release("c");

    REQUIRE(queue.waitUntilIdle(5000ms));
    REQUIRE(runner->started() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(runner->maxRunning() == 1);
    REQUIRE_FALSE(queue.activeId());
}

TEST_CASE("A pending job can be struck before it starts") {
    auto runner = std::make_shared<ScriptedRunner>();
    JobQueue queue([runner](const JobDescriptor& j, TransferControl& c) { (*runner)(j, c); });

    queue.enqueue(job("a"));
    queue.enqueue(job("b"));
    REQUIRE(wait_for([&] { return queue.activeId() == std::string("a"); }));

    REQUIRE(queue.cancel("b") == JobQueue::CancelOutcome::RemovedPending);
    REQUIRE_FALSE(queue.contains("b"));
    REQUIRE(queue.cancel("b") == JobQueue::CancelOutcome::NotFound);

    runner->release("a");
    REQUIRE(queue.waitUntilIdle(5000ms));
    REQUIRE(runner->started() == std::vector<std::string>{"a"});
}

TEST_CASE("Cancelling the active job signals its control and the next job starts") {
    auto runner = std::make_shared<ScriptedRunner>();
    JobQueue queue([runner](const JobDescriptor& j, TransferControl& c) { (*runner)(j, c); },
                   [] { return std::make_shared<TransferControl>(5ms); });

    queue.enqueue(job("a"));
    queue.enqueue(job("b"));
    REQUIRE(wait_for([&] { return queue.activeId() == std::string("a"); }));

    REQUIRE(queue.cancel("a") == JobQueue::CancelOutcome::SignalledActive);
    REQUIRE(wait_for([&] { return queue.activeId() == std::string("b"); }));

    runner->release("b");
    REQUIRE(queue.waitUntilIdle(5000ms));
}

TEST_CASE("A runner that throws does not stall the queue") {
    auto runner = std::make_shared<ScriptedRunner>();
    JobQueue queue([runner](const JobDescriptor& j, TransferControl& c) { (*runner)(j, c); });

    runner->release("throws");
    runner->release("after");
    queue.enqueue(job("throws"));
    queue.enqueue(job("after"));

    REQUIRE(queue.waitUntilIdle(5000ms));
    REQUIRE(runner->started() == std::vector<std::string>{"throws", "after"});
}

TEST_CASE("Pause and resume only reach the active job") {
    std::atomic<TransferControl*> seen{nullptr};
    auto gate = std::make_shared<Gate>();
    JobQueue queue([&seen, gate](const JobDescriptor&, TransferControl& control) {
        seen = &control;
        gate->wait([&control] { return control.shouldStop(); });
    });

    queue.enqueue(job("a"));
    queue.enqueue(job("b"));
    REQUIRE(wait_for([&] { return seen.load() != nullptr; }));

    REQUIRE(queue.pause("a"));
    REQUIRE(seen.load()->isPaused());
    REQUIRE_FALSE(queue.pause("b"));
    REQUIRE(queue.resume("a"));
    REQUIRE_FALSE(seen.load()->isPaused());

    gate->open();
    REQUIRE(queue.waitUntilIdle(5000ms));
}

TEST_CASE("Shutdown cancels the active job and returns the jobs that never started") {
    auto runner = std::make_shared<ScriptedRunner>();
    JobQueue queue([runner](const JobDescriptor& j, TransferControl& c) { (*runner)(j, c); },
                   [] { return std::make_shared<TransferControl>(5ms); });

    queue.enqueue(job("a"));
    queue.enqueue(job("b"));
    queue.enqueue(job("c"));
    REQUIRE(wait_for([&] { return queue.activeId() == std::string("a"); }));

    const auto dropped = queue.shutdown();
    REQUIRE(dropped.size() == 2);
    REQUIRE(dropped[0].id == "b");
    REQUIRE(dropped[1].id == "c");
    REQUIRE(runner->started() == std::vector<std::string>{"a"});
    REQUIRE(queue.shutdown().empty());
}
