#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace modelfetch {

/**
 * Per-job pause/cancel flags plus one byte counter slot per chunk. Each slot
 * has a single writer (its fetcher); readers sum the slots for the aggregate.
 */
class TransferControl {
public:
    explicit TransferControl(std::chrono::milliseconds pause_poll = std::chrono::milliseconds(500));

    void pause();
    void resume();
    // User-initiated stop. Not an error.
    void cancel();
    // Internal stop after a sibling chunk failed.
    void abort();

    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] bool isCancelled() const;
    [[nodiscard]] bool shouldStop() const;

    // Blocks while paused. Returns false if the transfer must stop.
    bool waitWhilePaused();

    // Not thread-safe; call before any fetcher starts.
    void resetCounters(std::size_t slots);
    void addBytes(std::size_t slot, std::uint64_t bytes);
    [[nodiscard]] std::uint64_t slotBytes(std::size_t slot) const;
    [[nodiscard]] std::uint64_t totalDownloaded() const;

private:
    std::chrono::milliseconds pause_poll_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> paused_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> aborted_{false};

    std::unique_ptr<std::atomic<std::uint64_t>[]> counters_;
    std::size_t slot_count_{0};
};

using TransferControlPtr = std::shared_ptr<TransferControl>;

} // namespace modelfetch
