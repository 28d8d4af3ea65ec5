#include "modelfetch/transfer_control.hpp"

#include <stdexcept>

namespace modelfetch {

TransferControl::TransferControl(std::chrono::milliseconds pause_poll) : pause_poll_(pause_poll) {}

void TransferControl::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
}

void TransferControl::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

void TransferControl::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void TransferControl::abort() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
    }
    cv_.notify_all();
}

bool TransferControl::isPaused() const { return paused_.load(); }

bool TransferControl::isCancelled() const { return cancelled_.load(); }

bool TransferControl::shouldStop() const { return cancelled_.load() || aborted_.load(); }

bool TransferControl::waitWhilePaused() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (paused_ && !cancelled_ && !aborted_) {
        cv_.wait_for(lock, pause_poll_);
    }
    return !cancelled_ && !aborted_;
}

void TransferControl::resetCounters(std::size_t slots) {
    counters_ = std::make_unique<std::atomic<std::uint64_t>[]>(slots);
    for (std::size_t i = 0; i < slots; ++i) {
        counters_[i].store(0);
    }
    slot_count_ = slots;
}

void TransferControl::addBytes(std::size_t slot, std::uint64_t bytes) {
    if (slot >= slot_count_) {
        throw std::out_of_range("transfer counter slot out of range");
    }
    counters_[slot].fetch_add(bytes, std::memory_order_relaxed);
}

std::uint64_t TransferControl::slotBytes(std::size_t slot) const {
    if (slot >= slot_count_) {
        throw std::out_of_range("transfer counter slot out of range");
    }
    return counters_[slot].load(std::memory_order_relaxed);
}

std::uint64_t TransferControl::totalDownloaded() const {
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < slot_count_; ++i) {
        total += counters_[i].load(std::memory_order_relaxed);
    }
    return total;
}

} // namespace modelfetch
