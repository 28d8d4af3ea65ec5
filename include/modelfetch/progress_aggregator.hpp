#pragma once

#include "transfer_control.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace modelfetch {

struct ProgressSnapshot {
    std::uint64_t downloaded{0};
    std::uint64_t total{0};
    double progress{0.0};
};

/**
 * Turns per-chunk counters into one downloaded/total/percent figure. Only the
 * designated reporter chunk emits, at most once per interval.
 */
class ProgressAggregator {
public:
    using Clock = std::chrono::steady_clock;
    using Emit = std::function<void(const ProgressSnapshot&)>;

    ProgressAggregator(const TransferControl& control,
                       std::uint64_t total,
                       std::chrono::milliseconds interval,
                       Emit emit,
                       std::size_t reporter = 0);

    // Returns true when an event was emitted.
    bool onIncrement(std::size_t chunk_index, Clock::time_point now = Clock::now());

    [[nodiscard]] ProgressSnapshot snapshot() const;

private:
    const TransferControl& control_;
    std::uint64_t total_;
    std::chrono::milliseconds interval_;
    Emit emit_;
    std::size_t reporter_;
    bool emitted_{false};
    Clock::time_point last_emit_{};
};

} // namespace modelfetch
