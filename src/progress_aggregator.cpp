#include "modelfetch/progress_aggregator.hpp"
#include "modelfetch/download_status.hpp"

#include <algorithm>
#include <utility>

namespace modelfetch {

ProgressAggregator::ProgressAggregator(const TransferControl& control,
                                       std::uint64_t total,
                                       std::chrono::milliseconds interval,
                                       Emit emit,
                                       std::size_t reporter)
    : control_(control),
      total_(total),
      interval_(interval),
      emit_(std::move(emit)),
      reporter_(reporter) {}

bool ProgressAggregator::onIncrement(std::size_t chunk_index, Clock::time_point now) {
    if (chunk_index != reporter_) {
        return false;
    }
    // Only the reporter's thread gets here, so emitted_/last_emit_ need no lock.
    if (emitted_ && now - last_emit_ < interval_) {
        return false;
    }

    emitted_ = true;
    last_emit_ = now;
    if (emit_) {
        emit_(snapshot());
    }
    return true;
}

ProgressSnapshot ProgressAggregator::snapshot() const {
    const std::uint64_t downloaded = std::min(control_.totalDownloaded(), total_);
    return {downloaded, total_, computeProgress(downloaded, total_)};
}

} // namespace modelfetch
