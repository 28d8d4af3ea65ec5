#include "modelfetch/chunk_fetcher.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/logger.hpp"
#include "modelfetch/output_file.hpp"

#include <optional>
#include <string>

#include <fmt/format.h>

namespace modelfetch {

ChunkFetcher::ChunkFetcher(HttpClient& http, TransferControl& control, ProgressAggregator* progress)
    : http_(http), control_(control), progress_(progress) {}

bool ChunkFetcher::acceptStatus(long status, bool ranged) {
    return status == 200 || (ranged && status == 206);
}

void ChunkFetcher::fetch(const ChunkRequest& request) {
    const ChunkPlan& plan = request.plan;
    const std::uint64_t expected = plan.length();
    written_ = 0;

    OutputFile file(request.output_path);
    std::string failure;

    const BodySink sink = [&](const ResponseHead& head, const char* data, std::size_t size) -> bool {
        if (!acceptStatus(head.status, request.ranged)) {
            failure = fmt::format("HTTP {} for chunk {}", head.status, plan.index);
            return false;
        }
        if (!control_.waitWhilePaused()) {
            return false;
        }
        if (written_ + size > expected) {
            failure = fmt::format("Server sent more than the {} bytes requested for chunk {}",
                                  expected, plan.index);
            return false;
        }

        try {
            file.writeAt(plan.start + written_, data, size);
        } catch (const TransferError& ex) {
            failure = ex.what();
            return false;
        }

        written_ += size;
        control_.addBytes(plan.index, size);
        if (progress_) {
            progress_->onIncrement(plan.index);
        }
        return true;
    };

    std::optional<ByteRange> range;
    if (request.ranged) {
        range = ByteRange{plan.start, plan.end};
    }

    detail::log(spdlog::level::debug, "Chunk {} requesting bytes {}-{}", plan.index, plan.start, plan.end);
    const FetchResult result = http_.get(request.url, range, sink, [this] { return control_.shouldStop(); });

    if (!failure.empty()) {
        throw TransferError(failure);
    }
    if (control_.shouldStop()) {
        return;
    }
    if (!acceptStatus(result.head.status, request.ranged)) {
        throw TransferError(fmt::format("HTTP {} for chunk {}", result.head.status, plan.index));
    }
    if (written_ != expected) {
        throw TransferError(fmt::format("Range download incomplete for chunk {} ({} of {} bytes)",
                                        plan.index, written_, expected));
    }
    detail::log(spdlog::level::debug, "Chunk {} finished ({} bytes)", plan.index, written_);
}

} // namespace modelfetch
