#pragma once

#include "chunk_plan.hpp"
#include "http_client.hpp"
#include "progress_aggregator.hpp"
#include "transfer_control.hpp"

#include <cstdint>
#include <string>

namespace modelfetch {

struct ChunkRequest {
    std::string url;
    std::string output_path;
    ChunkPlan plan;
    // false: plain GET of the whole body (single-connection mode)
    bool ranged{true};
};

class ChunkFetcher {
public:
    ChunkFetcher(HttpClient& http, TransferControl& control, ProgressAggregator* progress = nullptr);

    // Returns normally on success and on cancellation. Throws TransferError
    // on an unexpected status, a network fault, a write failure or a body
    // that does not match the requested range.
    void fetch(const ChunkRequest& request);

    [[nodiscard]] std::uint64_t bytesWritten() const { return written_; }

private:
    [[nodiscard]] static bool acceptStatus(long status, bool ranged);

    HttpClient& http_;
    TransferControl& control_;
    ProgressAggregator* progress_;
    std::uint64_t written_{0};
};

} // namespace modelfetch
