#pragma once

#include "chunk_plan.hpp"
#include "download_registry.hpp"
#include "download_status.hpp"
#include "event_bus.hpp"
#include "http_client.hpp"
#include "transfer_control.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace modelfetch {

// Upper bound on parallel connections per download.
inline constexpr std::size_t kMaxConnections = 64;

struct TransferOptions {
    std::size_t connections{8};
    // Files up to this size go through a single connection.
    std::uint64_t chunk_threshold{32ULL * 1024 * 1024};
    std::chrono::milliseconds progress_interval{100};
};

struct SizeInfo {
    std::uint64_t total{0};
    bool supports_range{false};
};

/**
 * Runs one job from size discovery to a terminal state: preallocates the
 * destination, fans out chunk fetchers (or one stream), joins them, then
 * records completed / error / cancelled in the registry and publishes the
 * matching event.
 */
class TransferCoordinator {
public:
    TransferCoordinator(HttpClient& http, DownloadRegistry& registry, const EventBus& events,
                        TransferOptions options = {});

    // Never throws; every failure ends as DownloadState::Error.
    DownloadState run(const JobDescriptor& job, TransferControl& control);

    // HEAD first, then GET bytes=0-0. Throws SizeUnknownError when neither
    // yields a size, TransferError when `should_abort` fires.
    [[nodiscard]] SizeInfo discoverSize(const std::string& url, const AbortCheck& should_abort = {});

    [[nodiscard]] bool useChunks(const SizeInfo& info) const;
    // Configured connections clamped to [1, kMaxConnections].
    [[nodiscard]] std::size_t connections() const;
    [[nodiscard]] std::vector<ChunkPlan> planFor(const SizeInfo& info) const;

private:
    void transfer(const JobDescriptor& job, TransferControl& control, const SizeInfo& info);
    DownloadState finishCancelled(const JobDescriptor& job, bool remove_file);
    DownloadState finishCompleted(const JobDescriptor& job, std::uint64_t total);
    DownloadState finishErrored(const JobDescriptor& job, const std::string& message);

    HttpClient& http_;
    DownloadRegistry& registry_;
    const EventBus& events_;
    TransferOptions options_;
};

// Parses the TOTAL of "bytes 0-0/TOTAL"; 0 when absent, unknown ("*") or
// not a plain decimal number.
[[nodiscard]] std::uint64_t parseContentRangeTotal(const std::string& content_range);

} // namespace modelfetch
