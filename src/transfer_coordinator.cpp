#include "modelfetch/transfer_coordinator.hpp"
#include "modelfetch/chunk_fetcher.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/logger.hpp"
#include "modelfetch/output_file.hpp"
#include "modelfetch/progress_aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace modelfetch {

std::uint64_t parseContentRangeTotal(const std::string& content_range) {
    const auto slash = content_range.rfind('/');
    if (slash == std::string::npos || slash + 1 >= content_range.size()) {
        return 0;
    }
    const std::string total = content_range.substr(slash + 1);
    // stoull would accept a sign or leading blanks.
    if (!std::all_of(total.begin(), total.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return 0;
    }
    try {
        return std::stoull(total);
    } catch (const std::out_of_range&) {
        return 0;
    }
}

TransferCoordinator::TransferCoordinator(HttpClient& http, DownloadRegistry& registry, const EventBus& events,
                                         TransferOptions options)
    : http_(http), registry_(registry), events_(events), options_(options) {}

SizeInfo TransferCoordinator::discoverSize(const std::string& url, const AbortCheck& should_abort) {
    SizeInfo info;
    const auto stopped = [&should_abort] { return should_abort && should_abort(); };

    try {
        const ResponseHead head = http_.head(url, should_abort);
        if (head.status >= 200 && head.status < 300) {
            info.total = head.content_length.value_or(0);
            info.supports_range = head.accept_ranges == "bytes";
        }
    } catch (const TransferError& ex) {
        detail::log(spdlog::level::warn, "HEAD request failed for {}: {}", url, ex.what());
    }

    if (stopped()) {
        throw TransferError("Size discovery aborted");
    }

    if (info.total == 0) {
        detail::log(spdlog::level::info, "HEAD request didn't return size, trying GET with Range for {}", url);
        try {
            // Only the headers matter; stop before the body.
            const FetchResult first_byte = http_.get(
                url, ByteRange{0, 0}, [](const ResponseHead&, const char*, std::size_t) { return false; },
                should_abort);
            const ResponseHead& head = first_byte.head;
            if (head.status == 200 || head.status == 206) {
                info.total = parseContentRangeTotal(head.content_range);
                if (info.total > 0 || head.status == 206) {
                    info.supports_range = true;
                }
                if (info.total == 0) {
                    info.total = head.content_length.value_or(0);
                }
            }
        } catch (const TransferError& ex) {
            detail::log(spdlog::level::warn, "GET with Range failed for {}: {}", url, ex.what());
        }
    }

    if (stopped()) {
        throw TransferError("Size discovery aborted");
    }
    if (info.total == 0) {
        throw SizeUnknownError();
    }
    return info;
}

bool TransferCoordinator::useChunks(const SizeInfo& info) const {
    return info.supports_range && info.total > options_.chunk_threshold;
}

std::size_t TransferCoordinator::connections() const {
    return std::clamp<std::size_t>(options_.connections, 1, kMaxConnections);
}

std::vector<ChunkPlan> TransferCoordinator::planFor(const SizeInfo& info) const {
    return planChunks(info.total, useChunks(info) ? connections() : 1);
}

DownloadState TransferCoordinator::run(const JobDescriptor& job, TransferControl& control) {
    const bool started = registry_.transition(job.id, job.generation, DownloadState::Downloading,
                                              [](DownloadStatus& status) {
                                                  status.progress = 0.0;
                                                  status.downloaded = 0;
                                              });
    if (!started) {
        detail::log(spdlog::level::info, "Skipping {}: no longer queued", job.id);
        return DownloadState::Cancelled;
    }

    detail::log(spdlog::level::info, "Starting download {} with {} connections", job.id, connections());
    events_.publish({EventKind::Progress, job.id, 0.0, 0, 0, {}, {}});

    bool preallocated = false;
    try {
        const SizeInfo info = discoverSize(job.url, [&control] { return control.shouldStop(); });
        detail::log(spdlog::level::info, "File size for {}: {} bytes, supports range: {}", job.id, info.total,
                    info.supports_range);
        if (control.isCancelled()) {
            return finishCancelled(job, false);
        }

        OutputFile::preallocate(job.output_path, info.total);
        preallocated = true;
        registry_.update(job.id, job.generation, [&info](DownloadStatus& status) {
            status.total = info.total;
            status.downloaded = 0;
        });

        transfer(job, control, info);

        if (control.isCancelled()) {
            return finishCancelled(job, true);
        }
        return finishCompleted(job, info.total);
    } catch (const std::exception& ex) {
        if (control.isCancelled()) {
            return finishCancelled(job, preallocated);
        }
        return finishErrored(job, ex.what());
    }
}

void TransferCoordinator::transfer(const JobDescriptor& job, TransferControl& control, const SizeInfo& info) {
    const std::vector<ChunkPlan> plan = planFor(info);
    control.resetCounters(plan.size());

    ProgressAggregator progress(control, info.total, options_.progress_interval,
                                [this, &job](const ProgressSnapshot& snapshot) {
                                    const bool live = registry_.update(
                                        job.id, job.generation, [&snapshot](DownloadStatus& status) {
                                            status.progress = snapshot.progress;
                                            status.downloaded = snapshot.downloaded;
                                        });
                                    // Nothing after a terminal state.
                                    if (live) {
                                        events_.publish({EventKind::Progress, job.id, snapshot.progress,
                                                         snapshot.downloaded, snapshot.total, {}, {}});
                                    }
                                });

    if (!useChunks(info)) {
        detail::log(spdlog::level::info, "Using single connection for {}", job.id);
        ChunkFetcher fetcher(http_, control, &progress);
        fetcher.fetch({job.url, job.output_path, plan.front(), false});
        return;
    }

    detail::log(spdlog::level::info, "Using {} connections for {}", plan.size(), job.id);

    std::mutex error_mutex;
    std::optional<std::string> first_error;
    std::vector<std::thread> workers;
    workers.reserve(plan.size());

    const auto join_all = [&workers] {
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    };

    try {
        for (const ChunkPlan& chunk : plan) {
            workers.emplace_back([&, chunk]() {
                try {
                    ChunkFetcher fetcher(http_, control, &progress);
                    fetcher.fetch({job.url, job.output_path, chunk, true});
                } catch (const std::exception& ex) {
                    detail::log(spdlog::level::err, "Error in chunk {} for {}: {}", chunk.index, job.id,
                                ex.what());
                    {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (!first_error) {
                            first_error = ex.what();
                        }
                    }
                    control.abort();
                }
            });
        }
    } catch (const std::system_error& ex) {
        control.abort();
        join_all();
        throw TransferError(fmt::format("Failed to start chunk thread {} of {}: {}", workers.size(),
                                        plan.size(), ex.what()));
    }

    join_all();

    if (first_error) {
        throw TransferError(*first_error);
    }
}

DownloadState TransferCoordinator::finishCancelled(const JobDescriptor& job, bool remove_file) {
    if (remove_file) {
        std::error_code ec;
        std::filesystem::remove(job.output_path, ec);
        if (ec) {
            detail::log(spdlog::level::warn, "Failed to remove partial file {}: {}", job.output_path, ec.message());
        }
    }
    // The cancel path may already have recorded and announced it.
    if (registry_.transition(job.id, job.generation, DownloadState::Cancelled)) {
        events_.publish({EventKind::Cancelled, job.id, 0.0, 0, 0, {}, {}});
    }
    detail::log(spdlog::level::info, "Download cancelled: {}", job.id);
    return DownloadState::Cancelled;
}

DownloadState TransferCoordinator::finishCompleted(const JobDescriptor& job, std::uint64_t total) {
    const bool completed = registry_.transition(job.id, job.generation, DownloadState::Completed,
                                                [total](DownloadStatus& status) {
                                                    status.progress = 100.0;
                                                    status.downloaded = total;
                                                    status.total = total;
                                                });
    if (!completed) {
        // Cancelled after the last byte landed.
        return finishCancelled(job, true);
    }

    events_.publish({EventKind::Complete, job.id, 100.0, total, total, job.output_path, {}});
    detail::log(spdlog::level::info, "Successfully downloaded {} to {}", job.id, job.output_path);
    return DownloadState::Completed;
}

DownloadState TransferCoordinator::finishErrored(const JobDescriptor& job, const std::string& message) {
    detail::log(spdlog::level::err, "Error downloading {}: {}", job.id, message);
    registry_.transition(job.id, job.generation, DownloadState::Error,
                         [&message](DownloadStatus& status) { status.error = message; });
    events_.publish({EventKind::Error, job.id, 0.0, 0, 0, {}, message});
    return DownloadState::Error;
}

} // namespace modelfetch
