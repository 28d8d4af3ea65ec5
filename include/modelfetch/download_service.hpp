#pragma once

#include "download_registry.hpp"
#include "download_status.hpp"
#include "event_bus.hpp"
#include "http_client.hpp"
#include "job_queue.hpp"
#include "model_path_registry.hpp"
#include "transfer_coordinator.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace modelfetch {

struct StartRequest {
    std::string url;
    std::string save_path; // model category, e.g. "checkpoints"
    std::string filename;  // may contain forward-slash subfolders
    bool override_existing{false};
};

struct ServiceOptions {
    TransferOptions transfer;
    std::chrono::milliseconds pause_poll{500};
};

/**
 * Owns the registry, the event bus and the single-slot job queue. Several
 * instances can coexist; nothing here is process-global.
 */
class DownloadService {
public:
    DownloadService(HttpClientPtr http, std::shared_ptr<const ModelPathRegistry> paths,
                    ServiceOptions options = {});
    ~DownloadService();

    DownloadService(const DownloadService&) = delete;
    DownloadService& operator=(const DownloadService&) = delete;

    // Validates, resolves the destination and queues the job. Returns the
    // download id. Throws ValidationError, ConflictError (destination exists
    // and override_existing is false) or DownloadError.
    std::string submit(const StartRequest& request);

    [[nodiscard]] std::optional<DownloadStatus> status(const std::string& id) const;
    [[nodiscard]] std::map<std::string, DownloadStatus> statuses() const;

    // Idempotent for queued, active and unknown ids.
    void cancel(const std::string& id);
    // Only the active download can be paused; returns false otherwise.
    bool pause(const std::string& id);
    bool resume(const std::string& id);
    void advance();

    EventBus::Token subscribe(EventBus::Listener listener);
    void unsubscribe(EventBus::Token token);

    [[nodiscard]] std::vector<std::string> supportedExtensions() const;
    [[nodiscard]] std::vector<std::string> folderNames() const;
    [[nodiscard]] std::vector<std::string> listFolder(const std::string& category) const;

    bool waitUntilIdle(std::chrono::milliseconds timeout);
    // Cancels the active download and marks pending ones cancelled.
    void shutdown();

private:
    void runJob(const JobDescriptor& job, TransferControl& control);
    void markCancelled(const std::string& id);

    HttpClientPtr http_;
    std::shared_ptr<const ModelPathRegistry> paths_;
    ServiceOptions options_;

    DownloadRegistry registry_;
    EventBus events_;
    std::mutex submit_mutex_;
    JobQueue queue_;
};

// Rejects traversal patterns and returns the normalized, forward-slash form.
// Throws ValidationError.
[[nodiscard]] std::string sanitizeFilename(const std::string& filename);

// First model directory of `save_path` joined with the sanitized filename.
// Throws ValidationError when the category cannot be resolved or the result
// escapes the directory.
[[nodiscard]] std::string resolveOutputPath(const ModelPathRegistry& paths, const std::string& save_path,
                                            const std::string& safe_filename);

} // namespace modelfetch
