#include "modelfetch/download_service.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/logger.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace modelfetch {

namespace fs = std::filesystem;

std::string sanitizeFilename(const std::string& filename) {
    if (filename.empty()) {
        throw ValidationError("Missing required parameter: filename");
    }
    if (filename.find('\\') != std::string::npos) {
        throw ValidationError("Invalid filename: backslashes not allowed");
    }
    if (filename.find("..") != std::string::npos || filename.front() == '/' || filename.front() == '~') {
        throw ValidationError("Invalid filename: path traversal patterns detected");
    }

    const std::string normalized = fs::path(filename).lexically_normal().generic_string();
    if (normalized.empty() || normalized == "." || normalized.front() == '/' || normalized.rfind("../", 0) == 0 ||
        normalized.find("/../") != std::string::npos) {
        throw ValidationError("Invalid filename: path traversal detected");
    }
    if (normalized.back() == '/') {
        throw ValidationError("Invalid filename: must name a file");
    }
    return normalized;
}

std::string resolveOutputPath(const ModelPathRegistry& paths, const std::string& save_path,
                              const std::string& safe_filename) {
    const auto directories = paths.resolveCategoryDirectories(save_path);
    if (!directories) {
        throw ValidationError(fmt::format("Invalid save_path: {} not found in folder_paths", save_path));
    }
    if (directories->empty()) {
        throw ValidationError(fmt::format("No valid paths configured for {}", save_path));
    }

    const std::vector<std::string> model_dirs = modelDirectories(paths, save_path);
    if (model_dirs.empty()) {
        throw ValidationError(
            fmt::format("No valid model paths (containing /models/) configured for {}", save_path));
    }

    const fs::path output_dir = fs::absolute(model_dirs.front()).lexically_normal();
    const fs::path output_path = (output_dir / safe_filename).lexically_normal();

    std::string dir_prefix = output_dir.generic_string();
    if (dir_prefix.empty() || dir_prefix.back() != '/') {
        dir_prefix.push_back('/');
    }
    if (output_path.generic_string().rfind(dir_prefix, 0) != 0) {
        throw ValidationError("Security error: attempted directory escape");
    }
    return output_path.string();
}

DownloadService::DownloadService(HttpClientPtr http, std::shared_ptr<const ModelPathRegistry> paths,
                                 ServiceOptions options)
    : http_(std::move(http)),
      paths_(std::move(paths)),
      options_(options),
      queue_([this](const JobDescriptor& job, TransferControl& control) { runJob(job, control); },
             [pause_poll = options.pause_poll] { return std::make_shared<TransferControl>(pause_poll); }) {}

DownloadService::~DownloadService() { shutdown(); }

std::string DownloadService::submit(const StartRequest& request) {
    if (request.url.empty() || request.save_path.empty() || request.filename.empty()) {
        throw ValidationError("Missing required parameters: url, save_path, filename");
    }

    const std::string safe_filename = sanitizeFilename(request.filename);
    const std::string output_path = resolveOutputPath(*paths_, request.save_path, safe_filename);
    const std::string id = request.save_path + "/" + safe_filename;

    std::lock_guard<std::mutex> lock(submit_mutex_);
    const auto existing = registry_.get(id);
    if (queue_.contains(id) || (existing && !isTerminal(existing->state))) {
        throw ValidationError(fmt::format("Download already queued or in progress: {}", id));
    }

    std::error_code ec;
    if (fs::exists(output_path, ec)) {
        if (!request.override_existing) {
            throw ConflictError(fmt::format("File already exists: {}", safe_filename), output_path);
        }
        detail::log(spdlog::level::info, "Overriding existing file: {}", output_path);
        if (!fs::remove(output_path, ec) && ec) {
            throw DownloadError(fmt::format("Failed to remove existing file: {}", ec.message()));
        }
    }

    fs::create_directories(fs::path(output_path).parent_path(), ec);
    if (ec) {
        throw DownloadError(fmt::format("Failed to create directory for {}: {}", output_path, ec.message()));
    }

    DownloadStatus status;
    status.id = id;
    status.url = request.url;
    status.filename = safe_filename;
    status.save_path = request.save_path;
    status.output_path = output_path;
    const std::uint64_t generation = registry_.admit(std::move(status));

    queue_.enqueue({id, request.url, output_path, generation});
    detail::log(spdlog::level::info, "Download queued: {}", id);
    return id;
}

std::optional<DownloadStatus> DownloadService::status(const std::string& id) const { return registry_.get(id); }

std::map<std::string, DownloadStatus> DownloadService::statuses() const { return registry_.all(); }

void DownloadService::cancel(const std::string& id) {
    const JobQueue::CancelOutcome outcome = queue_.cancel(id);
    if (outcome == JobQueue::CancelOutcome::SignalledActive) {
        detail::log(spdlog::level::info, "Cancelling active download {}", id);
    }
    markCancelled(id);
}

bool DownloadService::pause(const std::string& id) {
    if (!queue_.pause(id)) {
        return false;
    }
    if (const auto current = registry_.get(id)) {
        registry_.update(id, current->generation, [](DownloadStatus& status) { status.paused = true; });
    }
    detail::log(spdlog::level::info, "Paused {}", id);
    return true;
}

bool DownloadService::resume(const std::string& id) {
    if (!queue_.resume(id)) {
        return false;
    }
    if (const auto current = registry_.get(id)) {
        registry_.update(id, current->generation, [](DownloadStatus& status) { status.paused = false; });
    }
    detail::log(spdlog::level::info, "Resumed {}", id);
    return true;
}

void DownloadService::advance() { queue_.tryAdvance(); }

EventBus::Token DownloadService::subscribe(EventBus::Listener listener) {
    return events_.subscribe(std::move(listener));
}

void DownloadService::unsubscribe(EventBus::Token token) { events_.unsubscribe(token); }

std::vector<std::string> DownloadService::supportedExtensions() const { return paths_->supportedExtensions(); }

std::vector<std::string> DownloadService::folderNames() const { return modelfetch::folderNames(*paths_); }

std::vector<std::string> DownloadService::listFolder(const std::string& category) const {
    return listWithFolderEntry(*paths_, category);
}

bool DownloadService::waitUntilIdle(std::chrono::milliseconds timeout) { return queue_.waitUntilIdle(timeout); }

void DownloadService::shutdown() {
    for (const auto& job : queue_.shutdown()) {
        markCancelled(job.id);
    }
}

void DownloadService::runJob(const JobDescriptor& job, TransferControl& control) {
    TransferCoordinator coordinator(*http_, registry_, events_, options_.transfer);
    coordinator.run(job, control);
}

void DownloadService::markCancelled(const std::string& id) {
    if (registry_.transition(id, DownloadState::Cancelled)) {
        events_.publish({EventKind::Cancelled, id, 0.0, 0, 0, {}, {}});
    }
}

} // namespace modelfetch
