#include "modelfetch/download_status.hpp"

#include <cmath>

namespace modelfetch {

const char* toString(DownloadState state) {
    switch (state) {
    case DownloadState::Queued:
        return "queued";
    case DownloadState::Downloading:
        return "downloading";
    case DownloadState::Completed:
        return "completed";
    case DownloadState::Error:
        return "error";
    case DownloadState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool isTerminal(DownloadState state) {
    return state == DownloadState::Completed || state == DownloadState::Error ||
           state == DownloadState::Cancelled;
}

double computeProgress(std::uint64_t downloaded, std::uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    const double ratio = static_cast<double>(downloaded) / static_cast<double>(total);
    return std::round(ratio * 100.0 * 100.0) / 100.0;
}

Json::Value toJson(const DownloadStatus& status) {
    Json::Value obj(Json::objectValue);
    obj["url"] = status.url;
    obj["filename"] = status.filename;
    obj["save_path"] = status.save_path;
    obj["output_path"] = status.output_path;
    obj["progress"] = status.progress;
    obj["status"] = toString(status.state);
    obj["downloaded"] = Json::UInt64(status.downloaded);
    obj["total"] = Json::UInt64(status.total);
    obj["paused"] = status.paused;
    if (status.error) {
        obj["error"] = *status.error;
    }
    return obj;
}

} // namespace modelfetch
