#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <jsoncpp/json/json.h>

namespace modelfetch {

enum class DownloadState {
    Queued,
    Downloading,
    Completed,
    Error,
    Cancelled
};

[[nodiscard]] const char* toString(DownloadState state);
[[nodiscard]] bool isTerminal(DownloadState state);

struct JobDescriptor {
    std::string id;
    std::string url;
    std::string output_path;
    std::uint64_t generation{0};
};

struct DownloadStatus {
    std::string id;
    std::string url;
    std::string filename;
    std::string save_path;
    std::string output_path;
    double progress{0.0};
    DownloadState state{DownloadState::Queued};
    std::uint64_t downloaded{0};
    std::uint64_t total{0};
    bool paused{false};
    std::optional<std::string> error;
    std::uint64_t generation{0};
};

// round(downloaded / total * 100, 2); 0 when the total is unknown.
[[nodiscard]] double computeProgress(std::uint64_t downloaded, std::uint64_t total);

[[nodiscard]] Json::Value toJson(const DownloadStatus& status);

} // namespace modelfetch
