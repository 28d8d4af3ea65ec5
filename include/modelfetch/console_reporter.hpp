#pragma once

#include "download_service.hpp"
#include "download_status.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace modelfetch {

// Redraws a progress panel for a set of downloads on stdout.
class ConsoleReporter {
public:
    ConsoleReporter(const DownloadService& service, std::vector<std::string> ids);

    // Returns once every tracked download is terminal or `should_stop` says so.
    void run(const std::function<bool()>& should_stop,
             std::chrono::milliseconds refresh = std::chrono::milliseconds(200));

    [[nodiscard]] std::string buildPanel() const;
    [[nodiscard]] bool hasActiveDownloads() const;

    static std::string formatLine(const DownloadStatus& status);
    static std::string formatSize(std::uint64_t bytes);

private:
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    const DownloadService& service_;
    std::vector<std::string> ids_;
};

} // namespace modelfetch
