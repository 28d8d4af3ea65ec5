#include "modelfetch/console_reporter.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace modelfetch {

ConsoleReporter::ConsoleReporter(const DownloadService& service, std::vector<std::string> ids)
    : service_(service), ids_(std::move(ids)) {}

void ConsoleReporter::run(const std::function<bool()>& should_stop, std::chrono::milliseconds refresh) {
    std::size_t previous_lines = 0;
    while (true) {
        redrawPanel(buildPanel(), previous_lines);

        if (!hasActiveDownloads() || (should_stop && should_stop())) {
            break;
        }
        std::this_thread::sleep_for(refresh);
    }
    std::cout << std::flush;
}

std::string ConsoleReporter::buildPanel() const {
    std::string panel;
    panel.reserve(ids_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("modelfetch ({} downloads)\n", ids_.size());
    panel.append("--------------------------------------------------\n");

    for (const auto& id : ids_) {
        if (const auto status = service_.status(id)) {
            panel += formatLine(*status);
        } else {
            panel += fmt::format("{:<24} [unknown]", id);
        }
        panel.push_back('\n');
    }
    panel.append("==================================================\n");
    return panel;
}

bool ConsoleReporter::hasActiveDownloads() const {
    return std::any_of(ids_.begin(), ids_.end(), [this](const std::string& id) {
        const auto status = service_.status(id);
        return status && !isTerminal(status->state);
    });
}

std::string ConsoleReporter::formatLine(const DownloadStatus& status) {
    std::string display_name = std::filesystem::path(status.filename).filename().string();
    if (display_name.empty()) {
        display_name = status.id;
    }
    if (display_name.size() > 24) {
        display_name = display_name.substr(0, 24);
    }

    std::string line;
    switch (status.state) {
    case DownloadState::Queued:
        return fmt::format("{:<24} [Queued]", display_name);
    case DownloadState::Cancelled:
        return fmt::format("{:<24} [Cancelled]", display_name);
    case DownloadState::Error:
        return fmt::format("{:<24} [Error] {}", display_name, status.error.value_or("unknown error"));
    default:
        break;
    }

    if (status.total == 0) {
        return fmt::format("{:<24} [Initializing...]", display_name);
    }

    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(status.progress / 100.0 * bar_width);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    line += fmt::format("{:<24} [{}] {:>6.2f}% ({}/{})", display_name, bar, status.progress,
                        formatSize(status.downloaded), formatSize(status.total));
    if (status.state == DownloadState::Completed) {
        line.append("  Done");
    } else if (status.paused) {
        line.append("  Paused");
    }
    return line;
}

std::string ConsoleReporter::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    }
    return fmt::format("{} B", bytes);
}

void ConsoleReporter::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        std::cout << "\033[" << previous_lines << "F\033[J";
    }
    std::cout << panel;
    previous_lines = current_lines;
}

} // namespace modelfetch
