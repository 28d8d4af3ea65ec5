#include <catch2/catch.hpp>

#include <memory>
#include <string>

#include "fake_http_client.hpp"
#include "modelfetch/console_reporter.hpp"
#include "modelfetch/download_service.hpp"
#include "modelfetch/model_path_registry.hpp"

using modelfetch::ConsoleReporter;
using modelfetch::DownloadState;
using modelfetch::DownloadStatus;

namespace {

DownloadStatus statusOf(DownloadState state) {
    DownloadStatus status;
    status.id = "checkpoints/sub/model.safetensors";
    status.filename = "sub/model.safetensors";
    status.state = state;
    return status;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Sizes are printed in binary units") {
    REQUIRE(ConsoleReporter::formatSize(512) == "512 B");
    REQUIRE(ConsoleReporter::formatSize(1536) == "1.5 KB");
    REQUIRE(ConsoleReporter::formatSize(5ULL * 1024 * 1024) == "5.0 MB");
    REQUIRE(ConsoleReporter::formatSize(10ULL * 1024 * 1024 * 1024) == "10.0 GB");
}

TEST_CASE("Each state renders its own line") {
    const std::string queued = ConsoleReporter::formatLine(statusOf(DownloadState::Queued));
    REQUIRE(contains(queued, "model.safetensors"));
    REQUIRE(contains(queued, "[Queued]"));
    REQUIRE_FALSE(contains(queued, "sub/"));

    DownloadStatus failed = statusOf(DownloadState::Error);
    failed.error = "HTTP 404 for chunk 2";
    REQUIRE(contains(ConsoleReporter::formatLine(failed), "[Error] HTTP 404 for chunk 2"));

    REQUIRE(contains(ConsoleReporter::formatLine(statusOf(DownloadState::Cancelled)), "[Cancelled]"));
    REQUIRE(contains(ConsoleReporter::formatLine(statusOf(DownloadState::Downloading)), "[Initializing...]"));

    DownloadStatus running = statusOf(DownloadState::Downloading);
    running.total = 2048;
    running.downloaded = 1024;
    running.progress = 50.0;
    running.paused = true;
    const std::string line = ConsoleReporter::formatLine(running);
    REQUIRE(contains(line, " 50.00%"));
    REQUIRE(contains(line, "(1.0 KB/2.0 KB)"));
    REQUIRE(contains(line, "Paused"));
}

TEST_CASE("The panel lists every tracked download") {
    auto http = std::make_shared<FakeHttpClient>();
    auto paths = std::make_shared<modelfetch::FolderPathRegistry>();
    modelfetch::DownloadService service(http, paths);

    ConsoleReporter reporter(service, {"checkpoints/missing.bin"});
    REQUIRE(contains(reporter.buildPanel(), "checkpoints/missing.bin"));
    REQUIRE(contains(reporter.buildPanel(), "[unknown]"));
    REQUIRE_FALSE(reporter.hasActiveDownloads());
}
