#include <catch2/catch.hpp>

#include <chrono>
#include <string>
#include <thread>

#include "fake_http_client.hpp"
#include "modelfetch/chunk_fetcher.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/output_file.hpp"
#include "modelfetch/transfer_control.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using modelfetch::ChunkFetcher;
using modelfetch::ChunkRequest;
using modelfetch::OutputFile;
using modelfetch::TransferControl;
using modelfetch::TransferError;

namespace {

const std::string kUrl = "http://example.com/model.safetensors";

} // namespace

TEST_CASE("Preallocation sizes the destination before any write") {
    TempDir tmp;
    const auto path = (tmp.path() / "model.bin").string();
    OutputFile::preallocate(path, 4096);
    REQUIRE(std::filesystem::file_size(path) == 4096);
}

TEST_CASE("A ranged chunk lands at its own offset") {
    TempDir tmp;
    const auto path = (tmp.path() / "model.bin").string();
    const std::string body = make_payload(10000);

    FakeHttpClient http;
    FakeResource resource;
    resource.body = body;
    resource.increment = 333;
    http.serve(kUrl, resource);

    OutputFile::preallocate(path, body.size());
    TransferControl control;
    control.resetCounters(2);

    ChunkFetcher second(http, control);
    second.fetch({kUrl, path, {1, 5000, 9999}, true});
    ChunkFetcher first(http, control);
    first.fetch({kUrl, path, {0, 0, 4999}, true});

    REQUIRE(read_file(path) == body);
    REQUIRE(control.slotBytes(0) == 5000);
    REQUIRE(control.slotBytes(1) == 5000);
    REQUIRE(second.bytesWritten() == 5000);
}

TEST_CASE("A chunk answered with a non-success status fails") {
    TempDir tmp;
    const auto path = (tmp.path() / "model.bin").string();

    FakeHttpClient http;
    FakeResource resource;
    resource.body = make_payload(2000);
    resource.fail_range_start = 1000;
    resource.fail_status = 503;
    http.serve(kUrl, resource);

    OutputFile::preallocate(path, 2000);
    TransferControl control;
    control.resetCounters(2);

    ChunkFetcher fetcher(http, control);
    REQUIRE_THROWS_WITH(fetcher.fetch({kUrl, path, {1, 1000, 1999}, true}), "HTTP 503 for chunk 1");
    REQUIRE(control.slotBytes(1) == 0);
}

TEST_CASE("A server that ignores the range cannot overwrite a neighbouring chunk") {
    TempDir tmp;
    const auto path = (tmp.path() / "model.bin").string();

    FakeHttpClient http;
    FakeResource resource;
    resource.body = make_payload(4000);
    resource.accept_ranges = false;
    resource.increment = 4000;
    http.serve(kUrl, resource);

    OutputFile::preallocate(path, 4000);
    TransferControl control;
    control.resetCounters(2);

    ChunkFetcher fetcher(http, control);
    REQUIRE_THROWS_AS(fetcher.fetch({kUrl, path, {1, 2000, 3999}, true}), TransferError);
    REQUIRE(read_file(path) == std::string(4000, '\0'));
}

TEST_CASE("Single-stream mode fetches the whole body without a range") {
    TempDir tmp;
    const auto path = (tmp.path() / "model.bin").string();
    const std::string body = make_payload(7777);

    FakeHttpClient http;
    FakeResource resource;
    resource.body = body;
    resource.accept_ranges = false;
    http.serve(kUrl, resource);

    OutputFile::preallocate(path, body.size());
    TransferControl control;
    control.resetCounters(1);

    ChunkFetcher fetcher(http, control);
    fetcher.fetch({kUrl, path, {0, 0, body.size() - 1}, false});

    REQUIRE(read_file(path) == body);
    const auto ranges = http.requestedRanges();
    REQUIRE(ranges.size() == 1);
    REQUIRE_FALSE(ranges.front().has_value());
}

TEST_CASE("A cancelled chunk returns without error and stops consuming") {
    TempDir tmp;
    const auto path = (tmp.path() / "model.bin").string();

    FakeHttpClient http;
    FakeResource resource;
    resource.body = make_payload(8192);
    resource.increment = 1024;
    resource.hold = std::make_shared<Gate>();
    http.serve(kUrl, resource);

    OutputFile::preallocate(path, 8192);
    TransferControl control(5ms);
    control.resetCounters(1);

    std::thread canceller([&] {
        wait_for([&] { return control.totalDownloaded() > 0; });
        control.cancel();
    });

    ChunkFetcher fetcher(http, control);
    REQUIRE_NOTHROW(fetcher.fetch({kUrl, path, {0, 0, 8191}, true}));
    canceller.join();

    REQUIRE(fetcher.bytesWritten() == 1024);
    REQUIRE(control.totalDownloaded() == 1024);
}

TEST_CASE("A network fault propagates as a transfer error") {
    TempDir tmp;
    const auto path = (tmp.path() / "model.bin").string();
    OutputFile::preallocate(path, 10);

    FakeHttpClient http;
    TransferControl control;
    control.resetCounters(1);

    ChunkFetcher fetcher(http, control);
    REQUIRE_THROWS_AS(fetcher.fetch({"http://unknown.invalid/x", path, {0, 0, 9}, true}), TransferError);
}
