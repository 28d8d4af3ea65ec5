#include <catch2/catch.hpp>

#include <cstdint>
#include <numeric>

#include "modelfetch/chunk_plan.hpp"

using modelfetch::ChunkPlan;
using modelfetch::planChunks;

namespace {

void require_contiguous_cover(const std::vector<ChunkPlan>& plan, std::uint64_t total) {
    REQUIRE_FALSE(plan.empty());
    REQUIRE(plan.front().start == 0);
    REQUIRE(plan.back().end == total - 1);
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        REQUIRE(plan[i].index == i);
        REQUIRE(plan[i].end >= plan[i].start);
        if (i + 1 < plan.size()) {
            REQUIRE(plan[i].end + 1 == plan[i + 1].start);
        }
        sum += plan[i].length();
    }
    REQUIRE(sum == total);
}

} // namespace

TEST_CASE("planChunks covers the file exactly with contiguous ranges") {
    const std::uint64_t total = GENERATE(as<std::uint64_t>{}, 8, 33554433, 1000003, 999);
    const auto plan = planChunks(total, 8);
    REQUIRE(plan.size() == 8);
    require_contiguous_cover(plan, total);
}

TEST_CASE("10 GiB splits into eight chunks with the remainder in the last one") {
    const std::uint64_t total = 10ULL * 1024 * 1024 * 1024 + 5;
    const auto plan = planChunks(total, 8);

    REQUIRE(plan.size() == 8);
    require_contiguous_cover(plan, total);
    const std::uint64_t base = total / 8;
    for (std::size_t i = 0; i < 7; ++i) {
        REQUIRE(plan[i].length() == base);
    }
    REQUIRE(plan.back().length() == total - 7 * base);
}

TEST_CASE("planChunks never produces empty ranges for tiny files") {
    const auto plan = planChunks(3, 8);
    REQUIRE(plan.size() == 3);
    require_contiguous_cover(plan, 3);
}

TEST_CASE("planChunks with one connection yields the whole file") {
    const auto plan = planChunks(12345, 1);
    REQUIRE(plan.size() == 1);
    REQUIRE(plan[0].start == 0);
    REQUIRE(plan[0].end == 12344);
}

TEST_CASE("planChunks of an empty file is empty") {
    REQUIRE(planChunks(0, 8).empty());
}
