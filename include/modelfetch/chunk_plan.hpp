#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace modelfetch {

struct ChunkPlan {
    std::size_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0}; // inclusive

    [[nodiscard]] std::uint64_t length() const { return end - start + 1; }
};

/**
 * Splits [0, total_size) into `connections` contiguous ranges of
 * floor(total_size / connections) bytes; the last range absorbs the remainder.
 * Falls back to fewer ranges when total_size < connections so that no range
 * is empty. Returns an empty plan for total_size == 0.
 */
std::vector<ChunkPlan> planChunks(std::uint64_t total_size, std::size_t connections);

} // namespace modelfetch
