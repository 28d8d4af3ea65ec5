#include "modelfetch/chunk_plan.hpp"

#include <algorithm>

namespace modelfetch {

std::vector<ChunkPlan> planChunks(std::uint64_t total_size, std::size_t connections) {
    std::vector<ChunkPlan> plan;
    if (total_size == 0) {
        return plan;
    }

    const std::uint64_t count = std::min<std::uint64_t>(std::max<std::size_t>(1, connections), total_size);
    const std::uint64_t part_size = total_size / count;

    plan.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        const std::uint64_t start = i * part_size;
        const std::uint64_t end = (i + 1 == count) ? total_size - 1 : start + part_size - 1;
        plan.push_back({static_cast<std::size_t>(i), start, end});
    }
    return plan;
}

} // namespace modelfetch
