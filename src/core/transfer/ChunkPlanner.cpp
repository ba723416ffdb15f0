#include "ChunkPlanner.hpp"

#include <algorithm>
#include <stdexcept>

namespace ferry {

StrategyKind KindOf(const TransferStrategy& strategy) noexcept {
    switch (strategy.index()) {
        case 0:
            return StrategyKind::Direct;
        case 1:
            return StrategyKind::Chunked;
        default:
            return StrategyKind::ParallelChunked;
    }
}

TransferStrategy SelectStrategy(std::uint64_t object_size, const TransferConfig& cfg) {
    if (object_size < cfg.small_threshold) {
        return Direct{};
    }
    if (object_size <= cfg.large_threshold) {
        return Chunked{cfg.chunk_size};
    }
    return ParallelChunked{cfg.chunk_size, std::max(1u, cfg.max_workers)};
}

std::vector<Chunk> PlanChunks(std::uint64_t object_size, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<std::size_t>((object_size + chunk_size - 1) / chunk_size));
    for (std::uint64_t offset = 0; offset < object_size; offset += chunk_size) {
        chunks.push_back(Chunk{chunks.size(), offset,
                               std::min<std::uint64_t>(chunk_size, object_size - offset)});
    }
    return chunks;
}

}  // namespace ferry
