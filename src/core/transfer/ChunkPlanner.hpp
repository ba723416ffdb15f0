#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "Transfer.hpp"
#include "config.hpp"

namespace ferry {

struct Direct {};

struct Chunked {
    std::size_t chunk_size = 0;
};

struct ParallelChunked {
    std::size_t chunk_size = 0;
    unsigned int workers = 1;
};

/**
 * @brief How the bytes of one object are moved. Chosen once per transfer and
 * never changed by retries.
 */
using TransferStrategy = std::variant<Direct, Chunked, ParallelChunked>;

StrategyKind KindOf(const TransferStrategy& strategy) noexcept;

/**
 * @brief size < small_threshold -> Direct, size <= large_threshold -> Chunked,
 * anything larger -> ParallelChunked.
 */
TransferStrategy SelectStrategy(std::uint64_t object_size, const TransferConfig& cfg);

/**
 * @brief Splits [0, object_size) into consecutive chunks of `chunk_size`; the
 * last one may be shorter. An empty object has no chunks.
 */
std::vector<Chunk> PlanChunks(std::uint64_t object_size, std::size_t chunk_size);

}  // namespace ferry
