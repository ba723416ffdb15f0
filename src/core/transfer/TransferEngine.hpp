#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "BufferPool.hpp"
#include "Checksum.hpp"
#include "ChunkPlanner.hpp"
#include "Clock.hpp"
#include "IDestination.hpp"
#include "IObjectSource.hpp"
#include "Transfer.hpp"
#include "config.hpp"

namespace ferry {

// (bytes_transferred, bytes_total). May be invoked from worker threads, never concurrently.
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

/**
 * @brief Everything the engine needs to move one object.
 */
struct TransferJob {
    Credentials credentials;
    SourceLocation source;
    DestinationEndpoint destination;
    std::string remote_path;
    std::uint64_t object_size = 0;
    TransferStrategy strategy;
    ProgressCallback on_progress;
    Clock::time_point deadline = Clock::time_point::max();
};

/**
 * @brief Chunks already acknowledged by the destination, carried across
 * orchestrator-level attempts of the same transfer.
 */
struct ResumeState {
    std::vector<std::optional<Md5::Digest>> digests;

    // Resets the state if it was built for a different chunk count.
    void Prepare(std::size_t chunk_count);
    void Reset() { digests.clear(); }

    std::size_t ContiguousPrefix() const;
    std::size_t Acknowledged() const;
};

struct TransferResult {
    std::uint64_t bytes_transferred = 0;
    std::string checksum;
    std::size_t chunks_total = 0;
    std::size_t chunks_attempted = 0;
    std::size_t resumed_from = 0;
};

class ProgressTracker;

/**
 * @brief Streams one object from the source to the destination.
 *
 * @details
 * Strategies:
 * - Direct: single sequential stream, whole-object retry.
 * - Chunked: one chunk buffer at a time, appended in order. Transient chunk
 *   failures are retried in place after reconciling against the remote size.
 * - ParallelChunked: up to `workers` concurrent readers. Destinations with
 *   offset writes get one connection per worker; otherwise the calling thread
 *   commits chunks in order while workers read ahead, bounded by the worker
 *   count.
 *
 * Memory stays bounded by the chunk size times the worker count regardless of
 * the object size. The returned checksum follows the ChunkedChecksum layout,
 * so it is the same whichever strategy produced it.
 *
 * **Errors:** Retryable FerryErrors that exhaust the chunk retry budget, and
 * every non-retryable one, propagate to the caller. PhaseTimeout is raised
 * once `job.deadline` has passed.
 * **Thread Safety:** Transfer may be called concurrently for different jobs.
 */
class TransferEngine {
   public:
    TransferEngine(std::shared_ptr<IObjectSourceFactory> sources,
                   std::shared_ptr<IDestinationFactory> destinations,
                   std::shared_ptr<Clock> clock,
                   TransferConfig cfg = {});

    TransferResult Transfer(const TransferJob& job, ResumeState& resume);

    /**
     * @brief Re-reads the source and computes its checksum in the engine layout.
     * @throws FerryError ChecksumUnavailable, PhaseTimeout.
     */
    std::string ComputeSourceChecksum(const Credentials& credentials,
                                      const SourceLocation& source,
                                      std::uint64_t object_size,
                                      Clock::time_point deadline = Clock::time_point::max());

    const TransferConfig& config() const { return cfg_; }

   private:
    TransferResult Run(const TransferJob& job, const Direct& strategy, ResumeState& resume,
                       ProgressTracker& progress);
    TransferResult Run(const TransferJob& job, const Chunked& strategy, ResumeState& resume,
                       ProgressTracker& progress);
    TransferResult Run(const TransferJob& job, const ParallelChunked& strategy,
                       ResumeState& resume, ProgressTracker& progress);

    TransferResult StreamWhole(const TransferJob& job, std::size_t chunk_size,
                               ProgressTracker& progress);
    TransferResult RunAtOffsets(const TransferJob& job, const ParallelChunked& strategy,
                                const std::vector<Chunk>& chunks,
                                std::unique_ptr<IDestination> control, ResumeState& resume,
                                ProgressTracker& progress);
    TransferResult RunOrdered(const TransferJob& job, const ParallelChunked& strategy,
                              const std::vector<Chunk>& chunks,
                              std::unique_ptr<IDestination> control, ResumeState& resume,
                              ProgressTracker& progress);

    void ReadChunk(IObjectSource& source, const SourceLocation& location, const Chunk& chunk,
                   std::span<std::uint8_t> out);
    void CheckDeadline(Clock::time_point deadline) const;

    std::shared_ptr<IObjectSourceFactory> sources_;
    std::shared_ptr<IDestinationFactory> destinations_;
    std::shared_ptr<Clock> clock_;
    TransferConfig cfg_;
    BufferPool pool_;
};

}  // namespace ferry
