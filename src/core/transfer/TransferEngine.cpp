#include "TransferEngine.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <exception>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

#include "Errors.hpp"
#include "Retry.hpp"

namespace ferry {

// ============================================================================
// ResumeState
// ============================================================================

void ResumeState::Prepare(std::size_t chunk_count) {
    if (digests.size() != chunk_count) {
        digests.assign(chunk_count, std::nullopt);
    }
}

std::size_t ResumeState::ContiguousPrefix() const {
    std::size_t n = 0;
    while (n < digests.size() && digests[n].has_value()) ++n;
    return n;
}

std::size_t ResumeState::Acknowledged() const {
    return static_cast<std::size_t>(
        std::count_if(digests.begin(), digests.end(), [](const auto& d) { return d.has_value(); }));
}

// ============================================================================
// ProgressTracker
// ============================================================================

/**
 * @brief Serializes progress callbacks coming from engine workers.
 */
class ProgressTracker {
   public:
    ProgressTracker(std::uint64_t total, ProgressCallback callback)
        : total_(total), callback_(std::move(callback)) {}

    void Add(std::uint64_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ += n;
        Notify();
    }

    void Set(std::uint64_t done) {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = done;
        Notify();
    }

   private:
    void Notify() {
        if (callback_) callback_(done_, total_);
    }

    std::mutex mutex_;
    std::uint64_t total_;
    std::uint64_t done_ = 0;
    ProgressCallback callback_;
};

namespace {

ByteProducer ProduceFrom(std::span<const std::uint8_t> data) {
    return [data, pos = std::size_t{0}](std::span<std::uint8_t> out) mutable {
        const auto n = std::min(out.size(), data.size() - pos);
        std::memcpy(out.data(), data.data() + pos, n);
        pos += n;
        return n;
    };
}

std::string CombineDigests(const ResumeState& resume) {
    std::vector<Md5::Digest> digests;
    digests.reserve(resume.digests.size());
    for (const auto& d : resume.digests) {
        if (!d) {
            throw FerryError(ErrorCode::RetriesExhausted, "transfer finished with unacknowledged chunks");
        }
        digests.push_back(*d);
    }
    return ChunkedChecksum::Combine(digests);
}

/**
 * @brief Where a chunked upload can pick up, given what the destination holds.
 * Falls back to chunk 0 when the remote file no longer covers the
 * acknowledged prefix.
 */
std::size_t ResumePoint(IDestination& dest, const std::vector<Chunk>& chunks, ResumeState& resume) {
    resume.Prepare(chunks.size());
    const auto start = resume.ContiguousPrefix();
    if (start == 0) return 0;

    const auto remote = dest.RemoteSize();
    if (!remote || *remote < chunks[start - 1].end()) {
        spdlog::warn("[Engine] Remote file no longer covers {} acknowledged chunk(s); restarting",
                     start);
        resume.Reset();
        resume.Prepare(chunks.size());
        return 0;
    }
    spdlog::info("[Engine] Resuming at chunk {}/{} ({} bytes already at destination)", start,
                 chunks.size(), chunks[start - 1].end());
    return start;
}

/**
 * @brief Appends chunks to one destination connection, strictly in order.
 *
 * A failed write is retried on a fresh connection. Before the retry the
 * remote size is compared with the chunk bounds so only the missing tail of
 * the chunk is sent. If the remote file cannot be reconciled the resume point
 * is lost and the error propagates without further chunk retries.
 */
class SequentialWriter {
   public:
    SequentialWriter(IDestinationFactory& factory, const TransferJob& job,
                     std::unique_ptr<IDestination> dest, Clock& clock, const RetryConfig& retry)
        : factory_(factory), job_(job), dest_(std::move(dest)), clock_(clock), retry_(retry) {}

    ~SequentialWriter() { Close(); }

    SequentialWriter(const SequentialWriter&) = delete;
    SequentialWriter& operator=(const SequentialWriter&) = delete;

    void Commit(const Chunk& chunk, std::span<const std::uint8_t> data, bool reconcile_first) {
        bool reconcile = reconcile_first;
        for (std::uint32_t attempt = 1;; ++attempt) {
            try {
                if (!dest_) {
                    dest_ = factory_.Open(job_.destination, job_.remote_path);
                    dest_->Connect();
                }
                const std::uint64_t skip = reconcile ? Reconcile(chunk) : 0;
                if (skip == chunk.length) {
                    return;
                }
                const auto rest = data.subspan(static_cast<std::size_t>(skip));
                const auto offset = chunk.offset + skip;
                const auto mode = offset == 0 ? WriteMode::Truncate : WriteMode::Append;
                const auto written = dest_->Write(mode, offset, ProduceFrom(rest));
                if (written != rest.size()) {
                    throw FerryError(ErrorCode::DestinationUnreachable,
                                     fmt::format("short write on chunk {}: {} of {} bytes",
                                                 chunk.index, written, rest.size()));
                }
                return;
            } catch (const FerryError& e) {
                if (!e.retryable() || attempt >= retry_.max_attempts || resume_lost_) {
                    throw;
                }
                const auto delay = retry_.BackoffAfter(attempt);
                spdlog::warn("[Engine] Chunk {} write failed (attempt {}/{}): {}. Retrying in {} ms",
                             chunk.index, attempt, retry_.max_attempts, e.what(), delay.count());
                reconcile = true;
                Close();
                clock_.SleepFor(delay);
            }
        }
    }

    void Close() noexcept {
        if (dest_) {
            dest_->Close();
            dest_.reset();
        }
    }

    bool resume_lost() const { return resume_lost_; }

   private:
    std::uint64_t Reconcile(const Chunk& chunk) {
        const auto remote = dest_->RemoteSize();
        if (!remote) {
            if (chunk.offset == 0) return 0;
            resume_lost_ = true;
            throw FerryError(ErrorCode::DestinationUnreachable,
                             fmt::format("remote size unknown, cannot resume chunk {}", chunk.index));
        }
        if (*remote < chunk.offset || *remote > chunk.end()) {
            resume_lost_ = true;
            throw FerryError(ErrorCode::DestinationUnreachable,
                             fmt::format("remote size {} outside chunk {} [{}, {})", *remote,
                                         chunk.index, chunk.offset, chunk.end()));
        }
        return *remote - chunk.offset;
    }

    IDestinationFactory& factory_;
    const TransferJob& job_;
    std::unique_ptr<IDestination> dest_;
    Clock& clock_;
    const RetryConfig& retry_;
    bool resume_lost_ = false;
};

}  // namespace

// ============================================================================
// TransferEngine
// ============================================================================

TransferEngine::TransferEngine(std::shared_ptr<IObjectSourceFactory> sources,
                               std::shared_ptr<IDestinationFactory> destinations,
                               std::shared_ptr<Clock> clock,
                               TransferConfig cfg)
    : sources_(std::move(sources)),
      destinations_(std::move(destinations)),
      clock_(std::move(clock)),
      cfg_(std::move(cfg)),
      pool_(std::max(1u, cfg_.max_workers) * 2) {}

TransferResult TransferEngine::Transfer(const TransferJob& job, ResumeState& resume) {
    spdlog::info("[Engine] {} -> {}://{}{} ({} bytes, {})", job.source.object_key,
                 ToString(job.destination.protocol), job.destination.host, job.remote_path,
                 job.object_size, ToString(KindOf(job.strategy)));

    ProgressTracker progress(job.object_size, job.on_progress);
    return std::visit([&](const auto& strategy) { return Run(job, strategy, resume, progress); },
                      job.strategy);
}

void TransferEngine::CheckDeadline(Clock::time_point deadline) const {
    if (clock_->Now() >= deadline) {
        throw FerryError(ErrorCode::PhaseTimeout, "transfer phase deadline exceeded");
    }
}

void TransferEngine::ReadChunk(IObjectSource& source, const SourceLocation& location,
                               const Chunk& chunk, std::span<std::uint8_t> out) {
    RetryWithBackoff(cfg_.chunk_retry, *clock_, fmt::format("[Engine] Read of chunk {}", chunk.index),
                     [&](std::uint32_t) {
                         auto reader = source.OpenRange(location, chunk.offset, chunk.length);
                         const auto n = ReadFull(*reader, out.first(chunk.length));
                         if (n != chunk.length) {
                             throw FerryError(ErrorCode::SourceUnreadable,
                                              fmt::format("short read on chunk {}: {} of {} bytes",
                                                          chunk.index, n, chunk.length));
                         }
                     });
}

// -------- Direct --------

TransferResult TransferEngine::Run(const TransferJob& job, const Direct&, ResumeState& resume,
                                   ProgressTracker& progress) {
    resume.Reset();
    return StreamWhole(job, cfg_.chunk_size, progress);
}

TransferResult TransferEngine::StreamWhole(const TransferJob& job, std::size_t chunk_size,
                                           ProgressTracker& progress) {
    auto source = sources_->Open(job.credentials);
    auto reader = source->OpenRange(job.source, 0, job.object_size);
    auto dest = destinations_->Open(job.destination, job.remote_path);
    dest->Connect();

    ChunkedChecksum checksum(chunk_size);
    auto buffer = pool_.Acquire(cfg_.buffer_size);
    std::size_t filled = 0;
    std::size_t pos = 0;
    std::uint64_t read_total = 0;

    progress.Set(0);
    const ByteProducer produce = [&](std::span<std::uint8_t> out) -> std::size_t {
        if (pos == filled) {
            CheckDeadline(job.deadline);
            filled = ReadFull(*reader, *buffer);
            pos = 0;
            if (filled == 0) return 0;
            checksum.Update(std::span<const std::uint8_t>(buffer->data(), filled));
            read_total += filled;
        }
        const auto n = std::min(out.size(), filled - pos);
        std::memcpy(out.data(), buffer->data() + pos, n);
        pos += n;
        progress.Add(n);
        return n;
    };

    std::uint64_t written = 0;
    try {
        written = dest->Write(WriteMode::Truncate, 0, produce);
    } catch (const FerryError&) {
        dest->Close();
        throw;
    }
    dest->Close();

    if (read_total != job.object_size) {
        throw FerryError(ErrorCode::SourceUnreadable,
                         fmt::format("source ended after {} of {} bytes", read_total, job.object_size));
    }
    if (written != read_total) {
        throw FerryError(ErrorCode::DestinationUnreachable,
                         fmt::format("destination accepted {} of {} bytes", written, read_total));
    }

    TransferResult result;
    result.bytes_transferred = written;
    result.checksum = checksum.Finalize();
    return result;
}

// -------- Chunked --------

TransferResult TransferEngine::Run(const TransferJob& job, const Chunked& strategy,
                                   ResumeState& resume, ProgressTracker& progress) {
    const auto chunks = PlanChunks(job.object_size, strategy.chunk_size);
    if (chunks.empty()) {
        resume.Reset();
        return StreamWhole(job, strategy.chunk_size, progress);
    }

    auto dest = destinations_->Open(job.destination, job.remote_path);
    dest->Connect();
    if (!dest->Capabilities().append) {
        spdlog::warn("[Engine] {} cannot append; streaming {} as a whole",
                     ToString(job.destination.protocol), job.source.object_key);
        dest->Close();
        resume.Reset();
        auto result = StreamWhole(job, strategy.chunk_size, progress);
        result.chunks_total = chunks.size();
        return result;
    }

    const auto start = ResumePoint(*dest, chunks, resume);
    progress.Set(start > 0 ? chunks[start - 1].end() : 0);

    TransferResult result;
    result.chunks_total = chunks.size();
    result.resumed_from = start;

    SequentialWriter writer(*destinations_, job, std::move(dest), *clock_, cfg_.chunk_retry);
    auto source = sources_->Open(job.credentials);
    auto buffer = pool_.Acquire(strategy.chunk_size);

    try {
        for (std::size_t i = start; i < chunks.size(); ++i) {
            const auto& chunk = chunks[i];
            CheckDeadline(job.deadline);
            ++result.chunks_attempted;

            const std::span<std::uint8_t> data(buffer->data(), static_cast<std::size_t>(chunk.length));
            ReadChunk(*source, job.source, chunk, data);
            const auto digest = Md5::Of(data);
            writer.Commit(chunk, data, i == start && start > 0);

            resume.digests[i] = digest;
            progress.Set(chunk.end());
        }
    } catch (const FerryError&) {
        if (writer.resume_lost()) resume.Reset();
        throw;
    }
    writer.Close();

    result.bytes_transferred = job.object_size;
    result.checksum = CombineDigests(resume);
    return result;
}

// -------- ParallelChunked --------

TransferResult TransferEngine::Run(const TransferJob& job, const ParallelChunked& strategy,
                                   ResumeState& resume, ProgressTracker& progress) {
    const auto chunks = PlanChunks(job.object_size, strategy.chunk_size);
    if (chunks.empty()) {
        resume.Reset();
        return StreamWhole(job, strategy.chunk_size, progress);
    }

    auto control = destinations_->Open(job.destination, job.remote_path);
    control->Connect();
    if (control->Capabilities().offset_writes) {
        return RunAtOffsets(job, strategy, chunks, std::move(control), resume, progress);
    }
    if (!control->Capabilities().append) {
        spdlog::warn("[Engine] {} supports neither offset writes nor append; streaming {} as a whole",
                     ToString(job.destination.protocol), job.source.object_key);
        control->Close();
        resume.Reset();
        auto result = StreamWhole(job, strategy.chunk_size, progress);
        result.chunks_total = chunks.size();
        return result;
    }
    return RunOrdered(job, strategy, chunks, std::move(control), resume, progress);
}

TransferResult TransferEngine::RunAtOffsets(const TransferJob& job, const ParallelChunked& strategy,
                                            const std::vector<Chunk>& chunks,
                                            std::unique_ptr<IDestination> control,
                                            ResumeState& resume, ProgressTracker& progress) {
    resume.Prepare(chunks.size());
    std::uint64_t acknowledged_bytes = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (resume.digests[i]) acknowledged_bytes += chunks[i].length;
    }
    if (acknowledged_bytes == 0) {
        // Start from an empty remote file so stale bytes past the end cannot survive.
        control->Write(WriteMode::Truncate, 0, [](std::span<std::uint8_t>) { return std::size_t{0}; });
    }
    control->Close();
    progress.Set(acknowledged_bytes);

    TransferResult result;
    result.chunks_total = chunks.size();

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> attempted{0};
    std::atomic<bool> stop{false};
    std::mutex error_mutex;
    std::exception_ptr error;

    const auto worker = [&] {
        try {
            auto source = sources_->Open(job.credentials);
            std::unique_ptr<IDestination> dest;
            BufferPool::BufferPtr buffer = pool_.Acquire(strategy.chunk_size);

            for (;;) {
                const auto idx = next.fetch_add(1);
                if (idx >= chunks.size() || stop.load()) return;
                // Each index is claimed by exactly one worker, so its digest slot is not shared.
                if (resume.digests[idx]) continue;

                const auto& chunk = chunks[idx];
                CheckDeadline(job.deadline);
                ++attempted;

                const std::span<std::uint8_t> data(buffer->data(), static_cast<std::size_t>(chunk.length));
                ReadChunk(*source, job.source, chunk, data);
                const auto digest = Md5::Of(data);

                RetryWithBackoff(
                    cfg_.chunk_retry, *clock_, fmt::format("[Engine] Write of chunk {}", chunk.index),
                    [&](std::uint32_t) {
                        if (!dest) {
                            dest = destinations_->Open(job.destination, job.remote_path);
                            dest->Connect();
                        }
                        const auto written =
                            dest->Write(WriteMode::AtOffset, chunk.offset, ProduceFrom(data));
                        if (written != chunk.length) {
                            throw FerryError(ErrorCode::DestinationUnreachable,
                                             fmt::format("short write on chunk {}", chunk.index));
                        }
                    },
                    [&](std::uint32_t, const FerryError&) {
                        if (dest) {
                            dest->Close();
                            dest.reset();
                        }
                    });

                resume.digests[idx] = digest;
                progress.Add(chunk.length);
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!error) error = std::current_exception();
            stop = true;
        }
    };

    const auto worker_count =
        std::min<std::size_t>(std::max(1u, strategy.workers), std::max<std::size_t>(1, chunks.size()));
    {
        std::vector<std::jthread> threads;
        threads.reserve(worker_count);
        for (std::size_t k = 0; k < worker_count; ++k) {
            threads.emplace_back(worker);
        }
    }

    result.chunks_attempted = attempted.load();
    if (error) {
        std::rethrow_exception(error);
    }

    result.bytes_transferred = job.object_size;
    result.checksum = CombineDigests(resume);
    return result;
}

TransferResult TransferEngine::RunOrdered(const TransferJob& job, const ParallelChunked& strategy,
                                          const std::vector<Chunk>& chunks,
                                          std::unique_ptr<IDestination> control, ResumeState& resume,
                                          ProgressTracker& progress) {
    const auto start = ResumePoint(*control, chunks, resume);
    progress.Set(start > 0 ? chunks[start - 1].end() : 0);

    TransferResult result;
    result.chunks_total = chunks.size();
    result.resumed_from = start;

    struct ReadyChunk {
        BufferPool::BufferPtr buffer;
        Md5::Digest digest{};
    };

    const std::size_t window = std::max(1u, strategy.workers);
    std::mutex mutex;
    std::condition_variable cv;
    std::map<std::size_t, ReadyChunk> ready;
    std::size_t next = start;
    std::size_t committed = start;
    bool stop = false;
    std::exception_ptr error;
    std::atomic<std::size_t> attempted{0};

    const auto fail = [&](std::exception_ptr e) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!error) error = std::move(e);
            stop = true;
        }
        cv.notify_all();
    };

    const auto reader = [&] {
        try {
            auto source = sources_->Open(job.credentials);
            for (;;) {
                std::size_t idx = 0;
                {
                    std::unique_lock<std::mutex> lock(mutex);
                    cv.wait(lock, [&] {
                        return stop || next >= chunks.size() || next < committed + window;
                    });
                    if (stop || next >= chunks.size()) return;
                    idx = next++;
                }

                const auto& chunk = chunks[idx];
                CheckDeadline(job.deadline);
                ++attempted;

                ReadyChunk slot{pool_.Acquire(static_cast<std::size_t>(chunk.length))};
                ReadChunk(*source, job.source, chunk, *slot.buffer);
                slot.digest = Md5::Of(*slot.buffer);
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    ready.emplace(idx, std::move(slot));
                }
                cv.notify_all();
            }
        } catch (...) {
            fail(std::current_exception());
        }
    };

    SequentialWriter writer(*destinations_, job, std::move(control), *clock_, cfg_.chunk_retry);
    {
        const auto pending = chunks.size() - start;
        const auto worker_count = std::min<std::size_t>(window, std::max<std::size_t>(1, pending));
        std::vector<std::jthread> threads;
        threads.reserve(worker_count);
        for (std::size_t k = 0; k < worker_count && pending > 0; ++k) {
            threads.emplace_back(reader);
        }

        try {
            for (std::size_t i = start; i < chunks.size(); ++i) {
                ReadyChunk slot;
                {
                    std::unique_lock<std::mutex> lock(mutex);
                    cv.wait(lock, [&] { return stop || ready.contains(i); });
                    if (stop) break;
                    slot = std::move(ready.extract(i).mapped());
                }

                writer.Commit(chunks[i], *slot.buffer, i == start && start > 0);
                resume.digests[i] = slot.digest;
                progress.Set(chunks[i].end());

                {
                    std::lock_guard<std::mutex> lock(mutex);
                    committed = i + 1;
                }
                cv.notify_all();
            }
        } catch (...) {
            fail(std::current_exception());
        }
    }

    result.chunks_attempted = attempted.load();
    if (error) {
        if (writer.resume_lost()) resume.Reset();
        std::rethrow_exception(error);
    }
    writer.Close();

    result.bytes_transferred = job.object_size;
    result.checksum = CombineDigests(resume);
    return result;
}

// -------- Checksum --------

std::string TransferEngine::ComputeSourceChecksum(const Credentials& credentials,
                                                  const SourceLocation& source,
                                                  std::uint64_t object_size,
                                                  Clock::time_point deadline) {
    try {
        auto src = sources_->Open(credentials);
        return RetryWithBackoff(
            cfg_.chunk_retry, *clock_, "[Engine] Source checksum read", [&](std::uint32_t) {
                ChunkedChecksum checksum(cfg_.chunk_size);
                auto reader = src->OpenRange(source, 0, object_size);
                auto buffer = pool_.Acquire(cfg_.buffer_size);
                std::uint64_t total = 0;
                for (;;) {
                    CheckDeadline(deadline);
                    const auto n = ReadFull(*reader, *buffer);
                    if (n == 0) break;
                    checksum.Update(std::span<const std::uint8_t>(buffer->data(), n));
                    total += n;
                }
                if (total != object_size) {
                    throw FerryError(ErrorCode::SourceUnreadable,
                                     fmt::format("source ended after {} of {} bytes", total, object_size));
                }
                return checksum.Finalize();
            });
    } catch (const FerryError& e) {
        if (e.code() == ErrorCode::PhaseTimeout) throw;
        throw FerryError(ErrorCode::ChecksumUnavailable,
                         fmt::format("cannot compute source checksum: {}", e.what()));
    }
}

}  // namespace ferry
