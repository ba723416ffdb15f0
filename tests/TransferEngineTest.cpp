#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <vector>

#include "FakeDestination.hpp"
#include "FakeObjectSource.hpp"
#include "ManualClock.hpp"
#include "TransferEngine.hpp"

using namespace ferry;
using namespace std::chrono_literals;

namespace {

constexpr std::size_t kChunk = 1024;

TransferConfig SmallConfig() {
    TransferConfig cfg;
    cfg.small_threshold = 4 * kChunk;
    cfg.large_threshold = 16 * kChunk;
    cfg.chunk_size = kChunk;
    cfg.buffer_size = 1000;  // deliberately not chunk aligned
    cfg.max_workers = 3;
    return cfg;
}

}  // namespace

class TransferEngineTest : public ::testing::Test {
   protected:
    TransferEngineTest() { Build(SmallConfig()); }

    void Build(const TransferConfig& cfg) {
        engine_ = std::make_unique<TransferEngine>(std::make_shared<test::FakeSourceFactory>(objects_),
                                                   std::make_shared<test::FakeDestinationFactory>(remote_),
                                                   clock_, cfg);
    }

    TransferJob Job(std::uint64_t size, TransferStrategy strategy) {
        objects_->Add("reports", "data.bin", size);
        TransferJob job;
        job.credentials.access_key_id = "ASIA1";
        job.source = {"reports", "data.bin"};
        job.destination.protocol = Protocol::Sftp;
        job.destination.host = "sftp.example";
        job.destination.port = 22;
        job.remote_path = "/in/data.bin";
        job.object_size = size;
        job.strategy = strategy;
        job.on_progress = [this](std::uint64_t done, std::uint64_t total) {
            progress_.push_back(done);
            total_ = total;
        };
        return job;
    }

    void ExpectRemoteHoldsPattern(std::uint64_t size) {
        const auto data = remote_->Snapshot();
        ASSERT_EQ(data.size(), size);
        EXPECT_EQ(data, test::PatternBytes(0, size));
    }

    std::shared_ptr<test::ManualClock> clock_ = std::make_shared<test::ManualClock>();
    std::shared_ptr<test::FakeObjectStore> objects_ = std::make_shared<test::FakeObjectStore>();
    std::shared_ptr<test::FakeRemote> remote_ = std::make_shared<test::FakeRemote>();
    std::unique_ptr<TransferEngine> engine_;
    std::vector<std::uint64_t> progress_;
    std::uint64_t total_ = 0;
};

// -------- Direct --------

TEST_F(TransferEngineTest, DirectStreamsWholeObject) {
    const std::uint64_t size = 3 * kChunk + 17;
    ResumeState resume;
    const auto result = engine_->Transfer(Job(size, Direct{}), resume);

    EXPECT_EQ(result.bytes_transferred, size);
    EXPECT_EQ(result.checksum, test::PatternChecksum(size, kChunk));
    EXPECT_EQ(remote_->truncates, 1);
    EXPECT_EQ(remote_->writes, 1);
    ExpectRemoteHoldsPattern(size);

    ASSERT_FALSE(progress_.empty());
    EXPECT_TRUE(std::is_sorted(progress_.begin(), progress_.end()));
    EXPECT_EQ(progress_.back(), size);
    EXPECT_EQ(total_, size);
}

TEST_F(TransferEngineTest, DirectHandlesEmptyObject) {
    ResumeState resume;
    const auto result = engine_->Transfer(Job(0, Direct{}), resume);
    EXPECT_EQ(result.bytes_transferred, 0u);
    EXPECT_EQ(result.checksum, "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(remote_->truncates, 1);
}

TEST_F(TransferEngineTest, AuthenticationRejectionIsNotRetried) {
    remote_->reject_login = true;
    ResumeState resume;
    try {
        engine_->Transfer(Job(kChunk * 2, Chunked{kChunk}), resume);
        FAIL() << "expected AuthenticationRejected";
    } catch (const FerryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthenticationRejected);
    }
    EXPECT_EQ(remote_->connects, 1);
    EXPECT_EQ(clock_->slept(), test::ManualClock::duration::zero());
}

// -------- Chunked --------

TEST_F(TransferEngineTest, ChunkedAppendsChunksInOrder) {
    const std::uint64_t size = 5 * kChunk + 100;
    ResumeState resume;
    const auto result = engine_->Transfer(Job(size, Chunked{kChunk}), resume);

    EXPECT_EQ(result.chunks_total, 6u);
    EXPECT_EQ(result.chunks_attempted, 6u);
    EXPECT_EQ(result.checksum, test::PatternChecksum(size, kChunk));
    EXPECT_EQ(remote_->truncates, 1);
    EXPECT_EQ(remote_->appends, 5);
    EXPECT_EQ(resume.Acknowledged(), 6u);
    ExpectRemoteHoldsPattern(size);
    EXPECT_EQ(progress_.back(), size);
}

TEST_F(TransferEngineTest, ChunkedRetriesSourceReadsInPlace) {
    objects_->read_failures = 2;
    ResumeState resume;
    const auto result = engine_->Transfer(Job(3 * kChunk, Chunked{kChunk}), resume);
    EXPECT_EQ(result.bytes_transferred, 3 * kChunk);
    EXPECT_EQ(clock_->slept(), 6s);  // 2 s + 4 s
    ExpectRemoteHoldsPattern(3 * kChunk);
}

TEST_F(TransferEngineTest, ChunkedSendsOnlyMissingTailAfterPartialWrite) {
    const std::uint64_t size = 3 * kChunk;
    remote_->write_faults = {std::nullopt, 300};  // chunk 1 breaks after 300 bytes
    ResumeState resume;
    const auto result = engine_->Transfer(Job(size, Chunked{kChunk}), resume);

    EXPECT_EQ(result.checksum, test::PatternChecksum(size, kChunk));
    EXPECT_EQ(remote_->writes, 4);
    EXPECT_EQ(remote_->connects, 2);
    ExpectRemoteHoldsPattern(size);
}

TEST_F(TransferEngineTest, ChunkedResumesFromLastAcknowledgedChunk) {
    const std::uint64_t size = 5 * kChunk;
    remote_->write_faults = {std::nullopt, std::nullopt, 0, 0, 0};
    ResumeState resume;
    const auto job = Job(size, Chunked{kChunk});

    try {
        engine_->Transfer(job, resume);
        FAIL() << "chunk 2 should exhaust its retry budget";
    } catch (const FerryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DestinationUnreachable);
    }
    EXPECT_EQ(resume.ContiguousPrefix(), 2u);

    const auto result = engine_->Transfer(job, resume);
    EXPECT_EQ(result.resumed_from, 2u);
    EXPECT_EQ(result.chunks_attempted, 3u);
    EXPECT_EQ(result.checksum, test::PatternChecksum(size, kChunk));
    ExpectRemoteHoldsPattern(size);
}

TEST_F(TransferEngineTest, ChunkedRestartsWhenRemoteNoLongerMatches) {
    const std::uint64_t size = 4 * kChunk;
    remote_->write_faults = {std::nullopt, std::nullopt, 0, 0, 0};
    ResumeState resume;
    const auto job = Job(size, Chunked{kChunk});
    EXPECT_THROW(engine_->Transfer(job, resume), FerryError);

    {
        std::lock_guard<std::mutex> lock(remote_->mutex);
        remote_->data.resize(100);  // someone truncated the remote file
    }
    const auto result = engine_->Transfer(job, resume);
    EXPECT_EQ(result.resumed_from, 0u);
    EXPECT_EQ(result.chunks_attempted, 4u);
    ExpectRemoteHoldsPattern(size);
}

TEST_F(TransferEngineTest, ChunkedWithoutAppendFallsBackToWholeStream) {
    remote_->caps = {.append = false, .offset_writes = false};
    const std::uint64_t size = 3 * kChunk + 5;
    ResumeState resume;
    const auto result = engine_->Transfer(Job(size, Chunked{kChunk}), resume);
    EXPECT_EQ(remote_->writes, 1);
    EXPECT_EQ(result.checksum, test::PatternChecksum(size, kChunk));
    ExpectRemoteHoldsPattern(size);
}

TEST_F(TransferEngineTest, DeadlineStopsTheTransfer) {
    ResumeState resume;
    auto job = Job(3 * kChunk, Chunked{kChunk});
    job.deadline = clock_->Now();
    try {
        engine_->Transfer(job, resume);
        FAIL();
    } catch (const FerryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PhaseTimeout);
    }
}

// -------- ParallelChunked --------

TEST_F(TransferEngineTest, ParallelOrderedCommitOnAppendOnlyDestination) {
    const std::uint64_t size = 20 * kChunk + 3;
    ResumeState resume;
    const auto result = engine_->Transfer(Job(size, ParallelChunked{kChunk, 3}), resume);

    EXPECT_EQ(result.chunks_total, 21u);
    EXPECT_EQ(result.chunks_attempted, 21u);
    EXPECT_EQ(remote_->offset_writes, 0);
    EXPECT_EQ(result.checksum, test::PatternChecksum(size, kChunk));
    ExpectRemoteHoldsPattern(size);
    EXPECT_TRUE(std::is_sorted(progress_.begin(), progress_.end()));
}

TEST_F(TransferEngineTest, ParallelWritesAtOffsetsWhenSupported) {
    remote_->caps = {.append = true, .offset_writes = true};
    const std::uint64_t size = 17 * kChunk + 999;
    ResumeState resume;
    const auto result = engine_->Transfer(Job(size, ParallelChunked{kChunk, 5}), resume);

    EXPECT_EQ(result.chunks_attempted, 18u);
    EXPECT_EQ(remote_->offset_writes, 18);
    EXPECT_EQ(result.checksum, test::PatternChecksum(size, kChunk));
    ExpectRemoteHoldsPattern(size);
    EXPECT_EQ(progress_.back(), size);
}

TEST_F(TransferEngineTest, ParallelFailsWholeStrategyWhenAChunkExhaustsRetries) {
    auto cfg = SmallConfig();
    cfg.chunk_retry.max_attempts = 1;
    Build(cfg);
    remote_->caps = {.append = true, .offset_writes = true};
    remote_->write_faults = {0};

    ResumeState resume;
    try {
        engine_->Transfer(Job(12 * kChunk, ParallelChunked{kChunk, 4}), resume);
        FAIL() << "no partial silent success";
    } catch (const FerryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DestinationUnreachable);
    }
    EXPECT_LT(resume.Acknowledged(), 12u);
}

TEST_F(TransferEngineTest, ParallelChecksumMatchesDirectStream) {
    for (const std::uint64_t size : {kChunk, kChunk + 1, 7 * kChunk, 9 * kChunk + 511}) {
        remote_->caps = {.append = true, .offset_writes = false};
        ResumeState r1;
        const auto direct = engine_->Transfer(Job(size, Direct{}), r1);

        remote_->caps = {.append = true, .offset_writes = true};
        ResumeState r2;
        const auto parallel = engine_->Transfer(Job(size, ParallelChunked{kChunk, 4}), r2);

        remote_->caps = {.append = true, .offset_writes = false};
        ResumeState r3;
        const auto ordered = engine_->Transfer(Job(size, ParallelChunked{kChunk, 2}), r3);

        EXPECT_EQ(parallel.checksum, direct.checksum) << "size " << size;
        EXPECT_EQ(ordered.checksum, direct.checksum) << "size " << size;
    }
}

// -------- Source checksum --------

TEST_F(TransferEngineTest, ComputeSourceChecksumUsesChunkLayout) {
    const std::uint64_t size = 6 * kChunk + 10;
    objects_->Add("reports", "data.bin", size);
    EXPECT_EQ(engine_->ComputeSourceChecksum({}, {"reports", "data.bin"}, size),
              test::PatternChecksum(size, kChunk));
}

TEST_F(TransferEngineTest, ComputeSourceChecksumReportsUnavailable) {
    objects_->Add("reports", "data.bin", kChunk);
    objects_->read_failures = 3;
    try {
        engine_->ComputeSourceChecksum({}, {"reports", "data.bin"}, kChunk);
        FAIL();
    } catch (const FerryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ChecksumUnavailable);
    }
}
