#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "FakeCollaborators.hpp"
#include "FakeDestination.hpp"
#include "FakeObjectSource.hpp"
#include "InMemoryKeyValueStore.hpp"
#include "ManualClock.hpp"
#include "ProgressStore.hpp"
#include "SessionBroker.hpp"
#include "TransferEngine.hpp"
#include "TransferOrchestrator.hpp"

using namespace ferry;
using namespace std::chrono_literals;

class TransferOrchestratorTest : public ::testing::Test {
   protected:
    TransferOrchestratorTest() {
        store_ = std::make_shared<test::RecordingKeyValueStore>(
            std::make_shared<InMemoryKeyValueStore>(clock_));
        provider_ = std::make_shared<test::FakeCredentialProvider>(clock_);
        broker_ = std::make_shared<SessionBroker>(store_, provider_, clock_);
        progress_ = std::make_shared<ProgressStore>(store_, std::chrono::hours(168));
        Build(TransferConfig{});
    }

    void Build(const TransferConfig& cfg, OrchestratorConfig ocfg = {}) {
        auto sources = std::make_shared<test::FakeSourceFactory>(objects_);
        engine_ = std::make_shared<TransferEngine>(
            sources, std::make_shared<test::FakeDestinationFactory>(remote_), clock_, cfg);
        orchestrator_ = std::make_shared<TransferOrchestrator>(broker_, engine_, sources, progress_,
                                                               audit_, notifier_, clock_, ocfg);
    }

    static TransferRequest Request(const std::string& approval = "REQ-1001") {
        TransferRequest req;
        req.subject = "alice";
        req.approval_reference = approval;
        req.plan.source = {"reports", "data.bin"};
        req.plan.destination.protocol = Protocol::Sftp;
        req.plan.destination.host = "sftp.partner.example";
        req.plan.destination.port = 22;
        req.plan.destination.credentials = {"drop", "hunter2", ""};
        req.plan.destination.remote_path = "/in/";
        req.plan.requested_by = "alice";
        req.plan.approval_reference = approval;
        return req;
    }

    std::shared_ptr<test::ManualClock> clock_ = std::make_shared<test::ManualClock>();
    std::shared_ptr<test::RecordingKeyValueStore> store_;
    std::shared_ptr<test::FakeCredentialProvider> provider_;
    std::shared_ptr<SessionBroker> broker_;
    std::shared_ptr<ProgressStore> progress_;
    std::shared_ptr<test::FakeObjectStore> objects_ = std::make_shared<test::FakeObjectStore>();
    std::shared_ptr<test::FakeRemote> remote_ = std::make_shared<test::FakeRemote>();
    std::shared_ptr<test::RecordingAuditRecorder> audit_ = std::make_shared<test::RecordingAuditRecorder>();
    std::shared_ptr<test::RecordingNotifier> notifier_ = std::make_shared<test::RecordingNotifier>();
    std::shared_ptr<TransferEngine> engine_;
    std::shared_ptr<TransferOrchestrator> orchestrator_;
};

// A 50 MiB object streams directly and completes on the first attempt.
TEST_F(TransferOrchestratorTest, SmallObjectCompletesDirect) {
    const std::uint64_t size = 50 * MIB;
    objects_->Add("reports", "data.bin", size);

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Completed);
    ASSERT_TRUE(record.strategy.has_value());
    EXPECT_EQ(*record.strategy, StrategyKind::Direct);
    EXPECT_EQ(record.bytes_total, size);
    EXPECT_EQ(record.bytes_transferred, 50u * 1024 * 1024);
    EXPECT_EQ(record.checksum_actual, record.checksum_expected);
    EXPECT_EQ(record.checksum_actual, test::PatternChecksum(size, 10 * MIB));
    EXPECT_EQ(record.attempt_count, 1u);
    EXPECT_TRUE(record.completed_at.has_value());
    EXPECT_FALSE(record.error.has_value());
    EXPECT_EQ(record.audit_ticket, "AUD-1");

    EXPECT_EQ(remote_->paths.front(), "/in/data.bin");
    EXPECT_EQ(remote_->Snapshot().size(), size);
    EXPECT_EQ(provider_->last_scope, "read-only:reports/data.bin");

    const std::vector<std::string> expected{"Validating", "Authenticating", "Planning",
                                            "Transferring", "Verifying", "Recording",
                                            "Notifying", "CleaningUp", "Completed"};
    EXPECT_EQ(store_->states, expected);

    ASSERT_EQ(notifier_->notified.size(), 1u);
    EXPECT_TRUE(notifier_->notified[0].success);
    EXPECT_EQ(notifier_->notified[0].subject, "alice");
    EXPECT_FALSE(broker_->IsValid(record.session_token));
}

// A large object, scaled to KiB: 2048 units in 10-unit chunks with 5 workers.
TEST_F(TransferOrchestratorTest, LargeObjectRunsParallelChunked) {
    TransferConfig cfg;
    cfg.small_threshold = 100 * KIB;
    cfg.large_threshold = 1024 * KIB;
    cfg.chunk_size = 10 * KIB;
    cfg.buffer_size = 10 * KIB;
    cfg.max_workers = 5;
    Build(cfg);

    const std::uint64_t size = 2048 * KIB;
    objects_->Add("reports", "data.bin", size, "\"" + test::PatternChecksum(size, cfg.chunk_size) + "\"");

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Completed);
    EXPECT_EQ(*record.strategy, StrategyKind::ParallelChunked);
    // ceil(2048 / 10) chunk reads, then one re-read: a multipart ETag is never trusted.
    EXPECT_EQ(objects_->ranges_opened.load(), 206);
    EXPECT_TRUE(record.checksum_actual.ends_with("-205"));
    EXPECT_EQ(record.checksum_actual, record.checksum_expected);
    EXPECT_EQ(remote_->Snapshot(), test::PatternBytes(0, size));
}

TEST_F(TransferOrchestratorTest, LargeObjectFailsUnlessEveryChunkSucceeds) {
    TransferConfig cfg;
    cfg.small_threshold = 10 * KIB;
    cfg.large_threshold = 20 * KIB;
    cfg.chunk_size = KIB;
    cfg.max_workers = 5;
    cfg.chunk_retry.max_attempts = 1;
    Build(cfg);
    remote_->caps = {.append = true, .offset_writes = true};
    remote_->write_faults.assign(200, 0);  // every chunk write fails
    objects_->Add("reports", "data.bin", 40 * KIB);

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Failed);
    ASSERT_TRUE(record.error.has_value());
    EXPECT_EQ(record.error->kind, ErrorKind::Transfer);
    EXPECT_EQ(record.error->code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(record.attempt_count, 3u);
    EXPECT_TRUE(record.checksum_actual.empty());
}

// A second run under an approval that was already used is a replay.
TEST_F(TransferOrchestratorTest, ReusedApprovalFailsWithReplay) {
    objects_->Add("reports", "data.bin", 1000);
    ASSERT_EQ(orchestrator_->Execute(Request()).state, TransferState::Completed);
    const auto writes = remote_->writes;

    const auto second = orchestrator_->Execute(Request());
    ASSERT_EQ(second.state, TransferState::Failed);
    EXPECT_EQ(second.error->kind, ErrorKind::Authorization);
    EXPECT_EQ(second.error->code, ErrorCode::ReplayDetected);
    EXPECT_EQ(second.error->attempt, 1u);
    EXPECT_EQ(remote_->writes, writes);
    EXPECT_EQ(provider_->calls, 1);
}

// Two dropped destination connections cost two backoffs of 2s and 4s.
TEST_F(TransferOrchestratorTest, DestinationFailuresWithinBoundAreRetried) {
    objects_->Add("reports", "data.bin", 4096);
    remote_->connect_failures = 2;

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Completed);
    EXPECT_EQ(record.attempt_count, 3u);
    EXPECT_EQ(record.bytes_transferred, 4096u);
    EXPECT_EQ(remote_->connects, 3);
    EXPECT_EQ(clock_->slept(), 6s);

    const auto& states = store_->states;
    EXPECT_EQ(std::count(states.begin(), states.end(), "Retrying"), 2);
    EXPECT_EQ(states.back(), "Completed");
}

TEST_F(TransferOrchestratorTest, DestinationFailuresBeyondBoundFail) {
    objects_->Add("reports", "data.bin", 4096);
    remote_->connect_failures = 3;

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Failed);
    EXPECT_EQ(record.error->kind, ErrorKind::Transfer);
    EXPECT_EQ(record.attempt_count, 3u);
    EXPECT_EQ(record.error->attempt, 3u);
    EXPECT_EQ(record.error->Summary().rfind("TransferError after 3 attempt(s): ", 0), 0u);
    ASSERT_EQ(audit_->outcomes.size(), 1u);
    EXPECT_FALSE(audit_->outcomes[0].second.success);
    EXPECT_FALSE(broker_->IsValid(record.session_token));
}

// A provider slower than the session window leaves nothing to transfer with.
TEST_F(TransferOrchestratorTest, SessionExpiringDuringAuthenticationFails) {
    objects_->Add("reports", "data.bin", 4096);
    provider_->latency = 11s;

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Failed);
    EXPECT_EQ(record.error->kind, ErrorKind::Authorization);
    EXPECT_EQ(record.error->code, ErrorCode::SessionExpired);
    EXPECT_EQ(record.bytes_transferred, 0u);
    EXPECT_EQ(remote_->connects, 0);
    EXPECT_EQ(objects_->sources_opened.load(), 0);
    EXPECT_EQ(provider_->calls, 1);

    const std::vector<std::string> expected{"Validating", "Authenticating", "Recording",
                                            "Notifying", "CleaningUp", "Failed"};
    EXPECT_EQ(store_->states, expected);
}

TEST_F(TransferOrchestratorTest, ProviderOutagesAreRetried) {
    objects_->Add("reports", "data.bin", 4096);
    provider_->unavailable = 2;

    const auto record = orchestrator_->Execute(Request());
    EXPECT_EQ(record.state, TransferState::Completed);
    EXPECT_EQ(provider_->calls, 3);
}

TEST_F(TransferOrchestratorTest, ChecksumMismatchIsIntegrityErrorWithoutRetry) {
    const std::uint64_t size = 4096;
    objects_->Add("reports", "data.bin", size, test::PatternChecksum(size, 10 * MIB));
    objects_->corrupt_at = 100;  // only the transfer read sees a flipped byte
    objects_->corrupt_ranges = 1;

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Failed);
    EXPECT_EQ(record.error->kind, ErrorKind::Integrity);
    EXPECT_EQ(record.error->code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(record.attempt_count, 1u);
    EXPECT_EQ(remote_->writes, 1);
    EXPECT_EQ(objects_->ranges_opened.load(), 2);  // the ETag mismatch was confirmed by a re-read
    EXPECT_EQ(record.checksum_expected, test::PatternChecksum(size, 10 * MIB));
    EXPECT_NE(record.checksum_actual, record.checksum_expected);
}

// Uploaded in 8 MiB parts, so its ETag cannot match a 10 MiB chunk layout.
TEST_F(TransferOrchestratorTest, MultipartEtagFromOtherPartSizeIsNotTrusted) {
    const std::uint64_t size = 15 * MIB;
    const auto etag = test::PatternChecksum(size, 8 * MIB);
    ASSERT_TRUE(etag.ends_with("-2"));
    objects_->Add("reports", "data.bin", size, "\"" + etag + "\"");

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Completed);
    EXPECT_EQ(*record.strategy, StrategyKind::Direct);
    EXPECT_EQ(record.checksum_expected, test::PatternChecksum(size, 10 * MIB));
    EXPECT_EQ(record.checksum_actual, record.checksum_expected);
    EXPECT_NE(record.checksum_expected, etag);
    EXPECT_EQ(objects_->ranges_opened.load(), 2);
}

// SSE-KMS objects carry a 32-hex ETag that is not the MD5 of their bytes.
TEST_F(TransferOrchestratorTest, SinglePartEtagThatIsNotTheMd5IsRecomputed) {
    objects_->Add("reports", "data.bin", 4096, "\"0123456789abcdef0123456789abcdef\"");

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Completed);
    EXPECT_EQ(record.checksum_expected, test::PatternChecksum(4096, 10 * MIB));
    EXPECT_EQ(objects_->ranges_opened.load(), 2);
}

TEST_F(TransferOrchestratorTest, MatchingSinglePartEtagSkipsTheReRead) {
    const auto md5 = test::PatternChecksum(4096, 10 * MIB);
    objects_->Add("reports", "data.bin", 4096, "\"" + md5 + "\"");

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Completed);
    EXPECT_EQ(record.checksum_expected, md5);
    EXPECT_EQ(objects_->ranges_opened.load(), 1);
}

TEST_F(TransferOrchestratorTest, ExpectedChecksumIsRecomputedWithoutUsableEtag) {
    objects_->Add("reports", "data.bin", 4096, "not-an-md5");

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Completed);
    EXPECT_EQ(record.checksum_expected, test::PatternChecksum(4096, 10 * MIB));
    EXPECT_EQ(objects_->ranges_opened.load(), 2);  // transfer + verification
}

TEST_F(TransferOrchestratorTest, InvalidPlanFailsBeforeAuthentication) {
    auto req = Request();
    req.plan.source.container = "Bad_Bucket";

    const auto record = orchestrator_->Execute(req);

    ASSERT_EQ(record.state, TransferState::Failed);
    EXPECT_EQ(record.error->kind, ErrorKind::Validation);
    EXPECT_EQ(record.error->code, ErrorCode::InvalidPlan);
    EXPECT_EQ(provider_->calls, 0);
    ASSERT_EQ(audit_->outcomes.size(), 1u);

    const std::vector<std::string> expected{"Validating", "Recording", "Notifying", "CleaningUp",
                                            "Failed"};
    EXPECT_EQ(store_->states, expected);
}

TEST_F(TransferOrchestratorTest, MissingSourceIsFoundDuringPlanning) {
    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Failed);
    EXPECT_EQ(record.error->code, ErrorCode::SourceNotFound);
    EXPECT_EQ(record.error->kind, ErrorKind::Validation);
    EXPECT_EQ(provider_->calls, 1);
    EXPECT_FALSE(record.session_token.empty());
    EXPECT_FALSE(broker_->IsValid(record.session_token));
}

TEST_F(TransferOrchestratorTest, DestinationLoginRejectionIsNotRetried) {
    objects_->Add("reports", "data.bin", 4096);
    remote_->reject_login = true;

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Failed);
    EXPECT_EQ(record.error->code, ErrorCode::AuthenticationRejected);
    EXPECT_EQ(record.attempt_count, 1u);
    EXPECT_EQ(remote_->connects, 1);
}

TEST_F(TransferOrchestratorTest, AuditFailureIsDegradedSuccess) {
    objects_->Add("reports", "data.bin", 4096);
    audit_->fail = true;

    const auto record = orchestrator_->Execute(Request());

    EXPECT_EQ(record.state, TransferState::Completed);
    EXPECT_TRUE(record.degraded);
    EXPECT_NE(record.audit_error.find("503"), std::string::npos);
    EXPECT_TRUE(record.audit_ticket.empty());
    EXPECT_EQ(notifier_->notified.size(), 1u);
}

TEST_F(TransferOrchestratorTest, NotificationFailureDoesNotChangeOutcome) {
    objects_->Add("reports", "data.bin", 4096);
    notifier_->fail = true;

    const auto record = orchestrator_->Execute(Request());
    EXPECT_EQ(record.state, TransferState::Completed);
    EXPECT_FALSE(record.degraded);
}

TEST_F(TransferOrchestratorTest, ChunkedTransferResumesAcrossAttempts) {
    TransferConfig cfg;
    cfg.small_threshold = 2 * KIB;
    cfg.large_threshold = 64 * KIB;
    cfg.chunk_size = KIB;
    Build(cfg);
    objects_->Add("reports", "data.bin", 6 * KIB);
    // The fourth chunk exhausts its in-place retries once.
    remote_->write_faults = {std::nullopt, std::nullopt, std::nullopt, 0, 0, 0};

    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(record.state, TransferState::Completed);
    EXPECT_EQ(*record.strategy, StrategyKind::Chunked);
    EXPECT_EQ(record.attempt_count, 2u);
    EXPECT_EQ(remote_->truncates, 1);  // the second attempt never restarted from zero
    EXPECT_EQ(remote_->Snapshot(), test::PatternBytes(0, 6 * KIB));
}

TEST_F(TransferOrchestratorTest, StoredRecordIsFinalAndRedacted) {
    objects_->Add("reports", "data.bin", 4096);
    const auto record = orchestrator_->Execute(Request());

    const auto stored = orchestrator_->Find(record.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->state, TransferState::Completed);
    EXPECT_EQ(stored->bytes_transferred, 4096u);
    EXPECT_TRUE(stored->plan.destination.credentials.password.empty());
    EXPECT_FALSE(orchestrator_->Find("missing").has_value());
}

TEST_F(TransferOrchestratorTest, AuditDetailDescribesTheTransfer) {
    objects_->Add("reports", "data.bin", 4096);
    const auto record = orchestrator_->Execute(Request());

    ASSERT_EQ(audit_->outcomes.size(), 1u);
    const auto& [id, outcome] = audit_->outcomes[0];
    EXPECT_EQ(id, record.id);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.detail.at("strategy").as_string(), "direct");
    EXPECT_EQ(outcome.detail.at("remote_path").as_string(), "/in/data.bin");
    EXPECT_EQ(outcome.detail.at("bytes_transferred").to_number<std::uint64_t>(), 4096u);
    EXPECT_EQ(outcome.detail.at("approval_reference").as_string(), "REQ-1001");
}
