#include "TransferOrchestrator.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <utility>

#include "Checksum.hpp"
#include "PlanValidator.hpp"
#include "Retry.hpp"

namespace ferry {

TransferOrchestrator::TransferOrchestrator(std::shared_ptr<SessionBroker> broker,
                                           std::shared_ptr<TransferEngine> engine,
                                           std::shared_ptr<IObjectSourceFactory> sources,
                                           std::shared_ptr<ProgressStore> progress,
                                           std::shared_ptr<IAuditRecorder> audit,
                                           std::shared_ptr<INotifier> notifier,
                                           std::shared_ptr<Clock> clock,
                                           OrchestratorConfig cfg)
    : broker_(std::move(broker)),
      engine_(std::move(engine)),
      sources_(std::move(sources)),
      progress_(std::move(progress)),
      audit_(std::move(audit)),
      notifier_(std::move(notifier)),
      clock_(std::move(clock)),
      cfg_(std::move(cfg)) {}

// ============================================================================
// Entry points
// ============================================================================

TransferRecord TransferOrchestrator::Accept(const TransferRequest& request) {
    boost::uuids::random_generator generator;

    TransferRecord record;
    record.id = boost::uuids::to_string(generator());
    record.plan = request.plan;
    record.started_at = clock_->Now();
    record.state = TransferState::Validating;

    spdlog::info("[{}] Accepted from '{}' under {}: {}/{} -> {}://{}:{}{}", record.id,
                 request.subject, request.approval_reference, request.plan.source.container,
                 request.plan.source.object_key, ToString(request.plan.destination.protocol),
                 request.plan.destination.host, request.plan.destination.port,
                 request.plan.destination.remote_path);
    Persist(record);

    try {
        ValidateRequest(request);
    } catch (const FerryError& e) {
        Fail(record, e, 1);
        return Finish(std::move(record));
    }
    return record;
}

TransferRecord TransferOrchestrator::Run(TransferRecord record) {
    if (IsTerminal(record.state)) {
        return record;
    }

    std::uint32_t attempt = 1;
    try {
        const auto session = Authenticate(record, attempt);

        attempt = 1;
        TransferStrategy strategy;
        const auto metadata = Plan(record, session, strategy);

        Transition(record, TransferState::Transferring);
        const auto credentials = broker_->Consume(session.token);
        const auto result = Move(record, credentials, strategy, attempt);

        Transition(record, TransferState::Verifying);
        Verify(record, credentials, metadata, result);
    } catch (const FerryError& e) {
        Fail(record, e, attempt);
    } catch (const std::exception& e) {
        spdlog::critical("[{}] Unexpected error in {}: {}", record.id, ToString(record.state), e.what());
        Fail(record, FerryError(ErrorCode::RetriesExhausted, e.what()), attempt);
    }
    return Finish(std::move(record));
}

TransferRecord TransferOrchestrator::Execute(const TransferRequest& request) {
    auto record = Accept(request);
    if (IsTerminal(record.state)) {
        return record;
    }
    return Run(std::move(record));
}

std::optional<TransferRecord> TransferOrchestrator::Find(const std::string& id) {
    return progress_->Load(id);
}

std::vector<TransferRecord> TransferOrchestrator::History(const std::string& requested_by,
                                                          std::size_t limit) {
    return progress_->History(requested_by, limit);
}

// ============================================================================
// Phases
// ============================================================================

Session TransferOrchestrator::Authenticate(TransferRecord& record, std::uint32_t& attempt) {
    Transition(record, TransferState::Authenticating);

    auto session = RetryWithBackoff(
        cfg_.auth_retry, *clock_, fmt::format("[{}] Authentication", record.id),
        [&](std::uint32_t n) {
            attempt = n;
            return broker_->Authenticate(record.plan.requested_by, record.plan.approval_reference,
                                         record.plan.source);
        });

    record.session_token = session.token;
    Persist(record);
    return session;
}

ObjectMetadata TransferOrchestrator::Plan(TransferRecord& record, const Session& session,
                                          TransferStrategy& strategy) {
    Transition(record, TransferState::Planning);
    const auto deadline = clock_->Now() + cfg_.planning_timeout;

    const auto credentials = broker_->CredentialsFor(session.token);
    auto source = sources_->Open(credentials);
    const auto metadata = RetryWithBackoff(
        cfg_.transfer_retry, *clock_, fmt::format("[{}] Source lookup", record.id),
        [&](std::uint32_t) { return source->Stat(record.plan.source); });

    if (clock_->Now() >= deadline) {
        throw FerryError(ErrorCode::PhaseTimeout,
                         fmt::format("planning took longer than {}s", cfg_.planning_timeout.count()));
    }

    strategy = SelectStrategy(metadata.size, engine_->config());
    record.bytes_total = metadata.size;
    record.strategy = KindOf(strategy);
    spdlog::info("[{}] Source is {} bytes, strategy {}", record.id, metadata.size,
                 ToString(*record.strategy));
    Persist(record);
    return metadata;
}

TransferResult TransferOrchestrator::Move(TransferRecord& record, const Credentials& credentials,
                                          const TransferStrategy& strategy, std::uint32_t& attempt) {
    const auto deadline = clock_->Now() + cfg_.transfer_timeout;

    std::uint64_t last_saved = 0;
    TransferJob job;
    job.credentials = credentials;
    job.source = record.plan.source;
    job.destination = record.plan.destination;
    job.remote_path = ResolveRemotePath(record.plan);
    job.object_size = record.bytes_total;
    job.strategy = strategy;
    job.deadline = deadline;
    job.on_progress = [&](std::uint64_t done, std::uint64_t total) {
        record.bytes_transferred = done;
        if (done == total || done < last_saved || done - last_saved >= cfg_.progress_interval) {
            last_saved = done;
            Persist(record);
        }
    };

    ResumeState resume;
    for (attempt = 1;; ++attempt) {
        record.attempt_count = attempt;
        Persist(record);
        try {
            const auto result = engine_->Transfer(job, resume);
            record.bytes_transferred = result.bytes_transferred;
            record.checksum_actual = result.checksum;
            if (result.chunks_total > 0) {
                spdlog::info("[{}] Moved {} bytes in {} chunk(s), {} attempted this run", record.id,
                             result.bytes_transferred, result.chunks_total, result.chunks_attempted);
            } else {
                spdlog::info("[{}] Moved {} bytes", record.id, result.bytes_transferred);
            }
            Persist(record);
            return result;
        } catch (const FerryError& e) {
            if (!e.retryable()) {
                throw;
            }
            if (attempt >= cfg_.transfer_retry.max_attempts) {
                throw FerryError(ErrorCode::RetriesExhausted,
                                 fmt::format("{}: {}", ToString(e.code()), e.what()));
            }
            const auto delay = cfg_.transfer_retry.BackoffAfter(attempt);
            spdlog::warn("[{}] Transfer attempt {}/{} failed: {}. Retrying in {} ms", record.id,
                         attempt, cfg_.transfer_retry.max_attempts, e.what(), delay.count());
            Transition(record, TransferState::Retrying);
            clock_->SleepFor(delay);
            if (clock_->Now() >= deadline) {
                throw FerryError(ErrorCode::PhaseTimeout,
                                 fmt::format("transfer took longer than {}s", cfg_.transfer_timeout.count()));
            }
            Transition(record, TransferState::Transferring);
        }
    }
}

void TransferOrchestrator::Verify(TransferRecord& record, const Credentials& credentials,
                                  const ObjectMetadata& metadata, const TransferResult& result) {
    std::optional<std::string> etag;
    if (cfg_.trust_source_etag) {
        etag = UsableEtag(metadata.etag, metadata.size, engine_->config().chunk_size);
    }

    std::string expected;
    if (etag && *etag == result.checksum) {
        expected = std::move(*etag);
    } else {
        if (etag) {
            spdlog::warn("[{}] Source ETag {} differs from {}; recomputing source checksum",
                         record.id, *etag, result.checksum);
        } else {
            spdlog::info("[{}] Recomputing source checksum", record.id);
        }
        expected = engine_->ComputeSourceChecksum(credentials, record.plan.source, metadata.size,
                                                  clock_->Now() + cfg_.transfer_timeout);
    }

    record.checksum_expected = expected;
    Persist(record);

    if (expected != result.checksum) {
        throw FerryError(ErrorCode::ChecksumMismatch,
                         fmt::format("checksum mismatch: expected {}, got {}", expected, result.checksum));
    }
    spdlog::info("[{}] Checksum verified: {}", record.id, expected);
}

TransferRecord TransferOrchestrator::Finish(TransferRecord record) {
    const auto terminal = record.error ? TransferState::Failed : TransferState::Completed;

    Transition(record, TransferState::Recording);
    try {
        record.audit_ticket = audit_->RecordOutcome(record.id, BuildOutcome(record));
        spdlog::info("[{}] Audit ticket {}", record.id, record.audit_ticket);
    } catch (const std::exception& e) {
        record.degraded = true;
        record.audit_error = e.what();
        spdlog::warn("[{}] Audit recording failed, outcome is degraded: {}", record.id, e.what());
    }
    Persist(record);

    Transition(record, TransferState::Notifying);
    try {
        notifier_->Notify(record.plan.requested_by, record.id, BuildOutcome(record));
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Notification failed: {}", record.id, e.what());
    }

    Transition(record, TransferState::CleaningUp);
    if (!record.session_token.empty()) {
        try {
            broker_->Invalidate(record.session_token);
        } catch (const FerryError& e) {
            spdlog::error("[{}] Session invalidation failed: {}", record.id, e.what());
        }
    }

    record.completed_at = clock_->Now();
    Transition(record, terminal);
    if (record.error) {
        spdlog::error("[{}] Failed: {}", record.id, record.error->Summary());
    } else {
        spdlog::info("[{}] Completed{}", record.id, record.degraded ? " (degraded)" : "");
    }
    return record;
}

// ============================================================================
// Helpers
// ============================================================================

void TransferOrchestrator::Transition(TransferRecord& record, TransferState next) {
    spdlog::info("[{}] {} -> {}", record.id, ToString(record.state), ToString(next));
    record.state = next;
    Persist(record);
}

void TransferOrchestrator::Fail(TransferRecord& record, const FerryError& error,
                                std::uint32_t attempt) {
    FailureInfo info;
    info.kind = error.kind();
    info.code = error.code();
    info.message = error.what();
    info.attempt = std::max<std::uint32_t>(1, attempt);
    spdlog::error("[{}] {} failed: {}", record.id, ToString(record.state), info.Summary());
    record.error = std::move(info);
}

void TransferOrchestrator::Persist(const TransferRecord& record) {
    try {
        progress_->Save(record);
    } catch (const FerryError& e) {
        spdlog::error("[{}] Progress store write failed: {}", record.id, e.what());
    }
}

TransferOutcome TransferOrchestrator::BuildOutcome(const TransferRecord& record) const {
    TransferOutcome outcome;
    outcome.success = !record.error;
    outcome.summary = record.error ? record.error->Summary() : "completed";

    const auto& plan = record.plan;
    auto& d = outcome.detail;
    d["transfer_id"] = record.id;
    d["approval_reference"] = plan.approval_reference;
    d["requested_by"] = plan.requested_by;
    d["source"] = plan.source.container + "/" + plan.source.object_key;
    d["destination"] = fmt::format("{}://{}:{}", ToString(plan.destination.protocol),
                                   plan.destination.host, plan.destination.port);
    d["remote_path"] = ResolveRemotePath(plan);
    d["attempt_count"] = record.attempt_count;
    d["bytes_total"] = record.bytes_total;
    d["bytes_transferred"] = record.bytes_transferred;
    if (record.strategy) {
        d["strategy"] = ToString(*record.strategy);
    }
    if (!record.checksum_actual.empty()) {
        d["checksum"] = record.checksum_actual;
    }
    if (record.error) {
        d["kind"] = ToString(record.error->kind);
        d["code"] = ToString(record.error->code);
        d["error"] = record.error->Summary();
    }
    if (!record.audit_ticket.empty()) {
        d["audit_ticket"] = record.audit_ticket;
    }
    return outcome;
}

}  // namespace ferry
