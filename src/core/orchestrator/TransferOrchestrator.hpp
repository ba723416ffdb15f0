#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Clock.hpp"
#include "ICollaborators.hpp"
#include "IObjectSource.hpp"
#include "ProgressStore.hpp"
#include "SessionBroker.hpp"
#include "TransferEngine.hpp"
#include "config.hpp"

namespace ferry {

/**
 * @brief Drives one TransferRecord through its state machine.
 *
 * @details
 * Validating -> Authenticating -> Planning -> Transferring (<-> Retrying)
 * -> Verifying -> Recording -> Notifying -> CleaningUp -> Completed | Failed.
 *
 * Recording, Notifying and CleaningUp run on the failure path too, so the
 * session is always invalidated and every outcome reaches the audit trail.
 * Every transition is persisted through the ProgressStore before the next
 * phase starts; engine progress is written here, never by the engine.
 *
 * **Thread Safety:** One record runs on one thread. Several records may run
 * concurrently against the same orchestrator.
 */
class TransferOrchestrator {
   public:
    TransferOrchestrator(std::shared_ptr<SessionBroker> broker,
                         std::shared_ptr<TransferEngine> engine,
                         std::shared_ptr<IObjectSourceFactory> sources,
                         std::shared_ptr<ProgressStore> progress,
                         std::shared_ptr<IAuditRecorder> audit,
                         std::shared_ptr<INotifier> notifier,
                         std::shared_ptr<Clock> clock,
                         OrchestratorConfig cfg = {});

    /**
     * @brief Creates the record and runs Validating synchronously.
     * @return The validated record, or a terminal Failed record
     *         (ValidationError) that already went through the closing phases.
     */
    TransferRecord Accept(const TransferRequest& request);

    // Runs an accepted record to its terminal state.
    TransferRecord Run(TransferRecord record);

    TransferRecord Execute(const TransferRequest& request);

    std::optional<TransferRecord> Find(const std::string& id);

    // Records of one requester, newest first.
    std::vector<TransferRecord> History(const std::string& requested_by, std::size_t limit);

   private:
    Session Authenticate(TransferRecord& record, std::uint32_t& attempt);
    ObjectMetadata Plan(TransferRecord& record, const Session& session, TransferStrategy& strategy);
    TransferResult Move(TransferRecord& record, const Credentials& credentials,
                        const TransferStrategy& strategy, std::uint32_t& attempt);
    void Verify(TransferRecord& record, const Credentials& credentials,
                const ObjectMetadata& metadata, const TransferResult& result);
    TransferRecord Finish(TransferRecord record);

    void Transition(TransferRecord& record, TransferState next);
    void Fail(TransferRecord& record, const FerryError& error, std::uint32_t attempt);
    void Persist(const TransferRecord& record);
    TransferOutcome BuildOutcome(const TransferRecord& record) const;

    std::shared_ptr<SessionBroker> broker_;
    std::shared_ptr<TransferEngine> engine_;
    std::shared_ptr<IObjectSourceFactory> sources_;
    std::shared_ptr<ProgressStore> progress_;
    std::shared_ptr<IAuditRecorder> audit_;
    std::shared_ptr<INotifier> notifier_;
    std::shared_ptr<Clock> clock_;
    OrchestratorConfig cfg_;
};

}  // namespace ferry
