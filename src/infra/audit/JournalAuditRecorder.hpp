#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "Clock.hpp"
#include "ICollaborators.hpp"

namespace ferry {

/**
 * @brief Appends one JSON line per outcome to a journal file.
 *
 * @details
 * Line layout: `{"ticket", "transfer_id", "recorded_at", "success",
 * "summary", "detail"}`. Tickets are `AUD-<yyyymmdd>-<seq>`, where seq counts
 * lines written by this process.
 *
 * **Thread Safety:** Serialized by an internal mutex.
 * **Errors:** FerryError(AuditFailed) when the journal cannot be written.
 */
class JournalAuditRecorder final : public IAuditRecorder {
   public:
    JournalAuditRecorder(std::filesystem::path path, std::shared_ptr<Clock> clock);

    std::string RecordOutcome(const std::string& transfer_id,
                              const TransferOutcome& outcome) override;

   private:
    std::filesystem::path path_;
    std::shared_ptr<Clock> clock_;
    std::mutex mutex_;
    std::uint64_t sequence_ = 0;
};

/**
 * @brief Notifier that reports outcomes through the log.
 */
class LogNotifier final : public INotifier {
   public:
    void Notify(const std::string& subject, const std::string& transfer_id,
                const TransferOutcome& outcome) override;
};

}  // namespace ferry
