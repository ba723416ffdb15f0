#pragma once

#include <string>

#include <boost/json.hpp>

#include "types.hpp"

namespace ferry {

/**
 * @brief Terminal outcome of a transfer as reported to audit and notification.
 */
struct TransferOutcome {
    bool success = false;
    std::string summary;  // "completed" or the failure summary
    json::object detail;
};

/**
 * @brief Audit/ticketing collaborator.
 *
 * **Errors:** FerryError(AuditFailed). The orchestrator records the failure
 * as degraded success and never rolls the transfer back.
 */
struct IAuditRecorder {
    virtual ~IAuditRecorder() = default;

    // Returns the ticket reference.
    virtual std::string RecordOutcome(const std::string& transfer_id,
                                      const TransferOutcome& outcome) = 0;
};

/**
 * @brief Notification collaborator. Fire-and-forget.
 */
struct INotifier {
    virtual ~INotifier() = default;

    virtual void Notify(const std::string& subject, const std::string& transfer_id,
                        const TransferOutcome& outcome) = 0;
};

}  // namespace ferry
