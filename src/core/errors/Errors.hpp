#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry {

/**
 * @brief Failure taxonomy. Each ErrorCode belongs to exactly one kind.
 */
enum class ErrorKind {
    Validation,
    Authorization,
    TransientInfrastructure,
    Transfer,
    Integrity,
    Collaborator,
};

enum class ErrorCode {
    InvalidPlan,
    ApprovalInvalid,
    ReplayDetected,
    SessionExpired,
    SessionNotFound,
    CredentialIssuanceFailed,
    ProviderUnavailable,
    SourceNotFound,
    SourceUnreadable,
    DestinationUnreachable,
    AuthenticationRejected,
    ChecksumUnavailable,
    ChecksumMismatch,
    PhaseTimeout,
    RetriesExhausted,
    StoreUnavailable,
    AuditFailed,
    NotificationFailed,
};

ErrorKind KindOf(ErrorCode code) noexcept;
bool IsRetryable(ErrorCode code) noexcept;

std::string_view ToString(ErrorKind kind) noexcept;
std::string_view ToString(ErrorCode code) noexcept;

/**
 * @brief The single exception type thrown by ferry components.
 *
 * Protocol adapters translate transport errors (HTTP statuses, libcurl codes,
 * socket errors) into a FerryError before they leave the adapter.
 */
class FerryError : public std::runtime_error {
   public:
    FerryError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }
    ErrorKind kind() const noexcept { return KindOf(code_); }
    bool retryable() const noexcept { return IsRetryable(code_); }

   private:
    ErrorCode code_;
};

/**
 * @brief User-visible failure attached to a TransferRecord.
 */
struct FailureInfo {
    ErrorKind kind = ErrorKind::Transfer;
    ErrorCode code = ErrorCode::RetriesExhausted;
    std::string message;
    std::uint32_t attempt = 0;

    // "<Kind> after <n> attempt(s): <message>"
    std::string Summary() const;
};

}  // namespace ferry
