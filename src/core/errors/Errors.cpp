#include "Errors.hpp"

#include <fmt/format.h>

namespace ferry {

ErrorKind KindOf(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidPlan:
        case ErrorCode::SourceNotFound:
            return ErrorKind::Validation;
        case ErrorCode::ApprovalInvalid:
        case ErrorCode::ReplayDetected:
        case ErrorCode::SessionExpired:
        case ErrorCode::SessionNotFound:
        case ErrorCode::CredentialIssuanceFailed:
        case ErrorCode::AuthenticationRejected:
            return ErrorKind::Authorization;
        case ErrorCode::ProviderUnavailable:
        case ErrorCode::SourceUnreadable:
        case ErrorCode::DestinationUnreachable:
        case ErrorCode::StoreUnavailable:
            return ErrorKind::TransientInfrastructure;
        case ErrorCode::ChecksumMismatch:
            return ErrorKind::Integrity;
        case ErrorCode::ChecksumUnavailable:
        case ErrorCode::PhaseTimeout:
        case ErrorCode::RetriesExhausted:
            return ErrorKind::Transfer;
        case ErrorCode::AuditFailed:
        case ErrorCode::NotificationFailed:
            return ErrorKind::Collaborator;
    }
    return ErrorKind::Transfer;
}

bool IsRetryable(ErrorCode code) noexcept {
    return KindOf(code) == ErrorKind::TransientInfrastructure;
}

std::string_view ToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:
            return "ValidationError";
        case ErrorKind::Authorization:
            return "AuthorizationError";
        case ErrorKind::TransientInfrastructure:
            return "TransientInfrastructureError";
        case ErrorKind::Transfer:
            return "TransferError";
        case ErrorKind::Integrity:
            return "IntegrityError";
        case ErrorKind::Collaborator:
            return "CollaboratorError";
    }
    return "TransferError";
}

std::string_view ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidPlan:              return "InvalidPlan";
        case ErrorCode::ApprovalInvalid:          return "ApprovalInvalid";
        case ErrorCode::ReplayDetected:           return "ReplayDetected";
        case ErrorCode::SessionExpired:           return "SessionExpired";
        case ErrorCode::SessionNotFound:          return "SessionNotFound";
        case ErrorCode::CredentialIssuanceFailed: return "CredentialIssuanceFailed";
        case ErrorCode::ProviderUnavailable:      return "ProviderUnavailable";
        case ErrorCode::SourceNotFound:           return "SourceNotFound";
        case ErrorCode::SourceUnreadable:         return "SourceUnreadable";
        case ErrorCode::DestinationUnreachable:   return "DestinationUnreachable";
        case ErrorCode::AuthenticationRejected:   return "AuthenticationRejected";
        case ErrorCode::ChecksumUnavailable:      return "ChecksumUnavailable";
        case ErrorCode::ChecksumMismatch:         return "ChecksumMismatch";
        case ErrorCode::PhaseTimeout:             return "PhaseTimeout";
        case ErrorCode::RetriesExhausted:         return "RetriesExhausted";
        case ErrorCode::StoreUnavailable:         return "StoreUnavailable";
        case ErrorCode::AuditFailed:              return "AuditFailed";
        case ErrorCode::NotificationFailed:       return "NotificationFailed";
    }
    return "Unknown";
}

std::string FailureInfo::Summary() const {
    return fmt::format("{} after {} attempt(s): {}", ToString(kind), attempt, message);
}

}  // namespace ferry
