#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Clock.hpp"
#include "Errors.hpp"

namespace ferry {

// -------- Enums --------
enum class Protocol { Ftp, Sftp, Ftps };
enum class StrategyKind { Direct, Chunked, ParallelChunked };

enum class TransferState {
    Validating,
    Authenticating,
    Planning,
    Transferring,
    Retrying,
    Verifying,
    Recording,
    Notifying,
    CleaningUp,
    Completed,
    Failed,
};

std::string_view ToString(Protocol p) noexcept;
std::string_view ToString(StrategyKind s) noexcept;
std::string_view ToString(TransferState s) noexcept;

// Accepts the canonical names plus the "ssh" and "ftp-tls" aliases.
std::optional<Protocol> ParseProtocol(std::string_view name);
std::optional<StrategyKind> ParseStrategy(std::string_view name);
std::optional<TransferState> ParseState(std::string_view name);

std::uint16_t DefaultPort(Protocol p) noexcept;
bool IsTerminal(TransferState s) noexcept;

// -------- Credentials --------

/**
 * @brief Ephemeral, least-privilege access material issued for one session.
 */
struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::string region;
    std::string scope;
    Clock::time_point expiration{};
};

struct DestinationCredentials {
    std::string username;
    std::string password;
    std::string private_key_path;  // sftp only
};

// -------- Plan --------
struct SourceLocation {
    std::string container;
    std::string object_key;
};

struct DestinationEndpoint {
    Protocol protocol = Protocol::Sftp;
    std::string host;
    std::uint16_t port = 0;
    DestinationCredentials credentials;
    std::string remote_path;
};

/**
 * @brief What to move, where, and under whose approval. Immutable once accepted.
 */
struct TransferPlan {
    SourceLocation source;
    DestinationEndpoint destination;
    std::string requested_by;
    std::string approval_reference;
};

/**
 * @brief Intake envelope handed over by the front-end.
 */
struct TransferRequest {
    std::string subject;
    std::string approval_reference;
    TransferPlan plan;
};

// -------- Session --------
struct Session {
    std::string token;
    std::string subject;
    std::string approval_reference;
    Clock::time_point issued_at{};
    Clock::time_point expires_at{};
    Credentials credentials;
    bool consumed = false;

    bool ValidAt(Clock::time_point now) const { return now < expires_at && !consumed; }
};

// -------- Record --------

/**
 * @brief Auditable state of one transfer, persisted in the progress store.
 */
struct TransferRecord {
    std::string id;
    TransferPlan plan;
    std::optional<StrategyKind> strategy;
    TransferState state = TransferState::Validating;
    std::uint64_t bytes_total = 0;
    std::uint64_t bytes_transferred = 0;
    std::string checksum_expected;
    std::string checksum_actual;
    std::uint32_t attempt_count = 0;
    std::string session_token;
    Clock::time_point started_at{};
    std::optional<Clock::time_point> completed_at;
    std::optional<FailureInfo> error;

    std::string audit_ticket;
    bool degraded = false;
    std::string audit_error;
};

/**
 * @brief A contiguous byte range [offset, offset + length) of the source object.
 */
struct Chunk {
    std::size_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    std::uint64_t end() const { return offset + length; }
};

}  // namespace ferry
