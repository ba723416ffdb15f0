#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ferry {

static constexpr std::size_t KIB = 1024UZ;
static constexpr std::size_t MIB = 1024UZ * KIB;

struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 8080;  // NOLINT
    unsigned int threads = 1;
    unsigned int transfer_threads = 4;
};

struct S3Config {
    std::string host = "localhost";
    std::string port = "9000";
    std::string region = "us-east-1";
    std::string service = "s3";
};

struct IdentityConfig {
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    std::string role = "ferry-readonly";
};

struct BrokerConfig {
    std::chrono::seconds session_ttl{10};
    std::string approval_pattern = "^(REQ|INC|RITM|CHG)-?[0-9]{3,}$";
    std::chrono::hours approval_retention{720};
};

struct RetryConfig {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{2000};
    std::chrono::milliseconds max_backoff{10000};
    double multiplier = 2.0;

    // Delay before attempt `attempt + 1`, given `attempt` failures so far (1-based).
    std::chrono::milliseconds BackoffAfter(uint32_t attempt) const;
};

struct TransferConfig {
    std::uint64_t small_threshold = 100 * MIB;
    std::uint64_t large_threshold = 1024 * MIB;
    std::size_t chunk_size = 10 * MIB;
    std::size_t buffer_size = 10 * MIB;
    unsigned int max_workers = 5;
    std::chrono::seconds connect_timeout{30};
    RetryConfig chunk_retry{};
};

struct OrchestratorConfig {
    RetryConfig auth_retry{};
    RetryConfig transfer_retry{};
    std::chrono::seconds transfer_timeout{3600};
    std::chrono::seconds planning_timeout{60};
    std::chrono::hours record_retention{168};
    std::uint64_t progress_interval = 10 * MIB;
    bool trust_source_etag = true;
};

struct AuditConfig {
    std::string journal_path = "logs/audit.jsonl";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/ferry.log";
};

struct AppConfig {
    ServerConfig server;
    S3Config s3;
    IdentityConfig identity;
    BrokerConfig broker;
    TransferConfig transfer;
    OrchestratorConfig orchestrator;
    AuditConfig audit;
    LoggingConfig logging;

    std::string source;  // file the values were read from, empty when defaults
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object. Missing keys keep their defaults; a missing
 *         file gives the defaults with an empty `source`. Nothing is logged.
 * @throws std::runtime_error if the file cannot be parsed or a value is out of range.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

/**
 * @brief Same as LoadConfig but from an in-memory TOML document.
 */
AppConfig ParseConfig(std::string_view toml_text);

}  // namespace ferry
