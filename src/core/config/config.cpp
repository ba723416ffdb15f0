#include "config.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <toml++/toml.hpp>

namespace ferry {

namespace {

void ReadRetry(const toml::node_view<const toml::node>& tbl, RetryConfig& retry,
               const char* attempts_key) {
    retry.max_attempts = tbl[attempts_key].value_or(retry.max_attempts);
    retry.initial_backoff =
        std::chrono::milliseconds(tbl["initial_backoff_ms"].value_or<int64_t>(retry.initial_backoff.count()));
    retry.max_backoff =
        std::chrono::milliseconds(tbl["max_backoff_ms"].value_or<int64_t>(retry.max_backoff.count()));
    retry.multiplier = tbl["multiplier"].value_or(retry.multiplier);
}

void Validate(const AppConfig& config) {
    const auto& t = config.transfer;
    if (t.chunk_size == 0 || t.buffer_size == 0) {
        throw std::runtime_error("transfer.chunk_size_mib and buffer_size_mib must be > 0");
    }
    if (t.small_threshold > t.large_threshold) {
        throw std::runtime_error("transfer.small_threshold_mib must not exceed large_threshold_mib");
    }
    if (t.max_workers == 0) {
        throw std::runtime_error("transfer.max_workers must be > 0");
    }
    for (const auto* r : {&t.chunk_retry, &config.orchestrator.auth_retry,
                          &config.orchestrator.transfer_retry}) {
        if (r->max_attempts == 0) {
            throw std::runtime_error("retry attempts must be > 0");
        }
        if (r->multiplier < 1.0) {
            throw std::runtime_error("retry.multiplier must be >= 1.0");
        }
    }
    if (config.broker.session_ttl.count() <= 0) {
        throw std::runtime_error("broker.session_ttl_seconds must be > 0");
    }
}

AppConfig FromTable(const toml::table& tbl) {
    AppConfig config;

    // 1. Server Settings
    if (auto server = tbl["server"]) {
        config.server.address = server["address"].value_or(config.server.address);
        config.server.port = server["port"].value_or<uint16_t>(config.server.port);
        config.server.threads = server["threads"].value_or(config.server.threads);
        config.server.transfer_threads =
            server["transfer_threads"].value_or(config.server.transfer_threads);
    }

    // 2. S3 Settings
    if (auto s3 = tbl["s3"]) {
        config.s3.host = s3["host"].value_or(config.s3.host);
        config.s3.port = s3["port"].value_or(config.s3.port);
        config.s3.region = s3["region"].value_or(config.s3.region);
        config.s3.service = s3["service"].value_or(config.s3.service);
    }

    // 3. Identity provider
    if (auto id = tbl["identity"]) {
        config.identity.access_key = id["access_key"].value_or(config.identity.access_key);
        config.identity.secret_key = id["secret_key"].value_or(config.identity.secret_key);
        config.identity.session_token = id["session_token"].value_or(config.identity.session_token);
        config.identity.role = id["role"].value_or(config.identity.role);
    }

    // 4. Session broker
    if (auto broker = tbl["broker"]) {
        config.broker.session_ttl = std::chrono::seconds(
            broker["session_ttl_seconds"].value_or<int64_t>(config.broker.session_ttl.count()));
        config.broker.approval_pattern =
            broker["approval_pattern"].value_or(config.broker.approval_pattern);
        config.broker.approval_retention = std::chrono::hours(
            broker["approval_retention_hours"].value_or<int64_t>(config.broker.approval_retention.count()));
    }

    // 5. Transfer engine
    if (auto t = tbl["transfer"]) {
        auto& tc = config.transfer;
        tc.small_threshold = t["small_threshold_mib"].value_or<uint64_t>(tc.small_threshold / MIB) * MIB;
        tc.large_threshold = t["large_threshold_mib"].value_or<uint64_t>(tc.large_threshold / MIB) * MIB;
        tc.chunk_size = t["chunk_size_mib"].value_or<size_t>(tc.chunk_size / MIB) * MIB;
        tc.buffer_size = t["buffer_size_mib"].value_or<size_t>(tc.buffer_size / MIB) * MIB;
        tc.max_workers = t["max_workers"].value_or(tc.max_workers);
        tc.connect_timeout = std::chrono::seconds(
            t["connect_timeout_seconds"].value_or<int64_t>(tc.connect_timeout.count()));
        tc.chunk_retry.max_attempts = t["chunk_attempts"].value_or(tc.chunk_retry.max_attempts);
    }

    // 6. Retry / backoff (shared by authentication, transfer and chunk retries)
    if (auto r = tbl["retry"]) {
        auto& oc = config.orchestrator;
        ReadRetry(r, oc.auth_retry, "auth_attempts");
        ReadRetry(r, oc.transfer_retry, "transfer_attempts");
        const auto chunk_attempts = config.transfer.chunk_retry.max_attempts;
        config.transfer.chunk_retry = oc.transfer_retry;
        config.transfer.chunk_retry.max_attempts = chunk_attempts;
    }

    // 7. Orchestrator
    if (auto o = tbl["orchestrator"]) {
        auto& oc = config.orchestrator;
        oc.transfer_timeout = std::chrono::seconds(
            o["transfer_timeout_seconds"].value_or<int64_t>(oc.transfer_timeout.count()));
        oc.planning_timeout = std::chrono::seconds(
            o["planning_timeout_seconds"].value_or<int64_t>(oc.planning_timeout.count()));
        oc.record_retention = std::chrono::hours(
            o["record_retention_hours"].value_or<int64_t>(oc.record_retention.count()));
        oc.progress_interval =
            o["progress_interval_mib"].value_or<uint64_t>(oc.progress_interval / MIB) * MIB;
    }

    if (auto v = tbl["verify"]) {
        config.orchestrator.trust_source_etag =
            v["trust_source_etag"].value_or(config.orchestrator.trust_source_etag);
    }

    if (auto a = tbl["audit"]) {
        config.audit.journal_path = a["journal_path"].value_or(config.audit.journal_path);
    }

    if (auto l = tbl["logging"]) {
        config.logging.level = l["level"].value_or(config.logging.level);
        config.logging.file = l["file"].value_or(config.logging.file);
    }

    Validate(config);
    return config;
}

}  // namespace

std::chrono::milliseconds RetryConfig::BackoffAfter(uint32_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds::zero();
    }
    const double factor = std::pow(multiplier, static_cast<double>(attempt - 1));
    const double raw = static_cast<double>(initial_backoff.count()) * factor;
    const double capped = std::min(raw, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

AppConfig ParseConfig(std::string_view toml_text) {
    toml::table tbl;
    try {
        tbl = toml::parse(toml_text);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("Config parse error: " + std::string(err.description()));
    }
    return FromTable(tbl);
}

AppConfig LoadConfig(const std::string& path) {
    // Runs before logging is set up; main reports where the values came from.
    if (!std::filesystem::exists(path)) {
        return AppConfig{};
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("Config parse error in " + path + ": " +
                                 std::string(err.description()));
    }

    auto config = FromTable(tbl);
    config.source = path;
    return config;
}

}  // namespace ferry
